#include "Config.h"
#include "Error.h"

#include <algorithm>
#include <fstream>
#include <limits>
#include <set>
#include <sstream>

#include <yaml-cpp/yaml.h>

using namespace ensemble;

namespace {
    const std::map<std::string, std::string>& defaults() {
        static const std::map<std::string, std::string> table = {
            {"MCS.DbPath", "ensemble.sqlite"},
            {"MCS.RunSimsDir", "sims"},
            {"MCS.MaxSimDirs", "1000"},
            {"MCS.Seed", "0"},
            {"MCS.SamplingMethod", "lhs"},
            {"MCS.Years", "2015-2050:5"},
            {"MCS.MaxWorkers", "8"},
            {"MCS.MaxRetries", "0"},
            {"MCS.RunTimeoutSecs", "0"},
            {"MCS.PollMillis", "200"},
            {"MCS.ShutdownWhenIdle", "true"},
            {"MCS.LogLevel", "INFO"},
            {"MCS.LogDir", "logs"},
            {"MCS.BatchSystem", "SLURM"},
            {"IPP.MaxEngines", "300"},
            {"IPP.TasksPerNode", "4"},
            {"IPP.MinutesPerRun", "20"},
            {"SLURM.Partition", "short"},
            {"SLURM.BatchCommand", "sbatch -p {partition} -J {jobName} -t {walltime} -e {logFile} -o {logFile}"},
            {"PBS.Queue", "short"},
            {"PBS.BatchCommand", "qsub -q {queue} -N {jobName} -l walltime={walltime} -e {logFile} -j oe"},
        };
        return table;
    }

    std::string lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](const unsigned char c) { return std::tolower(c); });
        return s;
    }

    std::string trim(const std::string& s) {
        const auto b = s.find_first_not_of(" \t");
        if (b == std::string::npos) return "";
        const auto e = s.find_last_not_of(" \t");
        return s.substr(b, e - b + 1);
    }

    std::string scalarText(const YAML::Node& node, const std::string& key) {
        if (node.IsScalar()) return node.as<std::string>();
        if (node.IsNull()) return "";
        if (node.IsSequence()) {
            std::string joined;
            for (const auto& item : node) {
                if (!item.IsScalar()) throw ConfigurationError("Config key " + key + ": nested lists are not allowed");
                if (!joined.empty()) joined += ",";
                joined += item.as<std::string>();
            }
            return joined;
        }
        throw ConfigurationError("Config key " + key + " must be a scalar or a list of scalars");
    }
}

Config::Config() : values_(defaults()) {}

Config Config::fromYamlFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw ConfigurationError("Cannot read configuration file " + path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return fromYamlString(buffer.str());
}

Config Config::fromYamlString(const std::string& text) {
    Config cfg;
    cfg.merge(text);
    return cfg;
}

void Config::merge(const std::string& yamlText) {
    YAML::Node root;
    try {
        root = YAML::Load(yamlText);
    }
    catch (const YAML::Exception& e) {
        throw ConfigurationError(std::string("Malformed configuration: ") + e.what());
    }
    if (root.IsNull()) return;
    if (!root.IsMap()) throw ConfigurationError("Configuration must be a map of sections");

    for (const auto& section : root) {
        const auto name = section.first.as<std::string>();
        if (!section.second.IsMap())
            throw ConfigurationError("Configuration section " + name + " must be a map of keys");
        for (const auto& entry : section.second) {
            const std::string key = name + "." + entry.first.as<std::string>();
            values_[key] = scalarText(entry.second, key);
        }
    }
}

std::optional<std::string> Config::get(const std::string& key) const {
    const auto it = values_.find(key);
    if (it == values_.end()) return std::nullopt;
    return it->second;
}

std::string Config::getString(const std::string& key) const {
    const auto v = get(key);
    if (!v) throw ConfigurationError("Missing configuration value " + key);
    return *v;
}

std::string Config::getString(const std::string& key, const std::string& fallback) const {
    const auto v = get(key);
    return v ? *v : fallback;
}

int Config::getInt(const std::string& key) const {
    const int64_t v = getInt64(key);
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max())
        throw ConfigurationError("Configuration value " + key + " is out of range");
    return static_cast<int>(v);
}

int64_t Config::getInt64(const std::string& key) const {
    const std::string text = trim(getString(key));
    size_t pos = 0;
    int64_t v = 0;
    try {
        v = std::stoll(text, &pos);
    }
    catch (const std::logic_error&) {
        pos = 0;
    }
    if (text.empty() || pos != text.size())
        throw ConfigurationError("Configuration value " + key + " = '" + text + "' is not an integer");
    return v;
}

double Config::getDouble(const std::string& key) const {
    const std::string text = trim(getString(key));
    size_t pos = 0;
    double v = 0.0;
    try {
        v = std::stod(text, &pos);
    }
    catch (const std::logic_error&) {
        pos = 0;
    }
    if (text.empty() || pos != text.size())
        throw ConfigurationError("Configuration value " + key + " = '" + text + "' is not a number");
    return v;
}

bool Config::getBool(const std::string& key) const {
    const std::string v = lower(trim(getString(key)));
    if (v == "true" || v == "yes" || v == "on" || v == "1") return true;
    if (v == "false" || v == "no" || v == "off" || v == "0") return false;
    throw ConfigurationError("Configuration value " + key + " = '" + v + "' is not a boolean");
}

//------------------------------------------------------------------------------
// parseYears(): "1990,2005-2100:5" -> 1990, 2005, 2010, ..., 2100
//------------------------------------------------------------------------------
std::vector<int> ensemble::parseYears(const std::string& spec) {
    auto toInt = [&spec](const std::string& s) {
        const std::string t = trim(s);
        size_t pos = 0;
        int v = 0;
        try {
            v = std::stoi(t, &pos);
        }
        catch (const std::logic_error&) {
            pos = 0;
        }
        if (t.empty() || pos != t.size()) throw ConfigurationError("Malformed year specification '" + spec + "'");
        return v;
    };

    std::set<int> years;
    std::stringstream ss(spec);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (trim(item).empty()) continue;
        const auto dash = item.find('-');
        if (dash == std::string::npos) {
            years.insert(toInt(item));
            continue;
        }
        const auto colon = item.find(':', dash);
        const int first = toInt(item.substr(0, dash));
        const int last = toInt(item.substr(dash + 1, colon == std::string::npos ? std::string::npos : colon - dash - 1));
        const int step = colon == std::string::npos ? 5 : toInt(item.substr(colon + 1));
        if (step <= 0 || last < first) throw ConfigurationError("Malformed year range '" + trim(item) + "'");
        for (int y = first; y <= last; y += step) years.insert(y);
    }
    if (years.empty()) throw ConfigurationError("Year specification '" + spec + "' names no years");
    return {years.begin(), years.end()};
}
