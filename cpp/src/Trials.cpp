#include "Trials.h"
#include "Error.h"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <iomanip>
#include <set>
#include <sstream>

using namespace ensemble;

namespace {
    int parseTrialNumber(const std::string& text, const std::string& whole) {
        size_t pos = 0;
        int v = -1;
        try {
            v = std::stoi(text, &pos);
        }
        catch (const std::logic_error&) {
            pos = 0;
        }
        if (text.empty() || pos != text.size() || v < 0)
            throw ConfigurationError("Malformed trial string '" + whole + "'");
        return v;
    }

    std::string strip(const std::string& s) {
        std::string out;
        std::copy_if(s.begin(), s.end(), std::back_inserter(out), [](const unsigned char c) { return !std::isspace(c); });
        return out;
    }
}

std::vector<int> ensemble::parseTrialString(const std::string& text) {
    std::set<int> trials;
    std::stringstream ss(strip(text));
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (item.empty()) continue;
        const auto dash = item.find('-');
        if (dash == std::string::npos) {
            trials.insert(parseTrialNumber(item, text));
            continue;
        }
        const int first = parseTrialNumber(item.substr(0, dash), text);
        const int last = parseTrialNumber(item.substr(dash + 1), text);
        if (last < first) throw ConfigurationError("Descending trial range '" + item + "'");
        for (int t = first; t <= last; ++t) trials.insert(t);
    }
    return {trials.begin(), trials.end()};
}

std::string ensemble::createTrialString(std::vector<int> trials) {
    std::sort(trials.begin(), trials.end());
    trials.erase(std::unique(trials.begin(), trials.end()), trials.end());

    std::string out;
    for (size_t i = 0; i < trials.size();) {
        size_t j = i;
        while (j + 1 < trials.size() && trials[j + 1] == trials[j] + 1) ++j;
        if (!out.empty()) out += ",";
        out += std::to_string(trials[i]);
        if (j > i) out += "-" + std::to_string(trials[j]);
        i = j + 1;
    }
    return out;
}

std::string ensemble::trialDirectory(const std::string& simsDir, const int64_t simId, const int trialNum,
                                     const int maxSimDirs) {
    int digits = 0;
    for (int m = maxSimDirs; m > 1; m /= 10) {
        if (m % 10 != 0) throw ConfigurationError("MaxSimDirs must be a power of 10, got " + std::to_string(maxSimDirs));
        ++digits;
    }
    if (digits == 0) throw ConfigurationError("MaxSimDirs must be >= 10, got " + std::to_string(maxSimDirs));

    std::ostringstream oss;
    oss << simsDir << "/s" << std::setw(3) << std::setfill('0') << simId
        << '/' << std::setw(digits) << trialNum / maxSimDirs
        << '/' << std::setw(digits) << trialNum % maxSimDirs;
    return oss.str();
}
