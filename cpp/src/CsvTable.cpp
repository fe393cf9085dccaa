#include "CsvTable.h"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include <boost/algorithm/string/trim.hpp>
#include <boost/tokenizer.hpp>

using namespace ensemble;

namespace {
    std::vector<std::string> splitLine(const std::string& line) {
        using Tokenizer = boost::tokenizer<boost::escaped_list_separator<char>>;
        std::vector<std::string> cells;
        try {
            const Tokenizer tok(line, boost::escaped_list_separator<char>('\\', ',', '"'));
            for (const auto& cell : tok) cells.push_back(boost::algorithm::trim_copy(cell));
        }
        catch (const boost::escaped_list_error& e) {
            throw std::runtime_error("Malformed CSV line \"" + line + "\": " + e.what());
        }
        return cells;
    }

    const std::string kEmpty;
}

CsvTable CsvTable::fromFile(const std::string& path, const bool hasTitle) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("Cannot open " + path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return fromString(buffer.str(), hasTitle);
}

CsvTable CsvTable::fromString(const std::string& text, const bool hasTitle) {
    CsvTable table;
    std::istringstream in(text);
    std::string line;
    bool titleSeen = !hasTitle;
    bool headerSeen = false;

    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!titleSeen) {
            table.title_ = boost::algorithm::trim_copy(line);
            titleSeen = true;
            continue;
        }
        if (boost::algorithm::trim_copy(line).empty()) continue;
        if (!headerSeen) {
            table.header_ = splitLine(line);
            headerSeen = true;
            continue;
        }
        table.rows_.push_back(splitLine(line));
    }
    if (!headerSeen) throw std::runtime_error("CSV data has no header row");
    return table;
}

std::optional<size_t> CsvTable::columnIndex(const std::string& column) const {
    const std::string wanted = boost::algorithm::trim_copy(column);
    for (size_t i = 0; i < header_.size(); ++i)
        if (header_[i] == wanted) return i;
    return std::nullopt;
}

const std::string& CsvTable::cell(const size_t row, const std::string& column) const {
    const auto col = columnIndex(column);
    if (!col) throw std::out_of_range("No column '" + column + "'");
    const auto& cells = rows_.at(row);
    return *col < cells.size() ? cells[*col] : kEmpty;
}
