#pragma once
/**
 * @file CsvTable.h
 * @brief In-memory CSV table as written by model query exports.
 */
#include <optional>
#include <string>
#include <vector>

namespace ensemble {
    /**
     * @brief A header row plus data rows, all cells kept as text.
     *
     * Query-result files start with a title line that is not part of the table;
     * `hasTitle` skips it and keeps it available through title(). Quoted cells may
     * contain commas.
     */
    class CsvTable {
    public:
        /** @throws std::runtime_error if the file cannot be read or has no header */
        static CsvTable fromFile(const std::string& path, bool hasTitle = true);

        /** @throws std::runtime_error if the text has no header */
        static CsvTable fromString(const std::string& text, bool hasTitle = true);

        const std::string& title() const noexcept { return title_; }
        const std::vector<std::string>& header() const noexcept { return header_; }

        /** @brief Index of `column`, compared after trimming whitespace. */
        std::optional<size_t> columnIndex(const std::string& column) const;

        size_t rowCount() const noexcept { return rows_.size(); }
        const std::vector<std::string>& row(size_t i) const { return rows_.at(i); }

        /**
         * @brief Cell of `row` under `column`; missing trailing cells read as "".
         * @throws std::out_of_range for an unknown column or row
         */
        const std::string& cell(size_t row, const std::string& column) const;

    private:
        std::string title_;
        std::vector<std::string> header_;
        std::vector<std::vector<std::string>> rows_;
    };
}
