#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <unordered_map>
#include <optional>

// header name -> field value
using CsvRow = std::unordered_map<std::string, std::string>;

class Parser
{
public:
    // RFC 4180 records keyed by the header line. Blank lines are skipped and
    // short records get empty values for the missing columns.
    static std::vector<CsvRow> parseCsv(std::string_view content);

    static std::string_view stripBom(std::string_view content);
    static bool isValidUtf8(std::string_view content);

    static std::string field(CsvRow const& row, std::string const& key, std::string const& fallback = "");

    // Whole-field numeric parsing; surrounding blanks allowed, anything else
    // left over makes the field invalid.
    static std::optional<int> parseInt(std::string const& text);
    static std::optional<double> parseDouble(std::string const& text);

private:
    static std::vector<std::vector<std::string>> splitRecords(std::string_view content);
    static std::string trim(std::string const& text);
};
