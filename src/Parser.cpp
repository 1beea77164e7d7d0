#include "Parser.hpp"

#include <cctype>
#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdlib>

std::string_view Parser::stripBom(std::string_view content)
{
    if (content.size() >= 3
        && static_cast<unsigned char>(content[0]) == 0xEF
        && static_cast<unsigned char>(content[1]) == 0xBB
        && static_cast<unsigned char>(content[2]) == 0xBF)
    {
        content.remove_prefix(3);
    }
    return content;
}

bool Parser::isValidUtf8(std::string_view content)
{
    std::size_t i = 0;
    while (i < content.size())
    {
        auto lead = static_cast<unsigned char>(content[i]);
        std::size_t len = 0;

        if (lead < 0x80)                 len = 1;
        else if (lead >= 0xC2 && lead <= 0xDF) len = 2;
        else if (lead >= 0xE0 && lead <= 0xEF) len = 3;
        else if (lead >= 0xF0 && lead <= 0xF4) len = 4;
        else return false;

        if (i + len > content.size())
            return false;
        for (std::size_t k = 1; k < len; ++k)
        {
            if ((static_cast<unsigned char>(content[i + k]) & 0xC0) != 0x80)
                return false;
        }
        i += len;
    }
    return true;
}

std::vector<std::vector<std::string>> Parser::splitRecords(std::string_view content)
{
    std::vector<std::vector<std::string>> records;
    std::vector<std::string> record;
    std::string current;
    bool inQuotes = false;
    bool fieldStarted = false;

    auto endField = [&]()
    {
        record.push_back(std::move(current));
        current.clear();
        fieldStarted = false;
    };
    auto endRecord = [&]()
    {
        endField();
        bool blank = record.size() == 1 && record[0].empty();
        if (!blank)
            records.push_back(std::move(record));
        record.clear();
    };

    for (std::size_t i = 0; i < content.size(); ++i)
    {
        char c = content[i];

        if (inQuotes)
        {
            if (c == '"')
            {
                if (i + 1 < content.size() && content[i + 1] == '"')
                {
                    current += '"';
                    ++i;
                }
                else
                {
                    inQuotes = false;
                }
            }
            else
            {
                current += c;
            }
            continue;
        }

        switch (c)
        {
            case '"':
                if (!fieldStarted && current.empty())
                    inQuotes = true;
                else
                    current += c;
                fieldStarted = true;
                break;
            case ',':
                endField();
                break;
            case '\r':
                if (i + 1 < content.size() && content[i + 1] == '\n')
                    ++i;
                endRecord();
                break;
            case '\n':
                endRecord();
                break;
            default:
                current += c;
                fieldStarted = true;
                break;
        }
    }

    if (fieldStarted || !current.empty() || !record.empty())
        endRecord();

    return records;
}

std::vector<CsvRow> Parser::parseCsv(std::string_view content)
{
    std::vector<std::vector<std::string>> records = splitRecords(stripBom(content));
    if (records.empty())
        return {};

    std::vector<std::string> header;
    header.reserve(records[0].size());
    for (std::string const& name : records[0])
        header.push_back(trim(name));

    std::vector<CsvRow> rows;
    rows.reserve(records.size() - 1);

    for (std::size_t r = 1; r < records.size(); ++r)
    {
        CsvRow row;
        for (std::size_t c = 0; c < header.size(); ++c)
            row[header[c]] = c < records[r].size() ? records[r][c] : std::string();
        rows.push_back(std::move(row));
    }
    return rows;
}

std::string Parser::field(CsvRow const& row, std::string const& key, std::string const& fallback)
{
    auto it = row.find(key);
    if (it == row.end())
        return fallback;
    return it->second;
}

std::string Parser::trim(std::string const& text)
{
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return text.substr(begin, end - begin);
}

std::optional<int> Parser::parseInt(std::string const& text)
{
    std::string value = trim(text);
    if (value.empty())
        return std::nullopt;

    errno = 0;
    char* end = nullptr;
    long parsed = std::strtol(value.c_str(), &end, 10);
    if (errno == ERANGE || end != value.c_str() + value.size())
        return std::nullopt;
    if (parsed < INT_MIN || parsed > INT_MAX)
        return std::nullopt;
    return static_cast<int>(parsed);
}

std::optional<double> Parser::parseDouble(std::string const& text)
{
    std::string value = trim(text);
    if (value.empty())
        return std::nullopt;

    errno = 0;
    char* end = nullptr;
    double parsed = std::strtod(value.c_str(), &end);
    if (errno == ERANGE || end != value.c_str() + value.size() || !std::isfinite(parsed))
        return std::nullopt;
    return parsed;
}
