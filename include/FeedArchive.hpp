#pragma once
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "Parser.hpp"

// Read-only view of one GTFS ZIP archive.
class FeedArchive
{
public:
    // Throws ParseError if the file is missing or is not a ZIP archive.
    explicit FeedArchive(std::filesystem::path path);
    ~FeedArchive();

    FeedArchive(FeedArchive const&) = delete;
    FeedArchive& operator=(FeedArchive const&) = delete;

    // Rows of `fileName`, or nothing when the table is absent or cannot be
    // decoded. Decoding problems are logged, never thrown.
    std::vector<CsvRow> readTable(std::string const& fileName) const;

    bool hasTable(std::string const& fileName) const;
    std::vector<std::string> tableNames() const;
    std::filesystem::path const& getPath() const noexcept;

    // One-shot form: never throws, an unreadable archive gives no rows.
    static std::vector<CsvRow> readTable(std::filesystem::path const& archivePath, std::string const& fileName);

private:
    struct Impl;
    std::filesystem::path path;
    std::unique_ptr<Impl> impl;
};
