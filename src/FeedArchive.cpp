#include "FeedArchive.hpp"

#include <iostream>
#include <optional>
#include "miniz.h"
#include "Errors.hpp"

struct FeedArchive::Impl
{
    mz_zip_archive archive;

    explicit Impl(std::filesystem::path const& p)
    {
        mz_zip_zero_struct(&archive);
        if (!mz_zip_reader_init_file(&archive, p.string().c_str(), 0))
        {
            mz_zip_error err = mz_zip_get_last_error(&archive);
            throw ParseError("Unable to open zip " + p.string() + ": " + mz_zip_get_error_string(err));
        }
    }

    ~Impl() { mz_zip_reader_end(&archive); }

    Impl(Impl const&) = delete;
    Impl& operator=(Impl const&) = delete;

    std::optional<mz_uint32> locate(std::string const& fileName)
    {
        mz_uint32 index = 0;
        if (mz_zip_reader_locate_file_v2(&archive, fileName.c_str(), nullptr, 0, &index) != MZ_TRUE)
            return std::nullopt;
        return index;
    }
};

FeedArchive::FeedArchive(std::filesystem::path p)
    : path(std::move(p))
{
    if (!std::filesystem::is_regular_file(path))
        throw ParseError("Archive not found: " + path.string());
    impl = std::make_unique<Impl>(path);
}

FeedArchive::~FeedArchive() = default;

std::filesystem::path const& FeedArchive::getPath() const noexcept { return path; }

bool FeedArchive::hasTable(std::string const& fileName) const
{
    return impl->locate(fileName).has_value();
}

std::vector<std::string> FeedArchive::tableNames() const
{
    std::vector<std::string> names;
    mz_uint32 count = mz_zip_reader_get_num_files(&impl->archive);
    for (mz_uint32 i = 0; i < count; ++i)
    {
        if (mz_zip_reader_is_file_a_directory(&impl->archive, i))
            continue;

        mz_zip_archive_file_stat stat;
        if (mz_zip_reader_file_stat(&impl->archive, i, &stat))
            names.emplace_back(stat.m_filename);
    }
    return names;
}

std::vector<CsvRow> FeedArchive::readTable(std::string const& fileName) const
{
    std::optional<mz_uint32> index = impl->locate(fileName);
    if (!index)
        return {};

    std::size_t size = 0;
    void* data = mz_zip_reader_extract_to_heap(&impl->archive, *index, &size, 0);
    if (!data)
    {
        mz_zip_error err = mz_zip_get_last_error(&impl->archive);
        std::cerr << "[Archive] Cannot extract " << fileName << " from " << path.string()
                  << ": " << mz_zip_get_error_string(err) << "\n";
        return {};
    }

    std::string content(static_cast<char const*>(data), size);
    mz_free(data);

    std::string_view text = Parser::stripBom(content);
    if (!Parser::isValidUtf8(text))
    {
        std::cerr << "[Archive] " << fileName << " in " << path.string()
                  << " is not valid UTF-8, table ignored\n";
        return {};
    }

    return Parser::parseCsv(text);
}

std::vector<CsvRow> FeedArchive::readTable(std::filesystem::path const& archivePath, std::string const& fileName)
{
    try
    {
        FeedArchive archive(archivePath);
        return archive.readTable(fileName);
    }
    catch (std::exception const& e)
    {
        std::cerr << "[Archive] Error parsing " << fileName << " from " << archivePath.string()
                  << ": " << e.what() << "\n";
        return {};
    }
}
