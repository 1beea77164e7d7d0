#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <system_error>
#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include "Errors.hpp"
#include "FeedFetcher.hpp"

FeedFetcher::FeedFetcher(ConfigurationManager const& cfg)
    : config(cfg)
{
}

std::vector<FeedEndpoint> FeedFetcher::selectFeeds(std::string const& cityOrAll) const
{
    if (cityOrAll == "all")
        return config.getFeeds();

    FeedEndpoint const* feed = config.findFeed(cityOrAll);
    if (!feed)
        throw UnknownCityError("Unknown city: " + cityOrAll);
    return {*feed};
}

std::map<std::string, DownloadResult> FeedFetcher::download(std::string const& cityOrAll)
{
    std::vector<FeedEndpoint> feeds = selectFeeds(cityOrAll);
    std::vector<DownloadResult> results(feeds.size());

    std::error_code ec;
    std::filesystem::create_directories(config.getGtfsDir(), ec);
    if (ec)
        std::cerr << "[Fetch] Cannot create " << config.getGtfsDir() << ": " << ec.message() << "\n";

    boost::asio::io_context io;
    HttpClient client(io, config.getUserAgent());

    std::size_t next = 0;
    std::size_t workers = std::min(config.getMaxParallelDownloads(), feeds.size());
    for (std::size_t i = 0; i < workers; ++i)
    {
        boost::asio::co_spawn(io, worker(client, feeds, next, results), boost::asio::detached);
    }
    io.run();

    std::map<std::string, DownloadResult> byCity;
    for (std::size_t i = 0; i < feeds.size(); ++i)
        byCity[feeds[i].city] = std::move(results[i]);
    return byCity;
}

boost::asio::awaitable<void> FeedFetcher::worker(HttpClient& client, std::vector<FeedEndpoint> const& feeds, std::size_t& next, std::vector<DownloadResult>& results)
{
    while (next < feeds.size())
    {
        std::size_t slot = next++;
        results[slot] = co_await downloadOne(client, feeds[slot]);
    }
}

boost::asio::awaitable<DownloadResult> FeedFetcher::downloadOne(HttpClient& client, FeedEndpoint const& feed)
{
    DownloadResult result;
    std::cout << "[Fetch] Downloading GTFS for " << feed.city << "..." << std::endl;

    try
    {
        HttpResponse response = co_await client.get(feed.url, config.getDownloadTimeout());

        if (response.status < 200 || response.status >= 300)
        {
            result.error = "HTTP " + std::to_string(response.status);
        }
        else
        {
            result.file = config.archivePath(feed.city);
            result.sizeBytes = writeArchive(result.file, response.body);
            result.success = true;
        }
    }
    catch (std::exception const& e)
    {
        result.error = e.what();
    }

    if (result.success)
    {
        std::cout << "[Fetch] " << feed.city << ": " << std::fixed << std::setprecision(2)
                  << static_cast<double>(result.sizeBytes) / (1024.0 * 1024.0) << " MB -> "
                  << result.file.string() << std::endl;
    }
    else
    {
        std::cerr << "[Fetch] Failed to download " << feed.city << ": " << result.error << "\n";
    }
    co_return result;
}

// Written beside the target and renamed into place, so a failed write leaves
// the previous archive untouched.
std::uintmax_t FeedFetcher::writeArchive(std::filesystem::path const& target, std::string const& body)
{
    std::filesystem::path temp = target;
    temp += ".part";

    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out)
            throw std::runtime_error("Cannot write " + temp.string());
        out.write(body.data(), static_cast<std::streamsize>(body.size()));
        out.flush();
        if (!out)
        {
            out.close();
            std::error_code ignore;
            std::filesystem::remove(temp, ignore);
            throw std::runtime_error("Write failed for " + temp.string());
        }
    }

    std::filesystem::rename(temp, target);
    return std::filesystem::file_size(target);
}
