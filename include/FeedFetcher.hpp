#pragma once
#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include "ConfigurationManager.hpp"
#include "HttpClient.hpp"
#include "Types.hpp"

// Downloads city archives into the configured GTFS directory.
class FeedFetcher
{
private:
    ConfigurationManager const& config;

    std::vector<FeedEndpoint> selectFeeds(std::string const& cityOrAll) const;
    boost::asio::awaitable<void> worker(HttpClient& client, std::vector<FeedEndpoint> const& feeds, std::size_t& next, std::vector<DownloadResult>& results);
    boost::asio::awaitable<DownloadResult> downloadOne(HttpClient& client, FeedEndpoint const& feed);
    static std::uintmax_t writeArchive(std::filesystem::path const& target, std::string const& body);

public:
    explicit FeedFetcher(ConfigurationManager const& config);

    // "all" downloads every configured city. Throws UnknownCityError before
    // any I/O for a city that is not configured; every other failure is
    // reported in that city's result.
    std::map<std::string, DownloadResult> download(std::string const& cityOrAll);
};
