#include <cstdlib>
#include <stdexcept>
#include "ConfigurationManager.hpp"
#include "Parser.hpp"

namespace
{
std::string envOr(char const* name, std::string fallback)
{
    const char* value = std::getenv(name);
    if (!value || !*value) return fallback;
    return value;
}
}

ConfigurationManager::ConfigurationManager()
    : ConfigurationManager(envOr("STOPBOARD_DB", "stopboard.db"),
                           envOr("STOPBOARD_GTFS_DIR", "gtfs_data"),
                           {
                               {"limassol",     FEED_BASE + "6_google_transit.zip&rel=True"},
                               {"pafos",        FEED_BASE + "2_google_transit.zip&rel=True"},
                               {"famagusta",    FEED_BASE + "4_google_transit.zip&rel=True"},
                               {"intercity",    FEED_BASE + "5_google_transit.zip&rel=True"},
                               {"nicosia",      FEED_BASE + "9_google_transit.zip&rel=True"},
                               {"larnaca",      FEED_BASE + "10_google_transit.zip&rel=True"},
                               {"pame_express", FEED_BASE + "11_google_transit.zip&rel=True"}
                           })
{
    liveArrivalsBaseUrl = envOr("STOPBOARD_LIVE_URL", DEFAULT_LIVE_URL);

    const char* maxDownloads = std::getenv("STOPBOARD_MAX_DOWNLOADS");
    if (maxDownloads && *maxDownloads)
    {
        auto n = Parser::parseInt(maxDownloads);
        if (!n || *n < 1) throw std::runtime_error("STOPBOARD_MAX_DOWNLOADS must be a positive integer.");
        maxParallelDownloads = static_cast<std::size_t>(*n);
    }
}

ConfigurationManager::ConfigurationManager(std::string dbPath, std::filesystem::path dir, std::vector<FeedEndpoint> endpoints)
    : feeds(std::move(endpoints))
    , databasePath(std::move(dbPath))
    , gtfsDir(std::move(dir))
    , liveArrivalsBaseUrl(DEFAULT_LIVE_URL)
    , userAgent("StopBoard/1.0")
    , downloadTimeout(60)
    , liveTimeout(10)
    , maxParallelDownloads(3)
    , importBatchSize(500)
{
}

std::vector<FeedEndpoint> const& ConfigurationManager::getFeeds() const noexcept { return feeds; }

FeedEndpoint const* ConfigurationManager::findFeed(std::string const& city) const noexcept
{
    for (FeedEndpoint const& feed : feeds)
    {
        if (feed.city == city) return &feed;
    }
    return nullptr;
}

std::vector<std::string> ConfigurationManager::listCities() const
{
    std::vector<std::string> cities;
    cities.reserve(feeds.size());
    for (FeedEndpoint const& feed : feeds) cities.push_back(feed.city);
    return cities;
}

bool ConfigurationManager::isSafeCityId(std::string const& city) noexcept
{
    if (city.empty()) return false;
    for (char c : city)
    {
        bool ok = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
        if (!ok) return false;
    }
    return true;
}

std::filesystem::path ConfigurationManager::archivePath(std::string const& city) const
{
    return gtfsDir / (city + ".zip");
}

std::string const& ConfigurationManager::getDatabasePath() const noexcept { return databasePath; }
std::filesystem::path const& ConfigurationManager::getGtfsDir() const noexcept { return gtfsDir; }
std::string const& ConfigurationManager::getLiveArrivalsBaseUrl() const noexcept { return liveArrivalsBaseUrl; }
std::string const& ConfigurationManager::getUserAgent() const noexcept { return userAgent; }
std::chrono::seconds ConfigurationManager::getDownloadTimeout() const noexcept { return downloadTimeout; }
std::chrono::seconds ConfigurationManager::getLiveTimeout() const noexcept { return liveTimeout; }
std::size_t ConfigurationManager::getMaxParallelDownloads() const noexcept { return maxParallelDownloads; }
std::size_t ConfigurationManager::getImportBatchSize() const noexcept { return importBatchSize; }

void ConfigurationManager::setLiveArrivalsBaseUrl(std::string url) { liveArrivalsBaseUrl = std::move(url); }
void ConfigurationManager::setDownloadTimeout(std::chrono::seconds timeout) { downloadTimeout = timeout; }
void ConfigurationManager::setLiveTimeout(std::chrono::seconds timeout) { liveTimeout = timeout; }

void ConfigurationManager::setMaxParallelDownloads(std::size_t n)
{
    if (n == 0) throw std::invalid_argument("maxParallelDownloads must be at least 1");
    maxParallelDownloads = n;
}

void ConfigurationManager::setImportBatchSize(std::size_t n)
{
    if (n == 0) throw std::invalid_argument("importBatchSize must be at least 1");
    importBatchSize = n;
}
