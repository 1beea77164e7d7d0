#pragma once
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

struct FeedEndpoint
{
    std::string city;
    std::string url;
};

class ConfigurationManager
{
private:
    std::vector<FeedEndpoint> feeds;
    std::string databasePath;
    std::filesystem::path gtfsDir;
    std::string liveArrivalsBaseUrl;
    std::string userAgent;
    std::chrono::seconds downloadTimeout;
    std::chrono::seconds liveTimeout;
    std::size_t maxParallelDownloads;
    std::size_t importBatchSize;

    static inline const std::string FEED_BASE =
        "https://motionbuscard.org.cy/opendata/downloadfile?file=GTFS%5C";

public:
    static inline const std::string DEFAULT_LIVE_URL = "https://motionbuscard.org.cy/routes/stop";

    // Built-in city list; paths and limits may be overridden from the
    // environment (STOPBOARD_DB, STOPBOARD_GTFS_DIR, STOPBOARD_LIVE_URL,
    // STOPBOARD_MAX_DOWNLOADS).
    ConfigurationManager();
    ConfigurationManager(std::string databasePath, std::filesystem::path gtfsDir, std::vector<FeedEndpoint> feeds);

    [[nodiscard]] std::vector<FeedEndpoint> const& getFeeds() const noexcept;
    [[nodiscard]] FeedEndpoint const* findFeed(std::string const& city) const noexcept;
    [[nodiscard]] std::vector<std::string> listCities() const;
    [[nodiscard]] std::filesystem::path archivePath(std::string const& city) const;

    // Lower-case letters, digits, '_' and '-' only, so the id is usable as a
    // file name.
    static bool isSafeCityId(std::string const& city) noexcept;

    [[nodiscard]] std::string const& getDatabasePath() const noexcept;
    [[nodiscard]] std::filesystem::path const& getGtfsDir() const noexcept;
    [[nodiscard]] std::string const& getLiveArrivalsBaseUrl() const noexcept;
    [[nodiscard]] std::string const& getUserAgent() const noexcept;
    [[nodiscard]] std::chrono::seconds getDownloadTimeout() const noexcept;
    [[nodiscard]] std::chrono::seconds getLiveTimeout() const noexcept;
    [[nodiscard]] std::size_t getMaxParallelDownloads() const noexcept;
    [[nodiscard]] std::size_t getImportBatchSize() const noexcept;

    void setLiveArrivalsBaseUrl(std::string url);
    void setDownloadTimeout(std::chrono::seconds timeout);
    void setLiveTimeout(std::chrono::seconds timeout);
    void setMaxParallelDownloads(std::size_t n);
    void setImportBatchSize(std::size_t n);
};
