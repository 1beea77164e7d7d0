#pragma once
#include <map>
#include <string>
#include <vector>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include "ConfigurationManager.hpp"
#include "FeedFetcher.hpp"
#include "FeedImporter.hpp"
#include "LiveArrivalFetcher.hpp"
#include "SQLiteStore.hpp"
#include "Types.hpp"

// Entry point for consumers: feed maintenance, table statistics and the
// per-stop arrival board.
class TransitService
{
private:
    ConfigurationManager const& config;
    SQLiteStore& store;
    ArrivalSource& liveSource;
    FeedFetcher fetcher;
    FeedImporter importer;

public:
    TransitService(ConfigurationManager const& config, SQLiteStore& store, ArrivalSource& liveSource);

    std::vector<std::string> listCities() const;

    std::map<std::string, DownloadResult> downloadFeed(std::string const& cityOrAll);
    std::map<std::string, ImportResult> importFeed(std::string const& cityOrAll);

    // Throws FetchError when not a single archive could be downloaded.
    SyncResult syncFeed(std::string const& cityOrAll);

    // A table whose count fails reports 0.
    TableCounts stats();

    // Never fails because of the live source or a missing stop.
    boost::asio::awaitable<ArrivalBoard> getArrivals(std::string stopId);

    std::vector<StopRoute> getRoutesForStop(std::string const& stopId);
};
