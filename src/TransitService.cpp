#include <iostream>
#include "ArrivalFusion.hpp"
#include "Errors.hpp"
#include "TransitService.hpp"

TransitService::TransitService(ConfigurationManager const& cfg, SQLiteStore& s, ArrivalSource& source)
    : config(cfg)
    , store(s)
    , liveSource(source)
    , fetcher(cfg)
    , importer(s, cfg)
{
}

std::vector<std::string> TransitService::listCities() const
{
    return config.listCities();
}

std::map<std::string, DownloadResult> TransitService::downloadFeed(std::string const& cityOrAll)
{
    return fetcher.download(cityOrAll);
}

std::map<std::string, ImportResult> TransitService::importFeed(std::string const& cityOrAll)
{
    return importer.import(cityOrAll);
}

SyncResult TransitService::syncFeed(std::string const& cityOrAll)
{
    SyncResult result;
    result.downloads = fetcher.download(cityOrAll);

    std::size_t succeeded = 0;
    for (auto const& [city, download] : result.downloads)
    {
        if (download.success) ++succeeded;
    }

    if (succeeded == 0)
        throw FetchError("No GTFS files were downloaded");

    result.imports = importer.import(cityOrAll);
    return result;
}

TableCounts TransitService::stats()
{
    TableCounts counts;
    for (std::string const& table : SQLiteStore::TABLES)
    {
        try
        {
            counts[table] = store.countRows(table);
        }
        catch (StoreError const& e)
        {
            std::cerr << "[Store] Count failed for " << table << ": " << e.what() << "\n";
            counts[table] = 0;
        }
    }
    return counts;
}

boost::asio::awaitable<ArrivalBoard> TransitService::getArrivals(std::string stopId)
{
    ArrivalBoard board;
    board.stop.stopId = stopId;
    board.stop.stopName = "Stop " + stopId;

    try
    {
        if (auto stop = store.findStop(stopId))
        {
            if (!stop->name.empty()) board.stop.stopName = stop->name;
            board.stop.lat = stop->lat;
            board.stop.lon = stop->lon;
        }
        board.routes = store.routesForStop(stopId);
    }
    catch (StoreError const& e)
    {
        std::cerr << "[Store] Stop " << stopId << " lookup failed: " << e.what() << "\n";
        board.routes.clear();
    }

    std::vector<LiveArrival> live = co_await liveSource.fetch(stopId);
    board.arrivals = ArrivalFusion::enrich(live, board.routes);
    co_return board;
}

std::vector<StopRoute> TransitService::getRoutesForStop(std::string const& stopId)
{
    return store.routesForStop(stopId);
}
