#include <string>
#include <vector>
#include <map>
#include <iostream>
#include <iomanip>
#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include "ConfigurationManager.hpp"
#include "HttpClient.hpp"
#include "LiveArrivalFetcher.hpp"
#include "SQLiteStore.hpp"
#include "TransitService.hpp"
#include "Types.hpp"

void printUsage()
{
    std::cout << "Usage:\n"
              << "  stopboard cities\n"
              << "  stopboard download [city|all]\n"
              << "  stopboard import   [city|all]\n"
              << "  stopboard sync     [city|all]\n"
              << "  stopboard stats\n"
              << "  stopboard arrivals <stopId> [<stopId> ...]\n"
              << "  stopboard routes   <stopId>\n";
}

void printDownloads(std::map<std::string, DownloadResult> const& downloads)
{
    for (auto const& [city, result] : downloads)
    {
        if (result.success)
            std::cout << "   | " << city << ": " << result.sizeBytes << " bytes -> " << result.file.string() << "\n";
        else
            std::cout << "   | " << city << ": FAILED (" << result.error << ")\n";
    }
}

void printImports(std::map<std::string, ImportResult> const& imports)
{
    for (auto const& [city, result] : imports)
    {
        if (!result.success)
        {
            std::cout << "   | " << city << ": FAILED (" << result.error << ")\n";
            continue;
        }
        std::cout << "   | " << city << ":";
        for (auto const& [table, n] : result.rowCounts)
            std::cout << " " << table << "=" << n;
        std::cout << "\n";
    }
}

void printRoutes(std::vector<StopRoute> const& routes)
{
    for (StopRoute const& r : routes)
    {
        std::cout << "   | " << std::left << std::setw(8) << r.shortName
                  << " #" << r.color << "/#" << r.textColor
                  << "  " << toString(r.position)
                  << "  -> " << r.headsign << "\n";
    }
}

boost::asio::awaitable<void> printArrivals(TransitService& service, std::string stopId)
{
    try
    {
        ArrivalBoard board = co_await service.getArrivals(stopId);

        std::cout << "\n[" << board.stop.stopId << "] " << board.stop.stopName << "\n";
        if (board.arrivals.empty())
            std::cout << "   No live arrivals.\n";

        for (Arrival const& a : board.arrivals)
        {
            std::cout << "   | " << std::left << std::setw(8) << a.routeLabel
                      << std::right << std::setw(4) << a.minutesUntil << " min  "
                      << a.arrivalTime << "  -> " << a.headsign << "\n";
        }
        std::cout << "   Routes serving this stop: " << board.routes.size() << "\n";
    }
    catch (std::exception const& e)
    {
        std::cerr << "Error for stop " << stopId << ": " << e.what() << "\n";
    }
}

void parseCommandLineArgs(int argc, char* argv[], std::string& command, std::vector<std::string>& args)
{
    command.clear();
    args.clear();

    if (argc > 1)
        command = argv[1];

    for (int i = 2; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg.empty())
        {
            std::cerr << "Warning: ignoring empty argument\n";
            continue;
        }
        args.push_back(arg);
    }
}

int main(int argc, char* argv[])
{
    try
    {
        std::string command;
        std::vector<std::string> args;
        parseCommandLineArgs(argc, argv, command, args);

        if (command.empty() || command == "help" || command == "--help")
        {
            printUsage();
            return command.empty() ? 1 : 0;
        }

        std::string target = args.empty() ? "all" : args.front();

        ConfigurationManager config;
        if (command == "cities")
        {
            for (std::string const& city : config.listCities())
                std::cout << city << "\n";
            return 0;
        }

        boost::asio::io_context io;
        HttpClient client(io, config.getUserAgent());
        LiveArrivalFetcher live(client, config);
        SQLiteStore db(config.getDatabasePath());
        TransitService service(config, db, live);

        std::cout << "[System] Database: " << config.getDatabasePath() << "\n";

        if (command == "download")
        {
            printDownloads(service.downloadFeed(target));
        }
        else if (command == "import")
        {
            printImports(service.importFeed(target));
        }
        else if (command == "sync")
        {
            SyncResult result = service.syncFeed(target);
            printDownloads(result.downloads);
            printImports(result.imports);
        }
        else if (command == "stats")
        {
            for (auto const& [table, n] : service.stats())
                std::cout << "   | " << std::left << std::setw(16) << table << n << "\n";
        }
        else if (command == "arrivals")
        {
            if (args.empty())
            {
                printUsage();
                return 1;
            }
            for (std::string const& stopId : args)
                boost::asio::co_spawn(io, printArrivals(service, stopId), boost::asio::detached);
            io.run();
        }
        else if (command == "routes")
        {
            if (args.empty())
            {
                printUsage();
                return 1;
            }
            printRoutes(service.getRoutesForStop(args.front()));
        }
        else
        {
            std::cerr << "Unknown command: " << command << "\n";
            printUsage();
            return 1;
        }
    }
    catch (const std::exception& e)
    {
        std::cerr << "Main Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
