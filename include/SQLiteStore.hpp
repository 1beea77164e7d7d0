#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "sqlite3.h"
#include "Types.hpp"

// Relational GTFS store on a single SQLite connection. Every public member
// takes the connection lock, so readers on other threads are safe.
//
// Each write call runs in its own transaction and applies that table's merge
// policy (see the *_UPSERT statements in SQLiteStore.cpp). Rows rejected by a
// constraint, such as a stop_time whose stop was dropped, are skipped and
// logged; any other failure rolls back the call and throws StoreError.
class SQLiteStore
{
private:
    sqlite3* db;
    std::mutex mutex;

    void exec(char const* sql, char const* what);
    template <class Row, class Binder>
    std::size_t writeBatch(char const* table, char const* sql, std::vector<Row> const& rows, Binder bind);

public:
    static inline const std::vector<std::string> TABLES = {
        "agency", "stops", "routes", "calendar", "calendar_dates",
        "trips", "stop_times", "shapes", "fare_attributes", "fare_rules"
    };

    explicit SQLiteStore(std::string const& path);
    ~SQLiteStore();

    SQLiteStore(SQLiteStore const&) = delete;
    SQLiteStore& operator=(SQLiteStore const&) = delete;

    std::size_t upsertAgencies(std::vector<Agency> const& rows);
    std::size_t upsertStops(std::vector<Stop> const& rows);
    std::size_t upsertRoutes(std::vector<Route> const& rows);
    std::size_t upsertCalendars(std::vector<Calendar> const& rows);
    std::size_t upsertCalendarDates(std::vector<CalendarDate> const& rows);
    std::size_t upsertTrips(std::vector<Trip> const& rows);
    std::size_t upsertStopTimes(std::vector<StopTime> const& rows);
    std::size_t upsertShapes(std::vector<ShapePoint> const& rows);
    std::size_t upsertFareAttributes(std::vector<FareAttribute> const& rows);
    std::size_t upsertFareRules(std::vector<FareRule> const& rows);

    // All-days-off calendar rows spanning 2020-2099 for service ids that have
    // none. Returns how many were created.
    std::size_t insertPlaceholderCalendars(std::vector<std::string> const& serviceIds);

    // Best effort, failures are logged.
    void ensureIndexes();

    // Throws StoreError for a table outside TABLES.
    std::int64_t countRows(std::string const& table);

    std::optional<Agency> findAgency(std::string const& agencyId);
    std::optional<Stop> findStop(std::string const& stopId);
    std::optional<Route> findRoute(std::string const& routeId);
    std::optional<Calendar> findCalendar(std::string const& serviceId);
    std::optional<Trip> findTrip(std::string const& tripId);

    // In stop_sequence order.
    std::vector<StopTime> stopTimesForTrip(std::string const& tripId);

    // Routes calling at a stop, one entry per short name, with the stop's
    // position on the first matching trip.
    std::vector<StopRoute> routesForStop(std::string const& stopId);
};
