#include <algorithm>
#include <iostream>
#include <unordered_set>
#include "Errors.hpp"
#include "SQLiteStore.hpp"

namespace
{
const char* SCHEMA_SQL =
    "CREATE TABLE IF NOT EXISTS agency ("
    "  agency_id TEXT PRIMARY KEY, "
    "  agency_name TEXT NOT NULL, "
    "  agency_url TEXT NOT NULL, "
    "  agency_timezone TEXT NOT NULL, "
    "  agency_lang TEXT"
    ");"
    "CREATE TABLE IF NOT EXISTS stops ("
    "  stop_id TEXT PRIMARY KEY, "
    "  stop_code TEXT, "
    "  stop_name TEXT, "
    "  stop_desc TEXT, "
    "  stop_lat REAL, "
    "  stop_lon REAL, "
    "  zone_id TEXT, "
    "  location_type INTEGER DEFAULT 0, "
    "  parent_station TEXT, "
    "  wheelchair_boarding INTEGER DEFAULT 0"
    ");"
    "CREATE TABLE IF NOT EXISTS routes ("
    "  route_id TEXT PRIMARY KEY, "
    "  agency_id TEXT REFERENCES agency(agency_id), "
    "  route_short_name TEXT, "
    "  route_long_name TEXT, "
    "  route_desc TEXT, "
    "  route_type INTEGER NOT NULL, "
    "  route_color TEXT, "
    "  route_text_color TEXT, "
    "  route_sort_order INTEGER"
    ");"
    "CREATE TABLE IF NOT EXISTS calendar ("
    "  service_id TEXT PRIMARY KEY, "
    "  monday INTEGER NOT NULL, "
    "  tuesday INTEGER NOT NULL, "
    "  wednesday INTEGER NOT NULL, "
    "  thursday INTEGER NOT NULL, "
    "  friday INTEGER NOT NULL, "
    "  saturday INTEGER NOT NULL, "
    "  sunday INTEGER NOT NULL, "
    "  start_date INTEGER NOT NULL, "
    "  end_date INTEGER NOT NULL"
    ");"
    "CREATE TABLE IF NOT EXISTS calendar_dates ("
    "  service_id TEXT NOT NULL REFERENCES calendar(service_id), "
    "  date INTEGER NOT NULL, "
    "  exception_type INTEGER, "
    "  PRIMARY KEY (service_id, date)"
    ");"
    "CREATE TABLE IF NOT EXISTS trips ("
    "  trip_id TEXT PRIMARY KEY, "
    "  route_id TEXT NOT NULL, "
    "  service_id TEXT NOT NULL REFERENCES calendar(service_id), "
    "  trip_headsign TEXT, "
    "  trip_short_name TEXT, "
    "  direction_id INTEGER, "
    "  block_id TEXT, "
    "  shape_id TEXT, "
    "  wheelchair_accessible INTEGER DEFAULT 0, "
    "  bikes_allowed INTEGER DEFAULT 0"
    ");"
    "CREATE TABLE IF NOT EXISTS stop_times ("
    "  trip_id TEXT NOT NULL REFERENCES trips(trip_id), "
    "  arrival_time TEXT, "
    "  departure_time TEXT, "
    "  stop_id TEXT NOT NULL REFERENCES stops(stop_id), "
    "  stop_sequence INTEGER NOT NULL, "
    "  stop_headsign TEXT, "
    "  pickup_type INTEGER DEFAULT 0, "
    "  drop_off_type INTEGER DEFAULT 0, "
    "  shape_dist_traveled REAL, "
    "  timepoint INTEGER DEFAULT 1, "
    "  PRIMARY KEY (trip_id, stop_sequence)"
    ");"
    "CREATE TABLE IF NOT EXISTS shapes ("
    "  shape_id TEXT NOT NULL, "
    "  shape_pt_lat REAL NOT NULL, "
    "  shape_pt_lon REAL NOT NULL, "
    "  shape_pt_sequence INTEGER NOT NULL, "
    "  shape_dist_traveled REAL, "
    "  PRIMARY KEY (shape_id, shape_pt_sequence)"
    ");"
    "CREATE TABLE IF NOT EXISTS fare_attributes ("
    "  fare_id TEXT PRIMARY KEY, "
    "  price REAL, "
    "  currency_type TEXT, "
    "  payment_method INTEGER, "
    "  transfers INTEGER, "
    "  agency_id TEXT, "
    "  transfer_duration INTEGER"
    ");"
    "CREATE TABLE IF NOT EXISTS fare_rules ("
    "  fare_id TEXT NOT NULL REFERENCES fare_attributes(fare_id), "
    "  route_id TEXT NOT NULL, "
    "  origin_id TEXT, "
    "  destination_id TEXT, "
    "  PRIMARY KEY (fare_id, route_id)"
    ");";

// Merge policies: on a primary key conflict each table either keeps the
// stored row or overwrites the listed columns.

const char* AGENCY_UPSERT =
    "INSERT INTO agency (agency_id, agency_name, agency_url, agency_timezone, agency_lang) "
    "VALUES (?, ?, ?, ?, ?) "
    "ON CONFLICT (agency_id) DO NOTHING;";

const char* STOP_UPSERT =
    "INSERT INTO stops (stop_id, stop_code, stop_name, stop_desc, stop_lat, stop_lon, zone_id, "
    "                   location_type, parent_station, wheelchair_boarding) "
    "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?) "
    "ON CONFLICT (stop_id) DO UPDATE SET "
    "  stop_name = excluded.stop_name, "
    "  stop_lat = excluded.stop_lat, "
    "  stop_lon = excluded.stop_lon;";

const char* ROUTE_UPSERT =
    "INSERT INTO routes (route_id, agency_id, route_short_name, route_long_name, route_desc, "
    "                    route_type, route_color, route_text_color, route_sort_order) "
    "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?) "
    "ON CONFLICT (route_id) DO UPDATE SET "
    "  route_short_name = excluded.route_short_name, "
    "  route_long_name = excluded.route_long_name, "
    "  route_type = excluded.route_type;";

const char* CALENDAR_UPSERT =
    "INSERT INTO calendar (service_id, monday, tuesday, wednesday, thursday, friday, saturday, sunday, "
    "                      start_date, end_date) "
    "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?) "
    "ON CONFLICT (service_id) DO NOTHING;";

const char* PLACEHOLDER_CALENDAR_INSERT =
    "INSERT INTO calendar (service_id, monday, tuesday, wednesday, thursday, friday, saturday, sunday, "
    "                      start_date, end_date) "
    "VALUES (?, 0, 0, 0, 0, 0, 0, 0, 20200101, 20991231) "
    "ON CONFLICT (service_id) DO NOTHING;";

const char* CALENDAR_DATE_UPSERT =
    "INSERT INTO calendar_dates (service_id, date, exception_type) "
    "VALUES (?, ?, ?) "
    "ON CONFLICT (service_id, date) DO NOTHING;";

const char* TRIP_UPSERT =
    "INSERT INTO trips (trip_id, route_id, service_id, trip_headsign, trip_short_name, direction_id, "
    "                   block_id, shape_id, wheelchair_accessible, bikes_allowed) "
    "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?) "
    "ON CONFLICT (trip_id) DO UPDATE SET "
    "  route_id = excluded.route_id, "
    "  service_id = excluded.service_id;";

const char* STOP_TIME_UPSERT =
    "INSERT INTO stop_times (trip_id, arrival_time, departure_time, stop_id, stop_sequence, "
    "                        stop_headsign, pickup_type, drop_off_type, shape_dist_traveled, timepoint) "
    "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?) "
    "ON CONFLICT (trip_id, stop_sequence) DO NOTHING;";

const char* SHAPE_UPSERT =
    "INSERT INTO shapes (shape_id, shape_pt_lat, shape_pt_lon, shape_pt_sequence, shape_dist_traveled) "
    "VALUES (?, ?, ?, ?, ?) "
    "ON CONFLICT (shape_id, shape_pt_sequence) DO NOTHING;";

const char* FARE_ATTRIBUTE_UPSERT =
    "INSERT INTO fare_attributes (fare_id, price, currency_type, payment_method, transfers, "
    "                             agency_id, transfer_duration) "
    "VALUES (?, ?, ?, ?, ?, ?, ?) "
    "ON CONFLICT (fare_id) DO UPDATE SET "
    "  price = excluded.price, "
    "  currency_type = excluded.currency_type;";

const char* FARE_RULE_UPSERT =
    "INSERT INTO fare_rules (fare_id, route_id, origin_id, destination_id) "
    "VALUES (?, ?, ?, ?) "
    "ON CONFLICT (fare_id, route_id) DO UPDATE SET "
    "  origin_id = excluded.origin_id, "
    "  destination_id = excluded.destination_id;";

const char* INDEX_SQL[] = {
    "CREATE INDEX IF NOT EXISTS idx_stops_name ON stops(stop_name)",
    "CREATE INDEX IF NOT EXISTS idx_stops_coords ON stops(stop_lat, stop_lon)",
    "CREATE INDEX IF NOT EXISTS idx_routes_short_name ON routes(route_short_name)",
    "CREATE INDEX IF NOT EXISTS idx_trips_route ON trips(route_id)",
    "CREATE INDEX IF NOT EXISTS idx_trips_service ON trips(service_id)",
    "CREATE INDEX IF NOT EXISTS idx_stop_times_stop ON stop_times(stop_id)",
    "CREATE INDEX IF NOT EXISTS idx_stop_times_trip ON stop_times(trip_id)",
    "CREATE INDEX IF NOT EXISTS idx_stop_times_arrival ON stop_times(arrival_time)",
};

class Statement
{
public:
    Statement(sqlite3* db, char const* sql)
    {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK)
        {
            std::string message = sqlite3_errmsg(db);
            sqlite3_finalize(stmt);
            throw StoreError("Failed to prepare statement: " + message);
        }
    }
    ~Statement() { sqlite3_finalize(stmt); }

    Statement(Statement const&) = delete;
    Statement& operator=(Statement const&) = delete;

    operator sqlite3_stmt*() const { return stmt; }

private:
    sqlite3_stmt* stmt = nullptr;
};

void bindText(sqlite3_stmt* stmt, int index, std::string const& value)
{
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

// GTFS leaves optional columns blank; store those as NULL.
void bindNullableText(sqlite3_stmt* stmt, int index, std::string const& value)
{
    if (value.empty())
        sqlite3_bind_null(stmt, index);
    else
        sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void bindOptional(sqlite3_stmt* stmt, int index, std::optional<double> const& value)
{
    if (value)
        sqlite3_bind_double(stmt, index, *value);
    else
        sqlite3_bind_null(stmt, index);
}

void bindOptional(sqlite3_stmt* stmt, int index, std::optional<int> const& value)
{
    if (value)
        sqlite3_bind_int(stmt, index, *value);
    else
        sqlite3_bind_null(stmt, index);
}

std::string columnText(sqlite3_stmt* stmt, int column)
{
    const unsigned char* text = sqlite3_column_text(stmt, column);
    return text ? reinterpret_cast<const char*>(text) : "";
}

std::optional<double> columnDouble(sqlite3_stmt* stmt, int column)
{
    if (sqlite3_column_type(stmt, column) == SQLITE_NULL)
        return std::nullopt;
    return sqlite3_column_double(stmt, column);
}

std::optional<int> columnInt(sqlite3_stmt* stmt, int column)
{
    if (sqlite3_column_type(stmt, column) == SQLITE_NULL)
        return std::nullopt;
    return sqlite3_column_int(stmt, column);
}

StopPosition toPosition(std::string const& text)
{
    if (text == "origin") return StopPosition::Origin;
    if (text == "destination") return StopPosition::Destination;
    return StopPosition::Intermediate;
}
}

SQLiteStore::SQLiteStore(std::string const& path)
    : db(nullptr)
{
    int rc = sqlite3_open(path.c_str(), &db);
    if (rc != SQLITE_OK)
    {
        std::string message = db ? sqlite3_errmsg(db) : "out of memory";
        std::cerr << "[Store] Failed to open SQLite DB " << path << ": " << message << "\n";
        sqlite3_close(db);
        db = nullptr;
        throw StoreError("Failed to open SQLite DB " + path + ": " + message);
    }

    try
    {
        sqlite3_busy_timeout(db, 5000);
        exec("PRAGMA foreign_keys = ON;", "enable foreign keys");
        exec(SCHEMA_SQL, "create tables");
    }
    catch (StoreError const&)
    {
        sqlite3_close(db);
        db = nullptr;
        throw;
    }
}

SQLiteStore::~SQLiteStore()
{
    if (db) sqlite3_close(db);
}

void SQLiteStore::exec(char const* sql, char const* what)
{
    char* errMsg = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK)
    {
        std::string message = errMsg ? errMsg : "unknown error";
        if (errMsg) sqlite3_free(errMsg);
        throw StoreError(std::string("Failed to ") + what + ": " + message);
    }
}

template <class Row, class Binder>
std::size_t SQLiteStore::writeBatch(char const* table, char const* sql, std::vector<Row> const& rows, Binder bind)
{
    std::lock_guard<std::mutex> lock(mutex);

    if (rows.empty())
        return 0;

    Statement stmt(db, sql);
    exec("BEGIN TRANSACTION;", "begin transaction");

    std::size_t written = 0;
    std::size_t rejected = 0;
    std::string firstRejection;

    for (Row const& row : rows)
    {
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
        bind(stmt, row);

        int rc = sqlite3_step(stmt);
        if (rc == SQLITE_DONE)
        {
            ++written;
        }
        else if ((rc & 0xff) == SQLITE_CONSTRAINT)
        {
            if (rejected++ == 0)
                firstRejection = sqlite3_errmsg(db);
        }
        else
        {
            std::string message = sqlite3_errmsg(db);
            sqlite3_reset(stmt);
            sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr);
            throw StoreError(std::string("Write to ") + table + " failed: " + message);
        }
    }

    sqlite3_reset(stmt);
    try
    {
        exec("COMMIT;", "commit");
    }
    catch (StoreError const&)
    {
        sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr);
        throw;
    }

    if (rejected > 0)
    {
        std::cerr << "[Store] " << table << ": skipped " << rejected
                  << " rows rejected by constraints (" << firstRejection << ")\n";
    }
    return written;
}

std::size_t SQLiteStore::upsertAgencies(std::vector<Agency> const& rows)
{
    return writeBatch("agency", AGENCY_UPSERT, rows, [](sqlite3_stmt* stmt, Agency const& a)
    {
        bindText(stmt, 1, a.agencyId);
        bindText(stmt, 2, a.name);
        bindText(stmt, 3, a.url);
        bindText(stmt, 4, a.timezone);
        bindNullableText(stmt, 5, a.language);
    });
}

std::size_t SQLiteStore::upsertStops(std::vector<Stop> const& rows)
{
    return writeBatch("stops", STOP_UPSERT, rows, [](sqlite3_stmt* stmt, Stop const& s)
    {
        bindText(stmt, 1, s.stopId);
        bindNullableText(stmt, 2, s.code);
        bindText(stmt, 3, s.name);
        bindNullableText(stmt, 4, s.description);
        bindOptional(stmt, 5, s.lat);
        bindOptional(stmt, 6, s.lon);
        bindNullableText(stmt, 7, s.zoneId);
        sqlite3_bind_int(stmt, 8, s.locationType);
        bindNullableText(stmt, 9, s.parentStation);
        sqlite3_bind_int(stmt, 10, s.wheelchairBoarding);
    });
}

std::size_t SQLiteStore::upsertRoutes(std::vector<Route> const& rows)
{
    return writeBatch("routes", ROUTE_UPSERT, rows, [](sqlite3_stmt* stmt, Route const& r)
    {
        bindText(stmt, 1, r.routeId);
        bindNullableText(stmt, 2, r.agencyId);
        bindText(stmt, 3, r.shortName);
        bindText(stmt, 4, r.longName);
        bindNullableText(stmt, 5, r.description);
        sqlite3_bind_int(stmt, 6, r.routeType);
        bindNullableText(stmt, 7, r.color);
        bindNullableText(stmt, 8, r.textColor);
        bindOptional(stmt, 9, r.sortOrder);
    });
}

std::size_t SQLiteStore::upsertCalendars(std::vector<Calendar> const& rows)
{
    return writeBatch("calendar", CALENDAR_UPSERT, rows, [](sqlite3_stmt* stmt, Calendar const& c)
    {
        bindText(stmt, 1, c.serviceId);
        sqlite3_bind_int(stmt, 2, c.monday ? 1 : 0);
        sqlite3_bind_int(stmt, 3, c.tuesday ? 1 : 0);
        sqlite3_bind_int(stmt, 4, c.wednesday ? 1 : 0);
        sqlite3_bind_int(stmt, 5, c.thursday ? 1 : 0);
        sqlite3_bind_int(stmt, 6, c.friday ? 1 : 0);
        sqlite3_bind_int(stmt, 7, c.saturday ? 1 : 0);
        sqlite3_bind_int(stmt, 8, c.sunday ? 1 : 0);
        sqlite3_bind_int(stmt, 9, c.startDate);
        sqlite3_bind_int(stmt, 10, c.endDate);
    });
}

std::size_t SQLiteStore::insertPlaceholderCalendars(std::vector<std::string> const& serviceIds)
{
    std::lock_guard<std::mutex> lock(mutex);

    if (serviceIds.empty())
        return 0;

    Statement stmt(db, PLACEHOLDER_CALENDAR_INSERT);
    exec("BEGIN TRANSACTION;", "begin transaction");

    std::size_t created = 0;
    for (std::string const& serviceId : serviceIds)
    {
        sqlite3_reset(stmt);
        bindText(stmt, 1, serviceId);

        if (sqlite3_step(stmt) != SQLITE_DONE)
        {
            std::string message = sqlite3_errmsg(db);
            sqlite3_reset(stmt);
            sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr);
            throw StoreError("Placeholder calendar insert failed: " + message);
        }
        created += static_cast<std::size_t>(sqlite3_changes(db));
    }

    sqlite3_reset(stmt);
    try
    {
        exec("COMMIT;", "commit");
    }
    catch (StoreError const&)
    {
        sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr);
        throw;
    }
    return created;
}

std::size_t SQLiteStore::upsertCalendarDates(std::vector<CalendarDate> const& rows)
{
    return writeBatch("calendar_dates", CALENDAR_DATE_UPSERT, rows, [](sqlite3_stmt* stmt, CalendarDate const& d)
    {
        bindText(stmt, 1, d.serviceId);
        sqlite3_bind_int(stmt, 2, d.date);
        sqlite3_bind_int(stmt, 3, d.exceptionType);
    });
}

std::size_t SQLiteStore::upsertTrips(std::vector<Trip> const& rows)
{
    return writeBatch("trips", TRIP_UPSERT, rows, [](sqlite3_stmt* stmt, Trip const& t)
    {
        bindText(stmt, 1, t.tripId);
        bindText(stmt, 2, t.routeId);
        bindText(stmt, 3, t.serviceId);
        bindText(stmt, 4, t.headsign);
        bindNullableText(stmt, 5, t.shortName);
        bindOptional(stmt, 6, t.directionId);
        bindNullableText(stmt, 7, t.blockId);
        bindNullableText(stmt, 8, t.shapeId);
        sqlite3_bind_int(stmt, 9, t.wheelchairAccessible);
        sqlite3_bind_int(stmt, 10, t.bikesAllowed);
    });
}

std::size_t SQLiteStore::upsertStopTimes(std::vector<StopTime> const& rows)
{
    return writeBatch("stop_times", STOP_TIME_UPSERT, rows, [](sqlite3_stmt* stmt, StopTime const& st)
    {
        bindText(stmt, 1, st.tripId);
        bindText(stmt, 2, st.arrivalTime);
        bindText(stmt, 3, st.departureTime);
        bindText(stmt, 4, st.stopId);
        sqlite3_bind_int(stmt, 5, st.stopSequence);
        bindNullableText(stmt, 6, st.stopHeadsign);
        sqlite3_bind_int(stmt, 7, st.pickupType);
        sqlite3_bind_int(stmt, 8, st.dropOffType);
        bindOptional(stmt, 9, st.shapeDistTraveled);
        sqlite3_bind_int(stmt, 10, st.timepoint);
    });
}

std::size_t SQLiteStore::upsertShapes(std::vector<ShapePoint> const& rows)
{
    return writeBatch("shapes", SHAPE_UPSERT, rows, [](sqlite3_stmt* stmt, ShapePoint const& p)
    {
        bindText(stmt, 1, p.shapeId);
        sqlite3_bind_double(stmt, 2, p.lat);
        sqlite3_bind_double(stmt, 3, p.lon);
        sqlite3_bind_int(stmt, 4, p.sequence);
        bindOptional(stmt, 5, p.distTraveled);
    });
}

std::size_t SQLiteStore::upsertFareAttributes(std::vector<FareAttribute> const& rows)
{
    return writeBatch("fare_attributes", FARE_ATTRIBUTE_UPSERT, rows, [](sqlite3_stmt* stmt, FareAttribute const& f)
    {
        bindText(stmt, 1, f.fareId);
        bindOptional(stmt, 2, f.price);
        bindNullableText(stmt, 3, f.currencyType);
        sqlite3_bind_int(stmt, 4, f.paymentMethod);
        bindOptional(stmt, 5, f.transfers);
        bindNullableText(stmt, 6, f.agencyId);
        bindOptional(stmt, 7, f.transferDuration);
    });
}

std::size_t SQLiteStore::upsertFareRules(std::vector<FareRule> const& rows)
{
    return writeBatch("fare_rules", FARE_RULE_UPSERT, rows, [](sqlite3_stmt* stmt, FareRule const& r)
    {
        bindText(stmt, 1, r.fareId);
        bindText(stmt, 2, r.routeId);
        bindNullableText(stmt, 3, r.originId);
        bindNullableText(stmt, 4, r.destinationId);
    });
}

void SQLiteStore::ensureIndexes()
{
    std::lock_guard<std::mutex> lock(mutex);

    for (const char* sql : INDEX_SQL)
    {
        char* errMsg = nullptr;
        if (sqlite3_exec(db, sql, nullptr, nullptr, &errMsg) != SQLITE_OK)
        {
            std::cerr << "[Store] Index may already exist: "
                      << (errMsg ? errMsg : "unknown error") << "\n";
            if (errMsg) sqlite3_free(errMsg);
        }
    }
}

std::int64_t SQLiteStore::countRows(std::string const& table)
{
    if (std::find(TABLES.begin(), TABLES.end(), table) == TABLES.end())
        throw StoreError("Unknown table: " + table);

    std::lock_guard<std::mutex> lock(mutex);

    std::string sql = "SELECT COUNT(*) FROM " + table + ";";
    Statement stmt(db, sql.c_str());

    if (sqlite3_step(stmt) != SQLITE_ROW)
        throw StoreError("Count on " + table + " failed: " + sqlite3_errmsg(db));

    return sqlite3_column_int64(stmt, 0);
}

std::optional<Agency> SQLiteStore::findAgency(std::string const& agencyId)
{
    std::lock_guard<std::mutex> lock(mutex);

    Statement stmt(db,
        "SELECT agency_id, agency_name, agency_url, agency_timezone, agency_lang "
        "FROM agency WHERE agency_id = ?;");
    bindText(stmt, 1, agencyId);

    if (sqlite3_step(stmt) != SQLITE_ROW)
        return std::nullopt;

    Agency a;
    a.agencyId = columnText(stmt, 0);
    a.name     = columnText(stmt, 1);
    a.url      = columnText(stmt, 2);
    a.timezone = columnText(stmt, 3);
    a.language = columnText(stmt, 4);
    return a;
}

std::optional<Stop> SQLiteStore::findStop(std::string const& stopId)
{
    std::lock_guard<std::mutex> lock(mutex);

    Statement stmt(db,
        "SELECT stop_id, stop_code, stop_name, stop_desc, stop_lat, stop_lon, zone_id, "
        "       location_type, parent_station, wheelchair_boarding "
        "FROM stops WHERE stop_id = ?;");
    bindText(stmt, 1, stopId);

    if (sqlite3_step(stmt) != SQLITE_ROW)
        return std::nullopt;

    Stop s;
    s.stopId             = columnText(stmt, 0);
    s.code               = columnText(stmt, 1);
    s.name               = columnText(stmt, 2);
    s.description        = columnText(stmt, 3);
    s.lat                = columnDouble(stmt, 4);
    s.lon                = columnDouble(stmt, 5);
    s.zoneId             = columnText(stmt, 6);
    s.locationType       = columnInt(stmt, 7).value_or(0);
    s.parentStation      = columnText(stmt, 8);
    s.wheelchairBoarding = columnInt(stmt, 9).value_or(0);
    return s;
}

std::optional<Route> SQLiteStore::findRoute(std::string const& routeId)
{
    std::lock_guard<std::mutex> lock(mutex);

    Statement stmt(db,
        "SELECT route_id, agency_id, route_short_name, route_long_name, route_desc, route_type, "
        "       route_color, route_text_color, route_sort_order "
        "FROM routes WHERE route_id = ?;");
    bindText(stmt, 1, routeId);

    if (sqlite3_step(stmt) != SQLITE_ROW)
        return std::nullopt;

    Route r;
    r.routeId     = columnText(stmt, 0);
    r.agencyId    = columnText(stmt, 1);
    r.shortName   = columnText(stmt, 2);
    r.longName    = columnText(stmt, 3);
    r.description = columnText(stmt, 4);
    r.routeType   = columnInt(stmt, 5).value_or(3);
    r.color       = columnText(stmt, 6);
    r.textColor   = columnText(stmt, 7);
    r.sortOrder   = columnInt(stmt, 8);
    return r;
}

std::optional<Calendar> SQLiteStore::findCalendar(std::string const& serviceId)
{
    std::lock_guard<std::mutex> lock(mutex);

    Statement stmt(db,
        "SELECT service_id, monday, tuesday, wednesday, thursday, friday, saturday, sunday, "
        "       start_date, end_date "
        "FROM calendar WHERE service_id = ?;");
    bindText(stmt, 1, serviceId);

    if (sqlite3_step(stmt) != SQLITE_ROW)
        return std::nullopt;

    Calendar c;
    c.serviceId = columnText(stmt, 0);
    c.monday    = sqlite3_column_int(stmt, 1) != 0;
    c.tuesday   = sqlite3_column_int(stmt, 2) != 0;
    c.wednesday = sqlite3_column_int(stmt, 3) != 0;
    c.thursday  = sqlite3_column_int(stmt, 4) != 0;
    c.friday    = sqlite3_column_int(stmt, 5) != 0;
    c.saturday  = sqlite3_column_int(stmt, 6) != 0;
    c.sunday    = sqlite3_column_int(stmt, 7) != 0;
    c.startDate = sqlite3_column_int(stmt, 8);
    c.endDate   = sqlite3_column_int(stmt, 9);
    return c;
}

std::optional<Trip> SQLiteStore::findTrip(std::string const& tripId)
{
    std::lock_guard<std::mutex> lock(mutex);

    Statement stmt(db,
        "SELECT trip_id, route_id, service_id, trip_headsign, trip_short_name, direction_id, "
        "       block_id, shape_id, wheelchair_accessible, bikes_allowed "
        "FROM trips WHERE trip_id = ?;");
    bindText(stmt, 1, tripId);

    if (sqlite3_step(stmt) != SQLITE_ROW)
        return std::nullopt;

    Trip t;
    t.tripId               = columnText(stmt, 0);
    t.routeId              = columnText(stmt, 1);
    t.serviceId            = columnText(stmt, 2);
    t.headsign             = columnText(stmt, 3);
    t.shortName            = columnText(stmt, 4);
    t.directionId          = columnInt(stmt, 5);
    t.blockId              = columnText(stmt, 6);
    t.shapeId              = columnText(stmt, 7);
    t.wheelchairAccessible = columnInt(stmt, 8).value_or(0);
    t.bikesAllowed         = columnInt(stmt, 9).value_or(0);
    return t;
}

std::vector<StopTime> SQLiteStore::stopTimesForTrip(std::string const& tripId)
{
    std::lock_guard<std::mutex> lock(mutex);

    Statement stmt(db,
        "SELECT trip_id, arrival_time, departure_time, stop_id, stop_sequence, stop_headsign, "
        "       pickup_type, drop_off_type, shape_dist_traveled, timepoint "
        "FROM stop_times WHERE trip_id = ? "
        "ORDER BY stop_sequence;");
    bindText(stmt, 1, tripId);

    std::vector<StopTime> results;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
    {
        StopTime st;
        st.tripId            = columnText(stmt, 0);
        st.arrivalTime       = columnText(stmt, 1);
        st.departureTime     = columnText(stmt, 2);
        st.stopId            = columnText(stmt, 3);
        st.stopSequence      = sqlite3_column_int(stmt, 4);
        st.stopHeadsign      = columnText(stmt, 5);
        st.pickupType        = columnInt(stmt, 6).value_or(0);
        st.dropOffType       = columnInt(stmt, 7).value_or(0);
        st.shapeDistTraveled = columnDouble(stmt, 8);
        st.timepoint         = columnInt(stmt, 9).value_or(1);
        results.push_back(std::move(st));
    }

    if (rc != SQLITE_DONE)
        throw StoreError("Error stepping stopTimesForTrip: " + std::string(sqlite3_errmsg(db)));

    return results;
}

std::vector<StopRoute> SQLiteStore::routesForStop(std::string const& stopId)
{
    std::lock_guard<std::mutex> lock(mutex);

    const char* sql =
        "WITH bounds AS ("
        "  SELECT trip_id, MIN(stop_sequence) AS min_seq, MAX(stop_sequence) AS max_seq "
        "  FROM stop_times "
        "  WHERE trip_id IN (SELECT trip_id FROM stop_times WHERE stop_id = ?1) "
        "  GROUP BY trip_id"
        ") "
        "SELECT r.route_id, r.route_short_name, r.route_long_name, "
        "       r.route_color, r.route_text_color, t.trip_headsign, "
        "       CASE WHEN st.stop_sequence = b.min_seq THEN 'origin' "
        "            WHEN st.stop_sequence = b.max_seq THEN 'destination' "
        "            ELSE 'intermediate' END AS stop_position "
        "FROM stop_times st "
        "JOIN bounds b ON b.trip_id = st.trip_id "
        "JOIN trips t ON t.trip_id = st.trip_id "
        "JOIN routes r ON r.route_id = t.route_id "
        "WHERE st.stop_id = ?1 "
        "ORDER BY r.route_short_name, st.trip_id, st.stop_sequence;";

    Statement stmt(db, sql);
    bindText(stmt, 1, stopId);

    std::vector<StopRoute> results;
    std::unordered_set<std::string> seen;

    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
    {
        std::string shortName = columnText(stmt, 1);
        if (!seen.insert(shortName).second)
            continue;

        StopRoute route;
        route.routeId   = columnText(stmt, 0);
        route.shortName = shortName;
        route.longName  = columnText(stmt, 2);
        route.color     = columnText(stmt, 3);
        route.textColor = columnText(stmt, 4);
        route.headsign  = columnText(stmt, 5);
        route.position  = toPosition(columnText(stmt, 6));

        if (route.color.empty())     route.color = "FFFFFF";
        if (route.textColor.empty()) route.textColor = "000000";

        results.push_back(std::move(route));
    }

    if (rc != SQLITE_DONE)
        throw StoreError("Error stepping routesForStop: " + std::string(sqlite3_errmsg(db)));

    return results;
}
