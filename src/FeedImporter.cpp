#include <algorithm>
#include <iostream>
#include <set>
#include "Errors.hpp"
#include "FeedImporter.hpp"

namespace
{
std::string required(CsvRow const& row, std::string const& key)
{
    std::string value = Parser::field(row, key);
    if (value.empty())
        throw ParseError("missing " + key);
    return value;
}

int requiredInt(CsvRow const& row, std::string const& key)
{
    std::string value = Parser::field(row, key);
    auto n = Parser::parseInt(value);
    if (!n)
        throw ParseError("bad " + key + " '" + value + "'");
    return *n;
}

double requiredDouble(CsvRow const& row, std::string const& key)
{
    std::string value = Parser::field(row, key);
    auto d = Parser::parseDouble(value);
    if (!d)
        throw ParseError("bad " + key + " '" + value + "'");
    return *d;
}

// Blank means `fallback`; anything else must be an integer.
int intOr(CsvRow const& row, std::string const& key, int fallback)
{
    std::string value = Parser::field(row, key);
    if (value.empty())
        return fallback;
    auto n = Parser::parseInt(value);
    if (!n)
        throw ParseError("bad " + key + " '" + value + "'");
    return *n;
}

// Optional columns degrade to "absent" instead of failing the row.
std::optional<int> optionalInt(CsvRow const& row, std::string const& key)
{
    return Parser::parseInt(Parser::field(row, key));
}

std::optional<double> optionalDouble(CsvRow const& row, std::string const& key)
{
    return Parser::parseDouble(Parser::field(row, key));
}

template <class Row>
std::vector<Row> convert(FeedArchive const& archive, char const* table, Row (*toRow)(CsvRow const&))
{
    std::string fileName = std::string(table) + ".txt";
    std::vector<CsvRow> raw = archive.readTable(fileName);

    std::vector<Row> rows;
    rows.reserve(raw.size());

    // Line numbers count the header as line 1.
    std::size_t line = 1;
    for (CsvRow const& csv : raw)
    {
        ++line;
        try
        {
            rows.push_back(toRow(csv));
        }
        catch (ParseError const& e)
        {
            std::cerr << "[Import] " << fileName << " line " << line << " skipped: " << e.what() << "\n";
        }
    }
    return rows;
}
}

FeedImporter::FeedImporter(SQLiteStore& s, ConfigurationManager const& cfg)
    : store(s)
    , config(cfg)
{
}

std::map<std::string, ImportResult> FeedImporter::import(std::string const& cityOrAll)
{
    std::vector<std::string> cities;

    if (cityOrAll == "all")
    {
        for (std::string const& city : config.listCities())
        {
            if (std::filesystem::exists(config.archivePath(city)))
                cities.push_back(city);
        }
    }
    else
    {
        if (!ConfigurationManager::isSafeCityId(cityOrAll))
            throw UnknownCityError("Invalid city id: " + cityOrAll);
        if (!std::filesystem::exists(config.archivePath(cityOrAll)))
            throw ArchiveNotFoundError("GTFS file not found: " + config.archivePath(cityOrAll).string());
        cities.push_back(cityOrAll);
    }

    std::map<std::string, ImportResult> results;
    for (std::string const& city : cities)
    {
        ImportResult& result = results[city];
        try
        {
            result.rowCounts = importCity(city);
            result.success = true;
        }
        catch (std::exception const& e)
        {
            std::cerr << "[Import] Error importing " << city << ": " << e.what() << "\n";
            result.error = e.what();
        }
    }
    return results;
}

TableCounts FeedImporter::importCity(std::string const& city)
{
    if (!ConfigurationManager::isSafeCityId(city))
        throw UnknownCityError("Invalid city id: " + city);

    std::filesystem::path path = config.archivePath(city);
    if (!std::filesystem::exists(path))
        throw ArchiveNotFoundError("GTFS file not found: " + path.string());

    std::cout << "[Import] Importing GTFS for " << city << "..." << std::endl;
    FeedArchive archive(path);
    TableCounts counts = importArchive(archive);

    std::cout << "[Import] " << city << " done:";
    for (auto const& [table, n] : counts)
        std::cout << " " << table << "=" << n;
    std::cout << std::endl;

    return counts;
}

TableCounts FeedImporter::importArchive(FeedArchive const& archive)
{
    TableCounts counts;

    counts["agency"] = store.upsertAgencies(convert(archive, "agency", &FeedImporter::toAgency));
    counts["stops"]  = store.upsertStops(convert(archive, "stops", &FeedImporter::toStop));
    counts["routes"] = store.upsertRoutes(convert(archive, "routes", &FeedImporter::toRoute));
    counts["calendar"] = store.upsertCalendars(convert(archive, "calendar", &FeedImporter::toCalendar));

    std::vector<CalendarDate> calendarDates = convert(archive, "calendar_dates", &FeedImporter::toCalendarDate);
    std::vector<Trip> trips = convert(archive, "trips", &FeedImporter::toTrip);

    // Services referenced without a calendar.txt row get a placeholder so the
    // foreign keys from calendar_dates and trips hold.
    std::set<std::string> serviceIds;
    for (CalendarDate const& d : calendarDates) serviceIds.insert(d.serviceId);
    for (Trip const& t : trips) serviceIds.insert(t.serviceId);

    std::size_t placeholders = store.insertPlaceholderCalendars(std::vector<std::string>(serviceIds.begin(), serviceIds.end()));
    if (placeholders > 0)
        std::cout << "[Import] Created " << placeholders << " placeholder calendar entries" << std::endl;

    counts["calendar_dates"] = store.upsertCalendarDates(calendarDates);
    counts["trips"] = store.upsertTrips(trips);

    counts["stop_times"] = writeInBatches(convert(archive, "stop_times", &FeedImporter::toStopTime), &SQLiteStore::upsertStopTimes);
    counts["shapes"] = writeInBatches(convert(archive, "shapes", &FeedImporter::toShapePoint), &SQLiteStore::upsertShapes);

    counts["fare_attributes"] = store.upsertFareAttributes(convert(archive, "fare_attributes", &FeedImporter::toFareAttribute));
    counts["fare_rules"] = store.upsertFareRules(convert(archive, "fare_rules", &FeedImporter::toFareRule));

    store.ensureIndexes();
    return counts;
}

template <class Row>
std::size_t FeedImporter::writeInBatches(std::vector<Row> const& rows, std::size_t (SQLiteStore::*write)(std::vector<Row> const&))
{
    std::size_t batchSize = config.getImportBatchSize();
    std::size_t written = 0;

    for (std::size_t start = 0; start < rows.size(); start += batchSize)
    {
        auto first = rows.begin() + static_cast<std::ptrdiff_t>(start);
        auto last = rows.begin() + static_cast<std::ptrdiff_t>(std::min(rows.size(), start + batchSize));
        written += (store.*write)(std::vector<Row>(first, last));
    }
    return written;
}

Agency FeedImporter::toAgency(CsvRow const& row)
{
    Agency a;
    a.agencyId = Parser::field(row, "agency_id");
    a.name     = Parser::field(row, "agency_name");
    a.url      = Parser::field(row, "agency_url");
    a.timezone = Parser::field(row, "agency_timezone", "Europe/Nicosia");
    a.language = Parser::field(row, "agency_lang", "el");
    return a;
}

Stop FeedImporter::toStop(CsvRow const& row)
{
    Stop s;
    s.stopId             = required(row, "stop_id");
    s.code               = Parser::field(row, "stop_code");
    s.name               = Parser::field(row, "stop_name");
    s.description        = Parser::field(row, "stop_desc");
    s.zoneId             = Parser::field(row, "zone_id");
    s.locationType       = optionalInt(row, "location_type").value_or(0);
    s.parentStation      = Parser::field(row, "parent_station");
    s.wheelchairBoarding = optionalInt(row, "wheelchair_boarding").value_or(0);

    std::string lat = Parser::field(row, "stop_lat");
    std::string lon = Parser::field(row, "stop_lon");
    if (lat.empty() && lon.empty())
        return s;

    double latValue = requiredDouble(row, "stop_lat");
    double lonValue = requiredDouble(row, "stop_lon");
    if (latValue != 0.0 && lonValue != 0.0)
    {
        s.lat = latValue;
        s.lon = lonValue;
    }
    return s;
}

Route FeedImporter::toRoute(CsvRow const& row)
{
    Route r;
    r.routeId     = required(row, "route_id");
    r.agencyId    = Parser::field(row, "agency_id");
    r.shortName   = Parser::field(row, "route_short_name");
    r.longName    = Parser::field(row, "route_long_name");
    r.description = Parser::field(row, "route_desc");
    r.routeType   = optionalInt(row, "route_type").value_or(3);
    r.color       = Parser::field(row, "route_color");
    r.textColor   = Parser::field(row, "route_text_color");
    r.sortOrder   = optionalInt(row, "route_sort_order");
    return r;
}

Calendar FeedImporter::toCalendar(CsvRow const& row)
{
    Calendar c;
    c.serviceId = required(row, "service_id");
    c.monday    = intOr(row, "monday", 0) != 0;
    c.tuesday   = intOr(row, "tuesday", 0) != 0;
    c.wednesday = intOr(row, "wednesday", 0) != 0;
    c.thursday  = intOr(row, "thursday", 0) != 0;
    c.friday    = intOr(row, "friday", 0) != 0;
    c.saturday  = intOr(row, "saturday", 0) != 0;
    c.sunday    = intOr(row, "sunday", 0) != 0;
    c.startDate = requiredInt(row, "start_date");
    c.endDate   = requiredInt(row, "end_date");
    return c;
}

CalendarDate FeedImporter::toCalendarDate(CsvRow const& row)
{
    CalendarDate d;
    d.serviceId     = required(row, "service_id");
    d.date          = requiredInt(row, "date");
    d.exceptionType = optionalInt(row, "exception_type").value_or(1);
    return d;
}

Trip FeedImporter::toTrip(CsvRow const& row)
{
    Trip t;
    t.tripId               = required(row, "trip_id");
    t.routeId              = required(row, "route_id");
    t.serviceId            = required(row, "service_id");
    t.headsign             = Parser::field(row, "trip_headsign");
    t.shortName            = Parser::field(row, "trip_short_name");
    t.directionId          = optionalInt(row, "direction_id");
    t.blockId              = Parser::field(row, "block_id");
    t.shapeId              = Parser::field(row, "shape_id");
    t.wheelchairAccessible = optionalInt(row, "wheelchair_accessible").value_or(0);
    t.bikesAllowed         = optionalInt(row, "bikes_allowed").value_or(0);
    return t;
}

StopTime FeedImporter::toStopTime(CsvRow const& row)
{
    StopTime st;
    st.tripId            = required(row, "trip_id");
    st.arrivalTime       = Parser::field(row, "arrival_time");
    st.departureTime     = Parser::field(row, "departure_time");
    st.stopId            = required(row, "stop_id");
    st.stopSequence      = requiredInt(row, "stop_sequence");
    st.stopHeadsign      = Parser::field(row, "stop_headsign");
    st.pickupType        = optionalInt(row, "pickup_type").value_or(0);
    st.dropOffType       = optionalInt(row, "drop_off_type").value_or(0);
    st.shapeDistTraveled = optionalDouble(row, "shape_dist_traveled");
    st.timepoint         = optionalInt(row, "timepoint").value_or(1);
    return st;
}

ShapePoint FeedImporter::toShapePoint(CsvRow const& row)
{
    ShapePoint p;
    p.shapeId      = required(row, "shape_id");
    p.lat          = requiredDouble(row, "shape_pt_lat");
    p.lon          = requiredDouble(row, "shape_pt_lon");
    p.sequence     = requiredInt(row, "shape_pt_sequence");
    p.distTraveled = optionalDouble(row, "shape_dist_traveled");
    return p;
}

FareAttribute FeedImporter::toFareAttribute(CsvRow const& row)
{
    FareAttribute f;
    f.fareId           = required(row, "fare_id");
    f.price            = optionalDouble(row, "price");
    f.currencyType     = Parser::field(row, "currency_type");
    f.paymentMethod    = optionalInt(row, "payment_method").value_or(0);
    f.transfers        = optionalInt(row, "transfers");
    f.agencyId         = Parser::field(row, "agency_id");
    f.transferDuration = optionalInt(row, "transfer_duration");
    return f;
}

FareRule FeedImporter::toFareRule(CsvRow const& row)
{
    FareRule r;
    r.fareId        = required(row, "fare_id");
    r.routeId       = required(row, "route_id");
    r.originId      = Parser::field(row, "origin_id");
    r.destinationId = Parser::field(row, "destination_id");
    return r;
}
