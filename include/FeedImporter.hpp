#pragma once
#include <map>
#include <string>
#include <vector>
#include "ConfigurationManager.hpp"
#include "FeedArchive.hpp"
#include "Parser.hpp"
#include "SQLiteStore.hpp"
#include "Types.hpp"

// Loads downloaded city archives into the store, parents before children:
// agency, stops, routes, calendar, calendar_dates, trips, stop_times, shapes,
// fare_attributes, fare_rules. Re-running an import is safe; each table's
// merge policy decides what a second pass may change.
class FeedImporter
{
private:
    SQLiteStore& store;
    ConfigurationManager const& config;

    template <class Row>
    std::size_t writeInBatches(std::vector<Row> const& rows, std::size_t (SQLiteStore::*write)(std::vector<Row> const&));

    // Row converters throw ParseError for a row that has to be skipped.
    static Agency toAgency(CsvRow const& row);
    static Stop toStop(CsvRow const& row);
    static Route toRoute(CsvRow const& row);
    static Calendar toCalendar(CsvRow const& row);
    static CalendarDate toCalendarDate(CsvRow const& row);
    static Trip toTrip(CsvRow const& row);
    static StopTime toStopTime(CsvRow const& row);
    static ShapePoint toShapePoint(CsvRow const& row);
    static FareAttribute toFareAttribute(CsvRow const& row);
    static FareRule toFareRule(CsvRow const& row);

public:
    FeedImporter(SQLiteStore& store, ConfigurationManager const& config);

    // "all" imports every configured city with an archive on disk; one
    // city's failure is recorded in its result and the rest carry on.
    // A named city without an archive throws ArchiveNotFoundError, and an id
    // that is not a safe file name throws UnknownCityError.
    std::map<std::string, ImportResult> import(std::string const& cityOrAll);

    // Throws on any failure that aborts the city.
    TableCounts importCity(std::string const& city);

    TableCounts importArchive(FeedArchive const& archive);
};
