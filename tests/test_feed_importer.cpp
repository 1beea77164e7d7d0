#include <gtest/gtest.h>
#include "ConfigurationManager.hpp"
#include "Errors.hpp"
#include "FeedImporter.hpp"
#include "SQLiteStore.hpp"
#include "TestSupport.hpp"

struct FeedImporterTest : public ::testing::Test
{
protected:
    TempDir dir;
    SQLiteStore store{":memory:"};
    ConfigurationManager config{":memory:", dir.get(), {
        {"pafos", "http://127.0.0.1:1/pafos.zip"},
        {"larnaca", "http://127.0.0.1:1/larnaca.zip"},
        {"nicosia", "http://127.0.0.1:1/nicosia.zip"},
    }};
    FeedImporter importer{store, config};
};

TEST_F(FeedImporterTest, ImportsAllTablesInOrder)
{
    writeZip(config.archivePath("pafos"), sampleFeed());

    TableCounts counts = importer.importCity("pafos");

    EXPECT_EQ(counts["agency"], 1);
    EXPECT_EQ(counts["stops"], 6);
    EXPECT_EQ(counts["routes"], 2);
    EXPECT_EQ(counts["calendar"], 1);
    EXPECT_EQ(counts["calendar_dates"], 2);
    EXPECT_EQ(counts["trips"], 2);
    EXPECT_EQ(counts["stop_times"], 5);
    EXPECT_EQ(counts["shapes"], 2);
    EXPECT_EQ(counts["fare_attributes"], 1);
    EXPECT_EQ(counts["fare_rules"], 1);

    EXPECT_EQ(store.countRows("calendar"), 2);
    EXPECT_EQ(store.countRows("stop_times"), 5);
}

TEST_F(FeedImporterTest, StopCoordinateRules)
{
    writeZip(config.archivePath("pafos"), sampleFeed());
    importer.importCity("pafos");

    auto harbour = store.findStop("S1");
    ASSERT_TRUE(harbour);
    ASSERT_TRUE(harbour->lat);
    EXPECT_DOUBLE_EQ(*harbour->lat, 34.75);

    auto depot = store.findStop("S4");
    ASSERT_TRUE(depot);
    EXPECT_FALSE(depot->lat);
    EXPECT_FALSE(depot->lon);

    auto zero = store.findStop("S6");
    ASSERT_TRUE(zero);
    EXPECT_FALSE(zero->lat);
    EXPECT_FALSE(zero->lon);

    auto meridian = store.findStop("S7");
    ASSERT_TRUE(meridian);
    EXPECT_FALSE(meridian->lat);
    EXPECT_FALSE(meridian->lon);

    EXPECT_FALSE(store.findStop("S5"));
}

TEST_F(FeedImporterTest, DefaultsForUnparsableRouteTypeAndMissingAgencyColumns)
{
    writeZip(config.archivePath("pafos"), sampleFeed());
    importer.importCity("pafos");

    EXPECT_EQ(store.findRoute("R2")->routeType, 3);
    EXPECT_EQ(store.findAgency("OSYPA")->language, "el");
    EXPECT_EQ(store.findAgency("OSYPA")->timezone, "Europe/Nicosia");
}

TEST_F(FeedImporterTest, PlaceholderCalendarPrecedesDependents)
{
    writeZip(config.archivePath("pafos"), sampleFeed());
    importer.importCity("pafos");

    auto holiday = store.findCalendar("HOL");
    ASSERT_TRUE(holiday);
    EXPECT_FALSE(holiday->monday);
    EXPECT_EQ(holiday->startDate, 20200101);
    EXPECT_EQ(holiday->endDate, 20991231);
    EXPECT_TRUE(store.findTrip("T2"));

    importer.importCity("pafos");
    EXPECT_EQ(store.countRows("calendar"), 2);
}

TEST_F(FeedImporterTest, RepeatedImportIsIdempotent)
{
    writeZip(config.archivePath("pafos"), sampleFeed());

    TableCounts first = importer.importCity("pafos");
    TableCounts storedFirst;
    for (std::string const& table : SQLiteStore::TABLES)
        storedFirst[table] = store.countRows(table);

    TableCounts second = importer.importCity("pafos");
    TableCounts storedSecond;
    for (std::string const& table : SQLiteStore::TABLES)
        storedSecond[table] = store.countRows(table);

    EXPECT_EQ(first, second);
    EXPECT_EQ(storedFirst, storedSecond);
}

TEST_F(FeedImporterTest, SmallBatchesWriteEverything)
{
    config.setImportBatchSize(2);
    writeZip(config.archivePath("pafos"), sampleFeed());

    TableCounts counts = importer.importCity("pafos");
    EXPECT_EQ(counts["stop_times"], 5);
    EXPECT_EQ(store.countRows("stop_times"), 5);
    EXPECT_EQ(store.stopTimesForTrip("T2").back().arrivalTime, "25:30:00");
}

TEST_F(FeedImporterTest, CorruptArchiveIsIsolated)
{
    writeZip(config.archivePath("pafos"), sampleFeed());
    writeFile(config.archivePath("larnaca"), "not a zip");

    auto results = importer.import("all");

    ASSERT_EQ(results.size(), 2u);
    EXPECT_TRUE(results["pafos"].success);
    EXPECT_EQ(results["pafos"].rowCounts["stops"], 6);
    EXPECT_FALSE(results["larnaca"].success);
    EXPECT_FALSE(results["larnaca"].error.empty());
    EXPECT_EQ(results.count("nicosia"), 0u);
}

TEST_F(FeedImporterTest, NamedCityErrors)
{
    EXPECT_THROW(importer.import("nicosia"), ArchiveNotFoundError);
    EXPECT_THROW(importer.import("../etc"), UnknownCityError);
    EXPECT_THROW(importer.import("Pafos"), UnknownCityError);
}

TEST_F(FeedImporterTest, NamedCityFailureIsRecorded)
{
    writeFile(config.archivePath("larnaca"), "not a zip");
    auto results = importer.import("larnaca");
    ASSERT_EQ(results.size(), 1u);
    EXPECT_FALSE(results["larnaca"].success);
}

TEST_F(FeedImporterTest, ArchiveWithoutOptionalTables)
{
    writeZip(config.archivePath("nicosia"), {
        {"stops.txt", "stop_id,stop_name,stop_lat,stop_lon\nN1,Eleftheria,35.17,33.36\n"},
    });

    TableCounts counts = importer.importCity("nicosia");
    EXPECT_EQ(counts["stops"], 1);
    EXPECT_EQ(counts["trips"], 0);
    EXPECT_EQ(counts["fare_rules"], 0);
}
