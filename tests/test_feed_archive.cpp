#include <gtest/gtest.h>
#include <algorithm>
#include "Errors.hpp"
#include "FeedArchive.hpp"
#include "TestSupport.hpp"

struct FeedArchiveTest : public ::testing::Test
{
protected:
    TempDir dir;
    std::filesystem::path zip;

    void SetUp() override
    {
        zip = dir / "pafos.zip";
        writeZip(zip, {
            {"stops.txt", "\xEF\xBB\xBF" "stop_id,stop_name\nS1,\xCE\x9B\xCE\xB9\xCE\xBC\xCE\xAC\xCE\xBD\xCE\xB9\n"},
            {"routes.txt", "route_id,route_short_name\nR1,611\n"},
            {"trips.txt", "trip_id\n\xFF\xFE\n"},
        });
    }
};

TEST_F(FeedArchiveTest, ReadsTableAndStripsBom)
{
    FeedArchive archive(zip);
    auto rows = archive.readTable("stops.txt");
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].at("stop_id"), "S1");
}

TEST_F(FeedArchiveTest, AbsentTableIsEmpty)
{
    FeedArchive archive(zip);
    EXPECT_FALSE(archive.hasTable("shapes.txt"));
    EXPECT_TRUE(archive.readTable("shapes.txt").empty());
}

TEST_F(FeedArchiveTest, InvalidUtf8TableIsEmpty)
{
    FeedArchive archive(zip);
    EXPECT_TRUE(archive.hasTable("trips.txt"));
    EXPECT_TRUE(archive.readTable("trips.txt").empty());
}

TEST_F(FeedArchiveTest, ListsTables)
{
    FeedArchive archive(zip);
    auto names = archive.tableNames();
    std::sort(names.begin(), names.end());
    EXPECT_EQ(names, (std::vector<std::string>{"routes.txt", "stops.txt", "trips.txt"}));
}

TEST_F(FeedArchiveTest, CorruptArchiveThrowsOnOpen)
{
    auto bad = dir / "bad.zip";
    writeFile(bad, "this is not a zip archive");
    EXPECT_THROW(FeedArchive archive(bad), ParseError);
    EXPECT_THROW(FeedArchive archive(dir / "missing.zip"), ParseError);
}

TEST_F(FeedArchiveTest, OneShotReadNeverThrows)
{
    auto bad = dir / "bad.zip";
    writeFile(bad, "PK garbage");

    EXPECT_EQ(FeedArchive::readTable(zip, "routes.txt").size(), 1u);
    EXPECT_TRUE(FeedArchive::readTable(bad, "routes.txt").empty());
    EXPECT_TRUE(FeedArchive::readTable(dir / "missing.zip", "routes.txt").empty());
}
