#include <gtest/gtest.h>
#include <string>
#include "LiveArrivalFetcher.hpp"
#include "TestSupport.hpp"

namespace
{
std::string item(std::string const& label, std::string const& time)
{
    return "<li class=\"arrivalTimes__list__item\">"
           "<a href=\"/routes/1\"><span class=\"line__item__text\">" + label + "</span>"
           "<span class=\"arrivalTimes__list__item__link__text2\">" + time + "</span></a>"
           "</li>";
}

std::string page(std::string const& items)
{
    return "<!DOCTYPE html><html><head><meta charset=\"utf-8\"><title>Stop</title></head>"
           "<body><ul class=\"arrivalTimes__list\">" + items + "</ul></body></html>";
}

const std::string MINUTES = "\xCE\x9B\xCE\xB5\xCF\x80\xCF\x84\xCE\xAC";                     // Λεπτά
const std::string ROUTE = "\xCE\x94\xCE\xB9\xCE\xB1\xCE\xB4\xCF\x81\xCE\xBF\xCE\xBC\xCE\xAE";   // Διαδρομή
}

TEST(LiveArrivalParsing, ClockTimeAfterMidnight)
{
    auto arrivals = LiveArrivalFetcher::parsePage(page(item("611", "00:05")), LOCAL_2355);

    ASSERT_EQ(arrivals.size(), 1u);
    EXPECT_EQ(arrivals[0].routeLabel, "611");
    EXPECT_EQ(arrivals[0].minutesUntil, 10);
    EXPECT_EQ(arrivals[0].arrivalTime, "00:05:00");
}

TEST(LiveArrivalParsing, MinutesFormat)
{
    auto arrivals = LiveArrivalFetcher::parsePage(page(item("30", "<b>5</b> " + MINUTES)), LOCAL_2355);

    ASSERT_EQ(arrivals.size(), 1u);
    EXPECT_EQ(arrivals[0].minutesUntil, 5);
    EXPECT_EQ(arrivals[0].arrivalTime, "00:00:00");
}

TEST(LiveArrivalParsing, LabelIsTextBeforeRouteWord)
{
    std::string label = "\xCE\x91" "1 <small>" + ROUTE + "</small> Airport";
    auto arrivals = LiveArrivalFetcher::parsePage(page(item(label, "3 " + MINUTES)), LOCAL_2355);

    ASSERT_EQ(arrivals.size(), 1u);
    EXPECT_EQ(arrivals[0].routeLabel, "\xCE\x91" "1");
}

TEST(LiveArrivalParsing, SkipsPlaceholderAndIncompleteEntries)
{
    std::string placeholder =
        "\xCE\xA0\xCF\x81\xCE\xBF\xCE\xB2\xCE\xBB\xCE\xB5\xCF\x80\xCF\x8C\xCE\xB5\xCE\xBD\xCE\xB7 "
        "\xCF\x8E\xCF\x81\xCE\xB1 "
        "\xCF\x83\xCF\x8D\xCE\xBC\xCF\x86\xCF\x89\xCE\xBD "
        "\xCE\xBC\xCE\xB5 "
        "\xCF\x84\xCE\xBF "
        "\xCF\x87\xCF\x81\xCE\xBF\xCE\xBD\xCE\xBF\xCE\xB4\xCE\xB9\xCE\xAC\xCE\xB3\xCF\x81\xCE\xB1\xCE\xBC\xCE\xBC\xCE\xB1";

    std::string items =
        item("611", placeholder)
        + item("", "4 " + MINUTES)
        + item(ROUTE + " only", "4 " + MINUTES)
        + "<li class=\"arrivalTimes__list__item\"><span class=\"line__item__text\">612</span></li>"
        + item("613", "soon")
        + item("614", "2 " + MINUTES);

    auto arrivals = LiveArrivalFetcher::parsePage(page(items), LOCAL_2355);

    ASSERT_EQ(arrivals.size(), 1u);
    EXPECT_EQ(arrivals[0].routeLabel, "614");
}

TEST(LiveArrivalParsing, EarlierClockTimeMeansTomorrow)
{
    auto arrivals = LiveArrivalFetcher::parsePage(page(item("611", "23:50")), LOCAL_2355);

    ASSERT_EQ(arrivals.size(), 1u);
    EXPECT_EQ(arrivals[0].minutesUntil, 24 * 60 - 5);
    EXPECT_EQ(arrivals[0].arrivalTime, "23:50:00");
}

TEST(LiveArrivalParsing, NestedMarkupEntitiesAndExtraClasses)
{
    std::string html = page(
        "<li class=\"arrivalTimes__list__item is-live\" data-x='1'>"
        "  <div class=\"line\"><span class=\"badge line__item__text\">"
        "    <i class=\"icon\"></i><br/>6&amp;11"
        "  </span></div>"
        "  <!-- <span class=\"arrivalTimes__list__item__link__text2\">99 " + MINUTES + "</span> -->"
        "  <div><span class=\"arrivalTimes__list__item__link__text2\">&nbsp;30&nbsp;" + MINUTES + "</span>"
        "  <span class=\"arrivalTimes__list__item__link__text2\">1 " + MINUTES + "</span></div>"
        "</li>");

    auto arrivals = LiveArrivalFetcher::parsePage(html, LOCAL_2355);

    ASSERT_EQ(arrivals.size(), 1u);
    EXPECT_EQ(arrivals[0].routeLabel, "6&11");
    EXPECT_EQ(arrivals[0].minutesUntil, 30);
}

TEST(LiveArrivalParsing, KeepsPageOrder)
{
    std::string items = item("611", "9 " + MINUTES) + item("612", "1 " + MINUTES) + item("613", "00:15");
    auto arrivals = LiveArrivalFetcher::parsePage(page(items), LOCAL_2355);

    ASSERT_EQ(arrivals.size(), 3u);
    EXPECT_EQ(arrivals[0].routeLabel, "611");
    EXPECT_EQ(arrivals[1].routeLabel, "612");
    EXPECT_EQ(arrivals[2].routeLabel, "613");
    EXPECT_EQ(arrivals[2].minutesUntil, 20);
}

TEST(LiveArrivalParsing, EmptyOrForeignPage)
{
    EXPECT_TRUE(LiveArrivalFetcher::parsePage("", LOCAL_2355).empty());
    EXPECT_TRUE(LiveArrivalFetcher::parsePage("<html><body><p>Maintenance</p></body></html>", LOCAL_2355).empty());
}

TEST(LiveArrivalParsing, EntityDecoding)
{
    EXPECT_EQ(LiveArrivalFetcher::decodeEntities("a&lt;b&gt;&quot;c&quot;&#39;&#x41;"), "a<b>\"c\"'A");
    EXPECT_EQ(LiveArrivalFetcher::decodeEntities("&bogus; & done"), "&bogus; & done");
    EXPECT_EQ(LiveArrivalFetcher::trimText("\xC2\xA0 x y \xC2\xA0"), "x y");
}

TEST(LiveArrivalFetch, UnreachableSourceYieldsNothing)
{
    ConfigurationManager config(":memory:", ".", {});
    config.setLiveArrivalsBaseUrl("http://127.0.0.1:1/routes/stop");
    config.setLiveTimeout(std::chrono::seconds(2));

    boost::asio::io_context io;
    HttpClient client(io, config.getUserAgent());
    LiveArrivalFetcher fetcher(client, config);

    std::string stopId = "1234";
    bool done = false;
    std::size_t count = 99;
    boost::asio::co_spawn(io, fetcher.fetch(stopId), [&](std::exception_ptr e, std::vector<LiveArrival> arrivals)
    {
        EXPECT_FALSE(e);
        count = arrivals.size();
        done = true;
    });
    io.run();

    EXPECT_TRUE(done);
    EXPECT_EQ(count, 0u);
}

TEST(LiveArrivalParsing, DataAttributeIsNotTheClassList)
{
    std::string html = page(
        "<li data-class=\"promo\" class=\"arrivalTimes__list__item\">"
        "<span data-class=\"x\" class=\"line__item__text\">611</span>"
        "<span class=\"arrivalTimes__list__item__link__text2\">4 " + MINUTES + "</span>"
        "</li>");

    auto arrivals = LiveArrivalFetcher::parsePage(html, LOCAL_2355);

    ASSERT_EQ(arrivals.size(), 1u);
    EXPECT_EQ(arrivals[0].routeLabel, "611");
    EXPECT_EQ(arrivals[0].minutesUntil, 4);
}

struct LiveArrivalFetchTest : public ::testing::Test
{
protected:
    const std::string longStopId = "stop-id-long-enough-to-live-outside-small-string-storage";

    LocalHttpServer server{ServerReplies{
        {"/routes/stop/" + longStopId, {200, page(item("611", "00:05") + item("612", "7 " + MINUTES))}},
    }};
    ConfigurationManager config{":memory:", ".", {}};
    boost::asio::io_context io;
    HttpClient client{io, "stopboard-test"};
    LiveArrivalFetcher fetcher{client, config, [] { return LOCAL_2355; }};

    void SetUp() override
    {
        config.setLiveArrivalsBaseUrl(server.url("/routes/stop"));
        config.setLiveTimeout(std::chrono::seconds(5));
    }
};

TEST_F(LiveArrivalFetchTest, TemporaryStopIdOutlivesTheCall)
{
    bool done = false;
    std::vector<LiveArrival> arrivals;
    boost::asio::co_spawn(io, fetcher.fetch(std::string(longStopId.begin(), longStopId.end())),
        [&](std::exception_ptr e, std::vector<LiveArrival> result)
        {
            EXPECT_FALSE(e);
            arrivals = std::move(result);
            done = true;
        });
    io.run();

    ASSERT_TRUE(done);
    ASSERT_EQ(arrivals.size(), 2u);
    EXPECT_EQ(arrivals[0].routeLabel, "611");
    EXPECT_EQ(arrivals[0].minutesUntil, 10);
    EXPECT_EQ(arrivals[1].routeLabel, "612");
    EXPECT_EQ(arrivals[1].minutesUntil, 7);

    auto targets = server.requestedTargets();
    ASSERT_EQ(targets.size(), 1u);
    EXPECT_EQ(targets[0], "/routes/stop/" + longStopId);
}

TEST_F(LiveArrivalFetchTest, NotFoundYieldsNothing)
{
    bool done = false;
    std::size_t count = 99;
    boost::asio::co_spawn(io, fetcher.fetch(std::string("9999")), [&](std::exception_ptr e, std::vector<LiveArrival> result)
    {
        EXPECT_FALSE(e);
        count = result.size();
        done = true;
    });
    io.run();

    EXPECT_TRUE(done);
    EXPECT_EQ(count, 0u);
}
