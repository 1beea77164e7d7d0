#pragma once
#include <ctime>
#include <functional>
#include <string>
#include <string_view>
#include <vector>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include "ConfigurationManager.hpp"
#include "HttpClient.hpp"
#include "Types.hpp"

// Where live predictions for a stop come from.
class ArrivalSource
{
public:
    virtual ~ArrivalSource() = default;

    // Never throws; an unavailable source yields no arrivals.
    virtual boost::asio::awaitable<std::vector<LiveArrival>> fetch(std::string stopId) = 0;
};

// Scrapes the operator's per-stop arrivals page.
class LiveArrivalFetcher : public ArrivalSource
{
private:
    HttpClient& client;
    ConfigurationManager const& config;
    std::function<std::time_t()> clock;

    struct RawEntry
    {
        std::string label;
        std::string timeText;
    };

    static std::vector<RawEntry> extractEntries(std::string_view html);
    static std::string routeLabel(std::string const& text);
    static bool isPlaceholder(std::string const& timeText);
    static std::string percentEncode(std::string const& text);

public:
    static inline const std::string MINUTES_WORD = "Λεπτά";
    static inline const std::string ROUTE_WORD = "Διαδρομή";

    // `clock` supplies "now" for the fetched pages; the wall clock when empty.
    LiveArrivalFetcher(HttpClient& client, ConfigurationManager const& config, std::function<std::time_t()> clock = {});

    boost::asio::awaitable<std::vector<LiveArrival>> fetch(std::string stopId) override;

    // Pure: the arrivals listed in `html` as seen at `now`. Entries without a
    // live estimate, with an unreadable time or already in the past are left
    // out.
    static std::vector<LiveArrival> parsePage(std::string_view html, std::time_t now);

    // Named (amp, lt, gt, quot, apos, nbsp) and numeric character references.
    static std::string decodeEntities(std::string_view text);

    // Strips ASCII whitespace and no-break spaces from both ends.
    static std::string trimText(std::string const& text);
};
