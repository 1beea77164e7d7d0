#pragma once
#include <string>
#include <ctime>

// GTFS clock strings vs. Cyprus local timestamps.
//
// All local times use a single fixed offset (UTC+02:00, no DST). A GTFS time
// may run past 24:00:00; "25:30:00" is 01:30 on the following day.
class TimeNormalizer
{
public:
    static constexpr int UTC_OFFSET_SECONDS = 2 * 3600;
    static constexpr int SECONDS_PER_DAY = 86400;
    static constexpr int MAX_HOURS = 500000;   // keeps timeToSeconds within int

    // Anchors `text` to the local calendar day of `reference`.
    // Throws ParseError on empty or malformed input.
    static std::time_t parseGtfsTime(std::string const& text, std::time_t reference);

    static std::string formatGtfsTime(std::time_t t);

    // Raw seconds since midnight, no rollover reduction: "25:30:00" -> 91800.
    static int timeToSeconds(std::string const& text);
    static std::string secondsToTime(int seconds);

private:
    struct Clock
    {
        int hours;
        int minutes;
        int seconds;
    };

    static Clock parseClock(std::string const& text);
    static int parseField(std::string const& field, std::string const& text);
};
