#include "TimeNormalizer.hpp"

#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <vector>
#include <date/date.h>
#include "Errors.hpp"

namespace
{
date::local_seconds toLocal(std::time_t t)
{
    return date::local_seconds{std::chrono::seconds{static_cast<std::int64_t>(t) + TimeNormalizer::UTC_OFFSET_SECONDS}};
}

std::time_t fromLocal(date::local_seconds local)
{
    return static_cast<std::time_t>(local.time_since_epoch().count() - TimeNormalizer::UTC_OFFSET_SECONDS);
}
}

int TimeNormalizer::parseField(std::string const& field, std::string const& text)
{
    std::size_t begin = 0;
    std::size_t end = field.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(field[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(field[end - 1]))) --end;

    if (begin == end || end - begin > 9)
        throw ParseError("Malformed time value: '" + text + "'");

    int value = 0;
    for (std::size_t i = begin; i < end; ++i)
    {
        if (!std::isdigit(static_cast<unsigned char>(field[i])))
            throw ParseError("Malformed time value: '" + text + "'");
        value = value * 10 + (field[i] - '0');
    }
    return value;
}

TimeNormalizer::Clock TimeNormalizer::parseClock(std::string const& text)
{
    if (text.empty())
        throw ParseError("Time string cannot be empty");

    std::vector<std::string> fields;
    std::size_t start = 0;
    for (;;)
    {
        std::size_t colon = text.find(':', start);
        fields.push_back(text.substr(start, colon == std::string::npos ? std::string::npos : colon - start));
        if (colon == std::string::npos)
            break;
        start = colon + 1;
    }

    if (fields.size() > 3)
        throw ParseError("Malformed time value: '" + text + "'");

    Clock clock{};
    clock.hours   = parseField(fields[0], text);
    clock.minutes = fields.size() > 1 ? parseField(fields[1], text) : 0;
    clock.seconds = fields.size() > 2 ? parseField(fields[2], text) : 0;

    if (clock.minutes > 59 || clock.seconds > 59)
        throw ParseError("Minute or second out of range: '" + text + "'");
    if (clock.hours > MAX_HOURS)
        throw ParseError("Hour out of range: '" + text + "'");

    return clock;
}

std::time_t TimeNormalizer::parseGtfsTime(std::string const& text, std::time_t reference)
{
    Clock clock = parseClock(text);

    int daysOffset = clock.hours / 24;
    int hour       = clock.hours % 24;

    auto day = date::floor<date::days>(toLocal(reference));
    auto local = day + date::days{daysOffset}
               + std::chrono::hours{hour}
               + std::chrono::minutes{clock.minutes}
               + std::chrono::seconds{clock.seconds};

    return fromLocal(local);
}

std::string TimeNormalizer::formatGtfsTime(std::time_t t)
{
    auto local = toLocal(t);
    auto day = date::floor<date::days>(local);
    date::hh_mm_ss<std::chrono::seconds> tod{local - day};

    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%02d:%02d:%02d",
                  static_cast<int>(tod.hours().count()),
                  static_cast<int>(tod.minutes().count()),
                  static_cast<int>(tod.seconds().count()));
    return buffer;
}

int TimeNormalizer::timeToSeconds(std::string const& text)
{
    Clock clock = parseClock(text);
    return clock.hours * 3600 + clock.minutes * 60 + clock.seconds;
}

std::string TimeNormalizer::secondsToTime(int seconds)
{
    if (seconds < 0)
        throw ParseError("Negative seconds since midnight: " + std::to_string(seconds));

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%02d:%02d:%02d",
                  seconds / 3600, (seconds % 3600) / 60, seconds % 60);
    return buffer;
}
