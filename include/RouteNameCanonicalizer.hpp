#pragma once
#include <string>
#include <string_view>

// Matching key for route labels coming from two sources: the GTFS
// route_short_name and the label scraped from the live arrivals page.
//
// Whitespace is dropped, letters are upper-cased (ASCII, Latin-1, Greek) and
// Greek capitals are transliterated to Latin. A byte outside any valid UTF-8
// sequence becomes U+FFFD.
class RouteNameCanonicalizer
{
public:
    static std::string canonicalize(std::string_view label) noexcept;

private:
    static char const* transliterate(char32_t upperGreek) noexcept;
    static char32_t toUpper(char32_t cp) noexcept;
    static bool isSpace(char32_t cp) noexcept;
    static void appendUtf8(std::string& out, char32_t cp);
};
