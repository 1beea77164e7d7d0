#pragma once
#include <vector>
#include "Types.hpp"

// Joins scraped predictions to the stop's static routes by canonical route
// name and ranks them by time to arrival.
class ArrivalFusion
{
public:
    static constexpr char const* DEFAULT_HEADSIGN = "Unknown Destination";
    static constexpr char const* DEFAULT_COLOR = "FFFFFF";
    static constexpr char const* DEFAULT_TEXT_COLOR = "000000";

    // The first known route whose short name matches wins. Order among
    // arrivals due in the same minute is preserved.
    static std::vector<Arrival> enrich(std::vector<LiveArrival> const& live, std::vector<StopRoute> const& routes);
};
