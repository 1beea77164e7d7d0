#include <algorithm>
#include <string>
#include "ArrivalFusion.hpp"
#include "RouteNameCanonicalizer.hpp"

std::vector<Arrival> ArrivalFusion::enrich(std::vector<LiveArrival> const& live, std::vector<StopRoute> const& routes)
{
    std::vector<std::string> keys;
    keys.reserve(routes.size());
    for (StopRoute const& route : routes)
        keys.push_back(RouteNameCanonicalizer::canonicalize(route.shortName));

    std::vector<Arrival> arrivals;
    arrivals.reserve(live.size());

    for (LiveArrival const& event : live)
    {
        Arrival arrival;
        arrival.routeLabel = event.routeLabel;
        arrival.arrivalTime = event.arrivalTime;
        arrival.minutesUntil = event.minutesUntil;
        arrival.headsign = DEFAULT_HEADSIGN;
        arrival.color = DEFAULT_COLOR;
        arrival.textColor = DEFAULT_TEXT_COLOR;

        std::string key = RouteNameCanonicalizer::canonicalize(event.routeLabel);
        auto match = std::find(keys.begin(), keys.end(), key);
        if (match != keys.end())
        {
            StopRoute const& route = routes[static_cast<std::size_t>(match - keys.begin())];
            arrival.routeId = route.routeId;
            if (!route.headsign.empty())  arrival.headsign = route.headsign;
            if (!route.color.empty())     arrival.color = route.color;
            if (!route.textColor.empty()) arrival.textColor = route.textColor;
        }

        arrivals.push_back(std::move(arrival));
    }

    std::stable_sort(arrivals.begin(), arrivals.end(), [](Arrival const& a, Arrival const& b)
    {
        return a.minutesUntil < b.minutesUntil;
    });
    return arrivals;
}
