#pragma once
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <cstdint>
#include <filesystem>

// Static GTFS entities, one struct per store table.

struct Agency
{
    std::string agencyId;
    std::string name;
    std::string url;
    std::string timezone = "Europe/Nicosia";
    std::string language = "el";
};

struct Stop
{
    std::string stopId;
    std::string code;
    std::string name;
    std::string description;
    std::optional<double> lat;   // both set or both empty
    std::optional<double> lon;
    std::string zoneId;
    int locationType = 0;
    std::string parentStation;
    int wheelchairBoarding = 0;
};

struct Route
{
    std::string routeId;
    std::string agencyId;        // empty means no agency
    std::string shortName;
    std::string longName;
    std::string description;
    int routeType = 3;
    std::string color;
    std::string textColor;
    std::optional<int> sortOrder;
};

struct Calendar
{
    std::string serviceId;
    bool monday    = false;
    bool tuesday   = false;
    bool wednesday = false;
    bool thursday  = false;
    bool friday    = false;
    bool saturday  = false;
    bool sunday    = false;
    int startDate  = 0;          // YYYYMMDD
    int endDate    = 0;
};

struct CalendarDate
{
    std::string serviceId;
    int date = 0;                // YYYYMMDD
    int exceptionType = 1;
};

struct Trip
{
    std::string tripId;
    std::string routeId;
    std::string serviceId;
    std::string headsign;
    std::string shortName;
    std::optional<int> directionId;
    std::string blockId;
    std::string shapeId;
    int wheelchairAccessible = 0;
    int bikesAllowed = 0;
};

// arrival/departure are kept verbatim, "25:10:00" included.
struct StopTime
{
    std::string tripId;
    std::string arrivalTime;
    std::string departureTime;
    std::string stopId;
    int stopSequence = 0;
    std::string stopHeadsign;
    int pickupType = 0;
    int dropOffType = 0;
    std::optional<double> shapeDistTraveled;
    int timepoint = 1;
};

struct ShapePoint
{
    std::string shapeId;
    double lat = 0.0;
    double lon = 0.0;
    int sequence = 0;
    std::optional<double> distTraveled;
};

struct FareAttribute
{
    std::string fareId;
    std::optional<double> price;
    std::string currencyType;
    int paymentMethod = 0;
    std::optional<int> transfers;        // empty means unlimited
    std::string agencyId;
    std::optional<int> transferDuration;
};

struct FareRule
{
    std::string fareId;
    std::string routeId;
    std::string originId;
    std::string destinationId;
};

// table name -> rows
using TableCounts = std::map<std::string, std::int64_t>;

struct DownloadResult
{
    bool success = false;
    std::string error;
    std::uintmax_t sizeBytes = 0;
    std::filesystem::path file;
};

struct ImportResult
{
    bool success = false;
    std::string error;
    TableCounts rowCounts;
};

struct SyncResult
{
    std::map<std::string, DownloadResult> downloads;
    std::map<std::string, ImportResult> imports;
};

// One scraped prediction. Never persisted.
struct LiveArrival
{
    std::string routeLabel;
    std::string arrivalTime;     // HH:MM:SS, Cyprus local
    int minutesUntil = 0;
};

enum class StopPosition
{
    Origin,
    Destination,
    Intermediate
};

struct StopRoute
{
    std::string routeId;
    std::string shortName;
    std::string longName;
    std::string color     = "FFFFFF";
    std::string textColor = "000000";
    std::string headsign;
    StopPosition position = StopPosition::Intermediate;
};

// A live prediction after it has been matched against the static routes.
struct Arrival
{
    std::string routeLabel;
    std::string arrivalTime;
    int minutesUntil = 0;
    std::optional<std::string> routeId;
    std::string headsign;
    std::string color;
    std::string textColor;
    bool isLive = true;
};

struct StopInfo
{
    std::string stopId;
    std::string stopName;
    std::optional<double> lat;
    std::optional<double> lon;
};

struct ArrivalBoard
{
    StopInfo stop;
    std::vector<Arrival> arrivals;
    std::vector<StopRoute> routes;
};

std::string toString(StopPosition position);
