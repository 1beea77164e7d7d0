#include "Types.hpp"

std::string toString(StopPosition position)
{
    switch (position)
    {
        case StopPosition::Origin:      return "origin";
        case StopPosition::Destination: return "destination";
        case StopPosition::Intermediate: break;
    }
    return "intermediate";
}
