#include "Direction.hpp"
#include "GeoError.hpp"
#include <algorithm>
#include <cctype>

namespace geohash {

static std::string toLower(std::string_view code) {
    std::string lowered(code);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

Direction parseDirection(std::string_view code) {
    std::string dir = toLower(code);
    if (dir == "n") return Direction::North;
    if (dir == "s") return Direction::South;
    if (dir == "e") return Direction::East;
    if (dir == "w") return Direction::West;
    throw InvalidArgumentError("invalid direction '" + std::string(code) + "'");
}

CompoundDirection parseCompoundDirection(std::string_view code) {
    std::string dir = toLower(code);
    if (dir == "nw") return CompoundDirection::NorthWest;
    if (dir == "n") return CompoundDirection::North;
    if (dir == "ne") return CompoundDirection::NorthEast;
    if (dir == "w") return CompoundDirection::West;
    if (dir == "e") return CompoundDirection::East;
    if (dir == "sw") return CompoundDirection::SouthWest;
    if (dir == "s") return CompoundDirection::South;
    if (dir == "se") return CompoundDirection::SouthEast;
    throw InvalidArgumentError("invalid direction '" + std::string(code) + "'");
}

std::string toString(Direction dir) {
    switch (dir) {
        case Direction::North: return "n";
        case Direction::South: return "s";
        case Direction::East:  return "e";
        case Direction::West:  return "w";
    }
    throw InvalidArgumentError("invalid direction");
}

std::string toString(CompoundDirection dir) {
    switch (dir) {
        case CompoundDirection::NorthWest: return "nw";
        case CompoundDirection::North:     return "n";
        case CompoundDirection::NorthEast: return "ne";
        case CompoundDirection::West:      return "w";
        case CompoundDirection::East:      return "e";
        case CompoundDirection::SouthWest: return "sw";
        case CompoundDirection::South:     return "s";
        case CompoundDirection::SouthEast: return "se";
    }
    throw InvalidArgumentError("invalid direction");
}

}
