#pragma once
#include <array>
#include <string>
#include <string_view>

namespace geohash {

enum class Direction {
    North = 0,
    South,
    East,
    West
};

enum class CompoundDirection {
    NorthWest = 0,
    North,
    NorthEast,
    West,
    East,
    SouthWest,
    South,
    SouthEast
};

// Reply order used by neighbours(): nw n ne w e sw s se.
constexpr std::array<CompoundDirection, 8> ALL_COMPOUND_DIRECTIONS = {
    CompoundDirection::NorthWest, CompoundDirection::North, CompoundDirection::NorthEast,
    CompoundDirection::West, CompoundDirection::East,
    CompoundDirection::SouthWest, CompoundDirection::South, CompoundDirection::SouthEast
};

// "n", "S", ... Throws InvalidArgumentError for anything else.
Direction parseDirection(std::string_view code);
CompoundDirection parseCompoundDirection(std::string_view code);

std::string toString(Direction dir);
std::string toString(CompoundDirection dir);

}
