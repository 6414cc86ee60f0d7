#pragma once
#include "Direction.hpp"
#include <map>
#include <string>
#include <string_view>

namespace geohash {

constexpr double MIN_LATITUDE = -90.0;
constexpr double MAX_LATITUDE = 90.0;
constexpr double MIN_LONGITUDE = -180.0;
constexpr double MAX_LONGITUDE = 180.0;

constexpr int DEFAULT_PRECISION = 10;

struct Coordinates {
    double latitude;
    double longitude;
};

// Exact cell covered by a geohash, southwest and northeast corners.
struct BoundingBox {
    Coordinates sw;
    Coordinates ne;

    bool contains(const Coordinates& c) const;
    Coordinates center() const;
};

// Checks every symbol and returns the geohash lower-cased.
// Throws InvalidArgumentError when empty, InvalidCharacterError on a bad symbol.
std::string normalize(std::string_view geohash);

std::string encode(const Coordinates& coords, int precision = DEFAULT_PRECISION);

BoundingBox bounds(std::string_view geohash);

// Cell centre, rounded to the number of decimals the cell size resolves.
Coordinates decode(std::string_view geohash);

std::string adjacent(std::string_view geohash, Direction dir);
std::string adjacent(std::string_view geohash, std::string_view dir);

std::string neighbour(std::string_view geohash, CompoundDirection dir);
std::string neighbour(std::string_view geohash, std::string_view dir);

std::map<CompoundDirection, std::string> neighbours(std::string_view geohash);

}
