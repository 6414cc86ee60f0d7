#include "Geohash.hpp"
#include "Base32.hpp"
#include "GeoError.hpp"
#include <array>

namespace geohash {

// Rows follow Direction (n, s, e, w); columns are geohash length % 2.
using DirectionTable = std::array<std::array<std::string_view, 2>, 4>;

static constexpr DirectionTable NEIGHBOUR_TABLE = {{
    {{ "p0r21436x8zb9dcf5h7kjnmqesgutwvy", "bc01fg45238967deuvhjyznpkmstqrwx" }},
    {{ "14365h7k9dcfesgujnmqp0r2twvyx8zb", "238967debc01fg45kmstqrwxuvhjyznp" }},
    {{ "bc01fg45238967deuvhjyznpkmstqrwx", "p0r21436x8zb9dcf5h7kjnmqesgutwvy" }},
    {{ "238967debc01fg45kmstqrwxuvhjyznp", "14365h7k9dcfesgujnmqp0r2twvyx8zb" }}
}};

// Last characters sitting on the parent cell's edge in each direction.
static constexpr DirectionTable BORDER_TABLE = {{
    {{ "prxz",     "bcfguvyz" }},
    {{ "028b",     "0145hjnp" }},
    {{ "bcfguvyz", "prxz"     }},
    {{ "0145hjnp", "028b"     }}
}};

static std::string_view tableEntry(const DirectionTable& table, Direction dir, size_t length) {
    size_t row = static_cast<size_t>(dir);
    if (row >= table.size()) {
        throw InvalidArgumentError("invalid direction");
    }
    return table[row][length % 2];
}

static bool onBorder(char last, Direction dir, size_t length) {
    return tableEntry(BORDER_TABLE, dir, length).find(last) != std::string_view::npos;
}

static char shiftLast(char last, Direction dir, size_t length) {
    std::string_view row = tableEntry(NEIGHBOUR_TABLE, dir, length);
    size_t pos = row.find(last);
    if (pos == std::string_view::npos) {
        throw InvalidCharacterError(last);
    }
    return encodeDigit(static_cast<uint8_t>(pos));
}

// hash is already normalized. Each level drops one character, so the
// recursion never goes deeper than hash.size().
static std::string adjacentOf(std::string_view hash, Direction dir) {
    char last = hash.back();
    std::string_view parentView = hash.substr(0, hash.size() - 1);

    std::string parent(parentView);
    if (!parentView.empty() && onBorder(last, dir, hash.size())) {
        parent = adjacentOf(parentView, dir);
    }
    parent.push_back(shiftLast(last, dir, hash.size()));
    return parent;
}

std::string adjacent(std::string_view geohash, Direction dir) {
    std::string hash = normalize(geohash);
    return adjacentOf(hash, dir);
}

std::string adjacent(std::string_view geohash, std::string_view dir) {
    return adjacent(geohash, parseDirection(dir));
}

std::string neighbour(std::string_view geohash, CompoundDirection dir) {
    std::string hash = normalize(geohash);
    switch (dir) {
        case CompoundDirection::North:     return adjacentOf(hash, Direction::North);
        case CompoundDirection::South:     return adjacentOf(hash, Direction::South);
        case CompoundDirection::East:      return adjacentOf(hash, Direction::East);
        case CompoundDirection::West:      return adjacentOf(hash, Direction::West);
        case CompoundDirection::NorthWest: return adjacentOf(adjacentOf(hash, Direction::North), Direction::West);
        case CompoundDirection::NorthEast: return adjacentOf(adjacentOf(hash, Direction::North), Direction::East);
        case CompoundDirection::SouthWest: return adjacentOf(adjacentOf(hash, Direction::South), Direction::West);
        case CompoundDirection::SouthEast: return adjacentOf(adjacentOf(hash, Direction::South), Direction::East);
    }
    throw InvalidArgumentError("invalid direction");
}

std::string neighbour(std::string_view geohash, std::string_view dir) {
    return neighbour(geohash, parseCompoundDirection(dir));
}

std::map<CompoundDirection, std::string> neighbours(std::string_view geohash) {
    std::string hash = normalize(geohash);
    std::map<CompoundDirection, std::string> result;
    for (CompoundDirection dir : ALL_COMPOUND_DIRECTIONS) {
        result.emplace(dir, neighbour(hash, dir));
    }
    return result;
}

}
