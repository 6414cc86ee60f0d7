#define BOOST_TEST_MODULE GeohashNeighboursTest
#include <boost/test/unit_test.hpp>

#include "Geohash.hpp"
#include "GeoError.hpp"
#include <set>

using namespace geohash;

BOOST_AUTO_TEST_CASE(test_adjacent) {
    BOOST_CHECK_EQUAL(adjacent("sr2yk3bsm", Direction::North), "sr2yk3bst");
    BOOST_CHECK_EQUAL(adjacent("sr2yk3bsm", Direction::South), "sr2yk3bsj");
    BOOST_CHECK_EQUAL(adjacent("sr2yk3bsm", Direction::West), "sr2yk3bsk");
    BOOST_CHECK_EQUAL(adjacent("sr2yk3bsm", Direction::East), "sr2yk3bsq");
}

BOOST_AUTO_TEST_CASE(test_adjacent_with_direction_code) {
    BOOST_CHECK_EQUAL(adjacent("sr2yk3bsm", "n"), "sr2yk3bst");
    BOOST_CHECK_EQUAL(adjacent("sr2yk3bsm", "S"), "sr2yk3bsj");
    BOOST_CHECK_EQUAL(adjacent("SR2YK3BSM", "w"), "sr2yk3bsk");
    BOOST_CHECK_EQUAL(adjacent("c216ne", "n"), "c216ns");
}

BOOST_AUTO_TEST_CASE(test_adjacent_crosses_parent_cells) {
    BOOST_CHECK_EQUAL(adjacent("u000", Direction::West), "gbpb");
    BOOST_CHECK_EQUAL(adjacent("gbpb", Direction::East), "u000");
    BOOST_CHECK_EQUAL(adjacent("ezzz", Direction::East), "spbp");
    BOOST_CHECK_EQUAL(adjacent("9q8yy", Direction::North), "9q8zn");
    BOOST_CHECK_EQUAL(adjacent("dp3", Direction::East), "dp6");
}

// Characters sitting first in their border string must also push the step
// into the parent cell.
BOOST_AUTO_TEST_CASE(test_adjacent_first_border_character_propagates) {
    BOOST_CHECK_EQUAL(adjacent("u000", Direction::South), "spbp");
    BOOST_CHECK_EQUAL(adjacent("spbp", Direction::North), "u000");
}

BOOST_AUTO_TEST_CASE(test_adjacent_single_character) {
    BOOST_CHECK_EQUAL(adjacent("u", Direction::North), "h");
    BOOST_CHECK_EQUAL(adjacent("u", Direction::South), "s");
    BOOST_CHECK_EQUAL(adjacent("u", Direction::East), "v");
    BOOST_CHECK_EQUAL(adjacent("u", Direction::West), "g");
}

// At the poles and the antimeridian the step wraps inside the top-level grid.
BOOST_AUTO_TEST_CASE(test_adjacent_wraps_at_globe_edge) {
    BOOST_CHECK_EQUAL(adjacent("b", Direction::North), "0");
    BOOST_CHECK_EQUAL(adjacent("0", Direction::South), "b");
    BOOST_CHECK_EQUAL(adjacent("z", Direction::East), "b");
}

BOOST_AUTO_TEST_CASE(test_adjacent_is_locally_invertible) {
    for (const char* h : { "sr2yk3bsm", "c216ne", "u000", "9q8yy", "dp3", "gbpb", "r3gx2f9tt5sne" }) {
        BOOST_CHECK_EQUAL(adjacent(adjacent(h, Direction::North), Direction::South), h);
        BOOST_CHECK_EQUAL(adjacent(adjacent(h, Direction::South), Direction::North), h);
        BOOST_CHECK_EQUAL(adjacent(adjacent(h, Direction::East), Direction::West), h);
        BOOST_CHECK_EQUAL(adjacent(adjacent(h, Direction::West), Direction::East), h);
    }
}

BOOST_AUTO_TEST_CASE(test_adjacent_cell_touches_source) {
    std::string h = "sr2yk3bsm";
    BoundingBox box = bounds(h);

    BoundingBox north = bounds(adjacent(h, Direction::North));
    BOOST_CHECK_EQUAL(north.sw.latitude, box.ne.latitude);
    BOOST_CHECK_EQUAL(north.sw.longitude, box.sw.longitude);

    BoundingBox east = bounds(adjacent(h, Direction::East));
    BOOST_CHECK_EQUAL(east.sw.longitude, box.ne.longitude);
    BOOST_CHECK_EQUAL(east.sw.latitude, box.sw.latitude);
}

BOOST_AUTO_TEST_CASE(test_adjacent_rejects_bad_input) {
    BOOST_CHECK_THROW(adjacent("", Direction::North), InvalidArgumentError);
    BOOST_CHECK_THROW(adjacent("sr2yk", "x"), InvalidArgumentError);
    BOOST_CHECK_THROW(adjacent("sr2yk", "ne"), InvalidArgumentError);
    BOOST_CHECK_THROW(adjacent("sr2yk", ""), InvalidArgumentError);
    BOOST_CHECK_THROW(adjacent("sr2ya", Direction::North), InvalidCharacterError);
}

BOOST_AUTO_TEST_CASE(test_neighbour) {
    BOOST_CHECK_EQUAL(neighbour("sr2yk3bsm", "nw"), "sr2yk3bss");
    BOOST_CHECK_EQUAL(neighbour("sr2yk3bsm", "n"), "sr2yk3bst");
    BOOST_CHECK_EQUAL(neighbour("sr2yk3bsm", "ne"), "sr2yk3bsw");
    BOOST_CHECK_EQUAL(neighbour("sr2yk3bsm", "w"), "sr2yk3bsk");
    BOOST_CHECK_EQUAL(neighbour("sr2yk3bsm", "e"), "sr2yk3bsq");
    BOOST_CHECK_EQUAL(neighbour("sr2yk3bsm", "sw"), "sr2yk3bsh");
    BOOST_CHECK_EQUAL(neighbour("sr2yk3bsm", "s"), "sr2yk3bsj");
    BOOST_CHECK_EQUAL(neighbour("sr2yk3bsm", "SE"), "sr2yk3bsn");
}

BOOST_AUTO_TEST_CASE(test_neighbour_rejects_bad_input) {
    BOOST_CHECK_THROW(neighbour("", CompoundDirection::North), InvalidArgumentError);
    BOOST_CHECK_THROW(neighbour("sr2yk", "nn"), InvalidArgumentError);
    BOOST_CHECK_THROW(neighbour("sr2yk", "north"), InvalidArgumentError);
    BOOST_CHECK_THROW(neighbour("sr2yko", "n"), InvalidCharacterError);
}

BOOST_AUTO_TEST_CASE(test_neighbours) {
    auto all = neighbours("sr2yk3bsm");
    BOOST_REQUIRE_EQUAL(all.size(), 8u);
    BOOST_CHECK_EQUAL(all.at(CompoundDirection::NorthWest), "sr2yk3bss");
    BOOST_CHECK_EQUAL(all.at(CompoundDirection::North), "sr2yk3bst");
    BOOST_CHECK_EQUAL(all.at(CompoundDirection::NorthEast), "sr2yk3bsw");
    BOOST_CHECK_EQUAL(all.at(CompoundDirection::West), "sr2yk3bsk");
    BOOST_CHECK_EQUAL(all.at(CompoundDirection::East), "sr2yk3bsq");
    BOOST_CHECK_EQUAL(all.at(CompoundDirection::SouthWest), "sr2yk3bsh");
    BOOST_CHECK_EQUAL(all.at(CompoundDirection::South), "sr2yk3bsj");
    BOOST_CHECK_EQUAL(all.at(CompoundDirection::SouthEast), "sr2yk3bsn");
}

BOOST_AUTO_TEST_CASE(test_neighbours_across_parent_boundary) {
    auto all = neighbours("u000");
    BOOST_CHECK_EQUAL(all.at(CompoundDirection::NorthWest), "gbpc");
    BOOST_CHECK_EQUAL(all.at(CompoundDirection::North), "u001");
    BOOST_CHECK_EQUAL(all.at(CompoundDirection::NorthEast), "u003");
    BOOST_CHECK_EQUAL(all.at(CompoundDirection::West), "gbpb");
    BOOST_CHECK_EQUAL(all.at(CompoundDirection::East), "u002");
    BOOST_CHECK_EQUAL(all.at(CompoundDirection::SouthWest), "ezzz");
    BOOST_CHECK_EQUAL(all.at(CompoundDirection::South), "spbp");
    BOOST_CHECK_EQUAL(all.at(CompoundDirection::SouthEast), "spbr");
}

BOOST_AUTO_TEST_CASE(test_neighbours_are_distinct_and_same_length) {
    for (const char* h : { "sr2yk3bsm", "u000", "c23nb62w20sth", "dp3" }) {
        auto all = neighbours(h);
        BOOST_CHECK_EQUAL(all.size(), 8u);
        std::set<std::string> distinct;
        for (const auto& [dir, cell] : all) {
            BOOST_CHECK_EQUAL(cell.size(), std::string(h).size());
            BOOST_CHECK(cell != h);
            distinct.insert(cell);
        }
        BOOST_CHECK_EQUAL(distinct.size(), 8u);
    }
}

BOOST_AUTO_TEST_CASE(test_direction_codes) {
    BOOST_CHECK(parseDirection("N") == Direction::North);
    BOOST_CHECK(parseDirection("w") == Direction::West);
    BOOST_CHECK(parseCompoundDirection("Se") == CompoundDirection::SouthEast);
    BOOST_CHECK_THROW(parseDirection("nw"), InvalidArgumentError);
    BOOST_CHECK_THROW(parseCompoundDirection("x"), InvalidArgumentError);

    for (auto dir : ALL_COMPOUND_DIRECTIONS) {
        BOOST_CHECK(parseCompoundDirection(toString(dir)) == dir);
    }
    BOOST_CHECK_EQUAL(toString(Direction::East), "e");
}
