#include "GeoHandler.hpp"
#include "GeoError.hpp"
#include "Location.hpp"
#include "Resp.hpp"
#include <stdexcept>

static double parseDouble(const std::string& s, const char* what) {
    size_t pos = 0;
    double v = 0.0;
    try {
        v = std::stod(s, &pos);
    } catch (const std::invalid_argument&) {
        throw InvalidArgumentError(std::string(what) + " is not a valid float");
    } catch (const std::out_of_range&) {
        throw InvalidArgumentError(std::string(what) + " is out of range");
    }
    if (pos != s.size()) {
        throw InvalidArgumentError(std::string(what) + " is not a valid float");
    }
    return v;
}

static int parseInt(const std::string& s, const char* what) {
    size_t pos = 0;
    int v = 0;
    try {
        v = std::stoi(s, &pos);
    } catch (const std::invalid_argument&) {
        throw InvalidArgumentError(std::string(what) + " is not an integer");
    } catch (const std::out_of_range&) {
        throw InvalidArgumentError(std::string(what) + " is out of range");
    }
    if (pos != s.size()) {
        throw InvalidArgumentError(std::string(what) + " is not an integer");
    }
    return v;
}

static void requireArgs(const std::vector<std::string>& args, size_t min, size_t max, const char* usage) {
    if (args.size() < min || args.size() > max) {
        throw std::runtime_error(std::string("wrong number of arguments, usage: ") + usage);
    }
}

GeoHandler::GeoHandler(int defaultPrecision)
    : defaultPrecision(defaultPrecision) {}

bool GeoHandler::isGeoCommand(const std::string& cmd) const {
    return cmd == "GHENCODE" || cmd == "GHBOUNDS" || cmd == "GHDECODE" ||
           cmd == "GHADJACENT" || cmd == "GHNEIGHBOUR" || cmd == "GHNEIGHBOURS" ||
           cmd == "GEODIST" || cmd == "GEOBEARING" || cmd == "GEODEST";
}

std::string GeoHandler::handleCommand(const std::string& cmd, const std::vector<std::string>& args) const {
    if (cmd == "GHENCODE") return handleEncode(args);
    if (cmd == "GHBOUNDS") return handleBounds(args);
    if (cmd == "GHDECODE") return handleDecode(args);
    if (cmd == "GHADJACENT") return handleAdjacent(args);
    if (cmd == "GHNEIGHBOUR") return handleNeighbour(args);
    if (cmd == "GHNEIGHBOURS") return handleNeighbours(args);
    if (cmd == "GEODIST") return handleGeoDist(args);
    if (cmd == "GEOBEARING") return handleGeoBearing(args);
    if (cmd == "GEODEST") return handleGeoDest(args);
    throw std::runtime_error("unsupported geo command '" + cmd + "'");
}

std::string GeoHandler::handleEncode(const std::vector<std::string>& args) const {
    requireArgs(args, 2, 3, "GHENCODE lat lon [precision]");

    geohash::Coordinates coords{ parseDouble(args[0], "latitude"), parseDouble(args[1], "longitude") };
    int precision = args.size() == 3 ? parseInt(args[2], "precision") : defaultPrecision;

    return resp::bulkString(geohash::encode(coords, precision));
}

std::string GeoHandler::handleBounds(const std::vector<std::string>& args) const {
    requireArgs(args, 1, 1, "GHBOUNDS geohash");

    geohash::BoundingBox box = geohash::bounds(args[0]);
    return resp::bulkArray({
        resp::formatDouble(box.sw.latitude), resp::formatDouble(box.sw.longitude),
        resp::formatDouble(box.ne.latitude), resp::formatDouble(box.ne.longitude)
    });
}

std::string GeoHandler::handleDecode(const std::vector<std::string>& args) const {
    requireArgs(args, 1, 1, "GHDECODE geohash");

    geohash::Coordinates c = geohash::decode(args[0]);
    return resp::bulkArray({ resp::formatDouble(c.latitude), resp::formatDouble(c.longitude) });
}

std::string GeoHandler::handleAdjacent(const std::vector<std::string>& args) const {
    requireArgs(args, 2, 2, "GHADJACENT geohash n|s|e|w");
    return resp::bulkString(geohash::adjacent(args[0], args[1]));
}

std::string GeoHandler::handleNeighbour(const std::vector<std::string>& args) const {
    requireArgs(args, 2, 2, "GHNEIGHBOUR geohash nw|n|ne|w|e|sw|s|se");
    return resp::bulkString(geohash::neighbour(args[0], args[1]));
}

std::string GeoHandler::handleNeighbours(const std::vector<std::string>& args) const {
    requireArgs(args, 1, 1, "GHNEIGHBOURS geohash");

    auto all = geohash::neighbours(args[0]);
    std::vector<std::string> flat;
    flat.reserve(all.size() * 2);
    for (auto dir : geohash::ALL_COMPOUND_DIRECTIONS) {
        flat.push_back(geohash::toString(dir));
        flat.push_back(all.at(dir));
    }
    return resp::bulkArray(flat);
}

std::string GeoHandler::handleGeoDist(const std::vector<std::string>& args) const {
    requireArgs(args, 4, 5, "GEODIST lat1 lon1 lat2 lon2 [m|km|mi|ft]");

    geodesy::Location a(parseDouble(args[0], "latitude"), parseDouble(args[1], "longitude"));
    geodesy::Location b(parseDouble(args[2], "latitude"), parseDouble(args[3], "longitude"));
    double distance = geodesy::haversine(a, b);

    std::string unit = args.size() == 5 ? args[4] : "m";
    if (unit == "m") {
        // already meters
    } else if (unit == "km") {
        distance /= 1000.0;
    } else if (unit == "mi") {
        distance /= 1609.344;
    } else if (unit == "ft") {
        distance /= 0.3048;
    } else {
        throw InvalidArgumentError("unsupported unit '" + unit + "'");
    }
    return resp::bulkString(resp::formatDouble(distance));
}

std::string GeoHandler::handleGeoBearing(const std::vector<std::string>& args) const {
    requireArgs(args, 4, 4, "GEOBEARING lat1 lon1 lat2 lon2");

    geodesy::Location from(parseDouble(args[0], "latitude"), parseDouble(args[1], "longitude"));
    geodesy::Location to(parseDouble(args[2], "latitude"), parseDouble(args[3], "longitude"));
    return resp::bulkString(resp::formatDouble(geodesy::bearing(from, to)));
}

std::string GeoHandler::handleGeoDest(const std::vector<std::string>& args) const {
    requireArgs(args, 4, 4, "GEODEST lat lon distance bearing");

    geodesy::Location from(parseDouble(args[0], "latitude"), parseDouble(args[1], "longitude"));
    geodesy::Location to = geodesy::destination(from, parseDouble(args[2], "distance"),
                                                parseDouble(args[3], "bearing"));
    return resp::bulkArray({ resp::formatDouble(to.latitude()), resp::formatDouble(to.longitude()) });
}
