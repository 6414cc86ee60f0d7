#pragma once
#include "Geohash.hpp"
#include <vector>
#include <string>

// Geohash and geodesy commands. Every handler returns the encoded RESP reply
// and throws GeoError or std::runtime_error on bad arguments.
class GeoHandler {
public:
    explicit GeoHandler(int defaultPrecision = geohash::DEFAULT_PRECISION);

    bool isGeoCommand(const std::string& cmd) const;
    std::string handleCommand(const std::string& cmd, const std::vector<std::string>& args) const;

private:
    int defaultPrecision;

    std::string handleEncode(const std::vector<std::string>& args) const;
    std::string handleBounds(const std::vector<std::string>& args) const;
    std::string handleDecode(const std::vector<std::string>& args) const;
    std::string handleAdjacent(const std::vector<std::string>& args) const;
    std::string handleNeighbour(const std::vector<std::string>& args) const;
    std::string handleNeighbours(const std::vector<std::string>& args) const;
    std::string handleGeoDist(const std::vector<std::string>& args) const;
    std::string handleGeoBearing(const std::vector<std::string>& args) const;
    std::string handleGeoDest(const std::vector<std::string>& args) const;
};
