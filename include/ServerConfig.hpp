#pragma once
#include "Geohash.hpp"

struct ServerConfig {
    int port = 6379;
    int defaultPrecision = geohash::DEFAULT_PRECISION;
    bool verbose = false;
};

// Reads --port, --precision and --verbose. Throws std::runtime_error on a
// missing or invalid value and on unknown flags.
ServerConfig parseServerConfig(int argc, const char* const* argv);
