#include "ServerConfig.hpp"
#include <stdexcept>
#include <string>

static int parseNumber(const std::string& flag, const std::string& value, int min, int max) {
    size_t pos = 0;
    int n = 0;
    try {
        n = std::stoi(value, &pos);
    } catch (const std::logic_error&) {
        throw std::runtime_error(flag + " expects a number, got '" + value + "'");
    }
    if (pos != value.size() || n < min || n > max) {
        throw std::runtime_error(flag + " must be between " + std::to_string(min) + " and " + std::to_string(max));
    }
    return n;
}

ServerConfig parseServerConfig(int argc, const char* const* argv) {
    ServerConfig config;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--port" || arg == "--precision") {
            if (i + 1 >= argc) {
                throw std::runtime_error(arg + " requires a value");
            }
            std::string value = argv[++i];
            if (arg == "--port") config.port = parseNumber(arg, value, 1, 65535);
            else config.defaultPrecision = parseNumber(arg, value, 1, 64);
        } else if (arg == "--verbose") {
            config.verbose = true;
        } else {
            throw std::runtime_error("unknown option '" + arg + "'");
        }
    }
    return config;
}
