#include "Geohash.hpp"
#include "Base32.hpp"
#include "GeoError.hpp"
#include <cctype>
#include <cmath>

namespace geohash {

static bool isLatitude(double v) {
    return v >= MIN_LATITUDE && v <= MAX_LATITUDE;
}

static bool isLongitude(double v) {
    return v >= MIN_LONGITUDE && v <= MAX_LONGITUDE;
}

// Half-to-even like the reference decoder; negative digits round to tens, hundreds...
static double roundToDigits(double value, int digits) {
    if (digits >= 0) {
        double factor = std::pow(10.0, digits);
        return std::nearbyint(value * factor) / factor;
    }
    double factor = std::pow(10.0, -digits);
    return std::nearbyint(value / factor) * factor;
}

static int significantDigits(double min, double max) {
    return static_cast<int>(std::floor(2.0 - std::log10(max - min)));
}

bool BoundingBox::contains(const Coordinates& c) const {
    return c.latitude >= sw.latitude && c.latitude <= ne.latitude &&
           c.longitude >= sw.longitude && c.longitude <= ne.longitude;
}

Coordinates BoundingBox::center() const {
    return { (sw.latitude + ne.latitude) / 2.0, (sw.longitude + ne.longitude) / 2.0 };
}

std::string normalize(std::string_view geohash) {
    if (geohash.empty()) {
        throw InvalidArgumentError("invalid geohash: empty string");
    }
    std::string lowered;
    lowered.reserve(geohash.size());
    for (char c : geohash) {
        if (!isValidChar(c)) {
            throw InvalidCharacterError(c);
        }
        lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return lowered;
}

std::string encode(const Coordinates& coords, int precision) {
    if (!isLatitude(coords.latitude)) {
        throw InvalidArgumentError("invalid latitude " + std::to_string(coords.latitude));
    }
    if (!isLongitude(coords.longitude)) {
        throw InvalidArgumentError("invalid longitude " + std::to_string(coords.longitude));
    }
    if (precision < 1) {
        throw InvalidArgumentError("invalid precision " + std::to_string(precision));
    }

    double latMin = MIN_LATITUDE, latMax = MAX_LATITUDE;
    double lonMin = MIN_LONGITUDE, lonMax = MAX_LONGITUDE;
    bool isLonBit = true;
    uint8_t idx = 0;
    int bit = 0;

    std::string hash;
    hash.reserve(static_cast<size_t>(precision));

    while (hash.size() < static_cast<size_t>(precision)) {
        if (isLonBit) {
            double mid = (lonMin + lonMax) / 2.0;
            if (coords.longitude >= mid) {
                idx = static_cast<uint8_t>((idx << 1) | 1);
                lonMin = mid;
            } else {
                idx = static_cast<uint8_t>(idx << 1);
                lonMax = mid;
            }
        } else {
            double mid = (latMin + latMax) / 2.0;
            if (coords.latitude >= mid) {
                idx = static_cast<uint8_t>((idx << 1) | 1);
                latMin = mid;
            } else {
                idx = static_cast<uint8_t>(idx << 1);
                latMax = mid;
            }
        }
        isLonBit = !isLonBit;

        if (++bit == BASE32_BITS) {
            hash.push_back(encodeDigit(idx));
            bit = 0;
            idx = 0;
        }
    }
    return hash;
}

BoundingBox bounds(std::string_view geohash) {
    std::string hash = normalize(geohash);

    double latMin = MIN_LATITUDE, latMax = MAX_LATITUDE;
    double lonMin = MIN_LONGITUDE, lonMax = MAX_LONGITUDE;
    bool isLonBit = true;

    for (char c : hash) {
        uint8_t idx = decodeChar(c);
        for (int n = BASE32_BITS - 1; n >= 0; --n) {
            bool set = ((idx >> n) & 1) != 0;
            if (isLonBit) {
                double mid = (lonMin + lonMax) / 2.0;
                if (set) lonMin = mid;
                else lonMax = mid;
            } else {
                double mid = (latMin + latMax) / 2.0;
                if (set) latMin = mid;
                else latMax = mid;
            }
            isLonBit = !isLonBit;
        }
    }

    return { { latMin, lonMin }, { latMax, lonMax } };
}

Coordinates decode(std::string_view geohash) {
    BoundingBox box = bounds(geohash);
    Coordinates mid = box.center();

    return {
        roundToDigits(mid.latitude, significantDigits(box.sw.latitude, box.ne.latitude)),
        roundToDigits(mid.longitude, significantDigits(box.sw.longitude, box.ne.longitude))
    };
}

}
