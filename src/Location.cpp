#include "Location.hpp"
#include "GeoError.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace geodesy {

static constexpr double PI = 3.14159265358979323846;

static double toRadians(double deg) { return deg * PI / 180.0; }
static double toDegrees(double rad) { return rad * 180.0 / PI; }

static double clampUnit(double v) { return std::max(-1.0, std::min(1.0, v)); }

static void checkLatitude(double latitude) {
    if (!std::isfinite(latitude) || latitude < -90.0 || latitude > 90.0) {
        throw InvalidArgumentError("invalid location latitude " + std::to_string(latitude));
    }
}

Location::Location(double latitude, double longitude)
    : lat(latitude), lon(longitude) {
    checkLatitude(latitude);
    if (!std::isfinite(longitude) || longitude < -180.0 || longitude > 180.0) {
        throw InvalidArgumentError("invalid location longitude " + std::to_string(longitude));
    }
}

Location::Location(double latitude, double longitude, double altitude)
    : Location(latitude, longitude) {
    if (!std::isfinite(altitude)) {
        throw InvalidArgumentError("invalid location altitude");
    }
    alt = altitude;
}

double radiusSpheroid(double latitude) {
    checkLatitude(latitude);
    double s = std::sin(toRadians(latitude));
    return EQUATORIAL_RADIUS * (1.0 - FLATTENING * s * s);
}

double haversine(const Location& a, const Location& b) {
    double lat1 = toRadians(a.latitude());
    double lat2 = toRadians(b.latitude());
    double dLat = lat2 - lat1;
    double dLon = toRadians(b.longitude() - a.longitude());

    double h = std::sin(dLat / 2) * std::sin(dLat / 2) +
               std::cos(lat1) * std::cos(lat2) * std::sin(dLon / 2) * std::sin(dLon / 2);
    return MEAN_RADIUS * 2.0 * std::asin(std::sqrt(std::min(1.0, h)));
}

double haversineApproximation(const Location& a, const Location& b) {
    double lat1 = toRadians(a.latitude());
    double lat2 = toRadians(b.latitude());
    double x = toRadians(b.longitude() - a.longitude()) * std::cos(0.5 * (lat1 + lat2));
    double y = lat2 - lat1;
    return MEAN_RADIUS * std::sqrt(x * x + y * y);
}

double bearing(const Location& from, const Location& to) {
    double lat1 = toRadians(from.latitude());
    double lat2 = toRadians(to.latitude());
    double dLon = toRadians(to.longitude() - from.longitude());

    double y = std::sin(dLon) * std::cos(lat2);
    double x = std::cos(lat1) * std::sin(lat2) - std::sin(lat1) * std::cos(lat2) * std::cos(dLon);

    double deg = toDegrees(std::atan2(y, x));
    if (deg < 0.0) deg += 360.0;
    return deg;
}

Location destination(const Location& from, double distance, double bearingDegrees) {
    if (!std::isfinite(bearingDegrees) || bearingDegrees < 0.0 || bearingDegrees > 360.0) {
        throw InvalidArgumentError("invalid bearing " + std::to_string(bearingDegrees));
    }
    if (!std::isfinite(distance)) {
        throw InvalidArgumentError("invalid distance");
    }

    double lat1 = toRadians(from.latitude());
    double lon1 = toRadians(from.longitude());
    double brng = toRadians(bearingDegrees);
    double dr = distance / MEAN_RADIUS;

    double lat2 = std::asin(clampUnit(std::sin(lat1) * std::cos(dr) +
                                      std::cos(lat1) * std::sin(dr) * std::cos(brng)));
    double y = std::sin(brng) * std::sin(dr) * std::cos(lat1);
    double x = std::cos(dr) - std::sin(lat1) * std::sin(lat2);
    double lon2 = toDegrees(lon1 + std::atan2(y, x));

    lon2 = std::fmod(lon2 + 540.0, 360.0) - 180.0;
    return Location(toDegrees(lat2), lon2);
}

Cartesian toCartesian(const Location& loc) {
    double lat = toRadians(loc.latitude());
    double lon = toRadians(loc.longitude());
    double r = MEAN_RADIUS + loc.altitudeOrZero();

    return { r * std::cos(lat) * std::cos(lon),
             r * std::cos(lat) * std::sin(lon),
             r * std::sin(lat) };
}

Location fromCartesian(const Cartesian& xyz) {
    double r = std::sqrt(xyz.x * xyz.x + xyz.y * xyz.y + xyz.z * xyz.z);
    if (!(r > 0.0)) {
        throw InvalidArgumentError("cartesian point at the earth centre has no location");
    }
    double lat = toDegrees(std::asin(clampUnit(xyz.z / r)));
    double lon = toDegrees(std::atan2(xyz.y, xyz.x));
    return Location(lat, lon, r - MEAN_RADIUS);
}

Location midpoint(const Location& a, const Location& b) {
    Location groundA(a.latitude(), a.longitude());
    Location groundB(b.latitude(), b.longitude());
    Cartesian c1 = toCartesian(groundA);
    Cartesian c2 = toCartesian(groundB);

    Location mid = fromCartesian({ 0.5 * (c1.x + c2.x), 0.5 * (c1.y + c2.y), 0.5 * (c1.z + c2.z) });
    return Location(mid.latitude(), mid.longitude(), 0.5 * (a.altitudeOrZero() + b.altitudeOrZero()));
}

double angleBetween(const Location& a, const Location& b) {
    double lat1 = toRadians(a.latitude()), lon1 = toRadians(a.longitude());
    double lat2 = toRadians(b.latitude()), lon2 = toRadians(b.longitude());

    double dot = std::cos(lat1) * std::cos(lon1) * std::cos(lat2) * std::cos(lon2) +
                 std::cos(lat1) * std::sin(lon1) * std::cos(lat2) * std::sin(lon2) +
                 std::sin(lat1) * std::sin(lat2);
    return std::acos(clampUnit(dot));
}

Location interpolate(const Location& a, const Location& b, double fraction) {
    if (!(fraction >= 0.0 && fraction <= 1.0)) {
        throw InvalidArgumentError("invalid fraction " + std::to_string(fraction));
    }

    double altitude = a.altitudeOrZero() + fraction * (b.altitudeOrZero() - a.altitudeOrZero());
    double angle = angleBetween(a, b);
    double sinAngle = std::sin(angle);
    if (sinAngle == 0.0) {
        return Location(a.latitude(), a.longitude(), altitude);
    }

    double lat1 = toRadians(a.latitude()), lon1 = toRadians(a.longitude());
    double lat2 = toRadians(b.latitude()), lon2 = toRadians(b.longitude());
    double wa = std::sin((1.0 - fraction) * angle) / sinAngle;
    double wb = std::sin(fraction * angle) / sinAngle;

    double x = wa * std::cos(lat1) * std::cos(lon1) + wb * std::cos(lat2) * std::cos(lon2);
    double y = wa * std::cos(lat1) * std::sin(lon1) + wb * std::cos(lat2) * std::sin(lon2);
    double z = wa * std::sin(lat1) + wb * std::sin(lat2);

    double lat = toDegrees(std::atan2(z, std::sqrt(x * x + y * y)));
    double lon = toDegrees(std::atan2(y, x));
    return Location(lat, lon, altitude);
}

double crossTrackDistance(const Location& orig, const Location& dest, const Location& p) {
    double d13 = haversine(orig, p) / MEAN_RADIUS;
    double theta13 = toRadians(bearing(orig, p));
    double theta12 = toRadians(bearing(orig, dest));
    return std::asin(clampUnit(std::sin(d13) * std::sin(theta13 - theta12))) * MEAN_RADIUS;
}

double alongTrackDistance(const Location& orig, const Location& dest, const Location& p) {
    double d13 = haversine(orig, p) / MEAN_RADIUS;
    double dxt = crossTrackDistance(orig, dest, p) / MEAN_RADIUS;
    return std::acos(clampUnit(std::cos(d13) / std::cos(dxt))) * MEAN_RADIUS;
}

}
