#pragma once
#include <optional>

namespace geodesy {

constexpr double EQUATORIAL_RADIUS = 6378137.0;
constexpr double POLAR_RADIUS = 6356752.3;
constexpr double MEAN_RADIUS = (2.0 * EQUATORIAL_RADIUS + POLAR_RADIUS) / 3.0;
constexpr double FLATTENING = (EQUATORIAL_RADIUS - POLAR_RADIUS) / EQUATORIAL_RADIUS;

// A validated point on the sphere: degrees, optional altitude in metres.
class Location {
public:
    Location(double latitude, double longitude);
    Location(double latitude, double longitude, double altitude);

    double latitude() const { return lat; }
    double longitude() const { return lon; }
    const std::optional<double>& altitude() const { return alt; }
    double altitudeOrZero() const { return alt.value_or(0.0); }

private:
    double lat;
    double lon;
    std::optional<double> alt;
};

// Earth-centred coordinates in metres.
struct Cartesian {
    double x;
    double y;
    double z;
};

double radiusSpheroid(double latitude);

// Distances are in metres, bearings in degrees clockwise from north.
double haversine(const Location& a, const Location& b);
double haversineApproximation(const Location& a, const Location& b);
double bearing(const Location& from, const Location& to);
Location destination(const Location& from, double distance, double bearingDegrees);

Cartesian toCartesian(const Location& loc);
Location fromCartesian(const Cartesian& xyz);

Location midpoint(const Location& a, const Location& b);
double angleBetween(const Location& a, const Location& b);   // radians
Location interpolate(const Location& a, const Location& b, double fraction);

double crossTrackDistance(const Location& orig, const Location& dest, const Location& p);
double alongTrackDistance(const Location& orig, const Location& dest, const Location& p);

}
