#pragma once

#include <cstdint>
#include <cmath>

#include <Eigen/Dense>

namespace geoshard {

// Unit-length point on the sphere surface
using Point = Eigen::Vector3d;

// Finest cell level; level L has 6 * 4^L cells
constexpr int kMaxLevel = 30;

// Mean Earth radius used for radius queries
constexpr double kEarthRadiusMeters = 6371010.0;

constexpr double kPi = 3.14159265358979323846;

/**
 * Geographic coordinate in degrees.
 * Latitude is positive north, longitude positive east.
 */
struct LatLng {
    double lat_degrees;
    double lng_degrees;

    constexpr LatLng() noexcept : lat_degrees(0.0), lng_degrees(0.0) {}
    constexpr LatLng(double lat, double lng) noexcept : lat_degrees(lat), lng_degrees(lng) {}

    double lat_radians() const noexcept { return lat_degrees * kPi / 180.0; }
    double lng_radians() const noexcept { return lng_degrees * kPi / 180.0; }

    bool is_valid() const noexcept {
        return std::isfinite(lat_degrees) && std::isfinite(lng_degrees) &&
               std::fabs(lat_degrees) <= 90.0 && std::fabs(lng_degrees) <= 180.0;
    }

    Point to_point() const {
        const double phi = lat_radians();
        const double theta = lng_radians();
        const double cos_phi = std::cos(phi);
        return Point(std::cos(theta) * cos_phi, std::sin(theta) * cos_phi, std::sin(phi));
    }

    static LatLng from_point(const Point& p) {
        const double lat = std::atan2(p.z(), std::sqrt(p.x() * p.x() + p.y() * p.y()));
        const double lng = std::atan2(p.y(), p.x());
        return LatLng(lat * 180.0 / kPi, lng * 180.0 / kPi);
    }
};

// Angle in radians between two (not necessarily unit) vectors; stable for tiny angles
inline double angle_between(const Point& a, const Point& b) {
    return std::atan2(a.cross(b).norm(), a.dot(b));
}

} // namespace geoshard
