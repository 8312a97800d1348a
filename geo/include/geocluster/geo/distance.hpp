#pragma once
#include <functional>

#include <geocluster/common/point.hpp>

namespace geocluster::geo {

inline constexpr double EARTH_RADIUS_METERS = 6'371'000.0;

// Great-circle distance in meters on a sphere of radius EARTH_RADIUS_METERS.
// Symmetric, zero for identical points, finite for valid coordinates.
[[nodiscard]] double haversine_distance(const Point& a, const Point& b) noexcept;

// Pluggable metric used by the clusterer. Must be symmetric and non-negative.
using DistanceFn = std::function<double(const Point&, const Point&)>;

struct Haversine {
  [[nodiscard]] double operator()(const Point& a, const Point& b) const noexcept {
    return haversine_distance(a, b);
  }
};

[[nodiscard]] inline DistanceFn default_distance() { return Haversine{}; }

[[nodiscard]] constexpr double deg_to_rad(double deg) noexcept {
  return deg * 0.017453292519943295769;
}

[[nodiscard]] constexpr double rad_to_deg(double rad) noexcept {
  return rad * 57.295779513082320877;
}

}  // namespace geocluster::geo
