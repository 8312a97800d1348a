#include <algorithm>
#include <cmath>
#include <geocluster/geo/distance.hpp>

namespace geocluster::geo {

double haversine_distance(const Point& a, const Point& b) noexcept {
  const double lat1 = deg_to_rad(a.lat);
  const double lat2 = deg_to_rad(b.lat);
  const double sin_dlat = std::sin(deg_to_rad(b.lat - a.lat) / 2.0);
  const double sin_dlon = std::sin(deg_to_rad(b.lon - a.lon) / 2.0);

  double h = sin_dlat * sin_dlat + std::cos(lat1) * std::cos(lat2) * sin_dlon * sin_dlon;
  h = std::clamp(h, 0.0, 1.0);

  return 2.0 * EARTH_RADIUS_METERS * std::atan2(std::sqrt(h), std::sqrt(1.0 - h));
}

}  // namespace geocluster::geo
