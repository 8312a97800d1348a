#pragma once
#include <Eigen/Dense>
#include <cmath>
#include <cstddef>
#include <span>

namespace geocluster {

// Geographic position in degrees (lat in [-90, 90], lon in [-180, 180])
struct Point {
  double lat = 0.0;
  double lon = 0.0;

  friend bool operator==(const Point&, const Point&) = default;
};

[[nodiscard]] inline bool is_valid(const Point& p) noexcept {
  return std::isfinite(p.lat) && std::isfinite(p.lon) && p.lat >= -90.0 && p.lat <= 90.0
         && p.lon >= -180.0 && p.lon <= 180.0;
}

// N x 2 matrix, column 0 = lat, column 1 = lon (degrees)
using PointMatrix = Eigen::Matrix<double, Eigen::Dynamic, 2, Eigen::RowMajor>;

[[nodiscard]] inline PointMatrix to_matrix(std::span<const Point> points) {
  PointMatrix m(static_cast<Eigen::Index>(points.size()), 2);
  for (size_t i = 0; i < points.size(); ++i) {
    auto row = static_cast<Eigen::Index>(i);
    m(row, 0) = points[i].lat;
    m(row, 1) = points[i].lon;
  }
  return m;
}

}  // namespace geocluster
