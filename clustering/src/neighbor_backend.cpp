#include <algorithm>
#include <cmath>
#include <cstdint>
#include <format>
#include <geocluster/clustering/neighbor_backend.hpp>
#include <geocluster/common/error.hpp>
#include <geocluster/common/tracy.hpp>
#include <numbers>
#include <stdexcept>
#include <unordered_map>

#ifdef _OPENMP
#  include <omp.h>
#endif

namespace geocluster::clustering {

namespace {

  // Cell bounds are widened slightly so rounding never drops a true neighbor
  constexpr double CELL_SLACK = 1.0 + 1e-6;

  // Cells per axis; tiny eps falls back to cells larger than eps, which the
  // distance check in region_query keeps exact
  constexpr std::int64_t MAX_CELLS_PER_AXIS = std::int64_t{1} << 20;

  // floor(extent / cell) clamped to [1, MAX_CELLS_PER_AXIS], compared as doubles
  // so an infinite or huge ratio never reaches the integer cast
  std::int64_t cells_along(double extent, double cell) noexcept {
    double n = extent / cell;
    if (!(n < static_cast<double>(MAX_CELLS_PER_AXIS))) return MAX_CELLS_PER_AXIS;
    return std::max<std::int64_t>(static_cast<std::int64_t>(std::floor(n)), 1);
  }

  void check_eps(double eps) {
    if (!std::isfinite(eps) || eps <= 0.0) [[unlikely]] {
      throw InvalidParameter(std::format("eps must be a positive finite distance, got {}", eps));
    }
  }

}  // namespace

std::string_view to_string(const NeighborSearch& search) noexcept {
  return std::visit(overloaded{[](BruteForceSearch) { return std::string_view{"brute_force"}; },
                               [](GridSearch) { return std::string_view{"grid"}; }},
                    search);
}

std::optional<NeighborSearch> parse_neighbor_search(std::string_view name) noexcept {
  if (name == "brute_force") return NeighborSearch{BruteForceSearch{}};
  if (name == "grid") return NeighborSearch{GridSearch{}};
  return std::nullopt;
}

std::vector<Neighborhood> INeighborBackend::all_neighborhoods() const {
  GEOCLUSTER_ZONE;
  std::vector<Neighborhood> regions(size());

#ifdef _OPENMP
#  pragma omp parallel for schedule(dynamic, 16)
#endif
  for (std::int64_t i = 0; i < static_cast<std::int64_t>(regions.size()); ++i) {
    auto idx = static_cast<size_t>(i);
    regions[idx] = region_query(idx);
  }

  return regions;
}

// =============================================================================
// Brute Force Backend
// =============================================================================

class BruteForceBackend : public INeighborBackend {
public:
  explicit BruteForceBackend(geo::DistanceFn distance) : distance_(std::move(distance)) {}

  void build(std::span<const Point> points, double eps) override {
    check_eps(eps);
    points_.assign(points.begin(), points.end());
    eps_ = eps;
  }

  [[nodiscard]] Neighborhood region_query(size_t idx) const override {
    if (idx >= points_.size()) [[unlikely]] {
      throw std::out_of_range(
          std::format("point index {} out of range for {} points", idx, points_.size()));
    }

    Neighborhood region;
    const Point& query = points_[idx];
    for (size_t j = 0; j < points_.size(); ++j) {
      if (distance_(query, points_[j]) <= eps_) {
        region.push_back(j);
      }
    }
    return region;
  }

  [[nodiscard]] size_t size() const noexcept override { return points_.size(); }
  [[nodiscard]] double eps() const noexcept override { return eps_; }

private:
  geo::DistanceFn distance_;
  std::vector<Point> points_;
  double eps_ = 0.0;
};

// =============================================================================
// Grid Backend
// =============================================================================

// Buckets points into lat/lon cells at least as large as the largest coordinate
// offset two points within eps can have on the sphere, so a query only has to
// scan the 3x3 block of cells around its own cell.
class GridBackend : public INeighborBackend {
public:
  explicit GridBackend(geo::DistanceFn distance) : distance_(std::move(distance)) {}

  void build(std::span<const Point> points, double eps) override {
    GEOCLUSTER_ZONE;
    check_eps(eps);

    for (size_t i = 0; i < points.size(); ++i) {
      if (!is_valid(points[i])) [[unlikely]] {
        throw InvalidInput(std::format("point {} has invalid coordinates ({}, {})", i,
                                       points[i].lat, points[i].lon));
      }
    }

    points_.assign(points.begin(), points.end());
    eps_ = eps;
    cells_.clear();
    cell_of_.clear();

    const double angular = eps / geo::EARTH_RADIUS_METERS;

    // Rows: |dlat| <= angular for any pair within eps
    double row_height = geo::rad_to_deg(angular) * CELL_SLACK;
    n_rows_ = row_height >= 180.0 ? 1 : cells_along(180.0, row_height);
    row_height_ = 180.0 / static_cast<double>(n_rows_);

    // Columns: sin(dlon / 2) <= sin(angular / 2) / min(cos(lat)) over the dataset
    double min_cos = 1.0;
    for (const auto& p : points_) {
      min_cos = std::min(min_cos, std::cos(geo::deg_to_rad(p.lat)));
    }

    n_cols_ = 1;
    if (angular < std::numbers::pi && min_cos > 0.0) {
      double s = std::sin(angular / 2.0) / min_cos;
      if (s < 1.0) {
        double col_width = geo::rad_to_deg(2.0 * std::asin(s)) * CELL_SLACK;
        if (col_width < 360.0) {
          n_cols_ = cells_along(360.0, col_width);
        }
      }
    }
    col_width_ = 360.0 / static_cast<double>(n_cols_);

    cell_of_.reserve(points_.size());
    for (size_t i = 0; i < points_.size(); ++i) {
      auto [row, col] = cell_coords(points_[i]);
      cell_of_.emplace_back(row, col);
      cells_[key(row, col)].push_back(i);
    }
  }

  [[nodiscard]] Neighborhood region_query(size_t idx) const override {
    if (idx >= points_.size()) [[unlikely]] {
      throw std::out_of_range(
          std::format("point index {} out of range for {} points", idx, points_.size()));
    }

    const Point& query = points_[idx];
    auto [row, col] = cell_of_[idx];

    std::int64_t cols[3] = {wrap_col(col - 1), col, wrap_col(col + 1)};
    size_t n_unique_cols = n_cols_ >= 3 ? 3 : static_cast<size_t>(n_cols_);
    if (n_cols_ < 3) {
      for (std::int64_t c = 0; c < n_cols_; ++c) cols[c] = c;
    }

    Neighborhood region;
    for (std::int64_t r = std::max<std::int64_t>(row - 1, 0);
         r <= std::min<std::int64_t>(row + 1, n_rows_ - 1); ++r) {
      for (size_t c = 0; c < n_unique_cols; ++c) {
        auto it = cells_.find(key(r, cols[c]));
        if (it == cells_.end()) continue;
        for (size_t j : it->second) {
          if (distance_(query, points_[j]) <= eps_) {
            region.push_back(j);
          }
        }
      }
    }

    std::ranges::sort(region);
    return region;
  }

  [[nodiscard]] size_t size() const noexcept override { return points_.size(); }
  [[nodiscard]] double eps() const noexcept override { return eps_; }

private:
  [[nodiscard]] std::pair<std::int64_t, std::int64_t> cell_coords(const Point& p) const noexcept {
    auto row = static_cast<std::int64_t>(std::floor((p.lat + 90.0) / row_height_));
    row = std::clamp<std::int64_t>(row, 0, n_rows_ - 1);
    auto col = static_cast<std::int64_t>(std::floor((p.lon + 180.0) / col_width_));
    return {row, wrap_col(col)};
  }

  [[nodiscard]] std::int64_t wrap_col(std::int64_t col) const noexcept {
    col %= n_cols_;
    return col < 0 ? col + n_cols_ : col;
  }

  [[nodiscard]] std::int64_t key(std::int64_t row, std::int64_t col) const noexcept {
    return row * n_cols_ + col;
  }

  geo::DistanceFn distance_;
  std::vector<Point> points_;
  std::vector<std::pair<std::int64_t, std::int64_t>> cell_of_;
  std::unordered_map<std::int64_t, std::vector<size_t>> cells_;
  double eps_ = 0.0;
  double row_height_ = 180.0;
  double col_width_ = 360.0;
  std::int64_t n_rows_ = 1;
  std::int64_t n_cols_ = 1;
};

// =============================================================================
// Factory Functions
// =============================================================================

std::unique_ptr<INeighborBackend> create_backend(NeighborSearch search, geo::DistanceFn distance) {
  if (!distance) {
    throw std::invalid_argument("distance function must not be empty");
  }

  return std::visit(overloaded{[&](BruteForceSearch) -> std::unique_ptr<INeighborBackend> {
                                 return std::make_unique<BruteForceBackend>(std::move(distance));
                               },
                               [&](GridSearch) -> std::unique_ptr<INeighborBackend> {
                                 return std::make_unique<GridBackend>(std::move(distance));
                               }},
                    search);
}

}  // namespace geocluster::clustering
