#include <algorithm>
#include <cmath>
#include <format>
#include <geocluster/common/error.hpp>
#include <geocluster/common/tracy.hpp>
#include <geocluster/geo/distance.hpp>
#include <geocluster/summary/summarizer.hpp>
#include <numbers>
#include <numeric>
#include <ranges>
#include <stdexcept>

namespace geocluster::summary {

// =============================================================================
// Breakdown
// =============================================================================

void Breakdown::add(std::string_view label, int count) {
  auto it = std::ranges::find(entries_, label, &Entry::first);
  if (it != entries_.end()) {
    it->second += count;
  } else {
    entries_.emplace_back(std::string(label), count);
  }
}

int Breakdown::count(std::string_view label) const noexcept {
  auto it = std::ranges::find(entries_, label, &Entry::first);
  return it != entries_.end() ? it->second : 0;
}

int Breakdown::total() const noexcept {
  return std::accumulate(entries_.begin(), entries_.end(), 0,
                         [](int acc, const Entry& e) { return acc + e.second; });
}

// =============================================================================
// Metrics
// =============================================================================

double ClusterSummary::area_km2() const noexcept { return area_km2_for_radius(radius_meters); }

Point centroid_of(std::span<const Point> points) {
  if (points.empty()) {
    throw InvalidInput("centroid of an empty point set is undefined");
  }
  Eigen::RowVector2d mean = to_matrix(points).colwise().mean();
  return Point{mean(0), mean(1)};
}

double area_km2_for_radius(double radius_meters) noexcept {
  double radius_km = radius_meters / 1000.0;
  return std::numbers::pi * radius_km * radius_km;
}

double density_per_km2(int store_count, double area_km2) noexcept {
  return static_cast<double>(store_count) / std::max(area_km2, AREA_FLOOR_KM2);
}

int density_score(double density_per_km2) noexcept {
  double scaled = std::min(DENSITY_SCORE_CAP, density_per_km2 * DENSITY_SCORE_SCALE);
  return static_cast<int>(std::lround(std::max(scaled, 0.0)));
}

// =============================================================================
// ClusterSummarizer
// =============================================================================

ClusterSummary ClusterSummarizer::summarize(std::span<const Store> members, int cluster_id) const {
  std::vector<size_t> indices(members.size());
  std::iota(indices.begin(), indices.end(), size_t{0});
  return summarize(members, indices, cluster_id);
}

ClusterSummary ClusterSummarizer::summarize(std::span<const Store> stores,
                                            std::span<const size_t> member_indices,
                                            int cluster_id) const {
  GEOCLUSTER_ZONE;
  if (member_indices.empty()) {
    throw InvalidInput(std::format("cluster {} has no members to summarize", cluster_id));
  }

  std::vector<Point> locations;
  locations.reserve(member_indices.size());
  for (size_t idx : member_indices) {
    if (idx >= stores.size()) {
      throw std::out_of_range(std::format("cluster {} member index {} out of range for {} stores",
                                          cluster_id, idx, stores.size()));
    }
    locations.push_back(stores[idx].location);
  }

  ClusterSummary summary;
  summary.id = cluster_id;
  summary.store_count = static_cast<int>(member_indices.size());
  summary.member_indices.assign(member_indices.begin(), member_indices.end());
  summary.centroid = centroid_of(locations);

  auto to_centroid = [&](const Point& p) { return geo::haversine_distance(summary.centroid, p); };
  double max_distance = std::ranges::max(locations | std::views::transform(to_centroid));
  summary.radius_meters = std::max(max_distance, RADIUS_FLOOR_METERS);

  summary.density_per_km2 = density_per_km2(summary.store_count, summary.area_km2());
  summary.density_score = density_score(summary.density_per_km2);

  for (size_t idx : member_indices) {
    summary.category_breakdown.add(stores[idx].category);
    summary.size_breakdown.add(to_string(stores[idx].size));
  }

  return summary;
}

}  // namespace geocluster::summary
