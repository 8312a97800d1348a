#pragma once
#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <geocluster/common/point.hpp>
#include <geocluster/common/store.hpp>

namespace geocluster::summary {

inline constexpr double RADIUS_FLOOR_METERS = 100.0;
inline constexpr double AREA_FLOOR_KM2 = 0.0001;
inline constexpr double DENSITY_SCORE_SCALE = 10.0;
inline constexpr double DENSITY_SCORE_CAP = 100.0;

// Label -> count; keys keep the order in which labels were first seen
class Breakdown {
public:
  using Entry = std::pair<std::string, int>;

  void add(std::string_view label, int count = 1);

  [[nodiscard]] int count(std::string_view label) const noexcept;
  [[nodiscard]] int total() const noexcept;
  [[nodiscard]] size_t size() const noexcept { return entries_.size(); }
  [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }
  [[nodiscard]] const std::vector<Entry>& entries() const noexcept { return entries_; }

  [[nodiscard]] auto begin() const noexcept { return entries_.begin(); }
  [[nodiscard]] auto end() const noexcept { return entries_.end(); }

  friend bool operator==(const Breakdown&, const Breakdown&) = default;

private:
  std::vector<Entry> entries_;
};

struct ClusterSummary {
  int id = 0;
  Point centroid;
  double radius_meters = RADIUS_FLOOR_METERS;
  int store_count = 0;
  double density_per_km2 = 0.0;
  int density_score = 0;  // [0, 100]
  Breakdown category_breakdown;
  Breakdown size_breakdown;
  std::vector<size_t> member_indices;

  [[nodiscard]] double area_km2() const noexcept;

  friend bool operator==(const ClusterSummary&, const ClusterSummary&) = default;
};

// Planar mean of the degree values (not a spherical centroid)
[[nodiscard]] Point centroid_of(std::span<const Point> points);

[[nodiscard]] double area_km2_for_radius(double radius_meters) noexcept;
[[nodiscard]] double density_per_km2(int store_count, double area_km2) noexcept;
[[nodiscard]] int density_score(double density_per_km2) noexcept;

class ClusterSummarizer {
public:
  // Summary over every store in members; member_indices are positions in members.
  // Throws InvalidInput when members is empty.
  [[nodiscard]] ClusterSummary summarize(std::span<const Store> members, int cluster_id) const;

  // Summary over stores[i] for i in member_indices, in that order.
  // Throws InvalidInput when member_indices is empty, std::out_of_range on a bad index.
  [[nodiscard]] ClusterSummary summarize(std::span<const Store> stores,
                                         std::span<const size_t> member_indices,
                                         int cluster_id) const;
};

}  // namespace geocluster::summary
