#pragma once
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include <geocluster/clustering/neighbor_backend.hpp>
#include <geocluster/common/point.hpp>
#include <geocluster/geo/distance.hpp>

namespace geocluster::clustering {

inline constexpr int NOISE = -1;

// Per-point lifecycle during a run: unvisited -> noise candidate -> assigned.
// A noise candidate can still be assigned later; an assigned point never changes.
enum class PointState : std::uint8_t { Unvisited, NoiseCandidate, Assigned };

struct ClusterAssignment {
  std::vector<std::vector<size_t>> clusters;  // discovery order, members ascending
  std::vector<size_t> noise;                  // ascending
  std::vector<int> labels;                    // cluster id or NOISE, per point

  [[nodiscard]] size_t n_clusters() const noexcept { return clusters.size(); }
  [[nodiscard]] size_t n_points() const noexcept { return labels.size(); }
  [[nodiscard]] bool is_noise(size_t idx) const { return labels.at(idx) == NOISE; }
};

struct DbscanParams {
  double eps = 500.0;  // meters
  int min_pts = 3;     // neighborhood size, point itself included

  // Throws InvalidParameter
  void validate() const;
};

// DBSCAN over geographic points with a pluggable metric.
//
// Points are scanned in input order. A point whose eps-neighborhood holds at least
// min_pts points starts a new cluster that grows through the neighborhoods of its
// core members. Points already assigned to a cluster are never moved; noise
// candidates reached by a later expansion join that cluster. Cluster ids follow
// discovery order, so the output is fully determined by the input order.
class DensityClusterer {
public:
  explicit DensityClusterer(geo::DistanceFn distance = geo::default_distance(),
                            NeighborSearch search = BruteForceSearch{});

  // Throws InvalidParameter for eps <= 0 or min_pts < 1, EmptyInput for no points
  [[nodiscard]] ClusterAssignment cluster(std::span<const Point> points, double eps,
                                          int min_pts) const;

  [[nodiscard]] ClusterAssignment cluster(std::span<const Point> points,
                                          const DbscanParams& params) const {
    return cluster(points, params.eps, params.min_pts);
  }

  [[nodiscard]] const NeighborSearch& search() const noexcept { return search_; }

private:
  geo::DistanceFn distance_;
  NeighborSearch search_;
};

}  // namespace geocluster::clustering
