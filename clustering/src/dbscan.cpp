#include <algorithm>
#include <cmath>
#include <deque>
#include <format>
#include <geocluster/clustering/dbscan.hpp>
#include <geocluster/common/error.hpp>
#include <geocluster/common/logging.hpp>
#include <geocluster/common/tracy.hpp>

namespace geocluster::clustering {

void DbscanParams::validate() const {
  if (!std::isfinite(eps) || eps <= 0.0) {
    throw InvalidParameter(std::format("eps must be a positive finite distance, got {}", eps));
  }
  if (min_pts < 1) {
    throw InvalidParameter(std::format("min_pts must be at least 1, got {}", min_pts));
  }
}

DensityClusterer::DensityClusterer(geo::DistanceFn distance, NeighborSearch search)
    : distance_(std::move(distance)), search_(search) {
  if (!distance_) {
    throw std::invalid_argument("distance function must not be empty");
  }
}

ClusterAssignment DensityClusterer::cluster(std::span<const Point> points, double eps,
                                            int min_pts) const {
  GEOCLUSTER_ZONE;
  DbscanParams{eps, min_pts}.validate();
  if (points.empty()) {
    throw EmptyInput("cannot cluster an empty point sequence");
  }

  std::vector<Neighborhood> neighborhoods;
  {
    GEOCLUSTER_ZONE_N("dbscan::neighborhoods");
    auto backend = create_backend(search_, distance_);
    backend->build(points, eps);
    neighborhoods = backend->all_neighborhoods();
  }

  const size_t n = points.size();
  const auto min_size = static_cast<size_t>(min_pts);

  ClusterAssignment result;
  result.labels.assign(n, NOISE);
  std::vector<PointState> state(n, PointState::Unvisited);

  // Last cluster a point was queued for; keeps each pending set duplicate-free
  std::vector<int> queued_for(n, NOISE);

  for (size_t p = 0; p < n; ++p) {
    if (state[p] != PointState::Unvisited) continue;

    const auto& seed_region = neighborhoods[p];
    if (seed_region.size() < min_size) {
      state[p] = PointState::NoiseCandidate;
      continue;
    }

    GEOCLUSTER_ZONE_N("dbscan::expand");
    const int cluster_id = static_cast<int>(result.clusters.size());
    auto& members = result.clusters.emplace_back();

    std::deque<size_t> pending;
    for (size_t q : seed_region) {
      queued_for[q] = cluster_id;
      pending.push_back(q);
    }

    while (!pending.empty()) {
      size_t q = pending.front();
      pending.pop_front();

      if (state[q] == PointState::Assigned) continue;

      state[q] = PointState::Assigned;
      result.labels[q] = cluster_id;
      members.push_back(q);

      const auto& region = neighborhoods[q];
      if (region.size() < min_size) continue;

      for (size_t r : region) {
        if (state[r] != PointState::Assigned && queued_for[r] != cluster_id) {
          queued_for[r] = cluster_id;
          pending.push_back(r);
        }
      }
    }

    std::ranges::sort(members);
    logger()->trace("cluster {} discovered from point {} with {} members", cluster_id, p,
                    members.size());
  }

  for (size_t i = 0; i < n; ++i) {
    if (state[i] == PointState::NoiseCandidate) {
      result.noise.push_back(i);
    }
  }

  return result;
}

}  // namespace geocluster::clustering
