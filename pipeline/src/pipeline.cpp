#include <format>
#include <geocluster/clustering/dbscan.hpp>
#include <geocluster/common/logging.hpp>
#include <geocluster/common/tracy.hpp>
#include <geocluster/pipeline/pipeline.hpp>
#include <numeric>
#include <ranges>

namespace geocluster::pipeline {

size_t ClusteringResult::n_clustered() const noexcept {
  return std::accumulate(clusters.begin(), clusters.end(), size_t{0},
                         [](size_t acc, const summary::ClusterSummary& c) {
                           return acc + static_cast<size_t>(c.store_count);
                         });
}

ClusteringPipeline::ClusteringPipeline(PipelineConfig config, geo::DistanceFn distance)
    : config_(std::move(config)), distance_(std::move(distance)) {
  config_.validate();
  if (!distance_) {
    throw InvalidParameter("distance function must not be empty");
  }
}

std::expected<ClusteringPipeline, std::string> ClusteringPipeline::create(
    PipelineConfig config) noexcept {
  try {
    return ClusteringPipeline(std::move(config));
  } catch (const std::exception& e) {
    return std::unexpected(e.what());
  }
}

Result<ClusteringResult> ClusteringPipeline::run(std::span<const Store> stores) const noexcept {
  return run(stores, config_.eps_meters, config_.min_pts);
}

Result<ClusteringResult> ClusteringPipeline::run(std::span<const Store> stores, double eps,
                                                 int min_pts) const noexcept {
  GEOCLUSTER_ZONE;
  try {
    PipelineConfig effective = config_;
    effective.eps_meters = eps;
    effective.min_pts = min_pts;
    effective.validate();
    return run_checked(stores, effective);
  } catch (const InvalidParameter& e) {
    return std::unexpected(Error{e.code(), e.what()});
  } catch (const InvalidInput& e) {
    return std::unexpected(Error{e.code(), e.what()});
  } catch (const std::exception& e) {
    logger()->error("clustering run failed: {}", e.what());
    return std::unexpected(Error{ErrorCode::InvalidInput, e.what()});
  }
}

ClusteringResult ClusteringPipeline::run_checked(std::span<const Store> stores,
                                                 const PipelineConfig& config) const {
  ClusteringResult result;

  if (stores.empty()) {
    if (config.empty_input == EmptyInputPolicy::EmptyResult) {
      logger()->warn("empty store list, returning an empty result");
      return result;
    }
    throw InvalidInput("store list is empty");
  }

  std::vector<Point> points;
  points.reserve(stores.size());
  for (size_t i = 0; i < stores.size(); ++i) {
    const auto& store = stores[i];
    if (config.validate_coordinates && !is_valid(store.location)) {
      throw InvalidInput(std::format("store '{}' at index {} has invalid coordinates ({}, {})",
                                     store.id, i, store.location.lat, store.location.lon));
    }
    points.push_back(store.location);
  }

  logger()->debug("clustering {} stores: eps={}m min_pts={} search={}", stores.size(),
                  config.eps_meters, config.min_pts,
                  clustering::to_string(config.neighbor_search));

  clustering::DensityClusterer clusterer(distance_, config.neighbor_search);
  auto assignment = clusterer.cluster(points, config.eps_meters, config.min_pts);

  summary::ClusterSummarizer summarizer;
  result.n_stores = stores.size();
  result.clusters.reserve(assignment.n_clusters());
  for (size_t cluster_id = 0; cluster_id < assignment.n_clusters(); ++cluster_id) {
    result.clusters.push_back(summarizer.summarize(stores, assignment.clusters[cluster_id],
                                                   static_cast<int>(cluster_id)));
  }

  result.noise_indices = std::move(assignment.noise);
  auto noise_ids = result.noise_indices
                   | std::views::transform([&](size_t idx) { return stores[idx].id; });
  result.noise_store_ids.assign(noise_ids.begin(), noise_ids.end());

  logger()->debug("found {} clusters covering {} stores, {} noise", result.n_clusters(),
                  result.n_clustered(), result.noise_indices.size());
  return result;
}

}  // namespace geocluster::pipeline
