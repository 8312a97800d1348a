#pragma once
#include <cstddef>
#include <expected>
#include <span>
#include <string>
#include <vector>

#include <geocluster/common/error.hpp>
#include <geocluster/common/store.hpp>
#include <geocluster/geo/distance.hpp>
#include <geocluster/pipeline/config.hpp>
#include <geocluster/summary/summarizer.hpp>

namespace geocluster::pipeline {

struct ClusteringResult {
  std::vector<summary::ClusterSummary> clusters;  // cluster id order
  std::vector<std::string> noise_store_ids;       // input order
  std::vector<size_t> noise_indices;              // input order
  size_t n_stores = 0;

  [[nodiscard]] size_t n_clusters() const noexcept { return clusters.size(); }
  [[nodiscard]] size_t n_clustered() const noexcept;

  friend bool operator==(const ClusteringResult&, const ClusteringResult&) = default;
};

// Stores -> points -> DensityClusterer -> ClusterSummarizer.
// Holds only immutable configuration; concurrent run() calls are independent.
class ClusteringPipeline {
public:
  // Throws InvalidParameter when the config is invalid
  explicit ClusteringPipeline(PipelineConfig config = {},
                              geo::DistanceFn distance = geo::default_distance());

  [[nodiscard]] static std::expected<ClusteringPipeline, std::string> create(
      PipelineConfig config) noexcept;

  ClusteringPipeline(ClusteringPipeline&&) = default;
  ClusteringPipeline& operator=(ClusteringPipeline&&) = default;
  ClusteringPipeline(const ClusteringPipeline&) = default;
  ClusteringPipeline& operator=(const ClusteringPipeline&) = default;

  // Clusters with the configured eps / min_pts. No partial result on failure.
  [[nodiscard]] Result<ClusteringResult> run(std::span<const Store> stores) const noexcept;

  // Same, overriding eps (meters) and min_pts for this call
  [[nodiscard]] Result<ClusteringResult> run(std::span<const Store> stores, double eps,
                                             int min_pts) const noexcept;

  [[nodiscard]] const PipelineConfig& config() const noexcept { return config_; }

private:
  [[nodiscard]] ClusteringResult run_checked(std::span<const Store> stores,
                                             const PipelineConfig& config) const;

  PipelineConfig config_;
  geo::DistanceFn distance_;
};

}  // namespace geocluster::pipeline
