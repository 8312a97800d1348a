#pragma once
#include <optional>
#include <string_view>

#include <geocluster/clustering/dbscan.hpp>
#include <geocluster/clustering/neighbor_backend.hpp>

namespace geocluster::pipeline {

// What run() does with an empty store list
enum class EmptyInputPolicy { Error, EmptyResult };

[[nodiscard]] constexpr std::string_view to_string(EmptyInputPolicy policy) noexcept {
  return policy == EmptyInputPolicy::Error ? "error" : "empty_result";
}

[[nodiscard]] constexpr std::optional<EmptyInputPolicy> parse_empty_input_policy(
    std::string_view s) noexcept {
  if (s == "error") return EmptyInputPolicy::Error;
  if (s == "empty_result") return EmptyInputPolicy::EmptyResult;
  return std::nullopt;
}

struct PipelineConfig {
  double eps_meters = 500.0;
  int min_pts = 3;
  clustering::NeighborSearch neighbor_search = clustering::BruteForceSearch{};
  EmptyInputPolicy empty_input = EmptyInputPolicy::Error;
  bool validate_coordinates = true;

  // Throws InvalidParameter
  void validate() const { dbscan_params().validate(); }

  [[nodiscard]] clustering::DbscanParams dbscan_params() const noexcept {
    return {eps_meters, min_pts};
  }
};

}  // namespace geocluster::pipeline
