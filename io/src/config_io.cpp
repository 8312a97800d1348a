#include <format>
#include <geocluster/common/error.hpp>
#include <geocluster/common/tracy.hpp>
#include <geocluster/io/config_io.hpp>
#include <nlohmann/json.hpp>

#include "file_util.hpp"

using json = nlohmann::json;

namespace geocluster::pipeline {

// ============================================================================
// JSON Serialization - PipelineConfig
// ============================================================================

void to_json(json& j, const PipelineConfig& c) {
  j = {{"eps_meters", c.eps_meters},
       {"min_pts", c.min_pts},
       {"neighbor_search", std::string(clustering::to_string(c.neighbor_search))},
       {"empty_input", std::string(to_string(c.empty_input))},
       {"validate_coordinates", c.validate_coordinates}};
}

void from_json(const json& j, PipelineConfig& c) {
  PipelineConfig defaults;
  c.eps_meters = j.value("eps_meters", defaults.eps_meters);
  c.min_pts = j.value("min_pts", defaults.min_pts);
  c.validate_coordinates = j.value("validate_coordinates", defaults.validate_coordinates);

  auto search_name
      = j.value("neighbor_search", std::string(clustering::to_string(defaults.neighbor_search)));
  auto search = clustering::parse_neighbor_search(search_name);
  if (!search) {
    throw InvalidParameter(std::format(
        "neighbor_search must be 'brute_force' or 'grid', got '{}'", search_name));
  }
  c.neighbor_search = *search;

  auto policy_name = j.value("empty_input", std::string(to_string(defaults.empty_input)));
  auto policy = parse_empty_input_policy(policy_name);
  if (!policy) {
    throw InvalidParameter(std::format(
        "empty_input must be 'error' or 'empty_result', got '{}'", policy_name));
  }
  c.empty_input = *policy;
}

}  // namespace geocluster::pipeline

namespace geocluster::io {

pipeline::PipelineConfig config_from_json_string(const std::string& json_str) {
  GEOCLUSTER_ZONE;
  json j;
  try {
    j = json::parse(json_str);
  } catch (const json::parse_error& e) {
    throw ParseError(std::format("invalid pipeline config: {}", e.what()));
  }
  if (!j.is_object()) {
    throw ParseError("pipeline config must be a JSON object");
  }

  pipeline::PipelineConfig config;
  try {
    config = j.get<pipeline::PipelineConfig>();
  } catch (const json::exception& e) {
    throw ParseError(std::format("invalid pipeline config: {}", e.what()));
  }
  config.validate();
  return config;
}

pipeline::PipelineConfig load_config(const std::string& path) {
  return config_from_json_string(detail::read_text_file(path, "config"));
}

std::string config_to_json_string(const pipeline::PipelineConfig& config) {
  json j = config;
  return j.dump(2);
}

void save_config(const pipeline::PipelineConfig& config, const std::string& path) {
  detail::write_file(path, config_to_json_string(config), "config");
}

std::expected<pipeline::ClusteringPipeline, std::string> load_pipeline(
    const std::string& path) noexcept {
  try {
    return pipeline::ClusteringPipeline(load_config(path));
  } catch (const std::exception& e) {
    return std::unexpected(e.what());
  }
}

std::expected<pipeline::ClusteringPipeline, std::string> pipeline_from_json_string(
    const std::string& json_str) noexcept {
  try {
    return pipeline::ClusteringPipeline(config_from_json_string(json_str));
  } catch (const std::exception& e) {
    return std::unexpected(e.what());
  }
}

}  // namespace geocluster::io
