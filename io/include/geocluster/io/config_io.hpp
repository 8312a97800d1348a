#pragma once
#include <expected>
#include <string>

#include <geocluster/pipeline/config.hpp>
#include <geocluster/pipeline/pipeline.hpp>

namespace geocluster::io {

// Missing keys take their defaults, unknown keys are ignored. The result is validated.
[[nodiscard]] pipeline::PipelineConfig config_from_json_string(const std::string& json_str);
[[nodiscard]] pipeline::PipelineConfig load_config(const std::string& path);

[[nodiscard]] std::string config_to_json_string(const pipeline::PipelineConfig& config);
void save_config(const pipeline::PipelineConfig& config, const std::string& path);

// Pipeline built from a JSON config file or string
[[nodiscard]] std::expected<pipeline::ClusteringPipeline, std::string> load_pipeline(
    const std::string& path) noexcept;
[[nodiscard]] std::expected<pipeline::ClusteringPipeline, std::string> pipeline_from_json_string(
    const std::string& json_str) noexcept;

}  // namespace geocluster::io
