#pragma once
#include <span>
#include <string>

#include <geocluster/common/store.hpp>
#include <geocluster/pipeline/pipeline.hpp>

namespace geocluster::io {

// Version for format evolution
inline constexpr const char* RESULT_FORMAT_VERSION = "1.0";

// Per cluster: id, centroid [lat, lng], radiusMeters, storeCount, densityPerKm2,
// densityScore, types, sizes, members (store indices) and, when stores are given,
// stores (store ids). Top level: version, nStores, clusters, noise (ids), noiseIndices.
// Breakdown keys keep first-encounter order.
[[nodiscard]] std::string result_to_json_string(const pipeline::ClusteringResult& result,
                                                std::span<const Store> stores = {},
                                                int indent = 2);
[[nodiscard]] pipeline::ClusteringResult result_from_json_string(const std::string& json_str);

void save_result_json(const pipeline::ClusteringResult& result, std::span<const Store> stores,
                      const std::string& path);
[[nodiscard]] pipeline::ClusteringResult load_result_json(const std::string& path);

// Reduced per-cluster document for analysis consumers: id, centroid, storeCount, types, sizes
[[nodiscard]] std::string digest_json_string(const pipeline::ClusteringResult& result,
                                             int indent = 2);

// MessagePack with the same keys (store ids are not embedded)
[[nodiscard]] std::string result_to_msgpack_string(const pipeline::ClusteringResult& result);
[[nodiscard]] pipeline::ClusteringResult result_from_msgpack_string(const std::string& data);

void save_result_msgpack(const pipeline::ClusteringResult& result, const std::string& path);
[[nodiscard]] pipeline::ClusteringResult load_result_msgpack(const std::string& path);

}  // namespace geocluster::io
