#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cstdint>
#include <format>
#include <geocluster/common/error.hpp>
#include <geocluster/common/tracy.hpp>
#include <geocluster/io/result_io.hpp>
#include <map>
#include <msgpack.hpp>
#include <nlohmann/json.hpp>
#include <stdexcept>

#include "file_util.hpp"

// Insertion-ordered so breakdown keys keep first-encounter order
using json = nlohmann::ordered_json;

namespace geocluster::io {

using pipeline::ClusteringResult;
using summary::Breakdown;
using summary::ClusterSummary;

namespace {

  json breakdown_to_json(const Breakdown& breakdown) {
    json j = json::object();
    for (const auto& [label, count] : breakdown) {
      j[label] = count;
    }
    return j;
  }

  Breakdown breakdown_from_json(const json& j) {
    Breakdown breakdown;
    for (const auto& [label, count] : j.items()) {
      breakdown.add(label, count.get<int>());
    }
    return breakdown;
  }

  json centroid_to_json(const Point& p) { return json::array({p.lat, p.lon}); }

  // Loaded indices address the caller's store list, so they must stay below nStores
  void check_indices(const ClusteringResult& result) {
    for (const auto& c : result.clusters) {
      for (size_t idx : c.member_indices) {
        if (idx >= result.n_stores) {
          throw ParseError(std::format("cluster {} member index {} out of range for {} stores",
                                       c.id, idx, result.n_stores));
        }
      }
    }
    for (size_t idx : result.noise_indices) {
      if (idx >= result.n_stores) {
        throw ParseError(
            std::format("noise index {} out of range for {} stores", idx, result.n_stores));
      }
    }
  }

}  // namespace

// ============================================================================
// JSON
// ============================================================================

std::string result_to_json_string(const ClusteringResult& result, std::span<const Store> stores,
                                  int indent) {
  GEOCLUSTER_ZONE;
  const bool with_ids = !stores.empty();
  if (with_ids && stores.size() != result.n_stores) {
    throw InvalidInput(std::format("result covers {} stores but {} were given",
                                            result.n_stores, stores.size()));
  }

  json clusters = json::array();
  for (const auto& c : result.clusters) {
    json cluster = {{"id", c.id},
                    {"centroid", centroid_to_json(c.centroid)},
                    {"radiusMeters", c.radius_meters},
                    {"storeCount", c.store_count},
                    {"densityPerKm2", c.density_per_km2},
                    {"densityScore", c.density_score},
                    {"types", breakdown_to_json(c.category_breakdown)},
                    {"sizes", breakdown_to_json(c.size_breakdown)},
                    {"members", c.member_indices}};

    if (with_ids) {
      json ids = json::array();
      for (size_t idx : c.member_indices) {
        if (idx >= stores.size()) {
          throw InvalidInput(std::format("cluster {} member index {} out of range for {} stores",
                                         c.id, idx, stores.size()));
        }
        ids.push_back(stores[idx].id);
      }
      cluster["stores"] = std::move(ids);
    }
    clusters.push_back(std::move(cluster));
  }

  json j;
  j["version"] = RESULT_FORMAT_VERSION;
  j["nStores"] = result.n_stores;
  j["clusters"] = std::move(clusters);
  j["noise"] = result.noise_store_ids;
  j["noiseIndices"] = result.noise_indices;
  return j.dump(indent);
}

ClusteringResult result_from_json_string(const std::string& json_str) {
  GEOCLUSTER_ZONE;
  ClusteringResult result;
  try {
    json j = json::parse(json_str);

    result.n_stores = j.at("nStores").get<size_t>();

    for (const auto& cj : j.at("clusters")) {
      ClusterSummary c;
      cj.at("id").get_to(c.id);

      const auto& centroid = cj.at("centroid");
      if (!centroid.is_array() || centroid.size() != 2) {
        throw ParseError(std::format("cluster {} centroid must be a [lat, lng] pair", c.id));
      }
      centroid[0].get_to(c.centroid.lat);
      centroid[1].get_to(c.centroid.lon);

      cj.at("radiusMeters").get_to(c.radius_meters);
      cj.at("storeCount").get_to(c.store_count);
      cj.at("densityPerKm2").get_to(c.density_per_km2);
      cj.at("densityScore").get_to(c.density_score);
      c.category_breakdown = breakdown_from_json(cj.at("types"));
      c.size_breakdown = breakdown_from_json(cj.at("sizes"));
      if (cj.contains("members")) {
        cj.at("members").get_to(c.member_indices);
      }
      result.clusters.push_back(std::move(c));
    }

    j.at("noise").get_to(result.noise_store_ids);
    if (j.contains("noiseIndices")) {
      j.at("noiseIndices").get_to(result.noise_indices);
    }
  } catch (const json::exception& e) {
    throw ParseError(std::format("invalid result document: {}", e.what()));
  }
  check_indices(result);
  return result;
}

void save_result_json(const ClusteringResult& result, std::span<const Store> stores,
                      const std::string& path) {
  detail::write_file(path, result_to_json_string(result, stores), "result");
}

ClusteringResult load_result_json(const std::string& path) {
  return result_from_json_string(detail::read_text_file(path, "result"));
}

std::string digest_json_string(const ClusteringResult& result, int indent) {
  json clusters = json::array();
  for (const auto& c : result.clusters) {
    clusters.push_back({{"id", c.id},
                        {"centroid", centroid_to_json(c.centroid)},
                        {"storeCount", c.store_count},
                        {"types", breakdown_to_json(c.category_breakdown)},
                        {"sizes", breakdown_to_json(c.size_breakdown)}});
  }
  return clusters.dump(indent);
}

// ============================================================================
// MessagePack
// ============================================================================

namespace {

  void pack_breakdown(msgpack::packer<msgpack::sbuffer>& pk, const Breakdown& breakdown) {
    pk.pack_map(static_cast<uint32_t>(breakdown.size()));
    for (const auto& [label, count] : breakdown) {
      pk.pack(label);
      pk.pack(count);
    }
  }

  // Walks the map in wire order; converting to std::map would sort the keys
  Breakdown unpack_breakdown(const msgpack::object& obj) {
    if (obj.type != msgpack::type::MAP) {
      throw ParseError("breakdown must be a msgpack map");
    }
    Breakdown breakdown;
    for (uint32_t i = 0; i < obj.via.map.size; ++i) {
      const auto& kv = obj.via.map.ptr[i];
      breakdown.add(kv.key.as<std::string>(), kv.val.as<int>());
    }
    return breakdown;
  }

  std::vector<uint64_t> to_u64(const std::vector<size_t>& v) { return {v.begin(), v.end()}; }

  std::vector<size_t> from_u64(const std::vector<uint64_t>& v) { return {v.begin(), v.end()}; }

}  // namespace

std::string result_to_msgpack_string(const ClusteringResult& result) {
  GEOCLUSTER_ZONE;
  msgpack::sbuffer buffer;
  msgpack::packer<msgpack::sbuffer> pk(&buffer);

  // Top-level map with 5 keys
  pk.pack_map(5);

  pk.pack("version");
  pk.pack(std::string(RESULT_FORMAT_VERSION));

  pk.pack("nStores");
  pk.pack(static_cast<uint64_t>(result.n_stores));

  pk.pack("clusters");
  pk.pack_array(static_cast<uint32_t>(result.clusters.size()));
  for (const auto& c : result.clusters) {
    pk.pack_map(9);
    pk.pack("id");
    pk.pack(c.id);
    pk.pack("centroid");
    pk.pack_array(2);
    pk.pack(c.centroid.lat);
    pk.pack(c.centroid.lon);
    pk.pack("radiusMeters");
    pk.pack(c.radius_meters);
    pk.pack("storeCount");
    pk.pack(c.store_count);
    pk.pack("densityPerKm2");
    pk.pack(c.density_per_km2);
    pk.pack("densityScore");
    pk.pack(c.density_score);
    pk.pack("types");
    pack_breakdown(pk, c.category_breakdown);
    pk.pack("sizes");
    pack_breakdown(pk, c.size_breakdown);
    pk.pack("members");
    pk.pack(to_u64(c.member_indices));
  }

  pk.pack("noise");
  pk.pack(result.noise_store_ids);

  pk.pack("noiseIndices");
  pk.pack(to_u64(result.noise_indices));

  return std::string(buffer.data(), buffer.size());
}

ClusteringResult result_from_msgpack_string(const std::string& data) {
  GEOCLUSTER_ZONE;

  ClusteringResult result;
  try {
    msgpack::object_handle handle = msgpack::unpack(data.data(), data.size());
    auto map = handle.get().as<std::map<std::string, msgpack::object>>();

    result.n_stores = static_cast<size_t>(map.at("nStores").as<uint64_t>());

    auto clusters = map.at("clusters").as<std::vector<msgpack::object>>();
    result.clusters.reserve(clusters.size());
    for (const auto& cluster_obj : clusters) {
      auto cm = cluster_obj.as<std::map<std::string, msgpack::object>>();
      ClusterSummary c;
      c.id = cm.at("id").as<int>();

      auto centroid = cm.at("centroid").as<std::vector<double>>();
      if (centroid.size() != 2) {
        throw ParseError(
            std::format("cluster {} centroid must have 2 coordinates, got {}", c.id, centroid.size()));
      }
      c.centroid = Point{centroid[0], centroid[1]};

      c.radius_meters = cm.at("radiusMeters").as<double>();
      c.store_count = cm.at("storeCount").as<int>();
      c.density_per_km2 = cm.at("densityPerKm2").as<double>();
      c.density_score = cm.at("densityScore").as<int>();
      c.category_breakdown = unpack_breakdown(cm.at("types"));
      c.size_breakdown = unpack_breakdown(cm.at("sizes"));
      c.member_indices = from_u64(cm.at("members").as<std::vector<uint64_t>>());
      result.clusters.push_back(std::move(c));
    }

    result.noise_store_ids = map.at("noise").as<std::vector<std::string>>();
    result.noise_indices = from_u64(map.at("noiseIndices").as<std::vector<uint64_t>>());
  } catch (const msgpack::unpack_error& e) {
    throw ParseError(std::format("invalid msgpack result: {}", e.what()));
  } catch (const msgpack::type_error& e) {
    throw ParseError(std::format("invalid msgpack result: {}", e.what()));
  } catch (const std::out_of_range& e) {
    throw ParseError(std::format("msgpack result is missing a field: {}", e.what()));
  }
  check_indices(result);
  return result;
}

void save_result_msgpack(const ClusteringResult& result, const std::string& path) {
  detail::write_file(path, result_to_msgpack_string(result), "msgpack", true);
}

ClusteringResult load_result_msgpack(const std::string& path) {
  GEOCLUSTER_ZONE;

  int fd = open(path.c_str(), O_RDONLY);
  if (fd == -1) {
    throw IoError(std::format("Failed to open msgpack file: {}", path));
  }

  struct stat sb;
  if (fstat(fd, &sb) == -1) {
    close(fd);
    throw IoError(std::format("Failed to stat msgpack file: {}", path));
  }
  auto file_size = static_cast<size_t>(sb.st_size);
  if (file_size == 0) {
    close(fd);
    throw IoError(std::format("msgpack file is empty: {}", path));
  }

  void* mapped = mmap(nullptr, file_size, PROT_READ, MAP_PRIVATE, fd, 0);
  if (mapped == MAP_FAILED) {
    close(fd);
    throw IoError(std::format("Failed to mmap msgpack file: {}", path));
  }

  try {
    auto result = result_from_msgpack_string(std::string(static_cast<const char*>(mapped), file_size));
    munmap(mapped, file_size);
    close(fd);
    return result;
  } catch (...) {
    munmap(mapped, file_size);
    close(fd);
    throw;
  }
}

}  // namespace geocluster::io
