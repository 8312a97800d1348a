#pragma once
#include <span>
#include <string>
#include <vector>

#include <geocluster/common/store.hpp>

namespace geocluster::io {

// Accepts either
//   [ {"id", "name"?, "lat", "lng"|"lon", "type"|"category"?, "size"?, "tags"?}, ... ]
// or a place-query response
//   { "elements": [ {"id", "lat", "lon" | "center": {"lat", "lon"}, "tags"}, ... ] }
// Records without an explicit name, category or size get them from their tags;
// place records always do.
[[nodiscard]] std::vector<Store> stores_from_json_string(const std::string& json_str);
[[nodiscard]] std::vector<Store> load_stores(const std::string& path);

[[nodiscard]] std::string stores_to_json_string(std::span<const Store> stores);
void save_stores(std::span<const Store> stores, const std::string& path);

}  // namespace geocluster::io
