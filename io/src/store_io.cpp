#include <format>
#include <geocluster/catalog/catalog.hpp>
#include <geocluster/common/error.hpp>
#include <geocluster/common/tracy.hpp>
#include <geocluster/io/store_io.hpp>
#include <nlohmann/json.hpp>
#include <stdexcept>

#include "file_util.hpp"

using json = nlohmann::json;

namespace geocluster::io {

namespace {

  std::string id_to_string(const json& id, size_t index) {
    if (id.is_string()) return id.get<std::string>();
    if (id.is_number_integer()) return std::to_string(id.get<long long>());
    if (id.is_number_unsigned()) return std::to_string(id.get<unsigned long long>());
    throw ParseError(
        std::format("store record {} has an id that is neither a string nor an integer", index));
  }

  TagMap tags_from_json(const json& record) {
    TagMap tags;
    if (!record.contains("tags") || record["tags"].is_null()) return tags;

    for (const auto& [key, value] : record["tags"].items()) {
      tags[key] = value.is_string() ? value.get<std::string>() : value.dump();
    }
    return tags;
  }

  Point location_from_json(const json& record, size_t index) {
    const json* source = &record;
    if (!record.contains("lat") && record.contains("center")) {
      source = &record["center"];
    }

    if (!source->contains("lat")) {
      throw ParseError(std::format("store record {} has no latitude", index));
    }

    Point p;
    (*source)["lat"].get_to(p.lat);
    if (source->contains("lng")) {
      (*source)["lng"].get_to(p.lon);
    } else if (source->contains("lon")) {
      (*source)["lon"].get_to(p.lon);
    } else {
      throw ParseError(std::format("store record {} has no longitude", index));
    }
    return p;
  }

  // Place records (from an "elements" document) use "type" for the element kind,
  // so only plain store records may override the tag-derived fields.
  Store store_from_record(const json& record, size_t index, bool place_record) {
    if (!record.is_object()) {
      throw ParseError(std::format("store record {} is not an object", index));
    }
    if (!record.contains("id")) {
      throw ParseError(std::format("store record {} has no id", index));
    }

    Store store = catalog::make_store(id_to_string(record["id"], index),
                                      location_from_json(record, index), tags_from_json(record));
    if (place_record) return store;

    if (record.contains("name")) record["name"].get_to(store.name);
    if (record.contains("type")) {
      record["type"].get_to(store.category);
    } else if (record.contains("category")) {
      record["category"].get_to(store.category);
    }

    if (record.contains("size")) {
      auto size_name = record["size"].get<std::string>();
      auto size = parse_size_class(size_name);
      if (!size) {
        throw ParseError(std::format(
            "store record {} has size '{}', expected small, medium or large", index, size_name));
      }
      store.size = *size;
    }

    return store;
  }

}  // namespace

std::vector<Store> stores_from_json_string(const std::string& json_str) {
  GEOCLUSTER_ZONE;
  try {
    json j = json::parse(json_str);

    const json* records = &j;
    const bool place_records = j.is_object() && j.contains("elements");
    if (place_records) {
      records = &j["elements"];
    }
    if (!records->is_array()) {
      throw ParseError("store list must be an array or an object with 'elements'");
    }

    std::vector<Store> stores;
    stores.reserve(records->size());
    for (size_t i = 0; i < records->size(); ++i) {
      stores.push_back(store_from_record((*records)[i], i, place_records));
    }
    return stores;
  } catch (const json::exception& e) {
    throw ParseError(std::format("invalid store list: {}", e.what()));
  }
}

std::vector<Store> load_stores(const std::string& path) {
  return stores_from_json_string(detail::read_text_file(path, "store list"));
}

std::string stores_to_json_string(std::span<const Store> stores) {
  json records = json::array();
  for (const auto& store : stores) {
    records.push_back({{"id", store.id},
                       {"name", store.name},
                       {"lat", store.location.lat},
                       {"lng", store.location.lon},
                       {"type", store.category},
                       {"size", std::string(to_string(store.size))},
                       {"tags", store.tags}});
  }
  return records.dump(2);
}

void save_stores(std::span<const Store> stores, const std::string& path) {
  detail::write_file(path, stores_to_json_string(stores), "store list");
}

}  // namespace geocluster::io
