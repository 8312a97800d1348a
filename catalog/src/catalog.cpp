#include <algorithm>
#include <cctype>
#include <geocluster/catalog/catalog.hpp>
#include <initializer_list>
#include <ranges>

namespace geocluster::catalog {

namespace {

  std::string_view first_present(const TagMap& tags, std::initializer_list<const char*> keys,
                                 std::string_view fallback) {
    for (const char* key : keys) {
      auto it = tags.find(key);
      if (it != tags.end() && !it->second.empty()) {
        return it->second;
      }
    }
    return fallback;
  }

  std::string lowered_values(const TagMap& tags) {
    std::string joined;
    for (const auto& [key, value] : tags) {
      if (!joined.empty()) joined.push_back(' ');
      joined += value;
    }
    std::ranges::transform(joined, joined.begin(), [](unsigned char c) {
      return static_cast<char>(std::tolower(c));
    });
    return joined;
  }

  template <size_t N>
  bool contains_any(std::string_view haystack, const std::array<std::string_view, N>& needles) {
    return std::ranges::any_of(needles, [&](std::string_view needle) {
      return haystack.find(needle) != std::string_view::npos;
    });
  }

}  // namespace

std::string display_name(const TagMap& tags) {
  return std::string(first_present(tags, {"name", "brand"}, UNNAMED));
}

std::string category_from_tags(const TagMap& tags) {
  return std::string(first_present(tags, {"shop", "amenity"}, DEFAULT_CATEGORY));
}

SizeClass infer_size_class(const TagMap& tags) {
  const std::string values = lowered_values(tags);
  if (contains_any(values, LARGE_KEYWORDS)) return SizeClass::Large;
  if (contains_any(values, MEDIUM_KEYWORDS)) return SizeClass::Medium;
  return SizeClass::Small;
}

Store make_store(std::string id, Point location, TagMap tags) {
  Store store;
  store.id = std::move(id);
  store.name = display_name(tags);
  store.location = location;
  store.category = category_from_tags(tags);
  store.size = infer_size_class(tags);
  store.tags = std::move(tags);
  return store;
}

}  // namespace geocluster::catalog
