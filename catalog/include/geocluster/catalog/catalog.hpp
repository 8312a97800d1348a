#pragma once
#include <array>
#include <string>
#include <string_view>

#include <geocluster/common/store.hpp>

namespace geocluster::catalog {

inline constexpr std::string_view UNNAMED = "Unnamed";
inline constexpr std::string_view DEFAULT_CATEGORY = "shop";

inline constexpr std::array<std::string_view, 3> LARGE_KEYWORDS = {"supermarket",
                                                                   "department_store", "mall"};
inline constexpr std::array<std::string_view, 4> MEDIUM_KEYWORDS = {"grocery", "chemist", "bakery",
                                                                    "convenience"};

// tags["name"], then tags["brand"], then "Unnamed"
[[nodiscard]] std::string display_name(const TagMap& tags);

// tags["shop"], then tags["amenity"], then "shop"
[[nodiscard]] std::string category_from_tags(const TagMap& tags);

// Keyword match over all tag values, lowercased: large beats medium beats small
[[nodiscard]] SizeClass infer_size_class(const TagMap& tags);

// Heat weight used by map layers
[[nodiscard]] constexpr double size_weight(SizeClass size) noexcept {
  switch (size) {
    case SizeClass::Small:
      return 0.4;
    case SizeClass::Medium:
      return 0.7;
    case SizeClass::Large:
      return 1.0;
  }
  return 0.5;
}

// Store from a raw place record, applying the rules above
[[nodiscard]] Store make_store(std::string id, Point location, TagMap tags);

}  // namespace geocluster::catalog
