#pragma once
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <geocluster/common/point.hpp>

namespace geocluster {

enum class SizeClass { Small, Medium, Large };

[[nodiscard]] constexpr std::string_view to_string(SizeClass size) noexcept {
  switch (size) {
    case SizeClass::Small:
      return "small";
    case SizeClass::Medium:
      return "medium";
    case SizeClass::Large:
      return "large";
  }
  return "small";
}

[[nodiscard]] constexpr std::optional<SizeClass> parse_size_class(std::string_view s) noexcept {
  if (s == "small") return SizeClass::Small;
  if (s == "medium") return SizeClass::Medium;
  if (s == "large") return SizeClass::Large;
  return std::nullopt;
}

using TagMap = std::map<std::string, std::string>;

// Caller-owned store record; the engine only reads it
struct Store {
  std::string id;
  std::string name;
  Point location;
  std::string category;
  SizeClass size = SizeClass::Small;
  TagMap tags;
};

}  // namespace geocluster
