#pragma once
#include <cmath>
#include <geocluster/common/store.hpp>
#include <random>
#include <string>
#include <vector>

namespace bench_utils {

// Synthetic city: dense shopping districts on a sparse background, ~20 km across.
// Deterministic for a given seed.
inline std::vector<geocluster::Store> GenerateCity(size_t n_stores, size_t n_districts = 20,
                                                   unsigned seed = 42) {
  constexpr double kCenterLat = 51.5074;
  constexpr double kCenterLon = -0.1278;
  constexpr double kCityDeg = 0.09;      // ~10 km
  constexpr double kDistrictDeg = 0.003;  // ~300 m

  static const char* kCategories[] = {"supermarket", "bakery", "clothes", "pharmacy", "cafe"};

  std::mt19937 rng(seed);
  std::uniform_real_distribution<double> city(-kCityDeg, kCityDeg);
  std::normal_distribution<double> district(0.0, kDistrictDeg);
  std::uniform_int_distribution<int> category(0, 4);
  std::uniform_int_distribution<int> size(0, 2);

  std::vector<geocluster::Point> centers;
  centers.reserve(n_districts);
  for (size_t d = 0; d < n_districts; ++d) {
    centers.push_back({kCenterLat + city(rng), kCenterLon + city(rng)});
  }

  std::vector<geocluster::Store> stores;
  stores.reserve(n_stores);
  for (size_t i = 0; i < n_stores; ++i) {
    geocluster::Point p;
    // 80% of stores sit in a district, the rest are scattered
    if (n_districts > 0 && i % 5 != 0) {
      const auto& c = centers[i % n_districts];
      p = {c.lat + district(rng), c.lon + district(rng)};
    } else {
      p = {kCenterLat + city(rng), kCenterLon + city(rng)};
    }

    geocluster::Store s;
    s.id = "store-" + std::to_string(i);
    s.name = s.id;
    s.location = p;
    s.category = kCategories[category(rng)];
    s.size = static_cast<geocluster::SizeClass>(size(rng));
    stores.push_back(std::move(s));
  }
  return stores;
}

inline std::vector<geocluster::Point> Locations(const std::vector<geocluster::Store>& stores) {
  std::vector<geocluster::Point> points;
  points.reserve(stores.size());
  for (const auto& s : stores) points.push_back(s.location);
  return points;
}

}  // namespace bench_utils
