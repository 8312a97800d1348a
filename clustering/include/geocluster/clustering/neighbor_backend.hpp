#pragma once
#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <variant>
#include <vector>

#include <geocluster/common/point.hpp>
#include <geocluster/geo/distance.hpp>

namespace geocluster::clustering {

// Neighbor search strategy
struct BruteForceSearch {};
struct GridSearch {};

using NeighborSearch = std::variant<BruteForceSearch, GridSearch>;

template <class... Ts> struct overloaded : Ts... {
  using Ts::operator()...;
};

[[nodiscard]] std::string_view to_string(const NeighborSearch& search) noexcept;
[[nodiscard]] std::optional<NeighborSearch> parse_neighbor_search(std::string_view name) noexcept;

// Indices of the points within eps of a query point, query point included, ascending
using Neighborhood = std::vector<size_t>;

// Abstract interface for region-query backends
class INeighborBackend {
public:
  virtual ~INeighborBackend() = default;

  // Non-copyable, non-movable (polymorphic base class)
  INeighborBackend(const INeighborBackend&) = delete;
  INeighborBackend& operator=(const INeighborBackend&) = delete;
  INeighborBackend(INeighborBackend&&) = delete;
  INeighborBackend& operator=(INeighborBackend&&) = delete;

  // Index points for queries at radius eps (meters). Replaces any previous index.
  virtual void build(std::span<const Point> points, double eps) = 0;

  // Every indexed point p with distance(points[idx], p) <= eps
  [[nodiscard]] virtual Neighborhood region_query(size_t idx) const = 0;

  // Neighborhood of every indexed point, in index order. Rows are independent,
  // so the parallel build gives the same result as the serial one.
  [[nodiscard]] virtual std::vector<Neighborhood> all_neighborhoods() const;

  [[nodiscard]] virtual size_t size() const noexcept = 0;
  [[nodiscard]] virtual double eps() const noexcept = 0;

protected:
  INeighborBackend() = default;
};

// The distance function is called concurrently when OpenMP is enabled and must not throw.
// GridSearch assumes a metric bounded below by the haversine distance.
[[nodiscard]] std::unique_ptr<INeighborBackend> create_backend(NeighborSearch search,
                                                               geo::DistanceFn distance);

}  // namespace geocluster::clustering
