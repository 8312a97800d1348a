#include <benchmark/benchmark.h>

#include <geocluster/clustering/neighbor_backend.hpp>
#include <geocluster/geo/distance.hpp>

#include "bench_utils.hpp"

using namespace geocluster;

static void BM_Haversine(benchmark::State& state) {
  Point a{51.5074, -0.1278};
  Point b{51.5155, -0.0922};

  for (auto _ : state) {
    benchmark::DoNotOptimize(geo::haversine_distance(a, b));
    benchmark::ClobberMemory();
  }
}

BENCHMARK(BM_Haversine);

template <typename Search> static void BM_AllNeighborhoods(benchmark::State& state) {
  const auto n_stores = static_cast<size_t>(state.range(0));
  const auto points = bench_utils::Locations(bench_utils::GenerateCity(n_stores));

  auto backend = clustering::create_backend(Search{}, geo::default_distance());

  for (auto _ : state) {
    backend->build(points, 500.0);
    auto neighborhoods = backend->all_neighborhoods();
    benchmark::DoNotOptimize(neighborhoods);
  }

  state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(n_stores));
  state.SetLabel(std::string(clustering::to_string(Search{})) + "/" + std::to_string(n_stores));
}

static void BackendArgs(benchmark::internal::Benchmark* b) {
  for (int n : {500, 1000, 2000, 5000}) {
    b->Arg(n);
  }
  b->Unit(benchmark::kMillisecond);
}

BENCHMARK(BM_AllNeighborhoods<clustering::BruteForceSearch>)->Apply(BackendArgs);
BENCHMARK(BM_AllNeighborhoods<clustering::GridSearch>)->Apply(BackendArgs);

static void BM_GridRegionQuery(benchmark::State& state) {
  const auto n_stores = static_cast<size_t>(state.range(0));
  const auto points = bench_utils::Locations(bench_utils::GenerateCity(n_stores));

  auto backend = clustering::create_backend(clustering::GridSearch{}, geo::default_distance());
  backend->build(points, 500.0);

  size_t idx = 0;
  for (auto _ : state) {
    auto region = backend->region_query(idx);
    benchmark::DoNotOptimize(region);
    idx = (idx + 1) % n_stores;
  }
}

BENCHMARK(BM_GridRegionQuery)->Arg(1000)->Arg(10000)->Arg(50000);
