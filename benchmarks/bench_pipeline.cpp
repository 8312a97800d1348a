#include <benchmark/benchmark.h>

#include <geocluster/clustering/dbscan.hpp>
#include <geocluster/pipeline/pipeline.hpp>

#include "bench_utils.hpp"

using namespace geocluster;

static void BM_DensityClusterer(benchmark::State& state) {
  const auto n_stores = static_cast<size_t>(state.range(0));
  const auto points = bench_utils::Locations(bench_utils::GenerateCity(n_stores));

  clustering::DensityClusterer clusterer(geo::default_distance(), clustering::GridSearch{});

  for (auto _ : state) {
    auto assignment = clusterer.cluster(points, 500.0, 3);
    benchmark::DoNotOptimize(assignment);
  }

  state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(n_stores));
}

BENCHMARK(BM_DensityClusterer)->Arg(1000)->Arg(5000)->Arg(20000)->Unit(benchmark::kMillisecond);

static void BM_PipelineRun(benchmark::State& state) {
  const auto n_stores = static_cast<size_t>(state.range(0));
  const bool grid = state.range(1) != 0;
  const auto stores = bench_utils::GenerateCity(n_stores);

  pipeline::PipelineConfig config;
  if (grid) config.neighbor_search = clustering::GridSearch{};
  pipeline::ClusteringPipeline pipeline(config);

  for (auto _ : state) {
    auto result = pipeline.run(stores);
    if (!result) {
      state.SkipWithError(result.error().message.c_str());
      break;
    }
    benchmark::DoNotOptimize(result);
  }

  state.SetLabel(std::string(grid ? "grid" : "brute_force") + "/" + std::to_string(n_stores));
}

static void PipelineArgs(benchmark::internal::Benchmark* b) {
  for (int n : {500, 2000, 5000}) {
    b->Args({n, 0});
    b->Args({n, 1});
  }
  b->Unit(benchmark::kMillisecond);
}

BENCHMARK(BM_PipelineRun)->Apply(PipelineArgs);

static void BM_PipelineEpsSweep(benchmark::State& state) {
  const auto eps = static_cast<double>(state.range(0));
  const auto stores = bench_utils::GenerateCity(5000);

  pipeline::PipelineConfig config;
  config.neighbor_search = clustering::GridSearch{};
  pipeline::ClusteringPipeline pipeline(config);

  size_t n_clusters = 0;
  for (auto _ : state) {
    auto result = pipeline.run(stores, eps, 3);
    if (!result) {
      state.SkipWithError(result.error().message.c_str());
      break;
    }
    n_clusters = result->n_clusters();
    benchmark::DoNotOptimize(result);
  }

  state.counters["clusters"] = static_cast<double>(n_clusters);
}

BENCHMARK(BM_PipelineEpsSweep)->Arg(100)->Arg(250)->Arg(500)->Arg(1000)->Unit(benchmark::kMillisecond);
