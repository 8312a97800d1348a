#include <algorithm>
#include <cstdlib>
#include <exception>
#include <geocluster/catalog/catalog.hpp>
#include <geocluster/geo/distance.hpp>
#include <geocluster/io/config_io.hpp>
#include <geocluster/io/result_io.hpp>
#include <geocluster/pipeline/pipeline.hpp>
#include <span>
#include <string>
#include <vector>

#include "geocluster.h"

using geocluster::pipeline::ClusteringPipeline;
using geocluster::pipeline::ClusteringResult;
using geocluster::pipeline::PipelineConfig;

// Internal helper to convert std::string to C string
static char* str_duplicate(const std::string& str) {
  char* result = static_cast<char*>(malloc(str.length() + 1));
  if (result) {
    std::ranges::copy(str, result);
    result[str.length()] = '\0';
  }
  return result;
}

static void set_error(GeoclusterErrorCode* error_out, GeoclusterErrorCode code) {
  if (error_out) *error_out = code;
}

static GeoclusterErrorCode to_c_error(geocluster::ErrorCode code) {
  switch (code) {
    case geocluster::ErrorCode::InvalidParameter:
      return GEOCLUSTER_ERROR_INVALID_PARAMETER;
    case geocluster::ErrorCode::InvalidInput:
    case geocluster::ErrorCode::EmptyInput:
      return GEOCLUSTER_ERROR_INVALID_INPUT;
    case geocluster::ErrorCode::Io:
    case geocluster::ErrorCode::Parse:
      return GEOCLUSTER_ERROR_INTERNAL;
  }
  return GEOCLUSTER_ERROR_INTERNAL;
}

static geocluster::SizeClass to_size_class(GeoclusterSizeClass size) {
  switch (size) {
    case GEOCLUSTER_SIZE_MEDIUM:
      return geocluster::SizeClass::Medium;
    case GEOCLUSTER_SIZE_LARGE:
      return geocluster::SizeClass::Large;
    case GEOCLUSTER_SIZE_SMALL:
      break;
  }
  return geocluster::SizeClass::Small;
}

static std::vector<geocluster::Store> to_stores(const GeoclusterStore* stores, size_t n_stores) {
  std::vector<geocluster::Store> out;
  out.reserve(n_stores);
  for (const auto& s : std::span(stores, n_stores)) {
    geocluster::Store store;
    store.id = s.id;
    store.name = s.name ? s.name : std::string(geocluster::catalog::UNNAMED);
    store.location = {s.lat, s.lng};
    store.category = s.category ? s.category : std::string(geocluster::catalog::DEFAULT_CATEGORY);
    store.size = to_size_class(s.size);
    out.push_back(std::move(store));
  }
  return out;
}

// ============================================================================
// Result conversion (all buffers calloc'd so a partial result frees cleanly)
// ============================================================================

static void free_breakdown(GeoclusterBreakdownEntry* entries, size_t count) {
  if (!entries) return;
  for (size_t i = 0; i < count; ++i) {
    free(entries[i].label);
  }
  free(entries);
}

static bool fill_breakdown(const geocluster::summary::Breakdown& breakdown,
                           GeoclusterBreakdownEntry** entries_out, size_t* count_out) {
  *entries_out = nullptr;
  *count_out = 0;
  if (breakdown.empty()) return true;

  auto* entries = static_cast<GeoclusterBreakdownEntry*>(
      calloc(breakdown.size(), sizeof(GeoclusterBreakdownEntry)));
  if (!entries) return false;
  *entries_out = entries;
  *count_out = breakdown.size();

  size_t i = 0;
  for (const auto& [label, count] : breakdown) {
    entries[i].label = str_duplicate(label);
    if (!entries[i].label) return false;
    entries[i].count = count;
    ++i;
  }
  return true;
}

static bool fill_indices(const std::vector<size_t>& indices, size_t** out) {
  *out = nullptr;
  if (indices.empty()) return true;
  *out = static_cast<size_t*>(malloc(sizeof(size_t) * indices.size()));
  if (!*out) return false;
  std::ranges::copy(indices, *out);
  return true;
}

static bool fill_cluster(const geocluster::summary::ClusterSummary& summary,
                         GeoclusterCluster* cluster) {
  cluster->id = summary.id;
  cluster->centroid_lat = summary.centroid.lat;
  cluster->centroid_lng = summary.centroid.lon;
  cluster->radius_meters = summary.radius_meters;
  cluster->store_count = summary.store_count;
  cluster->density_per_km2 = summary.density_per_km2;
  cluster->density_score = summary.density_score;

  if (!fill_breakdown(summary.category_breakdown, &cluster->types, &cluster->types_count)) {
    return false;
  }
  if (!fill_breakdown(summary.size_breakdown, &cluster->sizes, &cluster->sizes_count)) {
    return false;
  }
  if (!fill_indices(summary.member_indices, &cluster->member_indices)) return false;
  cluster->member_count = summary.member_indices.size();
  return true;
}

static GeoclusterResult* to_c_result(const ClusteringResult& response) {
  auto* result = static_cast<GeoclusterResult*>(calloc(1, sizeof(GeoclusterResult)));
  if (!result) return nullptr;
  result->n_stores = response.n_stores;

  if (!response.clusters.empty()) {
    result->clusters = static_cast<GeoclusterCluster*>(
        calloc(response.clusters.size(), sizeof(GeoclusterCluster)));
    if (!result->clusters) {
      geocluster_result_free(result);
      return nullptr;
    }
    result->cluster_count = response.clusters.size();
    for (size_t i = 0; i < response.clusters.size(); ++i) {
      if (!fill_cluster(response.clusters[i], &result->clusters[i])) {
        geocluster_result_free(result);
        return nullptr;
      }
    }
  }

  if (!response.noise_indices.empty()) {
    result->noise_store_ids
        = static_cast<char**>(calloc(response.noise_indices.size(), sizeof(char*)));
    if (!result->noise_store_ids || !fill_indices(response.noise_indices, &result->noise_indices)) {
      geocluster_result_free(result);
      return nullptr;
    }
    result->noise_count = response.noise_indices.size();
    for (size_t i = 0; i < result->noise_count; ++i) {
      result->noise_store_ids[i] = str_duplicate(response.noise_store_ids[i]);
      if (!result->noise_store_ids[i]) {
        geocluster_result_free(result);
        return nullptr;
      }
    }
  }

  return result;
}

static geocluster::summary::Breakdown from_c_breakdown(const GeoclusterBreakdownEntry* entries,
                                                       size_t count) {
  geocluster::summary::Breakdown breakdown;
  for (const auto& entry : std::span(entries, count)) {
    breakdown.add(entry.label ? entry.label : "", entry.count);
  }
  return breakdown;
}

static ClusteringResult from_c_result(const GeoclusterResult& result) {
  ClusteringResult out;
  out.n_stores = result.n_stores;
  for (const auto& c : std::span(result.clusters, result.cluster_count)) {
    geocluster::summary::ClusterSummary summary;
    summary.id = c.id;
    summary.centroid = {c.centroid_lat, c.centroid_lng};
    summary.radius_meters = c.radius_meters;
    summary.store_count = c.store_count;
    summary.density_per_km2 = c.density_per_km2;
    summary.density_score = c.density_score;
    summary.category_breakdown = from_c_breakdown(c.types, c.types_count);
    summary.size_breakdown = from_c_breakdown(c.sizes, c.sizes_count);
    summary.member_indices.assign(c.member_indices, c.member_indices + c.member_count);
    out.clusters.push_back(std::move(summary));
  }
  for (size_t i = 0; i < result.noise_count; ++i) {
    out.noise_indices.push_back(result.noise_indices[i]);
    out.noise_store_ids.emplace_back(result.noise_store_ids[i] ? result.noise_store_ids[i] : "");
  }
  return out;
}

static GeoclusterResult* run_impl(const GeoclusterPipeline* pipeline,
                                  const GeoclusterStore* stores, size_t n_stores,
                                  const double* eps_meters, const int* min_pts,
                                  GeoclusterErrorCode* error_out) {
  if (!pipeline) {
    set_error(error_out, GEOCLUSTER_ERROR_NULL_PIPELINE);
    return nullptr;
  }
  if (!stores && n_stores > 0) {
    set_error(error_out, GEOCLUSTER_ERROR_NULL_STORES);
    return nullptr;
  }
  auto records = std::span(stores, n_stores);
  if (std::ranges::any_of(records, [](const GeoclusterStore& s) { return s.id == nullptr; })) {
    set_error(error_out, GEOCLUSTER_ERROR_INVALID_INPUT);
    return nullptr;
  }

  try {
    const auto* cpp_pipeline = reinterpret_cast<const ClusteringPipeline*>(pipeline);
    auto cpp_stores = to_stores(stores, n_stores);
    auto response = eps_meters ? cpp_pipeline->run(cpp_stores, *eps_meters, *min_pts)
                               : cpp_pipeline->run(cpp_stores);
    if (!response) {
      set_error(error_out, to_c_error(response.error().code));
      return nullptr;
    }

    GeoclusterResult* result = to_c_result(*response);
    if (!result) {
      set_error(error_out, GEOCLUSTER_ERROR_ALLOCATION_FAILED);
      return nullptr;
    }
    set_error(error_out, GEOCLUSTER_OK);
    return result;
  } catch (const std::bad_alloc&) {
    set_error(error_out, GEOCLUSTER_ERROR_ALLOCATION_FAILED);
    return nullptr;
  } catch (const std::exception&) {
    set_error(error_out, GEOCLUSTER_ERROR_INTERNAL);
    return nullptr;
  }
}

static GeoclusterPipeline* wrap(std::expected<ClusteringPipeline, std::string> created) {
  if (!created) {
    return nullptr;
  }
  return reinterpret_cast<GeoclusterPipeline*>(new ClusteringPipeline(std::move(*created)));
}

// C API implementation
extern "C" {

GeoclusterPipeline* geocluster_pipeline_create(double eps_meters, int min_pts,
                                               GeoclusterSearch search) {
  try {
    PipelineConfig config;
    config.eps_meters = eps_meters;
    config.min_pts = min_pts;
    if (search == GEOCLUSTER_SEARCH_GRID) {
      config.neighbor_search = geocluster::clustering::GridSearch{};
    }
    return wrap(ClusteringPipeline::create(config));
  } catch (const std::exception&) {
    return nullptr;
  }
}

GeoclusterPipeline* geocluster_pipeline_create_from_json(const char* json_str) {
  if (!json_str) {
    return nullptr;
  }

  try {
    return wrap(geocluster::io::pipeline_from_json_string(json_str));
  } catch (const std::exception&) {
    return nullptr;
  }
}

GeoclusterPipeline* geocluster_pipeline_create_from_file(const char* config_path) {
  if (!config_path) {
    return nullptr;
  }

  try {
    return wrap(geocluster::io::load_pipeline(config_path));
  } catch (const std::exception&) {
    return nullptr;
  }
}

void geocluster_pipeline_destroy(GeoclusterPipeline* pipeline) {
  if (pipeline) {
    delete reinterpret_cast<ClusteringPipeline*>(pipeline);
  }
}

GeoclusterResult* geocluster_run(const GeoclusterPipeline* pipeline, const GeoclusterStore* stores,
                                 size_t n_stores, GeoclusterErrorCode* error_out) {
  return run_impl(pipeline, stores, n_stores, nullptr, nullptr, error_out);
}

GeoclusterResult* geocluster_run_with_params(const GeoclusterPipeline* pipeline,
                                             const GeoclusterStore* stores, size_t n_stores,
                                             double eps_meters, int min_pts,
                                             GeoclusterErrorCode* error_out) {
  return run_impl(pipeline, stores, n_stores, &eps_meters, &min_pts, error_out);
}

char* geocluster_result_to_json(const GeoclusterResult* result) {
  if (!result) {
    return nullptr;
  }

  try {
    return str_duplicate(geocluster::io::result_to_json_string(from_c_result(*result)));
  } catch (const std::exception&) {
    return nullptr;
  }
}

void geocluster_result_free(GeoclusterResult* result) {
  if (!result) return;

  if (result->clusters) {
    for (auto& cluster : std::span(result->clusters, result->cluster_count)) {
      free_breakdown(cluster.types, cluster.types_count);
      free_breakdown(cluster.sizes, cluster.sizes_count);
      free(cluster.member_indices);
    }
    free(result->clusters);
  }

  if (result->noise_store_ids) {
    for (size_t i = 0; i < result->noise_count; ++i) {
      free(result->noise_store_ids[i]);
    }
    free(result->noise_store_ids);
  }
  free(result->noise_indices);
  free(result);
}

void geocluster_string_free(char* str) { free(str); }

double geocluster_pipeline_get_eps(const GeoclusterPipeline* pipeline) {
  if (!pipeline) return 0.0;
  return reinterpret_cast<const ClusteringPipeline*>(pipeline)->config().eps_meters;
}

int geocluster_pipeline_get_min_pts(const GeoclusterPipeline* pipeline) {
  if (!pipeline) return 0;
  return reinterpret_cast<const ClusteringPipeline*>(pipeline)->config().min_pts;
}

double geocluster_haversine_distance(double lat1, double lng1, double lat2, double lng2) {
  return geocluster::geo::haversine_distance({lat1, lng1}, {lat2, lng2});
}

}  // extern "C"
