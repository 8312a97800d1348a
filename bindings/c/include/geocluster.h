#ifndef GEOCLUSTER_H
#define GEOCLUSTER_H

#include <stddef.h>

/* Cross-platform DLL export/import macros */
#if defined(_WIN32) || defined(_WIN64)
#  ifdef GEOCLUSTER_C_EXPORTS
#    define GEOCLUSTER_API __declspec(dllexport)
#  else
#    define GEOCLUSTER_API __declspec(dllimport)
#  endif
#else
#  if __GNUC__ >= 4
#    define GEOCLUSTER_API __attribute__((visibility("default")))
#  else
#    define GEOCLUSTER_API
#  endif
#endif

#ifdef __cplusplus
extern "C" {
#endif

/**
 * Opaque handle to a clustering pipeline
 */
typedef struct GeoclusterPipeline GeoclusterPipeline;

/**
 * Store size class
 */
typedef enum {
  GEOCLUSTER_SIZE_SMALL = 0,
  GEOCLUSTER_SIZE_MEDIUM = 1,
  GEOCLUSTER_SIZE_LARGE = 2
} GeoclusterSizeClass;

/**
 * Neighborhood search strategy
 */
typedef enum { GEOCLUSTER_SEARCH_BRUTE_FORCE = 0, GEOCLUSTER_SEARCH_GRID = 1 } GeoclusterSearch;

/**
 * Store record (input, borrowed for the duration of the call)
 */
typedef struct {
  const char* id;       /**< Store id (required) */
  const char* name;     /**< Display name, NULL for "Unnamed" */
  double lat;           /**< Latitude in degrees */
  double lng;           /**< Longitude in degrees */
  const char* category; /**< Category label, NULL for "shop" */
  GeoclusterSizeClass size;
} GeoclusterStore;

/**
 * One label of a category or size breakdown
 */
typedef struct {
  char* label;
  int count;
} GeoclusterBreakdownEntry;

/**
 * Cluster summary
 */
typedef struct {
  int id;
  double centroid_lat;
  double centroid_lng;
  double radius_meters;
  int store_count;
  double density_per_km2;
  int density_score; /**< 0..100 */
  GeoclusterBreakdownEntry* types;
  size_t types_count;
  GeoclusterBreakdownEntry* sizes;
  size_t sizes_count;
  size_t* member_indices; /**< Indices into the input store array, ascending */
  size_t member_count;
} GeoclusterCluster;

/**
 * Clustering result
 */
typedef struct {
  GeoclusterCluster* clusters; /**< Ordered by cluster id */
  size_t cluster_count;
  size_t* noise_indices; /**< Input order */
  char** noise_store_ids;
  size_t noise_count;
  size_t n_stores;
} GeoclusterResult;

/**
 * Error codes for geocluster operations
 */
typedef enum {
  GEOCLUSTER_OK = 0,
  GEOCLUSTER_ERROR_NULL_PIPELINE,
  GEOCLUSTER_ERROR_NULL_STORES,
  GEOCLUSTER_ERROR_INVALID_PARAMETER,
  GEOCLUSTER_ERROR_INVALID_INPUT,
  GEOCLUSTER_ERROR_ALLOCATION_FAILED,
  GEOCLUSTER_ERROR_INTERNAL
} GeoclusterErrorCode;

/**
 * Create a pipeline from explicit parameters
 * @param eps_meters Neighborhood radius in meters (> 0)
 * @param min_pts Minimum neighborhood size for a core store (>= 1)
 * @param search Neighborhood search strategy
 * @return Pipeline handle, or NULL on invalid parameters
 */
GEOCLUSTER_API GeoclusterPipeline* geocluster_pipeline_create(double eps_meters, int min_pts,
                                                              GeoclusterSearch search);

/**
 * Create a pipeline from a JSON config string
 * @param json_str JSON object with eps_meters, min_pts, neighbor_search, ...
 * @return Pipeline handle, or NULL on error
 */
GEOCLUSTER_API GeoclusterPipeline* geocluster_pipeline_create_from_json(const char* json_str);

/**
 * Create a pipeline from a JSON config file
 * @param config_path Path to the config file
 * @return Pipeline handle, or NULL on error
 */
GEOCLUSTER_API GeoclusterPipeline* geocluster_pipeline_create_from_file(const char* config_path);

/**
 * Destroy a pipeline and free its resources
 * @param pipeline Pipeline handle
 */
GEOCLUSTER_API void geocluster_pipeline_destroy(GeoclusterPipeline* pipeline);

/**
 * Cluster stores with the pipeline's configured parameters
 * @param pipeline Pipeline handle
 * @param stores Array of store records (may be NULL when n_stores is 0)
 * @param n_stores Number of stores
 * @param error_out Optional error code output (can be NULL)
 * @return Result (caller must free with geocluster_result_free), or NULL on error
 */
GEOCLUSTER_API GeoclusterResult* geocluster_run(const GeoclusterPipeline* pipeline,
                                                const GeoclusterStore* stores, size_t n_stores,
                                                GeoclusterErrorCode* error_out);

/**
 * Cluster stores overriding eps and min_pts for this call
 */
GEOCLUSTER_API GeoclusterResult* geocluster_run_with_params(const GeoclusterPipeline* pipeline,
                                                            const GeoclusterStore* stores,
                                                            size_t n_stores, double eps_meters,
                                                            int min_pts,
                                                            GeoclusterErrorCode* error_out);

/**
 * Serialize a result to JSON (same document as the C++ result writer, without member ids)
 * @param result Result to serialize
 * @return JSON string (caller must free with geocluster_string_free), or NULL on error
 */
GEOCLUSTER_API char* geocluster_result_to_json(const GeoclusterResult* result);

/**
 * Free a result
 * @param result Result to free
 */
GEOCLUSTER_API void geocluster_result_free(GeoclusterResult* result);

/**
 * Free a string returned by the API
 * @param str String to free
 */
GEOCLUSTER_API void geocluster_string_free(char* str);

/**
 * Configured neighborhood radius in meters
 */
GEOCLUSTER_API double geocluster_pipeline_get_eps(const GeoclusterPipeline* pipeline);

/**
 * Configured minimum neighborhood size
 */
GEOCLUSTER_API int geocluster_pipeline_get_min_pts(const GeoclusterPipeline* pipeline);

/**
 * Great-circle distance in meters between two coordinates given in degrees
 */
GEOCLUSTER_API double geocluster_haversine_distance(double lat1, double lng1, double lat2,
                                                    double lng2);

#ifdef __cplusplus
}
#endif

#endif /* GEOCLUSTER_H */
