#include <nanobind/nanobind.h>
#include <nanobind/stl/map.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/vector.h>

#include <geocluster/catalog/catalog.hpp>
#include <geocluster/geo/distance.hpp>
#include <geocluster/io/config_io.hpp>
#include <geocluster/io/result_io.hpp>
#include <geocluster/io/store_io.hpp>
#include <geocluster/pipeline/pipeline.hpp>

namespace nb = nanobind;
using namespace nb::literals;

using geocluster::Point;
using geocluster::SizeClass;
using geocluster::Store;
using geocluster::pipeline::ClusteringPipeline;
using geocluster::pipeline::ClusteringResult;
using geocluster::pipeline::PipelineConfig;
using geocluster::summary::Breakdown;
using geocluster::summary::ClusterSummary;

namespace {

// dict keeps insertion order, matching the breakdown's first-seen order
nb::dict breakdown_to_dict(const Breakdown& breakdown) {
  nb::dict d;
  for (const auto& [label, count] : breakdown) {
    d[nb::str(label.c_str())] = count;
  }
  return d;
}

ClusteringResult unwrap(geocluster::Result<ClusteringResult> result) {
  if (!result) {
    throw nb::value_error(result.error().message.c_str());
  }
  return std::move(result.value());
}

}  // namespace

NB_MODULE(geocluster_ext, m) {
  m.doc() = "geocluster - density clustering of store locations";

  m.def("haversine_distance",
      [](double lat1, double lng1, double lat2, double lng2) {
          return geocluster::geo::haversine_distance({lat1, lng1}, {lat2, lng2});
      },
      "lat1"_a, "lng1"_a, "lat2"_a, "lng2"_a,
      "Great-circle distance in meters between two coordinates in degrees");

  nb::enum_<SizeClass>(m, "SizeClass")
      .value("SMALL", SizeClass::Small)
      .value("MEDIUM", SizeClass::Medium)
      .value("LARGE", SizeClass::Large);

  nb::class_<Store>(m, "Store", "Store location with category and size class")
      .def("__init__",
          [](Store* s, std::string id, double lat, double lng, std::string name,
             std::string category, SizeClass size) {
              new (s) Store{std::move(id), std::move(name), Point{lat, lng},
                            std::move(category), size, {}};
          },
          "id"_a, "lat"_a, "lng"_a, "name"_a = std::string(geocluster::catalog::UNNAMED),
          "category"_a = std::string(geocluster::catalog::DEFAULT_CATEGORY),
          "size"_a = SizeClass::Small)
      .def_static("from_tags",
          [](std::string id, double lat, double lng, geocluster::TagMap tags) {
              return geocluster::catalog::make_store(std::move(id), Point{lat, lng},
                                                     std::move(tags));
          },
          "id"_a, "lat"_a, "lng"_a, "tags"_a,
          "Build a store from raw place tags (name, category and size are inferred)")
      .def_rw("id", &Store::id)
      .def_rw("name", &Store::name)
      .def_rw("category", &Store::category)
      .def_rw("size", &Store::size)
      .def_rw("tags", &Store::tags)
      .def_prop_ro("lat", [](const Store& s) { return s.location.lat; })
      .def_prop_ro("lng", [](const Store& s) { return s.location.lon; })
      .def("__repr__", [](const Store& s) {
          return "<Store id='" + s.id + "' name='" + s.name + "'>";
      });

  nb::class_<PipelineConfig>(m, "PipelineConfig")
      .def(nb::init<>())
      .def_rw("eps_meters", &PipelineConfig::eps_meters)
      .def_rw("min_pts", &PipelineConfig::min_pts)
      .def_rw("validate_coordinates", &PipelineConfig::validate_coordinates)
      .def_prop_rw("neighbor_search",
          [](const PipelineConfig& c) {
              return std::string(geocluster::clustering::to_string(c.neighbor_search));
          },
          [](PipelineConfig& c, const std::string& name) {
              auto search = geocluster::clustering::parse_neighbor_search(name);
              if (!search) throw nb::value_error("neighbor_search must be 'brute_force' or 'grid'");
              c.neighbor_search = *search;
          })
      .def_prop_rw("empty_input",
          [](const PipelineConfig& c) {
              return std::string(geocluster::pipeline::to_string(c.empty_input));
          },
          [](PipelineConfig& c, const std::string& name) {
              auto policy = geocluster::pipeline::parse_empty_input_policy(name);
              if (!policy) throw nb::value_error("empty_input must be 'error' or 'empty_result'");
              c.empty_input = *policy;
          })
      .def_static("from_json_string", &geocluster::io::config_from_json_string, "json_str"_a)
      .def_static("from_json_file", &geocluster::io::load_config, "path"_a)
      .def("to_json_string", [](const PipelineConfig& c) {
          return geocluster::io::config_to_json_string(c);
      });

  nb::class_<ClusterSummary>(m, "ClusterSummary")
      .def_ro("id", &ClusterSummary::id)
      .def_prop_ro("centroid", [](const ClusterSummary& c) {
          return nb::make_tuple(c.centroid.lat, c.centroid.lon);
      }, "(lat, lng) tuple")
      .def_ro("radius_meters", &ClusterSummary::radius_meters)
      .def_ro("store_count", &ClusterSummary::store_count)
      .def_ro("density_per_km2", &ClusterSummary::density_per_km2)
      .def_ro("density_score", &ClusterSummary::density_score)
      .def_prop_ro("types", [](const ClusterSummary& c) {
          return breakdown_to_dict(c.category_breakdown);
      })
      .def_prop_ro("sizes", [](const ClusterSummary& c) {
          return breakdown_to_dict(c.size_breakdown);
      })
      .def_ro("member_indices", &ClusterSummary::member_indices)
      .def("__repr__", [](const ClusterSummary& c) {
          return "<ClusterSummary id=" + std::to_string(c.id) + " stores=" +
                 std::to_string(c.store_count) + ">";
      });

  nb::class_<ClusteringResult>(m, "ClusteringResult")
      .def_ro("clusters", &ClusteringResult::clusters)
      .def_ro("noise", &ClusteringResult::noise_store_ids, "Noise store ids in input order")
      .def_ro("noise_indices", &ClusteringResult::noise_indices)
      .def_ro("n_stores", &ClusteringResult::n_stores)
      .def("to_json_string",
          [](const ClusteringResult& r, const std::vector<Store>& stores) {
              return geocluster::io::result_to_json_string(r, stores);
          },
          "stores"_a = std::vector<Store>{},
          "Serialize to JSON; pass the input stores to embed member store ids")
      .def("digest_json_string", [](const ClusteringResult& r) {
          return geocluster::io::digest_json_string(r);
      })
      .def("to_msgpack_bytes", [](const ClusteringResult& r) {
          std::string data = geocluster::io::result_to_msgpack_string(r);
          return nb::bytes(data.data(), data.size());
      })
      .def_static("from_json_string", &geocluster::io::result_from_json_string, "json_str"_a)
      .def_static("from_msgpack_bytes", [](nb::bytes data) {
          return geocluster::io::result_from_msgpack_string(std::string(data.c_str(), data.size()));
      }, "data"_a);

  nb::class_<ClusteringPipeline>(m, "ClusteringPipeline",
      "Stores -> density clustering -> cluster summaries")
      .def("__init__",
          [](ClusteringPipeline* self, PipelineConfig config) {
              auto created = ClusteringPipeline::create(std::move(config));
              if (!created) {
                  throw nb::value_error(created.error().c_str());
              }
              new (self) ClusteringPipeline(std::move(*created));
          },
          "config"_a = PipelineConfig{})
      .def_static("from_config_file",
          [](const std::string& path) {
              auto created = geocluster::io::load_pipeline(path);
              if (!created) {
                  throw nb::value_error(created.error().c_str());
              }
              return std::move(created.value());
          },
          "path"_a)
      .def("run",
          [](const ClusteringPipeline& self, const std::vector<Store>& stores) {
              return unwrap(self.run(stores));
          },
          "stores"_a,
          "Cluster stores with the configured eps / min_pts\n\n"
          "Raises:\n"
          "    ValueError: On invalid parameters or input")
      .def("run",
          [](const ClusteringPipeline& self, const std::vector<Store>& stores, double eps,
             int min_pts) {
              return unwrap(self.run(stores, eps, min_pts));
          },
          "stores"_a, "eps"_a, "min_pts"_a)
      .def_prop_ro("config", &ClusteringPipeline::config);

  m.def("load_stores", &geocluster::io::load_stores, "path"_a,
      "Load a store list (array or place-query 'elements' document) from JSON");
  m.def("stores_from_json_string", &geocluster::io::stores_from_json_string, "json_str"_a);
}
