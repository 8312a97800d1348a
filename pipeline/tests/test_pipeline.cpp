#include <gtest/gtest.h>

#include <cmath>
#include <geocluster/common/logging.hpp>
#include <geocluster/pipeline/pipeline.hpp>
#include <random>
#include <set>
#include <string>
#include <vector>

using namespace geocluster;
using namespace geocluster::pipeline;

namespace {

constexpr double METERS_PER_DEG_LAT = 111194.92664455873;

// n stores heading north from origin, spacing_m apart
std::vector<Store> street(const std::string& prefix, Point origin, size_t n, double spacing_m,
                          const std::string& category = "shop",
                          SizeClass size = SizeClass::Small) {
  std::vector<Store> stores;
  for (size_t i = 0; i < n; ++i) {
    Store s;
    s.id = prefix + std::to_string(i);
    s.name = s.id;
    s.location = {origin.lat + static_cast<double>(i) * spacing_m / METERS_PER_DEG_LAT,
                  origin.lon};
    s.category = category;
    s.size = size;
    stores.push_back(std::move(s));
  }
  return stores;
}

void append(std::vector<Store>& to, const std::vector<Store>& from) {
  to.insert(to.end(), from.begin(), from.end());
}

}  // namespace

template <typename Search> class ClusteringPipelineTestT : public ::testing::Test {
protected:
  static PipelineConfig config() {
    PipelineConfig c;
    c.neighbor_search = Search{};
    return c;
  }

  ClusteringPipeline pipeline_{config()};
};

using SearchTypes = ::testing::Types<clustering::BruteForceSearch, clustering::GridSearch>;
TYPED_TEST_SUITE(ClusteringPipelineTestT, SearchTypes);

TYPED_TEST(ClusteringPipelineTestT, TenStoresWithin200mFormOneCluster) {
  auto stores = street("s", {40.7128, -74.0060}, 10, 20.0);

  auto result = this->pipeline_.run(stores, 500.0, 3);

  ASSERT_TRUE(result.has_value()) << result.error().message;
  ASSERT_EQ(result->n_clusters(), 1u);
  const auto& c = result->clusters[0];
  EXPECT_EQ(c.id, 0);
  EXPECT_EQ(c.store_count, 10);
  EXPECT_GE(c.radius_meters, 100.0);
  EXPECT_LE(c.radius_meters, 200.0);
  EXPECT_TRUE(result->noise_store_ids.empty());
  EXPECT_EQ(result->n_stores, 10u);
}

TYPED_TEST(ClusteringPipelineTestT, StoresFarApartAreAllNoise) {
  auto stores = street("s", {48.8566, 2.3522}, 5, 2000.0);

  auto result = this->pipeline_.run(stores, 500.0, 3);

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->n_clusters(), 0u);
  EXPECT_EQ(result->noise_store_ids, (std::vector<std::string>{"s0", "s1", "s2", "s3", "s4"}));
  EXPECT_EQ(result->noise_indices, (std::vector<size_t>{0, 1, 2, 3, 4}));
}

TYPED_TEST(ClusteringPipelineTestT, TwoGroupsThreeKilometersApart) {
  auto stores = street("a", {35.6762, 139.6503}, 5, 50.0, "bakery", SizeClass::Medium);
  append(stores, street("b", {35.6762 + 3000.0 / METERS_PER_DEG_LAT, 139.6503}, 5, 50.0,
                        "clothes", SizeClass::Small));

  auto result = this->pipeline_.run(stores, 500.0, 3);

  ASSERT_TRUE(result.has_value());
  ASSERT_EQ(result->n_clusters(), 2u);
  EXPECT_EQ(result->clusters[0].store_count, 5);
  EXPECT_EQ(result->clusters[1].store_count, 5);
  EXPECT_EQ(result->clusters[0].category_breakdown.count("bakery"), 5);
  EXPECT_EQ(result->clusters[1].category_breakdown.count("clothes"), 5);
  EXPECT_EQ(result->clusters[0].size_breakdown.count("medium"), 5);
  EXPECT_EQ(result->clusters[1].member_indices, (std::vector<size_t>{5, 6, 7, 8, 9}));
  EXPECT_TRUE(result->noise_store_ids.empty());

  // 200 m streets: radius ~100 m, ~159 stores/km2, score capped
  for (const auto& c : result->clusters) {
    EXPECT_NEAR(c.radius_meters, 100.0, 1.0);
    EXPECT_GT(c.density_per_km2, 150.0);
    EXPECT_EQ(c.density_score, 100);
  }
}

TYPED_TEST(ClusteringPipelineTestT, CoincidentStoresClusterAtMicroscopicEps) {
  std::vector<Store> stores = street("s", {10.0, 20.0}, 3, 0.0);

  for (double eps : {0.01, 0.001, 1e-9}) {
    auto result = this->pipeline_.run(stores, eps, 3);

    ASSERT_TRUE(result.has_value()) << "eps " << eps << ": " << result.error().message;
    ASSERT_EQ(result->n_clusters(), 1u);
    EXPECT_EQ(result->clusters[0].member_indices, (std::vector<size_t>{0, 1, 2}));
    EXPECT_TRUE(result->noise_store_ids.empty());
  }
}

TYPED_TEST(ClusteringPipelineTestT, UsesConfiguredParameters) {
  auto stores = street("s", {52.52, 13.405}, 6, 30.0);

  auto result = this->pipeline_.run(stores);

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->n_clusters(), 1u);
}

TYPED_TEST(ClusteringPipelineTestT, MixedClustersAndNoise) {
  auto stores = street("dense", {-33.8688, 151.2093}, 8, 40.0);
  append(stores, street("lone", {-33.80, 151.30}, 1, 0.0));
  append(stores, street("pair", {-33.95, 151.10}, 2, 10.0));

  auto result = this->pipeline_.run(stores, 500.0, 3);

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->n_clusters(), 1u);
  EXPECT_EQ(result->noise_store_ids, (std::vector<std::string>{"lone0", "pair0", "pair1"}));
  EXPECT_EQ(result->n_clustered() + result->noise_store_ids.size(), stores.size());
}

TYPED_TEST(ClusteringPipelineTestT, EveryStoreAccountedForExactlyOnce) {
  std::mt19937 rng(3);
  std::uniform_real_distribution<double> lat(41.37, 41.41);
  std::uniform_real_distribution<double> lon(2.15, 2.20);
  std::vector<Store> stores;
  for (int i = 0; i < 300; ++i) {
    Store s;
    s.id = "r" + std::to_string(i);
    s.location = {lat(rng), lon(rng)};
    s.category = i % 2 ? "cafe" : "bakery";
    stores.push_back(std::move(s));
  }

  auto result = this->pipeline_.run(stores, 200.0, 4);
  ASSERT_TRUE(result.has_value());

  std::multiset<size_t> seen;
  for (size_t k = 0; k < result->clusters.size(); ++k) {
    const auto& c = result->clusters[k];
    EXPECT_EQ(c.id, static_cast<int>(k));
    EXPECT_EQ(c.store_count, static_cast<int>(c.member_indices.size()));
    EXPECT_EQ(c.category_breakdown.total(), c.store_count);
    EXPECT_EQ(c.size_breakdown.total(), c.store_count);
    EXPECT_GE(c.radius_meters, 100.0);
    EXPECT_GE(c.density_score, 0);
    EXPECT_LE(c.density_score, 100);
    seen.insert(c.member_indices.begin(), c.member_indices.end());
  }
  seen.insert(result->noise_indices.begin(), result->noise_indices.end());

  ASSERT_EQ(seen.size(), stores.size());
  for (size_t i = 0; i < stores.size(); ++i) {
    EXPECT_EQ(seen.count(i), 1u) << "store " << i;
  }
}

TYPED_TEST(ClusteringPipelineTestT, RepeatedRunsAreIdentical) {
  auto stores = street("a", {19.4326, -99.1332}, 7, 60.0);
  append(stores, street("b", {19.45, -99.12}, 4, 80.0));

  auto first = this->pipeline_.run(stores, 300.0, 3);
  auto second = this->pipeline_.run(stores, 300.0, 3);

  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(*first, *second);
}

// =============================================================================
// Errors and configuration
// =============================================================================

class ClusteringPipelineTest : public ::testing::Test {
protected:
  ClusteringPipeline pipeline_;
  std::vector<Store> stores_ = street("s", {0.0, 0.0}, 4, 10.0);
};

TEST_F(ClusteringPipelineTest, EmptyInputFailsWithInvalidInput) {
  std::vector<Store> none;

  auto result = pipeline_.run(none, 500.0, 3);

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, ErrorCode::InvalidInput);
  EXPECT_FALSE(result.error().message.empty());
}

TEST_F(ClusteringPipelineTest, EmptyInputCanYieldEmptyResult) {
  PipelineConfig config;
  config.empty_input = EmptyInputPolicy::EmptyResult;
  ClusteringPipeline lenient(config);
  std::vector<Store> none;

  auto result = lenient.run(none);

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->n_clusters(), 0u);
  EXPECT_TRUE(result->noise_store_ids.empty());
  EXPECT_EQ(result->n_stores, 0u);
}

TEST_F(ClusteringPipelineTest, InvalidEpsIsInvalidParameter) {
  for (double eps : std::initializer_list<double>{0.0, -10.0, std::nan(""), INFINITY}) {
    auto result = pipeline_.run(stores_, eps, 3);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidParameter);
  }
}

TEST_F(ClusteringPipelineTest, InvalidMinPtsIsInvalidParameter) {
  auto result = pipeline_.run(stores_, 500.0, 0);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, ErrorCode::InvalidParameter);
}

TEST_F(ClusteringPipelineTest, InvalidParametersCheckedBeforeEmptyInput) {
  std::vector<Store> none;
  auto result = pipeline_.run(none, -1.0, 3);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, ErrorCode::InvalidParameter);
}

TEST_F(ClusteringPipelineTest, OutOfRangeCoordinatesAreInvalidInput) {
  stores_[2].location.lat = 120.0;

  auto result = pipeline_.run(stores_);

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, ErrorCode::InvalidInput);
  EXPECT_NE(result.error().message.find("s2"), std::string::npos);
}

TEST_F(ClusteringPipelineTest, CoordinateCheckCanBeDisabled) {
  PipelineConfig config;
  config.validate_coordinates = false;
  ClusteringPipeline permissive(config);
  stores_[0].location.lon = 181.0;

  auto result = permissive.run(stores_);

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->n_stores, stores_.size());
}

TEST_F(ClusteringPipelineTest, ConstructorRejectsInvalidConfig) {
  PipelineConfig config;
  config.eps_meters = -1.0;
  EXPECT_THROW(ClusteringPipeline{config}, InvalidParameter);

  config = {};
  config.min_pts = 0;
  EXPECT_THROW(ClusteringPipeline{config}, InvalidParameter);
}

TEST_F(ClusteringPipelineTest, CreateReportsInvalidConfig) {
  PipelineConfig config;
  config.eps_meters = 0.0;

  auto created = ClusteringPipeline::create(config);

  ASSERT_FALSE(created.has_value());
  EXPECT_NE(created.error().find("eps"), std::string::npos);
  EXPECT_TRUE(ClusteringPipeline::create({}).has_value());
}

TEST_F(ClusteringPipelineTest, DefaultsMatchDocumentedValues) {
  const auto& c = pipeline_.config();
  EXPECT_DOUBLE_EQ(c.eps_meters, 500.0);
  EXPECT_EQ(c.min_pts, 3);
  EXPECT_TRUE(std::holds_alternative<clustering::BruteForceSearch>(c.neighbor_search));
  EXPECT_EQ(c.empty_input, EmptyInputPolicy::Error);
  EXPECT_TRUE(c.validate_coordinates);
}

TEST_F(ClusteringPipelineTest, OverridesDoNotChangeConfig) {
  (void)pipeline_.run(stores_, 50.0, 2);
  EXPECT_DOUBLE_EQ(pipeline_.config().eps_meters, 500.0);
  EXPECT_EQ(pipeline_.config().min_pts, 3);
}

TEST_F(ClusteringPipelineTest, AcceptsCustomMetric) {
  // Every store is 1 km from every other under this metric
  ClusteringPipeline pipeline({}, [](const Point& a, const Point& b) {
    return a == b ? 0.0 : 1000.0;
  });

  EXPECT_EQ(pipeline.run(stores_, 500.0, 2)->n_clusters(), 0u);
  EXPECT_EQ(pipeline.run(stores_, 1000.0, 2)->n_clusters(), 1u);
}

TEST_F(ClusteringPipelineTest, LoggingLevelDoesNotChangeResults) {
  auto quiet = pipeline_.run(stores_);
  set_log_level(spdlog::level::trace);
  auto verbose = pipeline_.run(stores_);
  set_log_level(spdlog::level::warn);

  ASSERT_TRUE(quiet.has_value());
  ASSERT_TRUE(verbose.has_value());
  EXPECT_EQ(*quiet, *verbose);
}

TEST(PipelineConfigTest, EmptyInputPolicyNames) {
  EXPECT_EQ(to_string(EmptyInputPolicy::Error), "error");
  EXPECT_EQ(to_string(EmptyInputPolicy::EmptyResult), "empty_result");
  auto policy = parse_empty_input_policy("empty_result");
  ASSERT_TRUE(policy.has_value());
  EXPECT_EQ(*policy, EmptyInputPolicy::EmptyResult);
  EXPECT_FALSE(parse_empty_input_policy("ignore").has_value());
}
