#include <gtest/gtest.h>

#include <cmath>
#include <geocluster/geo/distance.hpp>
#include <vector>

using namespace geocluster;
using geo::haversine_distance;

class HaversineTest : public ::testing::Test {
protected:
  // R * pi / 180
  static constexpr double METERS_PER_DEGREE = 111194.92664455873;
};

TEST_F(HaversineTest, IdenticalPointsAreZero) {
  EXPECT_DOUBLE_EQ(haversine_distance({0.0, 0.0}, {0.0, 0.0}), 0.0);
  EXPECT_DOUBLE_EQ(haversine_distance({48.8566, 2.3522}, {48.8566, 2.3522}), 0.0);
  EXPECT_DOUBLE_EQ(haversine_distance({-90.0, 0.0}, {-90.0, 0.0}), 0.0);
}

TEST_F(HaversineTest, OneDegreeOfLatitude) {
  EXPECT_NEAR(haversine_distance({0.0, 0.0}, {1.0, 0.0}), METERS_PER_DEGREE, 1e-6);
  EXPECT_NEAR(haversine_distance({45.0, 10.0}, {46.0, 10.0}), METERS_PER_DEGREE, 1e-6);
}

TEST_F(HaversineTest, OneDegreeOfLongitudeShrinksWithLatitude) {
  EXPECT_NEAR(haversine_distance({0.0, 0.0}, {0.0, 1.0}), METERS_PER_DEGREE, 1e-6);

  double at_60 = haversine_distance({60.0, 0.0}, {60.0, 1.0});
  EXPECT_NEAR(at_60, METERS_PER_DEGREE / 2.0, 50.0);
  EXPECT_LT(at_60, METERS_PER_DEGREE);
}

TEST_F(HaversineTest, KnownCityPair) {
  // London - Paris, ~343.5 km on the 6371 km sphere
  double d = haversine_distance({51.5074, -0.1278}, {48.8566, 2.3522});
  EXPECT_NEAR(d, 343'500.0, 1'500.0);
}

TEST_F(HaversineTest, Symmetric) {
  std::vector<std::pair<Point, Point>> pairs = {
      {{40.7128, -74.0060}, {34.0522, -118.2437}},
      {{-33.8688, 151.2093}, {35.6762, 139.6503}},
      {{0.0, 179.9}, {0.0, -179.9}},
      {{89.9, 0.0}, {-89.9, 180.0}},
  };

  for (const auto& [a, b] : pairs) {
    EXPECT_DOUBLE_EQ(haversine_distance(a, b), haversine_distance(b, a));
  }
}

TEST_F(HaversineTest, AntipodalPointsAreHalfCircumference) {
  double half = M_PI * geo::EARTH_RADIUS_METERS;
  EXPECT_NEAR(haversine_distance({0.0, 0.0}, {0.0, 180.0}), half, 1e-3);
  EXPECT_NEAR(haversine_distance({90.0, 0.0}, {-90.0, 0.0}), half, 1e-3);
  EXPECT_TRUE(std::isfinite(haversine_distance({45.0, 45.0}, {-45.0, -135.0})));
}

TEST_F(HaversineTest, CrossesAntimeridian) {
  double d = haversine_distance({0.0, 179.999}, {0.0, -179.999});
  EXPECT_NEAR(d, 0.002 * METERS_PER_DEGREE, 1e-3);
}

TEST_F(HaversineTest, MeridiansMeetAtThePole) {
  EXPECT_NEAR(haversine_distance({90.0, 0.0}, {90.0, 123.0}), 0.0, 1e-6);
}

TEST_F(HaversineTest, NonNegativeAndFinite) {
  for (double lat = -90.0; lat <= 90.0; lat += 15.0) {
    for (double lon = -180.0; lon <= 180.0; lon += 30.0) {
      double d = haversine_distance({lat, lon}, {-lat / 2.0, lon / 3.0});
      EXPECT_GE(d, 0.0);
      EXPECT_TRUE(std::isfinite(d));
    }
  }
}

TEST_F(HaversineTest, DefaultDistanceIsHaversine) {
  auto fn = geo::default_distance();
  Point a{52.52, 13.405};
  Point b{52.53, 13.41};
  EXPECT_DOUBLE_EQ(fn(a, b), haversine_distance(a, b));
  EXPECT_DOUBLE_EQ(geo::Haversine{}(a, b), haversine_distance(a, b));
}

TEST(AngleConversionTest, RoundTrips) {
  EXPECT_DOUBLE_EQ(geo::deg_to_rad(180.0), M_PI);
  EXPECT_DOUBLE_EQ(geo::rad_to_deg(M_PI / 2.0), 90.0);
  static_assert(geo::deg_to_rad(0.0) == 0.0);
}

TEST(PointTest, Validity) {
  EXPECT_TRUE(is_valid({0.0, 0.0}));
  EXPECT_TRUE(is_valid({90.0, 180.0}));
  EXPECT_TRUE(is_valid({-90.0, -180.0}));
  EXPECT_FALSE(is_valid({90.5, 0.0}));
  EXPECT_FALSE(is_valid({0.0, -180.5}));
  EXPECT_FALSE(is_valid({NAN, 0.0}));
  EXPECT_FALSE(is_valid({0.0, INFINITY}));
}

TEST(PointTest, ToMatrix) {
  std::vector<Point> points = {{1.0, 2.0}, {3.0, 4.0}, {5.0, 6.0}};
  PointMatrix m = to_matrix(points);
  ASSERT_EQ(m.rows(), 3);
  EXPECT_DOUBLE_EQ(m(1, 0), 3.0);
  EXPECT_DOUBLE_EQ(m(2, 1), 6.0);
}
