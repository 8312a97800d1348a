#include <gtest/gtest.h>

#include <filesystem>
#include <geocluster/common/error.hpp>
#include <geocluster/io/config_io.hpp>

namespace fs = std::filesystem;
using namespace geocluster;
using namespace geocluster::pipeline;

class ConfigIoTest : public ::testing::Test {
protected:
  static fs::path fixture(const std::string& name) {
    return fs::path(__FILE__).parent_path() / "fixtures" / name;
  }

  void TearDown() override {
    if (!temp_path_.empty()) fs::remove(temp_path_);
  }

  fs::path temp_path_;
};

TEST_F(ConfigIoTest, LoadsFullConfigFile) {
  auto config = io::load_config(fixture("pipeline_config.json").string());

  EXPECT_DOUBLE_EQ(config.eps_meters, 250.0);
  EXPECT_EQ(config.min_pts, 4);
  EXPECT_TRUE(std::holds_alternative<clustering::GridSearch>(config.neighbor_search));
  EXPECT_EQ(config.empty_input, EmptyInputPolicy::EmptyResult);
  EXPECT_TRUE(config.validate_coordinates);
}

TEST_F(ConfigIoTest, MissingKeysTakeDefaults) {
  auto config = io::load_config(fixture("partial_config.json").string());

  EXPECT_DOUBLE_EQ(config.eps_meters, 500.0);
  EXPECT_EQ(config.min_pts, 5);
  EXPECT_TRUE(std::holds_alternative<clustering::BruteForceSearch>(config.neighbor_search));
  EXPECT_EQ(config.empty_input, EmptyInputPolicy::Error);
}

TEST_F(ConfigIoTest, EmptyObjectIsDefaultConfig) {
  auto config = io::config_from_json_string("{}");
  EXPECT_DOUBLE_EQ(config.eps_meters, 500.0);
  EXPECT_EQ(config.min_pts, 3);
}

TEST_F(ConfigIoTest, UnknownSearchIsInvalidParameter) {
  EXPECT_THROW((void)io::load_config(fixture("invalid_config.json").string()), InvalidParameter);
  EXPECT_THROW((void)io::config_from_json_string(R"({"empty_input": "skip"})"), InvalidParameter);
}

TEST_F(ConfigIoTest, OutOfRangeValuesAreInvalidParameter) {
  EXPECT_THROW((void)io::config_from_json_string(R"({"eps_meters": 0})"), InvalidParameter);
  EXPECT_THROW((void)io::config_from_json_string(R"({"min_pts": 0})"), InvalidParameter);
}

TEST_F(ConfigIoTest, RejectsNonObjectDocuments) {
  EXPECT_THROW((void)io::config_from_json_string("[1, 2]"), ParseError);
  EXPECT_THROW((void)io::config_from_json_string("not json"), ParseError);
}

TEST_F(ConfigIoTest, WrongFieldTypeIsParseError) {
  try {
    (void)io::config_from_json_string(R"({"eps_meters": "wide"})");
    FAIL() << "expected ParseError";
  } catch (const ParseError& e) {
    EXPECT_EQ(e.code(), ErrorCode::Parse);
  }
}

TEST_F(ConfigIoTest, MissingFileThrows) {
  try {
    (void)io::load_config("nonexistent_config.json");
    FAIL() << "expected IoError";
  } catch (const IoError& e) {
    EXPECT_EQ(e.code(), ErrorCode::Io);
    EXPECT_NE(std::string(e.what()).find("nonexistent_config.json"), std::string::npos);
  }
}

TEST_F(ConfigIoTest, SaveAndReload) {
  PipelineConfig config;
  config.eps_meters = 321.5;
  config.min_pts = 6;
  config.neighbor_search = clustering::GridSearch{};
  config.validate_coordinates = false;

  temp_path_ = fs::temp_directory_path() / "geocluster_config_io_test.json";
  io::save_config(config, temp_path_.string());
  auto loaded = io::load_config(temp_path_.string());

  EXPECT_DOUBLE_EQ(loaded.eps_meters, 321.5);
  EXPECT_EQ(loaded.min_pts, 6);
  EXPECT_TRUE(std::holds_alternative<clustering::GridSearch>(loaded.neighbor_search));
  EXPECT_FALSE(loaded.validate_coordinates);
}

TEST_F(ConfigIoTest, WritesReadableKeys) {
  auto text = io::config_to_json_string(PipelineConfig{});
  EXPECT_NE(text.find("\"neighbor_search\": \"brute_force\""), std::string::npos);
  EXPECT_NE(text.find("\"empty_input\": \"error\""), std::string::npos);
}

TEST_F(ConfigIoTest, LoadPipelineReportsErrors) {
  auto ok = io::load_pipeline(fixture("pipeline_config.json").string());
  ASSERT_TRUE(ok.has_value()) << ok.error();
  EXPECT_EQ(ok->config().min_pts, 4);

  auto missing = io::load_pipeline("nonexistent_config.json");
  ASSERT_FALSE(missing.has_value());
  EXPECT_NE(missing.error().find("nonexistent_config.json"), std::string::npos);

  EXPECT_FALSE(io::pipeline_from_json_string(R"({"neighbor_search": "kdtree"})").has_value());
  EXPECT_TRUE(io::pipeline_from_json_string(R"({"eps_meters": 100})").has_value());
}
