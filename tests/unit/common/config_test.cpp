/// @file config_test.cpp
/// @brief Tests for driftwatch configuration management

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "common/config.h"
#include "common/error.h"

namespace driftwatch {
namespace {

TEST(ConfigTest, LoadFromString) {
    const std::string yaml_content = R"(
monitor:
  alpha: 0.01
  num_workers: 4
  categorical_test: goodness_of_fit
features:
  numeric:
    - price
    - bedrooms
  categorical: [room_type]
logging:
  level: debug
)";

    auto result = Config::LoadFromString(yaml_content);
    ASSERT_TRUE(result.ok()) << result.status().message();

    Config config = std::move(*result);

    EXPECT_DOUBLE_EQ(config.GetDouble("monitor.alpha"), 0.01);
    EXPECT_EQ(config.GetInt("monitor.num_workers"), 4);
    EXPECT_EQ(config.GetString("monitor.categorical_test"), "goodness_of_fit");
    EXPECT_EQ(config.GetString("logging.level"), "debug");

    auto numeric = config.GetStringList("features.numeric");
    ASSERT_EQ(numeric.size(), 2);
    EXPECT_EQ(numeric[0], "price");
    EXPECT_EQ(numeric[1], "bedrooms");

    auto categorical = config.GetStringList("features.categorical");
    ASSERT_EQ(categorical.size(), 1);
    EXPECT_EQ(categorical[0], "room_type");
}

TEST(ConfigTest, DefaultValues) {
    Config config;

    EXPECT_EQ(config.GetString("nonexistent.key", "default"), "default");
    EXPECT_EQ(config.GetInt("nonexistent.key", 42), 42);
    EXPECT_EQ(config.GetDouble("nonexistent.key", 3.14), 3.14);
    EXPECT_EQ(config.GetBool("nonexistent.key", true), true);
    EXPECT_TRUE(config.GetStringList("nonexistent.key").empty());
}

TEST(ConfigTest, WrongTypeFallsBackToDefault) {
    auto result = Config::LoadFromString("monitor:\n  num_workers: many\n");
    ASSERT_TRUE(result.ok());

    EXPECT_EQ(result->GetInt("monitor.num_workers", 7), 7);
    EXPECT_EQ(result->GetDouble("monitor.num_workers", 0.5), 0.5);
}

TEST(ConfigTest, SetValues) {
    Config config;

    config.Set("test.string", std::string("value"));
    config.Set("test.int", static_cast<int64_t>(123));
    config.Set("test.double", 0.25);
    config.Set("test.bool", true);
    config.Set("test.list", std::vector<std::string>{"a", "b"});

    EXPECT_EQ(config.GetString("test.string"), "value");
    EXPECT_EQ(config.GetInt("test.int"), 123);
    EXPECT_DOUBLE_EQ(config.GetDouble("test.double"), 0.25);
    EXPECT_EQ(config.GetBool("test.bool"), true);
    EXPECT_EQ(config.GetStringList("test.list"), (std::vector<std::string>{"a", "b"}));
}

TEST(ConfigTest, SetOverwritesExistingValue) {
    auto result = Config::LoadFromString("monitor:\n  alpha: 0.05\n  num_workers: 2\n");
    ASSERT_TRUE(result.ok());
    Config config = std::move(*result);

    config.Set("monitor.alpha", 0.1);

    EXPECT_DOUBLE_EQ(config.GetDouble("monitor.alpha"), 0.1);
    EXPECT_EQ(config.GetInt("monitor.num_workers"), 2);
}

TEST(ConfigTest, HasKey) {
    const std::string yaml_content = R"(
existing:
  key: value
)";

    auto result = Config::LoadFromString(yaml_content);
    ASSERT_TRUE(result.ok());

    Config config = std::move(*result);

    EXPECT_TRUE(config.HasKey("existing.key"));
    EXPECT_TRUE(config.HasKey("existing"));
    EXPECT_FALSE(config.HasKey("nonexistent.key"));
    EXPECT_FALSE(config.HasKey("existing.key.deeper"));
}

TEST(ConfigTest, MergeConfigs) {
    const std::string base_yaml = R"(
key1: value1
nested:
  a: 1
  b: 2
)";

    const std::string overlay_yaml = R"(
key2: value2
nested:
  b: 20
  c: 3
)";

    auto base_result = Config::LoadFromString(base_yaml);
    auto overlay_result = Config::LoadFromString(overlay_yaml);
    ASSERT_TRUE(base_result.ok());
    ASSERT_TRUE(overlay_result.ok());

    Config base = std::move(*base_result);
    Config overlay = std::move(*overlay_result);

    base.Merge(overlay);

    EXPECT_EQ(base.GetString("key1"), "value1");
    EXPECT_EQ(base.GetString("key2"), "value2");
    EXPECT_EQ(base.GetInt("nested.a"), 1);
    EXPECT_EQ(base.GetInt("nested.b"), 20);  // Overwritten
    EXPECT_EQ(base.GetInt("nested.c"), 3);   // Added

    // The overlay is not aliased by the merged tree
    overlay.Set("nested.b", static_cast<int64_t>(99));
    EXPECT_EQ(base.GetInt("nested.b"), 20);
}

TEST(ConfigTest, InvalidYaml) {
    const std::string invalid_yaml = "{ invalid yaml [";

    auto result = Config::LoadFromString(invalid_yaml);
    EXPECT_FALSE(result.ok());
}

TEST(ConfigTest, MissingFile) {
    auto result = Config::LoadFromFile("/nonexistent/driftwatch.yaml");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.status().code(), absl::StatusCode::kNotFound);
}

TEST(ConfigTest, LoadFromFile) {
    const auto path = std::filesystem::temp_directory_path() / "driftwatch_config_test.yaml";
    {
        std::ofstream out(path);
        out << "monitor:\n  alpha: 0.2\n";
    }

    auto result = Config::LoadFromFile(path);
    std::filesystem::remove(path);

    ASSERT_TRUE(result.ok()) << result.status().message();
    EXPECT_DOUBLE_EQ(result->GetDouble("monitor.alpha"), 0.2);
}

TEST(ConfigTest, ToJson) {
    auto result = Config::LoadFromString(R"(
monitor:
  alpha: 0.05
  num_workers: 3
  categorical_test: contingency
features:
  numeric: [price]
)");
    ASSERT_TRUE(result.ok());

    auto json = result->ToJson();
    EXPECT_DOUBLE_EQ(json["monitor"]["alpha"].get<double>(), 0.05);
    EXPECT_EQ(json["monitor"]["num_workers"].get<int64_t>(), 3);
    EXPECT_EQ(json["monitor"]["categorical_test"].get<std::string>(), "contingency");
    ASSERT_TRUE(json["features"]["numeric"].is_array());
    EXPECT_EQ(json["features"]["numeric"][0].get<std::string>(), "price");
}

class ConfigEnvironmentTest : public ::testing::Test {
protected:
    void TearDown() override {
        unsetenv("DWTEST_ALPHA");
        unsetenv("DWTEST_NUM_WORKERS");
        unsetenv("DWTEST_CATEGORICAL_TEST");
        unsetenv("DWTEST_LOG_LEVEL");
    }
};

TEST_F(ConfigEnvironmentTest, ReadsKnownVariables) {
    setenv("DWTEST_ALPHA", "0.01", 1);
    setenv("DWTEST_NUM_WORKERS", "3", 1);
    setenv("DWTEST_CATEGORICAL_TEST", "goodness_of_fit", 1);
    setenv("DWTEST_LOG_LEVEL", "warn", 1);

    auto result = Config::LoadFromEnvironment("DWTEST_");
    ASSERT_TRUE(result.ok()) << result.status().message();

    EXPECT_DOUBLE_EQ(result->GetDouble("monitor.alpha"), 0.01);
    EXPECT_EQ(result->GetInt("monitor.num_workers"), 3);
    EXPECT_EQ(result->GetString("monitor.categorical_test"), "goodness_of_fit");
    EXPECT_EQ(result->GetString("logging.level"), "warn");
}

TEST_F(ConfigEnvironmentTest, RejectsNonNumericAlpha) {
    setenv("DWTEST_ALPHA", "five percent", 1);

    auto result = Config::LoadFromEnvironment("DWTEST_");
    ASSERT_FALSE(result.ok());
    EXPECT_TRUE(IsInvalidConfiguration(result.status()));
}

TEST_F(ConfigEnvironmentTest, RejectsNonIntegerWorkers) {
    setenv("DWTEST_NUM_WORKERS", "2.5", 1);

    auto result = Config::LoadFromEnvironment("DWTEST_");
    ASSERT_FALSE(result.ok());
    EXPECT_TRUE(IsInvalidConfiguration(result.status()));
}

TEST_F(ConfigEnvironmentTest, EnvironmentOverridesFile) {
    const auto path = std::filesystem::temp_directory_path() / "driftwatch_env_test.yaml";
    {
        std::ofstream out(path);
        out << "monitor:\n  alpha: 0.05\n  num_workers: 2\n";
    }
    setenv("DWTEST_ALPHA", "0.1", 1);

    auto result = LoadConfig(path, "DWTEST_");
    std::filesystem::remove(path);

    ASSERT_TRUE(result.ok()) << result.status().message();
    EXPECT_DOUBLE_EQ(result->GetDouble("monitor.alpha"), 0.1);
    EXPECT_EQ(result->GetInt("monitor.num_workers"), 2);
}

}  // namespace
}  // namespace driftwatch
