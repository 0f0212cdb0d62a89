#include <gtest/gtest.h>
#include <fstream>
#include <filesystem>
#include "util.hpp"

class ConfigLoadTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Create a temporary directory for test files
        test_dir = std::filesystem::temp_directory_path() / "strokecoach_config_tests";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        // Clean up test files
        if (std::filesystem::exists(test_dir)) {
            std::filesystem::remove_all(test_dir);
        }
    }

    void createTestConfig(const std::string& filename, const std::string& content) {
        std::ofstream file(test_dir / filename);
        file << content;
        file.close();
    }

    std::filesystem::path test_dir;
};

TEST_F(ConfigLoadTest, BasicConfigLoad) {
    const std::string config_content = R"(
input:
  reference_path: "data/coach_forehand.json"

analysis:
  capture_fps: 60

server:
  host: "127.0.0.1"
  port: 9000
)";

    createTestConfig("basic_config.yaml", config_content);

    AppConfig config = load_config((test_dir / "basic_config.yaml").string());

    EXPECT_EQ(config.input.reference_path, "data/coach_forehand.json");
    EXPECT_DOUBLE_EQ(config.analysis.capture_fps, 60.0);
    EXPECT_EQ(config.server.host, "127.0.0.1");
    EXPECT_EQ(config.server.port, 9000);
}

TEST_F(ConfigLoadTest, AnchorThresholds) {
    const std::string config_content = R"(
analysis:
  anchors:
    onset_drop: -3.0
    onset_lookback: 4
    forward_rise: 2.5
    settle_delta: 0.5
    settle_skip: 8
    settle_hold: 3
)";

    createTestConfig("anchors.yaml", config_content);

    AppConfig config = load_config((test_dir / "anchors.yaml").string());
    const auto& a = config.analysis.anchors;

    EXPECT_DOUBLE_EQ(a.onset_drop, -3.0);
    EXPECT_EQ(a.onset_lookback, 4);
    EXPECT_DOUBLE_EQ(a.forward_rise, 2.5);
    EXPECT_DOUBLE_EQ(a.settle_delta, 0.5);
    EXPECT_EQ(a.settle_skip, 8);
    EXPECT_EQ(a.settle_hold, 3);
}

TEST_F(ConfigLoadTest, RecommendationRules) {
    const std::string config_content = R"(
analysis:
  rules:
    rotation_high: -20.0
    rotation_medium: -10.0
    rotation_strength: -4.0
    wrist_drop_high: 25.0
    wrist_drop_medium: 12.0
    weight_transfer_high_ratio: 0.5
    weight_transfer_medium_ratio: 0.75
    extension_high: -30.0
    extension_medium: -18.0
    tempo_slow_ms: 250
    tempo_efficient_ms: 80
)";

    createTestConfig("rules.yaml", config_content);

    AppConfig config = load_config((test_dir / "rules.yaml").string());
    const auto& r = config.analysis.rules;

    EXPECT_DOUBLE_EQ(r.rotation_high, -20.0);
    EXPECT_DOUBLE_EQ(r.rotation_medium, -10.0);
    EXPECT_DOUBLE_EQ(r.rotation_strength, -4.0);
    EXPECT_DOUBLE_EQ(r.wrist_drop_high, 25.0);
    EXPECT_DOUBLE_EQ(r.wrist_drop_medium, 12.0);
    EXPECT_DOUBLE_EQ(r.weight_transfer_high_ratio, 0.5);
    EXPECT_DOUBLE_EQ(r.weight_transfer_medium_ratio, 0.75);
    EXPECT_DOUBLE_EQ(r.extension_high, -30.0);
    EXPECT_DOUBLE_EQ(r.extension_medium, -18.0);
    EXPECT_DOUBLE_EQ(r.tempo_slow_ms, 250.0);
    EXPECT_DOUBLE_EQ(r.tempo_efficient_ms, 80.0);
}

TEST_F(ConfigLoadTest, OutputConfig) {
    const std::string config_content = R"(
output:
  logging:
    verbose_logging: true
    log_level: "debug"
  json_output_path: "reports/session.json"
  csv:
    enable_csv_export: true
    csv_output_path: "reports/curves.csv"
)";

    createTestConfig("output_config.yaml", config_content);

    AppConfig config = load_config((test_dir / "output_config.yaml").string());

    EXPECT_TRUE(config.output_config.verbose_logging);
    EXPECT_EQ(config.output_config.log_level, "debug");
    EXPECT_EQ(config.output_config.json_output_path, "reports/session.json");
    EXPECT_TRUE(config.output_config.enable_csv_export);
    EXPECT_EQ(config.output_config.csv_output_path, "reports/curves.csv");
}

TEST_F(ConfigLoadTest, EmptyConfig) {
    const std::string config_content = "{}";

    createTestConfig("empty_config.yaml", config_content);

    AppConfig config = load_config((test_dir / "empty_config.yaml").string());

    // Should use default values for all settings
    EXPECT_EQ(config.input.reference_path, "data/pro_reference.json");
    EXPECT_DOUBLE_EQ(config.analysis.capture_fps, 30.0);
    EXPECT_DOUBLE_EQ(config.analysis.anchors.onset_drop, -2.0);
    EXPECT_DOUBLE_EQ(config.analysis.rules.tempo_slow_ms, 300.0);
    EXPECT_EQ(config.output_config.json_output_path, "output/analysis_report.json");
    EXPECT_FALSE(config.output_config.enable_csv_export);
    EXPECT_EQ(config.server.port, 8080);
}

TEST_F(ConfigLoadTest, PartialConfig) {
    const std::string config_content = R"(
analysis:
  anchors:
    settle_hold: 7
  rules:
    tempo_slow_ms: 400

output:
  csv:
    enable_csv_export: true
)";

    createTestConfig("partial_config.yaml", config_content);

    AppConfig config = load_config((test_dir / "partial_config.yaml").string());

    // Should override specified values
    EXPECT_EQ(config.analysis.anchors.settle_hold, 7);
    EXPECT_DOUBLE_EQ(config.analysis.rules.tempo_slow_ms, 400.0);
    EXPECT_TRUE(config.output_config.enable_csv_export);

    // Should keep defaults for unspecified values
    EXPECT_EQ(config.analysis.anchors.settle_skip, 10);
    EXPECT_DOUBLE_EQ(config.analysis.rules.tempo_efficient_ms, 100.0);
    EXPECT_EQ(config.output_config.csv_output_path, "output/comparison.csv");
    EXPECT_EQ(config.output_config.log_level, "info");
}

TEST_F(ConfigLoadTest, InvalidFile) {
    // Test loading non-existent file
    EXPECT_THROW(load_config("/nonexistent/path/config.yaml"), std::exception);
}

TEST_F(ConfigLoadTest, MalformedYAML) {
    const std::string malformed_content = R"(
input:
  reference_path: "data/pro.json
  extra: [invalid
)";

    createTestConfig("malformed.yaml", malformed_content);

    // Should throw an exception for malformed YAML
    EXPECT_THROW(load_config((test_dir / "malformed.yaml").string()), std::exception);
}

TEST_F(ConfigLoadTest, WrongValueType) {
    const std::string config_content = R"(
server:
  port: "not-a-port"
)";

    createTestConfig("bad_port.yaml", config_content);

    EXPECT_THROW(load_config((test_dir / "bad_port.yaml").string()), std::exception);
}

TEST(AppConfigTest, DefaultConstruction) {
    AppConfig config{};

    EXPECT_EQ(config.input.reference_path, "data/pro_reference.json");
    EXPECT_DOUBLE_EQ(config.analysis.capture_fps, 30.0);
    EXPECT_EQ(config.analysis.anchors.onset_lookback, 5);
    EXPECT_DOUBLE_EQ(config.analysis.rules.weight_transfer_medium_ratio, 0.8);
    EXPECT_EQ(config.server.host, "0.0.0.0");
    EXPECT_EQ(config.server.port, 8080);
}
