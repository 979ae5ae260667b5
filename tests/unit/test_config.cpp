/**
 * @file test_config.cpp
 * @brief Unit tests for configuration loading.
 */

#include "core/config.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace kernel_orchestrator;

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "ko_test_config";
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }

    std::filesystem::path write_toml(const std::string& content) {
        auto path = temp_dir_ / "test.toml";
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }
};

TEST_F(ConfigTest, DefaultConfig) {
    auto config = default_config();
    EXPECT_EQ(config.service.poll_interval_ms, 1000u);
    EXPECT_EQ(config.service.max_concurrent_tests, 10u);
    EXPECT_FALSE(config.service.enable_persistence);
    EXPECT_EQ(config.timeout.default_timeout_ms, 300000u);
    EXPECT_DOUBLE_EQ(config.timeout.margin_factor, 1.5);
    EXPECT_EQ(config.recovery.environment_failure_threshold, 5u);
    EXPECT_EQ(config.runner.kind, "simulated");
    EXPECT_TRUE(validate_config(config).has_value());
}

TEST_F(ConfigTest, LoadFullConfig) {
    auto path = write_toml(R"(
        [service]
        poll_interval_ms = 250
        max_concurrent_tests = 4
        enable_persistence = true
        state_file = "/tmp/ko_state.toml"
        finished_job_retention_s = 60

        [timeout]
        default_timeout_ms = 120000
        margin_factor = 2.0
        margin_ms = 1000
        warning_threshold = 0.75
        termination_grace_ms = 200

        [matcher]
        light_memory_mb = 1024
        light_duration_ms = 30000

        [recovery]
        degradation_window_s = 120
        environment_failure_threshold = 2
        resource_exhaustion_threshold = 4
        critical_error_threshold = 3
        max_recovery_attempts = 5
        retry_delay_ms = 100

        [runner]
        kind = "process"
        shell = "/bin/bash"

        [sources]
        environments_file = "envs.toml"
        catalog_file = "catalog.toml"
        plans_dir = "plans"

        [telemetry]
        log_dir = "/tmp/ko_logs"
        max_file_size_mb = 10
        rotate_count = 3
        log_level = "debug"
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;

    auto& config = *result;
    EXPECT_EQ(config.service.poll_interval_ms, 250u);
    EXPECT_EQ(config.service.max_concurrent_tests, 4u);
    EXPECT_TRUE(config.service.enable_persistence);
    EXPECT_EQ(config.service.state_file, "/tmp/ko_state.toml");
    EXPECT_EQ(config.service.finished_job_retention_s, 60u);
    EXPECT_EQ(config.timeout.default_timeout_ms, 120000u);
    EXPECT_DOUBLE_EQ(config.timeout.margin_factor, 2.0);
    EXPECT_EQ(config.timeout.margin_ms, 1000u);
    EXPECT_DOUBLE_EQ(config.timeout.warning_threshold, 0.75);
    EXPECT_EQ(config.timeout.termination_grace_ms, 200u);
    EXPECT_EQ(config.matcher.light_memory_mb, 1024u);
    EXPECT_EQ(config.recovery.degradation_window_s, 120u);
    EXPECT_EQ(config.recovery.critical_error_threshold, 3u);
    EXPECT_EQ(config.recovery.retry_delay_ms, 100u);
    EXPECT_EQ(config.runner.kind, "process");
    EXPECT_EQ(config.runner.shell, "/bin/bash");
    EXPECT_EQ(config.sources.environments_file, "envs.toml");
    EXPECT_EQ(config.sources.plans_dir, "plans");
    EXPECT_EQ(config.telemetry.log_dir, "/tmp/ko_logs");
    EXPECT_EQ(config.telemetry.rotate_count, 3u);
    EXPECT_EQ(config.telemetry.log_level, "debug");
}

TEST_F(ConfigTest, PartialConfig) {
    auto path = write_toml(R"(
        [service]
        max_concurrent_tests = 2
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value());

    // Overridden field
    EXPECT_EQ(result->service.max_concurrent_tests, 2u);
    // Defaults for everything else
    EXPECT_EQ(result->service.poll_interval_ms, 1000u);
    EXPECT_EQ(result->runner.kind, "simulated");
    EXPECT_TRUE(result->sources.plans_dir.empty());
}

TEST_F(ConfigTest, NegativeValuesKeepDefaults) {
    auto path = write_toml(R"(
        [service]
        poll_interval_ms = -5
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->service.poll_interval_ms, 1000u);
}

TEST_F(ConfigTest, NonexistentFile) {
    auto result = load_config("/nonexistent/path/config.toml");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::NotFound);
}

TEST_F(ConfigTest, MalformedToml) {
    auto path = write_toml("this is [[ not valid toml }}}}");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Parse);
}

TEST_F(ConfigTest, RejectsZeroConcurrency) {
    auto path = write_toml(R"(
        [service]
        max_concurrent_tests = 0
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
}

TEST_F(ConfigTest, ValidateRejectsBadValues) {
    auto config = default_config();
    config.runner.kind = "kvm";
    EXPECT_FALSE(validate_config(config).has_value());

    config = default_config();
    config.timeout.margin_factor = 0.5;
    EXPECT_FALSE(validate_config(config).has_value());

    config = default_config();
    config.timeout.warning_threshold = 1.0;
    EXPECT_FALSE(validate_config(config).has_value());

    config = default_config();
    config.telemetry.log_level = "verbose";
    EXPECT_FALSE(validate_config(config).has_value());
}
