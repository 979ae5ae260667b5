/**
 * @file config.hpp
 * @brief Daemon configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "core/result.hpp"

namespace kernel_orchestrator {

struct ServiceConfig {
    uint32_t poll_interval_ms = 1000;
    uint32_t max_concurrent_tests = 10;
    bool enable_persistence = false;
    std::filesystem::path state_file = "orchestrator_state.toml";
    uint32_t finished_job_retention_s = 3600;
};

struct TimeoutConfig {
    uint32_t default_timeout_ms = 300000;     ///< Service-level ceiling per job
    double margin_factor = 1.5;               ///< Applied to the job's own estimate
    uint32_t margin_ms = 0;                   ///< Added after the factor
    double warning_threshold = 0.8;           ///< Fraction of the timeout
    uint32_t termination_grace_ms = 500;      ///< Wait for the runner to honour a stop
};

struct MatcherConfig {
    uint32_t light_memory_mb = 2048;
    uint32_t light_duration_ms = 60000;
};

struct RecoveryConfig {
    uint32_t degradation_window_s = 600;
    uint32_t environment_failure_threshold = 5;
    uint32_t resource_exhaustion_threshold = 3;
    uint32_t critical_error_threshold = 1;
    uint32_t max_recovery_attempts = 3;
    uint32_t retry_delay_ms = 5000;
};

struct RunnerConfig {
    std::string kind = "simulated";           ///< "simulated", "process"
    double time_scale = 1.0;                  ///< Simulated runner only
    std::string shell = "/bin/sh";            ///< Process runner only
};

struct SourcesConfig {
    std::filesystem::path environments_file;
    std::filesystem::path catalog_file;
    std::filesystem::path plans_dir;
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
};

/**
 * @brief Top-level daemon configuration.
 */
struct Config {
    ServiceConfig service;
    TimeoutConfig timeout;
    MatcherConfig matcher;
    RecoveryConfig recovery;
    RunnerConfig runner;
    SourcesConfig sources;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file. Missing keys keep their defaults.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

/**
 * @brief Reject values the service cannot run with.
 */
Result<void> validate_config(const Config& config);

}  // namespace kernel_orchestrator
