/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"
#include "core/logger.hpp"

#include <toml++/toml.hpp>

namespace kernel_orchestrator {

namespace {

template <typename T>
T read_uint(const toml::node_view<toml::node>& table, std::string_view key, T fallback) {
    auto value = table[key].value<int64_t>();
    if (!value || *value < 0) return fallback;
    return static_cast<T>(*value);
}

}  // anonymous namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::NotFound, "Configuration file not found: " + path.string()};
    }

    Config config;
    try {
        auto tbl = toml::parse_file(path.string());

        // [service]
        if (auto service = tbl["service"]; service.is_table()) {
            config.service.poll_interval_ms =
                read_uint(service, "poll_interval_ms", config.service.poll_interval_ms);
            config.service.max_concurrent_tests =
                read_uint(service, "max_concurrent_tests", config.service.max_concurrent_tests);
            config.service.enable_persistence = service["enable_persistence"].value_or(false);
            config.service.state_file =
                service["state_file"].value_or(config.service.state_file.string());
            config.service.finished_job_retention_s =
                read_uint(service, "finished_job_retention_s", config.service.finished_job_retention_s);
        }

        // [timeout]
        if (auto timeout = tbl["timeout"]; timeout.is_table()) {
            config.timeout.default_timeout_ms =
                read_uint(timeout, "default_timeout_ms", config.timeout.default_timeout_ms);
            config.timeout.margin_factor =
                timeout["margin_factor"].value_or(config.timeout.margin_factor);
            config.timeout.margin_ms = read_uint(timeout, "margin_ms", config.timeout.margin_ms);
            config.timeout.warning_threshold =
                timeout["warning_threshold"].value_or(config.timeout.warning_threshold);
            config.timeout.termination_grace_ms =
                read_uint(timeout, "termination_grace_ms", config.timeout.termination_grace_ms);
        }

        // [matcher]
        if (auto matcher = tbl["matcher"]; matcher.is_table()) {
            config.matcher.light_memory_mb =
                read_uint(matcher, "light_memory_mb", config.matcher.light_memory_mb);
            config.matcher.light_duration_ms =
                read_uint(matcher, "light_duration_ms", config.matcher.light_duration_ms);
        }

        // [recovery]
        if (auto recovery = tbl["recovery"]; recovery.is_table()) {
            auto& rc = config.recovery;
            rc.degradation_window_s = read_uint(recovery, "degradation_window_s", rc.degradation_window_s);
            rc.environment_failure_threshold =
                read_uint(recovery, "environment_failure_threshold", rc.environment_failure_threshold);
            rc.resource_exhaustion_threshold =
                read_uint(recovery, "resource_exhaustion_threshold", rc.resource_exhaustion_threshold);
            rc.critical_error_threshold =
                read_uint(recovery, "critical_error_threshold", rc.critical_error_threshold);
            rc.max_recovery_attempts = read_uint(recovery, "max_recovery_attempts", rc.max_recovery_attempts);
            rc.retry_delay_ms = read_uint(recovery, "retry_delay_ms", rc.retry_delay_ms);
        }

        // [runner]
        if (auto runner = tbl["runner"]; runner.is_table()) {
            config.runner.kind = runner["kind"].value_or(config.runner.kind);
            config.runner.time_scale = runner["time_scale"].value_or(config.runner.time_scale);
            config.runner.shell = runner["shell"].value_or(config.runner.shell);
        }

        // [sources]
        if (auto sources = tbl["sources"]; sources.is_table()) {
            config.sources.environments_file = sources["environments_file"].value_or(std::string{});
            config.sources.catalog_file = sources["catalog_file"].value_or(std::string{});
            config.sources.plans_dir = sources["plans_dir"].value_or(std::string{});
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
            config.telemetry.max_file_size_mb =
                read_uint(telemetry, "max_file_size_mb", config.telemetry.max_file_size_mb);
            config.telemetry.rotate_count =
                read_uint(telemetry, "rotate_count", config.telemetry.rotate_count);
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
        }

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::Parse,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }

    if (auto valid = validate_config(config); !valid) {
        return valid.error();
    }
    return config;
}

Config default_config() {
    return Config{};
}

Result<void> validate_config(const Config& config) {
    if (config.service.poll_interval_ms == 0) {
        return Error{ErrorCode::InvalidArgument, "service.poll_interval_ms must be positive"};
    }
    if (config.service.max_concurrent_tests == 0) {
        return Error{ErrorCode::InvalidArgument, "service.max_concurrent_tests must be positive"};
    }
    if (config.timeout.default_timeout_ms == 0) {
        return Error{ErrorCode::InvalidArgument, "timeout.default_timeout_ms must be positive"};
    }
    if (config.timeout.margin_factor < 1.0) {
        return Error{ErrorCode::InvalidArgument, "timeout.margin_factor must be >= 1.0"};
    }
    if (config.timeout.warning_threshold <= 0.0 || config.timeout.warning_threshold >= 1.0) {
        return Error{ErrorCode::InvalidArgument, "timeout.warning_threshold must be in (0, 1)"};
    }
    if (config.runner.kind != "simulated" && config.runner.kind != "process") {
        return Error{ErrorCode::InvalidArgument, "runner.kind must be \"simulated\" or \"process\""};
    }
    if (config.runner.time_scale <= 0.0) {
        return Error{ErrorCode::InvalidArgument, "runner.time_scale must be positive"};
    }
    if (!parse_log_level(config.telemetry.log_level)) {
        return Error{ErrorCode::InvalidArgument, "Unknown telemetry.log_level: " + config.telemetry.log_level};
    }
    return {};
}

}  // namespace kernel_orchestrator
