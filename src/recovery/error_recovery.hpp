/**
 * @file error_recovery.hpp
 * @brief Error event ledger, recovery actions with bounded retries, and
 *        degraded-mode detection.
 *
 * Components report errors instead of throwing them across boundaries. A
 * worker thread runs the recovery actions registered for each category and
 * re-evaluates degraded mode over a sliding window:
 *
 *   environment failures in window   >= environment_failure_threshold
 *   unresolved resource exhaustion   >= resource_exhaustion_threshold
 *   unresolved critical errors       >= critical_error_threshold
 *
 * Environment failures count whether or not they were recovered; the
 * environment is gone either way.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace kernel_orchestrator {

enum class ErrorSeverity : uint8_t {
    Low,
    Medium,
    High,
    Critical
};

[[nodiscard]] constexpr std::string_view to_string(ErrorSeverity severity) noexcept {
    switch (severity) {
        case ErrorSeverity::Low:      return "low";
        case ErrorSeverity::Medium:   return "medium";
        case ErrorSeverity::High:     return "high";
        case ErrorSeverity::Critical: return "critical";
    }
    return "unknown";
}

enum class ErrorCategory : uint8_t {
    EnvironmentFailure,
    ResourceExhaustion,
    Timeout,
    JobFailure,
    ComponentFailure,
    Configuration,
    Persistence,
    Unknown
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCategory category) noexcept {
    switch (category) {
        case ErrorCategory::EnvironmentFailure: return "environment_failure";
        case ErrorCategory::ResourceExhaustion: return "resource_exhaustion";
        case ErrorCategory::Timeout:            return "timeout";
        case ErrorCategory::JobFailure:         return "job_failure";
        case ErrorCategory::ComponentFailure:   return "component_failure";
        case ErrorCategory::Configuration:      return "configuration";
        case ErrorCategory::Persistence:        return "persistence";
        case ErrorCategory::Unknown:            return "unknown";
    }
    return "unknown";
}

/**
 * @brief What a component reports.
 */
struct ErrorReport {
    ErrorCategory category{ErrorCategory::Unknown};
    ErrorSeverity severity{ErrorSeverity::Medium};
    std::string component;
    std::string message;
    std::optional<JobId> job_id;
    std::optional<EnvironmentId> environment_id;
};

/**
 * @brief A recorded error and its recovery progress.
 */
struct ErrorEvent {
    std::string id;
    ErrorReport report;
    Timestamp reported_at;
    SteadyTime reported_steady;

    bool resolved{false};
    std::string resolution;
    SteadyTime resolved_steady;

    uint32_t attempts{0};
    SteadyTime next_attempt;
};

/// Returns success when the error is recovered.
using RecoveryFn = std::function<Result<void>(const ErrorEvent&)>;

struct RecoveryStats {
    uint64_t total_errors{0};
    uint64_t resolved_errors{0};
    uint64_t environment_failures{0};
    uint64_t critical_errors{0};
    uint64_t successful_recoveries{0};
    uint64_t failed_recoveries{0};
    uint64_t degraded_entries{0};
};

struct ErrorSummary {
    size_t total{0};
    size_t resolved{0};
    size_t unresolved{0};
    std::map<ErrorCategory, size_t> by_category;
    std::map<ErrorSeverity, size_t> by_severity;
};

class ErrorRecoveryManager {
public:
    ErrorRecoveryManager(RecoveryConfig config, Duration poll_interval, Logger& logger);
    ~ErrorRecoveryManager();

    ErrorRecoveryManager(const ErrorRecoveryManager&) = delete;
    ErrorRecoveryManager& operator=(const ErrorRecoveryManager&) = delete;

    void start();
    void stop();
    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

    /// Record an error and wake the recovery loop. Returns the event id.
    std::string report(ErrorReport report);

    /// Mark an error resolved. False if unknown or already resolved.
    bool resolve(const std::string& error_id, std::string resolution);

    /// Actions run in registration order; the first success resolves the event.
    void register_action(ErrorCategory category, std::string name, RecoveryFn action);

    /// Called with the new value whenever degraded mode is entered or left.
    void on_degradation_change(std::function<void(bool)> callback);

    /**
     * @brief Run due recovery attempts. Called by the worker thread;
     *        public so tests can drive it directly.
     * @return Number of events resolved by this pass.
     */
    size_t process_pending(SteadyTime now);

    /// Recompute degraded mode. Returns the new value.
    bool evaluate_degradation(SteadyTime now);

    [[nodiscard]] bool is_degraded() const noexcept { return degraded_.load(); }

    [[nodiscard]] std::optional<ErrorEvent> find(const std::string& error_id) const;
    [[nodiscard]] ErrorSummary summary(Duration window) const;
    [[nodiscard]] RecoveryStats stats() const;

    /// Drop events older than @p max_age that are resolved or past recovery.
    size_t cleanup(Duration max_age);

    [[nodiscard]] ComponentHealth health() const;

private:
    struct NamedAction {
        std::string name;
        RecoveryFn action;
    };

    void run_loop(std::stop_token stop);
    [[nodiscard]] bool recovery_pending_locked(const ErrorEvent& event) const;

    RecoveryConfig config_;
    Duration poll_interval_;
    Logger& logger_;

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    bool work_pending_{false};
    std::unordered_map<std::string, ErrorEvent> events_;
    std::multimap<ErrorCategory, NamedAction> actions_;
    std::vector<std::function<void(bool)>> degradation_callbacks_;
    RecoveryStats stats_;
    uint64_t next_id_{1};
    SteadyTime degraded_since_;

    std::atomic<bool> degraded_{false};
    std::atomic<bool> running_{false};
    std::jthread worker_;
};

}  // namespace kernel_orchestrator
