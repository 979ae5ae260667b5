/**
 * @file orchestrator_service.hpp
 * @brief Top-level OrchestratorService facade that ties all modules together.
 *
 * Provides a single entry point for:
 *   1. Submitting, querying and cancelling test jobs
 *   2. Managing the environment pool, including failure injection
 *   3. Aggregate health and system metrics
 *
 * Start order: registry → matcher → dispatcher → timeout manager → recovery →
 * monitor. A maintenance thread polls the plan source, pushes plan status
 * back, prunes finished jobs and emits queue snapshots; a failing step
 * degrades the service instead of stopping it.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "environment/environment_registry.hpp"
#include "environment/resource_matcher.hpp"
#include "executor/runner.hpp"
#include "monitor/plan_source.hpp"
#include "monitor/queue_monitor.hpp"
#include "monitor/status_tracker.hpp"
#include "monitor/test_catalog.hpp"
#include "recovery/error_recovery.hpp"
#include "recovery/state_store.hpp"
#include "scheduler/dispatcher.hpp"
#include "telemetry/metrics_collector.hpp"
#include "timeout/timeout_manager.hpp"

#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace kernel_orchestrator {

struct ServiceHealth {
    HealthStatus status{HealthStatus::Stopped};
    std::vector<ComponentHealth> components;
    bool degraded_mode{false};             ///< Error recovery thresholds crossed
};

struct SystemMetrics {
    bool running{false};
    Duration uptime{0};
    uint32_t max_concurrent_tests{0};
    QueueSnapshot queue;
    TrackerMetrics jobs;
    DispatcherStats dispatcher;
    TimeoutStats timeouts;
    RecoveryStats recovery;
    PersistedCounters lifetime;            ///< Restored totals plus this run
};

/**
 * @brief Build the runner named by the configuration.
 */
[[nodiscard]] std::shared_ptr<IRunner> make_runner(const Config& config);

class OrchestratorService {
public:
    struct Options {
        Config config;
        std::shared_ptr<IRunner> runner;               ///< Built from config.runner when null
        std::unique_ptr<ILogSink> log_sink;            ///< NullSink when null
        LogLevel log_level = LogLevel::Info;
        std::unique_ptr<ILogSink> metrics_sink;        ///< NullSink when null
        std::shared_ptr<IPlanSource> plan_source;      ///< DirectoryPlanSource on sources.plans_dir when null
    };

    explicit OrchestratorService(Options opts);
    ~OrchestratorService();

    OrchestratorService(const OrchestratorService&) = delete;
    OrchestratorService& operator=(const OrchestratorService&) = delete;

    // ── Lifecycle ────────────────────────────

    /// Idempotent; true when the service is running afterwards.
    bool start();

    /// Idempotent; pending and running jobs end CANCELLED.
    bool stop();

    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

    // ── Jobs ─────────────────────────────────

    Result<JobId> submit_job(TestCase test_case, Priority priority, double impact_score = 0.0);
    Result<JobId> submit_job(JobRequest request);
    [[nodiscard]] Result<JobStatus> get_job_status(const JobId& job_id) const;
    [[nodiscard]] QueueSnapshot get_queue_status() const;
    Result<void> cancel_job(const JobId& job_id);
    size_t escalate_subsystem(const std::string& subsystem, Priority priority);
    [[nodiscard]] std::vector<JobTransition> job_history(const JobId& job_id) const;

    /// Block until nothing is pending or running. Test and demo helper.
    bool wait_until_idle(Duration timeout);

    // ── Environments ─────────────────────────

    Result<void> add_environment(Environment environment);
    Result<void> remove_environment(const EnvironmentId& env_id);

    /**
     * @brief Hardware or virtualization loss. The environment is dropped,
     *        a job running on it resolves FAILED, and recovery is notified.
     */
    Result<std::optional<JobId>> report_environment_failure(const EnvironmentId& env_id,
                                                            const std::string& reason);

    [[nodiscard]] std::vector<EnvironmentUsage> environment_usage() const;

    // ── Plans ────────────────────────────────

    /// Poll the plan source now instead of waiting for the maintenance tick.
    Result<PollReport> poll_plans_now();

    // ── Health & Metrics ─────────────────────

    [[nodiscard]] ServiceHealth get_health_status() const;
    [[nodiscard]] SystemMetrics get_system_metrics() const;

    /// Record an internal error with the recovery manager and telemetry.
    std::string report_error(ErrorReport report);

    /// One maintenance pass. Called by the maintenance thread; public for tests.
    void maintenance_tick();

    // ── Accessors (for testing) ─────────────
    Logger& logger() { return logger_; }
    const Config& config() const { return config_; }
    TestCatalog& catalog() { return catalog_; }
    StatusTracker& tracker() { return tracker_; }
    ErrorRecoveryManager& recovery() { return recovery_; }
    EnvironmentRegistry& registry() { return registry_; }
    Dispatcher& dispatcher() { return dispatcher_; }
    MetricsCollector& metrics() { return metrics_; }

private:
    void wire_components();
    void register_recovery_actions();
    void load_sources();
    void restore_state();
    void persist_state(const ShutdownSnapshot& snapshot);
    void maintenance_loop(std::stop_token stop);

    /// Run one maintenance step, turning an exception into a component fault.
    template <typename F>
    void guarded_step(const std::string& component, F&& step);

    /// Set or clear a component fault. True when a fault was newly raised.
    bool set_fault(const std::string& component, std::optional<std::string> fault);

    Config config_;
    Logger logger_;
    std::shared_ptr<IRunner> runner_;

    EnvironmentRegistry registry_;
    ResourceMatcher matcher_;
    TimeoutManager timeouts_;
    Dispatcher dispatcher_;
    ErrorRecoveryManager recovery_;
    StatusTracker tracker_;
    TestCatalog catalog_;
    std::shared_ptr<IPlanSource> plan_source_;
    std::unique_ptr<QueueMonitor> queue_monitor_;
    StateStore state_store_;
    MetricsCollector metrics_;

    std::mutex lifecycle_mutex_;
    std::atomic<bool> running_{false};
    bool sources_loaded_{false};
    SteadyTime started_at_;
    PersistedCounters restored_counters_;

    mutable std::mutex faults_mutex_;
    std::map<std::string, std::string> faults_;
    HealthStatus last_reported_status_{HealthStatus::Stopped};

    std::mutex maintenance_mutex_;
    std::condition_variable_any maintenance_cv_;
    std::jthread maintenance_thread_;
};

}  // namespace kernel_orchestrator
