/**
 * @file orchestrator_service.cpp
 * @brief OrchestratorService implementation.
 */

#include "service/orchestrator_service.hpp"

#include "environment/environment_loader.hpp"
#include "executor/process_runner.hpp"
#include "executor/simulated_runner.hpp"
#include "telemetry/json_sink.hpp"

#include <exception>

namespace kernel_orchestrator {

namespace {

constexpr std::string_view COMPONENT = "service";

std::unique_ptr<ILogSink> or_null(std::unique_ptr<ILogSink> sink) {
    if (sink) return sink;
    return std::make_unique<NullSink>();
}

std::shared_ptr<IPlanSource> default_plan_source(const Config& config) {
    if (config.sources.plans_dir.empty()) return nullptr;
    return std::make_shared<DirectoryPlanSource>(config.sources.plans_dir);
}

}  // anonymous namespace

std::shared_ptr<IRunner> make_runner(const Config& config) {
    if (config.runner.kind == "process") {
        return std::make_shared<ProcessRunner>(config.runner.shell,
                                               Duration{config.timeout.termination_grace_ms / 2});
    }
    return std::make_shared<SimulatedRunner>(config.runner.time_scale);
}

OrchestratorService::OrchestratorService(Options opts)
    : config_(std::move(opts.config))
    , logger_(or_null(std::move(opts.log_sink)), opts.log_level)
    , runner_(opts.runner ? std::move(opts.runner) : make_runner(config_))
    , matcher_(registry_, config_.matcher)
    , timeouts_(config_.timeout, Duration{config_.service.poll_interval_ms}, logger_)
    , dispatcher_(config_, registry_, matcher_, timeouts_, runner_, logger_)
    , recovery_(config_.recovery, Duration{config_.service.poll_interval_ms}, logger_)
    , plan_source_(opts.plan_source ? std::move(opts.plan_source) : default_plan_source(config_))
    , state_store_(config_.service.state_file)
    , metrics_(or_null(std::move(opts.metrics_sink))) {
    if (plan_source_) {
        queue_monitor_ = std::make_unique<QueueMonitor>(
            *plan_source_, catalog_, tracker_,
            [this](JobRequest request) { return dispatcher_.submit(std::move(request)); },
            logger_);
    }
    wire_components();
    register_recovery_actions();
}

OrchestratorService::~OrchestratorService() {
    stop();
}

// ─────────────────────────────────────────────
// Wiring
// ─────────────────────────────────────────────

void OrchestratorService::wire_components() {
    // Runs under the dispatcher lock; must not call back into it
    dispatcher_.on_transition([this](const JobTransition& t) {
        tracker_.record(t);
        metrics_.record_transition(t);

        if (t.to == JobState::Timeout) {
            report_error(ErrorReport{
                .category = ErrorCategory::Timeout,
                .severity = ErrorSeverity::Medium,
                .component = "dispatcher",
                .message = "job " + t.job_id + " timed out: " + t.detail,
                .job_id = t.job_id,
                .environment_id = t.environment_id,
            });
        } else if (t.to == JobState::Failed) {
            report_error(ErrorReport{
                .category = ErrorCategory::JobFailure,
                .severity = ErrorSeverity::Low,
                .component = "dispatcher",
                .message = "job " + t.job_id + " failed: " + t.detail,
                .job_id = t.job_id,
                .environment_id = t.environment_id,
            });
        }
    });

    timeouts_.on_timeout([this](const JobId& job_id, TimeoutStage stage) {
        metrics_.record_timeout(job_id, stage);
        dispatcher_.handle_timeout(job_id, stage);
    });

    recovery_.on_degradation_change([this](bool degraded) {
        metrics_.record_health_change(degraded ? HealthStatus::Degraded : HealthStatus::Healthy,
                                      degraded ? "error thresholds crossed" : "error rate recovered");
    });
}

void OrchestratorService::register_recovery_actions() {
    auto reclaim = [this](const ErrorEvent& event) -> Result<void> {
        if (!event.report.environment_id) return {};
        return dispatcher_.reclaim_environment(*event.report.environment_id);
    };
    recovery_.register_action(ErrorCategory::EnvironmentFailure, "reclaim_environment", reclaim);
    recovery_.register_action(ErrorCategory::Timeout, "reclaim_environment", reclaim);

    recovery_.register_action(ErrorCategory::ResourceExhaustion, "wake_dispatcher",
        [this](const ErrorEvent& event) -> Result<void> {
            if (event.report.job_id && !dispatcher_.placeable(*event.report.job_id)) {
                return Error{ErrorCode::Unavailable, "still no compatible environment"};
            }
            dispatcher_.wake();
            return {};
        });

    recovery_.register_action(ErrorCategory::ComponentFailure, "restart_component",
        [this](const ErrorEvent& event) -> Result<void> {
            const auto& component = event.report.component;
            if (!running_.load()) {
                return Error{ErrorCode::Unavailable, "service is stopped"};
            }
            if (component == "dispatcher") {
                dispatcher_.start();
                return {};
            }
            if (component == "timeout_manager") {
                timeouts_.start();
                return {};
            }
            if (component == "queue_monitor" && queue_monitor_) {
                auto polled = queue_monitor_->poll();
                if (!polled) return polled.error();
                set_fault(component, std::nullopt);
                return {};
            }
            return Error{ErrorCode::NotFound, "no restart handler for " + component};
        });
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

bool OrchestratorService::start() {
    std::lock_guard lifecycle(lifecycle_mutex_);
    if (running_.load()) return true;

    logger_.info(COMPONENT, "Orchestrator service starting: max_concurrent_tests="
                 + std::to_string(config_.service.max_concurrent_tests) + " poll_interval="
                 + std::to_string(config_.service.poll_interval_ms) + "ms runner="
                 + std::string{runner_->name()});

    // Sources and persisted jobs are read once per process
    if (!sources_loaded_) {
        load_sources();
        if (config_.service.enable_persistence) restore_state();
        sources_loaded_ = true;
    }

    running_ = true;
    started_at_ = std::chrono::steady_clock::now();

    dispatcher_.start();
    timeouts_.start();
    recovery_.start();

    maintenance_thread_ = std::jthread([this](std::stop_token stop) {
        maintenance_loop(stop);
    });

    {
        std::lock_guard lock(faults_mutex_);
        last_reported_status_ = HealthStatus::Healthy;
    }
    metrics_.record_health_change(HealthStatus::Healthy, "service started");
    logger_.info(COMPONENT, "Orchestrator service started with "
                 + std::to_string(registry_.total_count()) + " environments");
    return true;
}

bool OrchestratorService::stop() {
    std::lock_guard lifecycle(lifecycle_mutex_);
    if (!running_.exchange(false)) return true;

    logger_.info(COMPONENT, "Orchestrator service shutting down...");

    if (maintenance_thread_.joinable()) {
        maintenance_thread_.request_stop();
        maintenance_cv_.notify_all();
        maintenance_thread_.join();
    }
    maintenance_thread_ = std::jthread{};

    // Snapshot is taken inside stop() once admission has ended
    auto snapshot = dispatcher_.stop();
    if (config_.service.enable_persistence) {
        persist_state(snapshot);
    }
    if (queue_monitor_) queue_monitor_->push_plan_updates();
    timeouts_.stop();
    recovery_.stop();

    {
        std::lock_guard lock(faults_mutex_);
        last_reported_status_ = HealthStatus::Stopped;
    }
    metrics_.record_health_change(HealthStatus::Stopped, "service stopped");
    metrics_.flush();
    logger_.info(COMPONENT, "Orchestrator service stopped");
    logger_.flush();
    return true;
}

void OrchestratorService::load_sources() {
    const auto& sources = config_.sources;

    if (!sources.environments_file.empty()) {
        auto environments = load_environment_file(sources.environments_file);
        if (!environments) {
            logger_.error(COMPONENT, "Environment pool not loaded: " + environments.error().message);
            report_error(ErrorReport{
                .category = ErrorCategory::Configuration,
                .severity = ErrorSeverity::High,
                .component = "environment_registry",
                .message = environments.error().message,
            });
        } else {
            for (auto& env : *environments) {
                auto id = env.id;
                if (auto added = registry_.register_environment(std::move(env)); !added) {
                    logger_.warn(COMPONENT, "Skipping environment " + id + ": " + added.error().message);
                } else {
                    metrics_.record_environment_event(id, "registered");
                }
            }
            logger_.info(COMPONENT, "Loaded " + std::to_string(environments->size())
                         + " environments from " + sources.environments_file.string());
        }
    }

    if (!sources.catalog_file.empty()) {
        auto loaded = catalog_.load_file(sources.catalog_file);
        if (!loaded) {
            logger_.error(COMPONENT, "Test catalog not loaded: " + loaded.error().message);
            report_error(ErrorReport{
                .category = ErrorCategory::Configuration,
                .severity = ErrorSeverity::High,
                .component = "test_catalog",
                .message = loaded.error().message,
            });
        } else {
            logger_.info(COMPONENT, "Loaded " + std::to_string(*loaded) + " test definitions from "
                         + sources.catalog_file.string());
        }
    }
}

void OrchestratorService::restore_state() {
    auto state = state_store_.load();
    if (!state) {
        logger_.error(COMPONENT, "State not restored: " + state.error().message);
        report_error(ErrorReport{
            .category = ErrorCategory::Persistence,
            .severity = ErrorSeverity::High,
            .component = "state_store",
            .message = state.error().message,
        });
        return;
    }
    if (state->from_backup) {
        logger_.warn(COMPONENT, "State file unreadable, restored from " + state_store_.backup_path().string());
    }

    restored_counters_ = state->counters;
    size_t restored = 0;
    for (auto& request : state->jobs) {
        auto id = request.job_id.value_or("?");
        if (auto job = dispatcher_.submit(std::move(request)); job) {
            ++restored;
        } else {
            logger_.warn(COMPONENT, "Cannot restore job " + id + ": " + job.error().message);
        }
    }
    if (restored > 0 || !state->jobs.empty()) {
        logger_.info(COMPONENT, "Restored " + std::to_string(restored) + " of "
                     + std::to_string(state->jobs.size()) + " unfinished jobs");
    }
}

void OrchestratorService::persist_state(const ShutdownSnapshot& snapshot) {
    const auto& stats = snapshot.stats;
    PersistedState state{
        .jobs = snapshot.unfinished,
        .counters = PersistedCounters{
            .submitted = restored_counters_.submitted + stats.submitted,
            .completed = restored_counters_.completed + stats.completed,
            .failed = restored_counters_.failed + stats.failed,
            .timed_out = restored_counters_.timed_out + stats.timed_out,
            .cancelled = restored_counters_.cancelled + stats.cancelled,
        },
        .saved_at = std::chrono::system_clock::now(),
    };

    if (auto saved = state_store_.save(state); !saved) {
        logger_.error(COMPONENT, "State not saved: " + saved.error().message);
        report_error(ErrorReport{
            .category = ErrorCategory::Persistence,
            .severity = ErrorSeverity::High,
            .component = "state_store",
            .message = saved.error().message,
        });
        return;
    }
    logger_.info(COMPONENT, "Saved " + std::to_string(state.jobs.size()) + " unfinished jobs to "
                 + state_store_.path().string());
}

// ─────────────────────────────────────────────
// Jobs
// ─────────────────────────────────────────────

Result<JobId> OrchestratorService::submit_job(TestCase test_case, Priority priority, double impact_score) {
    return submit_job(JobRequest{
        .test_case = std::move(test_case),
        .priority = priority,
        .impact_score = impact_score,
    });
}

Result<JobId> OrchestratorService::submit_job(JobRequest request) {
    if (!running_.load()) {
        return Error{ErrorCode::Unavailable, "Orchestrator service is not running"};
    }
    return dispatcher_.submit(std::move(request));
}

Result<JobStatus> OrchestratorService::get_job_status(const JobId& job_id) const {
    return dispatcher_.status(job_id);
}

QueueSnapshot OrchestratorService::get_queue_status() const {
    return dispatcher_.queue_snapshot();
}

Result<void> OrchestratorService::cancel_job(const JobId& job_id) {
    return dispatcher_.cancel(job_id);
}

size_t OrchestratorService::escalate_subsystem(const std::string& subsystem, Priority priority) {
    return dispatcher_.escalate_subsystem(subsystem, priority);
}

std::vector<JobTransition> OrchestratorService::job_history(const JobId& job_id) const {
    return tracker_.history(job_id);
}

bool OrchestratorService::wait_until_idle(Duration timeout) {
    return dispatcher_.wait_until_idle(timeout);
}

// ─────────────────────────────────────────────
// Environments
// ─────────────────────────────────────────────

Result<void> OrchestratorService::add_environment(Environment environment) {
    auto id = environment.id;
    if (auto added = registry_.register_environment(std::move(environment)); !added) {
        return added;
    }
    metrics_.record_environment_event(id, "registered");
    logger_.info(COMPONENT, "Environment " + id + " registered");
    dispatcher_.wake();
    return {};
}

Result<void> OrchestratorService::remove_environment(const EnvironmentId& env_id) {
    auto holder = registry_.holder(env_id);
    if (auto removed = registry_.deregister(env_id); !removed) {
        return removed;
    }
    metrics_.record_environment_event(env_id, "removed", holder ? "retiring after " + *holder : "");
    logger_.info(COMPONENT, "Environment " + env_id + " removed"
                 + (holder ? ", retires when job " + *holder + " finishes" : std::string{}));
    return {};
}

Result<std::optional<JobId>> OrchestratorService::report_environment_failure(const EnvironmentId& env_id,
                                                                            const std::string& reason) {
    auto affected = dispatcher_.handle_environment_loss(env_id, reason);
    if (!affected) return affected;

    metrics_.record_environment_event(env_id, "lost", reason);
    report_error(ErrorReport{
        .category = ErrorCategory::EnvironmentFailure,
        .severity = ErrorSeverity::High,
        .component = "environment_registry",
        .message = "environment " + env_id + " lost: " + reason,
        .job_id = *affected,
        .environment_id = env_id,
    });
    dispatcher_.wake();
    return affected;
}

std::vector<EnvironmentUsage> OrchestratorService::environment_usage() const {
    return registry_.usage();
}

// ─────────────────────────────────────────────
// Plans
// ─────────────────────────────────────────────

Result<PollReport> OrchestratorService::poll_plans_now() {
    if (!queue_monitor_) {
        return Error{ErrorCode::Unavailable, "No plan source configured"};
    }
    auto report = queue_monitor_->poll();
    queue_monitor_->push_plan_updates();
    return report;
}

// ─────────────────────────────────────────────
// Maintenance
// ─────────────────────────────────────────────

template <typename F>
void OrchestratorService::guarded_step(const std::string& component, F&& step) {
    try {
        step();
    } catch (const std::exception& e) {
        logger_.error(COMPONENT, "Maintenance step '" + component + "' failed: " + e.what());
        set_fault(component, e.what());
        report_error(ErrorReport{
            .category = ErrorCategory::ComponentFailure,
            .severity = ErrorSeverity::Medium,
            .component = component,
            .message = e.what(),
        });
    }
}

bool OrchestratorService::set_fault(const std::string& component, std::optional<std::string> fault) {
    std::lock_guard lock(faults_mutex_);
    if (fault) {
        return faults_.insert_or_assign(component, std::move(*fault)).second;
    }
    faults_.erase(component);
    return false;
}

void OrchestratorService::maintenance_tick() {
    if (queue_monitor_) {
        guarded_step("queue_monitor", [this] {
            auto polled = queue_monitor_->poll();
            if (polled) {
                set_fault("queue_monitor", std::nullopt);
            } else {
                set_fault("queue_monitor", polled.error().message);
            }
            queue_monitor_->push_plan_updates();
        });
    }

    guarded_step("retention", [this] {
        Duration retention = std::chrono::seconds{config_.service.finished_job_retention_s};
        auto pruned = dispatcher_.prune_finished(retention);
        tracker_.prune(retention);
        if (queue_monitor_) queue_monitor_->prune(retention);
        recovery_.cleanup(retention);
        if (pruned > 0) {
            logger_.debug(COMPONENT, "Pruned " + std::to_string(pruned) + " finished jobs");
        }
    });

    guarded_step("backpressure", [this] {
        for (const auto& job : dispatcher_.take_unplaceable()) {
            report_error(ErrorReport{
                .category = ErrorCategory::ResourceExhaustion,
                .severity = ErrorSeverity::Medium,
                .component = "dispatcher",
                .message = "job " + job.job_id + " (" + job.test_case_id
                           + ") has no compatible environment",
                .job_id = job.job_id,
            });
        }
    });

    guarded_step("liveness", [this] {
        if (!running_.load()) return;
        auto check = [this](const std::string& component, bool alive) {
            if (alive) {
                set_fault(component, std::nullopt);
                return;
            }
            // Report once per outage
            if (set_fault(component, "not running")) {
                report_error(ErrorReport{
                    .category = ErrorCategory::ComponentFailure,
                    .severity = ErrorSeverity::High,
                    .component = component,
                    .message = component + " is not running",
                });
            }
        };
        check("dispatcher", dispatcher_.is_running());
        check("timeout_manager", timeouts_.is_running());
    });

    guarded_step("telemetry", [this] {
        metrics_.record_queue_snapshot(get_queue_status());

        auto health = get_health_status();
        bool changed = false;
        {
            std::lock_guard lock(faults_mutex_);
            changed = health.status != last_reported_status_;
            last_reported_status_ = health.status;
        }
        if (changed) {
            std::string detail;
            for (const auto& c : health.components) {
                if (c.status == HealthStatus::Healthy) continue;
                if (!detail.empty()) detail += "; ";
                detail += c.name + ": " + c.detail;
            }
            metrics_.record_health_change(health.status, detail);
            logger_.warn(COMPONENT, "Service health is now " + std::string{to_string(health.status)}
                         + (detail.empty() ? std::string{} : " (" + detail + ")"));
        }
    });
}

void OrchestratorService::maintenance_loop(std::stop_token stop) {
    const Duration interval{config_.service.poll_interval_ms};
    while (!stop.stop_requested()) {
        {
            std::unique_lock lock(maintenance_mutex_);
            maintenance_cv_.wait_for(lock, stop, interval, [] { return false; });
        }
        if (stop.stop_requested()) break;
        maintenance_tick();
    }
}

// ─────────────────────────────────────────────
// Health & Metrics
// ─────────────────────────────────────────────

std::string OrchestratorService::report_error(ErrorReport report) {
    auto copy = report;
    auto id = recovery_.report(std::move(report));
    metrics_.record_error(id, copy);
    return id;
}

ServiceHealth OrchestratorService::get_health_status() const {
    ServiceHealth health;
    health.components.push_back(dispatcher_.health());
    health.components.push_back(timeouts_.health());
    health.components.push_back(recovery_.health());
    health.components.push_back(tracker_.health());
    if (queue_monitor_) health.components.push_back(queue_monitor_->health());

    {
        std::lock_guard lock(faults_mutex_);
        for (const auto& [component, fault] : faults_) {
            health.components.push_back(ComponentHealth{
                .name = component,
                .status = HealthStatus::Degraded,
                .detail = fault,
            });
        }
    }

    health.degraded_mode = recovery_.is_degraded();
    if (!running_.load()) {
        health.status = HealthStatus::Stopped;
        return health;
    }

    health.status = health.degraded_mode ? HealthStatus::Degraded : HealthStatus::Healthy;
    for (const auto& component : health.components) {
        if (component.status != HealthStatus::Healthy) {
            health.status = HealthStatus::Degraded;
        }
    }
    return health;
}

SystemMetrics OrchestratorService::get_system_metrics() const {
    SystemMetrics m;
    m.running = running_.load();
    if (m.running) {
        m.uptime = std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - started_at_);
    }
    m.max_concurrent_tests = config_.service.max_concurrent_tests;
    m.queue = dispatcher_.queue_snapshot();
    m.jobs = tracker_.metrics();
    m.dispatcher = dispatcher_.stats();
    m.timeouts = timeouts_.stats();
    m.recovery = recovery_.stats();
    m.lifetime = PersistedCounters{
        .submitted = restored_counters_.submitted + m.dispatcher.submitted,
        .completed = restored_counters_.completed + m.dispatcher.completed,
        .failed = restored_counters_.failed + m.dispatcher.failed,
        .timed_out = restored_counters_.timed_out + m.dispatcher.timed_out,
        .cancelled = restored_counters_.cancelled + m.dispatcher.cancelled,
    };
    return m;
}

}  // namespace kernel_orchestrator
