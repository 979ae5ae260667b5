/**
 * @file error_recovery.cpp
 * @brief ErrorRecoveryManager implementation.
 */

#include "recovery/error_recovery.hpp"

#include <exception>
#include <utility>

namespace kernel_orchestrator {

namespace {

constexpr std::string_view COMPONENT = "recovery";

}  // anonymous namespace

ErrorRecoveryManager::ErrorRecoveryManager(RecoveryConfig config, Duration poll_interval, Logger& logger)
    : config_(config), poll_interval_(poll_interval), logger_(logger) {}

ErrorRecoveryManager::~ErrorRecoveryManager() {
    stop();
}

void ErrorRecoveryManager::start() {
    if (running_.exchange(true)) return;
    worker_ = std::jthread([this](std::stop_token stop) {
        run_loop(stop);
    });
    logger_.info(COMPONENT, "Error recovery started");
}

void ErrorRecoveryManager::stop() {
    if (worker_.joinable()) {
        worker_.request_stop();
        cv_.notify_all();
        worker_.join();
        logger_.info(COMPONENT, "Error recovery stopped");
    }
    worker_ = std::jthread{};
    running_ = false;
}

std::string ErrorRecoveryManager::report(ErrorReport report) {
    auto now = std::chrono::steady_clock::now();
    std::string id;
    {
        std::lock_guard lock(mutex_);
        id = "err-" + std::to_string(next_id_++);

        ++stats_.total_errors;
        if (report.category == ErrorCategory::EnvironmentFailure) ++stats_.environment_failures;
        if (report.severity == ErrorSeverity::Critical) ++stats_.critical_errors;

        ErrorEvent event{
            .id = id,
            .report = std::move(report),
            .reported_at = std::chrono::system_clock::now(),
            .reported_steady = now,
            .next_attempt = now,
        };
        const auto& r = event.report;
        std::string message = "[" + id + "] " + std::string(to_string(r.category))
                              + " (" + std::string(to_string(r.severity)) + ") from "
                              + r.component + ": " + r.message;
        if (r.severity >= ErrorSeverity::High) {
            logger_.error(COMPONENT, message);
        } else {
            logger_.warn(COMPONENT, message);
        }
        events_.emplace(id, std::move(event));
        work_pending_ = true;
    }
    cv_.notify_all();
    return id;
}

bool ErrorRecoveryManager::resolve(const std::string& error_id, std::string resolution) {
    std::lock_guard lock(mutex_);
    auto it = events_.find(error_id);
    if (it == events_.end() || it->second.resolved) return false;

    it->second.resolved = true;
    it->second.resolution = std::move(resolution);
    it->second.resolved_steady = std::chrono::steady_clock::now();
    ++stats_.resolved_errors;
    logger_.info(COMPONENT, "Resolved " + error_id + ": " + it->second.resolution);
    return true;
}

void ErrorRecoveryManager::register_action(ErrorCategory category, std::string name, RecoveryFn action) {
    std::lock_guard lock(mutex_);
    actions_.emplace(category, NamedAction{std::move(name), std::move(action)});
}

void ErrorRecoveryManager::on_degradation_change(std::function<void(bool)> callback) {
    std::lock_guard lock(mutex_);
    degradation_callbacks_.push_back(std::move(callback));
}

bool ErrorRecoveryManager::recovery_pending_locked(const ErrorEvent& event) const {
    return !event.resolved
        && event.attempts < config_.max_recovery_attempts
        && actions_.count(event.report.category) > 0;
}

size_t ErrorRecoveryManager::process_pending(SteadyTime now) {
    struct Attempt {
        ErrorEvent event;
        std::vector<NamedAction> actions;
    };

    std::vector<Attempt> due;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [id, event] : events_) {
            if (!recovery_pending_locked(event) || now < event.next_attempt) continue;
            Attempt attempt{.event = event};
            auto [first, last] = actions_.equal_range(event.report.category);
            for (auto it = first; it != last; ++it) {
                attempt.actions.push_back(it->second);
            }
            due.push_back(std::move(attempt));
        }
    }

    size_t resolved = 0;
    for (auto& attempt : due) {
        const auto& event = attempt.event;
        std::optional<std::string> recovered_by;
        std::string last_error;

        for (const auto& named : attempt.actions) {
            try {
                auto result = named.action(event);
                if (result) {
                    recovered_by = named.name;
                    break;
                }
                last_error = result.error().message;
            } catch (const std::exception& e) {
                last_error = e.what();
            }
            logger_.warn(COMPONENT, "Recovery action '" + named.name + "' failed for "
                         + event.id + ": " + last_error);
        }

        std::lock_guard lock(mutex_);
        auto it = events_.find(event.id);
        if (it == events_.end() || it->second.resolved) continue;

        auto& stored = it->second;
        ++stored.attempts;
        if (recovered_by) {
            stored.resolved = true;
            stored.resolution = "recovered by " + *recovered_by;
            stored.resolved_steady = std::chrono::steady_clock::now();
            ++stats_.successful_recoveries;
            ++stats_.resolved_errors;
            ++resolved;
            logger_.info(COMPONENT, "Recovered " + stored.id + " via " + *recovered_by
                         + " (attempt " + std::to_string(stored.attempts) + ")");
            continue;
        }

        ++stats_.failed_recoveries;
        stored.next_attempt = now + Duration{config_.retry_delay_ms};
        if (stored.attempts >= config_.max_recovery_attempts) {
            logger_.error(COMPONENT, "Giving up on " + stored.id + " after "
                          + std::to_string(stored.attempts) + " attempts");
        }
    }
    return resolved;
}

bool ErrorRecoveryManager::evaluate_degradation(SteadyTime now) {
    auto window = std::chrono::seconds{config_.degradation_window_s};
    std::vector<std::function<void(bool)>> callbacks;
    bool degraded = false;
    bool changed = false;
    {
        std::lock_guard lock(mutex_);
        size_t environment_failures = 0;
        size_t exhaustion = 0;
        size_t critical = 0;
        for (const auto& [id, event] : events_) {
            if (now - event.reported_steady > window) continue;
            if (event.report.category == ErrorCategory::EnvironmentFailure) ++environment_failures;
            if (event.resolved) continue;
            if (event.report.category == ErrorCategory::ResourceExhaustion) ++exhaustion;
            if (event.report.severity == ErrorSeverity::Critical) ++critical;
        }

        std::string reason;
        if (environment_failures >= config_.environment_failure_threshold) {
            reason = std::to_string(environment_failures) + " environment failures";
        } else if (exhaustion >= config_.resource_exhaustion_threshold) {
            reason = std::to_string(exhaustion) + " unresolved resource exhaustion errors";
        } else if (critical >= config_.critical_error_threshold) {
            reason = std::to_string(critical) + " unresolved critical errors";
        }
        degraded = !reason.empty();

        changed = degraded_.exchange(degraded) != degraded;
        if (changed) {
            callbacks = degradation_callbacks_;
            if (degraded) {
                ++stats_.degraded_entries;
                degraded_since_ = now;
                logger_.error(COMPONENT, "Entering degraded mode: " + reason);
            } else {
                logger_.info(COMPONENT, "Leaving degraded mode");
            }
        }
    }

    if (changed) {
        for (const auto& callback : callbacks) {
            try {
                callback(degraded);
            } catch (const std::exception& e) {
                logger_.error(COMPONENT, std::string("Degradation callback failed: ") + e.what());
            }
        }
    }
    return degraded;
}

std::optional<ErrorEvent> ErrorRecoveryManager::find(const std::string& error_id) const {
    std::lock_guard lock(mutex_);
    auto it = events_.find(error_id);
    if (it == events_.end()) return std::nullopt;
    return it->second;
}

ErrorSummary ErrorRecoveryManager::summary(Duration window) const {
    auto now = std::chrono::steady_clock::now();
    ErrorSummary result;
    std::lock_guard lock(mutex_);
    for (const auto& [id, event] : events_) {
        if (now - event.reported_steady > window) continue;
        ++result.total;
        if (event.resolved) {
            ++result.resolved;
        } else {
            ++result.unresolved;
        }
        ++result.by_category[event.report.category];
        ++result.by_severity[event.report.severity];
    }
    return result;
}

RecoveryStats ErrorRecoveryManager::stats() const {
    std::lock_guard lock(mutex_);
    return stats_;
}

size_t ErrorRecoveryManager::cleanup(Duration max_age) {
    auto now = std::chrono::steady_clock::now();
    std::lock_guard lock(mutex_);
    size_t removed = 0;
    for (auto it = events_.begin(); it != events_.end();) {
        const auto& event = it->second;
        bool old = now - event.reported_steady > max_age;
        if (old && !recovery_pending_locked(event)) {
            it = events_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        logger_.debug(COMPONENT, "Cleaned up " + std::to_string(removed) + " old error events");
    }
    return removed;
}

void ErrorRecoveryManager::run_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        {
            std::unique_lock lock(mutex_);
            cv_.wait_for(lock, stop, poll_interval_, [this] { return work_pending_; });
            work_pending_ = false;
        }
        if (stop.stop_requested()) break;

        auto now = std::chrono::steady_clock::now();
        process_pending(now);
        evaluate_degradation(now);
    }
}

ComponentHealth ErrorRecoveryManager::health() const {
    ComponentHealth h{.name = "error_recovery"};
    if (!is_running()) {
        h.status = HealthStatus::Stopped;
        h.detail = "not running";
        return h;
    }
    std::lock_guard lock(mutex_);
    size_t unresolved = 0;
    for (const auto& [id, event] : events_) {
        if (!event.resolved) ++unresolved;
    }
    h.detail = std::to_string(unresolved) + " unresolved errors";
    if (degraded_.load()) {
        h.status = HealthStatus::Degraded;
        auto since = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - degraded_since_);
        h.detail += ", degraded for " + std::to_string(since.count()) + "s";
    }
    return h;
}

}  // namespace kernel_orchestrator
