/**
 * @file timeout_manager.cpp
 * @brief TimeoutManager implementation.
 */

#include "timeout/timeout_manager.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <utility>

namespace kernel_orchestrator {

namespace {

constexpr std::string_view COMPONENT = "timeout";

}  // anonymous namespace

Duration compute_timeout(const TestCase& test, const TimeoutConfig& config) {
    Duration ceiling{config.default_timeout_ms};
    if (test.estimated_duration.count() <= 0) return ceiling;

    auto scaled = static_cast<int64_t>(
        std::ceil(static_cast<double>(test.estimated_duration.count()) * config.margin_factor));
    Duration estimate{scaled + static_cast<int64_t>(config.margin_ms)};
    return std::min(ceiling, estimate);
}

TimeoutManager::TimeoutManager(TimeoutConfig config, Duration poll_interval, Logger& logger)
    : config_(config), poll_interval_(poll_interval), logger_(logger) {}

TimeoutManager::~TimeoutManager() {
    stop();
}

void TimeoutManager::on_timeout(TimeoutCallback callback) {
    std::lock_guard lock(mutex_);
    callbacks_.push_back(std::move(callback));
}

void TimeoutManager::start() {
    if (running_.exchange(true)) return;
    worker_ = std::jthread([this](std::stop_token stop) {
        run_loop(stop);
    });
}

void TimeoutManager::stop() {
    if (worker_.joinable()) {
        worker_.request_stop();
        cv_.notify_all();
        worker_.join();
    }
    worker_ = std::jthread{};
    running_ = false;
}

bool TimeoutManager::is_running() const noexcept {
    return running_.load();
}

void TimeoutManager::watch(const JobId& job_id, Duration timeout) {
    auto now = std::chrono::steady_clock::now();
    auto warn_offset = Duration{static_cast<int64_t>(
        static_cast<double>(timeout.count()) * config_.warning_threshold)};
    {
        std::lock_guard lock(mutex_);
        entries_[job_id] = Entry{
            .started = now,
            .deadline = now + timeout,
            .warn_at = now + warn_offset,
            .force_at = std::nullopt,
        };
        stats_.watched = entries_.size();
        rescan_ = true;
    }
    cv_.notify_all();
}

void TimeoutManager::unwatch(const JobId& job_id) {
    std::lock_guard lock(mutex_);
    entries_.erase(job_id);
    stats_.watched = entries_.size();
}

std::optional<Duration> TimeoutManager::remaining(const JobId& job_id) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(job_id);
    if (it == entries_.end()) return std::nullopt;
    auto left = std::chrono::duration_cast<Duration>(it->second.deadline - std::chrono::steady_clock::now());
    return std::max(left, Duration{0});
}

bool TimeoutManager::is_expired(const JobId& job_id) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(job_id);
    return it != entries_.end() && it->second.expired;
}

size_t TimeoutManager::process_due(SteadyTime now) {
    std::vector<std::pair<JobId, TimeoutStage>> fired;
    std::vector<TimeoutCallback> callbacks;
    {
        std::lock_guard lock(mutex_);
        for (auto it = entries_.begin(); it != entries_.end();) {
            auto& [job_id, entry] = *it;

            if (!entry.warned && !entry.expired && now >= entry.warn_at) {
                entry.warned = true;
                ++stats_.warnings;
                fired.emplace_back(job_id, TimeoutStage::Warning);
            }
            if (!entry.expired && now >= entry.deadline) {
                entry.expired = true;
                entry.force_at = now + Duration{config_.termination_grace_ms};
                ++stats_.expirations;
                fired.emplace_back(job_id, TimeoutStage::Expired);
            }
            if (entry.force_at && now >= *entry.force_at) {
                ++stats_.forced_terminations;
                fired.emplace_back(job_id, TimeoutStage::ForceTerminate);
                it = entries_.erase(it);
                continue;
            }
            ++it;
        }
        stats_.watched = entries_.size();
        if (!fired.empty()) callbacks = callbacks_;
    }

    for (const auto& [job_id, stage] : fired) {
        if (stage == TimeoutStage::Warning) {
            logger_.warn(COMPONENT, "Job " + job_id + " passed "
                         + std::to_string(static_cast<int>(config_.warning_threshold * 100))
                         + "% of its timeout");
        } else if (stage == TimeoutStage::Expired) {
            logger_.warn(COMPONENT, "Job " + job_id + " exceeded its timeout, requesting termination");
        } else {
            logger_.error(COMPONENT, "Job " + job_id + " did not stop within the termination grace period");
        }

        for (const auto& callback : callbacks) {
            try {
                callback(job_id, stage);
            } catch (const std::exception& e) {
                {
                    std::lock_guard lock(mutex_);
                    ++callback_errors_;
                }
                logger_.error(COMPONENT, "Timeout callback failed for " + job_id + ": " + e.what());
            }
        }
    }
    return fired.size();
}

std::optional<SteadyTime> TimeoutManager::next_due_locked() const {
    std::optional<SteadyTime> next;
    for (const auto& [job_id, entry] : entries_) {
        SteadyTime due;
        if (entry.force_at) {
            due = *entry.force_at;
        } else if (!entry.warned) {
            due = entry.warn_at;
        } else {
            due = entry.deadline;
        }
        if (!next || due < *next) next = due;
    }
    return next;
}

void TimeoutManager::run_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        {
            std::unique_lock lock(mutex_);
            auto wake_at = std::chrono::steady_clock::now() + poll_interval_;
            if (auto due = next_due_locked(); due && *due < wake_at) wake_at = *due;
            // watch() sets rescan_ so a new, nearer deadline is picked up
            cv_.wait_until(lock, stop, wake_at, [this] { return rescan_; });
            bool rescan = std::exchange(rescan_, false);
            if (rescan && std::chrono::steady_clock::now() < wake_at) continue;
        }
        if (stop.stop_requested()) break;
        process_due(std::chrono::steady_clock::now());
    }
}

TimeoutStats TimeoutManager::stats() const {
    std::lock_guard lock(mutex_);
    return stats_;
}

ComponentHealth TimeoutManager::health() const {
    ComponentHealth h{.name = "timeout_manager"};
    if (!is_running()) {
        h.status = HealthStatus::Stopped;
        h.detail = "not running";
        return h;
    }
    std::lock_guard lock(mutex_);
    h.detail = std::to_string(entries_.size()) + " watched";
    if (callback_errors_ > 0) {
        h.status = HealthStatus::Degraded;
        h.detail += ", " + std::to_string(callback_errors_) + " callback errors";
    }
    return h;
}

}  // namespace kernel_orchestrator
