/**
 * @file status_tracker.cpp
 * @brief StatusTracker implementation.
 */

#include "monitor/status_tracker.hpp"

namespace kernel_orchestrator {

namespace {

void decrement(size_t& counter) {
    if (counter > 0) --counter;
}

PlanStatus derive_status(const PlanProgress& p, bool registered) {
    if (registered && p.total == 0) return PlanStatus::Failed;
    if (p.total > 0 && p.finished() >= p.total) {
        return (p.failed > 0 || p.cancelled > 0) ? PlanStatus::Failed : PlanStatus::Completed;
    }
    if (p.running > 0 || p.finished() > 0) return PlanStatus::Running;
    return PlanStatus::Queued;
}

}  // anonymous namespace

void StatusTracker::record(const JobTransition& transition) {
    std::lock_guard lock(mutex_);
    auto& entry = jobs_[transition.job_id];

    if (transition.from == JobState::Pending) decrement(queued_);
    if (transition.from == JobState::Running) decrement(active_);

    switch (transition.to) {
        case JobState::Pending:
            ++queued_;
            break;
        case JobState::Running:
            ++active_;
            break;
        case JobState::Completed:
            ++completed_;
            break;
        case JobState::Failed:
            ++failed_;
            break;
        case JobState::Timeout:
            ++failed_;
            ++timed_out_;
            break;
        case JobState::Cancelled:
            ++cancelled_;
            break;
    }

    if (is_terminal(transition.to)) {
        entry.finished = std::chrono::steady_clock::now();
        if (transition.to != JobState::Cancelled && transition.execution_time.count() > 0) {
            total_execution_ += transition.execution_time;
            ++timed_runs_;
        }
    }
    entry.state = transition.to;
    entry.history.push_back(transition);

    if (transition.plan_id) {
        update_plan_locked(*transition.plan_id, transition.from, transition.to);
    }
}

void StatusTracker::register_plan(const PlanId& plan_id, size_t total_jobs) {
    std::lock_guard lock(mutex_);
    auto& plan = plans_[plan_id];
    plan.progress.plan_id = plan_id;
    plan.progress.total = total_jobs;
    plan.registered = true;
    // Jobs may have finished before the total shrank
    refresh_plan_locked(plan_id, plan);
}

void StatusTracker::refresh_plan_locked(const PlanId& plan_id, PlanEntry& plan) {
    auto& p = plan.progress;
    auto status = derive_status(p, plan.registered);
    if (status == p.status) return;
    p.status = status;
    if (status == PlanStatus::Completed || status == PlanStatus::Failed) {
        plan.finished = std::chrono::steady_clock::now();
    }
    if (changed_index_.insert(plan_id).second) {
        changed_plans_.push_back(plan_id);
    }
}

void StatusTracker::update_plan_locked(const PlanId& plan_id, std::optional<JobState> from, JobState to) {
    auto& plan = plans_[plan_id];
    auto& p = plan.progress;
    p.plan_id = plan_id;

    if (!from && !plan.registered) ++p.total;
    if (from == JobState::Running) decrement(p.running);

    switch (to) {
        case JobState::Running:   ++p.running; break;
        case JobState::Completed: ++p.completed; break;
        case JobState::Failed:
        case JobState::Timeout:   ++p.failed; break;
        case JobState::Cancelled: ++p.cancelled; break;
        case JobState::Pending:   break;
    }

    refresh_plan_locked(plan_id, plan);
}

std::optional<PlanProgress> StatusTracker::plan(const PlanId& plan_id) const {
    std::lock_guard lock(mutex_);
    auto it = plans_.find(plan_id);
    if (it == plans_.end()) return std::nullopt;
    return it->second.progress;
}

std::vector<PlanProgress> StatusTracker::drain_plan_updates() {
    std::lock_guard lock(mutex_);
    std::vector<PlanProgress> updates;
    updates.reserve(changed_plans_.size());
    for (const auto& plan_id : changed_plans_) {
        if (auto it = plans_.find(plan_id); it != plans_.end()) {
            updates.push_back(it->second.progress);
        }
    }
    changed_plans_.clear();
    changed_index_.clear();
    return updates;
}

std::vector<JobTransition> StatusTracker::history(const JobId& job_id) const {
    std::lock_guard lock(mutex_);
    auto it = jobs_.find(job_id);
    if (it == jobs_.end()) return {};
    return it->second.history;
}

std::optional<JobState> StatusTracker::state(const JobId& job_id) const {
    std::lock_guard lock(mutex_);
    auto it = jobs_.find(job_id);
    if (it == jobs_.end()) return std::nullopt;
    return it->second.state;
}

TrackerMetrics StatusTracker::metrics() const {
    std::lock_guard lock(mutex_);
    return TrackerMetrics{
        .active_tests = active_,
        .queued_tests = queued_,
        .completed_tests = completed_,
        .failed_tests = failed_,
        .timed_out_tests = timed_out_,
        .cancelled_tests = cancelled_,
        .average_execution_time = timed_runs_ > 0
            ? Duration{total_execution_.count() / static_cast<int64_t>(timed_runs_)}
            : Duration{0},
    };
}

size_t StatusTracker::prune(Duration age) {
    auto cutoff = std::chrono::steady_clock::now() - age;
    std::lock_guard lock(mutex_);
    size_t removed = 0;
    for (auto it = jobs_.begin(); it != jobs_.end();) {
        if (is_terminal(it->second.state) && it->second.finished < cutoff) {
            it = jobs_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    for (auto it = plans_.begin(); it != plans_.end();) {
        auto status = it->second.progress.status;
        bool done = status == PlanStatus::Completed || status == PlanStatus::Failed;
        if (done && it->second.finished < cutoff && changed_index_.count(it->first) == 0) {
            it = plans_.erase(it);
        } else {
            ++it;
        }
    }
    return removed;
}

ComponentHealth StatusTracker::health() const {
    std::lock_guard lock(mutex_);
    return ComponentHealth{
        .name = "status_tracker",
        .status = HealthStatus::Healthy,
        .detail = std::to_string(jobs_.size()) + " jobs, " + std::to_string(plans_.size()) + " plans tracked",
    };
}

}  // namespace kernel_orchestrator
