/**
 * @file status_tracker.hpp
 * @brief Records every job transition and derives aggregate and per-plan status.
 *
 * Fed by the dispatcher's transition listener, so it observes changes in
 * the order they happen. It keeps its own counters and never queries the
 * dispatcher.
 */

#pragma once

#include "core/types.hpp"
#include "monitor/plan_source.hpp"
#include "scheduler/job.hpp"

#include <mutex>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace kernel_orchestrator {

struct TrackerMetrics {
    size_t active_tests{0};
    size_t queued_tests{0};
    uint64_t completed_tests{0};
    uint64_t failed_tests{0};          ///< Failed and timed-out
    uint64_t timed_out_tests{0};
    uint64_t cancelled_tests{0};
    Duration average_execution_time{0};
};

struct PlanProgress {
    PlanId plan_id;
    size_t total{0};
    size_t completed{0};
    size_t failed{0};
    size_t cancelled{0};
    size_t running{0};
    PlanStatus status{PlanStatus::Queued};

    [[nodiscard]] size_t finished() const noexcept { return completed + failed + cancelled; }
};

class StatusTracker {
public:
    StatusTracker() = default;

    StatusTracker(const StatusTracker&) = delete;
    StatusTracker& operator=(const StatusTracker&) = delete;

    /// Transition listener entry point.
    void record(const JobTransition& transition);

    /// Start tracking a plan expected to produce @p total_jobs jobs. Zero marks it failed.
    void register_plan(const PlanId& plan_id, size_t total_jobs);

    [[nodiscard]] std::optional<PlanProgress> plan(const PlanId& plan_id) const;

    /// Plans whose status changed since the previous call.
    std::vector<PlanProgress> drain_plan_updates();

    [[nodiscard]] std::vector<JobTransition> history(const JobId& job_id) const;
    [[nodiscard]] std::optional<JobState> state(const JobId& job_id) const;
    [[nodiscard]] TrackerMetrics metrics() const;

    /// Forget finished jobs and plans older than @p age.
    size_t prune(Duration age);

    [[nodiscard]] ComponentHealth health() const;

private:
    struct JobEntry {
        JobState state{JobState::Pending};
        std::vector<JobTransition> history;
        SteadyTime finished;
    };

    struct PlanEntry {
        PlanProgress progress;
        bool registered{false};        ///< Otherwise total grows with each submission
        SteadyTime finished;
    };

    void update_plan_locked(const PlanId& plan_id, std::optional<JobState> from, JobState to);
    void refresh_plan_locked(const PlanId& plan_id, PlanEntry& plan);

    mutable std::mutex mutex_;
    std::unordered_map<JobId, JobEntry> jobs_;
    std::unordered_map<PlanId, PlanEntry> plans_;
    std::vector<PlanId> changed_plans_;
    std::unordered_set<PlanId> changed_index_;

    size_t active_{0};
    size_t queued_{0};
    uint64_t completed_{0};
    uint64_t failed_{0};
    uint64_t timed_out_{0};
    uint64_t cancelled_{0};
    Duration total_execution_{0};
    uint64_t timed_runs_{0};
};

}  // namespace kernel_orchestrator
