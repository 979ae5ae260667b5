/**
 * @file queue_monitor.hpp
 * @brief Bridges an external plan source to the dispatcher.
 *
 * Each poll fetches queued plans, skips those already seen, and submits
 * one job per resolvable test in plan order. Plans are taken highest
 * level first (1 before 10), then by creation time. Plan status changes
 * observed by the status tracker are pushed back to the source.
 *
 * A plan id is remembered until its final status has been written to the
 * source and the retention age has passed.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "monitor/plan_source.hpp"
#include "monitor/status_tracker.hpp"
#include "monitor/test_catalog.hpp"
#include "scheduler/job.hpp"

#include <functional>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace kernel_orchestrator {

struct PollReport {
    size_t new_plans{0};
    size_t jobs_submitted{0};
    size_t unresolved_tests{0};
    size_t rejected_plans{0};
};

struct QueueMonitorStats {
    uint64_t polls{0};
    uint64_t poll_errors{0};
    uint64_t plans_detected{0};
    uint64_t jobs_submitted{0};
    uint64_t status_updates{0};
    std::optional<Timestamp> last_poll;
};

class QueueMonitor {
public:
    using SubmitFn = std::function<Result<JobId>(JobRequest)>;

    QueueMonitor(IPlanSource& source,
                 const TestCatalog& catalog,
                 StatusTracker& tracker,
                 SubmitFn submit,
                 Logger& logger);

    /// One poll of the source. Errors from the source are returned, not thrown.
    Result<PollReport> poll();

    /// Push plan status changes to the source. Returns how many were written.
    size_t push_plan_updates();

    /// Forget plans whose final status was written more than @p age ago.
    size_t prune(Duration age);

    [[nodiscard]] bool is_known(const PlanId& plan_id) const;
    [[nodiscard]] QueueMonitorStats stats() const;
    [[nodiscard]] ComponentHealth health() const;

private:
    /// Tests of @p plan in submission order; unresolvable ids are counted.
    std::vector<TestCase> resolve(const ExecutionPlan& plan, size_t& unresolved) const;

    /// Write FAILED to the source for a plan that produced no jobs.
    void mark_failed(const PlanId& plan_id);
    void mark_finished(const PlanId& plan_id);

    IPlanSource& source_;
    const TestCatalog& catalog_;
    StatusTracker& tracker_;
    SubmitFn submit_;
    Logger& logger_;

    mutable std::mutex mutex_;
    std::unordered_map<PlanId, std::optional<SteadyTime>> known_plans_;  ///< Value: final status written
    QueueMonitorStats stats_;
    bool last_poll_failed_{false};
    std::string last_error_;
};

}  // namespace kernel_orchestrator
