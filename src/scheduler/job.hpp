/**
 * @file job.hpp
 * @brief Job record, submission request and state-transition event.
 */

#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace kernel_orchestrator {

/**
 * @brief What a caller hands to the dispatcher.
 */
struct JobRequest {
    TestCase test_case;
    Priority priority{Priority::Medium};
    double impact_score{0.0};          ///< Reported only; never an ordering key
    std::optional<PlanId> plan_id;
    std::optional<JobId> job_id;       ///< Reuse an id when restoring state; generated otherwise
    std::vector<JobId> dependencies;   ///< Jobs that must complete before this one is admitted
};

/**
 * @brief Dispatcher-owned job record.
 *
 * `environment` is set exactly while state == Running.
 */
struct Job {
    JobId id;
    TestCase test_case;
    Priority priority{Priority::Medium};
    double impact_score{0.0};
    uint64_t sequence{0};              ///< FIFO key within a priority tier
    std::optional<PlanId> plan_id;
    std::vector<JobId> waiting_on;     ///< Dependencies not yet completed

    JobState state{JobState::Pending};
    Timestamp submitted_at;
    std::optional<Timestamp> started_at;
    std::optional<EnvironmentId> environment;
    std::optional<JobResult> result;
    SteadyTime finished_at;            ///< Retention clock, valid once terminal
};

/**
 * @brief Read-only view returned by status lookups.
 */
struct JobStatus {
    JobId job_id;
    TestCaseId test_case_id;
    JobState state{JobState::Pending};
    Priority priority{Priority::Medium};
    double impact_score{0.0};
    std::optional<PlanId> plan_id;
    std::optional<EnvironmentId> environment;
    Timestamp submitted_at;
    std::optional<Timestamp> started_at;
    std::optional<JobResult> result;
    std::vector<JobId> waiting_on;
};

[[nodiscard]] JobStatus to_status(const Job& job);

/**
 * @brief Emitted on every state change, in the order the changes happen.
 */
struct JobTransition {
    JobId job_id;
    TestCaseId test_case_id;
    std::optional<PlanId> plan_id;
    std::optional<JobState> from;      ///< Unset on submission
    JobState to{JobState::Pending};
    Timestamp at;
    std::optional<EnvironmentId> environment_id;
    Duration execution_time{0};
    std::string detail;
};

/**
 * @brief Random 128-bit identifier formatted as 8-4-4-4-12 hex.
 */
[[nodiscard]] JobId generate_job_id();

}  // namespace kernel_orchestrator
