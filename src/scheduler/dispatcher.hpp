/**
 * @file dispatcher.hpp
 * @brief Priority dispatcher: owns every job until it is terminal and admits
 *        pending jobs onto compatible environments up to the concurrency bound.
 *
 * Threads:
 *   admission loop   one std::jthread; ticks on wake() or every poll interval
 *   execution units  one ThreadPool task per admitted job, calling the runner
 *
 * Only running jobs count against max_concurrent_tests. A unit whose job
 * was resolved without it (hung runner, lost environment) is abandoned:
 * the pool gets a replacement worker, and on stop() the unit is detached
 * rather than joined. Units reach the dispatcher through a UnitGuard, so
 * a detached unit that returns after the dispatcher is gone does nothing.
 *
 * All job state lives behind mutex_. Lock order is dispatcher → registry /
 * timeout manager / listeners; none of those call back into the dispatcher
 * while holding their own lock. Transition listeners run under mutex_ and
 * must not call back into the dispatcher.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "environment/environment_registry.hpp"
#include "environment/resource_matcher.hpp"
#include "executor/runner.hpp"
#include "executor/thread_pool.hpp"
#include "scheduler/job.hpp"
#include "scheduler/job_queue.hpp"
#include "timeout/timeout_manager.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stop_token>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace kernel_orchestrator {

using TransitionListener = std::function<void(const JobTransition&)>;

struct DispatcherStats {
    uint64_t submitted{0};
    uint64_t admitted{0};
    uint64_t completed{0};
    uint64_t failed{0};
    uint64_t timed_out{0};
    uint64_t cancelled{0};
    size_t peak_running{0};
    size_t peak_pending{0};
    uint64_t late_results_discarded{0};
};

/**
 * @brief Taken by stop() once admission has ended, before anything is
 *        cancelled: every job still open at that moment, and the counters.
 */
struct ShutdownSnapshot {
    std::vector<JobRequest> unfinished;
    DispatcherStats stats;
};

class Dispatcher {
public:
    Dispatcher(const Config& config,
               EnvironmentRegistry& registry,
               ResourceMatcher& matcher,
               TimeoutManager& timeouts,
               std::shared_ptr<IRunner> runner,
               Logger& logger);
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    void on_transition(TransitionListener listener);

    // ── Lifecycle ────────────────────────────

    /// Start the execution pool and the admission loop. Idempotent.
    void start();

    /**
     * @brief Cancel pending jobs, stop running ones and release the pool.
     *        Idempotent; later calls return an empty snapshot.
     *
     * Running jobs get termination_grace to return; any still running after
     * that are resolved CANCELLED and their units abandoned. Abandoned units
     * get one more termination_grace and are then detached, so stop()
     * returns even while a runner ignores its stop request.
     */
    ShutdownSnapshot stop();

    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

    // ── Jobs ─────────────────────────────────

    /**
     * @brief Enqueue a job as PENDING. Returns immediately.
     *
     * Dependencies must name known jobs. The job is not admitted until all
     * of them are COMPLETED; if one ends otherwise, the job is resolved
     * CANCELLED (dependency cancelled) or FAILED (any other outcome).
     */
    Result<JobId> submit(JobRequest request);

    [[nodiscard]] Result<JobStatus> status(const JobId& job_id) const;
    [[nodiscard]] QueueSnapshot queue_snapshot() const;

    /// Pending or running → CANCELLED, releasing the environment exactly once.
    Result<void> cancel(const JobId& job_id);

    /**
     * @brief Raise pending jobs that target @p subsystem to @p priority.
     *        Jobs already at or above it are left alone.
     * @return Number of jobs moved.
     */
    size_t escalate_subsystem(const std::string& subsystem, Priority priority);

    /// Drop terminal jobs finished more than @p age ago.
    size_t prune_finished(Duration age);

    /// Pending and running jobs in submission order, for state persistence.
    [[nodiscard]] std::vector<JobRequest> unfinished_jobs() const;

    /// Block until nothing is pending or running, or @p timeout elapses.
    bool wait_until_idle(Duration timeout);

    /**
     * @brief Pending jobs that no registered environment, idle or busy, can
     *        run. Each job is returned once while it stays pending.
     */
    std::vector<JobStatus> take_unplaceable();

    /// False while @p job_id is pending with no compatible environment registered.
    [[nodiscard]] bool placeable(const JobId& job_id) const;

    // ── Collaborator hooks ───────────────────

    /// Timeout manager callback.
    void handle_timeout(const JobId& job_id, TimeoutStage stage);

    /**
     * @brief The environment is gone. Evict it; a job running on it is
     *        resolved FAILED at once and its runner asked to stop.
     * @return The affected job, if any.
     */
    Result<std::optional<JobId>> handle_environment_loss(const EnvironmentId& env_id,
                                                         const std::string& reason);

    /**
     * @brief Release an allocation whose holder is no longer running.
     *        No-op when the environment is idle, gone, or legitimately held.
     */
    Result<void> reclaim_environment(const EnvironmentId& env_id);

    /// One admission pass. Called by the loop; public for deterministic tests.
    void tick();

    /// Schedule an admission pass now instead of at the next poll.
    void wake();

    [[nodiscard]] DispatcherStats stats() const;
    [[nodiscard]] ComponentHealth health() const;

private:
    enum class StopReason : uint8_t {
        None,
        Timeout,
        Cancelled,
        EnvironmentLost,
        Shutdown
    };

    struct RunningEntry {
        Environment environment;
        std::stop_source stop_source;
        SteadyTime started;
        StopReason reason{StopReason::None};
    };

    /// Liveness of the dispatcher as seen from execution units.
    struct UnitGuard {
        std::shared_mutex mutex;
        bool alive{true};
    };

    struct UnitOutcome {
        Result<RunOutcome> outcome{Error{ErrorCode::Internal, "runner returned no outcome"}};
        std::optional<std::string> crash;
        Duration elapsed{0};
    };

    void admission_loop(std::stop_token stop);
    void tick_locked();
    void admit_locked(Job& job, Environment environment);

    /// Runs on a pool worker without touching the dispatcher.
    static UnitOutcome run_unit(IRunner& runner, const TestCase& test, const Environment& environment,
                                std::stop_token stop);
    void complete_unit(const JobId& job_id, const Environment& environment, UnitOutcome unit);

    /**
     * @brief Move a PENDING or RUNNING job to @p state. Releases the
     *        environment and the timeout watch. Exactly-once: returns false
     *        if the job is already terminal.
     */
    bool finalize_locked(Job& job, JobState state, JobResult result);

    /// Resolve a running job without waiting for its runner; the unit is abandoned.
    void force_finalize_locked(Job& job, JobState state, std::string detail);

    /// Unblock or resolve pending jobs waiting on @p job_id, now in @p state.
    void resolve_dependents_locked(const JobId& job_id, JobState state);

    [[nodiscard]] std::vector<JobRequest> unfinished_locked() const;

    void request_stop_locked(const JobId& job_id, StopReason reason);
    void emit_locked(const JobTransition& transition);
    void track_peaks_locked();

    [[nodiscard]] JobState state_for(StopReason reason) const noexcept;
    [[nodiscard]] JobResult make_result(const Job& job, JobState state) const;

    Config config_;
    EnvironmentRegistry& registry_;
    ResourceMatcher& matcher_;
    TimeoutManager& timeouts_;
    std::shared_ptr<IRunner> runner_;
    Logger& logger_;

    mutable std::mutex mutex_;
    std::condition_variable finished_cv_;
    std::unordered_map<JobId, Job> jobs_;
    JobQueue queue_;
    std::unordered_map<JobId, RunningEntry> running_jobs_;
    std::unordered_set<JobId> abandoned_;
    std::unordered_set<JobId> unplaceable_reported_;
    std::vector<TransitionListener> listeners_;
    uint64_t next_sequence_{0};
    DispatcherStats stats_;
    uint64_t loop_errors_{0};
    uint64_t listener_errors_{0};

    std::atomic<bool> running_{false};
    std::unique_ptr<ThreadPool> pool_;
    std::shared_ptr<UnitGuard> unit_guard_;

    std::mutex wake_mutex_;
    std::condition_variable_any wake_cv_;
    bool wake_pending_{false};
    std::jthread admission_thread_;
};

}  // namespace kernel_orchestrator
