/**
 * @file dispatcher.cpp
 * @brief Dispatcher implementation.
 */

#include "scheduler/dispatcher.hpp"

#include <algorithm>
#include <exception>

namespace kernel_orchestrator {

namespace {

constexpr std::string_view COMPONENT = "dispatcher";

}  // anonymous namespace

Dispatcher::Dispatcher(const Config& config,
                       EnvironmentRegistry& registry,
                       ResourceMatcher& matcher,
                       TimeoutManager& timeouts,
                       std::shared_ptr<IRunner> runner,
                       Logger& logger)
    : config_(config)
    , registry_(registry)
    , matcher_(matcher)
    , timeouts_(timeouts)
    , runner_(std::move(runner))
    , logger_(logger) {}

Dispatcher::~Dispatcher() {
    stop();
}

void Dispatcher::on_transition(TransitionListener listener) {
    std::lock_guard lock(mutex_);
    listeners_.push_back(std::move(listener));
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

void Dispatcher::start() {
    if (running_.exchange(true)) return;

    {
        std::lock_guard lock(mutex_);
        pool_ = std::make_unique<ThreadPool>(config_.service.max_concurrent_tests, "executor");
        unit_guard_ = std::make_shared<UnitGuard>();
    }
    admission_thread_ = std::jthread([this](std::stop_token stop) {
        admission_loop(stop);
    });

    logger_.info(COMPONENT, "Started with " + std::to_string(config_.service.max_concurrent_tests)
                 + " execution units, runner '" + std::string{runner_->name()} + "'");
    wake();
}

ShutdownSnapshot Dispatcher::stop() {
    if (!running_.exchange(false)) return {};

    if (admission_thread_.joinable()) {
        admission_thread_.request_stop();
        wake_cv_.notify_all();
        admission_thread_.join();
    }

    ShutdownSnapshot snapshot;
    size_t cancelled_pending = 0;
    size_t forced = 0;
    {
        std::unique_lock lock(mutex_);
        snapshot.unfinished = unfinished_locked();
        snapshot.stats = stats_;

        for (const auto& id : queue_.ordered()) {
            auto it = jobs_.find(id);
            if (it == jobs_.end()) continue;
            auto result = make_result(it->second, JobState::Cancelled);
            result.failure_detail = "service stopped before the job started";
            if (it->second.state != JobState::Pending) continue;
            if (finalize_locked(it->second, JobState::Cancelled, std::move(result))) ++cancelled_pending;
        }

        for (auto& [id, entry] : running_jobs_) {
            if (entry.reason == StopReason::None) entry.reason = StopReason::Shutdown;
            entry.stop_source.request_stop();
        }

        finished_cv_.wait_for(lock, Duration{config_.timeout.termination_grace_ms},
                              [this] { return running_jobs_.empty(); });

        std::vector<JobId> stuck;
        for (const auto& [id, entry] : running_jobs_) stuck.push_back(id);
        for (const auto& id : stuck) {
            force_finalize_locked(jobs_.at(id), JobState::Cancelled,
                                  "runner did not stop before shutdown");
            ++forced;
        }
    }

    std::unique_ptr<ThreadPool> pool;
    std::shared_ptr<UnitGuard> guard;
    {
        std::lock_guard lock(mutex_);
        pool = std::move(pool_);
        guard = std::move(unit_guard_);
    }

    // Every job is terminal now; busy workers are abandoned units
    size_t detached = 0;
    if (pool) detached = pool->shutdown(Duration{config_.timeout.termination_grace_ms});
    if (guard) {
        std::unique_lock lock(guard->mutex);
        guard->alive = false;
    }
    {
        std::lock_guard lock(mutex_);
        abandoned_.clear();
    }

    if (detached > 0) {
        logger_.warn(COMPONENT, "Detached " + std::to_string(detached)
                     + " execution units still inside the runner");
    }
    logger_.info(COMPONENT, "Stopped: " + std::to_string(cancelled_pending) + " pending cancelled, "
                 + std::to_string(forced) + " running force-cancelled");
    return snapshot;
}

// ─────────────────────────────────────────────
// Submission & Queries
// ─────────────────────────────────────────────

Result<JobId> Dispatcher::submit(JobRequest request) {
    if (request.test_case.script.empty()) {
        return Error{ErrorCode::InvalidArgument, "Test case script must not be empty"};
    }
    if (!(request.impact_score >= 0.0)) {
        return Error{ErrorCode::InvalidArgument, "Impact score must be a non-negative number"};
    }

    std::lock_guard lock(mutex_);

    JobId id = request.job_id ? *request.job_id : generate_job_id();
    if (jobs_.count(id) > 0) {
        return Error{ErrorCode::AlreadyExists, "Job already exists: " + id};
    }

    std::vector<JobId> waiting_on;
    std::optional<std::pair<JobId, JobState>> broken;
    for (const auto& dep : request.dependencies) {
        auto d = jobs_.find(dep);
        if (d == jobs_.end()) {
            return Error{ErrorCode::NotFound, "Unknown dependency: " + dep};
        }
        if (d->second.state == JobState::Completed) continue;
        if (is_terminal(d->second.state)) {
            if (!broken) broken.emplace(dep, d->second.state);
            continue;
        }
        if (std::find(waiting_on.begin(), waiting_on.end(), dep) == waiting_on.end()) {
            waiting_on.push_back(dep);
        }
    }

    Job job;
    job.id = id;
    job.test_case = std::move(request.test_case);
    job.priority = request.priority;
    job.impact_score = std::min(request.impact_score, 1.0);
    job.sequence = next_sequence_++;
    job.plan_id = std::move(request.plan_id);
    job.waiting_on = std::move(waiting_on);
    job.state = JobState::Pending;
    job.submitted_at = std::chrono::system_clock::now();

    queue_.push(job.id, job.priority, job.sequence);
    ++stats_.submitted;

    JobTransition transition{
        .job_id = job.id,
        .test_case_id = job.test_case.id,
        .plan_id = job.plan_id,
        .from = std::nullopt,
        .to = JobState::Pending,
        .at = job.submitted_at,
        .environment_id = std::nullopt,
        .execution_time = Duration{0},
        .detail = "priority " + std::string{to_string(job.priority)}
    };
    jobs_.emplace(id, std::move(job));
    emit_locked(transition);

    logger_.debug(COMPONENT, "Queued job " + id + " (" + transition.detail + ")");

    if (broken) {
        JobState state = broken->second == JobState::Cancelled ? JobState::Cancelled : JobState::Failed;
        auto& queued = jobs_.at(id);
        auto result = make_result(queued, state);
        result.failure_detail = "dependency " + broken->first + " ended "
                              + std::string{to_string(broken->second)};
        finalize_locked(queued, state, std::move(result));
        return id;
    }

    if (running_.load()) {
        tick_locked();
    }
    track_peaks_locked();
    return id;
}

Result<JobStatus> Dispatcher::status(const JobId& job_id) const {
    std::lock_guard lock(mutex_);
    auto it = jobs_.find(job_id);
    if (it == jobs_.end()) {
        return Error{ErrorCode::NotFound, "Unknown job: " + job_id};
    }
    return to_status(it->second);
}

QueueSnapshot Dispatcher::queue_snapshot() const {
    std::lock_guard lock(mutex_);
    QueueSnapshot snapshot;
    snapshot.running_jobs = running_jobs_.size();
    snapshot.pending_jobs = queue_.size();
    registry_.visit([&](const EnvironmentRecord& record) {
        ++snapshot.total_environments;
        if (record.state == AllocationState::Allocated) {
            ++snapshot.allocated_environments;
        } else {
            ++snapshot.available_environments;
        }
    });
    return snapshot;
}

std::vector<JobStatus> Dispatcher::take_unplaceable() {
    std::lock_guard lock(mutex_);
    std::vector<JobStatus> found;
    std::unordered_set<JobId> still_pending;
    for (const auto& id : queue_.ordered()) {
        auto it = jobs_.find(id);
        if (it == jobs_.end()) continue;
        if (matcher_.any_compatible(it->second.test_case)) continue;
        still_pending.insert(id);
        if (unplaceable_reported_.count(id) == 0) {
            found.push_back(to_status(it->second));
            logger_.warn(COMPONENT, "Job " + id + " (" + it->second.test_case.id
                         + ") has no compatible environment and stays pending");
        }
    }
    unplaceable_reported_ = std::move(still_pending);
    return found;
}

bool Dispatcher::placeable(const JobId& job_id) const {
    std::lock_guard lock(mutex_);
    auto it = jobs_.find(job_id);
    if (it == jobs_.end() || it->second.state != JobState::Pending) return true;
    return matcher_.any_compatible(it->second.test_case);
}

std::vector<JobRequest> Dispatcher::unfinished_jobs() const {
    std::lock_guard lock(mutex_);
    return unfinished_locked();
}

std::vector<JobRequest> Dispatcher::unfinished_locked() const {
    std::vector<const Job*> open;
    for (const auto& [id, job] : jobs_) {
        if (!is_terminal(job.state)) open.push_back(&job);
    }
    std::sort(open.begin(), open.end(),
              [](const Job* a, const Job* b) { return a->sequence < b->sequence; });

    std::vector<JobRequest> requests;
    requests.reserve(open.size());
    for (const auto* job : open) {
        requests.push_back(JobRequest{
            .test_case = job->test_case,
            .priority = job->priority,
            .impact_score = job->impact_score,
            .plan_id = job->plan_id,
            .job_id = job->id,
            .dependencies = job->waiting_on
        });
    }
    return requests;
}

bool Dispatcher::wait_until_idle(Duration timeout) {
    std::unique_lock lock(mutex_);
    return finished_cv_.wait_for(lock, timeout, [this] {
        return queue_.empty() && running_jobs_.empty();
    });
}

// ─────────────────────────────────────────────
// Cancellation & Escalation
// ─────────────────────────────────────────────

Result<void> Dispatcher::cancel(const JobId& job_id) {
    std::unique_lock lock(mutex_);
    auto it = jobs_.find(job_id);
    if (it == jobs_.end()) {
        return Error{ErrorCode::NotFound, "Unknown job: " + job_id};
    }
    if (is_terminal(it->second.state)) {
        return Error{ErrorCode::InvalidArgument,
                     "Job " + job_id + " is already " + std::string{to_string(it->second.state)}};
    }

    if (it->second.state == JobState::Pending) {
        auto result = make_result(it->second, JobState::Cancelled);
        result.failure_detail = "cancelled before start";
        finalize_locked(it->second, JobState::Cancelled, std::move(result));
        logger_.info(COMPONENT, "Cancelled pending job " + job_id);
        return {};
    }

    request_stop_locked(job_id, StopReason::Cancelled);
    finished_cv_.wait_for(lock, Duration{config_.timeout.termination_grace_ms}, [&] {
        auto j = jobs_.find(job_id);
        return j == jobs_.end() || j->second.state != JobState::Running;
    });

    auto j = jobs_.find(job_id);
    if (j != jobs_.end() && j->second.state == JobState::Running) {
        force_finalize_locked(j->second, JobState::Cancelled,
                              "runner did not stop within termination grace");
    }
    logger_.info(COMPONENT, "Cancelled running job " + job_id);
    return {};
}

size_t Dispatcher::escalate_subsystem(const std::string& subsystem, Priority priority) {
    size_t moved = 0;
    {
        std::lock_guard lock(mutex_);
        for (const auto& id : queue_.ordered()) {
            auto& job = jobs_.at(id);
            if (job.test_case.target_subsystem != subsystem || job.priority >= priority) continue;
            queue_.reprioritize(id, priority);
            job.priority = priority;
            ++moved;
        }
    }

    if (moved > 0) {
        logger_.info(COMPONENT, "Escalated " + std::to_string(moved) + " pending jobs for subsystem '"
                     + subsystem + "' to " + std::string{to_string(priority)});
        wake();
    }
    return moved;
}

size_t Dispatcher::prune_finished(Duration age) {
    std::lock_guard lock(mutex_);
    auto cutoff = std::chrono::steady_clock::now() - age;
    size_t pruned = 0;
    for (auto it = jobs_.begin(); it != jobs_.end();) {
        if (is_terminal(it->second.state) && it->second.finished_at <= cutoff) {
            it = jobs_.erase(it);
            ++pruned;
        } else {
            ++it;
        }
    }
    return pruned;
}

// ─────────────────────────────────────────────
// Collaborator Hooks
// ─────────────────────────────────────────────

void Dispatcher::handle_timeout(const JobId& job_id, TimeoutStage stage) {
    if (stage == TimeoutStage::Warning) return;

    std::lock_guard lock(mutex_);
    auto it = jobs_.find(job_id);
    if (it == jobs_.end() || it->second.state != JobState::Running) return;

    if (stage == TimeoutStage::Expired) {
        request_stop_locked(job_id, StopReason::Timeout);
        return;
    }

    auto rit = running_jobs_.find(job_id);
    StopReason reason = (rit == running_jobs_.end() || rit->second.reason == StopReason::None)
        ? StopReason::Timeout : rit->second.reason;
    force_finalize_locked(it->second, state_for(reason), "runner did not stop within termination grace");
}

Result<std::optional<JobId>> Dispatcher::handle_environment_loss(const EnvironmentId& env_id,
                                                                 const std::string& reason) {
    std::lock_guard lock(mutex_);
    auto evicted = registry_.evict(env_id);
    if (!evicted) return evicted.error();

    std::optional<JobId> holder = *evicted;
    if (holder) {
        auto it = jobs_.find(*holder);
        auto rit = running_jobs_.find(*holder);
        if (it != jobs_.end() && it->second.state == JobState::Running && rit != running_jobs_.end()) {
            JobState state = rit->second.reason == StopReason::Timeout ? JobState::Timeout : JobState::Failed;
            if (rit->second.reason == StopReason::None) rit->second.reason = StopReason::EnvironmentLost;
            force_finalize_locked(it->second, state, "environment " + env_id + " lost: " + reason);
        }
    }

    logger_.warn(COMPONENT, "Environment " + env_id + " lost (" + reason + ")"
                 + (holder ? ", job " + *holder + " resolved" : std::string{}));
    return holder;
}

Result<void> Dispatcher::reclaim_environment(const EnvironmentId& env_id) {
    {
        std::lock_guard lock(mutex_);
        auto holder = registry_.holder(env_id);
        if (!holder) return {};

        auto it = jobs_.find(*holder);
        if (it != jobs_.end() && it->second.state == JobState::Running
            && it->second.environment == env_id) {
            return {};
        }

        auto released = registry_.release(env_id, *holder);
        if (!released) return released.error();
        logger_.warn(COMPONENT, "Reclaimed environment " + env_id + " from finished job " + *holder);
    }
    wake();
    return {};
}

// ─────────────────────────────────────────────
// Admission
// ─────────────────────────────────────────────

void Dispatcher::wake() {
    {
        std::lock_guard lock(wake_mutex_);
        wake_pending_ = true;
    }
    wake_cv_.notify_one();
}

void Dispatcher::admission_loop(std::stop_token stop) {
    const Duration poll_interval{config_.service.poll_interval_ms};
    while (!stop.stop_requested()) {
        {
            std::unique_lock lock(wake_mutex_);
            wake_cv_.wait_for(lock, stop, poll_interval, [this] { return wake_pending_; });
            wake_pending_ = false;
        }
        if (stop.stop_requested()) break;

        try {
            tick();
        } catch (const std::exception& e) {
            {
                std::lock_guard lock(mutex_);
                ++loop_errors_;
            }
            logger_.error(COMPONENT, std::string{"Admission pass failed: "} + e.what());
        }
    }
}

void Dispatcher::tick() {
    std::lock_guard lock(mutex_);
    if (!running_.load()) return;
    tick_locked();
}

void Dispatcher::tick_locked() {
    if (queue_.empty()) return;

    const size_t max_running = config_.service.max_concurrent_tests;
    for (const auto& id : queue_.ordered()) {
        if (running_jobs_.size() >= max_running) break;
        if (registry_.available_count() == 0) break;

        auto it = jobs_.find(id);
        if (it == jobs_.end()) {
            queue_.erase(id);
            continue;
        }
        if (!it->second.waiting_on.empty()) continue;

        // No compatible idle environment: the job stays pending
        auto environment = matcher_.allocate(id, it->second.test_case);
        if (!environment) continue;

        admit_locked(it->second, std::move(*environment));
    }
    track_peaks_locked();
}

void Dispatcher::admit_locked(Job& job, Environment environment) {
    queue_.erase(job.id);

    job.state = JobState::Running;
    job.environment = environment.id;
    job.started_at = std::chrono::system_clock::now();

    auto [rit, inserted] = running_jobs_.insert_or_assign(job.id, RunningEntry{
        .environment = environment,
        .stop_source = std::stop_source{},
        .started = std::chrono::steady_clock::now(),
        .reason = StopReason::None
    });
    ++stats_.admitted;

    auto timeout = compute_timeout(job.test_case, config_.timeout);
    timeouts_.watch(job.id, timeout);

    emit_locked(JobTransition{
        .job_id = job.id,
        .test_case_id = job.test_case.id,
        .plan_id = job.plan_id,
        .from = JobState::Pending,
        .to = JobState::Running,
        .at = *job.started_at,
        .environment_id = environment.id,
        .execution_time = Duration{0},
        .detail = "timeout " + std::to_string(timeout.count()) + "ms"
    });
    logger_.debug(COMPONENT, "Admitted job " + job.id + " on " + environment.id
                  + " (timeout " + std::to_string(timeout.count()) + "ms)");

    bool posted = pool_ && unit_guard_ && pool_->post(
        [this, guard = unit_guard_, runner = runner_, id = job.id, test = job.test_case,
         env = std::move(environment), token = rit->second.stop_source.get_token()](std::stop_token) {
            auto unit = run_unit(*runner, test, env, token);
            std::shared_lock alive(guard->mutex);
            if (!guard->alive) return;
            complete_unit(id, env, std::move(unit));
        });

    if (!posted) {
        auto result = make_result(job, JobState::Failed);
        result.failure_detail = "executor unavailable";
        finalize_locked(job, JobState::Failed, std::move(result));
    }
}

Dispatcher::UnitOutcome Dispatcher::run_unit(IRunner& runner, const TestCase& test,
                                             const Environment& environment, std::stop_token stop) {
    auto started = std::chrono::steady_clock::now();
    UnitOutcome unit;
    try {
        unit.outcome = runner.execute(test, environment, stop);
    } catch (const std::exception& e) {
        unit.crash = e.what();
    }
    unit.elapsed = std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - started);
    return unit;
}

void Dispatcher::complete_unit(const JobId& job_id, const Environment& environment, UnitOutcome unit) {
    auto& outcome = unit.outcome;
    {
        std::lock_guard lock(mutex_);

        bool was_abandoned = abandoned_.erase(job_id) > 0;
        if (was_abandoned && pool_ && running_.load()) pool_->shrink(1);

        auto it = jobs_.find(job_id);
        auto rit = running_jobs_.find(job_id);
        if (was_abandoned || it == jobs_.end()
            || it->second.state != JobState::Running || rit == running_jobs_.end()) {
            ++stats_.late_results_discarded;
            logger_.debug(COMPONENT, "Discarded late result for job " + job_id);
        } else {
            Job& job = it->second;
            JobResult result = make_result(job, JobState::Completed);
            result.execution_time = unit.elapsed;

            JobState state;
            if (unit.crash) {
                state = JobState::Failed;
                result.failure_detail = "runner exception: " + *unit.crash;
            } else if (!outcome) {
                state = JobState::Failed;
                result.failure_detail = outcome.error().message;
            } else {
                result.stdout_text = std::move(outcome->stdout_text);
                result.stderr_text = std::move(outcome->stderr_text);
                result.exit_code = outcome->exit_code;
                if (outcome->exit_code == 0) {
                    state = JobState::Completed;
                } else {
                    state = JobState::Failed;
                    result.failure_detail = "exit code " + std::to_string(outcome->exit_code);
                }
            }

            switch (rit->second.reason) {
                case StopReason::None:
                    break;
                case StopReason::Timeout:
                    state = JobState::Timeout;
                    result.failure_detail = "exceeded timeout of "
                        + std::to_string(compute_timeout(job.test_case, config_.timeout).count()) + "ms";
                    break;
                case StopReason::Cancelled:
                    state = JobState::Cancelled;
                    result.failure_detail = "cancelled while running";
                    break;
                case StopReason::EnvironmentLost:
                    state = JobState::Failed;
                    result.failure_detail = "environment " + environment.id + " lost";
                    break;
                case StopReason::Shutdown:
                    state = JobState::Cancelled;
                    result.failure_detail = "service stopped";
                    break;
            }

            finalize_locked(job, state, std::move(result));
        }
    }
    wake();
}

// ─────────────────────────────────────────────
// State Transitions
// ─────────────────────────────────────────────

bool Dispatcher::finalize_locked(Job& job, JobState state, JobResult result) {
    if (is_terminal(job.state)) return false;

    const JobState from = job.state;
    const std::optional<EnvironmentId> environment = job.environment;

    if (from == JobState::Running) {
        if (environment) {
            auto released = registry_.release(*environment, job.id);
            // NotFound after eviction is expected
            if (!released && released.error().code != ErrorCode::NotFound) {
                logger_.warn(COMPONENT, "Release of " + *environment + " for job " + job.id
                             + " failed: " + released.error().message);
            }
        }
        timeouts_.unwatch(job.id);
        running_jobs_.erase(job.id);
    } else {
        queue_.erase(job.id);
    }

    result.job_id = job.id;
    result.state = state;
    result.environment_id = environment.value_or(EnvironmentId{});
    result.completed_at = std::chrono::system_clock::now();

    job.state = state;
    job.environment.reset();
    job.finished_at = std::chrono::steady_clock::now();
    job.result = result;

    switch (state) {
        case JobState::Completed: ++stats_.completed; break;
        case JobState::Failed:    ++stats_.failed; break;
        case JobState::Timeout:   ++stats_.timed_out; break;
        case JobState::Cancelled: ++stats_.cancelled; break;
        default: break;
    }

    emit_locked(JobTransition{
        .job_id = job.id,
        .test_case_id = job.test_case.id,
        .plan_id = job.plan_id,
        .from = from,
        .to = state,
        .at = result.completed_at,
        .environment_id = environment,
        .execution_time = result.execution_time,
        .detail = result.failure_detail.value_or(std::string{})
    });

    if (state == JobState::Completed) {
        logger_.debug(COMPONENT, "Job " + job.id + " completed in "
                      + std::to_string(result.execution_time.count()) + "ms");
    } else {
        logger_.info(COMPONENT, "Job " + job.id + " " + std::string{to_string(state)}
                     + (result.failure_detail ? ": " + *result.failure_detail : std::string{}));
    }

    resolve_dependents_locked(job.id, state);

    finished_cv_.notify_all();
    return true;
}

void Dispatcher::resolve_dependents_locked(const JobId& job_id, JobState state) {
    for (const auto& id : queue_.ordered()) {
        auto it = jobs_.find(id);
        if (it == jobs_.end() || it->second.state != JobState::Pending) continue;

        auto& waiting = it->second.waiting_on;
        auto w = std::find(waiting.begin(), waiting.end(), job_id);
        if (w == waiting.end()) continue;

        if (state == JobState::Completed) {
            waiting.erase(w);
            continue;
        }

        JobState outcome = state == JobState::Cancelled ? JobState::Cancelled : JobState::Failed;
        auto result = make_result(it->second, outcome);
        result.failure_detail = "dependency " + job_id + " ended " + std::string{to_string(state)};
        finalize_locked(it->second, outcome, std::move(result));
    }
}

void Dispatcher::force_finalize_locked(Job& job, JobState state, std::string detail) {
    auto rit = running_jobs_.find(job.id);
    if (rit == running_jobs_.end()) return;

    rit->second.stop_source.request_stop();
    auto elapsed = std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - rit->second.started);
    abandoned_.insert(job.id);
    if (pool_ && running_.load()) pool_->grow(1);

    auto result = make_result(job, state);
    result.execution_time = elapsed;
    result.failure_detail = std::move(detail);
    finalize_locked(job, state, std::move(result));

    logger_.warn(COMPONENT, "Abandoned execution unit of job " + job.id);
}

void Dispatcher::request_stop_locked(const JobId& job_id, StopReason reason) {
    auto rit = running_jobs_.find(job_id);
    if (rit == running_jobs_.end()) return;
    if (rit->second.reason == StopReason::None) rit->second.reason = reason;
    rit->second.stop_source.request_stop();
}

void Dispatcher::emit_locked(const JobTransition& transition) {
    for (const auto& listener : listeners_) {
        try {
            listener(transition);
        } catch (const std::exception& e) {
            ++listener_errors_;
            logger_.error(COMPONENT, "Transition listener failed for job " + transition.job_id
                          + ": " + e.what());
        }
    }
}

void Dispatcher::track_peaks_locked() {
    stats_.peak_running = std::max(stats_.peak_running, running_jobs_.size());
    stats_.peak_pending = std::max(stats_.peak_pending, queue_.size());
}

JobState Dispatcher::state_for(StopReason reason) const noexcept {
    switch (reason) {
        case StopReason::Timeout:         return JobState::Timeout;
        case StopReason::Cancelled:       return JobState::Cancelled;
        case StopReason::Shutdown:        return JobState::Cancelled;
        case StopReason::EnvironmentLost: return JobState::Failed;
        case StopReason::None:            break;
    }
    return JobState::Failed;
}

JobResult Dispatcher::make_result(const Job& job, JobState state) const {
    JobResult result;
    result.job_id = job.id;
    result.state = state;
    result.environment_id = job.environment.value_or(EnvironmentId{});
    return result;
}

// ─────────────────────────────────────────────
// Introspection
// ─────────────────────────────────────────────

DispatcherStats Dispatcher::stats() const {
    std::lock_guard lock(mutex_);
    return stats_;
}

ComponentHealth Dispatcher::health() const {
    ComponentHealth h{.name = "dispatcher"};
    if (!running_.load()) {
        h.status = HealthStatus::Stopped;
        h.detail = "not running";
        return h;
    }

    std::lock_guard lock(mutex_);
    h.detail = std::to_string(running_jobs_.size()) + " running, "
             + std::to_string(queue_.size()) + " pending";
    if (!abandoned_.empty()) {
        h.status = HealthStatus::Degraded;
        h.detail += ", " + std::to_string(abandoned_.size()) + " hung runner units";
    }
    if (loop_errors_ > 0 || listener_errors_ > 0) {
        h.status = HealthStatus::Degraded;
        h.detail += ", " + std::to_string(loop_errors_ + listener_errors_) + " internal errors";
    }
    return h;
}

}  // namespace kernel_orchestrator
