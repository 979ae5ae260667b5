/**
 * @file timeout_manager.hpp
 * @brief Per-job deadline tracking with warning, expiry and forced termination stages.
 *
 * A dedicated std::jthread sleeps until the earliest pending due time
 * (capped at the poll interval) and fires the registered callbacks outside
 * its own lock. Each stage fires at most once per watched job:
 *
 *   Warning        at warning_threshold × timeout
 *   Expired        at the deadline; the callback asks the runner to stop
 *   ForceTerminate at deadline + termination_grace, if the job is still watched
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <vector>

namespace kernel_orchestrator {

enum class TimeoutStage : uint8_t {
    Warning,
    Expired,
    ForceTerminate
};

[[nodiscard]] constexpr std::string_view to_string(TimeoutStage stage) noexcept {
    switch (stage) {
        case TimeoutStage::Warning:        return "warning";
        case TimeoutStage::Expired:        return "expired";
        case TimeoutStage::ForceTerminate: return "force_terminate";
    }
    return "unknown";
}

using TimeoutCallback = std::function<void(const JobId&, TimeoutStage)>;

/**
 * @brief Effective timeout for a test: the tighter of the service default and
 *        the test's own estimate × margin_factor + margin. Without an
 *        estimate the default applies.
 */
[[nodiscard]] Duration compute_timeout(const TestCase& test, const TimeoutConfig& config);

struct TimeoutStats {
    size_t watched{0};
    uint64_t warnings{0};
    uint64_t expirations{0};
    uint64_t forced_terminations{0};
};

class TimeoutManager {
public:
    TimeoutManager(TimeoutConfig config, Duration poll_interval, Logger& logger);
    ~TimeoutManager();

    TimeoutManager(const TimeoutManager&) = delete;
    TimeoutManager& operator=(const TimeoutManager&) = delete;

    void on_timeout(TimeoutCallback callback);

    void start();
    void stop();
    [[nodiscard]] bool is_running() const noexcept;

    /// Begin tracking @p job_id with a deadline @p timeout from now.
    void watch(const JobId& job_id, Duration timeout);
    void unwatch(const JobId& job_id);

    [[nodiscard]] std::optional<Duration> remaining(const JobId& job_id) const;
    [[nodiscard]] bool is_expired(const JobId& job_id) const;

    /**
     * @brief Fire every stage due at @p now. Called by the worker thread;
     *        public so tests can drive it with a synthetic clock.
     * @return Number of callbacks fired.
     */
    size_t process_due(SteadyTime now);

    [[nodiscard]] TimeoutStats stats() const;
    [[nodiscard]] ComponentHealth health() const;

private:
    struct Entry {
        SteadyTime started;
        SteadyTime deadline;
        SteadyTime warn_at;
        std::optional<SteadyTime> force_at;
        bool warned{false};
        bool expired{false};
    };

    void run_loop(std::stop_token stop);
    [[nodiscard]] std::optional<SteadyTime> next_due_locked() const;

    TimeoutConfig config_;
    Duration poll_interval_;
    Logger& logger_;

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::unordered_map<JobId, Entry> entries_;
    std::vector<TimeoutCallback> callbacks_;
    TimeoutStats stats_;
    uint64_t callback_errors_{0};
    bool rescan_{false};

    std::atomic<bool> running_{false};

    std::jthread worker_;
};

}  // namespace kernel_orchestrator
