/**
 * @file simulated_runner.hpp
 * @brief Runner that sleeps for the test's estimated duration instead of running it.
 */

#pragma once

#include "executor/runner.hpp"

#include <atomic>
#include <mutex>
#include <unordered_map>

namespace kernel_orchestrator {

/**
 * @brief Deterministic stand-in for a real runner, used by demo mode and tests.
 *
 * Each test sleeps for estimated_duration × time_scale in short slices,
 * checking the stop token between slices. Individual tests can be scripted
 * to fail, error, throw, hang or ignore stop requests.
 */
class SimulatedRunner : public IRunner {
public:
    enum class Behavior : uint8_t {
        Pass,          ///< exit 0
        Fail,          ///< non-zero exit code
        Error,         ///< error Result
        Throw,         ///< std::runtime_error
        Hang,          ///< run until stopped
        IgnoreStop     ///< keep running for the full duration even when stopped
    };

    explicit SimulatedRunner(double time_scale = 1.0);

    Result<RunOutcome> execute(const TestCase& test,
                               const Environment& environment,
                               std::stop_token stop) override;

    [[nodiscard]] std::string_view name() const noexcept override { return "simulated"; }

    void set_behavior(const TestCaseId& test_id, Behavior behavior, int exit_code = 1);
    void clear_behaviors();

    [[nodiscard]] size_t execution_count() const noexcept { return executions_.load(); }
    [[nodiscard]] size_t active_count() const noexcept { return active_.load(); }
    [[nodiscard]] size_t peak_concurrency() const noexcept { return peak_active_.load(); }

private:
    struct Script {
        Behavior behavior{Behavior::Pass};
        int exit_code{1};
    };

    /// Sleep up to @p target, or until @p stop when @p honour_stop is set.
    void simulate_work(Duration target, std::stop_token stop, bool honour_stop);

    double time_scale_;
    mutable std::mutex scripts_mutex_;
    std::unordered_map<TestCaseId, Script> scripts_;

    std::atomic<size_t> executions_{0};
    std::atomic<size_t> active_{0};
    std::atomic<size_t> peak_active_{0};
};

}  // namespace kernel_orchestrator
