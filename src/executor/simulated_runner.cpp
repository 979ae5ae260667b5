/**
 * @file simulated_runner.cpp
 * @brief SimulatedRunner implementation with sliced sleeps.
 */

#include "executor/simulated_runner.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <thread>

namespace kernel_orchestrator {

namespace {

constexpr Duration SLICE{5};

}  // anonymous namespace

SimulatedRunner::SimulatedRunner(double time_scale)
    : time_scale_(time_scale > 0.0 ? time_scale : 1.0) {}

void SimulatedRunner::set_behavior(const TestCaseId& test_id, Behavior behavior, int exit_code) {
    std::lock_guard lock(scripts_mutex_);
    scripts_[test_id] = Script{.behavior = behavior, .exit_code = exit_code};
}

void SimulatedRunner::clear_behaviors() {
    std::lock_guard lock(scripts_mutex_);
    scripts_.clear();
}

Result<RunOutcome> SimulatedRunner::execute(const TestCase& test,
                                            const Environment& environment,
                                            std::stop_token stop) {
    Script script;
    {
        std::lock_guard lock(scripts_mutex_);
        if (auto it = scripts_.find(test.id); it != scripts_.end()) script = it->second;
    }

    ++executions_;
    size_t now_active = ++active_;
    size_t peak = peak_active_.load();
    while (now_active > peak && !peak_active_.compare_exchange_weak(peak, now_active)) {}

    struct ActiveGuard {
        std::atomic<size_t>& counter;
        ~ActiveGuard() { --counter; }
    } guard{active_};

    auto start = std::chrono::steady_clock::now();
    auto target = Duration{static_cast<int64_t>(
        static_cast<double>(test.estimated_duration.count()) * time_scale_)};

    RunOutcome outcome;
    outcome.stdout_text = "[" + environment.id + "] running " + test.name + "\n";

    switch (script.behavior) {
        case Behavior::Throw:
            throw std::runtime_error("simulated runner crash in " + test.id);
        case Behavior::Error:
            return Error{ErrorCode::Internal, "simulated execution error in " + test.id};
        case Behavior::Hang:
            simulate_work(Duration::max(), stop, true);
            break;
        case Behavior::IgnoreStop:
            simulate_work(target, stop, false);
            break;
        case Behavior::Pass:
        case Behavior::Fail:
            simulate_work(target, stop, true);
            break;
    }

    outcome.duration = std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - start);
    if (stop.stop_requested() && script.behavior != Behavior::IgnoreStop) {
        outcome.exit_code = 143;
        outcome.stderr_text = "terminated\n";
        return outcome;
    }

    if (script.behavior == Behavior::Fail) {
        outcome.exit_code = script.exit_code;
        outcome.stderr_text = "simulated failure\n";
    } else {
        outcome.stdout_text += "ok\n";
    }
    return outcome;
}

void SimulatedRunner::simulate_work(Duration target, std::stop_token stop, bool honour_stop) {
    auto start = std::chrono::steady_clock::now();
    while (true) {
        if (honour_stop && stop.stop_requested()) return;

        auto elapsed = std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - start);
        if (elapsed >= target) return;

        std::this_thread::sleep_for(std::min(SLICE, target - elapsed));
    }
}

}  // namespace kernel_orchestrator
