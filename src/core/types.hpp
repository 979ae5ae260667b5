/**
 * @file types.hpp
 * @brief Fundamental vocabulary types used throughout KernelOrchestrator.
 *
 * Defines identifiers, priority tiers, job/environment states, hardware
 * descriptors and the value types exchanged between the scheduler, the
 * environment registry and the external runner.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kernel_orchestrator {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using JobId = std::string;
using EnvironmentId = std::string;
using PlanId = std::string;
using TestCaseId = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;
using SteadyTime = std::chrono::steady_clock::time_point;

// ─────────────────────────────────────────────
// Priority
// ─────────────────────────────────────────────

/**
 * @brief Admission tier. Larger underlying value is admitted first.
 */
enum class Priority : uint8_t {
    Low = 1,
    Medium = 2,
    High = 3,
    Critical = 4
};

[[nodiscard]] constexpr std::string_view to_string(Priority priority) noexcept {
    switch (priority) {
        case Priority::Low:      return "low";
        case Priority::Medium:   return "medium";
        case Priority::High:     return "high";
        case Priority::Critical: return "critical";
    }
    return "unknown";
}

[[nodiscard]] std::optional<Priority> parse_priority(std::string_view text) noexcept;

/**
 * @brief Map an execution-plan priority (1 = highest … 10 = lowest) to a tier.
 */
[[nodiscard]] constexpr Priority priority_from_plan_level(int level) noexcept {
    if (level <= 2) return Priority::Critical;
    if (level <= 4) return Priority::High;
    if (level <= 6) return Priority::Medium;
    return Priority::Low;
}

// ─────────────────────────────────────────────
// Job State
// ─────────────────────────────────────────────

enum class JobState : uint8_t {
    Pending,       ///< Queued, waiting for a compatible environment
    Running,       ///< Environment allocated, runner executing
    Completed,     ///< Runner finished with exit code 0
    Failed,        ///< Non-zero exit, runner error or environment loss
    Timeout,       ///< Deadline exceeded
    Cancelled      ///< Cancelled explicitly or by shutdown
};

[[nodiscard]] constexpr std::string_view to_string(JobState state) noexcept {
    switch (state) {
        case JobState::Pending:   return "pending";
        case JobState::Running:   return "running";
        case JobState::Completed: return "completed";
        case JobState::Failed:    return "failed";
        case JobState::Timeout:   return "timeout";
        case JobState::Cancelled: return "cancelled";
    }
    return "unknown";
}

[[nodiscard]] constexpr bool is_terminal(JobState state) noexcept {
    return state != JobState::Pending && state != JobState::Running;
}

// ─────────────────────────────────────────────
// Hardware
// ─────────────────────────────────────────────

/**
 * @brief Execution backend of an environment.
 *
 * Container-style backends start fast and suit light jobs; full-machine
 * emulators and physical boards suit heavy or CPU-intensive jobs.
 */
enum class BackendKind : uint8_t {
    Container,
    FullEmulator,
    Physical
};

[[nodiscard]] constexpr std::string_view to_string(BackendKind kind) noexcept {
    switch (kind) {
        case BackendKind::Container:    return "container";
        case BackendKind::FullEmulator: return "emulator";
        case BackendKind::Physical:     return "physical";
    }
    return "unknown";
}

[[nodiscard]] std::optional<BackendKind> parse_backend_kind(std::string_view text) noexcept;

enum class TestType : uint8_t {
    Unit,
    Integration,
    Performance,
    Stress,
    Fuzz,
    Security
};

[[nodiscard]] constexpr std::string_view to_string(TestType type) noexcept {
    switch (type) {
        case TestType::Unit:        return "unit";
        case TestType::Integration: return "integration";
        case TestType::Performance: return "performance";
        case TestType::Stress:      return "stress";
        case TestType::Fuzz:        return "fuzz";
        case TestType::Security:    return "security";
    }
    return "unknown";
}

[[nodiscard]] std::optional<TestType> parse_test_type(std::string_view text) noexcept;

[[nodiscard]] constexpr bool is_cpu_intensive(TestType type) noexcept {
    return type == TestType::Performance || type == TestType::Stress || type == TestType::Fuzz;
}

/**
 * @brief Hardware descriptor of a registered environment.
 */
struct HardwareProfile {
    std::string architecture;                 ///< "x86_64", "arm64", "riscv64", "arm"
    std::string cpu_model;
    uint32_t memory_mb{0};
    std::string storage_type = "ssd";
    std::vector<std::string> peripherals;
    bool is_virtual{true};
    BackendKind backend{BackendKind::FullEmulator};
};

/**
 * @brief What a test needs from an environment. Empty fields match anything.
 */
struct HardwareRequirement {
    std::string architecture;
    std::string cpu_model;
    uint32_t memory_mb{0};
    std::vector<std::string> peripherals;
    std::optional<bool> is_virtual;
};

struct Environment {
    EnvironmentId id;
    HardwareProfile hardware;
    std::string kernel_version;
};

enum class AllocationState : uint8_t {
    Idle,
    Allocated
};

[[nodiscard]] constexpr std::string_view to_string(AllocationState state) noexcept {
    return state == AllocationState::Idle ? "idle" : "allocated";
}

// ─────────────────────────────────────────────
// Test Case & Result
// ─────────────────────────────────────────────

struct TestCase {
    TestCaseId id;
    std::string name;
    std::string script;
    Duration estimated_duration{0};
    HardwareRequirement requirement;
    std::string target_subsystem;
    TestType test_type{TestType::Unit};
};

/**
 * @brief Outcome of a finished job. Immutable once attached to a job.
 */
struct JobResult {
    JobId job_id;
    JobState state{JobState::Completed};
    Duration execution_time{0};
    EnvironmentId environment_id;
    std::string stdout_text;
    std::string stderr_text;
    std::optional<int> exit_code;
    std::optional<std::string> failure_detail;
    Timestamp completed_at;
};

/**
 * @brief Point-in-time counts used for monitoring and admission.
 */
struct QueueSnapshot {
    size_t running_jobs{0};
    size_t pending_jobs{0};
    size_t available_environments{0};
    size_t allocated_environments{0};
    size_t total_environments{0};
};

// ─────────────────────────────────────────────
// Health
// ─────────────────────────────────────────────

enum class HealthStatus : uint8_t {
    Healthy,
    Degraded,
    Stopped
};

[[nodiscard]] constexpr std::string_view to_string(HealthStatus status) noexcept {
    switch (status) {
        case HealthStatus::Healthy:  return "healthy";
        case HealthStatus::Degraded: return "degraded";
        case HealthStatus::Stopped:  return "stopped";
    }
    return "unknown";
}

struct ComponentHealth {
    std::string name;
    HealthStatus status{HealthStatus::Healthy};
    std::string detail;
};

}  // namespace kernel_orchestrator
