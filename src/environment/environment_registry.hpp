/**
 * @file environment_registry.hpp
 * @brief Owned-and-locked table of execution environments and their allocation state.
 *
 * Every mutation of allocation state goes through one of four atomic
 * operations: register, deregister/evict, allocate, release. Each takes the
 * registry lock for its full duration, so a double allocate or double
 * release of the same environment is rejected rather than raced.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace kernel_orchestrator {

/**
 * @brief Registry entry. Only the registry writes these fields.
 */
struct EnvironmentRecord {
    Environment environment;
    AllocationState state{AllocationState::Idle};
    std::optional<JobId> holder;              ///< Set iff state == Allocated
    bool retiring{false};                     ///< Removed while allocated; dropped on release

    SteadyTime registered_at;
    SteadyTime allocated_at;
    SteadyTime last_released;                 ///< LRU key; registration time until first use

    uint64_t jobs_run{0};
    Duration busy_time{0};
};

/**
 * @brief Per-environment usage accounting.
 */
struct EnvironmentUsage {
    EnvironmentId id;
    AllocationState state{AllocationState::Idle};
    uint64_t jobs_run{0};
    Duration busy_time{0};
    Duration registered_for{0};
    bool retiring{false};

    [[nodiscard]] double utilization() const noexcept {
        if (registered_for.count() <= 0) return 0.0;
        return static_cast<double>(busy_time.count()) / static_cast<double>(registered_for.count());
    }
};

class EnvironmentRegistry {
public:
    EnvironmentRegistry() = default;

    EnvironmentRegistry(const EnvironmentRegistry&) = delete;
    EnvironmentRegistry& operator=(const EnvironmentRegistry&) = delete;

    // ── Registration ─────────────────────────

    /// Add an environment as IDLE. Re-adding a retiring environment revives it.
    Result<void> register_environment(Environment environment);

    /// Idle environments are dropped immediately; allocated ones retire on release.
    Result<void> deregister(const EnvironmentId& id);

    /**
     * @brief Drop an environment immediately, whatever its state.
     * @return The job that held it, if any.
     */
    Result<std::optional<JobId>> evict(const EnvironmentId& id);

    // ── Allocation ───────────────────────────

    /**
     * @brief Offer every idle, non-retiring environment to @p selector and
     *        allocate the one it picks to @p job_id, atomically.
     */
    template <EnvironmentSelector S>
    std::optional<Environment> allocate_with(const JobId& job_id, S&& selector);

    Result<void> allocate(const EnvironmentId& id, const JobId& job_id);

    /// Release an allocation. Fails unless @p job_id is the current holder.
    Result<void> release(const EnvironmentId& id, const JobId& job_id);

    // ── Queries ──────────────────────────────

    [[nodiscard]] std::optional<Environment> get(const EnvironmentId& id) const;
    [[nodiscard]] std::optional<JobId> holder(const EnvironmentId& id) const;
    [[nodiscard]] bool contains(const EnvironmentId& id) const;
    [[nodiscard]] std::vector<Environment> environments() const;

    /// Calls @p visitor with every record under the lock.
    template <typename F>
    void visit(F&& visitor) const;

    [[nodiscard]] size_t total_count() const;
    [[nodiscard]] size_t available_count() const;
    [[nodiscard]] size_t allocated_count() const;

    [[nodiscard]] std::vector<EnvironmentUsage> usage() const;

    /**
     * @brief available + allocated == total, and a holder exists iff allocated.
     */
    [[nodiscard]] bool check_invariants() const;

private:
    Result<void> allocate_locked(EnvironmentRecord& record, const JobId& job_id, SteadyTime now);

    mutable std::mutex mutex_;
    std::unordered_map<EnvironmentId, EnvironmentRecord> records_;
};

// ── Template implementations ─────────────────

template <EnvironmentSelector S>
std::optional<Environment> EnvironmentRegistry::allocate_with(const JobId& job_id, S&& selector) {
    std::lock_guard lock(mutex_);

    std::vector<const EnvironmentRecord*> idle;
    idle.reserve(records_.size());
    for (const auto& [id, record] : records_) {
        if (record.state == AllocationState::Idle && !record.retiring) {
            idle.push_back(&record);
        }
    }
    if (idle.empty()) return std::nullopt;

    std::optional<EnvironmentId> chosen = selector(idle);
    if (!chosen) return std::nullopt;

    auto it = records_.find(*chosen);
    if (it == records_.end()) return std::nullopt;
    if (!allocate_locked(it->second, job_id, std::chrono::steady_clock::now())) {
        return std::nullopt;
    }
    return it->second.environment;
}

template <typename F>
void EnvironmentRegistry::visit(F&& visitor) const {
    std::lock_guard lock(mutex_);
    for (const auto& [id, record] : records_) {
        visitor(record);
    }
}

}  // namespace kernel_orchestrator
