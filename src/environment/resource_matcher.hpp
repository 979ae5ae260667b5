/**
 * @file resource_matcher.hpp
 * @brief Hardware-compatibility matching and backend preference over the registry.
 */

#pragma once

#include "core/config.hpp"
#include "core/types.hpp"
#include "environment/environment_registry.hpp"

#include <optional>
#include <vector>

namespace kernel_orchestrator {

/**
 * @brief Selects a compatible, idle environment for a test case.
 *
 * Algorithm:
 *   candidates = idle environments where is_compatible(profile, requirement)
 *   rank(env)  = backend preference for the workload weight
 *   pick argmin (rank, last_released, id)
 *
 * Light workloads (memory <= light_memory_mb, estimate <= light_duration_ms,
 * not CPU-intensive) prefer container backends; everything else prefers
 * full-machine emulators, then physical boards.
 */
class ResourceMatcher {
public:
    ResourceMatcher(EnvironmentRegistry& registry, MatcherConfig config);

    /// Exact architecture, sufficient memory, required peripherals present.
    [[nodiscard]] static bool is_compatible(const HardwareProfile& profile,
                                            const HardwareRequirement& requirement) noexcept;

    [[nodiscard]] bool is_light(const TestCase& test) const noexcept;

    /// Lower is preferred.
    [[nodiscard]] int backend_rank(BackendKind kind, bool light) const noexcept;

    /// Read-only lookup; does not allocate.
    [[nodiscard]] std::optional<Environment> find_match(const TestCase& test) const;

    /// Find and allocate to @p job_id in one registry operation.
    [[nodiscard]] std::optional<Environment> allocate(const JobId& job_id, const TestCase& test);

    /// Whether any registered environment, idle or not, could ever run @p test.
    [[nodiscard]] bool any_compatible(const TestCase& test) const;

    /// Pick from an already-filtered idle set. Exposed for the registry selector.
    [[nodiscard]] std::optional<EnvironmentId> select(
        const std::vector<const EnvironmentRecord*>& idle, const TestCase& test) const;

private:
    EnvironmentRegistry& registry_;
    MatcherConfig config_;
};

}  // namespace kernel_orchestrator
