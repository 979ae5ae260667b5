/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for KernelOrchestrator seams.
 */

#pragma once

#include "core/types.hpp"

#include <concepts>
#include <optional>
#include <vector>

namespace kernel_orchestrator {

struct EnvironmentRecord;

/**
 * @concept EnvironmentSelector
 * @brief Picks one of the idle environments offered by the registry, or none.
 */
template <typename T>
concept EnvironmentSelector = requires(T selector,
                                       const std::vector<const EnvironmentRecord*>& idle) {
    { selector(idle) } -> std::same_as<std::optional<EnvironmentId>>;
};

}  // namespace kernel_orchestrator
