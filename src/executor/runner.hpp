/**
 * @file runner.hpp
 * @brief Interface to the capability that executes a test script inside an environment.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <stop_token>
#include <string>
#include <string_view>

namespace kernel_orchestrator {

struct RunOutcome {
    int exit_code{0};
    std::string stdout_text;
    std::string stderr_text;
    Duration duration{0};
};

/**
 * @brief Black-box test runner.
 *
 * Implementations must return promptly once @p stop is requested, returning
 * whatever output was captured so far. The dispatcher treats a runner that
 * ignores the request past the termination grace period as hung.
 * An error Result and a thrown exception are both reported as FAILED.
 */
class IRunner {
public:
    virtual ~IRunner() = default;

    virtual Result<RunOutcome> execute(const TestCase& test,
                                       const Environment& environment,
                                       std::stop_token stop) = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

}  // namespace kernel_orchestrator
