/**
 * @file process_runner.hpp
 * @brief Runner that executes the test script as a local child process.
 */

#pragma once

#include "core/config.hpp"
#include "executor/runner.hpp"

#include <string>

namespace kernel_orchestrator {

/**
 * @brief Runs `shell -c <script>` in its own process group.
 *
 * The environment is described to the child through KO_ENVIRONMENT_ID,
 * KO_ARCHITECTURE, KO_KERNEL_VERSION and KO_TEST_ID. Output on stdout and
 * stderr is captured up to a fixed cap. On stop the group receives SIGTERM,
 * then SIGKILL after the grace period.
 */
class ProcessRunner : public IRunner {
public:
    static constexpr size_t MAX_CAPTURE_BYTES = 1024 * 1024;

    explicit ProcessRunner(std::string shell = "/bin/sh", Duration kill_grace = Duration{500});

    Result<RunOutcome> execute(const TestCase& test,
                               const Environment& environment,
                               std::stop_token stop) override;

    [[nodiscard]] std::string_view name() const noexcept override { return "process"; }

private:
    std::string shell_;
    Duration kill_grace_;
};

}  // namespace kernel_orchestrator
