/**
 * @file test_process_runner.cpp
 * @brief Unit tests for ProcessRunner against /bin/sh.
 */

#include "executor/process_runner.hpp"
#include "common/test_helpers.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <csignal>
#include <future>
#include <thread>
#include <vector>

using namespace kernel_orchestrator;
using kernel_orchestrator::testing::make_env;
using kernel_orchestrator::testing::make_test;

namespace {

TestCase scripted(const std::string& id, const std::string& script) {
    auto test = make_test(id);
    test.script = script;
    return test;
}

}  // namespace

TEST(ProcessRunnerTest, CapturesOutputAndExitCode) {
    ProcessRunner runner;
    std::stop_source source;

    auto outcome = runner.execute(scripted("t1", "echo hello; echo oops >&2; exit 4"),
                                  make_env("env-1"), source.get_token());
    ASSERT_TRUE(outcome.has_value()) << outcome.error().message;
    EXPECT_EQ(outcome->exit_code, 4);
    EXPECT_EQ(outcome->stdout_text, "hello\n");
    EXPECT_EQ(outcome->stderr_text, "oops\n");
}

TEST(ProcessRunnerTest, ExportsEnvironmentDescription) {
    ProcessRunner runner;
    std::stop_source source;
    auto env = make_env("qemu-arm-1", "arm64");

    auto outcome = runner.execute(
        scripted("t2", R"(echo "$KO_ENVIRONMENT_ID $KO_ARCHITECTURE $KO_KERNEL_VERSION $KO_TEST_ID")"),
        env, source.get_token());
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->exit_code, 0);
    EXPECT_EQ(outcome->stdout_text, "qemu-arm-1 arm64 6.6.0 t2\n");
}

TEST(ProcessRunnerTest, EmptyScriptRejected) {
    ProcessRunner runner;
    std::stop_source source;
    auto outcome = runner.execute(scripted("t3", ""), make_env("e"), source.get_token());
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, ErrorCode::InvalidArgument);
}

TEST(ProcessRunnerTest, MissingShellExits127) {
    ProcessRunner runner("/nonexistent/shell");
    std::stop_source source;
    auto outcome = runner.execute(scripted("t4", "true"), make_env("e"), source.get_token());
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->exit_code, 127);
}

TEST(ProcessRunnerTest, StopTerminatesProcessGroup) {
    ProcessRunner runner("/bin/sh", Duration{200});
    std::stop_source source;

    auto start = std::chrono::steady_clock::now();
    auto future = std::async(std::launch::async, [&] {
        return runner.execute(scripted("t5", "sleep 30"), make_env("e"), source.get_token());
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    source.request_stop();

    ASSERT_EQ(future.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    auto outcome = future.get();
    ASSERT_TRUE(outcome.has_value());
    EXPECT_GE(outcome->exit_code, 128);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
}

TEST(ProcessRunnerTest, KillsAfterGraceWhenTermIgnored) {
    ProcessRunner runner("/bin/sh", Duration{100});
    std::stop_source source;

    auto future = std::async(std::launch::async, [&] {
        return runner.execute(scripted("t6", "trap '' TERM; while true; do sleep 0.05; done"),
                              make_env("e"), source.get_token());
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    source.request_stop();

    ASSERT_EQ(future.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    auto outcome = future.get();
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->exit_code, 128 + SIGKILL);
}

TEST(ProcessRunnerTest, ConcurrentChildrenInheritNoPipes) {
    ProcessRunner runner;
    std::stop_source source;
    const auto list_fds = scripted("fds", "ls /proc/self/fd");

    auto baseline = runner.execute(list_fds, make_env("e"), source.get_token());
    ASSERT_TRUE(baseline.has_value()) << baseline.error().message;
    ASSERT_EQ(baseline->exit_code, 0);

    // Each child must see the same descriptors as a child forked alone
    std::vector<std::future<Result<RunOutcome>>> runs;
    for (int i = 0; i < 8; ++i) {
        runs.push_back(std::async(std::launch::async, [&] {
            return runner.execute(list_fds, make_env("e"), source.get_token());
        }));
    }
    for (auto& run : runs) {
        auto outcome = run.get();
        ASSERT_TRUE(outcome.has_value()) << outcome.error().message;
        EXPECT_EQ(outcome->stdout_text, baseline->stdout_text);
    }
}
