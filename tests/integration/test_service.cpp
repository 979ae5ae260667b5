/**
 * @file test_service.cpp
 * @brief Integration tests exercising the full orchestration pipeline
 *        through OrchestratorService with the simulated runner.
 */

#include "service/orchestrator_service.hpp"
#include "core/config.hpp"
#include "executor/simulated_runner.hpp"
#include "monitor/plan_source.hpp"
#include "telemetry/json_sink.hpp"
#include "common/test_helpers.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <memory>
#include <thread>

using namespace kernel_orchestrator;
using kernel_orchestrator::testing::CaptureSink;
using kernel_orchestrator::testing::count_containing;
using kernel_orchestrator::testing::eventually;
using kernel_orchestrator::testing::make_env;
using kernel_orchestrator::testing::make_test;

namespace {

Config fast_config(uint32_t max_concurrent) {
    auto config = default_config();
    config.service.poll_interval_ms = 20;
    config.service.max_concurrent_tests = max_concurrent;
    config.service.enable_persistence = false;
    config.timeout.margin_factor = 1.5;
    config.timeout.margin_ms = 0;
    config.timeout.termination_grace_ms = 200;
    config.runner.kind = "simulated";
    config.sources = SourcesConfig{};
    return config;
}

struct Harness {
    std::shared_ptr<SimulatedRunner> runner;
    std::shared_ptr<CaptureSink::Buffer> metrics;
    std::unique_ptr<OrchestratorService> service;
};

Harness make_harness(Config config, std::shared_ptr<IPlanSource> plans = nullptr) {
    Harness h;
    h.runner = std::make_shared<SimulatedRunner>(1.0);
    h.metrics = std::make_shared<CaptureSink::Buffer>();
    h.service = std::make_unique<OrchestratorService>(OrchestratorService::Options{
        .config = std::move(config),
        .runner = h.runner,
        .log_sink = std::make_unique<NullSink>(),
        .log_level = LogLevel::Error,
        .metrics_sink = std::make_unique<CaptureSink>(h.metrics),
        .plan_source = std::move(plans),
    });
    return h;
}

JobStatus status_of(OrchestratorService& service, const JobId& id) {
    auto status = service.get_job_status(id);
    EXPECT_TRUE(status.has_value());
    return status.value();
}

}  // namespace

// ═══════════════════════════════════════════════
// Scheduling
// ═══════════════════════════════════════════════

TEST(ServiceIntegration, CriticalRunsBeforeLow) {
    auto h = make_harness(fast_config(1));
    ASSERT_TRUE(h.service->start());

    // Nothing can run until an environment appears
    auto low = h.service->submit_job(make_test("low", Duration{40}), Priority::Low);
    auto critical = h.service->submit_job(make_test("critical", Duration{40}), Priority::Critical);
    ASSERT_TRUE(low.has_value());
    ASSERT_TRUE(critical.has_value());
    EXPECT_EQ(h.service->get_queue_status().pending_jobs, 2u);

    ASSERT_TRUE(h.service->add_environment(make_env("qemu-1")));
    ASSERT_TRUE(h.service->wait_until_idle(Duration{5000}));

    auto low_status = status_of(*h.service, *low);
    auto critical_status = status_of(*h.service, *critical);
    EXPECT_EQ(low_status.state, JobState::Completed);
    EXPECT_EQ(critical_status.state, JobState::Completed);
    ASSERT_TRUE(low_status.started_at && critical_status.started_at);
    EXPECT_LT(*critical_status.started_at, *low_status.started_at);

    h.service->stop();
}

TEST(ServiceIntegration, TwoEnvironmentsFiveJobs) {
    auto h = make_harness(fast_config(4));
    ASSERT_TRUE(h.service->add_environment(make_env("env-a")));
    ASSERT_TRUE(h.service->add_environment(make_env("env-b")));
    ASSERT_TRUE(h.service->start());

    std::vector<JobId> ids;
    for (int i = 0; i < 5; ++i) {
        auto id = h.service->submit_job(make_test("t" + std::to_string(i), Duration{60}), Priority::Medium);
        ASSERT_TRUE(id.has_value());
        ids.push_back(*id);
    }

    // Never more running than environments
    for (int i = 0; i < 20; ++i) {
        EXPECT_LE(h.service->get_queue_status().running_jobs, 2u);
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    ASSERT_TRUE(h.service->wait_until_idle(Duration{5000}));

    for (const auto& id : ids) {
        auto status = status_of(*h.service, id);
        EXPECT_EQ(status.state, JobState::Completed);
        ASSERT_TRUE(status.result.has_value());
        EXPECT_TRUE(status.result->environment_id == "env-a" || status.result->environment_id == "env-b");
    }

    auto metrics = h.service->get_system_metrics();
    EXPECT_EQ(metrics.dispatcher.completed, 5u);
    EXPECT_EQ(metrics.dispatcher.peak_running, 2u);
    EXPECT_EQ(metrics.dispatcher.peak_pending, 3u);
    EXPECT_EQ(metrics.jobs.completed_tests, 5u);
    EXPECT_LE(h.runner->peak_concurrency(), 2u);

    uint64_t total_runs = 0;
    for (const auto& usage : h.service->environment_usage()) total_runs += usage.jobs_run;
    EXPECT_EQ(total_runs, 5u);

    h.service->stop();
}

TEST(ServiceIntegration, ThreeTimesOversubscribed) {
    auto h = make_harness(fast_config(3));
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(h.service->add_environment(make_env("env-" + std::to_string(i))));
    }
    ASSERT_TRUE(h.service->start());

    const Priority priorities[] = {Priority::Low, Priority::Medium, Priority::High, Priority::Critical};
    for (int i = 0; i < 9; ++i) {
        ASSERT_TRUE(h.service->submit_job(make_test("load-" + std::to_string(i), Duration{30}),
                                          priorities[i % 4]));
    }
    ASSERT_TRUE(h.service->wait_until_idle(Duration{10000}));

    auto metrics = h.service->get_system_metrics();
    EXPECT_EQ(metrics.dispatcher.completed, 9u);
    EXPECT_LE(metrics.dispatcher.peak_running, 3u);
    EXPECT_GE(metrics.dispatcher.peak_pending, 6u);
    EXPECT_EQ(metrics.queue.running_jobs, 0u);
    EXPECT_EQ(metrics.queue.available_environments, 3u);

    h.service->stop();
}

TEST(ServiceIntegration, RemoveAllocatedEnvironmentDuringRun) {
    auto h = make_harness(fast_config(2));
    ASSERT_TRUE(h.service->add_environment(make_env("env-a")));
    ASSERT_TRUE(h.service->add_environment(make_env("env-b")));
    ASSERT_TRUE(h.service->start());

    auto job = h.service->submit_job(make_test("long", Duration{150}), Priority::Medium);
    ASSERT_TRUE(job.has_value());
    ASSERT_TRUE(eventually([&] { return status_of(*h.service, *job).state == JobState::Running; }));
    auto held = status_of(*h.service, *job).environment;
    ASSERT_TRUE(held.has_value());

    // Stays allocated to the job until it ends
    ASSERT_TRUE(h.service->remove_environment(*held));
    EXPECT_EQ(h.service->get_queue_status().allocated_environments, 1u);

    ASSERT_TRUE(h.service->wait_until_idle(Duration{5000}));
    EXPECT_EQ(status_of(*h.service, *job).state, JobState::Completed);

    auto queue = h.service->get_queue_status();
    EXPECT_EQ(queue.total_environments, 1u);
    EXPECT_EQ(queue.available_environments, 1u);
    EXPECT_EQ(queue.allocated_environments, 0u);
    EXPECT_TRUE(h.service->registry().check_invariants());

    // Later jobs only see the remaining environment
    auto after = h.service->submit_job(make_test("after", Duration{10}), Priority::Medium);
    ASSERT_TRUE(after.has_value());
    ASSERT_TRUE(h.service->wait_until_idle(Duration{5000}));
    auto result = status_of(*h.service, *after).result;
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->state, JobState::Completed);
    EXPECT_NE(result->environment_id, *held);

    h.service->stop();
}

TEST(ServiceIntegration, IncompatibleJobWaitsForMatchingEnvironment) {
    auto h = make_harness(fast_config(2));
    ASSERT_TRUE(h.service->add_environment(make_env("x86-1", "x86_64")));
    ASSERT_TRUE(h.service->start());

    auto arm = h.service->submit_job(make_test("arm-only", Duration{20}, "arm64"), Priority::High);
    ASSERT_TRUE(arm.has_value());
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_EQ(status_of(*h.service, *arm).state, JobState::Pending);

    ASSERT_TRUE(h.service->add_environment(make_env("arm-1", "arm64")));
    EXPECT_TRUE(eventually([&] {
        return status_of(*h.service, *arm).state == JobState::Completed;
    }));
    auto result = status_of(*h.service, *arm).result;
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->environment_id, "arm-1");

    h.service->stop();
}

// ═══════════════════════════════════════════════
// Failure handling
// ═══════════════════════════════════════════════

TEST(ServiceIntegration, HangingJobTimesOut) {
    auto h = make_harness(fast_config(1));
    ASSERT_TRUE(h.service->add_environment(make_env("qemu-1")));
    ASSERT_TRUE(h.service->start());

    h.runner->set_behavior("stuck", SimulatedRunner::Behavior::Hang);
    auto stuck = h.service->submit_job(make_test("stuck", Duration{40}), Priority::High);
    auto next = h.service->submit_job(make_test("next", Duration{20}), Priority::Low);
    ASSERT_TRUE(stuck.has_value() && next.has_value());

    ASSERT_TRUE(h.service->wait_until_idle(Duration{5000}));
    auto status = status_of(*h.service, *stuck);
    EXPECT_EQ(status.state, JobState::Timeout);
    ASSERT_TRUE(status.result.has_value());
    EXPECT_TRUE(status.result->failure_detail.has_value());

    // The environment came back for the next job
    EXPECT_EQ(status_of(*h.service, *next).state, JobState::Completed);

    auto metrics = h.service->get_system_metrics();
    EXPECT_EQ(metrics.dispatcher.timed_out, 1u);
    EXPECT_EQ(metrics.jobs.timed_out_tests, 1u);
    EXPECT_GE(metrics.recovery.total_errors, 1u);
    EXPECT_GE(count_containing(h.metrics, R"("event":"timeout")"), 1u);

    h.service->stop();
}

TEST(ServiceIntegration, EnvironmentLossFailsRunningJob) {
    auto h = make_harness(fast_config(2));
    ASSERT_TRUE(h.service->add_environment(make_env("board-1")));
    ASSERT_TRUE(h.service->start());

    h.runner->set_behavior("long", SimulatedRunner::Behavior::Hang);
    auto long_job = h.service->submit_job(make_test("long", Duration{60000}), Priority::High);
    ASSERT_TRUE(long_job.has_value());
    ASSERT_TRUE(eventually([&] {
        return status_of(*h.service, *long_job).state == JobState::Running;
    }));

    auto affected = h.service->report_environment_failure("board-1", "usb disconnected");
    ASSERT_TRUE(affected.has_value());
    ASSERT_TRUE(affected->has_value());
    EXPECT_EQ(**affected, *long_job);

    auto status = status_of(*h.service, *long_job);
    EXPECT_EQ(status.state, JobState::Failed);
    EXPECT_EQ(h.service->get_queue_status().total_environments, 0u);

    auto unknown = h.service->report_environment_failure("board-1", "again");
    EXPECT_FALSE(unknown.has_value());

    auto metrics = h.service->get_system_metrics();
    EXPECT_EQ(metrics.recovery.environment_failures, 1u);
    EXPECT_EQ(count_containing(h.metrics, R"("event":"environment_lost")"), 1u);

    h.service->stop();
}

TEST(ServiceIntegration, FailingTestsAreReportedNotRetried) {
    auto h = make_harness(fast_config(2));
    ASSERT_TRUE(h.service->add_environment(make_env("qemu-1")));
    ASSERT_TRUE(h.service->start());

    h.runner->set_behavior("net", SimulatedRunner::Behavior::Fail, 2);
    auto job = h.service->submit_job(make_test("net", Duration{10}), Priority::Medium);
    ASSERT_TRUE(job.has_value());
    ASSERT_TRUE(h.service->wait_until_idle(Duration{5000}));

    auto status = status_of(*h.service, *job);
    EXPECT_EQ(status.state, JobState::Failed);
    ASSERT_TRUE(status.result && status.result->exit_code);
    EXPECT_EQ(*status.result->exit_code, 2);
    EXPECT_EQ(h.runner->execution_count(), 1u);

    auto history = h.service->job_history(*job);
    ASSERT_EQ(history.size(), 3u);
    EXPECT_EQ(history[0].to, JobState::Pending);
    EXPECT_EQ(history[1].to, JobState::Running);
    EXPECT_EQ(history[2].to, JobState::Failed);

    h.service->stop();
}

// ═══════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════

TEST(ServiceIntegration, StartStopAreIdempotent) {
    auto h = make_harness(fast_config(2));
    EXPECT_EQ(h.service->get_health_status().status, HealthStatus::Stopped);

    auto rejected = h.service->submit_job(make_test("early"), Priority::Low);
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error().code, ErrorCode::Unavailable);

    EXPECT_TRUE(h.service->start());
    EXPECT_TRUE(h.service->start());
    EXPECT_TRUE(h.service->is_running());

    EXPECT_TRUE(h.service->stop());
    EXPECT_TRUE(h.service->stop());
    EXPECT_FALSE(h.service->is_running());

    EXPECT_TRUE(h.service->start());
    EXPECT_TRUE(h.service->is_running());
    h.service->stop();
}

TEST(ServiceIntegration, StopCancelsEverything) {
    auto h = make_harness(fast_config(1));
    ASSERT_TRUE(h.service->add_environment(make_env("qemu-1")));
    ASSERT_TRUE(h.service->start());

    h.runner->set_behavior("forever", SimulatedRunner::Behavior::Hang);
    auto running = h.service->submit_job(make_test("forever", Duration{60000}), Priority::High);
    auto pending = h.service->submit_job(make_test("waiting", Duration{10}), Priority::Low);
    ASSERT_TRUE(running.has_value() && pending.has_value());
    ASSERT_TRUE(eventually([&] {
        return status_of(*h.service, *running).state == JobState::Running;
    }));

    h.service->stop();

    auto queue = h.service->get_queue_status();
    EXPECT_EQ(queue.running_jobs, 0u);
    EXPECT_EQ(queue.pending_jobs, 0u);
    EXPECT_EQ(queue.allocated_environments, 0u);
    EXPECT_EQ(status_of(*h.service, *running).state, JobState::Cancelled);
    EXPECT_EQ(status_of(*h.service, *pending).state, JobState::Cancelled);
    EXPECT_EQ(h.service->get_health_status().status, HealthStatus::Stopped);
}

TEST(ServiceIntegration, CancelAndEscalate) {
    auto h = make_harness(fast_config(1));
    ASSERT_TRUE(h.service->start());

    auto fs = make_test("fs-1", Duration{10});
    fs.target_subsystem = "fs";
    auto mm = make_test("mm-1", Duration{10});
    mm.target_subsystem = "mm";

    auto fs_job = h.service->submit_job(fs, Priority::Medium);
    auto mm_job = h.service->submit_job(mm, Priority::Low);
    auto doomed = h.service->submit_job(make_test("doomed"), Priority::Critical);
    ASSERT_TRUE(fs_job && mm_job && doomed);

    ASSERT_TRUE(h.service->cancel_job(*doomed));
    EXPECT_FALSE(h.service->cancel_job(*doomed).has_value());
    EXPECT_EQ(h.service->escalate_subsystem("mm", Priority::Critical), 1u);
    EXPECT_EQ(status_of(*h.service, *mm_job).priority, Priority::Critical);

    ASSERT_TRUE(h.service->add_environment(make_env("qemu-1")));
    ASSERT_TRUE(h.service->wait_until_idle(Duration{5000}));

    EXPECT_EQ(status_of(*h.service, *doomed).state, JobState::Cancelled);
    EXPECT_LT(*status_of(*h.service, *mm_job).started_at, *status_of(*h.service, *fs_job).started_at);

    h.service->stop();
}

TEST(ServiceIntegration, UnfinishedJobsSurviveRestart) {
    auto state_file = std::filesystem::temp_directory_path() / "ko_test_service" / "state.toml";
    std::filesystem::remove_all(state_file.parent_path());

    auto config = fast_config(2);
    config.service.enable_persistence = true;
    config.service.state_file = state_file;

    JobId first_id;
    {
        auto h = make_harness(config);
        ASSERT_TRUE(h.service->start());
        auto first = h.service->submit_job(make_test("persist-1", Duration{10}), Priority::High);
        ASSERT_TRUE(h.service->submit_job(make_test("persist-2", Duration{10}), Priority::Low));
        ASSERT_TRUE(first.has_value());
        first_id = *first;
        h.service->stop();
    }
    ASSERT_TRUE(std::filesystem::exists(state_file));

    {
        auto h = make_harness(config);
        ASSERT_TRUE(h.service->start());
        EXPECT_EQ(h.service->get_queue_status().pending_jobs, 2u);

        auto restored = status_of(*h.service, first_id);
        EXPECT_EQ(restored.state, JobState::Pending);
        EXPECT_EQ(restored.priority, Priority::High);
        EXPECT_EQ(restored.test_case_id, "persist-1");

        ASSERT_TRUE(h.service->add_environment(make_env("qemu-1")));
        ASSERT_TRUE(h.service->wait_until_idle(Duration{5000}));
        EXPECT_EQ(status_of(*h.service, first_id).state, JobState::Completed);
        EXPECT_EQ(h.service->get_system_metrics().lifetime.submitted, 4u);
        h.service->stop();
    }
    std::filesystem::remove_all(state_file.parent_path());
}

// ═══════════════════════════════════════════════
// Plans, health and telemetry
// ═══════════════════════════════════════════════

TEST(ServiceIntegration, PlansFlowThroughToCompletion) {
    auto plans = std::make_shared<InMemoryPlanSource>();
    auto h = make_harness(fast_config(2), plans);
    h.service->catalog().add(make_test("mm-001", Duration{10}));
    h.service->catalog().add(make_test("fs-001", Duration{10}));
    ASSERT_TRUE(h.service->add_environment(make_env("qemu-1")));
    ASSERT_TRUE(h.service->start());

    ExecutionPlan plan;
    plan.plan_id = "nightly";
    plan.test_case_ids = {"mm-001", "fs-001"};
    plan.priority = 2;
    ASSERT_TRUE(plans->add(plan));

    auto report = h.service->poll_plans_now();
    ASSERT_TRUE(report.has_value());
    if (report->new_plans == 0) {
        // The maintenance thread picked it up first
        EXPECT_TRUE(h.service->tracker().plan("nightly").has_value());
    } else {
        EXPECT_EQ(report->jobs_submitted, 2u);
    }

    EXPECT_TRUE(eventually([&] { return plans->status("nightly") == PlanStatus::Completed; }));
    auto progress = h.service->tracker().plan("nightly");
    ASSERT_TRUE(progress.has_value());
    EXPECT_EQ(progress->completed, 2u);

    h.service->stop();
}

TEST(ServiceIntegration, PollWithoutPlanSourceIsUnavailable) {
    auto h = make_harness(fast_config(1));
    auto report = h.service->poll_plans_now();
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code, ErrorCode::Unavailable);
}

TEST(ServiceIntegration, HealthAndTelemetry) {
    auto h = make_harness(fast_config(2));
    ASSERT_TRUE(h.service->add_environment(make_env("qemu-1")));
    ASSERT_TRUE(h.service->start());

    auto health = h.service->get_health_status();
    EXPECT_EQ(health.status, HealthStatus::Healthy);
    EXPECT_FALSE(health.degraded_mode);
    EXPECT_GE(health.components.size(), 4u);

    auto job = h.service->submit_job(make_test("quick", Duration{10}), Priority::Medium);
    ASSERT_TRUE(job.has_value());
    ASSERT_TRUE(h.service->wait_until_idle(Duration{5000}));
    h.service->maintenance_tick();

    EXPECT_EQ(count_containing(h.metrics, R"("event":"job_state_change")"), 3u);
    EXPECT_EQ(count_containing(h.metrics, R"("event":"environment_allocated")"), 1u);
    EXPECT_EQ(count_containing(h.metrics, R"("event":"environment_released")"), 1u);
    EXPECT_EQ(count_containing(h.metrics, R"("event":"environment_registered")"), 1u);
    EXPECT_GE(count_containing(h.metrics, R"("event":"queue_snapshot")"), 1u);

    auto metrics = h.service->get_system_metrics();
    EXPECT_TRUE(metrics.running);
    EXPECT_EQ(metrics.max_concurrent_tests, 2u);
    EXPECT_EQ(metrics.lifetime.completed, 1u);

    h.service->stop();
    EXPECT_GE(count_containing(h.metrics, R"("status":"stopped")"), 1u);
}

TEST(ServiceIntegration, UnplaceableJobReportsExhaustionOnce) {
    auto h = make_harness(fast_config(2));
    ASSERT_TRUE(h.service->add_environment(make_env("x86", "x86_64")));
    ASSERT_TRUE(h.service->start());

    auto arm = h.service->submit_job(make_test("arm-only", Duration{10}, "arm64"), Priority::High);
    ASSERT_TRUE(arm.has_value());
    h.service->maintenance_tick();
    h.service->maintenance_tick();

    auto metrics = h.service->get_system_metrics();
    EXPECT_EQ(metrics.recovery.total_errors, 1u);
    EXPECT_EQ(status_of(*h.service, *arm).state, JobState::Pending);
    EXPECT_FALSE(h.service->get_health_status().degraded_mode);

    h.service->stop();
}

TEST(ServiceIntegration, CriticalErrorDegradesService) {
    auto h = make_harness(fast_config(1));
    ASSERT_TRUE(h.service->start());

    h.service->report_error(ErrorReport{
        .category = ErrorCategory::Persistence,
        .severity = ErrorSeverity::Critical,
        .component = "state_store",
        .message = "disk full",
    });
    EXPECT_TRUE(eventually([&] { return h.service->get_health_status().degraded_mode; }));
    EXPECT_EQ(h.service->get_health_status().status, HealthStatus::Degraded);

    h.service->stop();
}
