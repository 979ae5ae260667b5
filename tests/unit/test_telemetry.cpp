/**
 * @file test_telemetry.cpp
 * @brief Unit tests for the NDJSON sinks and the metrics collector.
 */

#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"
#include "common/test_helpers.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <iterator>

using namespace kernel_orchestrator;
using kernel_orchestrator::testing::CaptureSink;
using kernel_orchestrator::testing::count_containing;
using kernel_orchestrator::testing::lines_of;

namespace {

std::vector<std::string> read_lines(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    return lines;
}

bool contains(const std::string& haystack, std::string_view needle) {
    return haystack.find(needle) != std::string::npos;
}

}  // namespace

// ═══════════════════════════════════════════════
// JsonFileSink
// ═══════════════════════════════════════════════

class JsonFileSinkTest : public ::testing::Test {
protected:
    std::filesystem::path dir_;

    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / "ko_test_telemetry";
        std::filesystem::remove_all(dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }
};

TEST_F(JsonFileSinkTest, WritesOneLinePerRecord) {
    {
        JsonFileSink sink(dir_, "events");
        ASSERT_TRUE(sink.is_open());
        EXPECT_EQ(sink.current_path(), dir_ / "events.ndjson");
        sink.write(R"({"event":"a"})");
        sink.write(R"({"event":"b"})");
        sink.flush();
    }
    auto lines = read_lines(dir_ / "events.ndjson");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[1], R"({"event":"b"})");
}

TEST_F(JsonFileSinkTest, AppendsAcrossReopen) {
    {
        JsonFileSink sink(dir_, "events");
        sink.write(R"({"n":1})");
    }
    {
        JsonFileSink sink(dir_, "events");
        sink.write(R"({"n":2})");
    }
    EXPECT_EQ(read_lines(dir_ / "events.ndjson").size(), 2u);
}

TEST_F(JsonFileSinkTest, RotatesAndKeepsBoundedHistory) {
    JsonFileSink sink(dir_, "events", 50, 3);
    sink.set_max_file_size_bytes(20);

    // Each record is 12 bytes with its newline, so every write after the first rotates
    for (int i = 0; i < 5; ++i) {
        sink.write(R"({"n":")" + std::to_string(i) + R"("}  )");
    }
    sink.flush();

    EXPECT_EQ(sink.rotated_path(1), dir_ / "events.1.ndjson");
    EXPECT_TRUE(std::filesystem::exists(sink.current_path()));
    EXPECT_TRUE(std::filesystem::exists(sink.rotated_path(1)));
    EXPECT_TRUE(std::filesystem::exists(sink.rotated_path(2)));
    EXPECT_FALSE(std::filesystem::exists(sink.rotated_path(3)));

    EXPECT_TRUE(contains(read_lines(sink.current_path()).at(0), R"("n":"4")"));
    EXPECT_TRUE(contains(read_lines(sink.rotated_path(1)).at(0), R"("n":"3")"));
    EXPECT_TRUE(contains(read_lines(sink.rotated_path(2)).at(0), R"("n":"2")"));
}

TEST_F(JsonFileSinkTest, OversizedFirstRecordIsStillWritten) {
    JsonFileSink sink(dir_, "big", 50, 2);
    sink.set_max_file_size_bytes(4);
    sink.write(R"({"event":"larger than the limit"})");
    sink.flush();
    EXPECT_EQ(read_lines(sink.current_path()).size(), 1u);
    EXPECT_FALSE(std::filesystem::exists(sink.rotated_path(1)));
}

TEST(NullSinkTest, DiscardsEverything) {
    NullSink sink;
    sink.write("anything");
    sink.flush();
    SUCCEED();
}

// ═══════════════════════════════════════════════
// MetricsCollector
// ═══════════════════════════════════════════════

class MetricsCollectorTest : public ::testing::Test {
protected:
    std::shared_ptr<CaptureSink::Buffer> buffer_ = std::make_shared<CaptureSink::Buffer>();
    MetricsCollector metrics_{std::make_unique<CaptureSink>(buffer_)};

    static JobTransition transition(std::optional<JobState> from, JobState to) {
        JobTransition t;
        t.job_id = "job-1";
        t.test_case_id = "mm-001";
        t.plan_id = "nightly";
        t.from = from;
        t.to = to;
        t.at = std::chrono::system_clock::now();
        t.environment_id = "qemu-1";
        t.execution_time = Duration{1234};
        return t;
    }
};

TEST_F(MetricsCollectorTest, SubmissionHasNoFromState) {
    auto t = transition(std::nullopt, JobState::Pending);
    t.environment_id.reset();
    metrics_.record_transition(t);

    auto lines = lines_of(buffer_);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_TRUE(contains(lines[0], R"({"event":"job_state_change","ts_ms":)"));
    EXPECT_TRUE(contains(lines[0], R"("to":"pending")"));
    EXPECT_TRUE(contains(lines[0], R"("plan":"nightly")"));
    EXPECT_FALSE(contains(lines[0], R"("from")"));
    EXPECT_FALSE(contains(lines[0], R"("duration_ms")"));
}

TEST_F(MetricsCollectorTest, AdmissionAlsoRecordsAllocation) {
    metrics_.record_transition(transition(JobState::Pending, JobState::Running));

    auto lines = lines_of(buffer_);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_TRUE(contains(lines[0], R"("from":"pending","to":"running")"));
    EXPECT_TRUE(contains(lines[1], R"("event":"environment_allocated")"));
    EXPECT_TRUE(contains(lines[1], R"("environment":"qemu-1","detail":"job-1")"));
    EXPECT_EQ(metrics_.events_emitted(), 2u);
}

TEST_F(MetricsCollectorTest, TerminalStateRecordsReleaseAndDuration) {
    auto t = transition(JobState::Running, JobState::Completed);
    t.detail = "exit \"0\"";
    metrics_.record_transition(t);

    auto lines = lines_of(buffer_);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_TRUE(contains(lines[0], R"("duration_ms":1234)"));
    EXPECT_TRUE(contains(lines[0], R"("detail":"exit \"0\"")"));
    EXPECT_TRUE(contains(lines[1], R"("event":"environment_released")"));
}

TEST_F(MetricsCollectorTest, PendingCancellationHasNoEnvironmentEvent) {
    auto t = transition(JobState::Pending, JobState::Cancelled);
    t.environment_id.reset();
    metrics_.record_transition(t);
    EXPECT_EQ(metrics_.events_emitted(), 1u);
}

TEST_F(MetricsCollectorTest, OtherEventKinds) {
    metrics_.record_timeout("job-9", TimeoutStage::ForceTerminate);
    metrics_.record_error("err-1", ErrorReport{
        .category = ErrorCategory::EnvironmentFailure,
        .severity = ErrorSeverity::High,
        .component = "registry",
        .message = "board unplugged",
        .job_id = std::nullopt,
        .environment_id = "rpi4-1",
    });
    metrics_.record_health_change(HealthStatus::Degraded, "dispatcher: listener failed");
    metrics_.record_queue_snapshot(QueueSnapshot{
        .running_jobs = 2,
        .pending_jobs = 7,
        .available_environments = 1,
        .allocated_environments = 2,
        .total_environments = 3,
    });
    metrics_.record_custom("plan_poll", R"({"accepted":2})");
    metrics_.flush();

    auto lines = lines_of(buffer_);
    ASSERT_EQ(lines.size(), 5u);
    EXPECT_TRUE(contains(lines[0], R"("event":"timeout")"));
    EXPECT_TRUE(contains(lines[0], R"("stage":"force_terminate")"));
    EXPECT_TRUE(contains(lines[1], R"("category":"environment_failure","severity":"high")"));
    EXPECT_TRUE(contains(lines[1], R"("environment":"rpi4-1")"));
    EXPECT_FALSE(contains(lines[1], R"("job")"));
    EXPECT_TRUE(contains(lines[2], R"("status":"degraded")"));
    EXPECT_TRUE(contains(lines[3], R"("running":2,"pending":7,"available_envs":1)"));
    EXPECT_TRUE(contains(lines[4], R"({"event":"plan_poll")"));
    EXPECT_TRUE(contains(lines[4], R"("data":{"accepted":2}})"));

    EXPECT_EQ(count_containing(buffer_, R"("ts_ms":)"), 5u);
    EXPECT_EQ(metrics_.events_emitted(), 5u);
}
