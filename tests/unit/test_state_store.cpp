/**
 * @file test_state_store.cpp
 * @brief Unit tests for the TOML state file and its backup fallback.
 */

#include "recovery/state_store.hpp"
#include "common/test_helpers.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

using namespace kernel_orchestrator;
using kernel_orchestrator::testing::make_test;

class StateStoreTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "ko_test_state";
        std::filesystem::remove_all(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }

    static PersistedState sample_state() {
        PersistedState state;
        auto mm = make_test("mm-001", Duration{5000}, "x86_64", 512);
        mm.target_subsystem = "mm";
        state.jobs.push_back(JobRequest{
            .test_case = mm,
            .priority = Priority::Critical,
            .impact_score = 0.75,
            .plan_id = "nightly",
            .job_id = "job-a",
        });
        state.jobs.push_back(JobRequest{
            .test_case = make_test("fs-002", Duration{100}),
            .priority = Priority::Low,
            .impact_score = 0.0,
            .plan_id = std::nullopt,
            .job_id = "job-b",
            .dependencies = {"job-a"},
        });
        state.counters = PersistedCounters{
            .submitted = 10, .completed = 6, .failed = 1, .timed_out = 1, .cancelled = 0};
        state.saved_at = std::chrono::system_clock::now();
        return state;
    }
};

TEST_F(StateStoreTest, MissingFileIsEmptyState) {
    StateStore store(temp_dir_ / "state.toml");
    auto state = store.load();
    ASSERT_TRUE(state.has_value());
    EXPECT_TRUE(state->jobs.empty());
    EXPECT_EQ(state->counters.submitted, 0u);
    EXPECT_FALSE(state->from_backup);
}

TEST_F(StateStoreTest, SaveCreatesDirectoriesAndReloads) {
    StateStore store(temp_dir_ / "nested" / "state.toml");
    auto original = sample_state();
    ASSERT_TRUE(store.save(original));
    EXPECT_TRUE(std::filesystem::exists(store.path()));

    auto loaded = store.load();
    ASSERT_TRUE(loaded.has_value()) << loaded.error().message;
    ASSERT_EQ(loaded->jobs.size(), 2u);

    const auto& first = loaded->jobs[0];
    ASSERT_TRUE(first.job_id.has_value());
    EXPECT_EQ(*first.job_id, "job-a");
    ASSERT_TRUE(first.plan_id.has_value());
    EXPECT_EQ(*first.plan_id, "nightly");
    EXPECT_EQ(first.priority, Priority::Critical);
    EXPECT_DOUBLE_EQ(first.impact_score, 0.75);
    EXPECT_EQ(first.test_case.id, "mm-001");
    EXPECT_EQ(first.test_case.target_subsystem, "mm");
    EXPECT_EQ(first.test_case.requirement.memory_mb, 512u);
    EXPECT_EQ(first.test_case.estimated_duration, Duration{5000});

    EXPECT_FALSE(loaded->jobs[1].plan_id.has_value());
    EXPECT_TRUE(first.dependencies.empty());
    EXPECT_EQ(loaded->jobs[1].dependencies, std::vector<JobId>{"job-a"});
    EXPECT_EQ(loaded->counters.completed, 6u);
    EXPECT_EQ(loaded->counters.timed_out, 1u);

    auto saved_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        original.saved_at.time_since_epoch()).count();
    auto loaded_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        loaded->saved_at.time_since_epoch()).count();
    EXPECT_EQ(saved_ms, loaded_ms);
}

TEST_F(StateStoreTest, SecondSaveKeepsBackup) {
    StateStore store(temp_dir_ / "state.toml");
    auto state = sample_state();
    ASSERT_TRUE(store.save(state));
    EXPECT_FALSE(std::filesystem::exists(store.backup_path()));

    state.jobs.pop_back();
    ASSERT_TRUE(store.save(state));
    EXPECT_TRUE(std::filesystem::exists(store.backup_path()));

    auto path = store.path();
    path += ".tmp";
    EXPECT_FALSE(std::filesystem::exists(path));
    EXPECT_EQ(store.load()->jobs.size(), 1u);
}

TEST_F(StateStoreTest, CorruptPrimaryFallsBackToBackup) {
    StateStore store(temp_dir_ / "state.toml");
    auto state = sample_state();
    ASSERT_TRUE(store.save(state));
    ASSERT_TRUE(store.save(state));

    {
        std::ofstream out(store.path(), std::ios::trunc);
        out << "version = [[[ broken";
    }

    auto loaded = store.load();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_TRUE(loaded->from_backup);
    EXPECT_EQ(loaded->jobs.size(), 2u);
}

TEST_F(StateStoreTest, CorruptWithoutBackupIsError) {
    std::filesystem::create_directories(temp_dir_);
    StateStore store(temp_dir_ / "state.toml");
    {
        std::ofstream out(store.path());
        out << "not = [valid";
    }
    auto loaded = store.load();
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, ErrorCode::Parse);
}

TEST_F(StateStoreTest, NonStringDependencyIsParseError) {
    StateStore store(temp_dir_ / "state.toml");
    ASSERT_TRUE(store.save(sample_state()));

    std::ifstream in(store.path());
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    in.close();
    auto pos = text.find("dependencies");
    ASSERT_NE(pos, std::string::npos);
    text.replace(pos, text.find('\n', pos) - pos, "dependencies = [ 42 ]");
    std::ofstream(store.path(), std::ios::trunc) << text;

    auto loaded = store.load();
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, ErrorCode::Parse);
}

TEST_F(StateStoreTest, RejectsUnknownVersion) {
    std::filesystem::create_directories(temp_dir_);
    StateStore store(temp_dir_ / "state.toml");
    {
        std::ofstream out(store.path());
        out << "version = 99\n";
    }
    auto loaded = store.load();
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, ErrorCode::Parse);
}

TEST_F(StateStoreTest, UnwritableLocationIsIoError) {
    StateStore store("/proc/ko_cannot_write_here/state.toml");
    auto saved = store.save(sample_state());
    ASSERT_FALSE(saved.has_value());
    EXPECT_EQ(saved.error().code, ErrorCode::Io);
}
