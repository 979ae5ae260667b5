/**
 * @file test_types.cpp
 * @brief Unit tests for core types.
 */

#include "core/types.hpp"

#include <gtest/gtest.h>

using namespace kernel_orchestrator;

TEST(PriorityTest, ToStringAndParse) {
    EXPECT_EQ(to_string(Priority::Low), "low");
    EXPECT_EQ(to_string(Priority::Critical), "critical");
    EXPECT_EQ(parse_priority("high"), Priority::High);
    EXPECT_EQ(parse_priority("medium"), Priority::Medium);
    EXPECT_FALSE(parse_priority("urgent").has_value());
}

TEST(PriorityTest, TiersAreOrdered) {
    EXPECT_GT(static_cast<int>(Priority::Critical), static_cast<int>(Priority::High));
    EXPECT_GT(static_cast<int>(Priority::High), static_cast<int>(Priority::Medium));
    EXPECT_GT(static_cast<int>(Priority::Medium), static_cast<int>(Priority::Low));
}

TEST(PriorityTest, PlanLevelMapping) {
    EXPECT_EQ(priority_from_plan_level(1), Priority::Critical);
    EXPECT_EQ(priority_from_plan_level(2), Priority::Critical);
    EXPECT_EQ(priority_from_plan_level(3), Priority::High);
    EXPECT_EQ(priority_from_plan_level(5), Priority::Medium);
    EXPECT_EQ(priority_from_plan_level(6), Priority::Medium);
    EXPECT_EQ(priority_from_plan_level(7), Priority::Low);
    EXPECT_EQ(priority_from_plan_level(10), Priority::Low);
}

TEST(JobStateTest, ToString) {
    EXPECT_EQ(to_string(JobState::Pending), "pending");
    EXPECT_EQ(to_string(JobState::Running), "running");
    EXPECT_EQ(to_string(JobState::Completed), "completed");
    EXPECT_EQ(to_string(JobState::Timeout), "timeout");
    EXPECT_EQ(to_string(JobState::Cancelled), "cancelled");
}

TEST(JobStateTest, TerminalStates) {
    EXPECT_FALSE(is_terminal(JobState::Pending));
    EXPECT_FALSE(is_terminal(JobState::Running));
    EXPECT_TRUE(is_terminal(JobState::Completed));
    EXPECT_TRUE(is_terminal(JobState::Failed));
    EXPECT_TRUE(is_terminal(JobState::Timeout));
    EXPECT_TRUE(is_terminal(JobState::Cancelled));
}

TEST(BackendKindTest, ParseAliases) {
    EXPECT_EQ(parse_backend_kind("container"), BackendKind::Container);
    EXPECT_EQ(parse_backend_kind("docker"), BackendKind::Container);
    EXPECT_EQ(parse_backend_kind("qemu"), BackendKind::FullEmulator);
    EXPECT_EQ(parse_backend_kind("board"), BackendKind::Physical);
    EXPECT_FALSE(parse_backend_kind("vm").has_value());
}

TEST(TestTypeTest, CpuIntensive) {
    EXPECT_EQ(parse_test_type("fuzz"), TestType::Fuzz);
    EXPECT_TRUE(is_cpu_intensive(TestType::Performance));
    EXPECT_TRUE(is_cpu_intensive(TestType::Stress));
    EXPECT_TRUE(is_cpu_intensive(TestType::Fuzz));
    EXPECT_FALSE(is_cpu_intensive(TestType::Unit));
    EXPECT_FALSE(is_cpu_intensive(TestType::Security));
}

TEST(HardwareRequirementTest, DefaultsMatchAnything) {
    HardwareRequirement req;
    EXPECT_TRUE(req.architecture.empty());
    EXPECT_EQ(req.memory_mb, 0u);
    EXPECT_FALSE(req.is_virtual.has_value());
}
