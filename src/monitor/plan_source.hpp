/**
 * @file plan_source.hpp
 * @brief External execution-plan stores polled by the queue monitor.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace kernel_orchestrator {

enum class PlanStatus : uint8_t {
    Queued,
    Running,
    Completed,
    Failed
};

[[nodiscard]] constexpr std::string_view to_string(PlanStatus status) noexcept {
    switch (status) {
        case PlanStatus::Queued:    return "queued";
        case PlanStatus::Running:   return "running";
        case PlanStatus::Completed: return "completed";
        case PlanStatus::Failed:    return "failed";
    }
    return "unknown";
}

/**
 * @brief A batch of tests submitted together.
 *
 * `priority` is 1 (highest) … 10 (lowest). Tests are resolved against the
 * catalog by id unless the plan carries its own definition.
 */
struct ExecutionPlan {
    PlanId plan_id;
    std::vector<TestCaseId> test_case_ids;
    std::vector<TestCase> inline_tests;
    int priority{5};
    PlanStatus status{PlanStatus::Queued};
    Timestamp created_at;
};

class IPlanSource {
public:
    virtual ~IPlanSource() = default;

    /// Plans still in the Queued state.
    virtual Result<std::vector<ExecutionPlan>> fetch_queued() = 0;

    virtual Result<void> update_status(const PlanId& plan_id, PlanStatus status) = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

// ─────────────────────────────────────────────
// InMemoryPlanSource
// ─────────────────────────────────────────────

class InMemoryPlanSource final : public IPlanSource {
public:
    /// AlreadyExists if the id is taken.
    Result<void> add(ExecutionPlan plan);

    Result<std::vector<ExecutionPlan>> fetch_queued() override;
    Result<void> update_status(const PlanId& plan_id, PlanStatus status) override;
    [[nodiscard]] std::string_view name() const noexcept override { return "memory"; }

    [[nodiscard]] std::optional<PlanStatus> status(const PlanId& plan_id) const;

private:
    mutable std::mutex mutex_;
    std::map<PlanId, ExecutionPlan> plans_;
};

// ─────────────────────────────────────────────
// DirectoryPlanSource
// ─────────────────────────────────────────────

/**
 * @brief One TOML file per plan. Queued plans sit in the root directory;
 *        a status update moves the file into running/, completed/ or failed/.
 *
 *   plan_id = "plan-42"             # defaults to the file stem
 *   priority = 3
 *   created_at_ms = 1735689600000   # optional; FIFO key within a level
 *   test_case_ids = ["mm-001"]
 *   [[test]]                        # optional inline definitions
 */
class DirectoryPlanSource final : public IPlanSource {
public:
    explicit DirectoryPlanSource(std::filesystem::path root);

    Result<std::vector<ExecutionPlan>> fetch_queued() override;
    Result<void> update_status(const PlanId& plan_id, PlanStatus status) override;
    [[nodiscard]] std::string_view name() const noexcept override { return "directory"; }

    /// Unreadable files the last fetch moved to failed/.
    [[nodiscard]] std::vector<std::filesystem::path> rejected_files() const;

    [[nodiscard]] static Result<ExecutionPlan> parse_plan(std::string_view toml_text,
                                                          const std::string& default_id);

private:
    std::filesystem::path status_dir(PlanStatus status) const;

    std::filesystem::path root_;
    mutable std::mutex mutex_;
    std::map<PlanId, std::filesystem::path> locations_;
    std::vector<std::filesystem::path> rejected_;
};

}  // namespace kernel_orchestrator
