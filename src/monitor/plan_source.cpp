/**
 * @file plan_source.cpp
 * @brief In-memory and directory-backed plan sources.
 */

#include "monitor/plan_source.hpp"
#include "core/toml_codec.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

namespace kernel_orchestrator {

// ─────────────────────────────────────────────
// InMemoryPlanSource
// ─────────────────────────────────────────────

Result<void> InMemoryPlanSource::add(ExecutionPlan plan) {
    std::lock_guard lock(mutex_);
    if (plans_.count(plan.plan_id) > 0) {
        return Error{ErrorCode::AlreadyExists, "Plan already exists: " + plan.plan_id};
    }
    auto id = plan.plan_id;
    plans_.emplace(std::move(id), std::move(plan));
    return {};
}

Result<std::vector<ExecutionPlan>> InMemoryPlanSource::fetch_queued() {
    std::lock_guard lock(mutex_);
    std::vector<ExecutionPlan> queued;
    for (const auto& [id, plan] : plans_) {
        if (plan.status == PlanStatus::Queued) queued.push_back(plan);
    }
    return queued;
}

Result<void> InMemoryPlanSource::update_status(const PlanId& plan_id, PlanStatus status) {
    std::lock_guard lock(mutex_);
    auto it = plans_.find(plan_id);
    if (it == plans_.end()) {
        return Error{ErrorCode::NotFound, "Unknown plan: " + plan_id};
    }
    it->second.status = status;
    return {};
}

std::optional<PlanStatus> InMemoryPlanSource::status(const PlanId& plan_id) const {
    std::lock_guard lock(mutex_);
    auto it = plans_.find(plan_id);
    if (it == plans_.end()) return std::nullopt;
    return it->second.status;
}

// ─────────────────────────────────────────────
// DirectoryPlanSource
// ─────────────────────────────────────────────

namespace {

Result<void> move_into(const std::filesystem::path& file, const std::filesystem::path& dir,
                       std::filesystem::path& moved_to) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return Error{ErrorCode::Io, "Cannot create " + dir.string() + ": " + ec.message()};
    }
    auto target = dir / file.filename();
    std::filesystem::rename(file, target, ec);
    if (ec) {
        return Error{ErrorCode::Io, "Cannot move " + file.string() + ": " + ec.message()};
    }
    moved_to = target;
    return {};
}

}  // anonymous namespace

DirectoryPlanSource::DirectoryPlanSource(std::filesystem::path root) : root_(std::move(root)) {}

std::filesystem::path DirectoryPlanSource::status_dir(PlanStatus status) const {
    if (status == PlanStatus::Queued) return root_;
    return root_ / std::string{to_string(status)};
}

Result<ExecutionPlan> DirectoryPlanSource::parse_plan(std::string_view toml_text,
                                                      const std::string& default_id) {
    toml::table document;
    try {
        document = toml::parse(toml_text);
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::Parse,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }

    ExecutionPlan plan;
    plan.plan_id = document["plan_id"].value_or(default_id);
    if (plan.plan_id.empty()) {
        return Error{ErrorCode::Parse, "plan without an id"};
    }
    plan.priority = static_cast<int>(document["priority"].value_or(int64_t{5}));
    if (plan.priority < 1 || plan.priority > 10) {
        return Error{ErrorCode::Parse, "plan " + plan.plan_id + ": priority must be in [1, 10]"};
    }
    plan.created_at = Timestamp{std::chrono::milliseconds{document["created_at_ms"].value_or(int64_t{0})}};
    plan.test_case_ids = read_string_array(document, "test_case_ids");

    if (const auto* tests = document["test"].as_array()) {
        for (const auto& node : *tests) {
            const auto* table = node.as_table();
            if (table == nullptr) {
                return Error{ErrorCode::Parse, "plan " + plan.plan_id + ": [[test]] entries must be tables"};
            }
            auto test = test_case_from_toml(*table);
            if (!test) return test.error();
            plan.inline_tests.push_back(std::move(test).value());
        }
    }

    if (plan.test_case_ids.empty() && plan.inline_tests.empty()) {
        return Error{ErrorCode::Parse, "plan " + plan.plan_id + " has no tests"};
    }
    return plan;
}

Result<std::vector<ExecutionPlan>> DirectoryPlanSource::fetch_queued() {
    std::vector<ExecutionPlan> plans;
    std::vector<std::filesystem::path> bad;

    std::error_code ec;
    if (!std::filesystem::is_directory(root_, ec)) {
        return Error{ErrorCode::NotFound, "Plan directory not found: " + root_.string()};
    }

    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::directory_iterator(root_, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == ".toml") {
            files.push_back(entry.path());
        }
    }
    if (ec) {
        return Error{ErrorCode::Io, "Cannot scan " + root_.string() + ": " + ec.message()};
    }

    std::lock_guard lock(mutex_);
    for (const auto& file : files) {
        std::ifstream in(file);
        std::stringstream buffer;
        buffer << in.rdbuf();

        auto plan = in ? parse_plan(buffer.str(), file.stem().string())
                       : Result<ExecutionPlan>{Error{ErrorCode::Io, "unreadable"}};
        if (!plan) {
            std::filesystem::path moved;
            if (move_into(file, status_dir(PlanStatus::Failed), moved)) bad.push_back(moved);
            continue;
        }
        locations_[plan->plan_id] = file;
        plans.push_back(std::move(plan).value());
    }
    rejected_ = std::move(bad);
    return plans;
}

Result<void> DirectoryPlanSource::update_status(const PlanId& plan_id, PlanStatus status) {
    std::lock_guard lock(mutex_);
    auto it = locations_.find(plan_id);
    if (it == locations_.end()) {
        return Error{ErrorCode::NotFound, "Unknown plan: " + plan_id};
    }
    auto target_dir = status_dir(status);
    if (it->second.parent_path() == target_dir) return {};

    std::filesystem::path moved;
    if (auto result = move_into(it->second, target_dir, moved); !result) {
        return result;
    }
    it->second = moved;
    return {};
}

std::vector<std::filesystem::path> DirectoryPlanSource::rejected_files() const {
    std::lock_guard lock(mutex_);
    return rejected_;
}

}  // namespace kernel_orchestrator
