/**
 * @file queue_monitor.cpp
 * @brief QueueMonitor implementation.
 */

#include "monitor/queue_monitor.hpp"

#include <algorithm>
#include <exception>
#include <tuple>

namespace kernel_orchestrator {

namespace {

constexpr std::string_view COMPONENT = "queue_monitor";

}  // anonymous namespace

QueueMonitor::QueueMonitor(IPlanSource& source,
                           const TestCatalog& catalog,
                           StatusTracker& tracker,
                           SubmitFn submit,
                           Logger& logger)
    : source_(source),
      catalog_(catalog),
      tracker_(tracker),
      submit_(std::move(submit)),
      logger_(logger) {}

std::vector<TestCase> QueueMonitor::resolve(const ExecutionPlan& plan, size_t& unresolved) const {
    if (plan.test_case_ids.empty()) return plan.inline_tests;

    std::vector<TestCase> tests;
    tests.reserve(plan.test_case_ids.size());
    for (const auto& id : plan.test_case_ids) {
        auto inline_it = std::find_if(plan.inline_tests.begin(), plan.inline_tests.end(),
                                      [&](const TestCase& t) { return t.id == id; });
        if (inline_it != plan.inline_tests.end()) {
            tests.push_back(*inline_it);
        } else if (auto test = catalog_.find(id)) {
            tests.push_back(std::move(*test));
        } else {
            ++unresolved;
            logger_.warn(COMPONENT, "Plan " + plan.plan_id + " references unknown test " + id);
        }
    }
    return tests;
}

Result<PollReport> QueueMonitor::poll() {
    Result<std::vector<ExecutionPlan>> fetched = std::vector<ExecutionPlan>{};
    try {
        fetched = source_.fetch_queued();
    } catch (const std::exception& e) {
        fetched = Error{ErrorCode::Unavailable, e.what()};
    }

    {
        std::lock_guard lock(mutex_);
        ++stats_.polls;
        stats_.last_poll = std::chrono::system_clock::now();
        if (!fetched) {
            ++stats_.poll_errors;
            last_poll_failed_ = true;
            last_error_ = fetched.error().message;
        } else {
            last_poll_failed_ = false;
        }
    }
    if (!fetched) {
        logger_.error(COMPONENT, "Polling " + std::string(source_.name()) + " failed: "
                      + fetched.error().message);
        return fetched.error();
    }

    std::vector<ExecutionPlan> fresh;
    {
        std::lock_guard lock(mutex_);
        for (auto& plan : *fetched) {
            if (known_plans_.try_emplace(plan.plan_id).second) fresh.push_back(std::move(plan));
        }
        stats_.plans_detected += fresh.size();
    }
    std::sort(fresh.begin(), fresh.end(), [](const ExecutionPlan& a, const ExecutionPlan& b) {
        return std::tie(a.priority, a.created_at, a.plan_id) < std::tie(b.priority, b.created_at, b.plan_id);
    });

    PollReport report{.new_plans = fresh.size()};
    for (const auto& plan : fresh) {
        logger_.info(COMPONENT, "Detected plan " + plan.plan_id + " (level "
                     + std::to_string(plan.priority) + ")");

        size_t unresolved = 0;
        auto tests = resolve(plan, unresolved);
        report.unresolved_tests += unresolved;

        if (tests.empty()) {
            ++report.rejected_plans;
            logger_.error(COMPONENT, "Plan " + plan.plan_id + " has no runnable tests");
            mark_failed(plan.plan_id);
            continue;
        }

        tracker_.register_plan(plan.plan_id, tests.size());
        auto priority = priority_from_plan_level(plan.priority);
        size_t submitted = 0;
        for (auto& test : tests) {
            auto test_id = test.id;
            auto job = submit_(JobRequest{
                .test_case = std::move(test),
                .priority = priority,
                .plan_id = plan.plan_id,
            });
            if (job) {
                ++submitted;
            } else {
                ++report.unresolved_tests;
                logger_.warn(COMPONENT, "Plan " + plan.plan_id + ": test " + test_id
                             + " rejected: " + job.error().message);
            }
        }
        if (submitted != tests.size()) tracker_.register_plan(plan.plan_id, submitted);
        report.jobs_submitted += submitted;

        if (submitted == 0) {
            ++report.rejected_plans;
            logger_.error(COMPONENT, "Plan " + plan.plan_id + " had every test rejected");
            mark_failed(plan.plan_id);
            continue;
        }

        // Claim the plan so a restart does not submit it twice
        if (auto claimed = source_.update_status(plan.plan_id, PlanStatus::Running); !claimed) {
            logger_.warn(COMPONENT, "Cannot mark plan " + plan.plan_id + " running: "
                         + claimed.error().message);
        }
    }

    {
        std::lock_guard lock(mutex_);
        stats_.jobs_submitted += report.jobs_submitted;
    }
    if (report.new_plans > 0) {
        logger_.info(COMPONENT, "Poll found " + std::to_string(report.new_plans) + " new plans, submitted "
                     + std::to_string(report.jobs_submitted) + " jobs");
    }
    return report;
}

size_t QueueMonitor::push_plan_updates() {
    size_t written = 0;
    for (const auto& progress : tracker_.drain_plan_updates()) {
        Result<void> updated;
        try {
            updated = source_.update_status(progress.plan_id, progress.status);
        } catch (const std::exception& e) {
            updated = Error{ErrorCode::Unavailable, e.what()};
        }
        if (!updated) {
            logger_.warn(COMPONENT, "Cannot update plan " + progress.plan_id + " to "
                         + std::string(to_string(progress.status)) + ": " + updated.error().message);
            continue;
        }
        ++written;
        if (progress.status == PlanStatus::Completed || progress.status == PlanStatus::Failed) {
            mark_finished(progress.plan_id);
        }
        logger_.info(COMPONENT, "Plan " + progress.plan_id + " is now " + std::string(to_string(progress.status))
                     + " (" + std::to_string(progress.finished()) + "/" + std::to_string(progress.total) + ")");
    }
    std::lock_guard lock(mutex_);
    stats_.status_updates += written;
    return written;
}

void QueueMonitor::mark_failed(const PlanId& plan_id) {
    if (auto updated = source_.update_status(plan_id, PlanStatus::Failed); !updated) {
        logger_.warn(COMPONENT, "Cannot mark plan " + plan_id + " failed: " + updated.error().message);
        return;
    }
    mark_finished(plan_id);
}

void QueueMonitor::mark_finished(const PlanId& plan_id) {
    std::lock_guard lock(mutex_);
    if (auto it = known_plans_.find(plan_id); it != known_plans_.end()) {
        it->second = std::chrono::steady_clock::now();
    }
}

size_t QueueMonitor::prune(Duration age) {
    auto cutoff = std::chrono::steady_clock::now() - age;
    std::lock_guard lock(mutex_);
    return std::erase_if(known_plans_, [&](const auto& entry) {
        return entry.second && *entry.second < cutoff;
    });
}

bool QueueMonitor::is_known(const PlanId& plan_id) const {
    std::lock_guard lock(mutex_);
    return known_plans_.count(plan_id) > 0;
}

QueueMonitorStats QueueMonitor::stats() const {
    std::lock_guard lock(mutex_);
    return stats_;
}

ComponentHealth QueueMonitor::health() const {
    std::lock_guard lock(mutex_);
    ComponentHealth h{.name = "queue_monitor"};
    h.detail = std::to_string(known_plans_.size()) + " plans seen";
    if (last_poll_failed_) {
        h.status = HealthStatus::Degraded;
        h.detail += ", last poll failed: " + last_error_;
    }
    return h;
}

}  // namespace kernel_orchestrator
