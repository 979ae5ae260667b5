/**
 * @file job_queue.hpp
 * @brief Pending-job ordering: priority tier first, then submission sequence.
 */

#pragma once

#include "core/types.hpp"

#include <set>
#include <unordered_map>
#include <vector>

namespace kernel_orchestrator {

/**
 * @brief Ordered set of pending jobs with O(log n) removal by id.
 *
 * Not thread-safe; the dispatcher lock guards it.
 */
class JobQueue {
public:
    struct Entry {
        Priority priority;
        uint64_t sequence;
        JobId job_id;
    };

    /// False if @p job_id is already queued.
    bool push(const JobId& job_id, Priority priority, uint64_t sequence);
    bool erase(const JobId& job_id);

    /// Move a queued job to another tier, keeping its sequence number.
    bool reprioritize(const JobId& job_id, Priority priority);

    /// Job ids in admission order.
    [[nodiscard]] std::vector<JobId> ordered() const;

    [[nodiscard]] bool contains(const JobId& job_id) const { return index_.count(job_id) > 0; }
    [[nodiscard]] size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

private:
    struct AdmissionOrder {
        bool operator()(const Entry& a, const Entry& b) const noexcept {
            if (a.priority != b.priority) return a.priority > b.priority;
            return a.sequence < b.sequence;
        }
    };

    using EntrySet = std::set<Entry, AdmissionOrder>;

    EntrySet entries_;
    std::unordered_map<JobId, EntrySet::iterator> index_;
};

}  // namespace kernel_orchestrator
