/**
 * @file job_queue.cpp
 * @brief JobQueue implementation.
 */

#include "scheduler/job_queue.hpp"

namespace kernel_orchestrator {

bool JobQueue::push(const JobId& job_id, Priority priority, uint64_t sequence) {
    if (index_.count(job_id) > 0) return false;
    auto [it, inserted] = entries_.insert(Entry{priority, sequence, job_id});
    if (!inserted) return false;
    index_.emplace(job_id, it);
    return true;
}

bool JobQueue::erase(const JobId& job_id) {
    auto it = index_.find(job_id);
    if (it == index_.end()) return false;
    entries_.erase(it->second);
    index_.erase(it);
    return true;
}

bool JobQueue::reprioritize(const JobId& job_id, Priority priority) {
    auto it = index_.find(job_id);
    if (it == index_.end()) return false;

    Entry entry = *it->second;
    if (entry.priority == priority) return true;

    entries_.erase(it->second);
    entry.priority = priority;
    it->second = entries_.insert(std::move(entry)).first;
    return true;
}

std::vector<JobId> JobQueue::ordered() const {
    std::vector<JobId> ids;
    ids.reserve(entries_.size());
    for (const auto& entry : entries_) {
        ids.push_back(entry.job_id);
    }
    return ids;
}

}  // namespace kernel_orchestrator
