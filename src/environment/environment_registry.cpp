/**
 * @file environment_registry.cpp
 * @brief EnvironmentRegistry implementation.
 */

#include "environment/environment_registry.hpp"

namespace kernel_orchestrator {

Result<void> EnvironmentRegistry::register_environment(Environment environment) {
    if (environment.id.empty()) {
        return Error{ErrorCode::InvalidArgument, "Environment id must not be empty"};
    }

    std::lock_guard lock(mutex_);
    auto now = std::chrono::steady_clock::now();

    auto it = records_.find(environment.id);
    if (it != records_.end()) {
        if (!it->second.retiring) {
            return Error{ErrorCode::AlreadyExists, "Environment already registered: " + environment.id};
        }
        // Removed while in use and added back before the job finished
        it->second.retiring = false;
        it->second.environment = std::move(environment);
        return {};
    }

    EnvironmentRecord record;
    record.registered_at = now;
    record.last_released = now;
    record.environment = std::move(environment);
    auto id = record.environment.id;
    records_.emplace(std::move(id), std::move(record));
    return {};
}

Result<void> EnvironmentRegistry::deregister(const EnvironmentId& id) {
    std::lock_guard lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end() || it->second.retiring) {
        return Error{ErrorCode::NotFound, "Unknown environment: " + id};
    }

    if (it->second.state == AllocationState::Allocated) {
        it->second.retiring = true;
    } else {
        records_.erase(it);
    }
    return {};
}

Result<std::optional<JobId>> EnvironmentRegistry::evict(const EnvironmentId& id) {
    std::lock_guard lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) {
        return Error{ErrorCode::NotFound, "Unknown environment: " + id};
    }
    std::optional<JobId> holder = it->second.holder;
    records_.erase(it);
    return holder;
}

Result<void> EnvironmentRegistry::allocate(const EnvironmentId& id, const JobId& job_id) {
    std::lock_guard lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end() || it->second.retiring) {
        return Error{ErrorCode::NotFound, "Unknown environment: " + id};
    }
    return allocate_locked(it->second, job_id, std::chrono::steady_clock::now());
}

Result<void> EnvironmentRegistry::allocate_locked(EnvironmentRecord& record,
                                                  const JobId& job_id,
                                                  SteadyTime now) {
    if (record.state == AllocationState::Allocated) {
        return Error{ErrorCode::Unavailable,
                     "Environment " + record.environment.id + " already held by " + record.holder.value_or("?")};
    }
    record.state = AllocationState::Allocated;
    record.holder = job_id;
    record.allocated_at = now;
    return {};
}

Result<void> EnvironmentRegistry::release(const EnvironmentId& id, const JobId& job_id) {
    std::lock_guard lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) {
        return Error{ErrorCode::NotFound, "Unknown environment: " + id};
    }

    auto& record = it->second;
    if (record.state != AllocationState::Allocated || record.holder != job_id) {
        return Error{ErrorCode::InvalidArgument,
                     "Environment " + id + " is not held by job " + job_id};
    }

    auto now = std::chrono::steady_clock::now();
    record.busy_time += std::chrono::duration_cast<Duration>(now - record.allocated_at);
    record.jobs_run++;
    record.last_released = now;
    record.state = AllocationState::Idle;
    record.holder.reset();

    if (record.retiring) {
        records_.erase(it);
    }
    return {};
}

std::optional<Environment> EnvironmentRegistry::get(const EnvironmentId& id) const {
    std::lock_guard lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) return std::nullopt;
    return it->second.environment;
}

std::optional<JobId> EnvironmentRegistry::holder(const EnvironmentId& id) const {
    std::lock_guard lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) return std::nullopt;
    return it->second.holder;
}

bool EnvironmentRegistry::contains(const EnvironmentId& id) const {
    std::lock_guard lock(mutex_);
    return records_.count(id) > 0;
}

std::vector<Environment> EnvironmentRegistry::environments() const {
    std::lock_guard lock(mutex_);
    std::vector<Environment> result;
    result.reserve(records_.size());
    for (const auto& [id, record] : records_) {
        result.push_back(record.environment);
    }
    return result;
}

size_t EnvironmentRegistry::total_count() const {
    std::lock_guard lock(mutex_);
    return records_.size();
}

size_t EnvironmentRegistry::available_count() const {
    std::lock_guard lock(mutex_);
    size_t count = 0;
    for (const auto& [id, record] : records_) {
        if (record.state == AllocationState::Idle) ++count;
    }
    return count;
}

size_t EnvironmentRegistry::allocated_count() const {
    std::lock_guard lock(mutex_);
    size_t count = 0;
    for (const auto& [id, record] : records_) {
        if (record.state == AllocationState::Allocated) ++count;
    }
    return count;
}

std::vector<EnvironmentUsage> EnvironmentRegistry::usage() const {
    std::lock_guard lock(mutex_);
    auto now = std::chrono::steady_clock::now();

    std::vector<EnvironmentUsage> result;
    result.reserve(records_.size());
    for (const auto& [id, record] : records_) {
        EnvironmentUsage u;
        u.id = id;
        u.state = record.state;
        u.jobs_run = record.jobs_run;
        u.busy_time = record.busy_time;
        if (record.state == AllocationState::Allocated) {
            u.busy_time += std::chrono::duration_cast<Duration>(now - record.allocated_at);
        }
        u.registered_for = std::chrono::duration_cast<Duration>(now - record.registered_at);
        u.retiring = record.retiring;
        result.push_back(std::move(u));
    }
    return result;
}

bool EnvironmentRegistry::check_invariants() const {
    std::lock_guard lock(mutex_);
    size_t idle = 0;
    size_t allocated = 0;
    for (const auto& [id, record] : records_) {
        if (record.state == AllocationState::Idle) {
            if (record.holder || record.retiring) return false;
            ++idle;
        } else {
            if (!record.holder) return false;
            ++allocated;
        }
    }
    return idle + allocated == records_.size();
}

}  // namespace kernel_orchestrator
