/**
 * @file resource_matcher.cpp
 * @brief ResourceMatcher implementation.
 */

#include "environment/resource_matcher.hpp"

#include <algorithm>
#include <tuple>

namespace kernel_orchestrator {

ResourceMatcher::ResourceMatcher(EnvironmentRegistry& registry, MatcherConfig config)
    : registry_(registry), config_(config) {}

bool ResourceMatcher::is_compatible(const HardwareProfile& profile,
                                    const HardwareRequirement& requirement) noexcept {
    if (!requirement.architecture.empty() && profile.architecture != requirement.architecture) {
        return false;
    }
    if (!requirement.cpu_model.empty() && profile.cpu_model != requirement.cpu_model) {
        return false;
    }
    if (profile.memory_mb < requirement.memory_mb) {
        return false;
    }
    if (requirement.is_virtual && *requirement.is_virtual != profile.is_virtual) {
        return false;
    }
    for (const auto& peripheral : requirement.peripherals) {
        if (std::find(profile.peripherals.begin(), profile.peripherals.end(), peripheral)
            == profile.peripherals.end()) {
            return false;
        }
    }
    return true;
}

bool ResourceMatcher::is_light(const TestCase& test) const noexcept {
    return test.requirement.memory_mb <= config_.light_memory_mb
        && test.estimated_duration.count() <= static_cast<int64_t>(config_.light_duration_ms)
        && !is_cpu_intensive(test.test_type);
}

int ResourceMatcher::backend_rank(BackendKind kind, bool light) const noexcept {
    if (light) {
        switch (kind) {
            case BackendKind::Container:    return 0;
            case BackendKind::FullEmulator: return 1;
            case BackendKind::Physical:     return 2;
        }
    } else {
        switch (kind) {
            case BackendKind::FullEmulator: return 0;
            case BackendKind::Physical:     return 1;
            case BackendKind::Container:    return 2;
        }
    }
    return 3;
}

std::optional<EnvironmentId> ResourceMatcher::select(
    const std::vector<const EnvironmentRecord*>& idle, const TestCase& test) const {
    const bool light = is_light(test);

    const EnvironmentRecord* best = nullptr;
    int best_rank = 0;
    for (const auto* record : idle) {
        if (!is_compatible(record->environment.hardware, test.requirement)) continue;

        int rank = backend_rank(record->environment.hardware.backend, light);
        if (!best
            || std::tie(rank, record->last_released, record->environment.id)
               < std::tie(best_rank, best->last_released, best->environment.id)) {
            best = record;
            best_rank = rank;
        }
    }

    if (!best) return std::nullopt;
    return best->environment.id;
}

std::optional<Environment> ResourceMatcher::find_match(const TestCase& test) const {
    std::vector<EnvironmentRecord> snapshot;
    registry_.visit([&](const EnvironmentRecord& record) {
        if (record.state == AllocationState::Idle && !record.retiring) {
            snapshot.push_back(record);
        }
    });

    std::vector<const EnvironmentRecord*> idle;
    idle.reserve(snapshot.size());
    for (const auto& record : snapshot) idle.push_back(&record);

    auto chosen = select(idle, test);
    if (!chosen) return std::nullopt;
    for (const auto& record : snapshot) {
        if (record.environment.id == *chosen) return record.environment;
    }
    return std::nullopt;
}

std::optional<Environment> ResourceMatcher::allocate(const JobId& job_id, const TestCase& test) {
    return registry_.allocate_with(job_id,
        [this, &test](const std::vector<const EnvironmentRecord*>& idle) {
            return select(idle, test);
        });
}

bool ResourceMatcher::any_compatible(const TestCase& test) const {
    bool found = false;
    registry_.visit([&](const EnvironmentRecord& record) {
        if (!record.retiring && is_compatible(record.environment.hardware, test.requirement)) {
            found = true;
        }
    });
    return found;
}

}  // namespace kernel_orchestrator
