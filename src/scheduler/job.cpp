/**
 * @file job.cpp
 * @brief Job helpers.
 */

#include "scheduler/job.hpp"

#include <array>
#include <cstdio>
#include <mutex>
#include <random>

namespace kernel_orchestrator {

JobStatus to_status(const Job& job) {
    return JobStatus{
        .job_id = job.id,
        .test_case_id = job.test_case.id,
        .state = job.state,
        .priority = job.priority,
        .impact_score = job.impact_score,
        .plan_id = job.plan_id,
        .environment = job.environment,
        .submitted_at = job.submitted_at,
        .started_at = job.started_at,
        .result = job.result,
        .waiting_on = job.waiting_on
    };
}

JobId generate_job_id() {
    static std::mutex rng_mutex;
    static std::mt19937_64 rng{std::random_device{}()};

    uint64_t hi;
    uint64_t lo;
    {
        std::lock_guard lock(rng_mutex);
        hi = rng();
        lo = rng();
    }

    // Version 4 / variant 1 bits so the id reads as a UUID
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::array<char, 37> buf{};
    std::snprintf(buf.data(), buf.size(), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32),
                  static_cast<unsigned>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned>(hi & 0xFFFF),
                  static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return JobId{buf.data()};
}

}  // namespace kernel_orchestrator
