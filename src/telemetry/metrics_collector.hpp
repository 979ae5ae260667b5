/**
 * @file metrics_collector.hpp
 * @brief Structured event collection for telemetry.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"
#include "recovery/error_recovery.hpp"
#include "scheduler/job.hpp"
#include "timeout/timeout_manager.hpp"

#include <atomic>
#include <memory>
#include <mutex>

namespace kernel_orchestrator {

/**
 * @brief Collects and logs structured telemetry events as NDJSON.
 *
 * Every line is {"event":"...","ts_ms":<epoch ms>,...}.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    /// Job state change. Admission and release also emit environment events.
    void record_transition(const JobTransition& transition);
    void record_environment_event(const EnvironmentId& env_id, std::string_view event_type,
                                  std::string_view detail = {});
    void record_timeout(const JobId& job_id, TimeoutStage stage);
    void record_error(const std::string& error_id, const ErrorReport& report);
    void record_health_change(HealthStatus status, std::string_view detail);
    void record_queue_snapshot(const QueueSnapshot& snapshot);
    void record_custom(std::string_view event, std::string_view json_payload);

    void flush();

    [[nodiscard]] uint64_t events_emitted() const noexcept { return events_.load(); }

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;
    std::atomic<uint64_t> events_{0};

    void emit(std::string_view json_line);
};

}  // namespace kernel_orchestrator
