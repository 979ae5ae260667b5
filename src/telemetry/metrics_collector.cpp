/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 */

#include "telemetry/metrics_collector.hpp"

#include <chrono>
#include <sstream>

namespace kernel_orchestrator {

namespace {

/// Opens an event object with its name and timestamp.
std::ostringstream begin_event(std::string_view event) {
    auto ts = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    std::ostringstream oss;
    oss << R"({"event":")" << event << "\""
        << R"(,"ts_ms":)" << ts;
    return oss;
}

}  // anonymous namespace

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_transition(const JobTransition& t) {
    auto oss = begin_event("job_state_change");
    oss << R"(,"job":")" << json_escape(t.job_id) << "\""
        << R"(,"test":")" << json_escape(t.test_case_id) << "\"";
    if (t.from) oss << R"(,"from":")" << to_string(*t.from) << "\"";
    oss << R"(,"to":")" << to_string(t.to) << "\"";
    if (t.plan_id) oss << R"(,"plan":")" << json_escape(*t.plan_id) << "\"";
    if (t.environment_id) oss << R"(,"environment":")" << json_escape(*t.environment_id) << "\"";
    if (is_terminal(t.to)) oss << R"(,"duration_ms":)" << t.execution_time.count();
    if (!t.detail.empty()) oss << R"(,"detail":")" << json_escape(t.detail) << "\"";
    oss << "}";
    emit(oss.str());

    if (t.environment_id && t.to == JobState::Running) {
        record_environment_event(*t.environment_id, "allocated", t.job_id);
    } else if (t.environment_id && t.from == JobState::Running) {
        record_environment_event(*t.environment_id, "released", t.job_id);
    }
}

void MetricsCollector::record_environment_event(const EnvironmentId& env_id, std::string_view event_type,
                                                std::string_view detail) {
    auto oss = begin_event("environment_" + std::string(event_type));
    oss << R"(,"environment":")" << json_escape(env_id) << "\"";
    if (!detail.empty()) oss << R"(,"detail":")" << json_escape(detail) << "\"";
    oss << "}";
    emit(oss.str());
}

void MetricsCollector::record_timeout(const JobId& job_id, TimeoutStage stage) {
    auto oss = begin_event("timeout");
    oss << R"(,"job":")" << json_escape(job_id) << "\""
        << R"(,"stage":")" << to_string(stage) << "\""
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_error(const std::string& error_id, const ErrorReport& report) {
    auto oss = begin_event("error");
    oss << R"(,"id":")" << json_escape(error_id) << "\""
        << R"(,"category":")" << to_string(report.category) << "\""
        << R"(,"severity":")" << to_string(report.severity) << "\""
        << R"(,"component":")" << json_escape(report.component) << "\""
        << R"(,"message":")" << json_escape(report.message) << "\"";
    if (report.job_id) oss << R"(,"job":")" << json_escape(*report.job_id) << "\"";
    if (report.environment_id) oss << R"(,"environment":")" << json_escape(*report.environment_id) << "\"";
    oss << "}";
    emit(oss.str());
}

void MetricsCollector::record_health_change(HealthStatus status, std::string_view detail) {
    auto oss = begin_event("health_change");
    oss << R"(,"status":")" << to_string(status) << "\""
        << R"(,"detail":")" << json_escape(detail) << "\""
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_queue_snapshot(const QueueSnapshot& s) {
    auto oss = begin_event("queue_snapshot");
    oss << R"(,"running":)" << s.running_jobs
        << R"(,"pending":)" << s.pending_jobs
        << R"(,"available_envs":)" << s.available_environments
        << R"(,"allocated_envs":)" << s.allocated_environments
        << R"(,"total_envs":)" << s.total_environments
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_custom(std::string_view event, std::string_view json_payload) {
    auto oss = begin_event(event);
    oss << R"(,"data":)" << json_payload
        << "}";
    emit(oss.str());
}

void MetricsCollector::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
    ++events_;
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace kernel_orchestrator
