/**
 * @file test_helpers.hpp
 * @brief Shared fixtures for unit and integration tests.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace kernel_orchestrator::testing {

/**
 * @brief Sink that keeps every line in memory. Lines stay readable after
 *        ownership moves into a Logger through the shared buffer.
 */
class CaptureSink : public ILogSink {
public:
    struct Buffer {
        std::mutex mutex;
        std::vector<std::string> lines;
    };

    explicit CaptureSink(std::shared_ptr<Buffer> buffer = std::make_shared<Buffer>())
        : buffer_(std::move(buffer)) {}

    void write(std::string_view json_line) override {
        std::lock_guard lock(buffer_->mutex);
        buffer_->lines.emplace_back(json_line);
    }
    void flush() override {}

    [[nodiscard]] std::shared_ptr<Buffer> buffer() const { return buffer_; }

private:
    std::shared_ptr<Buffer> buffer_;
};

inline std::vector<std::string> lines_of(const std::shared_ptr<CaptureSink::Buffer>& buffer) {
    std::lock_guard lock(buffer->mutex);
    return buffer->lines;
}

inline size_t count_containing(const std::shared_ptr<CaptureSink::Buffer>& buffer, std::string_view needle) {
    size_t n = 0;
    for (const auto& line : lines_of(buffer)) {
        if (line.find(needle) != std::string::npos) ++n;
    }
    return n;
}

inline Logger null_logger() {
    class Null : public ILogSink {
    public:
        void write(std::string_view) override {}
        void flush() override {}
    };
    return Logger(std::make_unique<Null>(), LogLevel::Error);
}

inline Environment make_env(std::string id, std::string arch = "x86_64", uint32_t memory_mb = 4096,
                            BackendKind backend = BackendKind::FullEmulator) {
    Environment env;
    env.id = std::move(id);
    env.kernel_version = "6.6.0";
    env.hardware.architecture = std::move(arch);
    env.hardware.cpu_model = "generic";
    env.hardware.memory_mb = memory_mb;
    env.hardware.backend = backend;
    env.hardware.is_virtual = backend != BackendKind::Physical;
    return env;
}

inline TestCase make_test(std::string id, Duration estimate = Duration{100}, std::string arch = "",
                          uint32_t memory_mb = 0) {
    TestCase test;
    test.id = id;
    test.name = id;
    test.script = "run " + id;
    test.estimated_duration = estimate;
    test.target_subsystem = "core";
    test.requirement.architecture = std::move(arch);
    test.requirement.memory_mb = memory_mb;
    return test;
}

/// Poll until the predicate holds or the deadline passes.
inline bool eventually(const std::function<bool()>& predicate,
                       Duration timeout = Duration{5000}) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

}  // namespace kernel_orchestrator::testing
