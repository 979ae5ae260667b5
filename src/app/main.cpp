/**
 * @file main.cpp
 * @brief KernelOrchestrator daemon entry point.
 *
 * Wires all modules into a complete test execution pipeline:
 *   Config → Logger → Environment pool → Dispatcher → Runner → Timeouts →
 *   Recovery → Status tracker / Queue monitor → Telemetry
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "executor/simulated_runner.hpp"
#include "service/orchestrator_service.hpp"
#include "telemetry/json_sink.hpp"

#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace kernel_orchestrator;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

void print_banner() {
    std::cout << R"(
  ╔═══════════════════════════════════════════╗
  ║         KernelOrchestrator v1.0.0         ║
  ║   Test Execution Orchestrator for         ║
  ║   Heterogeneous Kernel Test Environments  ║
  ╚═══════════════════════════════════════════╝
)" << std::endl;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::filesystem::path environments_file;
    std::filesystem::path catalog_file;
    std::filesystem::path plans_dir;
    std::string log_dir;
    std::string log_level;
    bool demo_mode = false;
};

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--environments" && i + 1 < argc) {
            args.environments_file = argv[++i];
        } else if (arg == "--catalog" && i + 1 < argc) {
            args.catalog_file = argv[++i];
        } else if (arg == "--plans-dir" && i + 1 < argc) {
            args.plans_dir = argv[++i];
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--demo") {
            args.demo_mode = true;
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: kernel_orchestrator [OPTIONS]\n"
                      << "  --config <path>        Configuration file (default: config/default.toml)\n"
                      << "  --environments <path>  Environment pool file ([[environment]] tables)\n"
                      << "  --catalog <path>       Test catalog file ([[test]] tables)\n"
                      << "  --plans-dir <path>     Directory polled for execution plan files\n"
                      << "  --log-dir <path>       Log output directory (empty: stdout)\n"
                      << "  --log-level <level>    debug, info, warn or error\n"
                      << "  --demo                 Run a simulated scheduling demo, then exit\n"
                      << "  --help, -h             Show this help message\n";
            std::exit(0);
        } else {
            std::cerr << "Ignoring unknown argument: " << arg << std::endl;
        }
    }
    return args;
}

Environment demo_environment(std::string id, std::string arch, uint32_t memory_mb, BackendKind backend) {
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

TestCase demo_test(std::string id, std::string subsystem, std::string arch, uint32_t memory_mb,
                   Duration estimate, TestType type = TestType::Unit) {
    TestCase test;
    test.id = id;
    test.name = id;
    test.script = "./run_test.sh " + id;
    test.estimated_duration = estimate;
    test.target_subsystem = std::move(subsystem);
    test.test_type = type;
    test.requirement.architecture = std::move(arch);
    test.requirement.memory_mb = memory_mb;
    return test;
}

/**
 * @brief Run a single demo: register a small pool, submit a mixed batch,
 *        inject a hang and an environment failure, and print the outcome.
 */
int run_demo(Config config, std::unique_ptr<ILogSink> log_sink, LogLevel level) {
    config.service.poll_interval_ms = 100;
    config.service.max_concurrent_tests = 3;
    config.service.enable_persistence = false;
    config.runner.kind = "simulated";
    config.timeout.margin_factor = 1.5;
    config.timeout.margin_ms = 0;
    config.sources = SourcesConfig{};

    auto runner = std::make_shared<SimulatedRunner>(0.05);
    OrchestratorService service(OrchestratorService::Options{
        .config = config,
        .runner = runner,
        .log_sink = std::move(log_sink),
        .log_level = level,
        .metrics_sink = std::make_unique<NullSink>(),
        .plan_source = nullptr,
    });
    auto& logger = service.logger();
    logger.info("demo", "=== Demo Mode ===");

    for (auto env : {demo_environment("docker-x86-1", "x86_64", 2048, BackendKind::Container),
                     demo_environment("qemu-x86-1", "x86_64", 8192, BackendKind::FullEmulator),
                     demo_environment("qemu-arm64-1", "arm64", 4096, BackendKind::FullEmulator)}) {
        if (auto added = service.add_environment(env); !added) {
            logger.warn("demo", "Cannot add " + env.id + ": " + added.error().message);
        }
    }
    service.start();

    // Scaled by 0.05: a 2 s estimate runs for 100 ms
    runner->set_behavior("sched-hang", SimulatedRunner::Behavior::Hang);
    runner->set_behavior("net-fail", SimulatedRunner::Behavior::Fail, 2);

    struct Submission {
        TestCase test;
        Priority priority;
        double impact;
    };
    std::vector<Submission> batch{
        {demo_test("mm-001", "mm", "x86_64", 512, Duration{2000}), Priority::Low, 0.2},
        {demo_test("mm-002", "mm", "x86_64", 512, Duration{2000}), Priority::Low, 0.2},
        {demo_test("fs-001", "fs", "x86_64", 1024, Duration{4000}), Priority::Medium, 0.5},
        {demo_test("net-fail", "net", "x86_64", 512, Duration{1000}), Priority::High, 0.6},
        {demo_test("sched-hang", "sched", "x86_64", 4096, Duration{1000}, TestType::Stress), Priority::Medium, 0.4},
        {demo_test("arm-boot", "arch", "arm64", 1024, Duration{6000}), Priority::Critical, 0.9},
        {demo_test("arm-perf", "arch", "arm64", 2048, Duration{60000}, TestType::Performance), Priority::Medium, 0.3},
    };

    std::vector<JobId> jobs;
    for (auto& submission : batch) {
        auto job = service.submit_job(submission.test, submission.priority, submission.impact);
        if (job) {
            jobs.push_back(*job);
        } else {
            logger.warn("demo", "Submission of " + submission.test.id + " rejected: " + job.error().message);
        }
    }
    service.escalate_subsystem("mm", Priority::High);

    // The long ARM performance test loses its emulator half-way through
    std::this_thread::sleep_for(std::chrono::milliseconds(800));
    if (auto lost = service.report_environment_failure("qemu-arm64-1", "emulator crashed"); !lost) {
        logger.warn("demo", "Failure injection failed: " + lost.error().message);
    }

    service.wait_until_idle(std::chrono::seconds(10));

    std::cout << "\n  Job                                   Test         State      Env             Time\n";
    for (const auto& id : jobs) {
        auto status = service.get_job_status(id);
        if (!status) continue;
        std::string env = status->result ? status->result->environment_id : "-";
        auto elapsed = status->result ? status->result->execution_time.count() : 0;
        std::cout << "  " << id << "  " << status->test_case_id
                  << std::string(13 - std::min<size_t>(12, status->test_case_id.size()), ' ')
                  << to_string(status->state)
                  << std::string(11 - std::min<size_t>(10, to_string(status->state).size()), ' ')
                  << env << std::string(16 - std::min<size_t>(15, env.size()), ' ')
                  << elapsed << "ms\n";
    }

    auto metrics = service.get_system_metrics();
    auto health = service.get_health_status();
    std::cout << "\n  completed=" << metrics.jobs.completed_tests
              << " failed=" << metrics.jobs.failed_tests
              << " (timeouts " << metrics.jobs.timed_out_tests << ")"
              << " cancelled=" << metrics.jobs.cancelled_tests
              << " peak_running=" << metrics.dispatcher.peak_running
              << " peak_pending=" << metrics.dispatcher.peak_pending
              << " avg=" << metrics.jobs.average_execution_time.count() << "ms"
              << " health=" << to_string(health.status) << "\n\n";

    service.stop();
    logger.info("demo", "=== Demo Complete ===");
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    print_banner();

    auto args = parse_args(argc, argv);

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (!args.environments_file.empty()) config.sources.environments_file = args.environments_file;
    if (!args.catalog_file.empty()) config.sources.catalog_file = args.catalog_file;
    if (!args.plans_dir.empty()) config.sources.plans_dir = args.plans_dir;
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;
    if (!args.log_level.empty()) config.telemetry.log_level = args.log_level;

    if (auto valid = validate_config(config); !valid) {
        std::cerr << "Invalid configuration: " << valid.error().message << std::endl;
        return 1;
    }
    auto level = parse_log_level(config.telemetry.log_level).value_or(LogLevel::Info);

    // ── Initialize Logger ────────────────────
    auto make_sink = [&](const std::string& prefix) -> std::unique_ptr<ILogSink> {
        if (config.telemetry.log_dir.empty()) return std::make_unique<StdoutSink>();
        return std::make_unique<JsonFileSink>(config.telemetry.log_dir, prefix,
                                              config.telemetry.max_file_size_mb,
                                              config.telemetry.rotate_count);
    };

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // ── Demo mode shortcut ───────────────────
    if (args.demo_mode) {
        return run_demo(config, std::make_unique<StdoutSink>(), level);
    }

    OrchestratorService service(OrchestratorService::Options{
        .config = config,
        .runner = nullptr,
        .log_sink = make_sink("kernel_orchestrator"),
        .log_level = level,
        .metrics_sink = config.telemetry.log_dir.empty()
            ? std::unique_ptr<ILogSink>(std::make_unique<NullSink>())
            : make_sink("metrics"),
        .plan_source = nullptr,
    });
    auto& logger = service.logger();
    logger.info("main", "KernelOrchestrator starting...");
    logger.info("main", "Runner: " + config.runner.kind
                + ", max concurrent tests: " + std::to_string(config.service.max_concurrent_tests)
                + ", persistence: " + (config.service.enable_persistence ? "on" : "off"));

    if (!service.start()) {
        logger.error("main", "Orchestrator service failed to start");
        return 1;
    }

    // ── Main Loop ────────────────────────────
    logger.info("main", "Entering main loop. Press Ctrl+C to shutdown.");

    uint64_t loop_count = 0;
    while (!g_shutdown_requested) {
        // Periodic status logging (every 30 seconds at 100ms intervals)
        if (loop_count % 300 == 0 && loop_count > 0) {
            auto queue = service.get_queue_status();
            auto health = service.get_health_status();
            logger.info("main", "Status: " + std::string{to_string(health.status)} + ", "
                        + std::to_string(queue.running_jobs) + " running, "
                        + std::to_string(queue.pending_jobs) + " pending, "
                        + std::to_string(queue.available_environments) + "/"
                        + std::to_string(queue.total_environments) + " environments free");
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        ++loop_count;
    }

    // ── Graceful Shutdown ────────────────────
    logger.info("main", "Shutdown requested. Cleaning up...");
    service.stop();
    logger.info("main", "KernelOrchestrator stopped.");
    return 0;
}
