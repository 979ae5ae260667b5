/**
 * @file toml_codec.hpp
 * @brief Conversion of test cases and environments to and from TOML tables.
 *
 * Shared by the environment pool loader, the test catalog, the directory
 * plan source and the state store so that every file the daemon reads or
 * writes uses the same field names.
 *
 *   [[test]]                          [[environment]]
 *   id = "mm-001"                     id = "qemu-x86-1"
 *   script = "..."                    kernel_version = "6.6.0"
 *   estimated_duration_ms = 5000      architecture = "x86_64"
 *   target_subsystem = "mm"           memory_mb = 4096
 *   test_type = "unit"                backend = "emulator"
 *   [test.requires]                   peripherals = ["virtio-net"]
 *   architecture = "x86_64"           virtual = true
 *   memory_mb = 512
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <toml++/toml.hpp>

namespace kernel_orchestrator {

[[nodiscard]] Result<TestCase> test_case_from_toml(const toml::table& table);
[[nodiscard]] toml::table to_toml(const TestCase& test);

[[nodiscard]] Result<Environment> environment_from_toml(const toml::table& table);
[[nodiscard]] toml::table to_toml(const Environment& environment);

/// String array field; non-string elements are skipped.
[[nodiscard]] std::vector<std::string> read_string_array(const toml::table& table, std::string_view key);

}  // namespace kernel_orchestrator
