/**
 * @file toml_codec.cpp
 * @brief TOML conversion for test cases and environments using toml++.
 */

#include "core/toml_codec.hpp"

namespace kernel_orchestrator {

namespace {

std::optional<uint32_t> read_u32(const toml::table& table, std::string_view key) {
    auto value = table[key].value<int64_t>();
    if (!value || *value < 0 || *value > static_cast<int64_t>(UINT32_MAX)) return std::nullopt;
    return static_cast<uint32_t>(*value);
}

toml::array to_array(const std::vector<std::string>& values) {
    toml::array array;
    for (const auto& value : values) {
        array.push_back(value);
    }
    return array;
}

}  // anonymous namespace

std::vector<std::string> read_string_array(const toml::table& table, std::string_view key) {
    std::vector<std::string> values;
    if (const auto* array = table[key].as_array()) {
        for (const auto& element : *array) {
            if (auto text = element.value<std::string>()) {
                values.push_back(std::move(*text));
            }
        }
    }
    return values;
}

// ─────────────────────────────────────────────
// Test Case
// ─────────────────────────────────────────────

Result<TestCase> test_case_from_toml(const toml::table& table) {
    TestCase test;
    test.id = table["id"].value_or(std::string{});
    if (test.id.empty()) {
        return Error{ErrorCode::Parse, "test case without an id"};
    }
    test.name = table["name"].value_or(test.id);
    test.script = table["script"].value_or(std::string{});
    test.target_subsystem = table["target_subsystem"].value_or(std::string{});

    auto estimate = table["estimated_duration_ms"].value<int64_t>();
    if (estimate && *estimate < 0) {
        return Error{ErrorCode::Parse, "test " + test.id + ": negative estimated_duration_ms"};
    }
    test.estimated_duration = Duration{estimate.value_or(0)};

    if (auto type = table["test_type"].value<std::string>()) {
        auto parsed = parse_test_type(*type);
        if (!parsed) {
            return Error{ErrorCode::Parse, "test " + test.id + ": unknown test_type '" + *type + "'"};
        }
        test.test_type = *parsed;
    }

    if (const auto* requires_table = table["requires"].as_table()) {
        auto& req = test.requirement;
        req.architecture = (*requires_table)["architecture"].value_or(std::string{});
        req.cpu_model = (*requires_table)["cpu_model"].value_or(std::string{});
        req.memory_mb = read_u32(*requires_table, "memory_mb").value_or(0);
        req.peripherals = read_string_array(*requires_table, "peripherals");
        req.is_virtual = (*requires_table)["virtual"].value<bool>();
    }
    return test;
}

toml::table to_toml(const TestCase& test) {
    toml::table requires_table{
        {"architecture", test.requirement.architecture},
        {"memory_mb", static_cast<int64_t>(test.requirement.memory_mb)},
    };
    if (!test.requirement.cpu_model.empty()) {
        requires_table.insert_or_assign("cpu_model", test.requirement.cpu_model);
    }
    if (!test.requirement.peripherals.empty()) {
        requires_table.insert_or_assign("peripherals", to_array(test.requirement.peripherals));
    }
    if (test.requirement.is_virtual) {
        requires_table.insert_or_assign("virtual", *test.requirement.is_virtual);
    }

    return toml::table{
        {"id", test.id},
        {"name", test.name},
        {"script", test.script},
        {"estimated_duration_ms", static_cast<int64_t>(test.estimated_duration.count())},
        {"target_subsystem", test.target_subsystem},
        {"test_type", std::string{to_string(test.test_type)}},
        {"requires", std::move(requires_table)},
    };
}

// ─────────────────────────────────────────────
// Environment
// ─────────────────────────────────────────────

Result<Environment> environment_from_toml(const toml::table& table) {
    Environment env;
    env.id = table["id"].value_or(std::string{});
    if (env.id.empty()) {
        return Error{ErrorCode::Parse, "environment without an id"};
    }
    env.kernel_version = table["kernel_version"].value_or(std::string{});

    auto& hw = env.hardware;
    hw.architecture = table["architecture"].value_or(std::string{});
    if (hw.architecture.empty()) {
        return Error{ErrorCode::Parse, "environment " + env.id + ": architecture is required"};
    }
    hw.cpu_model = table["cpu_model"].value_or(std::string{});
    auto memory = read_u32(table, "memory_mb");
    if (!memory) {
        return Error{ErrorCode::Parse, "environment " + env.id + ": memory_mb is required"};
    }
    hw.memory_mb = *memory;
    hw.storage_type = table["storage_type"].value_or(hw.storage_type);
    hw.peripherals = read_string_array(table, "peripherals");
    hw.is_virtual = table["virtual"].value_or(hw.is_virtual);

    if (auto backend = table["backend"].value<std::string>()) {
        auto parsed = parse_backend_kind(*backend);
        if (!parsed) {
            return Error{ErrorCode::Parse, "environment " + env.id + ": unknown backend '" + *backend + "'"};
        }
        hw.backend = *parsed;
    } else if (!hw.is_virtual) {
        hw.backend = BackendKind::Physical;
    }
    return env;
}

toml::table to_toml(const Environment& environment) {
    const auto& hw = environment.hardware;
    return toml::table{
        {"id", environment.id},
        {"kernel_version", environment.kernel_version},
        {"architecture", hw.architecture},
        {"cpu_model", hw.cpu_model},
        {"memory_mb", static_cast<int64_t>(hw.memory_mb)},
        {"storage_type", hw.storage_type},
        {"peripherals", to_array(hw.peripherals)},
        {"virtual", hw.is_virtual},
        {"backend", std::string{to_string(hw.backend)}},
    };
}

}  // namespace kernel_orchestrator
