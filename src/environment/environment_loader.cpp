/**
 * @file environment_loader.cpp
 * @brief Environment pool loading using toml++.
 */

#include "environment/environment_loader.hpp"
#include "core/toml_codec.hpp"

#include <unordered_set>

namespace kernel_orchestrator {

namespace {

Result<std::vector<Environment>> from_document(const toml::table& document) {
    std::vector<Environment> environments;
    std::unordered_set<EnvironmentId> seen;

    const auto* array = document["environment"].as_array();
    if (array == nullptr) return environments;

    for (const auto& node : *array) {
        const auto* table = node.as_table();
        if (table == nullptr) {
            return Error{ErrorCode::Parse, "[[environment]] entries must be tables"};
        }
        auto env = environment_from_toml(*table);
        if (!env) return env.error();
        if (!seen.insert(env->id).second) {
            return Error{ErrorCode::Parse, "duplicate environment id: " + env->id};
        }
        environments.push_back(std::move(env).value());
    }
    return environments;
}

}  // anonymous namespace

Result<std::vector<Environment>> parse_environments(std::string_view toml_text) {
    try {
        return from_document(toml::parse(toml_text));
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::Parse,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Result<std::vector<Environment>> load_environment_file(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::NotFound, "Environment file not found: " + path.string()};
    }
    try {
        return from_document(toml::parse_file(path.string()));
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::Parse,
                     path.string() + ": " + std::string{err.description()}};
    }
}

}  // namespace kernel_orchestrator
