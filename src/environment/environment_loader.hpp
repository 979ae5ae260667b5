/**
 * @file environment_loader.hpp
 * @brief Environment pool file: a TOML document of [[environment]] tables.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <string_view>
#include <vector>

namespace kernel_orchestrator {

/// Parse pool definitions from TOML text. Duplicate ids are rejected.
Result<std::vector<Environment>> parse_environments(std::string_view toml_text);

Result<std::vector<Environment>> load_environment_file(const std::filesystem::path& path);

}  // namespace kernel_orchestrator
