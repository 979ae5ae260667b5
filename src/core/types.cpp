/**
 * @file types.cpp
 * @brief String parsing for vocabulary enums.
 */

#include "core/types.hpp"

#include <array>
#include <utility>

namespace kernel_orchestrator {

namespace {

template <typename Enum, size_t N>
std::optional<Enum> lookup(std::string_view text,
                           const std::array<std::pair<std::string_view, Enum>, N>& table) noexcept {
    for (const auto& [name, value] : table) {
        if (name == text) return value;
    }
    return std::nullopt;
}

}  // anonymous namespace

std::optional<Priority> parse_priority(std::string_view text) noexcept {
    static constexpr std::array<std::pair<std::string_view, Priority>, 4> table{{
        {"low", Priority::Low},
        {"medium", Priority::Medium},
        {"high", Priority::High},
        {"critical", Priority::Critical},
    }};
    return lookup(text, table);
}

std::optional<BackendKind> parse_backend_kind(std::string_view text) noexcept {
    static constexpr std::array<std::pair<std::string_view, BackendKind>, 6> table{{
        {"container", BackendKind::Container},
        {"docker", BackendKind::Container},
        {"emulator", BackendKind::FullEmulator},
        {"qemu", BackendKind::FullEmulator},
        {"physical", BackendKind::Physical},
        {"board", BackendKind::Physical},
    }};
    return lookup(text, table);
}

std::optional<TestType> parse_test_type(std::string_view text) noexcept {
    static constexpr std::array<std::pair<std::string_view, TestType>, 6> table{{
        {"unit", TestType::Unit},
        {"integration", TestType::Integration},
        {"performance", TestType::Performance},
        {"stress", TestType::Stress},
        {"fuzz", TestType::Fuzz},
        {"security", TestType::Security},
    }};
    return lookup(text, table);
}

}  // namespace kernel_orchestrator
