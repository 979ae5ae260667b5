/**
 * @file state_store.cpp
 * @brief StateStore implementation using toml++.
 */

#include "recovery/state_store.hpp"
#include "core/toml_codec.hpp"

#include <fstream>
#include <system_error>

namespace kernel_orchestrator {

namespace {

uint64_t read_counter(const toml::table& table, std::string_view key) {
    auto value = table[key].value<int64_t>();
    return value && *value > 0 ? static_cast<uint64_t>(*value) : 0;
}

toml::table encode(const PersistedState& state) {
    const auto& c = state.counters;
    toml::table counters{
        {"submitted", static_cast<int64_t>(c.submitted)},
        {"completed", static_cast<int64_t>(c.completed)},
        {"failed", static_cast<int64_t>(c.failed)},
        {"timed_out", static_cast<int64_t>(c.timed_out)},
        {"cancelled", static_cast<int64_t>(c.cancelled)},
    };

    toml::array jobs;
    for (const auto& request : state.jobs) {
        toml::table job{
            {"priority", std::string{to_string(request.priority)}},
            {"impact_score", request.impact_score},
            {"test", to_toml(request.test_case)},
        };
        if (request.job_id) job.insert_or_assign("job_id", *request.job_id);
        if (request.plan_id) job.insert_or_assign("plan_id", *request.plan_id);
        if (!request.dependencies.empty()) {
            toml::array dependencies;
            for (const auto& dep : request.dependencies) dependencies.push_back(dep);
            job.insert_or_assign("dependencies", std::move(dependencies));
        }
        jobs.push_back(std::move(job));
    }

    auto saved_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        state.saved_at.time_since_epoch()).count();
    return toml::table{
        {"version", StateStore::FORMAT_VERSION},
        {"saved_at_ms", static_cast<int64_t>(saved_ms)},
        {"counters", std::move(counters)},
        {"job", std::move(jobs)},
    };
}

Result<PersistedState> decode(const toml::table& document) {
    auto version = document["version"].value<int64_t>();
    if (!version || *version != StateStore::FORMAT_VERSION) {
        return Error{ErrorCode::Parse, "unsupported state file version"};
    }

    PersistedState state;
    state.saved_at = Timestamp{std::chrono::milliseconds{document["saved_at_ms"].value_or(int64_t{0})}};

    if (const auto* counters = document["counters"].as_table()) {
        state.counters.submitted = read_counter(*counters, "submitted");
        state.counters.completed = read_counter(*counters, "completed");
        state.counters.failed = read_counter(*counters, "failed");
        state.counters.timed_out = read_counter(*counters, "timed_out");
        state.counters.cancelled = read_counter(*counters, "cancelled");
    }

    if (const auto* jobs = document["job"].as_array()) {
        for (const auto& node : *jobs) {
            const auto* job = node.as_table();
            const auto* test = job ? (*job)["test"].as_table() : nullptr;
            if (test == nullptr) {
                return Error{ErrorCode::Parse, "persisted job without a [job.test] table"};
            }
            auto test_case = test_case_from_toml(*test);
            if (!test_case) return test_case.error();

            JobRequest request{.test_case = std::move(test_case).value()};
            auto priority = parse_priority((*job)["priority"].value_or(std::string{"medium"}));
            if (!priority) {
                return Error{ErrorCode::Parse, "persisted job with an unknown priority"};
            }
            request.priority = *priority;
            request.impact_score = (*job)["impact_score"].value_or(0.0);
            if (auto id = (*job)["job_id"].value<std::string>()) request.job_id = std::move(*id);
            if (auto plan = (*job)["plan_id"].value<std::string>()) request.plan_id = std::move(*plan);
            if (const auto* dependencies = (*job)["dependencies"].as_array()) {
                for (const auto& dep : *dependencies) {
                    auto id = dep.value<std::string>();
                    if (!id) return Error{ErrorCode::Parse, "persisted job with a non-string dependency"};
                    request.dependencies.push_back(std::move(*id));
                }
            }
            state.jobs.push_back(std::move(request));
        }
    }
    return state;
}

Result<PersistedState> load_from(const std::filesystem::path& path) {
    try {
        return decode(toml::parse_file(path.string()));
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::Parse, path.string() + ": " + std::string{err.description()}};
    }
}

}  // anonymous namespace

StateStore::StateStore(std::filesystem::path path) : path_(std::move(path)) {}

std::filesystem::path StateStore::backup_path() const {
    auto backup = path_;
    backup += ".bak";
    return backup;
}

Result<void> StateStore::save(const PersistedState& state) const {
    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::Io, "Cannot create " + path_.parent_path().string() + ": " + ec.message()};
        }
    }

    auto tmp = path_;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            return Error{ErrorCode::Io, "Cannot open " + tmp.string() + " for writing"};
        }
        out << encode(state) << '\n';
        out.flush();
        if (!out) {
            return Error{ErrorCode::Io, "Write failed for " + tmp.string()};
        }
    }

    if (std::filesystem::exists(path_)) {
        std::filesystem::copy_file(path_, backup_path(),
                                   std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) {
            return Error{ErrorCode::Io, "Cannot back up " + path_.string() + ": " + ec.message()};
        }
    }

    std::filesystem::rename(tmp, path_, ec);
    if (ec) {
        return Error{ErrorCode::Io, "Cannot rename " + tmp.string() + ": " + ec.message()};
    }
    return {};
}

Result<PersistedState> StateStore::load() const {
    bool primary = std::filesystem::exists(path_);
    bool backup = std::filesystem::exists(backup_path());
    if (!primary && !backup) return PersistedState{};

    if (primary) {
        auto state = load_from(path_);
        if (state || !backup) return state;
    }

    auto state = load_from(backup_path());
    if (state) state->from_backup = true;
    return state;
}

}  // namespace kernel_orchestrator
