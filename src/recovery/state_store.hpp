/**
 * @file state_store.hpp
 * @brief Persists unfinished jobs and service counters across restarts.
 *
 * The state file is TOML. save() writes a sibling ".tmp" file and renames it
 * over the target, keeping the previous file as ".bak"; load() falls back to
 * the backup when the primary is unreadable.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "scheduler/job.hpp"

#include <filesystem>
#include <vector>

namespace kernel_orchestrator {

struct PersistedCounters {
    uint64_t submitted{0};
    uint64_t completed{0};
    uint64_t failed{0};
    uint64_t timed_out{0};
    uint64_t cancelled{0};
};

struct PersistedState {
    std::vector<JobRequest> jobs;          ///< Submission order
    PersistedCounters counters;
    Timestamp saved_at;
    bool from_backup{false};
};

class StateStore {
public:
    static constexpr int64_t FORMAT_VERSION = 1;

    explicit StateStore(std::filesystem::path path);

    Result<void> save(const PersistedState& state) const;

    /// A missing file yields an empty state.
    [[nodiscard]] Result<PersistedState> load() const;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] std::filesystem::path backup_path() const;

private:
    std::filesystem::path path_;
};

}  // namespace kernel_orchestrator
