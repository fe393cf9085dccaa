#pragma once
#include <string>

namespace ensemble {
    /** Lifecycle of one execution attempt of (trial, experiment). */
    enum class RunStatus : int {
        PENDING, QUEUED, RUNNING, SUCCEEDED, FAILED, ABORTED
    };

    const char* toString(RunStatus status) noexcept;

    /** @throws StoreError for an unknown name */
    RunStatus runStatusFromString(const std::string& name);

    /** @brief SUCCEEDED, FAILED and ABORTED rows are never modified again. */
    inline bool isTerminal(const RunStatus status) noexcept {
        return status == RunStatus::SUCCEEDED || status == RunStatus::FAILED || status == RunStatus::ABORTED;
    }

    inline bool isActive(const RunStatus status) noexcept { return !isTerminal(status); }
}
