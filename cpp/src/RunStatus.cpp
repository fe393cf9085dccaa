#include "RunStatus.h"
#include "Error.h"

using namespace ensemble;

const char* ensemble::toString(const RunStatus status) noexcept {
    switch (status) {
        case RunStatus::PENDING: return "PENDING";
        case RunStatus::QUEUED: return "QUEUED";
        case RunStatus::RUNNING: return "RUNNING";
        case RunStatus::SUCCEEDED: return "SUCCEEDED";
        case RunStatus::FAILED: return "FAILED";
        case RunStatus::ABORTED: return "ABORTED";
    }
    return "UNKNOWN";
}

RunStatus ensemble::runStatusFromString(const std::string& name) {
    if (name == "PENDING") return RunStatus::PENDING;
    if (name == "QUEUED") return RunStatus::QUEUED;
    if (name == "RUNNING") return RunStatus::RUNNING;
    if (name == "SUCCEEDED") return RunStatus::SUCCEEDED;
    if (name == "FAILED") return RunStatus::FAILED;
    if (name == "ABORTED") return RunStatus::ABORTED;
    throw StoreError("Unknown run status '" + name + "'");
}
