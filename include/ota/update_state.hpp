#pragma once

namespace fwsync {

// Idle -> Downloading -> Verifying (per file, interleaved with Downloading)
//      -> Downloaded -> Verified -> Updating -> Updated
// Failed is reachable from every state and ends the attempt.
enum class UpdateState {
    Idle,
    Downloading,
    Verifying,
    Downloaded,
    Verified,
    Updating,
    Updated,
    Failed,
};

const char* ToString(UpdateState state);

} // namespace fwsync
