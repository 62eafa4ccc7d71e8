#pragma once

namespace fwsync {

enum class ErrorCode : int {
    None = 0,
    InvalidRepositoryUrl,
    EmptyRepository,
    HashMismatch,
    ConnectionExhausted,
    Transport,
    Protocol,
    Io,
    Config,
    UnsafePath,
};

const char* ToString(ErrorCode code);

// The four kinds an update attempt reports to the backend as a failed publish or
// an unreachable network.
bool IsUpdateError(ErrorCode code);

// Worth retrying on a later poll cycle without a change on the backend.
bool IsTransient(ErrorCode code);

} // namespace fwsync
