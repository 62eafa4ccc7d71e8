#include "util/error_code.hpp"

namespace fwsync {

const char* ToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:                 return "none";
        case ErrorCode::InvalidRepositoryUrl: return "invalid-repository-url";
        case ErrorCode::EmptyRepository:      return "empty-repository";
        case ErrorCode::HashMismatch:         return "hash-mismatch";
        case ErrorCode::ConnectionExhausted:  return "connection-exhausted";
        case ErrorCode::Transport:            return "transport";
        case ErrorCode::Protocol:             return "protocol";
        case ErrorCode::Io:                   return "io";
        case ErrorCode::Config:               return "config";
        case ErrorCode::UnsafePath:           return "unsafe-path";
    }
    return "unknown";
}

bool IsUpdateError(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidRepositoryUrl:
        case ErrorCode::EmptyRepository:
        case ErrorCode::HashMismatch:
        case ErrorCode::ConnectionExhausted:
            return true;
        default:
            return false;
    }
}

bool IsTransient(ErrorCode code) {
    return code == ErrorCode::ConnectionExhausted;
}

} // namespace fwsync
