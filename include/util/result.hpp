#pragma once

#include "util/error_code.hpp"

#include <string>
#include <string_view>
#include <utility>

namespace fwsync {

struct Result {
    bool ok{true};
    ErrorCode err{ErrorCode::None};
    std::string msg;

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }
    ErrorCode code() const { return err; }

    static Result Ok() { return {}; }
    static Result Fail(ErrorCode e, std::string m) {
        return {.ok = false, .err = e, .msg = std::move(m)};
    }

    // Same code, message prefixed with where it happened.
    static Result Wrap(const Result& inner, std::string_view context) {
        return Fail(inner.err, std::string(context) + ": " + inner.msg);
    }
};

} // namespace fwsync
