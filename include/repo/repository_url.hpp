#pragma once

#include "util/result.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace fwsync {

struct RepositoryLocation {
    std::string host;
    std::string owner;
    std::string name;
    // Third path segment of the URL, sent as a bearer credential.
    std::optional<std::string> access_token;
};

// Accepts http(s)://host/owner/repo and http(s)://host/owner/repo/token,
// with an optional trailing slash. Anything else is ErrorCode::InvalidRepositoryUrl.
Result ParseRepositoryUrl(std::string_view url, RepositoryLocation& out);

} // namespace fwsync
