#include "repo/repository_url.hpp"

#include <regex>
#include <string>

namespace fwsync {

Result ParseRepositoryUrl(std::string_view url, RepositoryLocation& out) {
    static const std::regex kPattern(R"(^https?://([^/]+)/([^/]+)/([^/]+)(?:/([^/]+))?/?$)");

    out = RepositoryLocation{};
    const std::string text(url);
    std::smatch m;
    if (!std::regex_match(text, m, kPattern)) {
        return Result::Fail(ErrorCode::InvalidRepositoryUrl,
                            "Repository URL is not valid: " + text);
    }

    out.host = m[1].str();
    out.owner = m[2].str();
    out.name = m[3].str();
    if (m[4].matched && m[4].length() > 0)
        out.access_token = m[4].str();
    return Result::Ok();
}

} // namespace fwsync
