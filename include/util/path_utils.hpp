#pragma once

#include <string>
#include <string_view>

namespace fwsync {

// Normalize a repository path to a clean relative form:
// - strip leading "./"
// - strip leading "/" (avoid absolute)
// - collapse duplicate slashes
// - drop a trailing "/"
inline std::string NormalizeRepoPath(std::string s) {
    while (s.rfind("./", 0) == 0) s.erase(0, 2);
    while (!s.empty() && s.front() == '/') s.erase(0, 1);

    std::string out;
    out.reserve(s.size());
    bool prev_slash = false;
    for (char c : s) {
        const bool slash = (c == '/');
        if (slash && prev_slash) continue;
        out.push_back(c);
        prev_slash = slash;
    }
    if (!out.empty() && out.back() == '/') out.pop_back();
    return out;
}

// "lib/neopixel.py" -> "lib", "code.py" -> "code.py"
inline std::string_view TopLevelComponent(std::string_view relative_path) {
    const auto pos = relative_path.find('/');
    return pos == std::string_view::npos ? relative_path : relative_path.substr(0, pos);
}

inline bool HasParentSegment(std::string_view p) {
    while (!p.empty()) {
        const auto pos = p.find('/');
        if (p.substr(0, pos) == "..") return true;
        if (pos == std::string_view::npos) break;
        p.remove_prefix(pos + 1);
    }
    return false;
}

} // namespace fwsync
