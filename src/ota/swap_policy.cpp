#include "ota/swap_policy.hpp"

#include "util/path_utils.hpp"

#include <algorithm>
#include <utility>

namespace fwsync {

namespace {

bool Contains(const std::vector<std::string>& names, std::string_view name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

} // namespace

SwapPolicy::SwapPolicy(std::vector<std::string> keep_files, std::vector<std::string> keep_dirs)
    : keep_files_(std::move(keep_files)), keep_dirs_(std::move(keep_dirs)) {}

SwapPolicy SwapPolicy::Default(std::string_view staging_dir) {
    std::vector<std::string> dirs = {"lib"};
    // An absolute staging dir lives outside the live tree and needs no keep entry.
    const bool relative = !staging_dir.empty() && staging_dir.front() != '/';
    const std::string staging = relative ? NormalizeRepoPath(std::string(staging_dir)) : std::string();
    if (!staging.empty()) {
        const std::string top(TopLevelComponent(staging));
        if (!Contains(dirs, top)) dirs.push_back(top);
    }
    return SwapPolicy({"main.py", "boot.py", "settings.toml"}, std::move(dirs));
}

bool SwapPolicy::KeepsFile(std::string_view name) const { return Contains(keep_files_, name); }

bool SwapPolicy::KeepsDirectory(std::string_view name) const { return Contains(keep_dirs_, name); }

bool SwapPolicy::IsProtected(std::string_view relative_path) const {
    const std::string_view top = TopLevelComponent(relative_path);
    if (KeepsDirectory(top)) return true;
    return top.size() == relative_path.size() && KeepsFile(top);
}

Result SwapPolicy::NormalizeStagedPath(std::string_view raw_path, std::string& out_relative) const {
    if (raw_path.find('\\') != std::string_view::npos) {
        return Result::Fail(ErrorCode::UnsafePath,
                            "Unsafe path in repository: " + std::string(raw_path));
    }

    out_relative = NormalizeRepoPath(std::string(raw_path));
    if (out_relative.empty() || out_relative == ".") {
        return Result::Fail(ErrorCode::UnsafePath,
                            "Empty path in repository: '" + std::string(raw_path) + "'");
    }
    if (raw_path.front() == '/' || HasParentSegment(out_relative)) {
        return Result::Fail(ErrorCode::UnsafePath, "Unsafe path in repository: " + out_relative);
    }
    return Result::Ok();
}

} // namespace fwsync
