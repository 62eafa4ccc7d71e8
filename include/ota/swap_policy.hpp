#pragma once

#include "util/result.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace fwsync {

// Names at the top of the live firmware tree that a swap never touches: entry-point
// files and device settings, the dependency library directory, and the staging
// directory itself. Repository files landing on one of these are not staged, so the
// staged set and the surviving set never overlap.
class SwapPolicy {
  public:
    SwapPolicy(std::vector<std::string> keep_files, std::vector<std::string> keep_dirs);

    // keep files: main.py, boot.py, settings.toml
    // keep dirs:  lib, and the top-level component of a relative `staging_dir`
    static SwapPolicy Default(std::string_view staging_dir);

    bool KeepsFile(std::string_view name) const;
    bool KeepsDirectory(std::string_view name) const;

    // True when a normalized repository path would replace or enter a kept entry.
    bool IsProtected(std::string_view relative_path) const;

    // Normalizes a repository path and rejects absolute, backslash and ".." paths.
    Result NormalizeStagedPath(std::string_view raw_path, std::string& out_relative) const;

    const std::vector<std::string>& keep_files() const { return keep_files_; }
    const std::vector<std::string>& keep_dirs() const { return keep_dirs_; }

  private:
    std::vector<std::string> keep_files_;
    std::vector<std::string> keep_dirs_;
};

} // namespace fwsync
