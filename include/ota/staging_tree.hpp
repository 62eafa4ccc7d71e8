#pragma once

#include "util/result.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>

namespace fwsync {

// Exclusive owner of the staging directory for one update attempt. Acquire()
// starts from an empty directory (leftovers of an interrupted attempt are
// removed); the destructor removes the directory on every exit path.
class StagingTree {
  public:
    static Result Acquire(const std::filesystem::path& root, StagingTree& out);

    StagingTree();
    StagingTree(const StagingTree&) = delete;
    StagingTree& operator=(const StagingTree&) = delete;
    StagingTree(StagingTree&& other) noexcept;
    StagingTree& operator=(StagingTree&& other) noexcept;
    ~StagingTree();

    // Writes `bytes` to root/relative_path, creating parent directories, and fsyncs it.
    // `relative_path` must already be normalized and checked.
    Result StageFile(const std::string& relative_path, std::span<const std::uint8_t> bytes);

    // Recursively removes the directory. Safe to call more than once.
    Result Release();

    const std::filesystem::path& Root() const { return root_; }
    bool Held() const { return held_; }
    std::size_t StagedCount() const { return staged_count_; }

  private:
    std::filesystem::path root_;
    bool held_ = false;
    std::size_t staged_count_ = 0;
};

} // namespace fwsync
