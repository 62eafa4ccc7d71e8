#pragma once

#include "ota/swap_policy.hpp"
#include "util/result.hpp"

#include <filesystem>

namespace fwsync {

// Replaces the contents of the live firmware tree with a staged tree:
// wipe every top-level entry the policy does not keep, move every staged entry in,
// then remove the emptied staging directory.
class FirmwareSwapper {
  public:
    explicit FirmwareSwapper(const SwapPolicy& policy) : policy_(policy) {}

    Result Swap(const std::filesystem::path& staging_root,
                const std::filesystem::path& live_root) const;

    Result WipeLiveTree(const std::filesystem::path& live_root) const;

    // Directories present on both sides are merged; files are replaced.
    Result MoveStagedContents(const std::filesystem::path& staging_root,
                              const std::filesystem::path& live_root) const;

  private:
    const SwapPolicy& policy_;
};

} // namespace fwsync
