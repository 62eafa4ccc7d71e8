#pragma once

#include "backend/firmware_backend.hpp"
#include "ota/staging_tree.hpp"
#include "ota/swap_policy.hpp"
#include "ota/update_state.hpp"
#include "repo/firmware_source.hpp"
#include "system/device_restarter.hpp"
#include "util/result.hpp"

#include <filesystem>
#include <string>

namespace fwsync {

class UpdateOrchestrator {
  public:
    struct Options {
        // Relative paths are resolved against the target directory.
        std::string staging_dir = "temp-firmware";
    };

    UpdateOrchestrator(IFirmwareBackend& backend,
                       IFirmwareSource& source,
                       IDeviceRestarter& restarter);
    UpdateOrchestrator(IFirmwareBackend& backend,
                       IFirmwareSource& source,
                       IDeviceRestarter& restarter,
                       Options opt);

    Result IsUpdateAvailable(bool& out);

    // Full pipeline: discover, download + verify + stage, swap, publish, restart.
    // Returns Ok without side effects when the device already runs the desired
    // firmware. On failure the error is reported to the backend (best effort) and
    // returned; the staging tree is gone on every exit path.
    Result DownloadAndApplyUpdate(const std::string& target_dir = ".");

    UpdateState State() const { return state_; }
    const SwapPolicy& Policy() const { return policy_; }

  private:
    Result RunPipeline(const std::filesystem::path& target, bool& restart_requested);
    Result DownloadAndStage(const std::string& source_url, StagingTree& staging);
    void TransitionTo(UpdateState next);
    void ReportFailureBestEffort(const Result& error);

    IFirmwareBackend& backend_;
    IFirmwareSource& source_;
    IDeviceRestarter& restarter_;
    Options opt_{};
    SwapPolicy policy_;
    UpdateState state_ = UpdateState::Idle;
};

} // namespace fwsync
