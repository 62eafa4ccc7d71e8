#include "ota/update_orchestrator.hpp"

#include "crypto/git_blob_hash.hpp"
#include "ota/firmware_swapper.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <memory>
#include <optional>

namespace fs = std::filesystem;

namespace fwsync {

const char* ToString(UpdateState state) {
    switch (state) {
        case UpdateState::Idle:        return "Idle";
        case UpdateState::Downloading: return "Downloading";
        case UpdateState::Verifying:   return "Verifying";
        case UpdateState::Downloaded:  return "Downloaded";
        case UpdateState::Verified:    return "Verified";
        case UpdateState::Updating:    return "Updating";
        case UpdateState::Updated:     return "Updated";
        case UpdateState::Failed:      return "Failed";
    }
    return "?";
}

UpdateOrchestrator::UpdateOrchestrator(IFirmwareBackend& backend,
                                       IFirmwareSource& source,
                                       IDeviceRestarter& restarter)
    : UpdateOrchestrator(backend, source, restarter, Options{}) {}

UpdateOrchestrator::UpdateOrchestrator(IFirmwareBackend& backend,
                                       IFirmwareSource& source,
                                       IDeviceRestarter& restarter,
                                       Options opt)
    : backend_(backend),
      source_(source),
      restarter_(restarter),
      opt_(std::move(opt)),
      policy_(SwapPolicy::Default(opt_.staging_dir)) {}

void UpdateOrchestrator::TransitionTo(UpdateState next) {
    if (state_ == next)
        return;
    const bool per_file = next == UpdateState::Verifying ||
                          (next == UpdateState::Downloading && state_ == UpdateState::Verifying);
    if (per_file) {
        LogDebug("state: %s -> %s", ToString(state_), ToString(next));
    } else {
        LogInfo("state: %s -> %s", ToString(state_), ToString(next));
    }
    state_ = next;
}

Result UpdateOrchestrator::IsUpdateAvailable(bool& out) {
    out = false;

    FirmwareDescriptor current;
    auto cr = backend_.FetchCurrentFirmware(current);
    if (!cr.is_ok())
        return cr;

    std::optional<FirmwareDescriptor> desired;
    auto dr = backend_.FetchDesiredFirmware(desired);
    if (!dr.is_ok())
        return dr;

    out = NeedsUpdate(desired, current);
    return Result::Ok();
}

Result UpdateOrchestrator::DownloadAndStage(const std::string& source_url, StagingTree& staging) {
    std::unique_ptr<IFileStream> stream;
    auto open_result = source_.Open(source_url, stream);
    if (!open_result.is_ok())
        return open_result;

    while (true) {
        TransitionTo(UpdateState::Downloading);

        DownloadedFile downloaded;
        bool eof = false;
        auto next_result = stream->Next(downloaded, eof);
        if (!next_result.is_ok())
            return next_result;
        if (eof)
            break;

        TransitionTo(UpdateState::Verifying);
        const RemoteFile& file = downloaded.file;
        const std::string actual = GitBlobHashHex(downloaded.Bytes());
        if (actual.empty())
            return Result::Fail(ErrorCode::Io, "digest computation failed for " + file.path);
        if (!DigestEquals(actual, file.content_digest)) {
            return Result::Fail(ErrorCode::HashMismatch,
                                "Hash value '" + actual + "' does not match the expected hash value '" +
                                    file.content_digest + "' for " + file.path);
        }

        std::string relative;
        auto path_result = policy_.NormalizeStagedPath(file.path, relative);
        if (!path_result.is_ok())
            return path_result;

        if (policy_.IsProtected(relative)) {
            LogWarn("Keeping device copy of protected path: %s", relative.c_str());
        } else {
            LogInfo("Saving firmware to: %s", (staging.Root() / relative).string().c_str());
            auto stage_result = staging.StageFile(relative, downloaded.Bytes());
            if (!stage_result.is_ok())
                return stage_result;
        }

        downloaded.ReleaseBytes();
    }

    LogInfo("Firmware downloaded to: %s (%zu of %zu files staged)",
            staging.Root().string().c_str(),
            staging.StagedCount(),
            stream->FileCount());
    return Result::Ok();
}

Result UpdateOrchestrator::RunPipeline(const fs::path& target, bool& restart_requested) {
    restart_requested = false;

    std::optional<FirmwareDescriptor> desired;
    auto dr = backend_.FetchDesiredFirmware(desired);
    if (!dr.is_ok())
        return dr;

    FirmwareDescriptor current;
    auto cr = backend_.FetchCurrentFirmware(current);
    if (!cr.is_ok())
        return cr;

    if (!NeedsUpdate(desired, current)) {
        LogInfo("Firmware is up to date (title=%s version=%s)",
                current.title.c_str(), current.version.c_str());
        return Result::Ok();
    }

    LogInfo("Remote firmware: title=%s version=%s url=%s",
            desired->title.c_str(), desired->version.c_str(), desired->source_url.c_str());
    LogInfo("Current firmware: title=%s version=%s", current.title.c_str(), current.version.c_str());

    fs::path staging_root;
    if (fs::path(opt_.staging_dir).is_absolute()) {
        staging_root = fs::path(opt_.staging_dir).lexically_normal();
        // The policy keeps no entry for it, so it must lie outside the live tree.
        const fs::path rel = staging_root.lexically_relative(fs::absolute(target).lexically_normal());
        if (rel.empty() || *rel.begin() != "..") {
            return Result::Fail(ErrorCode::Config,
                                "absolute staging dir must be outside " + target.string() + ": " +
                                    opt_.staging_dir);
        }
    } else {
        const std::string relative = NormalizeRepoPath(opt_.staging_dir);
        if (relative.empty() || relative == "." || HasParentSegment(relative)) {
            return Result::Fail(ErrorCode::Config,
                                "staging dir must be a subdirectory: " + opt_.staging_dir);
        }
        staging_root = target / relative;
    }

    StagingTree staging;
    auto acquire_result = StagingTree::Acquire(staging_root, staging);
    if (!acquire_result.is_ok())
        return acquire_result;

    TransitionTo(UpdateState::Downloading);
    auto report_result = backend_.ReportStatus(current, UpdateStatus::Downloading);
    if (!report_result.is_ok())
        return report_result;

    auto download_result = DownloadAndStage(desired->source_url, staging);
    if (!download_result.is_ok())
        return download_result;

    TransitionTo(UpdateState::Downloaded);
    TransitionTo(UpdateState::Verified);
    for (const UpdateStatus status :
         {UpdateStatus::Verified, UpdateStatus::Downloaded, UpdateStatus::Updating}) {
        report_result = backend_.ReportStatus(current, status);
        if (!report_result.is_ok())
            return report_result;
    }

    TransitionTo(UpdateState::Updating);
    LogInfo("Updating firmware in %s to %s %s",
            target.string().c_str(), desired->title.c_str(), desired->version.c_str());
    const FirmwareSwapper swapper(policy_);
    auto swap_result = swapper.Swap(staging.Root(), target);
    if (!swap_result.is_ok())
        return Result::Wrap(swap_result, "swap");

    auto release_result = staging.Release();
    if (!release_result.is_ok())
        return release_result;

    auto publish_result = backend_.PublishCurrentFirmware(*desired);
    if (!publish_result.is_ok())
        return publish_result;

    TransitionTo(UpdateState::Updated);
    LogInfo("Firmware updated successfully");
    report_result = backend_.ReportStatus(current, UpdateStatus::Updated);
    if (!report_result.is_ok())
        return report_result;

    restart_requested = true;
    return Result::Ok();
}

void UpdateOrchestrator::ReportFailureBestEffort(const Result& error) {
    auto r = backend_.ReportFailure(error.message());
    if (!r.is_ok()) {
        LogError("Failed to report update failure: %s", r.message().c_str());
    }
}

Result UpdateOrchestrator::DownloadAndApplyUpdate(const std::string& target_dir) {
    state_ = UpdateState::Idle;
    const fs::path target(target_dir.empty() ? std::string(".") : target_dir);

    bool restart_requested = false;
    auto r = RunPipeline(target, restart_requested);
    if (!r.is_ok()) {
        LogError("Update failed (%s): %s", ToString(r.code()), r.message().c_str());
        TransitionTo(UpdateState::Failed);
        ReportFailureBestEffort(r);
        return r;
    }

    if (!restart_requested)
        return Result::Ok();

    auto restart_result = restarter_.Restart();
    if (!restart_result.is_ok()) {
        LogError("Device restart failed: %s", restart_result.message().c_str());
        return restart_result;
    }
    return Result::Ok();
}

} // namespace fwsync
