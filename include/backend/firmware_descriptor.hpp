#pragma once

#include <optional>
#include <string>

namespace fwsync {

struct FirmwareDescriptor {
    std::string title;
    std::string version;
    std::string source_url;

    bool SameRelease(const FirmwareDescriptor& other) const {
        return title == other.title && version == other.version;
    }
};

// `desired` is nullopt when the backend has not published all of title, version
// and source URL.
inline bool NeedsUpdate(const std::optional<FirmwareDescriptor>& desired,
                        const FirmwareDescriptor& current) {
    return desired.has_value() && !desired->SameRelease(current);
}

enum class UpdateStatus { Downloading, Downloaded, Verified, Updating, Updated, Failed };

// Wire value of the fw_state telemetry key.
const char* ToString(UpdateStatus status);

} // namespace fwsync
