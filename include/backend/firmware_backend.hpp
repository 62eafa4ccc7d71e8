#pragma once

#include "backend/firmware_descriptor.hpp"
#include "util/result.hpp"

#include <optional>
#include <string_view>

namespace fwsync {

class IFirmwareBackend {
  public:
    virtual ~IFirmwareBackend() = default;

    virtual Result FetchDesiredFirmware(std::optional<FirmwareDescriptor>& out) = 0;
    virtual Result FetchCurrentFirmware(FirmwareDescriptor& out) = 0;

    virtual Result ReportStatus(const FirmwareDescriptor& current, UpdateStatus status) = 0;
    virtual Result ReportFailure(std::string_view error) = 0;
    virtual Result PublishCurrentFirmware(const FirmwareDescriptor& firmware) = 0;
};

} // namespace fwsync
