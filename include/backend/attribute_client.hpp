#pragma once

#include "backend/firmware_backend.hpp"
#include "net/request_executor.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace fwsync {

namespace attr {
inline constexpr const char kFwTitle[] = "fw_title";
inline constexpr const char kFwVersion[] = "fw_version";
inline constexpr const char kFwUrl[] = "fw_url";
inline constexpr const char kFwState[] = "fw_state";
inline constexpr const char kFwError[] = "fw_error";
} // namespace attr

// Device side of the backend's HTTP attribute/telemetry API:
//   GET  {base}/attributes?sharedKeys=fw_title,fw_version,fw_url   -> {"shared": {...}}
//   GET  {base}/attributes?clientKeys=fw_title,fw_version,fw_url   -> {"client": {...}}
//   POST {base}/attributes   client attribute update
//   POST {base}/telemetry    time-series point
// where base = {url}:{port}/api/v1/{device token}.
class RemoteAttributeClient final : public IFirmwareBackend {
  public:
    struct Endpoint {
        std::string url;
        std::uint16_t port = 0;
        std::string access_token;
    };

    RemoteAttributeClient(Endpoint endpoint, const RequestExecutor& executor);

    Result FetchDesiredFirmware(std::optional<FirmwareDescriptor>& out) override;
    Result FetchCurrentFirmware(FirmwareDescriptor& out) override;
    Result ReportStatus(const FirmwareDescriptor& current, UpdateStatus status) override;
    Result ReportFailure(std::string_view error) override;
    Result PublishCurrentFirmware(const FirmwareDescriptor& firmware) override;

    Result IsUpdateAvailable(bool& out);
    Result FetchFirmwareUrl(std::string& out);
    Result SendTelemetry(const nlohmann::json& point);

    const std::string& ApiBase() const { return api_base_; }
    std::string SharedAttributesUrl() const;
    std::string ClientAttributesUrl() const;

  private:
    Result GetAttributeSection(const std::string& url, const char* section, nlohmann::json& out) const;
    Result PostJson(const std::string& url, const nlohmann::json& body) const;

    std::string api_base_;
    const RequestExecutor& executor_;
};

// Strings verbatim, anything else as compact JSON text (2 -> "2"); null -> nullopt.
std::optional<std::string> NormalizeAttributeValue(const nlohmann::json& value);

} // namespace fwsync
