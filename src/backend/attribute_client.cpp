#include "backend/attribute_client.hpp"

#include "util/logger.hpp"

#include <utility>

namespace fwsync {

namespace {

using json = nlohmann::json;

std::string FirmwareKeyList() {
    return std::string(attr::kFwTitle) + "," + attr::kFwVersion + "," + attr::kFwUrl;
}

std::string StringOrEmpty(const json& section, const char* key) {
    auto it = section.find(key);
    if (it == section.end())
        return {};
    return NormalizeAttributeValue(*it).value_or("");
}

} // namespace

std::optional<std::string> NormalizeAttributeValue(const json& value) {
    if (value.is_null())
        return std::nullopt;
    if (value.is_string())
        return value.get<std::string>();
    return value.dump();
}

RemoteAttributeClient::RemoteAttributeClient(Endpoint endpoint, const RequestExecutor& executor)
    : api_base_(endpoint.url + ":" + std::to_string(endpoint.port) + "/api/v1/" +
                endpoint.access_token),
      executor_(executor) {}

std::string RemoteAttributeClient::SharedAttributesUrl() const {
    return api_base_ + "/attributes?sharedKeys=" + FirmwareKeyList();
}

std::string RemoteAttributeClient::ClientAttributesUrl() const {
    return api_base_ + "/attributes?clientKeys=" + FirmwareKeyList();
}

Result RemoteAttributeClient::GetAttributeSection(const std::string& url,
                                                  const char* section,
                                                  json& out) const {
    json body;
    auto r = executor_.ExecuteJson(HttpRequest::Get(url), "attributes", body);
    if (!r.is_ok())
        return r;

    if (!body.is_object())
        return Result::Fail(ErrorCode::Protocol, "attributes response must be a JSON object");

    auto it = body.find(section);
    if (it == body.end() || it->is_null()) {
        out = json::object();
        return Result::Ok();
    }
    if (!it->is_object()) {
        return Result::Fail(ErrorCode::Protocol,
                            std::string("attributes '") + section + "' must be a JSON object");
    }
    out = *it;
    return Result::Ok();
}

Result RemoteAttributeClient::PostJson(const std::string& url, const json& body) const {
    HttpResponse response;
    return executor_.Execute(HttpRequest::PostJson(url, body.dump()), response);
}

Result RemoteAttributeClient::FetchDesiredFirmware(std::optional<FirmwareDescriptor>& out) {
    out.reset();

    json shared;
    auto r = GetAttributeSection(SharedAttributesUrl(), "shared", shared);
    if (!r.is_ok())
        return r;

    FirmwareDescriptor fw;
    const std::pair<const char*, std::string*> fields[] = {
        {attr::kFwTitle, &fw.title},
        {attr::kFwVersion, &fw.version},
        {attr::kFwUrl, &fw.source_url},
    };
    for (const auto& [key, dst] : fields) {
        auto it = shared.find(key);
        if (it == shared.end())
            return Result::Ok();
        auto value = NormalizeAttributeValue(*it);
        if (!value)
            return Result::Ok();
        *dst = std::move(*value);
    }

    out = std::move(fw);
    return Result::Ok();
}

Result RemoteAttributeClient::FetchCurrentFirmware(FirmwareDescriptor& out) {
    out = FirmwareDescriptor{};

    json client;
    auto r = GetAttributeSection(ClientAttributesUrl(), "client", client);
    if (!r.is_ok())
        return r;

    out.title = StringOrEmpty(client, attr::kFwTitle);
    out.version = StringOrEmpty(client, attr::kFwVersion);
    out.source_url = StringOrEmpty(client, attr::kFwUrl);
    return Result::Ok();
}

Result RemoteAttributeClient::IsUpdateAvailable(bool& out) {
    out = false;

    FirmwareDescriptor current;
    auto cr = FetchCurrentFirmware(current);
    if (!cr.is_ok())
        return cr;

    std::optional<FirmwareDescriptor> desired;
    auto dr = FetchDesiredFirmware(desired);
    if (!dr.is_ok())
        return dr;

    out = NeedsUpdate(desired, current);
    return Result::Ok();
}

Result RemoteAttributeClient::FetchFirmwareUrl(std::string& out) {
    out.clear();
    std::optional<FirmwareDescriptor> desired;
    auto r = FetchDesiredFirmware(desired);
    if (!r.is_ok())
        return r;
    if (desired)
        out = desired->source_url;
    return Result::Ok();
}

Result RemoteAttributeClient::SendTelemetry(const json& point) {
    return PostJson(api_base_ + "/telemetry", point);
}

Result RemoteAttributeClient::ReportStatus(const FirmwareDescriptor& current, UpdateStatus status) {
    json point = {
        {std::string("current_") + attr::kFwTitle, current.title},
        {std::string("current_") + attr::kFwVersion, current.version},
        {attr::kFwState, ToString(status)},
    };
    LogDebug("report %s=%s", attr::kFwState, ToString(status));
    return SendTelemetry(point);
}

Result RemoteAttributeClient::ReportFailure(std::string_view error) {
    json point = {
        {attr::kFwState, ToString(UpdateStatus::Failed)},
        {attr::kFwError, std::string(error)},
    };
    return SendTelemetry(point);
}

Result RemoteAttributeClient::PublishCurrentFirmware(const FirmwareDescriptor& firmware) {
    json attributes = {
        {attr::kFwTitle, firmware.title},
        {attr::kFwVersion, firmware.version},
        {attr::kFwUrl, firmware.source_url},
    };
    return PostJson(api_base_ + "/attributes", attributes);
}

} // namespace fwsync
