#include "util/agent_config.hpp"

#include "util/config_json_utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <limits>
#include <optional>
#include <sstream>
#include <system_error>
#include <utility>

namespace fwsync {

namespace {

template <typename T>
void Assign(std::optional<T>& value, T& field) {
    if (value) field = std::move(*value);
}

} // namespace

Result AgentConfig::LoadFromFile(const std::string& path, AgentConfig& out) {
    out = AgentConfig{};

    nlohmann::json j;
    auto lr = config::detail::LoadJsonObjectFromFile(path, j);
    if (!lr.is_ok())
        return lr;

    std::optional<std::string> backend_url, device_token, firmware_dir, staging_dir;
    std::optional<std::string> api_base, raw_base, branch, restart_command, log_level;
    std::optional<std::uint16_t> port;
    std::optional<std::uint64_t> attempts, delay, timeout, poll;

    using config::detail::ReadPort;
    using config::detail::ReadString;
    using config::detail::ReadU64;
    for (const Result& r : {
             ReadString(j, "backend_url", backend_url),
             ReadPort(j, "backend_port", port),
             ReadString(j, "device_token", device_token),
             ReadString(j, "firmware_dir", firmware_dir),
             ReadString(j, "staging_dir", staging_dir),
             ReadString(j, "repo_api_base", api_base),
             ReadString(j, "repo_raw_base", raw_base),
             ReadString(j, "repo_branch", branch),
             ReadU64(j, "retry_attempts", attempts),
             ReadU64(j, "retry_delay_seconds", delay),
             ReadU64(j, "request_timeout_seconds", timeout),
             ReadU64(j, "poll_interval_seconds", poll),
             ReadString(j, "restart_command", restart_command),
             ReadString(j, "log_level", log_level),
         }) {
        if (!r.is_ok())
            return Result::Wrap(r, path);
    }

    Assign(backend_url, out.backend_url);
    Assign(port, out.backend_port);
    Assign(device_token, out.device_token);
    Assign(firmware_dir, out.firmware_dir);
    Assign(staging_dir, out.staging_dir);
    Assign(api_base, out.repo_api_base);
    Assign(raw_base, out.repo_raw_base);
    Assign(branch, out.repo_branch);
    Assign(attempts, out.retry_attempts);
    Assign(delay, out.retry_delay_seconds);
    Assign(timeout, out.request_timeout_seconds);
    Assign(poll, out.poll_interval_seconds);
    Assign(restart_command, out.restart_command);

    if (log_level && !ParseLogLevel(*log_level, out.log_level)) {
        return Result::Fail(ErrorCode::Config, "unknown log_level '" + *log_level + "' in " + path);
    }
    return Result::Ok();
}

Result AgentConfig::Load(const std::string& path, const EnvLookup& lookup, AgentConfig& out) {
    out = AgentConfig{};

    std::error_code ec;
    const bool present = std::filesystem::exists(path, ec);
    if (ec)
        return Result::Fail(ErrorCode::Config, "cannot stat " + path + ": " + ec.message());

    if (present) {
        auto lr = LoadFromFile(path, out);
        if (!lr.is_ok())
            return lr;
    } else {
        LogWarn("Config file %s not found, using defaults and environment", path.c_str());
    }

    auto er = out.ApplyEnvironment(lookup);
    if (!er.is_ok())
        return er;
    return out.Validate();
}

Result AgentConfig::ApplyEnvironment(const EnvLookup& lookup) {
    if (!lookup)
        return Result::Ok();

    if (const char* v = lookup("THINGSBOARD_URL"); v && *v) backend_url = v;
    if (const char* v = lookup("THINGSBOARD_DEVICE_TOKEN"); v && *v) device_token = v;
    if (const char* v = lookup("FWSYNC_FIRMWARE_DIR"); v && *v) firmware_dir = v;

    if (const char* v = lookup("THINGSBOARD_PORT"); v && *v) {
        if (!config::detail::ParsePort(v, backend_port)) {
            return Result::Fail(ErrorCode::Config,
                                std::string("THINGSBOARD_PORT is not a valid port: ") + v);
        }
    }
    if (const char* v = lookup("FWSYNC_LOG_LEVEL"); v && *v) {
        if (!ParseLogLevel(v, log_level)) {
            return Result::Fail(ErrorCode::Config, std::string("unknown FWSYNC_LOG_LEVEL: ") + v);
        }
    }
    return Result::Ok();
}

Result AgentConfig::Validate() const {
    if (backend_url.empty())
        return Result::Fail(ErrorCode::Config, "missing backend_url (THINGSBOARD_URL)");
    if (backend_port == 0)
        return Result::Fail(ErrorCode::Config, "missing backend_port (THINGSBOARD_PORT)");
    if (device_token.empty())
        return Result::Fail(ErrorCode::Config, "missing device_token (THINGSBOARD_DEVICE_TOKEN)");
    if (firmware_dir.empty())
        return Result::Fail(ErrorCode::Config, "firmware_dir must not be empty");
    if (staging_dir.empty())
        return Result::Fail(ErrorCode::Config, "staging_dir must not be empty");
    if (retry_attempts == 0)
        return Result::Fail(ErrorCode::Config, "retry_attempts must be at least 1");
    if (retry_attempts > std::numeric_limits<unsigned>::max())
        return Result::Fail(ErrorCode::Config, "retry_attempts is out of range");
    const std::pair<const char*, std::uint64_t> durations[] = {
        {"retry_delay_seconds", retry_delay_seconds},
        {"request_timeout_seconds", request_timeout_seconds},
        {"poll_interval_seconds", poll_interval_seconds},
    };
    for (const auto& [name, value] : durations) {
        if (value > static_cast<std::uint64_t>(std::numeric_limits<long>::max()))
            return Result::Fail(ErrorCode::Config, std::string(name) + " is out of range");
    }
    if (repo_branch.empty())
        return Result::Fail(ErrorCode::Config, "repo_branch must not be empty");
    return Result::Ok();
}

std::vector<std::string> AgentConfig::RestartArgv() const {
    std::vector<std::string> argv;
    std::istringstream is(restart_command);
    std::string word;
    while (is >> word) argv.push_back(word);
    return argv;
}

} // namespace fwsync
