#pragma once

#include "util/logger.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace fwsync {

struct AgentConfig {
    std::string backend_url;
    std::uint16_t backend_port = 0;
    std::string device_token;

    std::string firmware_dir = ".";
    std::string staging_dir = "temp-firmware";

    std::string repo_api_base = "https://api.github.com";
    std::string repo_raw_base = "https://raw.githubusercontent.com";
    std::string repo_branch = "main";

    std::uint64_t retry_attempts = 3;
    std::uint64_t retry_delay_seconds = 5;
    std::uint64_t request_timeout_seconds = 30;
    std::uint64_t poll_interval_seconds = 60;

    std::string restart_command = "/sbin/reboot";
    LogLevel log_level = LogLevel::Info;

    // Returns nullptr for unset variables.
    using EnvLookup = std::function<const char*(const char*)>;

    static Result LoadFromFile(const std::string& path, AgentConfig& out);

    // LoadFromFile, then ApplyEnvironment, then Validate. Only a missing file
    // falls back to defaults; any other load error is returned.
    static Result Load(const std::string& path, const EnvLookup& lookup, AgentConfig& out);

    // THINGSBOARD_URL, THINGSBOARD_PORT, THINGSBOARD_DEVICE_TOKEN,
    // FWSYNC_FIRMWARE_DIR, FWSYNC_LOG_LEVEL.
    Result ApplyEnvironment(const EnvLookup& lookup);

    // Also range-checks values narrowed by their consumers.
    Result Validate() const;

    std::vector<std::string> RestartArgv() const;
};

} // namespace fwsync
