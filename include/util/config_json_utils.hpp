#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace fwsync::config::detail {

Result LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out);

// Absent keys leave `out` untouched; present keys of the wrong type fail.
Result ReadString(const nlohmann::json& j, const char* key, std::optional<std::string>& out);
Result ReadU64(const nlohmann::json& j, const char* key, std::optional<std::uint64_t>& out);

// Accepts a JSON number or a decimal string ("1883").
Result ReadPort(const nlohmann::json& j, const char* key, std::optional<std::uint16_t>& out);

bool ParsePort(const std::string& text, std::uint16_t& out);

} // namespace fwsync::config::detail
