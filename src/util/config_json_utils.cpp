#include "util/config_json_utils.hpp"

#include <charconv>
#include <fstream>

namespace fwsync::config::detail {

Result LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out) {
    std::ifstream is(path);
    if (!is.good()) {
        return Result::Fail(ErrorCode::Config, "cannot open " + path);
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        return Result::Fail(ErrorCode::Config, "invalid JSON in " + path + ": " + e.what());
    }

    if (!out.is_object()) {
        return Result::Fail(ErrorCode::Config, "root must be JSON object: " + path);
    }
    return Result::Ok();
}

Result ReadString(const nlohmann::json& j, const char* key, std::optional<std::string>& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return Result::Ok();
    if (!it->is_string())
        return Result::Fail(ErrorCode::Config, std::string("'") + key + "' must be a string");
    out = it->get<std::string>();
    return Result::Ok();
}

Result ReadU64(const nlohmann::json& j, const char* key, std::optional<std::uint64_t>& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return Result::Ok();
    if (it->is_number_unsigned()) {
        out = it->get<std::uint64_t>();
        return Result::Ok();
    }
    if (!it->is_number_integer())
        return Result::Fail(ErrorCode::Config, std::string("'") + key + "' must be an integer");
    const auto v = it->get<std::int64_t>();
    if (v < 0)
        return Result::Fail(ErrorCode::Config, std::string("'") + key + "' must not be negative");
    out = static_cast<std::uint64_t>(v);
    return Result::Ok();
}

bool ParsePort(const std::string& text, std::uint16_t& out) {
    unsigned value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last || value == 0 || value > 65535)
        return false;
    out = static_cast<std::uint16_t>(value);
    return true;
}

Result ReadPort(const nlohmann::json& j, const char* key, std::optional<std::uint16_t>& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return Result::Ok();

    std::uint16_t port = 0;
    if (it->is_string()) {
        if (!ParsePort(it->get<std::string>(), port))
            return Result::Fail(ErrorCode::Config, std::string("'") + key + "' is not a valid port");
    } else if (it->is_number_unsigned()) {
        const auto v = it->get<std::uint64_t>();
        if (v == 0 || v > 65535)
            return Result::Fail(ErrorCode::Config, std::string("'") + key + "' is not a valid port");
        port = static_cast<std::uint16_t>(v);
    } else if (it->is_number_integer()) {
        const auto v = it->get<std::int64_t>();
        if (v <= 0 || v > 65535)
            return Result::Fail(ErrorCode::Config, std::string("'") + key + "' is not a valid port");
        port = static_cast<std::uint16_t>(v);
    } else {
        return Result::Fail(ErrorCode::Config, std::string("'") + key + "' must be a number or string");
    }
    out = port;
    return Result::Ok();
}

} // namespace fwsync::config::detail
