#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace fwsync {

std::string Sha1Hex(std::span<const std::uint8_t> data);

// SHA1("blob " + decimal length + '\0' + data), lowercase hex. This is the object
// id a git tree listing publishes for the file, so downloads can be checked against
// the listing without a separate manifest. Empty string if the digest fails.
std::string GitBlobHashHex(std::span<const std::uint8_t> data);

// Case-insensitive comparison of two hex digests.
bool DigestEquals(std::string_view lhs, std::string_view rhs);

} // namespace fwsync
