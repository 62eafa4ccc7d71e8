#include "crypto/git_blob_hash.hpp"

#include <openssl/evp.h>

#include <array>
#include <cctype>
#include <string>

namespace fwsync {

namespace {

constexpr std::size_t kSha1Size = 20;

std::string HexEncode(std::span<const std::uint8_t> bytes) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(bytes.size() * 2);
    for (size_t i = 0; i < bytes.size(); ++i) {
        out[i * 2] = kHex[(bytes[i] >> 4) & 0xF];
        out[i * 2 + 1] = kHex[bytes[i] & 0xF];
    }
    return out;
}

class EvpCtx final {
  public:
    EvpCtx() : ctx_(EVP_MD_CTX_new()) {}
    EvpCtx(const EvpCtx&) = delete;
    EvpCtx& operator=(const EvpCtx&) = delete;
    ~EvpCtx() {
        if (ctx_) EVP_MD_CTX_free(ctx_);
    }

    bool Init() {
        return ctx_ && EVP_DigestInit_ex(ctx_, EVP_sha1(), nullptr) == 1;
    }

    bool Update(const void* data, std::size_t len) {
        if (len == 0) return true;
        return EVP_DigestUpdate(ctx_, data, len) == 1;
    }

    bool Final(std::array<std::uint8_t, kSha1Size>& out) {
        unsigned int len = 0;
        if (EVP_DigestFinal_ex(ctx_, out.data(), &len) != 1) return false;
        return len == out.size();
    }

  private:
    EVP_MD_CTX* ctx_ = nullptr;
};

} // namespace

std::string Sha1Hex(std::span<const std::uint8_t> data) {
    EvpCtx ctx;
    if (!ctx.Init()) return {};
    if (!ctx.Update(data.data(), data.size())) return {};
    std::array<std::uint8_t, kSha1Size> digest{};
    if (!ctx.Final(digest)) return {};
    return HexEncode(digest);
}

std::string GitBlobHashHex(std::span<const std::uint8_t> data) {
    // The header includes its terminating NUL.
    const std::string header = "blob " + std::to_string(data.size());

    EvpCtx ctx;
    if (!ctx.Init()) return {};
    if (!ctx.Update(header.c_str(), header.size() + 1)) return {};
    if (!ctx.Update(data.data(), data.size())) return {};
    std::array<std::uint8_t, kSha1Size> digest{};
    if (!ctx.Final(digest)) return {};
    return HexEncode(digest);
}

bool DigestEquals(std::string_view lhs, std::string_view rhs) {
    if (lhs.size() != rhs.size()) return false;
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(lhs[i])) !=
            std::tolower(static_cast<unsigned char>(rhs[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace fwsync
