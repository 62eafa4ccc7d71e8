#pragma once

#include "util/result.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>

namespace fwsync {

struct RemoteFile {
    std::string path;            // repository-relative
    std::string content_digest;  // hex, as published by the listing
};

// `bytes` takes over the HTTP response body, so one buffer per file is resident.
struct DownloadedFile {
    RemoteFile file;
    std::string bytes;

    std::span<const std::uint8_t> Bytes() const {
        return {reinterpret_cast<const std::uint8_t*>(bytes.data()), bytes.size()};
    }
    void ReleaseBytes() { std::string().swap(bytes); }
};

// Single pass over a listed file set. Each Next() downloads one file, so at most
// one file's bytes are held by the stream's consumer at a time.
class IFileStream {
  public:
    virtual ~IFileStream() = default;

    // Returns Ok + eof=true after the last file.
    virtual Result Next(DownloadedFile& out, bool& eof) = 0;
    virtual std::size_t FileCount() const = 0;
};

class IFirmwareSource {
  public:
    virtual ~IFirmwareSource() = default;

    // Resolves and lists `source_url`. Listing errors surface here, before any
    // file is downloaded.
    virtual Result Open(const std::string& source_url, std::unique_ptr<IFileStream>& out) = 0;
};

} // namespace fwsync
