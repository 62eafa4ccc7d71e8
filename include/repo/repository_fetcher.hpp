#pragma once

#include "net/request_executor.hpp"
#include "repo/firmware_source.hpp"
#include "repo/repository_url.hpp"

#include <string>
#include <vector>

namespace fwsync {

// Source-hosting client:
//   GET {api_base}/repos/{owner}/{repo}/git/trees/{branch}?recursive=1
//   GET {raw_base}/{owner}/{repo}/{branch}/{path}
class RepositoryFetcher final : public IFirmwareSource {
  public:
    struct Options {
        std::string api_base = "https://api.github.com";
        std::string raw_base = "https://raw.githubusercontent.com";
        std::string branch = "main";
    };

    explicit RepositoryFetcher(const RequestExecutor& executor);
    RepositoryFetcher(const RequestExecutor& executor, Options opt);

    Result Open(const std::string& source_url, std::unique_ptr<IFileStream>& out) override;

    // Blob entries of the recursive tree, in listing order.
    Result ListFiles(const RepositoryLocation& repo, std::vector<RemoteFile>& out) const;

    std::string TreeUrl(const RepositoryLocation& repo) const;
    std::string RawFileUrl(const RepositoryLocation& repo, const std::string& path) const;

    // Empty without an access token, otherwise "Authorization: Bearer <token>".
    static std::vector<HttpHeader> AuthHeaders(const RepositoryLocation& repo);

  private:
    const RequestExecutor& executor_;
    Options opt_{};
};

// Percent-encodes everything outside RFC 3986 unreserved characters, keeping '/'.
std::string EncodeUrlPath(const std::string& path);

} // namespace fwsync
