#pragma once

#include "net/http_transport.hpp"

#include <cstdint>
#include <string>

namespace fwsync {

class CurlHttpTransport final : public IHttpTransport {
  public:
    struct Options {
        std::uint64_t timeout_seconds = 30;
        std::uint64_t connect_timeout_seconds = 10;
        bool follow_redirects = true;
        std::string user_agent = "fwsync";
    };

    CurlHttpTransport();
    explicit CurlHttpTransport(Options opt);

    Result Perform(const HttpRequest& request, HttpResponse& out) override;

  private:
    Options opt_{};
};

} // namespace fwsync
