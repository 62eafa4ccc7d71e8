#pragma once

#include "util/result.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace fwsync {

enum class HttpMethod { Get, Post };

const char* ToString(HttpMethod method);

struct HttpHeader {
    std::string name;
    std::string value;
};

struct HttpRequest {
    HttpMethod method = HttpMethod::Get;
    std::string url;
    std::vector<HttpHeader> headers;
    std::string body;

    static HttpRequest Get(std::string url, std::vector<HttpHeader> headers = {});
    static HttpRequest PostJson(std::string url, std::string json_body);

    // Case-insensitive lookup; nullptr when absent.
    const HttpHeader* FindHeader(std::string_view name) const;
};

struct HttpResponse {
    long status = 0;
    std::string body;

    bool IsSuccess() const { return status >= 200 && status < 300; }
};

class IHttpTransport {
  public:
    virtual ~IHttpTransport() = default;

    // Fails with ErrorCode::Transport when no HTTP response was received.
    // Any received response, whatever its status, is Ok.
    virtual Result Perform(const HttpRequest& request, HttpResponse& out) = 0;
};

} // namespace fwsync
