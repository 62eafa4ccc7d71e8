#include "net/http_transport.hpp"

#include <strings.h>

#include <utility>

namespace fwsync {

const char* ToString(HttpMethod method) {
    switch (method) {
        case HttpMethod::Get:  return "GET";
        case HttpMethod::Post: return "POST";
    }
    return "?";
}

HttpRequest HttpRequest::Get(std::string url, std::vector<HttpHeader> headers) {
    HttpRequest req;
    req.method = HttpMethod::Get;
    req.url = std::move(url);
    req.headers = std::move(headers);
    return req;
}

HttpRequest HttpRequest::PostJson(std::string url, std::string json_body) {
    HttpRequest req;
    req.method = HttpMethod::Post;
    req.url = std::move(url);
    req.headers.push_back({"Content-Type", "application/json"});
    req.body = std::move(json_body);
    return req;
}

const HttpHeader* HttpRequest::FindHeader(std::string_view name) const {
    for (const auto& h : headers) {
        if (h.name.size() == name.size() &&
            ::strncasecmp(h.name.data(), name.data(), name.size()) == 0) {
            return &h;
        }
    }
    return nullptr;
}

} // namespace fwsync
