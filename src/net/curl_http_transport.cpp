#include "net/curl_http_transport.hpp"

#include "util/logger.hpp"

#include <curl/curl.h>

#include <mutex>
#include <string>

namespace fwsync {

namespace {

void EnsureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

class CurlHandle final {
  public:
    CurlHandle() : curl_(curl_easy_init()) {}
    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
    ~CurlHandle() {
        if (curl_) curl_easy_cleanup(curl_);
    }

    CURL* get() const { return curl_; }
    bool ok() const { return curl_ != nullptr; }

  private:
    CURL* curl_ = nullptr;
};

class CurlHeaderList final {
  public:
    CurlHeaderList() = default;
    CurlHeaderList(const CurlHeaderList&) = delete;
    CurlHeaderList& operator=(const CurlHeaderList&) = delete;
    ~CurlHeaderList() {
        if (list_) curl_slist_free_all(list_);
    }

    bool Append(const std::string& line) {
        curl_slist* next = curl_slist_append(list_, line.c_str());
        if (!next) return false;
        list_ = next;
        return true;
    }

    curl_slist* get() const { return list_; }

  private:
    curl_slist* list_ = nullptr;
};

size_t AppendBody(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(data, size * nmemb);
    return size * nmemb;
}

} // namespace

CurlHttpTransport::CurlHttpTransport() : CurlHttpTransport(Options{}) {}

CurlHttpTransport::CurlHttpTransport(Options opt) : opt_(std::move(opt)) {
    EnsureCurlGlobalInit();
}

Result CurlHttpTransport::Perform(const HttpRequest& request, HttpResponse& out) {
    out = HttpResponse{};

    CurlHandle handle;
    if (!handle.ok())
        return Result::Fail(ErrorCode::Transport, "curl_easy_init failed");
    CURL* curl = handle.get();

    CurlHeaderList headers;
    for (const auto& h : request.headers) {
        if (!headers.Append(h.name + ": " + h.value))
            return Result::Fail(ErrorCode::Transport, "curl_slist_append failed");
    }

    char errbuf[CURL_ERROR_SIZE]{};
    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, opt_.follow_redirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(opt_.timeout_seconds));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(opt_.connect_timeout_seconds));
    curl_easy_setopt(curl, CURLOPT_USERAGENT, opt_.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &AppendBody);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &out.body);

    if (request.method == HttpMethod::Post) {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    } else {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    }

    const CURLcode rc = curl_easy_perform(curl);
    if (rc != CURLE_OK) {
        const std::string detail = errbuf[0] != '\0' ? errbuf : curl_easy_strerror(rc);
        out.body.clear();
        return Result::Fail(ErrorCode::Transport,
                            std::string(ToString(request.method)) + " " + request.url + ": " + detail);
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &out.status);
    LogDebug("%s %s -> %ld (%zu bytes)",
             ToString(request.method), request.url.c_str(), out.status, out.body.size());
    return Result::Ok();
}

} // namespace fwsync
