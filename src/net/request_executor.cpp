#include "net/request_executor.hpp"

#include "util/logger.hpp"

#include <string>
#include <thread>

namespace fwsync {

namespace {

class ThreadSleeper final : public RequestExecutor::ISleeper {
  public:
    void SleepFor(std::chrono::seconds delay) const override {
        std::this_thread::sleep_for(delay);
    }
};

bool IsTransientStatus(long status) {
    return status >= 500 || status == 429;
}

} // namespace

std::shared_ptr<const RequestExecutor::ISleeper> RequestExecutor::DefaultSleeper() {
    static const std::shared_ptr<const ISleeper> kDefault = std::make_shared<ThreadSleeper>();
    return kDefault;
}

RequestExecutor::RequestExecutor(IHttpTransport& transport)
    : RequestExecutor(transport, Options{}, nullptr) {}

RequestExecutor::RequestExecutor(IHttpTransport& transport,
                                 Options opt,
                                 std::shared_ptr<const ISleeper> sleeper)
    : transport_(transport), opt_(opt), sleeper_(sleeper ? std::move(sleeper) : DefaultSleeper()) {
    if (opt_.attempts == 0) opt_.attempts = 1;
}

Result RequestExecutor::Execute(const HttpRequest& request, HttpResponse& out) const {
    std::string last_error;

    for (unsigned attempt = 1; attempt <= opt_.attempts; ++attempt) {
        auto r = transport_.Perform(request, out);
        if (r.is_ok()) {
            if (out.IsSuccess())
                return Result::Ok();
            if (!IsTransientStatus(out.status)) {
                return Result::Fail(ErrorCode::Protocol,
                                    std::string(ToString(request.method)) + " " + request.url +
                                        " returned HTTP " + std::to_string(out.status));
            }
            last_error = "HTTP " + std::to_string(out.status);
        } else {
            last_error = r.message();
        }

        if (attempt < opt_.attempts) {
            LogWarn("%s - Retrying in %llds (%u/%u)",
                    last_error.c_str(),
                    static_cast<long long>(opt_.delay.count()),
                    attempt,
                    opt_.attempts);
            sleeper_->SleepFor(opt_.delay);
        } else {
            LogError("Failed after %u attempts. Last error: %s", attempt, last_error.c_str());
        }
    }

    out = HttpResponse{};
    return Result::Fail(ErrorCode::ConnectionExhausted,
                        "Failed to establish connection to " + request.url + " after " +
                            std::to_string(opt_.attempts) + " attempts: " + last_error);
}

Result RequestExecutor::ExecuteJson(const HttpRequest& request,
                                    std::string_view what,
                                    nlohmann::json& out) const {
    HttpResponse response;
    auto r = Execute(request, response);
    if (!r.is_ok())
        return r;

    try {
        out = nlohmann::json::parse(response.body);
    } catch (const nlohmann::json::parse_error& e) {
        return Result::Fail(ErrorCode::Protocol,
                            std::string(what) + ": invalid JSON response: " + e.what());
    }
    return Result::Ok();
}

} // namespace fwsync
