#pragma once

#include "net/http_transport.hpp"
#include "util/result.hpp"

#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include <string_view>

namespace fwsync {

// Bounded-retry request primitive shared by every backend and repository call.
//
// A request is retried with the same parameters when the transport fails or the
// server answers 5xx/429. Other non-2xx answers fail at once with ErrorCode::Protocol.
// When every attempt failed the result is ErrorCode::ConnectionExhausted.
class RequestExecutor {
  public:
    struct Options {
        unsigned attempts = 3;
        std::chrono::seconds delay{5};
    };

    class ISleeper {
      public:
        virtual ~ISleeper() = default;
        virtual void SleepFor(std::chrono::seconds delay) const = 0;
    };

    explicit RequestExecutor(IHttpTransport& transport);
    RequestExecutor(IHttpTransport& transport,
                    Options opt,
                    std::shared_ptr<const ISleeper> sleeper = nullptr);

    Result Execute(const HttpRequest& request, HttpResponse& out) const;

    // Execute, then parse the body as JSON. `what` names the call in errors.
    Result ExecuteJson(const HttpRequest& request, std::string_view what, nlohmann::json& out) const;

    const Options& options() const { return opt_; }

  private:
    static std::shared_ptr<const ISleeper> DefaultSleeper();

    IHttpTransport& transport_;
    Options opt_{};
    std::shared_ptr<const ISleeper> sleeper_;
};

} // namespace fwsync
