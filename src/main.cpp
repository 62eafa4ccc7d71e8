#include "backend/attribute_client.hpp"
#include "net/curl_http_transport.hpp"
#include "net/request_executor.hpp"
#include "ota/update_orchestrator.hpp"
#include "repo/repository_fetcher.hpp"
#include "system/device_restarter.hpp"
#include "system/signals.hpp"
#include "util/agent_config.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <getopt.h>
#include <limits>
#include <string>

namespace {

constexpr const char* kDefaultConfigPath = "/etc/fwsync/fwsync.conf";

constexpr int kExitUpToDate = 3;

enum class Mode { Poll, Check, Once };

void PrintUsage(const char* argv0) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [-c <config>] [--check | --once] [-i <seconds>] [-v]\n"
        "\n"
        "Options:\n"
        "  -c, --config     Config file (default %s)\n"
        "      --check      Exit 0 if a firmware update is available, %d if up to date\n"
        "      --once       Run a single update attempt and exit\n"
        "  -i, --interval   Seconds between polls (overrides poll_interval_seconds)\n"
        "  -v, --verbose    Debug logging\n"
        "  -h, --help       Show this help\n",
        argv0, kDefaultConfigPath, kExitUpToDate);
}

bool ParseSeconds(const char* text, std::uint64_t& out) {
    char* end = nullptr;
    errno = 0;
    const unsigned long long v = std::strtoull(text, &end, 10);
    if (!end || *end != '\0' || end == text || *text == '-') return false;
    if (errno == ERANGE || v > static_cast<unsigned long long>(std::numeric_limits<long>::max()))
        return false;
    out = static_cast<std::uint64_t>(v);
    return true;
}

} // namespace

int main(int argc, char** argv) {
    fwsync::InstallSignalHandlers();

    std::string config_path = kDefaultConfigPath;
    Mode mode = Mode::Poll;
    bool verbose = false;
    std::uint64_t interval_override = 0;
    bool has_interval = false;

    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"check", no_argument, nullptr, 'C'},
        {"once", no_argument, nullptr, 'O'},
        {"interval", required_argument, nullptr, 'i'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hc:i:v", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;
            case 'c':
                config_path = optarg;
                break;
            case 'C':
                mode = Mode::Check;
                break;
            case 'O':
                mode = Mode::Once;
                break;
            case 'i':
                if (!ParseSeconds(optarg, interval_override)) {
                    std::fprintf(stderr, "Invalid --interval: %s\n", optarg);
                    return 2;
                }
                has_interval = true;
                break;
            case 'v':
                verbose = true;
                break;
            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    fwsync::AgentConfig cfg;
    const auto process_env = [](const char* name) -> const char* { return std::getenv(name); };
    if (auto r = fwsync::AgentConfig::Load(config_path, process_env, cfg); !r.is_ok()) {
        std::fprintf(stderr, "ERROR: %s\n", r.message().c_str());
        return 1;
    }
    if (has_interval) cfg.poll_interval_seconds = interval_override;

    fwsync::Logger::Instance().SetLevel(verbose ? fwsync::LogLevel::Debug : cfg.log_level);

    fwsync::CurlHttpTransport::Options http_opt;
    http_opt.timeout_seconds = cfg.request_timeout_seconds;
    fwsync::CurlHttpTransport transport(http_opt);

    fwsync::RequestExecutor::Options retry_opt;
    retry_opt.attempts = static_cast<unsigned>(cfg.retry_attempts);
    retry_opt.delay = std::chrono::seconds(cfg.retry_delay_seconds);
    const fwsync::RequestExecutor executor(transport, retry_opt);

    fwsync::RemoteAttributeClient backend(
        {.url = cfg.backend_url, .port = cfg.backend_port, .access_token = cfg.device_token},
        executor);

    fwsync::RepositoryFetcher::Options repo_opt;
    repo_opt.api_base = cfg.repo_api_base;
    repo_opt.raw_base = cfg.repo_raw_base;
    repo_opt.branch = cfg.repo_branch;
    fwsync::RepositoryFetcher fetcher(executor, repo_opt);

    fwsync::CommandRestarter restarter(cfg.RestartArgv());

    fwsync::UpdateOrchestrator::Options ota_opt;
    ota_opt.staging_dir = cfg.staging_dir;
    fwsync::UpdateOrchestrator orchestrator(backend, fetcher, restarter, ota_opt);

    if (mode == Mode::Check) {
        bool available = false;
        if (auto r = orchestrator.IsUpdateAvailable(available); !r.is_ok()) {
            LogError("%s", r.message().c_str());
            return 1;
        }
        std::printf("%s\n", available ? "update available" : "up to date");
        return available ? 0 : kExitUpToDate;
    }

    if (mode == Mode::Once) {
        auto r = orchestrator.DownloadAndApplyUpdate(cfg.firmware_dir);
        return r.is_ok() ? 0 : 1;
    }

    LogInfo("Polling %s:%u every %llus", cfg.backend_url.c_str(), static_cast<unsigned>(cfg.backend_port),
            static_cast<unsigned long long>(cfg.poll_interval_seconds));
    while (!fwsync::CancelRequested()) {
        bool available = false;
        auto r = orchestrator.IsUpdateAvailable(available);
        if (r.is_ok() && available) {
            r = orchestrator.DownloadAndApplyUpdate(cfg.firmware_dir);
        }
        if (!r.is_ok()) {
            if (fwsync::IsTransient(r.code())) {
                LogWarn("Network unavailable, retrying next cycle: %s", r.message().c_str());
            } else {
                LogError("Update attempt failed: %s", r.message().c_str());
            }
        }

        if (!fwsync::SleepUnlessCancelled(std::chrono::seconds(cfg.poll_interval_seconds)))
            break;
    }

    LogInfo("Stopped");
    return 0;
}
