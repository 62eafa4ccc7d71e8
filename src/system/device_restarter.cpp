#include "system/device_restarter.hpp"

#include "util/logger.hpp"

#include <cerrno>
#include <cstring>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fwsync {

CommandRestarter::CommandRestarter(std::vector<std::string> argv) : argv_(std::move(argv)) {}

Result CommandRestarter::Restart() {
    if (argv_.empty())
        return Result::Fail(ErrorCode::Config, "restart command is empty");

    std::vector<char*> args;
    args.reserve(argv_.size() + 1);
    for (auto& a : argv_) args.push_back(a.data());
    args.push_back(nullptr);

    LogInfo("Initiating device restart: %s", argv_.front().c_str());

    const pid_t pid = ::fork();
    if (pid < 0)
        return Result::Fail(ErrorCode::Io, std::string("fork failed: ") + std::strerror(errno));
    if (pid == 0) {
        ::execvp(args[0], args.data());
        ::_exit(127);
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR)
            return Result::Fail(ErrorCode::Io, std::string("waitpid failed: ") + std::strerror(errno));
    }

    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        const int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
        return Result::Fail(ErrorCode::Io,
                            "restart command " + argv_.front() + " exited with " + std::to_string(code));
    }
    return Result::Ok();
}

} // namespace fwsync
