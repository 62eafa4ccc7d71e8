#pragma once

#include "util/result.hpp"

#include <string>
#include <vector>

namespace fwsync {

class IDeviceRestarter {
  public:
    virtual ~IDeviceRestarter() = default;

    // Normally does not return control for long; an error means the restart
    // could not be requested.
    virtual Result Restart() = 0;
};

// Runs a restart command (e.g. /sbin/reboot) and waits for it to exit.
class CommandRestarter final : public IDeviceRestarter {
  public:
    explicit CommandRestarter(std::vector<std::string> argv);

    Result Restart() override;

  private:
    std::vector<std::string> argv_;
};

} // namespace fwsync
