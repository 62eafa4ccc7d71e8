#pragma once

#include <atomic>
#include <chrono>

namespace fwsync {

extern std::atomic_bool g_cancel;

void InstallSignalHandlers();

bool CancelRequested();

// Sleeps up to `total`, waking early once SIGINT/SIGTERM arrived.
// Returns false when cancelled.
bool SleepUnlessCancelled(std::chrono::seconds total);

} // namespace fwsync
