// signals.cpp - Signal handling and the poll loop's cancel flag.

#include "system/signals.hpp"

#include <algorithm>
#include <csignal>
#include <thread>

namespace fwsync {

std::atomic_bool g_cancel{false};

static void HandleSignal(int) {
    g_cancel.store(true, std::memory_order_relaxed);
}

void InstallSignalHandlers() {
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);
}

bool CancelRequested() {
    return g_cancel.load(std::memory_order_relaxed);
}

bool SleepUnlessCancelled(std::chrono::seconds total) {
    using namespace std::chrono_literals;
    const auto deadline = std::chrono::steady_clock::now() + total;
    while (!CancelRequested()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline)
            return true;
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(deadline - now, 200ms));
    }
    return false;
}

} // namespace fwsync
