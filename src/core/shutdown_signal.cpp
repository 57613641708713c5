#include "core/shutdown_signal.hpp"

#include <atomic>
#include <csignal>

namespace alertwatch {

namespace {

std::atomic<int> g_received{0};

static_assert(std::atomic<int>::is_always_lock_free,
              "signal handler requires a lock-free atomic");

void handle_shutdown_signal(int signal) {
    g_received.store(signal, std::memory_order_release);
}

} // anonymous namespace

void ShutdownSignal::install() {
    std::signal(SIGINT, handle_shutdown_signal);
    std::signal(SIGTERM, handle_shutdown_signal);
}

int ShutdownSignal::received() {
    return g_received.load(std::memory_order_acquire);
}

void ShutdownSignal::reset() {
    g_received.store(0, std::memory_order_release);
}

} // namespace alertwatch
