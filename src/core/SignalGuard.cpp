#include "SignalGuard.hpp"
#include <csignal>
#include <cstring>

namespace mcp_stdio {

namespace {
    volatile std::sig_atomic_t interrupt_signal = 0;

    void signal_handler(int signal) {
        interrupt_signal = signal;
    }
}

void SignalGuard::install() {
    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = signal_handler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;  // no SA_RESTART: blocking waits must see EINTR

    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

bool SignalGuard::requested() {
    return interrupt_signal != 0;
}

int SignalGuard::last_signal() {
    return static_cast<int>(interrupt_signal);
}

void SignalGuard::reset() {
    interrupt_signal = 0;
}

} // namespace mcp_stdio
