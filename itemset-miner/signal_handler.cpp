#include "signal_handler.h"

std::atomic<bool> g_stop_requested{false};

void signal_handler(int signum) {
    if (signum == SIGINT) {
        g_stop_requested = true;
    }
}

void install_signal_handler() {
    g_stop_requested = false;
    std::signal(SIGINT, signal_handler);
}
