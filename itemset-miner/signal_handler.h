#ifndef SIGNAL_HANDLER_H
#define SIGNAL_HANDLER_H

#include <atomic>
#include <csignal>

// Set by SIGINT, polled by the miners between top-level branches.
// The handler only stores the flag; the pollers do the reporting.
extern std::atomic<bool> g_stop_requested;

void signal_handler(int signum);
void install_signal_handler();

#endif // SIGNAL_HANDLER_H
