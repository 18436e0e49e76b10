#include "fcaudit/run_control.hpp"

#include <csignal>

namespace fcaudit {

namespace {

CancelToken g_cancel_token;

static_assert(std::atomic<bool>::is_always_lock_free,
              "cancel flag must be lock-free to be set from a signal handler");

void on_interrupt(int /*sig*/) {
    g_cancel_token.request();
}

} // namespace

CancelToken& process_cancel_token() {
    return g_cancel_token;
}

void install_interrupt_handlers() {
    std::signal(SIGINT, on_interrupt);
    std::signal(SIGTERM, on_interrupt);
}

} // namespace fcaudit
