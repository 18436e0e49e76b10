#pragma once
// Cooperative cancellation for long runs.
//
// The engine polls a CancelToken per record and per null trial and throws
// RunCancelled once it is set. The CLI wires SIGINT/SIGTERM to the
// process-wide token.

#include <atomic>

#include "fcaudit/errors.hpp"

namespace fcaudit {

class CancelToken {
public:
    void request() { flag_.store(true, std::memory_order_relaxed); }
    bool requested() const { return flag_.load(std::memory_order_relaxed); }
    void reset() { flag_.store(false, std::memory_order_relaxed); }

    void throw_if_requested() const {
        if (requested()) throw RunCancelled();
    }

private:
    std::atomic<bool> flag_{false};
};

// Token set by the interrupt handler
CancelToken& process_cancel_token();

// Route SIGINT and SIGTERM to process_cancel_token()
void install_interrupt_handlers();

} // namespace fcaudit
