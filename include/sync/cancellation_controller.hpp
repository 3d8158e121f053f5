#pragma once

#include "sync/sync_request.hpp"
#include "sync/sync_transport.hpp"

#include <atomic>
#include <functional>

namespace billsync {

class CancellationController {
public:
    CancellationController(IStreamTransport& transport,
                           ICancelNotifier& notifier,
                           SyncRequest request,
                           std::function<void()> on_aborted);

    CancellationController(const CancellationController&) = delete;
    CancellationController& operator=(const CancellationController&) = delete;

    // Idempotent and callable from any thread. Aborts the local read, fires the
    // server-side cancel without waiting for it, then reports the abort.
    // Returns true only for the call that actually cancelled.
    bool Cancel();

    bool Requested() const { return requested_.load(std::memory_order_acquire); }

private:
    IStreamTransport& transport_;
    ICancelNotifier& notifier_;
    SyncRequest request_;
    std::function<void()> on_aborted_;
    std::atomic_bool requested_{false};
};

} // namespace billsync
