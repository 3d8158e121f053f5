#include "sync/cancellation_controller.hpp"

#include "util/logger.hpp"

#include <exception>

namespace billsync {

CancellationController::CancellationController(IStreamTransport& transport,
                                               ICancelNotifier& notifier,
                                               SyncRequest request,
                                               std::function<void()> on_aborted)
    : transport_(transport),
      notifier_(notifier),
      request_(std::move(request)),
      on_aborted_(std::move(on_aborted)) {}

bool CancellationController::Cancel() {
    bool expected = false;
    if (!requested_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        LogDebug("Cancel already requested for sync %s", request_.correlation_id.c_str());
        return false;
    }

    LogInfo("Cancelling sync %s", request_.correlation_id.c_str());
    transport_.Abort();

    try {
        notifier_.NotifyCancel(request_);
    } catch (const std::exception& e) {
        LogWarn("Server cancel request for sync %s not sent: %s",
                request_.correlation_id.c_str(), e.what());
    }

    if (on_aborted_) on_aborted_();
    return true;
}

} // namespace billsync
