#pragma once

#include "sync/cancellation_controller.hpp"
#include "sync/discovered_bills.hpp"
#include "sync/event_router.hpp"
#include "sync/frame_decoder.hpp"
#include "sync/progress.hpp"
#include "sync/progress_aggregator.hpp"
#include "sync/sync_request.hpp"
#include "sync/sync_transport.hpp"
#include "util/result.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace billsync {

// One supplier synchronization run.
//
//   Idle --Start()--> Running --complete------------> Completed
//                             --error / I/O / EOF---> Failed
//                             --Cancel() / cancelled-> Cancelled
//
// The first transition out of Running wins; later events are ignored.
// A session is single-use.
class SyncSession {
public:
    struct Options {
        std::size_t max_line_bytes = FrameDecoder::kDefaultMaxLineBytes;
        ContractFilter contract_filter;
    };

    SyncSession(IStreamTransport& transport, ICancelNotifier& notifier);
    SyncSession(IStreamTransport& transport, ICancelNotifier& notifier, Options opt);

    SyncSession(const SyncSession&) = delete;
    SyncSession& operator=(const SyncSession&) = delete;

    // Observers must outlive the session. Subscribe before Start().
    void Subscribe(ISyncObserver* observer);

    // Idle -> Running. Generates the correlation id when the request has none.
    Result Start(SyncRequest request);

    // Runs the read loop until a terminal state and returns the final result.
    SyncResult Consume();

    // Safe from any thread. Returns false when nothing was running.
    bool Cancel();

    SessionState State() const;
    std::string CorrelationId() const;
    ProgressSnapshot Snapshot() const;
    std::optional<SyncResult> FinalResult() const;

private:
    bool HandleChunk(std::string_view chunk);
    void ApplyFrameLocked(const Frame& frame);
    void ApplyEventLocked(SyncEvent& ev);
    bool FinishLocked(SessionState state, std::string error);
    void EmitProgressLocked();
    void AdviseLocked(const std::string& message);
    ProgressSnapshot SnapshotLocked() const;
    bool CancelRequested() const;

    IStreamTransport& transport_;
    ICancelNotifier& notifier_;
    Options options_;

    mutable std::recursive_mutex mu_;
    SessionState state_ = SessionState::Idle;
    SyncRequest request_;
    std::unique_ptr<FrameDecoder> decoder_;
    EventRouter router_;
    ProgressAggregator aggregator_;
    DiscoveredBillCollector bills_;
    std::unique_ptr<CancellationController> cancel_;
    std::vector<ISyncObserver*> observers_;
    std::vector<Frame> frames_;

    std::chrono::system_clock::time_point started_at_{};
    std::optional<std::chrono::system_clock::time_point> ended_at_;
    std::optional<SyncResult> final_;
};

} // namespace billsync
