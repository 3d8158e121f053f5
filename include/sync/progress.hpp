#pragma once

#include "sync/progress_aggregator.hpp"
#include "sync/sync_events.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace billsync {

enum class SessionState {
    Idle,
    Running,
    Completed,
    Cancelled,
    Failed,
};

const char* ToString(SessionState s);
inline bool IsTerminal(SessionState s) {
    return s == SessionState::Completed || s == SessionState::Cancelled ||
           s == SessionState::Failed;
}

struct SyncResult {
    SessionState state = SessionState::Idle;
    std::string correlation_id;
    std::string error; // set only for Failed
    ProgressSnapshot snapshot;
    std::vector<DiscoveredBill> discovered_bills;
    std::chrono::system_clock::time_point started_at{};
    std::optional<std::chrono::system_clock::time_point> ended_at;
};

// Callbacks arrive on the session's read loop (or on the thread that called
// Cancel()) with the session lock held: keep them short and do not call
// Start() or Consume() from inside them.
class ISyncObserver {
public:
    virtual ~ISyncObserver() = default;
    virtual void OnProgress(const ProgressSnapshot& snapshot) = 0;
    virtual void OnFinished(const SyncResult& result) = 0;
    // Non-fatal trouble such as an undecodable frame.
    virtual void OnAdvisory(const std::string& message) { (void)message; }
};

} // namespace billsync
