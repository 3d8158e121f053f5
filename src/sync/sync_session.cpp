#include "sync/sync_session.hpp"

#include "util/logger.hpp"
#include "util/uuid.hpp"

#include <type_traits>
#include <utility>
#include <variant>

namespace billsync {

namespace {
constexpr const char kUnexpectedEnd[] = "stream ended unexpectedly";
} // namespace

const char* ToString(SessionState s) {
    switch (s) {
        case SessionState::Idle:      return "idle";
        case SessionState::Running:   return "running";
        case SessionState::Completed: return "completed";
        case SessionState::Cancelled: return "cancelled";
        case SessionState::Failed:    return "failed";
    }
    return "unknown";
}

SyncSession::SyncSession(IStreamTransport& transport, ICancelNotifier& notifier)
    : SyncSession(transport, notifier, Options{}) {}

SyncSession::SyncSession(IStreamTransport& transport, ICancelNotifier& notifier, Options opt)
    : transport_(transport), notifier_(notifier), options_(std::move(opt)) {}

void SyncSession::Subscribe(ISyncObserver* observer) {
    if (!observer) return;
    std::lock_guard<std::recursive_mutex> lk(mu_);
    observers_.push_back(observer);
}

Result SyncSession::Start(SyncRequest request) {
    std::lock_guard<std::recursive_mutex> lk(mu_);
    if (state_ != SessionState::Idle) {
        return Result::Fail(std::string("sync session already ") + ToString(state_));
    }
    if (request.all_properties) {
        if (request.supplier_groups.empty()) {
            return Result::Fail("sync of all properties needs at least one supplier group");
        }
    } else if (request.property_id.empty()) {
        return Result::Fail("sync needs a property id");
    }

    if (request.correlation_id.empty()) {
        auto id = GenerateUuidV4();
        if (!id) return Result::Fail("cannot generate sync id: " + id.error());
        request.correlation_id = std::move(*id);
    }

    request_ = std::move(request);
    aggregator_.Reset();
    bills_.Reset();
    decoder_ = std::make_unique<FrameDecoder>(options_.max_line_bytes);
    cancel_ = std::make_unique<CancellationController>(
        transport_, notifier_, request_, [this] {
            std::lock_guard<std::recursive_mutex> guard(mu_);
            FinishLocked(SessionState::Cancelled, {});
        });

    state_ = SessionState::Running;
    started_at_ = std::chrono::system_clock::now();
    ended_at_.reset();
    final_.reset();

    LogInfo("Sync %s started: %s%s", request_.correlation_id.c_str(),
            request_.BasePath().c_str(), request_.discover_only ? " (discover only)" : "");
    return Result::Ok();
}

SyncResult SyncSession::Consume() {
    {
        std::lock_guard<std::recursive_mutex> lk(mu_);
        if (state_ == SessionState::Idle) {
            SyncResult r;
            r.state = SessionState::Idle;
            r.error = "sync session not started";
            return r;
        }
        if (state_ != SessionState::Running) {
            return *final_;
        }
    }

    const Result streamed = transport_.Stream(
        request_, [this](std::string_view chunk) { return HandleChunk(chunk); });

    std::lock_guard<std::recursive_mutex> lk(mu_);
    if (state_ == SessionState::Running) {
        if (CancelRequested()) {
            // Abort returned before the canceller reached the session.
            FinishLocked(SessionState::Cancelled, {});
        } else if (!streamed.is_ok()) {
            FinishLocked(SessionState::Failed, streamed.msg);
        } else {
            if (decoder_->Finish()) {
                AdviseLocked("partial frame dropped at end of stream");
            }
            FinishLocked(SessionState::Failed, kUnexpectedEnd);
        }
    }
    return *final_;
}

bool SyncSession::Cancel() {
    // Held across the whole cancel so a terminal frame cannot land between
    // the state check and the abort.
    std::lock_guard<std::recursive_mutex> lk(mu_);
    if (state_ != SessionState::Running || !cancel_) return false;
    return cancel_->Cancel();
}

SessionState SyncSession::State() const {
    std::lock_guard<std::recursive_mutex> lk(mu_);
    return state_;
}

std::string SyncSession::CorrelationId() const {
    std::lock_guard<std::recursive_mutex> lk(mu_);
    return request_.correlation_id;
}

ProgressSnapshot SyncSession::Snapshot() const {
    std::lock_guard<std::recursive_mutex> lk(mu_);
    return SnapshotLocked();
}

std::optional<SyncResult> SyncSession::FinalResult() const {
    std::lock_guard<std::recursive_mutex> lk(mu_);
    return final_;
}

bool SyncSession::CancelRequested() const {
    return cancel_ && cancel_->Requested();
}

bool SyncSession::HandleChunk(std::string_view chunk) {
    std::lock_guard<std::recursive_mutex> lk(mu_);
    if (state_ != SessionState::Running || CancelRequested()) return false;

    frames_.clear();
    const Result fed = decoder_->Feed(chunk, frames_);

    for (const auto& frame : frames_) {
        // Cancellation lands between frames, never inside one.
        if (state_ != SessionState::Running || CancelRequested()) break;
        ApplyFrameLocked(frame);
    }

    if (!fed.is_ok() && state_ == SessionState::Running && !CancelRequested()) {
        FinishLocked(SessionState::Failed, fed.msg);
    }
    return state_ == SessionState::Running && !CancelRequested();
}

void SyncSession::ApplyFrameLocked(const Frame& frame) {
    auto routed = router_.Route(frame);
    if (!routed) {
        const DecodeError& e = routed.error();
        LogWarn("Dropping '%s' frame: %s", e.event_type.c_str(), e.message.c_str());
        AdviseLocked("undecodable '" + e.event_type + "' event: " + e.message);
        return;
    }
    ApplyEventLocked(*routed);
}

void SyncSession::ApplyEventLocked(SyncEvent& ev) {
    std::visit(
        [this](auto& e) {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, StartEvent>) {
                LogInfo("Server accepted sync %s", request_.correlation_id.c_str());
            } else if constexpr (std::is_same_v<T, ProgressEvent>) {
                aggregator_.Apply(e);
                if (!e.bills.empty()) bills_.Add(e.bills);
                if (e.status == SupplierStatus::Error) {
                    LogWarn("Supplier %s failed: %s", e.supplier_name.c_str(),
                            e.error ? e.error->c_str() : "(no message)");
                } else {
                    LogDebug("Supplier %s %s found=%llu created=%llu",
                             e.supplier_name.c_str(), ToString(e.status),
                             (unsigned long long)e.bills_found,
                             (unsigned long long)e.bills_created);
                }
                EmitProgressLocked();
            } else if constexpr (std::is_same_v<T, CompleteEvent>) {
                if (e.bills_created) aggregator_.SetAuthoritativeTotal(*e.bills_created);
                FinishLocked(SessionState::Completed, {});
            } else if constexpr (std::is_same_v<T, ErrorEvent>) {
                FinishLocked(SessionState::Failed, e.error);
            } else if constexpr (std::is_same_v<T, CancelledEvent>) {
                FinishLocked(SessionState::Cancelled, {});
            } else {
                LogInfo("Ignoring unknown event '%s'", e.event_type.c_str());
                AdviseLocked("unknown event '" + e.event_type + "'");
            }
        },
        ev);
}

bool SyncSession::FinishLocked(SessionState state, std::string error) {
    if (state_ != SessionState::Running) return false;

    if (state == SessionState::Cancelled) {
        const std::size_t n = aggregator_.MarkUnfinishedCancelled();
        if (n > 0) LogInfo("Marked %zu unfinished supplier(s) as cancelled", n);
    }

    state_ = state;
    ended_at_ = std::chrono::system_clock::now();

    SyncResult r;
    r.state = state;
    r.correlation_id = request_.correlation_id;
    r.error = std::move(error);
    r.snapshot = SnapshotLocked();
    if (state == SessionState::Completed) {
        r.discovered_bills = bills_.Finalize(options_.contract_filter);
    }
    r.started_at = started_at_;
    r.ended_at = ended_at_;
    final_ = std::move(r);

    if (state == SessionState::Failed) {
        LogError("Sync %s failed: %s", request_.correlation_id.c_str(), final_->error.c_str());
    } else {
        LogInfo("Sync %s %s: %zu supplier(s), %llu bill(s) created",
                request_.correlation_id.c_str(), ToString(state),
                final_->snapshot.entries.size(),
                (unsigned long long)final_->snapshot.total_bills_created);
    }

    EmitProgressLocked();
    for (auto* obs : observers_) obs->OnFinished(*final_);
    return true;
}

void SyncSession::EmitProgressLocked() {
    if (observers_.empty()) return;
    const ProgressSnapshot snap = SnapshotLocked();
    for (auto* obs : observers_) obs->OnProgress(snap);
}

void SyncSession::AdviseLocked(const std::string& message) {
    for (auto* obs : observers_) obs->OnAdvisory(message);
}

ProgressSnapshot SyncSession::SnapshotLocked() const {
    ProgressSnapshot s = aggregator_.Snapshot();
    s.bills_discovered = bills_.Size();
    return s;
}

} // namespace billsync
