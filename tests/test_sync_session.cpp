#include "sync/sync_session.hpp"
#include "testing.hpp"
#include "util/uuid.hpp"

#include <gtest/gtest.h>
#include <optional>
#include <string>
#include <thread>

namespace billsync {

namespace {

using testutil::SseFrame;

SyncRequest PropertyRequest() {
    SyncRequest r;
    r.property_id = "prop-42";
    return r;
}

std::string Progress(const std::string& name, const std::string& status, int created,
                     const std::string& extra = {}) {
    return SseFrame("progress", "{\"supplier_name\":\"" + name + "\",\"status\":\"" + status +
                                    "\",\"bills_found\":" + std::to_string(created) +
                                    ",\"bills_created\":" + std::to_string(created) + extra + "}");
}

class SyncSessionTests : public ::testing::Test {
  protected:
    testutil::ScriptedTransport transport;
    testutil::RecordingNotifier notifier;
    testutil::RecordingObserver observer;
};

} // namespace

TEST_F(SyncSessionTests, HappyPathCompletes) {
    transport.chunks = {
        SseFrame("start", "{}"),
        Progress("Enel", "processing", 1),
        Progress("Enel", "completed", 2) + Progress("A2A", "completed", 3),
        SseFrame("complete", "{\"bills_created\":5}"),
    };

    SyncSession session(transport, notifier);
    session.Subscribe(&observer);
    ASSERT_TRUE(session.Start(PropertyRequest()).ok);
    EXPECT_EQ(session.State(), SessionState::Running);
    EXPECT_TRUE(LooksLikeUuid(session.CorrelationId()));

    const SyncResult r = session.Consume();

    EXPECT_EQ(r.state, SessionState::Completed);
    EXPECT_TRUE(r.error.empty());
    EXPECT_EQ(r.correlation_id, session.CorrelationId());
    EXPECT_EQ(r.snapshot.total_bills_created, 5u);
    ASSERT_EQ(r.snapshot.entries.size(), 2u);
    EXPECT_EQ(r.snapshot.entries[0].supplier_name, "Enel");
    EXPECT_TRUE(r.ended_at.has_value());

    EXPECT_EQ(transport.LastRequest().property_id, "prop-42");
    EXPECT_EQ(notifier.Count(), 0u);
    ASSERT_EQ(observer.finished.size(), 1u);
    EXPECT_EQ(observer.finished[0].state, SessionState::Completed);
    // three progress frames plus the final snapshot
    EXPECT_EQ(observer.snapshots.size(), 4u);
    EXPECT_EQ(session.FinalResult()->state, SessionState::Completed);
}

TEST_F(SyncSessionTests, AuthoritativeTotalOverridesRunningSum) {
    transport.chunks = {Progress("Enel", "completed", 2), SseFrame("complete", "{\"bills_created\":9}")};

    SyncSession session(transport, notifier);
    ASSERT_TRUE(session.Start(PropertyRequest()).ok);
    EXPECT_EQ(session.Consume().snapshot.total_bills_created, 9u);
}

TEST_F(SyncSessionTests, FramesSplitAcrossChunksAreReassembled) {
    const std::string body = SseFrame("start", "{}") + Progress("Enel", "completed", 4) +
                             SseFrame("complete", "{}");
    for (size_t i = 0; i < body.size(); i += 7) transport.chunks.push_back(body.substr(i, 7));

    SyncSession session(transport, notifier);
    ASSERT_TRUE(session.Start(PropertyRequest()).ok);
    const auto r = session.Consume();
    EXPECT_EQ(r.state, SessionState::Completed);
    EXPECT_EQ(r.snapshot.total_bills_created, 4u);
}

TEST_F(SyncSessionTests, ErrorEventFails) {
    transport.chunks = {Progress("Enel", "processing", 0), SseFrame("error", "{\"error\":\"portal down\"}")};

    SyncSession session(transport, notifier);
    session.Subscribe(&observer);
    ASSERT_TRUE(session.Start(PropertyRequest()).ok);
    const auto r = session.Consume();

    EXPECT_EQ(r.state, SessionState::Failed);
    EXPECT_EQ(r.error, "portal down");
    ASSERT_EQ(observer.finished.size(), 1u);
}

TEST_F(SyncSessionTests, ServerCancelledEventMarksOpenSuppliers) {
    transport.chunks = {Progress("Enel", "completed", 1), Progress("A2A", "processing", 0),
                        SseFrame("cancelled", "")};

    SyncSession session(transport, notifier);
    ASSERT_TRUE(session.Start(PropertyRequest()).ok);
    const auto r = session.Consume();

    EXPECT_EQ(r.state, SessionState::Cancelled);
    EXPECT_EQ(r.snapshot.Find("Enel")->status, SupplierStatus::Completed);
    EXPECT_EQ(r.snapshot.Find("A2A")->status, SupplierStatus::Error);
    EXPECT_EQ(r.snapshot.Find("A2A")->error, "Cancelled");
    EXPECT_EQ(notifier.Count(), 0u);
}

TEST_F(SyncSessionTests, StreamEndingWithoutTerminalEventFails) {
    transport.chunks = {Progress("Enel", "processing", 0), "event: complete\ndata: {}\n"};

    SyncSession session(transport, notifier);
    ASSERT_TRUE(session.Start(PropertyRequest()).ok);
    const auto r = session.Consume();

    EXPECT_EQ(r.state, SessionState::Failed);
    EXPECT_EQ(r.error, "stream ended unexpectedly");
}

TEST_F(SyncSessionTests, TransportFailureFails) {
    transport.chunks = {SseFrame("start", "{}")};
    transport.failure = Result::Fail(503, "HTTP error: status 503");

    SyncSession session(transport, notifier);
    ASSERT_TRUE(session.Start(PropertyRequest()).ok);
    const auto r = session.Consume();

    EXPECT_EQ(r.state, SessionState::Failed);
    EXPECT_EQ(r.error, "HTTP error: status 503");
}

TEST_F(SyncSessionTests, EventsAfterTerminalAreIgnored) {
    transport.chunks = {SseFrame("complete", "{}") + Progress("Enel", "completed", 3),
                        SseFrame("error", "{\"error\":\"late\"}")};

    SyncSession session(transport, notifier);
    session.Subscribe(&observer);
    ASSERT_TRUE(session.Start(PropertyRequest()).ok);
    const auto r = session.Consume();

    EXPECT_EQ(r.state, SessionState::Completed);
    EXPECT_TRUE(r.snapshot.entries.empty());
    EXPECT_EQ(observer.finished.size(), 1u);
    // reading stops once the session is terminal
    EXPECT_EQ(transport.ChunksDelivered(), 1u);
    EXPECT_FALSE(session.Cancel());
}

TEST_F(SyncSessionTests, UndecodableAndUnknownFramesAreAdvisories) {
    transport.chunks = {SseFrame("heartbeat", "{}"), SseFrame("progress", "{\"status\":\"processing\"}"),
                        Progress("Enel", "completed", 1), SseFrame("complete", "{}")};

    SyncSession session(transport, notifier);
    session.Subscribe(&observer);
    ASSERT_TRUE(session.Start(PropertyRequest()).ok);
    const auto r = session.Consume();

    EXPECT_EQ(r.state, SessionState::Completed);
    ASSERT_EQ(observer.advisories.size(), 2u);
    EXPECT_EQ(observer.advisories[0], "unknown event 'heartbeat'");
    EXPECT_EQ(observer.advisories[1],
              "undecodable 'progress' event: progress event missing supplier_name");
}

TEST_F(SyncSessionTests, OverlongLineFailsTheSession) {
    transport.chunks = {"data: " + std::string(64, 'x')};

    SyncSession::Options opt;
    opt.max_line_bytes = 32;
    SyncSession session(transport, notifier, opt);
    ASSERT_TRUE(session.Start(PropertyRequest()).ok);
    const auto r = session.Consume();

    EXPECT_EQ(r.state, SessionState::Failed);
    EXPECT_NE(r.error.find("exceeds 32 bytes"), std::string::npos);
}

TEST_F(SyncSessionTests, CancelFromObserverStopsBeforeComplete) {
    class CancelOnFirstProgress final : public ISyncObserver {
      public:
        SyncSession* session = nullptr;
        void OnProgress(const ProgressSnapshot& snap) override {
            if (!snap.entries.empty()) session->Cancel();
        }
        void OnFinished(const SyncResult&) override {}
    } canceller;

    transport.chunks = {Progress("Enel", "processing", 1) + Progress("A2A", "completed", 2),
                        SseFrame("complete", "{}")};

    SyncSession session(transport, notifier);
    canceller.session = &session;
    session.Subscribe(&canceller);
    ASSERT_TRUE(session.Start(PropertyRequest()).ok);
    const auto r = session.Consume();

    EXPECT_EQ(r.state, SessionState::Cancelled);
    // the second frame of the chunk is never applied
    EXPECT_EQ(r.snapshot.entries.size(), 1u);
    EXPECT_EQ(r.snapshot.Find("Enel")->error, "Cancelled");
    EXPECT_EQ(transport.AbortCalls(), 1);
    ASSERT_EQ(notifier.Count(), 1u);
    EXPECT_EQ(notifier.Requests()[0].correlation_id, r.correlation_id);
}

TEST_F(SyncSessionTests, CancelFromAnotherThreadUnblocksRead) {
    transport.chunks = {SseFrame("start", "{}"), Progress("Enel", "processing", 0)};
    transport.block_after_chunks = true;

    SyncSession session(transport, notifier);
    session.Subscribe(&observer);
    ASSERT_TRUE(session.Start(PropertyRequest()).ok);

    SyncResult r;
    std::thread reader([&] { r = session.Consume(); });

    ASSERT_TRUE(transport.WaitUntilBlocked());
    EXPECT_TRUE(session.Cancel());
    EXPECT_FALSE(session.Cancel());
    reader.join();

    EXPECT_EQ(r.state, SessionState::Cancelled);
    EXPECT_EQ(session.State(), SessionState::Cancelled);
    EXPECT_EQ(notifier.Count(), 1u);
    EXPECT_EQ(observer.finished.size(), 1u);
}

TEST_F(SyncSessionTests, SupplierErrorDoesNotDisturbOthers) {
    class WatchAfterError final : public ISyncObserver {
      public:
        SyncSession* session = nullptr;
        std::optional<ProgressSnapshot> after_error;
        std::optional<SessionState> state_after_error;

        void OnProgress(const ProgressSnapshot& snap) override {
            const auto* a = snap.Find("A2A");
            if (!after_error && a && a->status == SupplierStatus::Error) {
                after_error = snap;
                state_after_error = session->State();
            }
        }
        void OnFinished(const SyncResult&) override {}
    } watcher;

    transport.chunks = {Progress("Enel", "processing", 1),
                        Progress("A2A", "error", 0, ",\"error\":\"x\""),
                        Progress("Enel", "completed", 2),
                        SseFrame("complete", "{}")};

    SyncSession session(transport, notifier);
    watcher.session = &session;
    session.Subscribe(&watcher);
    ASSERT_TRUE(session.Start(PropertyRequest()).ok);
    const auto r = session.Consume();

    ASSERT_TRUE(watcher.after_error.has_value());
    EXPECT_EQ(watcher.state_after_error, SessionState::Running);
    ASSERT_NE(watcher.after_error->Find("Enel"), nullptr);
    EXPECT_EQ(watcher.after_error->Find("Enel")->status, SupplierStatus::Processing);
    EXPECT_EQ(watcher.after_error->Find("Enel")->bills_created, 1u);

    EXPECT_EQ(r.state, SessionState::Completed);
    EXPECT_TRUE(r.error.empty());
    EXPECT_EQ(r.snapshot.Find("A2A")->status, SupplierStatus::Error);
    EXPECT_EQ(r.snapshot.Find("A2A")->error, "x");
    EXPECT_EQ(r.snapshot.Find("Enel")->status, SupplierStatus::Completed);
    EXPECT_EQ(r.snapshot.total_bills_created, 2u);
}

TEST(SyncSessionRaceTests, CancelRacingCompleteHasOneWinner) {
    for (int i = 0; i < 300; ++i) {
        testutil::ScriptedTransport transport;
        testutil::RecordingNotifier notifier;
        transport.chunks = {Progress("Enel", "completed", 1), SseFrame("complete", "{}")};

        SyncSession session(transport, notifier);
        ASSERT_TRUE(session.Start(PropertyRequest()).ok);

        SyncResult r;
        std::thread reader([&] { r = session.Consume(); });
        const bool cancelled = session.Cancel();
        reader.join();

        if (r.state == SessionState::Completed) {
            EXPECT_FALSE(cancelled) << "iteration " << i;
            EXPECT_EQ(notifier.Count(), 0u) << "iteration " << i;
            EXPECT_FALSE(transport.Aborted()) << "iteration " << i;
        } else {
            EXPECT_EQ(r.state, SessionState::Cancelled) << "iteration " << i;
            EXPECT_TRUE(cancelled) << "iteration " << i;
            EXPECT_EQ(notifier.Count(), 1u) << "iteration " << i;
        }
    }
}

TEST_F(SyncSessionTests, PartialFrameAtEndIsReported) {
    transport.chunks = {SseFrame("start", "{}"), "event: complete\ndata: {}\n"};

    SyncSession session(transport, notifier);
    session.Subscribe(&observer);
    ASSERT_TRUE(session.Start(PropertyRequest()).ok);
    const auto r = session.Consume();

    EXPECT_EQ(r.state, SessionState::Failed);
    EXPECT_EQ(r.error, "stream ended unexpectedly");
    ASSERT_EQ(observer.advisories.size(), 1u);
    EXPECT_EQ(observer.advisories[0], "partial frame dropped at end of stream");
}

TEST_F(SyncSessionTests, CleanEndOfStreamHasNoAdvisory) {
    transport.chunks = {SseFrame("start", "{}")};

    SyncSession session(transport, notifier);
    session.Subscribe(&observer);
    ASSERT_TRUE(session.Start(PropertyRequest()).ok);

    EXPECT_EQ(session.Consume().state, SessionState::Failed);
    EXPECT_TRUE(observer.advisories.empty());
}

TEST_F(SyncSessionTests, CancelWhenIdleDoesNothing) {
    SyncSession session(transport, notifier);
    EXPECT_FALSE(session.Cancel());
    EXPECT_EQ(notifier.Count(), 0u);
    EXPECT_EQ(transport.AbortCalls(), 0);
}

TEST_F(SyncSessionTests, ConsumeBeforeStartReportsIdle) {
    SyncSession session(transport, notifier);
    const auto r = session.Consume();
    EXPECT_EQ(r.state, SessionState::Idle);
    EXPECT_EQ(r.error, "sync session not started");
    EXPECT_EQ(transport.StreamCalls(), 0);
}

TEST_F(SyncSessionTests, StartValidatesRequest) {
    SyncSession session(transport, notifier);
    EXPECT_EQ(session.Start(SyncRequest{}).msg, "sync needs a property id");

    SyncRequest all;
    all.all_properties = true;
    EXPECT_EQ(session.Start(all).msg, "sync of all properties needs at least one supplier group");
    EXPECT_EQ(session.State(), SessionState::Idle);
}

TEST_F(SyncSessionTests, SessionIsSingleUse) {
    transport.chunks = {SseFrame("complete", "{}")};

    SyncSession session(transport, notifier);
    ASSERT_TRUE(session.Start(PropertyRequest()).ok);
    auto again = session.Start(PropertyRequest());
    EXPECT_FALSE(again.ok);
    EXPECT_EQ(again.msg, "sync session already running");

    session.Consume();
    EXPECT_EQ(session.Start(PropertyRequest()).msg, "sync session already completed");
    // a second Consume hands back the stored result without reading again
    EXPECT_EQ(session.Consume().state, SessionState::Completed);
    EXPECT_EQ(transport.StreamCalls(), 1);
}

TEST_F(SyncSessionTests, CallerSuppliedIdIsKept) {
    transport.chunks = {SseFrame("complete", "{}")};
    auto req = PropertyRequest();
    req.correlation_id = "run-7";

    SyncSession session(transport, notifier);
    ASSERT_TRUE(session.Start(req).ok);
    EXPECT_EQ(session.CorrelationId(), "run-7");
    EXPECT_EQ(session.Consume().correlation_id, "run-7");
}

TEST_F(SyncSessionTests, DiscoveredBillsAreDedupedAndFiltered) {
    const std::string bills =
        ",\"bills\":[{\"bill_number\":\"F-1\",\"amount\":10,\"due_date\":\"2026-11-01\",\"contract_id\":\"C-1\"},"
        "{\"bill_number\":\"F-2\",\"amount\":20,\"due_date\":\"2026-11-01\",\"contract_id\":\"C-2\"}]";
    transport.chunks = {Progress("Enel", "processing", 0, bills), Progress("Enel", "completed", 0, bills),
                        SseFrame("complete", "{}")};

    SyncSession::Options opt;
    opt.contract_filter = {{"Enel", "C-1"}};
    SyncSession session(transport, notifier, opt);
    auto req = PropertyRequest();
    req.discover_only = true;
    ASSERT_TRUE(session.Start(req).ok);

    const auto r = session.Consume();
    EXPECT_EQ(r.state, SessionState::Completed);
    EXPECT_EQ(r.snapshot.bills_discovered, 4u);
    ASSERT_EQ(r.discovered_bills.size(), 1u);
    EXPECT_EQ(r.discovered_bills[0].bill_number, "F-1");
    EXPECT_TRUE(transport.LastRequest().discover_only);
}

TEST_F(SyncSessionTests, DiscoveredBillsDroppedWhenRunDoesNotComplete) {
    transport.chunks = {Progress("Enel", "completed", 0,
                                 ",\"bills\":[{\"bill_number\":\"F-1\",\"amount\":1,\"due_date\":\"x\"}]"),
                        SseFrame("error", "{}")};

    SyncSession session(transport, notifier);
    ASSERT_TRUE(session.Start(PropertyRequest()).ok);
    const auto r = session.Consume();
    EXPECT_EQ(r.state, SessionState::Failed);
    EXPECT_EQ(r.error, "Sync failed");
    EXPECT_TRUE(r.discovered_bills.empty());
}

} // namespace billsync
