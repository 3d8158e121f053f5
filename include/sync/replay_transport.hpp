#pragma once

#include "io/io.hpp"
#include "sync/sync_transport.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace billsync {

// Plays back a recorded event stream (file, "-" for stdin, *.gz inflated on
// the fly) as if it were the response body of the start call.
class ReplayStreamTransport final : public IStreamTransport {
public:
    struct Options {
        std::size_t chunk_bytes = 4096;
        // Pause between chunks, to watch a replay unfold.
        std::chrono::milliseconds pace{0};
        // How often a blocked source is re-checked for Abort().
        std::chrono::milliseconds poll_interval{100};
    };

    static Result Open(const std::string& path, const Options& opt,
                       std::unique_ptr<ReplayStreamTransport>& out);

    ReplayStreamTransport(std::unique_ptr<IReader> source, Options opt);

    Result Stream(const SyncRequest& request, const ChunkHandler& on_chunk) override;
    void Abort() override;

    std::uint64_t BytesDelivered() const { return delivered_.load(); }

private:
    std::unique_ptr<IReader> source_;
    Options opt_;
    std::atomic_bool aborted_{false};
    std::atomic<std::uint64_t> delivered_{0};
};

// Cancel notifier for replays: there is no server, so it only logs.
class LoggingCancelNotifier final : public ICancelNotifier {
public:
    void NotifyCancel(const SyncRequest& request) override;
};

} // namespace billsync
