#include "sync/replay_transport.hpp"

#include "io/file_reader.hpp"
#include "io/gzip_reader.hpp"
#include "util/logger.hpp"

#include <exception>
#include <thread>
#include <vector>

namespace billsync {

Result ReplayStreamTransport::Open(const std::string& path, const Options& opt,
                                   std::unique_ptr<ReplayStreamTransport>& out) {
    auto file = std::make_unique<FileOrStdinReader>();
    if (auto r = FileOrStdinReader::Open(path, *file); !r.is_ok()) {
        return r;
    }

    std::unique_ptr<IReader> source = std::move(file);
    if (IsGzipPath(path)) {
        try {
            LogDebug("Wrapping GzipReader for %s", path.c_str());
            source = std::make_unique<GzipReader>(std::move(source));
        } catch (const std::exception& e) {
            return Result::Fail(std::string("Gzip init failed: ") + e.what());
        }
    }

    out = std::make_unique<ReplayStreamTransport>(std::move(source), opt);
    return Result::Ok();
}

ReplayStreamTransport::ReplayStreamTransport(std::unique_ptr<IReader> source, Options opt)
    : source_(std::move(source)), opt_(opt) {
    if (opt_.chunk_bytes == 0) opt_.chunk_bytes = 4096;
}

Result ReplayStreamTransport::Stream(const SyncRequest& request, const ChunkHandler& on_chunk) {
    if (!source_) return Result::Fail("Null replay source");
    LogInfo("Replaying recorded stream for sync %s", request.correlation_id.c_str());

    std::vector<std::uint8_t> buf(opt_.chunk_bytes);
    const int poll_ms = static_cast<int>(opt_.poll_interval.count());

    while (!aborted_.load()) {
        const int ready = source_->PollReadable(poll_ms);
        if (ready < 0) return Result::Fail("replay source poll failed");
        if (ready == 0) continue;

        const ssize_t n = source_->Read(buf);
        if (n < 0) {
            if (auto* gz = dynamic_cast<GzipReader*>(source_.get()); gz && !gz->LastError().empty()) {
                return Result::Fail("replay read failed: " + gz->LastError());
            }
            return Result::Fail("replay read failed");
        }
        if (n == 0) {
            LogDebug("Replay finished after %llu bytes", (unsigned long long)delivered_.load());
            return Result::Ok();
        }

        delivered_ += static_cast<std::uint64_t>(n);
        if (!on_chunk(std::string_view(reinterpret_cast<const char*>(buf.data()),
                                       static_cast<size_t>(n)))) {
            return Result::Ok();
        }
        if (opt_.pace.count() > 0) {
            std::this_thread::sleep_for(opt_.pace);
        }
    }
    return Result::Ok();
}

void ReplayStreamTransport::Abort() {
    aborted_.store(true);
}

void LoggingCancelNotifier::NotifyCancel(const SyncRequest& request) {
    LogInfo("Replay: would send cancel for sync %s to %s/cancel",
            request.correlation_id.c_str(), request.BasePath().c_str());
}

} // namespace billsync
