#pragma once

#include "sync/sync_request.hpp"
#include "util/result.hpp"

#include <functional>
#include <string_view>

namespace billsync {

// Receives raw body bytes in arrival order. Returning false stops the stream.
using ChunkHandler = std::function<bool(std::string_view chunk)>;

class IStreamTransport {
public:
    virtual ~IStreamTransport() = default;

    // Blocks until end of stream, Abort(), a false return from on_chunk, or
    // failure. Ok covers the first three; the caller tells them apart.
    virtual Result Stream(const SyncRequest& request, const ChunkHandler& on_chunk) = 0;

    // Thread-safe; makes a running Stream() return promptly.
    virtual void Abort() = 0;
};

// Out-of-band "please stop" for the server side of a run.
class ICancelNotifier {
public:
    virtual ~ICancelNotifier() = default;

    // Must not wait for the network. Failures are the notifier's to log.
    virtual void NotifyCancel(const SyncRequest& request) = 0;
};

} // namespace billsync
