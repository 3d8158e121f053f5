#pragma once

#include "sync/sync_transport.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace httplib {
class Client;
}

namespace billsync {

struct HttpEndpoint {
    std::string base_url;   // scheme://host[:port], no trailing slash
    std::string token;      // bearer token, may be empty
    std::chrono::seconds connect_timeout{10};
    // Upper bound on silence between chunks of the event stream.
    std::chrono::seconds read_timeout{300};
};

// Path plus query string of the start call for `request`.
std::string BuildStartTarget(const SyncRequest& request);
// Path plus query string of the cancel call for `request`.
std::string BuildCancelTarget(const SyncRequest& request);
// JSON body of an all-properties start call; empty for single-property runs.
std::string BuildStartBody(const SyncRequest& request);

// Single-use: once Abort() has been called every later Stream() fails.
class HttpStreamTransport final : public IStreamTransport {
public:
    explicit HttpStreamTransport(HttpEndpoint endpoint);
    ~HttpStreamTransport() override;

    Result Stream(const SyncRequest& request, const ChunkHandler& on_chunk) override;
    void Abort() override;

private:
    HttpEndpoint endpoint_;
    std::mutex mu_;
    httplib::Client* active_ = nullptr;
    std::atomic_bool aborted_{false};
};

// Sends the cancel call from a worker thread bounded by `timeout`.
// The destructor waits for outstanding workers.
class HttpCancelNotifier final : public ICancelNotifier {
public:
    HttpCancelNotifier(HttpEndpoint endpoint, std::chrono::milliseconds timeout);
    ~HttpCancelNotifier() override;

    HttpCancelNotifier(const HttpCancelNotifier&) = delete;
    HttpCancelNotifier& operator=(const HttpCancelNotifier&) = delete;

    void NotifyCancel(const SyncRequest& request) override;

private:
    HttpEndpoint endpoint_;
    std::chrono::milliseconds timeout_;
    std::mutex mu_;
    std::vector<std::thread> workers_;
};

} // namespace billsync
