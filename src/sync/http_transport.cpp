#include "sync/http_transport.hpp"

#include "util/logger.hpp"

#include <httplib.h>

#include <string>

namespace billsync {

namespace {

httplib::Headers BaseHeaders(const HttpEndpoint& ep) {
    httplib::Headers headers;
    headers.emplace("User-Agent", "billsync/1.0");
    if (!ep.token.empty()) {
        headers.emplace("Authorization", "Bearer " + ep.token);
    }
    return headers;
}

void Configure(httplib::Client& cli, const HttpEndpoint& ep) {
    cli.set_connection_timeout(static_cast<time_t>(ep.connect_timeout.count()), 0);
    cli.set_read_timeout(static_cast<time_t>(ep.read_timeout.count()), 0);
    cli.set_write_timeout(static_cast<time_t>(ep.connect_timeout.count()), 0);
}

} // namespace

HttpStreamTransport::HttpStreamTransport(HttpEndpoint endpoint) : endpoint_(std::move(endpoint)) {}

HttpStreamTransport::~HttpStreamTransport() = default;

Result HttpStreamTransport::Stream(const SyncRequest& request, const ChunkHandler& on_chunk) {
    if (endpoint_.base_url.empty()) return Result::Fail("no server base URL configured");

    httplib::Client cli(endpoint_.base_url);
    if (!cli.is_valid()) {
        return Result::Fail("invalid server base URL: " + endpoint_.base_url);
    }
    Configure(cli, endpoint_);
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (aborted_.load()) return Result::Fail("stream transport was aborted");
        active_ = &cli;
    }

    httplib::Request req;
    req.method = "POST";
    req.path = BuildStartTarget(request);
    req.headers = BaseHeaders(endpoint_);
    req.headers.emplace("Accept", "text/event-stream");
    req.body = BuildStartBody(request);
    if (!req.body.empty()) {
        req.headers.emplace("Content-Type", "application/json");
    }

    int status = 0;
    bool consumer_stopped = false;
    req.response_handler = [&](const httplib::Response& res) {
        status = res.status;
        return status >= 200 && status < 300;
    };
    req.content_receiver = [&](const char* data, size_t len, uint64_t, uint64_t) {
        if (aborted_.load()) return false;
        if (!on_chunk(std::string_view(data, len))) {
            consumer_stopped = true;
            return false;
        }
        return true;
    };

    LogInfo("POST %s%s", endpoint_.base_url.c_str(), req.path.c_str());
    auto res = cli.send(req);

    {
        std::lock_guard<std::mutex> lk(mu_);
        active_ = nullptr;
    }

    if (aborted_.load() || consumer_stopped) return Result::Ok();
    if (status != 0 && (status < 200 || status >= 300)) {
        return Result::Fail(status, "HTTP error: status " + std::to_string(status));
    }
    if (!res) {
        return Result::Fail("Connection error: " + httplib::to_string(res.error()));
    }
    return Result::Ok();
}

void HttpStreamTransport::Abort() {
    std::lock_guard<std::mutex> lk(mu_);
    aborted_.store(true);
    if (active_) {
        // Shuts the socket down so a blocked read returns.
        active_->stop();
    }
}

HttpCancelNotifier::HttpCancelNotifier(HttpEndpoint endpoint, std::chrono::milliseconds timeout)
    : endpoint_(std::move(endpoint)), timeout_(timeout) {}

HttpCancelNotifier::~HttpCancelNotifier() {
    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lk(mu_);
        workers.swap(workers_);
    }
    for (auto& t : workers) {
        if (t.joinable()) t.join();
    }
}

void HttpCancelNotifier::NotifyCancel(const SyncRequest& request) {
    const std::string target = BuildCancelTarget(request);
    const std::string sync_id = request.correlation_id;
    const HttpEndpoint ep = endpoint_;
    const auto timeout = timeout_;

    std::lock_guard<std::mutex> lk(mu_);
    workers_.emplace_back([ep, timeout, target, sync_id] {
        httplib::Client cli(ep.base_url);
        const auto sec = std::chrono::duration_cast<std::chrono::seconds>(timeout);
        const auto usec = std::chrono::duration_cast<std::chrono::microseconds>(timeout - sec);
        cli.set_connection_timeout(static_cast<time_t>(sec.count()), static_cast<time_t>(usec.count()));
        cli.set_read_timeout(static_cast<time_t>(sec.count()), static_cast<time_t>(usec.count()));
        cli.set_write_timeout(static_cast<time_t>(sec.count()), static_cast<time_t>(usec.count()));

        auto res = cli.Post(target, BaseHeaders(ep), std::string(), "application/json");
        if (!res) {
            LogWarn("Cancel request for sync %s failed: %s",
                    sync_id.c_str(), httplib::to_string(res.error()).c_str());
            return;
        }
        if (res->status < 200 || res->status >= 300) {
            LogWarn("Cancel request for sync %s returned status %d", sync_id.c_str(), res->status);
            return;
        }
        LogInfo("Server acknowledged cancel of sync %s", sync_id.c_str());
    });
}

} // namespace billsync
