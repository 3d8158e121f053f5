#include "sync/http_transport.hpp"
#include "sync/progress_sinks.hpp"
#include "sync/replay_transport.hpp"
#include "sync/sync_session.hpp"
#include "system/signals.hpp"
#include "util/client_config.hpp"
#include "util/logger.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <getopt.h>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace {

constexpr const char *kDefaultConfigPath = "/etc/billsync/billsync.conf";

constexpr int kExitCompleted = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;
constexpr int kExitCancelled = 3;

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s -p <property-id> [-s <id,id,...>] [-d] [options]\n"
        "   %s -A -g <supplier[:contract]=prop,prop> [-g ...] [-d] [options]\n"
        "\n"
        "Options:\n"
        "  -p, --property <id>       Sync the suppliers of one property\n"
        "  -s, --suppliers <ids>     Comma-separated property supplier ids (default: all)\n"
        "  -A, --all                 Sync supplier groups across properties\n"
        "  -g, --group <spec>        supplier_id[:contract_id]=property_id,... (repeatable)\n"
        "  -d, --discover-only       Report found bills without saving them\n"
        "  -C, --contract <s=c>      Keep only discovered bills of contract c for supplier s\n"
        "  -r, --replay <file|->     Replay a recorded event stream instead of calling the server\n"
        "  -i, --sync-id <id>        Use this sync id instead of a random one\n"
        "  -c, --config <path>       Config file (default %s)\n"
        "  -P, --progress-file <p>   Keep a JSON progress snapshot at <p>\n"
        "  -q, --quiet               No console progress\n"
        "  -j, --json                Print the final result as JSON on stdout\n"
        "  -v, --verbose             Debug logging\n"
        "  -h, --help                Show this help\n",
        argv, argv, kDefaultConfigPath);
}

std::vector<std::string> SplitList(const std::string &s, char sep) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= s.size()) {
        const size_t end = s.find(sep, start);
        std::string item = s.substr(start, end == std::string::npos ? std::string::npos : end - start);
        if (!item.empty()) out.push_back(std::move(item));
        if (end == std::string::npos) break;
        start = end + 1;
    }
    return out;
}

std::optional<billsync::SupplierGroup> ParseGroup(const std::string &spec) {
    const size_t eq = spec.find('=');
    if (eq == std::string::npos || eq == 0) return std::nullopt;

    billsync::SupplierGroup g;
    const std::string head = spec.substr(0, eq);
    const size_t colon = head.find(':');
    g.supplier_id = head.substr(0, colon);
    if (colon != std::string::npos && colon + 1 < head.size()) {
        g.contract_id = head.substr(colon + 1);
    }
    g.property_ids = SplitList(spec.substr(eq + 1), ',');
    if (g.supplier_id.empty() || g.property_ids.empty()) return std::nullopt;
    return g;
}

} // namespace

int main(int argc, char **argv) {
    billsync::InstallSignalHandlers();

    std::string config_path = kDefaultConfigPath;
    bool config_explicit = false;
    std::string replay_path;
    std::string progress_file;
    bool quiet = false;
    bool json_out = false;
    bool verbose = false;

    billsync::SyncRequest request;
    billsync::ContractFilter contract_filter;

    static option long_opts[] = {
        {"property", required_argument, nullptr, 'p'},
        {"suppliers", required_argument, nullptr, 's'},
        {"all", no_argument, nullptr, 'A'},
        {"group", required_argument, nullptr, 'g'},
        {"discover-only", no_argument, nullptr, 'd'},
        {"contract", required_argument, nullptr, 'C'},
        {"replay", required_argument, nullptr, 'r'},
        {"sync-id", required_argument, nullptr, 'i'},
        {"config", required_argument, nullptr, 'c'},
        {"progress-file", required_argument, nullptr, 'P'},
        {"quiet", no_argument, nullptr, 'q'},
        {"json", no_argument, nullptr, 'j'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hp:s:Ag:dC:r:i:c:P:qjv", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;

            case 'p':
                request.property_id = optarg;
                break;

            case 's':
                request.supplier_ids = SplitList(optarg, ',');
                break;

            case 'A':
                request.all_properties = true;
                break;

            case 'g': {
                auto g = ParseGroup(optarg);
                if (!g) {
                    std::fprintf(stderr, "Invalid --group: %s\n", optarg);
                    return kExitUsage;
                }
                request.supplier_groups.push_back(std::move(*g));
                break;
            }

            case 'd':
                request.discover_only = true;
                break;

            case 'C': {
                const std::string spec = optarg;
                const size_t eq = spec.find('=');
                if (eq == std::string::npos || eq == 0) {
                    std::fprintf(stderr, "Invalid --contract: %s\n", optarg);
                    return kExitUsage;
                }
                contract_filter[spec.substr(0, eq)] = spec.substr(eq + 1);
                break;
            }

            case 'r':
                replay_path = optarg;
                break;

            case 'i':
                request.correlation_id = optarg;
                break;

            case 'c':
                config_path = optarg;
                config_explicit = true;
                break;

            case 'P':
                progress_file = optarg;
                break;

            case 'q':
                quiet = true;
                break;

            case 'j':
                json_out = true;
                break;

            case 'v':
                verbose = true;
                break;

            default:
                PrintUsage(argv[0]);
                return kExitUsage;
        }
    }

    if (request.all_properties == !request.property_id.empty()) {
        std::fprintf(stderr, "Exactly one of --property or --all is required\n");
        PrintUsage(argv[0]);
        return kExitUsage;
    }
    if (request.all_properties && request.supplier_groups.empty()) {
        std::fprintf(stderr, "--all needs at least one --group\n");
        return kExitUsage;
    }

    billsync::config::ClientConfigFromFile cfg;
    const bool cfg_ok = cfg.LoadFile(config_path);
    if (!cfg_ok && (config_explicit || replay_path.empty())) {
        std::fprintf(stderr, "ERROR: cannot load config: %s\n", config_path.c_str());
        return kExitFailed;
    } else if (!cfg_ok) {
        std::fprintf(stderr, "WARN: cannot load config: %s (continuing with replay)\n", config_path.c_str());
    }
    cfg.ApplyEnvironment();

    if (cfg.log_level) {
        billsync::Logger::Instance().SetLevel(*billsync::ParseLogLevel(*cfg.log_level));
    }
    if (verbose) {
        billsync::Logger::Instance().SetLevel(billsync::LogLevel::Debug);
    }
    if (progress_file.empty() && cfg.progress_file) {
        progress_file = *cfg.progress_file;
    }
    const bool console_progress = !quiet && cfg.progress.value_or(true);

    std::unique_ptr<billsync::IStreamTransport> transport;
    std::unique_ptr<billsync::ICancelNotifier> notifier;
    if (!replay_path.empty()) {
        std::unique_ptr<billsync::ReplayStreamTransport> replay;
        if (auto r = billsync::ReplayStreamTransport::Open(replay_path, {}, replay); !r.ok) {
            std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
            return kExitFailed;
        }
        transport = std::move(replay);
        notifier = std::make_unique<billsync::LoggingCancelNotifier>();
    } else {
        if (cfg.base_url.empty()) {
            std::fprintf(stderr, "ERROR: BaseUrl missing in %s\n", config_path.c_str());
            return kExitFailed;
        }
        billsync::HttpEndpoint ep;
        ep.base_url = cfg.base_url;
        ep.token = cfg.token;
        if (cfg.connect_timeout_sec) ep.connect_timeout = std::chrono::seconds(*cfg.connect_timeout_sec);
        if (cfg.read_timeout_sec) ep.read_timeout = std::chrono::seconds(*cfg.read_timeout_sec);
        const std::chrono::milliseconds cancel_timeout(cfg.cancel_timeout_ms.value_or(5000));

        transport = std::make_unique<billsync::HttpStreamTransport>(ep);
        notifier = std::make_unique<billsync::HttpCancelNotifier>(ep, cancel_timeout);
    }

    billsync::SyncSession::Options opt;
    opt.max_line_bytes = cfg.max_line_bytes.value_or(billsync::FrameDecoder::kDefaultMaxLineBytes);
    opt.contract_filter = std::move(contract_filter);

    billsync::ConsoleProgressSink console_sink;
    std::unique_ptr<billsync::FileProgressSink> file_sink;

    billsync::SyncSession session(*transport, *notifier, std::move(opt));
    if (console_progress) {
        session.Subscribe(&console_sink);
    }
    if (!progress_file.empty()) {
        file_sink = std::make_unique<billsync::FileProgressSink>(progress_file);
        session.Subscribe(file_sink.get());
    }

    if (auto r = session.Start(std::move(request)); !r.ok) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return kExitFailed;
    }
    billsync::Logger::Instance().SetContext("sync " + session.CorrelationId().substr(0, 8));

    billsync::SyncResult result;
    std::atomic_bool done{false};
    std::thread reader([&] {
        result = session.Consume();
        done.store(true);
    });

    bool cancel_sent = false;
    while (!done.load()) {
        if (!cancel_sent && billsync::g_cancel.load()) {
            LogWarn("Interrupted, cancelling sync %s", session.CorrelationId().c_str());
            session.Cancel();
            cancel_sent = true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    reader.join();

    if (json_out) {
        std::printf("%s\n", billsync::ResultToJson(result).dump(2).c_str());
    }

    switch (result.state) {
        case billsync::SessionState::Completed:
            return kExitCompleted;
        case billsync::SessionState::Cancelled:
            return kExitCancelled;
        default:
            if (!console_progress && !result.error.empty()) {
                std::fprintf(stderr, "ERROR: %s\n", result.error.c_str());
            }
            return kExitFailed;
    }
}
