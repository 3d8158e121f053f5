#include "sync/progress_sinks.hpp"

#include "util/logger.hpp"

#include <atomic>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <fstream>
#include <string>

namespace billsync {

namespace {
std::atomic_bool g_progress_line_active{false};

std::string Label(const SupplierProgressEntry& e) {
    if (e.contract_id) return e.supplier_name + " (" + *e.contract_id + ")";
    return e.supplier_name;
}

std::string FormatTime(std::chrono::system_clock::time_point tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    if (gmtime_r(&t, &tm) == nullptr) return {};
    char buf[32]{};
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}
} // namespace

nlohmann::json SnapshotToJson(const ProgressSnapshot& snapshot) {
    nlohmann::json suppliers = nlohmann::json::array();
    for (const auto& e : snapshot.entries) {
        nlohmann::json j;
        j["supplier_name"] = e.supplier_name;
        if (e.contract_id) j["contract_id"] = *e.contract_id;
        j["status"] = ToString(e.status);
        j["bills_found"] = e.bills_found;
        j["bills_created"] = e.bills_created;
        if (e.error) j["error"] = *e.error;
        if (!e.properties_affected.empty()) j["properties_affected"] = e.properties_affected;
        suppliers.push_back(std::move(j));
    }

    nlohmann::json doc;
    doc["suppliers"] = std::move(suppliers);
    doc["total_bills_created"] = snapshot.total_bills_created;
    doc["bills_discovered"] = snapshot.bills_discovered;
    return doc;
}

nlohmann::json ResultToJson(const SyncResult& result) {
    nlohmann::json doc = SnapshotToJson(result.snapshot);
    doc["sync_id"] = result.correlation_id;
    doc["state"] = ToString(result.state);
    if (!result.error.empty()) doc["error"] = result.error;
    doc["started_at"] = FormatTime(result.started_at);
    if (result.ended_at) doc["ended_at"] = FormatTime(*result.ended_at);

    nlohmann::json bills = nlohmann::json::array();
    for (const auto& b : result.discovered_bills) {
        bills.push_back(b.raw.is_object() ? b.raw : nlohmann::json::object());
        auto& j = bills.back();
        j["supplier_name"] = b.supplier_name;
        j["description"] = b.description;
    }
    doc["discovered_bills"] = std::move(bills);
    return doc;
}

FileProgressSink::FileProgressSink(std::string path) : path_(std::move(path)) {}

void FileProgressSink::OnProgress(const ProgressSnapshot& snapshot) {
    nlohmann::json doc = SnapshotToJson(snapshot);
    doc["state"] = "running";
    WriteAtomically(doc);
}

void FileProgressSink::OnFinished(const SyncResult& result) {
    WriteAtomically(ResultToJson(result));
}

void FileProgressSink::WriteAtomically(const nlohmann::json& doc) {
    const std::string tmp_path = path_ + ".tmp";
    std::ofstream os(tmp_path, std::ios::trunc);
    if (!os.good()) {
        LogWarn("Cannot write progress file %s", tmp_path.c_str());
        return;
    }

    os << doc.dump(2) << "\n";
    os.close();
    if (!os.good()) {
        LogWarn("Short write to progress file %s", tmp_path.c_str());
        return;
    }

    if (std::rename(tmp_path.c_str(), path_.c_str()) != 0) {
        LogWarn("Cannot replace progress file %s: %s", path_.c_str(), std::strerror(errno));
    }
}

void ConsoleProgressSink::OnProgress(const ProgressSnapshot& snapshot) {
    std::size_t done = 0;
    for (const auto& e : snapshot.entries) {
        const bool finished =
            e.status == SupplierStatus::Completed || e.status == SupplierStatus::Error;
        if (finished) ++done;

        const SupplierKey key = e.Key();
        auto it = reported_.find(key);
        if (it != reported_.end() && it->second == e.status) continue;
        reported_[key] = e.status;
        if (!finished) continue;

        ClearProgressLine();
        const std::string label = Label(e);
        if (e.status == SupplierStatus::Completed) {
            std::fprintf(stderr, "[%s] completed: %llu found, %llu created\n",
                         label.c_str(),
                         (unsigned long long)e.bills_found,
                         (unsigned long long)e.bills_created);
        } else {
            std::fprintf(stderr, "[%s] error: %s\n",
                         label.c_str(), e.error ? e.error->c_str() : "unknown error");
        }
    }

    std::fprintf(stderr,
                 "\r[sync] %zu/%zu suppliers done | %llu bills created",
                 done,
                 snapshot.entries.size(),
                 (unsigned long long)snapshot.total_bills_created);
    if (snapshot.bills_discovered > 0) {
        std::fprintf(stderr, " | %zu discovered", snapshot.bills_discovered);
    }
    std::fflush(stderr);
    g_progress_line_active = true;
}

void ConsoleProgressSink::OnFinished(const SyncResult& result) {
    ClearProgressLine();
    std::fprintf(stderr, "Sync %s: %llu bills created across %zu suppliers",
                 ToString(result.state),
                 (unsigned long long)result.snapshot.total_bills_created,
                 result.snapshot.entries.size());
    if (!result.discovered_bills.empty()) {
        std::fprintf(stderr, ", %zu bills discovered", result.discovered_bills.size());
    }
    std::fprintf(stderr, "\n");
    if (!result.error.empty()) {
        std::fprintf(stderr, "  %s\n", result.error.c_str());
    }
}

bool IsProgressLineActive() { return g_progress_line_active; }

void ClearProgressLine() {
    if (g_progress_line_active.exchange(false)) {
        std::fprintf(stderr, "\n");
    }
}

} // namespace billsync
