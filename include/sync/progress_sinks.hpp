#pragma once

#include "sync/progress.hpp"

#include <map>
#include <nlohmann/json.hpp>
#include <string>

namespace billsync {

nlohmann::json SnapshotToJson(const ProgressSnapshot& snapshot);
nlohmann::json ResultToJson(const SyncResult& result);

// Keeps `path` holding the latest snapshot as JSON (temp file + rename).
class FileProgressSink final : public ISyncObserver {
public:
    explicit FileProgressSink(std::string path);

    void OnProgress(const ProgressSnapshot& snapshot) override;
    void OnFinished(const SyncResult& result) override;

private:
    void WriteAtomically(const nlohmann::json& doc);

    std::string path_;
};

// Prints a line when a supplier finishes or fails and keeps a one-line
// running summary on stderr.
class ConsoleProgressSink final : public ISyncObserver {
public:
    ConsoleProgressSink() = default;

    void OnProgress(const ProgressSnapshot& snapshot) override;
    void OnFinished(const SyncResult& result) override;

private:
    std::map<SupplierKey, SupplierStatus> reported_;
};

bool IsProgressLineActive();
void ClearProgressLine();

} // namespace billsync
