#pragma once

#include <atomic>

namespace billsync {

// Set by SIGINT/SIGTERM. The CLI's watcher turns it into SyncSession::Cancel().
extern std::atomic_bool g_cancel;

void InstallSignalHandlers();

} // namespace billsync
