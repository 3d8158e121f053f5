#include "sync/sync_request.hpp"

namespace billsync {

std::string SyncRequest::BasePath() const {
    if (all_properties) return "/suppliers/sync-all";
    return "/suppliers/sync/" + property_id;
}

} // namespace billsync
