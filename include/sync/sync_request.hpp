#pragma once

#include <optional>
#include <string>
#include <vector>

namespace billsync {

struct SupplierGroup {
    std::string supplier_id;
    std::optional<std::string> contract_id;
    std::vector<std::string> property_ids;
};

// What to synchronize. Either one property or, with all_properties set, the
// supplier groups spanning several properties.
struct SyncRequest {
    std::string correlation_id;

    bool all_properties = false;
    std::string property_id;
    std::vector<std::string> supplier_ids;       // single property only
    std::vector<SupplierGroup> supplier_groups;  // all properties only
    bool discover_only = false;

    // "/suppliers/sync/{id}" or "/suppliers/sync-all"
    std::string BasePath() const;
};

} // namespace billsync
