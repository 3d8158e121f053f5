#pragma once

#include "sync/sync_events.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace billsync {

struct SupplierKey {
    std::string supplier_name;
    std::string contract_id; // "" when the server sent none

    auto operator<=>(const SupplierKey&) const = default;
};

struct SupplierProgressEntry {
    std::string supplier_name;
    std::optional<std::string> contract_id;
    SupplierStatus status = SupplierStatus::Starting;
    std::uint64_t bills_found = 0;
    std::uint64_t bills_created = 0;
    std::optional<std::string> error;
    std::vector<std::string> properties_affected;
    // Highest bills_created seen for this row; the part already in the total.
    std::uint64_t bills_created_counted = 0;

    SupplierKey Key() const { return {supplier_name, contract_id.value_or("")}; }
};

struct ProgressSnapshot {
    std::vector<SupplierProgressEntry> entries; // first-seen order
    std::uint64_t total_bills_created = 0;
    std::size_t bills_discovered = 0;

    const SupplierProgressEntry* Find(const std::string& supplier_name,
                                      const std::string& contract_id = {}) const;
};

// Per-supplier progress table plus the running bills_created total.
//
// Rows keep the order in which suppliers first appeared so a display does not
// reshuffle while statuses change. The total grows by how far a supplier's
// bills_created rises above the highest value it reported before, so a value
// that dips and recovers is counted once.
class ProgressAggregator {
public:
    // Returns the index of the entry that was touched.
    std::size_t Apply(const ProgressEvent& ev);

    void SetAuthoritativeTotal(std::uint64_t total);

    // Entries still starting/processing become errors with "Cancelled".
    std::size_t MarkUnfinishedCancelled();

    void Reset();

    std::uint64_t TotalBillsCreated() const { return total_bills_created_; }
    std::size_t Size() const { return entries_.size(); }
    const std::vector<SupplierProgressEntry>& Entries() const { return entries_; }

    ProgressSnapshot Snapshot() const;

private:
    std::vector<SupplierProgressEntry> entries_;
    std::map<SupplierKey, std::size_t> index_;
    std::uint64_t total_bills_created_ = 0;
};

} // namespace billsync
