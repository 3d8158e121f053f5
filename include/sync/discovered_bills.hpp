#pragma once

#include "sync/sync_events.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace billsync {

// supplier name -> contract id the caller expects bills for
using ContractFilter = std::map<std::string, std::string>;

// Bills reported by a discover-only run, in arrival order.
class DiscoveredBillCollector {
public:
    void Add(const std::vector<DiscoveredBill>& bills);

    // Duplicates (supplier, bill number, amount, due date) are dropped keeping
    // the first one. A supplier mapped to a non-empty contract id keeps only
    // bills for that contract; other suppliers keep everything.
    std::vector<DiscoveredBill> Finalize(const ContractFilter& filter) const;

    std::size_t Size() const { return bills_.size(); }
    void Reset() { bills_.clear(); }

private:
    std::vector<DiscoveredBill> bills_;
};

} // namespace billsync
