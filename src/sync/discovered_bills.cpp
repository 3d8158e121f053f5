#include "sync/discovered_bills.hpp"

#include "util/logger.hpp"

#include <cstdio>
#include <set>

namespace billsync {

namespace {

std::string DedupKey(const DiscoveredBill& b) {
    // %.17g keeps distinct doubles distinct
    char amount[64];
    std::snprintf(amount, sizeof(amount), "%.17g", b.amount);
    return b.supplier_name + '|' + b.bill_number.value_or("") + '|' + amount + '|' + b.due_date;
}

} // namespace

void DiscoveredBillCollector::Add(const std::vector<DiscoveredBill>& bills) {
    bills_.insert(bills_.end(), bills.begin(), bills.end());
}

std::vector<DiscoveredBill> DiscoveredBillCollector::Finalize(const ContractFilter& filter) const {
    std::vector<DiscoveredBill> out;
    out.reserve(bills_.size());

    std::set<std::string> seen;
    std::size_t duplicates = 0;
    std::size_t filtered = 0;
    for (const auto& b : bills_) {
        if (!seen.insert(DedupKey(b)).second) {
            ++duplicates;
            continue;
        }
        auto it = filter.find(b.supplier_name);
        if (it != filter.end() && !it->second.empty() &&
            b.contract_id.value_or("") != it->second) {
            ++filtered;
            continue;
        }
        out.push_back(b);
    }

    if (duplicates > 0 || filtered > 0) {
        LogInfo("Discovered bills: %zu kept, %zu duplicate, %zu other contract",
                out.size(), duplicates, filtered);
    }
    return out;
}

} // namespace billsync
