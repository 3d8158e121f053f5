#include "sync/progress_aggregator.hpp"

#include "util/logger.hpp"

namespace billsync {

namespace {
constexpr const char kCancelledMessage[] = "Cancelled";
} // namespace

const SupplierProgressEntry* ProgressSnapshot::Find(const std::string& supplier_name,
                                                    const std::string& contract_id) const {
    for (const auto& e : entries) {
        if (e.supplier_name == supplier_name && e.contract_id.value_or("") == contract_id) {
            return &e;
        }
    }
    return nullptr;
}

std::size_t ProgressAggregator::Apply(const ProgressEvent& ev) {
    SupplierKey key{ev.supplier_name, ev.contract_id.value_or("")};

    auto [it, inserted] = index_.try_emplace(key, entries_.size());
    if (inserted) {
        SupplierProgressEntry fresh;
        fresh.supplier_name = ev.supplier_name;
        fresh.contract_id = ev.contract_id;
        entries_.push_back(std::move(fresh));
        LogDebug("Tracking supplier %s%s%s", ev.supplier_name.c_str(),
                 ev.contract_id ? " contract " : "",
                 ev.contract_id ? ev.contract_id->c_str() : "");
    }

    SupplierProgressEntry& entry = entries_[it->second];
    const std::uint64_t previous_created = entry.bills_created;
    const std::uint64_t counted = entry.bills_created_counted;

    entry.status = ev.status;
    entry.bills_found = ev.bills_found;
    entry.bills_created = ev.bills_created;
    if (ev.status == SupplierStatus::Error) {
        entry.error = ev.error;
    } else {
        entry.error.reset();
    }
    if (ev.properties_affected) {
        entry.properties_affected = *ev.properties_affected;
    }

    if (ev.bills_created > counted) {
        total_bills_created_ += ev.bills_created - counted;
        entry.bills_created_counted = ev.bills_created;
    }
    if (ev.bills_created < previous_created) {
        LogWarn("Supplier %s reported bills_created=%llu after %llu; total left unchanged",
                ev.supplier_name.c_str(),
                (unsigned long long)ev.bills_created,
                (unsigned long long)previous_created);
    }

    return it->second;
}

void ProgressAggregator::SetAuthoritativeTotal(std::uint64_t total) {
    if (total != total_bills_created_) {
        LogInfo("Server total bills_created=%llu overrides local total %llu",
                (unsigned long long)total,
                (unsigned long long)total_bills_created_);
    }
    total_bills_created_ = total;
}

std::size_t ProgressAggregator::MarkUnfinishedCancelled() {
    std::size_t n = 0;
    for (auto& e : entries_) {
        if (e.status == SupplierStatus::Starting || e.status == SupplierStatus::Processing) {
            e.status = SupplierStatus::Error;
            e.error = kCancelledMessage;
            ++n;
        }
    }
    return n;
}

void ProgressAggregator::Reset() {
    entries_.clear();
    index_.clear();
    total_bills_created_ = 0;
}

ProgressSnapshot ProgressAggregator::Snapshot() const {
    ProgressSnapshot s;
    s.entries = entries_;
    s.total_bills_created = total_bills_created_;
    return s;
}

} // namespace billsync
