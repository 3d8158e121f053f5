#include "sync/event_router.hpp"

#include <nlohmann/json.hpp>

namespace billsync {

using json = nlohmann::json;

namespace {

constexpr const char kDefaultErrorMessage[] = "Sync failed";

std::unexpected<DecodeError> Bad(const Frame& f, std::string msg) {
    return std::unexpected(DecodeError{f.event_type, std::move(msg)});
}

bool GetOptionalString(const json& j, const char* key, std::optional<std::string>& out,
                       std::string& err) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return true;
    if (!it->is_string()) {
        err = std::string("'") + key + "' must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool GetCount(const json& j, const char* key, std::uint64_t& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        out = 0;
        return true;
    }
    if (it->is_number_unsigned()) {
        out = it->get<std::uint64_t>();
        return true;
    }
    if (it->is_number_integer()) {
        const auto v = it->get<long long>();
        if (v < 0) {
            err = std::string("'") + key + "' must not be negative";
            return false;
        }
        out = static_cast<std::uint64_t>(v);
        return true;
    }
    err = std::string("'") + key + "' must be an integer";
    return false;
}

std::optional<std::string> StringField(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return std::nullopt;
    auto s = it->get<std::string>();
    if (s.empty()) return std::nullopt;
    return s;
}

DiscoveredBill ParseBill(const json& b, const std::string& supplier_name) {
    DiscoveredBill bill;
    bill.supplier_name = supplier_name;
    bill.bill_number = StringField(b, "bill_number");
    if (auto it = b.find("amount"); it != b.end() && it->is_number()) {
        bill.amount = it->get<double>();
    }
    bill.due_date = StringField(b, "due_date").value_or("");
    bill.iban = StringField(b, "iban");
    bill.contract_id = StringField(b, "contract_id");
    bill.property_id = StringField(b, "property_id");
    bill.description = StringField(b, "description").value_or(supplier_name);
    bill.raw = b;
    return bill;
}

std::expected<SyncEvent, DecodeError> RouteProgress(const Frame& f, const json& j) {
    ProgressEvent ev;
    std::string err;

    auto name = j.find("supplier_name");
    if (name == j.end() || !name->is_string() || name->get<std::string>().empty()) {
        return Bad(f, "progress event missing supplier_name");
    }
    ev.supplier_name = name->get<std::string>();

    if (!GetOptionalString(j, "contract_id", ev.contract_id, err)) return Bad(f, err);
    if (ev.contract_id && ev.contract_id->empty()) ev.contract_id.reset();

    auto st = j.find("status");
    if (st == j.end() || !st->is_string()) {
        return Bad(f, "progress event missing status");
    }
    auto status = ParseSupplierStatus(st->get<std::string>());
    if (!status) {
        return Bad(f, "unknown supplier status '" + st->get<std::string>() + "'");
    }
    ev.status = *status;

    if (!GetCount(j, "bills_found", ev.bills_found, err)) return Bad(f, err);
    if (!GetCount(j, "bills_created", ev.bills_created, err)) return Bad(f, err);

    if (!GetOptionalString(j, "error", ev.error, err)) return Bad(f, err);
    if (ev.status != SupplierStatus::Error) ev.error.reset();

    if (auto it = j.find("properties_affected"); it != j.end() && !it->is_null()) {
        if (!it->is_array()) return Bad(f, "'properties_affected' must be an array");
        std::vector<std::string> props;
        for (const auto& p : *it) {
            if (p.is_string()) props.push_back(p.get<std::string>());
        }
        ev.properties_affected = std::move(props);
    }

    if (auto it = j.find("bills"); it != j.end() && it->is_array()) {
        for (const auto& b : *it) {
            if (b.is_object()) ev.bills.push_back(ParseBill(b, ev.supplier_name));
        }
    }

    return ev;
}

} // namespace

std::expected<SyncEvent, DecodeError> EventRouter::Route(const Frame& frame) const {
    const std::string& type = frame.event_type;
    const bool known = type == "start" || type == "progress" || type == "complete" ||
                       type == "error" || type == "cancelled";
    if (!known) {
        return UnknownEvent{type, frame.data};
    }

    json j = json::object();
    if (frame.data.find_first_not_of(" \t\r\n") != std::string::npos) {
        try {
            j = json::parse(frame.data);
        } catch (const json::parse_error& e) {
            return Bad(frame, std::string("invalid JSON payload: ") + e.what());
        }
    }
    if (!j.is_object()) {
        return Bad(frame, "payload must be a JSON object");
    }

    try {
        if (type == "start") {
            return StartEvent{};
        }
        if (type == "progress") {
            return RouteProgress(frame, j);
        }
        if (type == "complete") {
            CompleteEvent ev;
            if (j.contains("bills_created") && !j["bills_created"].is_null()) {
                std::uint64_t total = 0;
                std::string err;
                if (!GetCount(j, "bills_created", total, err)) return Bad(frame, err);
                ev.bills_created = total;
            }
            return ev;
        }
        if (type == "error") {
            ErrorEvent ev;
            auto it = j.find("error");
            if (it != j.end() && it->is_string() && !it->get<std::string>().empty()) {
                ev.error = it->get<std::string>();
            } else {
                ev.error = kDefaultErrorMessage;
            }
            return ev;
        }
        return CancelledEvent{};
    } catch (const json::exception& e) {
        return Bad(frame, std::string("malformed payload: ") + e.what());
    }
}

const char* EventName(const SyncEvent& ev) {
    struct Visitor {
        const char* operator()(const StartEvent&) const { return "start"; }
        const char* operator()(const ProgressEvent&) const { return "progress"; }
        const char* operator()(const CompleteEvent&) const { return "complete"; }
        const char* operator()(const ErrorEvent&) const { return "error"; }
        const char* operator()(const CancelledEvent&) const { return "cancelled"; }
        const char* operator()(const UnknownEvent&) const { return "unknown"; }
    };
    return std::visit(Visitor{}, ev);
}

const char* ToString(SupplierStatus s) {
    switch (s) {
        case SupplierStatus::Starting:   return "starting";
        case SupplierStatus::Processing: return "processing";
        case SupplierStatus::Completed:  return "completed";
        case SupplierStatus::Error:      return "error";
    }
    return "unknown";
}

std::optional<SupplierStatus> ParseSupplierStatus(std::string_view s) {
    if (s == "starting") return SupplierStatus::Starting;
    if (s == "processing") return SupplierStatus::Processing;
    if (s == "completed") return SupplierStatus::Completed;
    if (s == "error") return SupplierStatus::Error;
    return std::nullopt;
}

} // namespace billsync
