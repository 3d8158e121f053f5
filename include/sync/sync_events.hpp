#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace billsync {

enum class SupplierStatus {
    Starting,
    Processing,
    Completed,
    Error,
};

const char* ToString(SupplierStatus s);
std::optional<SupplierStatus> ParseSupplierStatus(std::string_view s);

struct DiscoveredBill {
    std::string supplier_name;
    std::optional<std::string> bill_number;
    double amount = 0.0;
    std::string due_date;
    std::optional<std::string> iban;
    std::optional<std::string> contract_id;
    std::optional<std::string> property_id;
    std::string description;
    nlohmann::json raw;
};

struct StartEvent {};

struct ProgressEvent {
    std::string supplier_name;
    std::optional<std::string> contract_id;
    SupplierStatus status = SupplierStatus::Starting;
    std::uint64_t bills_found = 0;
    std::uint64_t bills_created = 0;
    std::optional<std::string> error;
    // Present only when the server sent the field.
    std::optional<std::vector<std::string>> properties_affected;
    std::vector<DiscoveredBill> bills;
};

struct CompleteEvent {
    // Authoritative final total when present.
    std::optional<std::uint64_t> bills_created;
};

struct ErrorEvent {
    std::string error;
};

struct CancelledEvent {};

struct UnknownEvent {
    std::string event_type;
    std::string payload;
};

using SyncEvent = std::variant<StartEvent,
                               ProgressEvent,
                               CompleteEvent,
                               ErrorEvent,
                               CancelledEvent,
                               UnknownEvent>;

// A frame whose payload could not be turned into a SyncEvent.
struct DecodeError {
    std::string event_type;
    std::string message;
};

} // namespace billsync
