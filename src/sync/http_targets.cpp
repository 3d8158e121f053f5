#include "sync/http_transport.hpp"

#include <nlohmann/json.hpp>

#include <cstdio>

namespace billsync {

namespace {

std::string EncodeQueryComponent(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out.append(buf);
        }
    }
    return out;
}

std::string Join(const std::vector<std::string>& items, char sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i) out.push_back(sep);
        out += items[i];
    }
    return out;
}

} // namespace

std::string BuildStartTarget(const SyncRequest& request) {
    std::string target = request.BasePath();
    if (request.all_properties) return target;

    target += "?sync_id=" + EncodeQueryComponent(request.correlation_id);
    if (!request.supplier_ids.empty()) {
        target += "&supplier_ids=" + EncodeQueryComponent(Join(request.supplier_ids, ','));
    }
    if (request.discover_only) {
        target += "&discover_only=true";
    }
    return target;
}

std::string BuildCancelTarget(const SyncRequest& request) {
    return request.BasePath() + "/cancel?sync_id=" + EncodeQueryComponent(request.correlation_id);
}

std::string BuildStartBody(const SyncRequest& request) {
    if (!request.all_properties) return {};

    nlohmann::json groups = nlohmann::json::array();
    for (const auto& g : request.supplier_groups) {
        nlohmann::json jg;
        jg["supplier_id"] = g.supplier_id;
        jg["contract_id"] = g.contract_id ? nlohmann::json(*g.contract_id) : nlohmann::json();
        jg["property_ids"] = g.property_ids;
        groups.push_back(std::move(jg));
    }
    nlohmann::json body;
    body["sync_id"] = request.correlation_id;
    body["supplier_groups"] = std::move(groups);
    body["discover_only"] = request.discover_only;
    return body.dump();
}

} // namespace billsync
