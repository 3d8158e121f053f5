#include "util/config_json_utils.hpp"

#include "util/logger.hpp"

#include <fstream>

namespace billsync::config::detail {

namespace {

bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out) {
    auto it = j.find(key);
    if (it == j.end())
        return false;
    if (!it->is_string())
        return false;
    out = it->get<std::string>();
    return true;
}

bool GetU64IfPresent(const nlohmann::json& j, const char* key, std::uint64_t& out) {
    auto it = j.find(key);
    if (it == j.end())
        return false;
    if (!(it->is_number_unsigned() || it->is_number_integer()))
        return false;
    auto v = it->get<long long>();
    if (v < 0)
        return false;
    out = static_cast<std::uint64_t>(v);
    return true;
}

bool GetBoolIfPresent(const nlohmann::json& j, const char* key, bool& out) {
    auto it = j.find(key);
    if (it == j.end())
        return false;
    if (!it->is_boolean())
        return false;
    out = it->get<bool>();
    return true;
}

bool HasScheme(const std::string& url) {
    return url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, ClientConfigFromFile& cfg, std::string& err) {
    GetStringIfPresent(j, "BaseUrl", cfg.base_url);
    GetStringIfPresent(j, "Token", cfg.token);

    if (!cfg.base_url.empty()) {
        if (!HasScheme(cfg.base_url)) {
            err = "BaseUrl must start with http:// or https://";
            return false;
        }
        while (!cfg.base_url.empty() && cfg.base_url.back() == '/') {
            cfg.base_url.pop_back();
        }
    }

    {
        std::uint64_t v{};
        if (GetU64IfPresent(j, "ConnectTimeoutSec", v)) {
            cfg.connect_timeout_sec = v;
        }
        if (GetU64IfPresent(j, "ReadTimeoutSec", v)) {
            cfg.read_timeout_sec = v;
        }
        if (GetU64IfPresent(j, "CancelTimeoutMs", v)) {
            cfg.cancel_timeout_ms = v;
        }
        if (GetU64IfPresent(j, "MaxLineBytes", v)) {
            if (v == 0) {
                err = "MaxLineBytes must be positive";
                return false;
            }
            cfg.max_line_bytes = v;
        }
    }
    {
        bool b{};
        if (GetBoolIfPresent(j, "Progress", b)) {
            cfg.progress = b;
        }
    }
    {
        std::string s;
        if (GetStringIfPresent(j, "ProgressFile", s) && !s.empty()) {
            cfg.progress_file = s;
        }
        if (GetStringIfPresent(j, "LogLevel", s)) {
            if (!ParseLogLevel(s)) {
                err = "unknown LogLevel '" + s + "'";
                return false;
            }
            cfg.log_level = s;
        }
    }

    return true;
}

} // namespace billsync::config::detail
