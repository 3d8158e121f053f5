#include "util/client_config.hpp"

#include "util/config_json_utils.hpp"

#include <cstdio>
#include <cstdlib>

namespace billsync::config {

void ClientConfigFromFile::Reset() {
    base_url.clear();
    token.clear();
    connect_timeout_sec.reset();
    read_timeout_sec.reset();
    cancel_timeout_ms.reset();
    max_line_bytes.reset();
    progress.reset();
    progress_file.reset();
    log_level.reset();
}

bool ClientConfigFromFile::LoadFile(const std::string& path) {
    Reset();

    nlohmann::json json;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(path, json, err)) {
        std::fprintf(stderr, "Config: %s\n", err.c_str());
        return false;
    }

    if (!detail::FillConfigFromJson(json, *this, err)) {
        std::fprintf(stderr, "Config: %s in %s\n", err.c_str(), path.c_str());
        return false;
    }

    return true;
}

void ClientConfigFromFile::ApplyEnvironment() {
    if (const char* env_token = std::getenv("BILLSYNC_TOKEN")) {
        if (*env_token != '\0') {
            token = env_token;
        }
    }
}

} // namespace billsync::config
