#pragma once

#include "util/client_config.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace billsync::config::detail {

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err);
bool FillConfigFromJson(const nlohmann::json& j, ClientConfigFromFile& cfg, std::string& err);

} // namespace billsync::config::detail
