#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace billsync::config {

class ClientConfigFromFile {
public:
    std::string base_url;
    std::string token;

    std::optional<std::uint64_t> connect_timeout_sec;
    std::optional<std::uint64_t> read_timeout_sec;
    std::optional<std::uint64_t> cancel_timeout_ms;
    std::optional<std::uint64_t> max_line_bytes;
    std::optional<bool> progress;
    std::optional<std::string> progress_file;
    std::optional<std::string> log_level;

    bool LoadFile(const std::string &path);

    // BILLSYNC_TOKEN wins over the file's Token.
    void ApplyEnvironment();

    void Reset();
};

} // namespace billsync::config
