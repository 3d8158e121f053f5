#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <sys/types.h>

namespace billsync {

class IReader {
public:
    virtual ~IReader() = default;

    // Returns bytes read, 0 at end of input, -1 on error.
    virtual ssize_t Read(std::span<std::uint8_t> out) = 0;
    virtual std::optional<std::uint64_t> TotalSize() const { return std::nullopt; }

    // 1 if a Read() would not block, 0 on timeout, -1 on error.
    // Sources that never block keep the default.
    virtual int PollReadable(int timeout_ms) {
        (void)timeout_ms;
        return 1;
    }
};

} // namespace billsync
