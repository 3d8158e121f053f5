#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace billsync {

// Reads a recorded event stream from a file, or from stdin when path is "-".
class FileOrStdinReader final : public IReader {
public:
    static Result Open(std::string path, FileOrStdinReader &out);

    // Takes ownership of an already open descriptor (pipes, sockets).
    static FileOrStdinReader FromFd(Fd fd, std::string label);

    std::optional<std::uint64_t> TotalSize() const override;
    ssize_t Read(std::span<std::uint8_t> out) override;
    int PollReadable(int timeout_ms) override;

    const std::string& Path() const { return path_; }

private:
    std::string path_;
    Fd fd_;
    std::optional<std::uint64_t> size_;
};

} // namespace billsync
