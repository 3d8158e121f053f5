#pragma once

#include "io/io.hpp"

#include <memory>
#include <string>
#include <vector>
#include <zlib.h>

namespace billsync {

// Inflates a gzip-compressed recording on the fly.
class GzipReader final : public IReader {
  public:
    explicit GzipReader(std::unique_ptr<IReader> source);
    ~GzipReader() override;

    GzipReader(const GzipReader&) = delete;
    GzipReader& operator=(const GzipReader&) = delete;

    ssize_t Read(std::span<std::uint8_t> out) override;
    std::optional<std::uint64_t> TotalSize() const override { return std::nullopt; }
    int PollReadable(int timeout_ms) override;

    const std::string& LastError() const { return last_error_; }

  private:
    ssize_t Fail(std::string msg);

    std::unique_ptr<IReader> source_;
    z_stream strm_{};
    std::vector<std::uint8_t> in_buffer_;
    bool eof_reached_ = false;
    std::string last_error_;
};

// True for names ending in ".gz".
bool IsGzipPath(const std::string& path);

} // namespace billsync
