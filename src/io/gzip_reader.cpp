#include "io/gzip_reader.hpp"

#include <stdexcept>

namespace billsync {

GzipReader::GzipReader(std::unique_ptr<IReader> source)
    : source_(std::move(source)), in_buffer_(16384) {
    if (!source_) {
        throw std::invalid_argument("GzipReader: null source");
    }
    strm_.zalloc = Z_NULL;
    strm_.zfree = Z_NULL;
    strm_.opaque = Z_NULL;
    strm_.avail_in = 0;
    strm_.next_in = Z_NULL;

    // 16 + MAX_WBITS tells zlib to expect a gzip header
    if (inflateInit2(&strm_, 16 + MAX_WBITS) != Z_OK) {
        throw std::runtime_error("Failed to initialize zlib inflate");
    }
}

GzipReader::~GzipReader() {
    inflateEnd(&strm_);
}

ssize_t GzipReader::Fail(std::string msg) {
    last_error_ = std::move(msg);
    return -1;
}

ssize_t GzipReader::Read(std::span<std::uint8_t> out) {
    if (eof_reached_ || out.empty()) return 0;

    strm_.next_out = out.data();
    strm_.avail_out = static_cast<uInt>(out.size());

    while (strm_.avail_out > 0) {
        if (strm_.avail_in == 0) {
            // Hand back what we have before blocking on the source again.
            if (strm_.avail_out < out.size()) break;

            ssize_t n = source_->Read(in_buffer_);
            if (n < 0) return Fail("gzip source read failed");
            if (n == 0) {
                return Fail("gzip stream truncated");
            }
            strm_.avail_in = static_cast<uInt>(n);
            strm_.next_in = in_buffer_.data();
        }

        int ret = inflate(&strm_, Z_NO_FLUSH);

        if (ret == Z_STREAM_END) {
            eof_reached_ = true;
            break;
        }

        // Z_BUF_ERROR only means zlib wants more input or output space.
        if (ret != Z_OK && ret != Z_BUF_ERROR) {
            return Fail(std::string("inflate failed: ") + (strm_.msg ? strm_.msg : "unknown"));
        }
    }

    return static_cast<ssize_t>(out.size() - strm_.avail_out);
}

int GzipReader::PollReadable(int timeout_ms) {
    if (eof_reached_ || strm_.avail_in > 0) return 1;
    return source_->PollReadable(timeout_ms);
}

bool IsGzipPath(const std::string& path) {
    return path.size() >= 3 && path.compare(path.size() - 3, 3, ".gz") == 0;
}

} // namespace billsync
