#include "sync/frame_decoder.hpp"

#include "util/logger.hpp"

namespace billsync {

namespace {

constexpr std::string_view kDefaultEventType = "message";

std::string_view FieldValue(std::string_view line, std::size_t colon) {
    std::string_view v = line.substr(colon + 1);
    if (!v.empty() && v.front() == ' ') v.remove_prefix(1);
    return v;
}

std::string_view Trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

} // namespace

FrameDecoder::FrameDecoder(std::size_t max_line_bytes)
    : max_line_bytes_(max_line_bytes == 0 ? kDefaultMaxLineBytes : max_line_bytes) {}

bool FrameDecoder::HasPendingFrame() const {
    return saw_event_ || saw_data_ || !line_buf_.empty();
}

Result FrameDecoder::Feed(std::string_view chunk, std::vector<Frame>& out) {
    if (finished_) return Result::Fail("FrameDecoder: input after end of stream");

    while (!chunk.empty()) {
        const std::size_t nl = chunk.find('\n');
        if (nl == std::string_view::npos) {
            if (line_buf_.size() + chunk.size() > max_line_bytes_) {
                return Result::Fail("event stream line exceeds " +
                                    std::to_string(max_line_bytes_) + " bytes");
            }
            line_buf_.append(chunk);
            break;
        }

        std::string_view line;
        if (line_buf_.empty()) {
            line = chunk.substr(0, nl);
        } else {
            line_buf_.append(chunk.substr(0, nl));
            line = line_buf_;
        }
        if (line.size() > max_line_bytes_) {
            return Result::Fail("event stream line exceeds " +
                                std::to_string(max_line_bytes_) + " bytes");
        }
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);

        ProcessLine(line, out);
        line_buf_.clear();
        chunk.remove_prefix(nl + 1);
    }
    return Result::Ok();
}

bool FrameDecoder::Finish() {
    if (finished_) return false;
    finished_ = true;

    const bool dropped = HasPendingFrame();
    if (dropped) {
        LogWarn("Event stream ended inside a frame (event='%s', %zu data bytes, %zu unterminated bytes); dropped",
                event_type_.c_str(), data_.size(), line_buf_.size());
    }
    line_buf_.clear();
    ResetFrame();
    return dropped;
}

void FrameDecoder::ProcessLine(std::string_view line, std::vector<Frame>& out) {
    if (line.empty()) {
        if (saw_event_ || saw_data_) Dispatch(out);
        return;
    }
    if (line.front() == ':') {
        // comment / keep-alive
        return;
    }

    const std::size_t colon = line.find(':');
    const std::string_view field = colon == std::string_view::npos ? line : line.substr(0, colon);
    const std::string_view value =
        colon == std::string_view::npos ? std::string_view{} : FieldValue(line, colon);

    if (field == "event") {
        event_type_.assign(Trim(value));
        saw_event_ = true;
    } else if (field == "data") {
        if (saw_data_) data_.push_back('\n');
        data_.append(value);
        saw_data_ = true;
    } else {
        LogDebug("Ignoring event stream field '%.*s'", (int)field.size(), field.data());
    }
}

void FrameDecoder::Dispatch(std::vector<Frame>& out) {
    Frame f;
    f.event_type = event_type_.empty() ? std::string(kDefaultEventType) : std::move(event_type_);
    f.data = std::move(data_);
    out.push_back(std::move(f));
    ++frames_emitted_;
    ResetFrame();
}

void FrameDecoder::ResetFrame() {
    event_type_.clear();
    data_.clear();
    saw_event_ = false;
    saw_data_ = false;
}

} // namespace billsync
