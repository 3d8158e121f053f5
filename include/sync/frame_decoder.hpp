#pragma once

#include "util/result.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace billsync {

struct Frame {
    std::string event_type;
    std::string data;

    bool operator==(const Frame&) const = default;
};

// Incremental text/event-stream framer.
//
// Bytes may arrive split anywhere; a trailing partial line is kept until its
// newline shows up. A frame is emitted when a blank line terminates it.
// One decoder serves exactly one stream: after Finish() it rejects input.
class FrameDecoder {
public:
    static constexpr std::size_t kDefaultMaxLineBytes = 1024 * 1024;

    explicit FrameDecoder(std::size_t max_line_bytes = kDefaultMaxLineBytes);

    // Appends every frame completed by this chunk to `out`.
    Result Feed(std::string_view chunk, std::vector<Frame>& out);

    // End of input. A frame still being assembled is dropped; returns true
    // when that happened.
    bool Finish();

    bool Finished() const { return finished_; }
    bool HasPendingFrame() const;
    std::size_t FramesEmitted() const { return frames_emitted_; }

private:
    void ProcessLine(std::string_view line, std::vector<Frame>& out);
    void Dispatch(std::vector<Frame>& out);
    void ResetFrame();

    std::size_t max_line_bytes_;
    std::string line_buf_;
    std::string event_type_;
    std::string data_;
    bool saw_event_ = false;
    bool saw_data_ = false;
    bool finished_ = false;
    std::size_t frames_emitted_ = 0;
};

} // namespace billsync
