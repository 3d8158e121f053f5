#pragma once

#include "sync/frame_decoder.hpp"
#include "sync/sync_events.hpp"

#include <expected>

namespace billsync {

// Turns decoded frames into typed events.
class EventRouter {
public:
    std::expected<SyncEvent, DecodeError> Route(const Frame& frame) const;
};

const char* EventName(const SyncEvent& ev);

} // namespace billsync
