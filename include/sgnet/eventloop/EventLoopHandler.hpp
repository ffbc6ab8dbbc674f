#pragma once

#include <cstdint>

namespace sgnet {

// Receives readiness events for one registered fd on the loop thread.
class EventLoopHandler {
public:
    EventLoopHandler() = default;
    virtual ~EventLoopHandler() = default;

    virtual void onEvent(uint32_t event_mask) noexcept = 0;

protected:
    static constexpr uint32_t kEpollIn = 0x001;
    static constexpr uint32_t kEpollOut = 0x004;
    static constexpr uint32_t kEpollErr = 0x008;
    static constexpr uint32_t kEpollHup = 0x010;
};

}  // namespace sgnet
