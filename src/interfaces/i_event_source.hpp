#pragma once

#include "../event.hpp"

namespace panedash {

class IEventSource {
public:
    virtual ~IEventSource() = default;

    // Blocks until the next input event. Throws TerminalError on failure.
    virtual Event read_event() = 0;
};

} // namespace panedash
