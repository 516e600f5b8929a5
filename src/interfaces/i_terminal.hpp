#pragma once

#include "../tui/frame.hpp"
#include <functional>

namespace panedash {

class ITerminal {
public:
    virtual ~ITerminal() = default;

    // Calls `render` once with a frame covering the whole screen, then
    // writes the frame out. Throws TerminalError on backend failure.
    virtual void draw(const std::function<void(Frame&)>& render) = 0;
};

} // namespace panedash
