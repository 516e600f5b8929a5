#pragma once

#include <stdexcept>
#include <string>

namespace panedash {

// Fatal failure of the terminal backend (setup, drawing or reading input).
// Nothing recovers from it; it unwinds to main.
class TerminalError : public std::runtime_error {
public:
    explicit TerminalError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace panedash
