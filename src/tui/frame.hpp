#pragma once

#include "buffer.hpp"

namespace panedash {

// One frame's drawing context: the canvas rect and the buffer behind it
class Frame {
public:
    explicit Frame(Buffer& buffer) : buffer_(buffer) {}

    [[nodiscard]] Rect area() const { return buffer_.area(); }
    [[nodiscard]] Buffer& buffer() { return buffer_; }

    // Anything with `void render(const Rect&, Buffer&) const`
    template <typename Widget>
    void render_widget(const Widget& widget, const Rect& area) {
        widget.render(area, buffer_);
    }

private:
    Buffer& buffer_;
};

} // namespace panedash
