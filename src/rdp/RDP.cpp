#include "RDP.hpp"

void RDP::submit(u32 word) {
    queue_.push_back(word);
    if (queue_.size() < 2u) return;

    execute(queue_[0], queue_[1]);
    queue_.clear();
}

void RDP::execute(u32 high, u32 /*low*/) noexcept {
    const u32 type = command_type(high);
    if (type >= kTriangleFirst && type <= kTriangleLast) {
        ++triangles_;
    }
    // Anything else is dropped.
}

void RDP::reset() noexcept {
    queue_.clear();
    triangles_ = 0;
}

Frame RDP::render_frame() const {
    constexpr u32 w = N64::FRAME_WIDTH;
    constexpr u32 h = N64::FRAME_HEIGHT;

    Frame f;
    f.width  = w;
    f.height = h;
    f.pixels.resize(static_cast<std::size_t>(w) * h);

    for (u32 y = 0; y < h; ++y) {
        for (u32 x = 0; x < w; ++x) {
            const u32 r = (x * 255u / w) & 0xFFu;
            const u32 g = (y * 255u / h) & 0xFFu;
            const u32 b = ((x + y) * 255u / (w + h)) & 0xFFu;
            f.pixels[y * w + x] = (r << 16u) | (g << 8u) | b;
        }
    }
    return f;
}
