#pragma once

#include <vector>
#include "common/Types.hpp"

// ── Frame ─────────────────────────────────────────────────────────────────────
// One rendered picture, row-major, 0x00RRGGBB per pixel.
struct Frame {
    std::vector<u32> pixels;
    u32 width  = 0;
    u32 height = 0;

    [[nodiscard]] u32 at(u32 x, u32 y) const noexcept { return pixels[y * width + x]; }
};

// ── RDP (display-list command processor) ──────────────────────────────────────
// Commands arrive as 64-bit pairs, high word first.  The command type sits in
// bits [29:24] of the high word; types 0x08–0x0F are the triangle family and
// are counted.  The queue is dropped after every pair, matched or not, so it
// never holds more than one word between calls.
//
// Rasterization is not modelled: render_frame() returns a fixed test pattern
// regardless of what was submitted.
class RDP {
public:
    static constexpr u32 kTriangleFirst = 0x08u;
    static constexpr u32 kTriangleLast  = 0x0Fu;

    void submit(u32 word);

    [[nodiscard]] u64         triangles() const noexcept { return triangles_; }
    [[nodiscard]] std::size_t pending()   const noexcept { return queue_.size(); }

    void reset() noexcept;

    // 320×240 gradient: R follows x, G follows y, B follows x + y.
    [[nodiscard]] Frame render_frame() const;

    [[nodiscard]] static constexpr u32 command_type(u32 high) noexcept {
        return (high >> 24u) & 0x3Fu;
    }

private:
    void execute(u32 high, u32 low) noexcept;

    std::vector<u32> queue_;
    u64 triangles_ = 0;
};
