#pragma once

#include <span>
#include <vector>
#include "common/Types.hpp"
#include "common/Status.hpp"

// ── RDRAM ─────────────────────────────────────────────────────────────────────
// Flat main memory, sized at construction (4 MiB by default) and reachable
// through one fixed window:
//
//   virtual [RDRAM_BASE, RDRAM_BASE + size)  →  offset (virtual − RDRAM_BASE)
//
// Words are stored big-endian.  A word access is mapped only when the offset
// is 4-byte aligned and the whole word fits; anything else reads as 0 and
// writes are dropped.  Nothing here faults.
class Rdram {
public:
    explicit Rdram(u32 size = N64::RDRAM_SIZE);

    [[nodiscard]] u32 size() const noexcept { return static_cast<u32>(data_.size()); }

    // Bulk access — used by the debugger and the tests.
    [[nodiscard]] std::span<const u8> view() const noexcept { return data_; }
    [[nodiscard]] std::span<u8>       view()       noexcept { return data_; }

    // True when a 32-bit access at `vaddr` is inside the window and aligned.
    [[nodiscard]] bool contains(u32 vaddr) const noexcept;

    // ── CPU interface ─────────────────────────────────────────────────────────
    [[nodiscard]] u32 read_word(u32 vaddr) const noexcept;
    void              write_word(u32 vaddr, u32 value) noexcept;

    // ── Host interface ────────────────────────────────────────────────────────
    // Copy a cartridge image into RDRAM, skipping the ROM header.  The copy
    // starts at offset 0 and is truncated to whichever of the payload and
    // the RAM is shorter.  Fails only on an empty image.
    [[nodiscard]] Status load_image(std::span<const u8> image) noexcept;

    // Bounds-checked copy of [vaddr, vaddr + len).  The result is cut at the
    // end of the window and is empty when `vaddr` itself is unmapped.
    [[nodiscard]] std::vector<u8> dump(u32 vaddr, u32 len) const;

    void clear() noexcept;

private:
    std::vector<u8> data_;
};
