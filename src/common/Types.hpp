#pragma once

#include <cstdint>
#include <cstddef>

// ── Scalar type aliases ────────────────────────────────────────────────────────
using u8  = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using s8  = std::int8_t;
using s16 = std::int16_t;
using s32 = std::int32_t;
using s64 = std::int64_t;

// ── N64 memory map and timing constants ───────────────────────────────────────
namespace N64 {

// RDRAM is only reachable through a single direct-mapped window starting at
// KSEG0.  Everything outside [RDRAM_BASE, RDRAM_BASE + size) is unmapped; no
// TLB, no KSEG1 alias, no MMIO.
//
//   0x8000_0000 – 0x803F_FFFF   RDRAM (4 MiB)
//   anything else               unmapped (reads 0, writes ignored)
//
inline constexpr u32 RDRAM_BASE   = 0x8000'0000;
inline constexpr u32 RDRAM_SIZE   = 4u * 1024u * 1024u;    // 4 MiB

// Cartridge images start with a fixed-size header that is not copied into
// RDRAM; the payload lands at RDRAM offset 0.
inline constexpr u32 ROM_HEADER_SIZE = 0x1000u;

// Reset vector: first word of RDRAM (KSEG0).
inline constexpr u32 RESET_VECTOR = RDRAM_BASE;

// ── Coprocessor scratch memory ────────────────────────────────────────────────
inline constexpr u32 RSP_IMEM_SIZE = 0x1000u;              // 4 KiB
inline constexpr u32 RSP_DMEM_SIZE = 0x1000u;              // 4 KiB

// ── Video output ──────────────────────────────────────────────────────────────
inline constexpr u32 FRAME_WIDTH  = 320u;
inline constexpr u32 FRAME_HEIGHT = 240u;

// ── Timing ────────────────────────────────────────────────────────────────────
// One emulated instruction per "cycle"; the effective core clock divided by
// the refresh rate gives the per-frame budget.
inline constexpr u64 CPU_CLOCK_HZ      = 93'750'000u;
inline constexpr u32 REFRESH_HZ        = 60u;
inline constexpr u64 CYCLES_PER_FRAME  = CPU_CLOCK_HZ / REFRESH_HZ;   // 1 562 500
inline constexpr u64 VI_INTERVAL       = 1'562'500u;

} // namespace N64
