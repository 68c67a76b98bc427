#pragma once

#include <span>
#include <string>
#include "common/Types.hpp"

struct RegisterSnapshot;

// ── Debugger text dumps ───────────────────────────────────────────────────────
// Plain-text views of a register snapshot and a block of memory, for the
// headless runner and the debugger console.

// One line per GPR ("R 0: 0x00000000"), then PC, HI and LO.
[[nodiscard]] std::string format_registers(const RegisterSnapshot& regs);

// 16 bytes per line: address, hex bytes, then printable ASCII ('.' for the
// rest).  A short final line is padded so the ASCII column stays aligned.
[[nodiscard]] std::string format_memory(u32 base, std::span<const u8> bytes);
