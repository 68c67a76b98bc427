#pragma once

#include <string_view>
#include "common/Types.hpp"

// ── MIPS R4300 instruction word ───────────────────────────────────────────────
//
// Three encoding formats:
//
//  R-type  [31:26] op=0   [25:21] rs   [20:16] rt   [15:11] rd
//          [10:6]  shamt  [5:0]   funct
//
//  I-type  [31:26] op     [25:21] rs   [20:16] rt   [15:0]  imm16
//
//  J-type  [31:26] op     [25:0]  target26
//
struct Instruction {
    u32 raw;

    // ── Field extractors ──────────────────────────────────────────────────────
    [[nodiscard]] constexpr u32 opcode() const noexcept { return raw >> 26; }
    [[nodiscard]] constexpr u32 rs()     const noexcept { return (raw >> 21) & 0x1Fu; }
    [[nodiscard]] constexpr u32 rt()     const noexcept { return (raw >> 16) & 0x1Fu; }
    [[nodiscard]] constexpr u32 rd()     const noexcept { return (raw >> 11) & 0x1Fu; }
    [[nodiscard]] constexpr u32 shamt()  const noexcept { return (raw >>  6) & 0x1Fu; }
    [[nodiscard]] constexpr u32 funct()  const noexcept { return raw & 0x3Fu; }

    // Zero-extended 16-bit immediate
    [[nodiscard]] constexpr u32 uimm16() const noexcept { return raw & 0xFFFFu; }

    // Sign-extended 16-bit immediate (cast through s16 preserves sign)
    [[nodiscard]] constexpr s32 simm16() const noexcept {
        return static_cast<s32>(static_cast<s16>(raw & 0xFFFFu));
    }

    // 26-bit jump target (shifted left 2 by the CPU, or'd with PC[31:28])
    [[nodiscard]] constexpr u32 target26() const noexcept { return raw & 0x3FF'FFFFu; }
};

// ── Primary opcodes handled by this core ──────────────────────────────────────
namespace Op {
    inline constexpr u32 SPECIAL = 0x00;  // dispatch on funct
    inline constexpr u32 J       = 0x02;
    inline constexpr u32 JAL     = 0x03;
    inline constexpr u32 ADDI    = 0x08;
    inline constexpr u32 ANDI    = 0x0C;
    inline constexpr u32 ORI     = 0x0D;
    inline constexpr u32 LW      = 0x23;
} // namespace Op

// ── SPECIAL funct codes ───────────────────────────────────────────────────────
namespace Funct {
    inline constexpr u32 ADD     = 0x20;
    inline constexpr u32 AND     = 0x24;
    inline constexpr u32 OR      = 0x25;
    inline constexpr u32 SLT     = 0x2A;
} // namespace Funct

// ── Decode result ─────────────────────────────────────────────────────────────
// Every 32-bit word decodes to exactly one of these.  Anything the core does
// not implement is `Unrecognized` and executes as a no-op, so "do nothing"
// is an explicit outcome of decode() rather than a missing switch case.
enum class Mnemonic : u8 {
    Unrecognized,
    ADD, AND, OR, SLT,          // R-family
    ADDI, ANDI, ORI, LW,        // I-family
    J, JAL,                     // J-family
};

enum class Format : u8 { R, I, J };

struct Decoded {
    Instruction instr;
    Format      format;
    Mnemonic    mnemonic;

    [[nodiscard]] constexpr bool recognized() const noexcept {
        return mnemonic != Mnemonic::Unrecognized;
    }
};

// Opcode 0 → R family (keyed by funct), opcodes 2/3 → J family, every other
// opcode → I family keyed by the opcode itself.
[[nodiscard]] constexpr Decoded decode(u32 word) noexcept {
    const Instruction instr{word};
    const u32 op = instr.opcode();

    if (op == Op::SPECIAL) {
        Mnemonic m = Mnemonic::Unrecognized;
        switch (instr.funct()) {
        case Funct::ADD: m = Mnemonic::ADD; break;
        case Funct::AND: m = Mnemonic::AND; break;
        case Funct::OR:  m = Mnemonic::OR;  break;
        case Funct::SLT: m = Mnemonic::SLT; break;
        default: break;
        }
        return {instr, Format::R, m};
    }

    if (op == Op::J)   return {instr, Format::J, Mnemonic::J};
    if (op == Op::JAL) return {instr, Format::J, Mnemonic::JAL};

    Mnemonic m = Mnemonic::Unrecognized;
    switch (op) {
    case Op::ADDI: m = Mnemonic::ADDI; break;
    case Op::ANDI: m = Mnemonic::ANDI; break;
    case Op::ORI:  m = Mnemonic::ORI;  break;
    case Op::LW:   m = Mnemonic::LW;   break;
    default: break;
    }
    return {instr, Format::I, m};
}

[[nodiscard]] constexpr std::string_view to_string(Mnemonic m) noexcept {
    switch (m) {
    case Mnemonic::ADD:  return "add";
    case Mnemonic::AND:  return "and";
    case Mnemonic::OR:   return "or";
    case Mnemonic::SLT:  return "slt";
    case Mnemonic::ADDI: return "addi";
    case Mnemonic::ANDI: return "andi";
    case Mnemonic::ORI:  return "ori";
    case Mnemonic::LW:   return "lw";
    case Mnemonic::J:    return "j";
    case Mnemonic::JAL:  return "jal";
    case Mnemonic::Unrecognized: break;
    }
    return "???";
}
