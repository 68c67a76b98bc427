#include "CPU.hpp"
#include "mem/Rdram.hpp"

#include <cstdio>

CPU::CPU(CpuConfig config) noexcept : config_(config) {}

void CPU::reset() noexcept {
    gpr_.fill(0u);
    cop0_.fill(0u);
    pc_         = N64::RESET_VECTOR;
    next_pc_    = 0u;
    hi_         = 0u;
    lo_         = 0u;
    ll_bit_     = false;
    state_      = CpuState::Halted;
    fault_      = CpuFault::None;
    fault_addr_ = 0u;
    retired_    = 0u;
}

void CPU::raise(CpuFault f, u32 addr) noexcept {
    fault_      = f;
    fault_addr_ = addr;
    state_      = CpuState::Halted;
    std::fprintf(stderr, "[CPU] %s fault at 0x%08X (pc=0x%08X)\n",
                 f == CpuFault::FetchAddress ? "fetch" : "load", addr, pc_);
}

// ── step() ────────────────────────────────────────────────────────────────────
// fetch → decode → execute → retire.  The pending target set by J/JAL is
// consumed here on the same step, so the instruction at the target is the
// next one to run (no delay slot).
bool CPU::step(const Rdram& mem) noexcept {
    if (state_ != CpuState::Running) return true;

    if (config_.strict_addressing && !mem.contains(pc_)) {
        raise(CpuFault::FetchAddress, pc_);
        return false;
    }

    // An unmapped pc reads as 0x00000000, which decodes as SPECIAL/SLL —
    // unrecognized here, so the CPU just walks forward.
    const Decoded d = decode(mem.read_word(pc_));

    if (!execute(d, mem)) return false;
    ++retired_;

    if (next_pc_ != 0u) {
        pc_      = next_pc_;
        next_pc_ = 0u;
    } else {
        pc_ += 4u;
    }
    return true;
}

bool CPU::execute(const Decoded& d, const Rdram& mem) noexcept {
    if (!d.recognized()) return true;

    switch (d.format) {
    case Format::R: op_special(d);             return true;
    case Format::I: return op_immediate(d, mem);
    case Format::J: op_jump(d);                return true;
    }
    return true;
}

// ── R-family ──────────────────────────────────────────────────────────────────
// ADD never traps on overflow here; the sum simply wraps.
void CPU::op_special(const Decoded& d) noexcept {
    const Instruction i = d.instr;
    const u32 a = reg(i.rs());
    const u32 b = reg(i.rt());

    switch (d.mnemonic) {
    case Mnemonic::ADD: set_reg(i.rd(), a + b); break;
    case Mnemonic::AND: set_reg(i.rd(), a & b); break;
    case Mnemonic::OR:  set_reg(i.rd(), a | b); break;
    case Mnemonic::SLT:
        set_reg(i.rd(), static_cast<s32>(a) < static_cast<s32>(b) ? 1u : 0u);
        break;
    default: break;
    }
}

// ── I-family ──────────────────────────────────────────────────────────────────
bool CPU::op_immediate(const Decoded& d, const Rdram& mem) noexcept {
    const Instruction i = d.instr;
    const u32 base = reg(i.rs());
    const u32 simm = static_cast<u32>(i.simm16());

    // ANDI/ORI take the sign-extended immediate unless the corrected mode asks
    // for zero extension.
    const u32 limm = config_.zero_extend_logical_imm ? i.uimm16() : simm;

    switch (d.mnemonic) {
    case Mnemonic::ADDI: set_reg(i.rt(), base + simm); break;
    case Mnemonic::ANDI: set_reg(i.rt(), base & limm); break;
    case Mnemonic::ORI:  set_reg(i.rt(), base | limm); break;

    case Mnemonic::LW: {
        // An unmapped address leaves rt untouched (no zero fill).
        const u32 addr = base + simm;
        if (mem.contains(addr)) {
            set_reg(i.rt(), mem.read_word(addr));
        } else if (config_.strict_addressing) {
            raise(CpuFault::LoadAddress, addr);
            return false;
        }
        break;
    }
    default: break;
    }
    return true;
}

// ── J-family ──────────────────────────────────────────────────────────────────
// Target = PC[31:28] of the jump itself | target26 << 2.
void CPU::op_jump(const Decoded& d) noexcept {
    const u32 target = (pc_ & 0xF000'0000u) | (d.instr.target26() << 2u);

    if (d.mnemonic == Mnemonic::JAL) {
        set_reg(31u, pc_ + 8u);
    }
    next_pc_ = target;
}
