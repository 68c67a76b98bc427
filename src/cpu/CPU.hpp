#pragma once

#include <array>
#include "common/Types.hpp"
#include "cpu/Instruction.hpp"

class Rdram;

// ── Run state ─────────────────────────────────────────────────────────────────
enum class CpuState : u8 { Halted, Running };

// ── Strict-mode faults ────────────────────────────────────────────────────────
// Only raised when CpuConfig::strict_addressing is set.  The default model
// treats an unmapped fetch as a zero word and an unmapped load as a no-op.
enum class CpuFault : u8 {
    None,
    FetchAddress,   // pc outside RDRAM or misaligned
    LoadAddress,    // LW effective address outside RDRAM or misaligned
};

struct CpuConfig {
    // ANDI/ORI zero-extend their immediate, as the hardware does.  Off by
    // default: the immediate is sign-extended for all three of ADDI/ANDI/ORI.
    bool zero_extend_logical_imm = false;

    // Unmapped fetch / load halts the CPU with a CpuFault.
    bool strict_addressing = false;
};

// ── CPU (MIPS R4300, integer subset) ──────────────────────────────────────────
// Implements ADD/AND/OR/SLT, ADDI/ANDI/ORI/LW and J/JAL.  Every other word is
// a no-op.  There is no branch delay slot: a jump takes effect on the very
// next step, unlike the real pipeline.
class CPU {
public:
    explicit CPU(CpuConfig config = {}) noexcept;

    // Back to the power-on layout and Halted.
    void reset() noexcept;

    // Host-requested transition between Halted and Running.
    void set_running(bool running) noexcept {
        state_ = running ? CpuState::Running : CpuState::Halted;
    }

    // Execute one instruction.  A no-op while Halted.  Returns false only when
    // strict addressing raised a fault (the CPU is Halted afterwards).
    bool step(const Rdram& mem) noexcept;

    // ── Inspection (debugger / test harness) ──────────────────────────────────
    [[nodiscard]] u32        reg(u32 idx) const noexcept { return idx == 0u ? 0u : gpr_[idx & 0x1Fu]; }
    [[nodiscard]] u32        pc()         const noexcept { return pc_; }
    [[nodiscard]] u32        next_pc()    const noexcept { return next_pc_; }
    [[nodiscard]] u32        hi()         const noexcept { return hi_; }
    [[nodiscard]] u32        lo()         const noexcept { return lo_; }
    [[nodiscard]] u32        cop0(u32 idx) const noexcept { return cop0_[idx & 0x1Fu]; }
    [[nodiscard]] bool       ll_bit()     const noexcept { return ll_bit_; }
    [[nodiscard]] CpuState   state()      const noexcept { return state_; }
    [[nodiscard]] bool       running()    const noexcept { return state_ == CpuState::Running; }
    [[nodiscard]] CpuFault   fault()      const noexcept { return fault_; }
    [[nodiscard]] u32        fault_addr() const noexcept { return fault_addr_; }
    [[nodiscard]] u64        retired()    const noexcept { return retired_; }
    [[nodiscard]] const CpuConfig& config() const noexcept { return config_; }

    // ── Test / debugger pokes ─────────────────────────────────────────────────
    void set_pc (u32 addr) noexcept { pc_ = addr; next_pc_ = 0u; }
    void set_reg(u32 idx, u32 val) noexcept { if (idx != 0u) gpr_[idx & 0x1Fu] = val; }

private:
    // ── Register file ─────────────────────────────────────────────────────────
    // Storage keeps whatever lands in gpr_[0]; reg()/set_reg() are what make
    // r0 read as zero and drop writes.
    std::array<u32, 32> gpr_{};

    u32  pc_      = N64::RESET_VECTOR;  // current fetch address
    u32  next_pc_ = 0;                  // pending jump target, 0 = none
    u32  hi_      = 0;
    u32  lo_      = 0;

    std::array<u32, 32> cop0_{};
    bool ll_bit_ = false;

    CpuState  state_      = CpuState::Halted;
    CpuFault  fault_      = CpuFault::None;
    u32       fault_addr_ = 0;
    u64       retired_    = 0;

    CpuConfig config_;

    void raise(CpuFault f, u32 addr) noexcept;

    // ── Instruction group handlers ────────────────────────────────────────────
    // Return false when the instruction raised a fault.
    bool execute(const Decoded& d, const Rdram& mem) noexcept;

    void op_special(const Decoded& d) noexcept;
    bool op_immediate(const Decoded& d, const Rdram& mem) noexcept;
    void op_jump(const Decoded& d) noexcept;
};
