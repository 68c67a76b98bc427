#include "Dump.hpp"
#include "sched/Scheduler.hpp"

#include <format>
#include <iterator>

std::string format_registers(const RegisterSnapshot& regs) {
    std::string out = "R4300 registers:\n\n";
    auto it = std::back_inserter(out);

    for (u32 i = 0; i < 32u; ++i) {
        std::format_to(it, "R{:2}: 0x{:08X}\n", i, regs.gpr[i]);
    }
    std::format_to(it, "\nPC:  0x{:08X}\n", regs.pc);
    std::format_to(it, "HI:  0x{:08X}\n", regs.hi);
    std::format_to(it, "LO:  0x{:08X}\n", regs.lo);
    return out;
}

std::string format_memory(u32 base, std::span<const u8> bytes) {
    constexpr std::size_t kRow = 16u;

    std::string out;
    auto it = std::back_inserter(out);

    for (std::size_t row = 0; row < bytes.size(); row += kRow) {
        std::format_to(it, "{:08X}: ", base + static_cast<u32>(row));

        for (std::size_t col = 0; col < kRow; ++col) {
            if (row + col < bytes.size()) {
                std::format_to(it, "{:02X} ", bytes[row + col]);
            } else {
                out += "   ";
            }
        }
        out += ' ';

        for (std::size_t col = 0; col < kRow && row + col < bytes.size(); ++col) {
            const u8 b = bytes[row + col];
            out += (b >= 0x20u && b <= 0x7Eu) ? static_cast<char>(b) : '.';
        }
        out += '\n';
    }
    return out;
}
