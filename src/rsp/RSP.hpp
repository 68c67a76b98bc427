#pragma once

#include <array>
#include <span>
#include <vector>
#include "common/Types.hpp"

// ── RSP (vector / audio processor) ────────────────────────────────────────────
// Only the outside of the unit is modelled: two 4 KiB scratch memories, a
// local pc and a status word.  No microcode runs.  Audio processing is a
// fixed gain; a display list is "processed" by counting its bytes.
class RSP {
public:
    static constexpr float kAudioGain = 0.8f;

    // Scale every sample by kAudioGain.  Pure: order and length are kept and
    // the unit's state is untouched.
    [[nodiscard]] std::vector<float> process_samples(std::span<const float> samples) const;

    // Stand-in primitive count: the length of the list.
    [[nodiscard]] u32 run_display_list(std::span<const u8> display_list) const noexcept {
        return static_cast<u32>(display_list.size());
    }

    void reset() noexcept;

    [[nodiscard]] std::span<const u8> imem() const noexcept { return imem_; }
    [[nodiscard]] std::span<u8>       imem()       noexcept { return imem_; }
    [[nodiscard]] std::span<const u8> dmem() const noexcept { return dmem_; }
    [[nodiscard]] std::span<u8>       dmem()       noexcept { return dmem_; }

    [[nodiscard]] u32 pc()     const noexcept { return pc_; }
    [[nodiscard]] u32 status() const noexcept { return status_; }

private:
    std::array<u8, N64::RSP_IMEM_SIZE> imem_{};
    std::array<u8, N64::RSP_DMEM_SIZE> dmem_{};
    u32 pc_     = 0;
    u32 status_ = 0;
};
