#include "rsp/RSP.hpp"

#include <algorithm>

std::vector<float> RSP::process_samples(std::span<const float> samples) const {
    std::vector<float> out(samples.size());
    std::transform(samples.begin(), samples.end(), out.begin(),
                   [](float s) { return s * kAudioGain; });
    return out;
}

void RSP::reset() noexcept {
    imem_.fill(0);
    dmem_.fill(0);
    pc_     = 0;
    status_ = 0;
}
