#include "Rdram.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>

Rdram::Rdram(u32 size) : data_(size, 0u) {}

bool Rdram::contains(u32 vaddr) const noexcept {
    if (vaddr < N64::RDRAM_BASE) return false;
    const u64 off = static_cast<u64>(vaddr) - N64::RDRAM_BASE;
    return (off & 3u) == 0u && off + 4u <= data_.size();
}

// ── Big-endian word access ────────────────────────────────────────────────────
u32 Rdram::read_word(u32 vaddr) const noexcept {
    if (!contains(vaddr)) return 0u;

    const u8* p = data_.data() + (vaddr - N64::RDRAM_BASE);
    return (static_cast<u32>(p[0]) << 24u)
         | (static_cast<u32>(p[1]) << 16u)
         | (static_cast<u32>(p[2]) <<  8u)
         |  static_cast<u32>(p[3]);
}

void Rdram::write_word(u32 vaddr, u32 value) noexcept {
    if (!contains(vaddr)) return;

    u8* p = data_.data() + (vaddr - N64::RDRAM_BASE);
    p[0] = static_cast<u8>(value >> 24u);
    p[1] = static_cast<u8>(value >> 16u);
    p[2] = static_cast<u8>(value >>  8u);
    p[3] = static_cast<u8>(value);
}

// ── Image load ────────────────────────────────────────────────────────────────
Status Rdram::load_image(std::span<const u8> image) noexcept {
    if (image.empty()) {
        std::fprintf(stderr, "[Rdram] refusing to load an empty image\n");
        return Status::ImageTooSmall;
    }

    // An image that is all header leaves RAM untouched but still counts as
    // loaded.
    if (image.size() <= N64::ROM_HEADER_SIZE) {
        std::fprintf(stderr, "[Rdram] image is %zu bytes, nothing past the header\n",
                     image.size());
        return Status::Ok;
    }

    const std::size_t payload = image.size() - N64::ROM_HEADER_SIZE;
    const std::size_t count   = std::min(payload, data_.size());
    std::memcpy(data_.data(), image.data() + N64::ROM_HEADER_SIZE, count);

    std::fprintf(stdout, "[Rdram] loaded %zu of %zu payload bytes\n", count, payload);
    return Status::Ok;
}

std::vector<u8> Rdram::dump(u32 vaddr, u32 len) const {
    if (vaddr < N64::RDRAM_BASE) return {};
    const u64 off = static_cast<u64>(vaddr) - N64::RDRAM_BASE;
    if (off >= data_.size()) return {};

    const u64 end = std::min<u64>(off + len, data_.size());
    return std::vector<u8>(data_.begin() + static_cast<std::ptrdiff_t>(off),
                           data_.begin() + static_cast<std::ptrdiff_t>(end));
}

void Rdram::clear() noexcept {
    std::fill(data_.begin(), data_.end(), u8{0});
}
