/**
 * Ultra64 emulator core
 *
 * RDP Command Processor Unit Tests
 * Command pairing, triangle accounting and the test-pattern frame
 */

#include <gtest/gtest.h>
#include "rdp/RDP.hpp"

#include <initializer_list>

namespace {

constexpr u32 command(u32 type) noexcept { return (type & 0x3Fu) << 24; }

} // namespace

//=============================================================================
// Command pairing
//=============================================================================

TEST(RDPTest, TrianglePairCountsOnce) {
    RDP rdp;
    rdp.submit(command(0x08));
    EXPECT_EQ(rdp.triangles(), 0u);
    EXPECT_EQ(rdp.pending(), 1u);

    rdp.submit(0x0000'0000u);
    EXPECT_EQ(rdp.triangles(), 1u);
    EXPECT_EQ(rdp.pending(), 0u);
}

TEST(RDPTest, WholeTriangleRangeCounts) {
    RDP rdp;
    for (u32 type = RDP::kTriangleFirst; type <= RDP::kTriangleLast; ++type) {
        rdp.submit(command(type));
        rdp.submit(0u);
    }
    EXPECT_EQ(rdp.triangles(), 8u);
}

TEST(RDPTest, NonTriangleCommandsAreDropped) {
    RDP rdp;
    for (u32 type : { 0x00u, 0x07u, 0x10u, 0x24u, 0x3Fu }) {
        rdp.submit(command(type));
        rdp.submit(command(0x08));   // low word is never inspected
        EXPECT_EQ(rdp.pending(), 0u);
    }
    EXPECT_EQ(rdp.triangles(), 0u);
}

TEST(RDPTest, TopBitsOfHighWordAreIgnored) {
    RDP rdp;
    // Bits [31:30] set, type field 0x0A.
    rdp.submit(0xC000'0000u | command(0x0A));
    rdp.submit(0u);
    EXPECT_EQ(rdp.triangles(), 1u);
    EXPECT_EQ(RDP::command_type(0xCA00'0000u), 0x0Au);
}

TEST(RDPTest, QueueNeverHoldsMoreThanOneWord) {
    RDP rdp;
    for (u32 i = 0; i < 101u; ++i) {
        rdp.submit(i << 24);
        EXPECT_LE(rdp.pending(), 1u);
    }
    EXPECT_EQ(rdp.pending(), 1u);
}

TEST(RDPTest, ResetClearsQueueAndCounter) {
    RDP rdp;
    rdp.submit(command(0x08));
    rdp.submit(0u);
    rdp.submit(command(0x08));
    rdp.reset();

    EXPECT_EQ(rdp.triangles(), 0u);
    EXPECT_EQ(rdp.pending(), 0u);
}

//=============================================================================
// Frame
//=============================================================================

TEST(RDPTest, FrameDimensions) {
    const Frame f = RDP{}.render_frame();
    EXPECT_EQ(f.width, 320u);
    EXPECT_EQ(f.height, 240u);
    EXPECT_EQ(f.pixels.size(), 320u * 240u);
}

TEST(RDPTest, FrameGradient) {
    const Frame f = RDP{}.render_frame();

    EXPECT_EQ(f.at(0, 0), 0x000000u);
    // x=319: R = 319*255/320 = 254, B = 319*255/560 = 145
    EXPECT_EQ(f.at(319, 0), (254u << 16) | 145u);
    // y=239: G = 239*255/240 = 253, B = 239*255/560 = 108
    EXPECT_EQ(f.at(0, 239), (253u << 8) | 108u);
    // x=160, y=120: R = 127, G = 127, B = 280*255/560 = 127
    EXPECT_EQ(f.at(160, 120), 0x7F7F7Fu);
}

TEST(RDPTest, FrameIsRepeatable) {
    RDP rdp;
    const Frame a = rdp.render_frame();
    const Frame b = rdp.render_frame();
    EXPECT_EQ(a.pixels, b.pixels);
}

TEST(RDPTest, FrameIgnoresSubmittedCommands) {
    RDP rdp;
    const Frame before = rdp.render_frame();
    rdp.submit(command(0x08));
    rdp.submit(0u);
    EXPECT_EQ(rdp.render_frame().pixels, before.pixels);
}
