/**
 * Ultra64 emulator core
 *
 * RSP Unit Tests
 */

#include <gtest/gtest.h>
#include "rsp/RSP.hpp"

#include <vector>

TEST(RSPTest, SamplesAreAttenuated) {
    const RSP rsp;
    const std::vector<float> in = { 1.0f, -0.5f, 0.0f, 0.25f };

    const auto out = rsp.process_samples(in);
    ASSERT_EQ(out.size(), in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        EXPECT_FLOAT_EQ(out[i], in[i] * 0.8f);
    }
}

TEST(RSPTest, EmptySampleBlock) {
    const RSP rsp;
    EXPECT_TRUE(rsp.process_samples({}).empty());
}

TEST(RSPTest, ProcessingLeavesStateAlone) {
    RSP rsp;
    rsp.dmem()[0] = 0x42u;
    const std::vector<float> in(256, 0.5f);

    (void)rsp.process_samples(in);
    EXPECT_EQ(rsp.dmem()[0], 0x42u);
    EXPECT_EQ(rsp.pc(), 0u);
    EXPECT_EQ(rsp.status(), 0u);
}

TEST(RSPTest, DisplayListCountIsLength) {
    const RSP rsp;
    const std::vector<u8> list(37, 0xFFu);
    EXPECT_EQ(rsp.run_display_list(list), 37u);
    EXPECT_EQ(rsp.run_display_list({}), 0u);
}

TEST(RSPTest, ScratchMemorySizes) {
    RSP rsp;
    EXPECT_EQ(rsp.imem().size(), 4096u);
    EXPECT_EQ(rsp.dmem().size(), 4096u);
}

TEST(RSPTest, ResetClearsScratch) {
    RSP rsp;
    rsp.imem()[10] = 1u;
    rsp.dmem()[20] = 2u;
    rsp.reset();
    EXPECT_EQ(rsp.imem()[10], 0u);
    EXPECT_EQ(rsp.dmem()[20], 0u);
}
