/**
 * Ultra64 emulator core
 *
 * Test Suite Entry Point
 */

#include <gtest/gtest.h>

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
