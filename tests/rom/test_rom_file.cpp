/**
 * Ultra64 emulator core
 *
 * ROM File Loader Unit Tests
 */

#include <gtest/gtest.h>
#include "rom/RomFile.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

class RomFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = fs::temp_directory_path() /
            ("ultra64_rom_" + std::string(::testing::UnitTest::GetInstance()
                                             ->current_test_info()->name()) + ".z64");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    void write(const std::vector<u8>& bytes) {
        std::ofstream out(path_, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
    }

    fs::path path_;
};

TEST_F(RomFileTest, ReadsBytesVerbatim) {
    const std::vector<u8> bytes = { 0x80u, 0x37u, 0x12u, 0x40u, 0x00u, 0xFFu };
    write(bytes);

    const auto rom = RomFile::load(path_);
    ASSERT_TRUE(rom.has_value());
    EXPECT_EQ(*rom, bytes);
}

TEST_F(RomFileTest, EmptyFileGivesEmptyBuffer) {
    write({});

    const auto rom = RomFile::load(path_);
    ASSERT_TRUE(rom.has_value());
    EXPECT_TRUE(rom->empty());
}

TEST_F(RomFileTest, MissingFileGivesNullopt) {
    EXPECT_FALSE(RomFile::load(path_ / "does_not_exist.z64").has_value());
}

TEST_F(RomFileTest, DirectoryGivesNullopt) {
    EXPECT_FALSE(RomFile::load(fs::temp_directory_path()).has_value());
}
