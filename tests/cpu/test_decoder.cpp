/**
 * Ultra64 emulator core
 *
 * Instruction Decoder Unit Tests
 */

#include <gtest/gtest.h>
#include "cpu/Instruction.hpp"
#include "Encode.hpp"

//=============================================================================
// Field extraction
//=============================================================================

TEST(DecoderTest, FieldExtraction) {
    const Instruction i{enc::r_type(Funct::SLT, 7, 9, 11)};
    EXPECT_EQ(i.opcode(), 0u);
    EXPECT_EQ(i.rs(), 7u);
    EXPECT_EQ(i.rt(), 9u);
    EXPECT_EQ(i.rd(), 11u);
    EXPECT_EQ(i.funct(), Funct::SLT);
}

TEST(DecoderTest, ImmediateExtension) {
    const Instruction i{enc::addi(1, 2, 0x8001)};
    EXPECT_EQ(i.uimm16(), 0x8001u);
    EXPECT_EQ(i.simm16(), -32767);
}

//=============================================================================
// Families
//=============================================================================

TEST(DecoderTest, RFamily) {
    EXPECT_EQ(decode(enc::add(1, 2, 3)).mnemonic,  Mnemonic::ADD);
    EXPECT_EQ(decode(enc::and_(1, 2, 3)).mnemonic, Mnemonic::AND);
    EXPECT_EQ(decode(enc::or_(1, 2, 3)).mnemonic,  Mnemonic::OR);
    EXPECT_EQ(decode(enc::slt(1, 2, 3)).mnemonic,  Mnemonic::SLT);
    EXPECT_EQ(decode(enc::add(1, 2, 3)).format,    Format::R);
}

TEST(DecoderTest, IFamily) {
    EXPECT_EQ(decode(enc::addi(1, 2, 3)).mnemonic, Mnemonic::ADDI);
    EXPECT_EQ(decode(enc::andi(1, 2, 3)).mnemonic, Mnemonic::ANDI);
    EXPECT_EQ(decode(enc::ori(1, 2, 3)).mnemonic,  Mnemonic::ORI);
    EXPECT_EQ(decode(enc::lw(1, 2, 3)).mnemonic,   Mnemonic::LW);
    EXPECT_EQ(decode(enc::lw(1, 2, 3)).format,     Format::I);
}

TEST(DecoderTest, JFamily) {
    EXPECT_EQ(decode(enc::j(0x10)).mnemonic,   Mnemonic::J);
    EXPECT_EQ(decode(enc::jal(0x10)).mnemonic, Mnemonic::JAL);
    EXPECT_EQ(decode(enc::jal(0x10)).format,   Format::J);
}

//=============================================================================
// Unrecognized words
//=============================================================================

TEST(DecoderTest, ZeroWordIsUnrecognized) {
    const Decoded d = decode(0u);
    EXPECT_EQ(d.format, Format::R);
    EXPECT_FALSE(d.recognized());
}

TEST(DecoderTest, UnknownFunctIsUnrecognized) {
    // SUB (funct 0x22) is not part of the implemented subset.
    EXPECT_FALSE(decode(enc::r_type(0x22, 1, 2, 3)).recognized());
}

TEST(DecoderTest, UnknownOpcodeFallsIntoIFamily) {
    // BEQ (0x04) and SW (0x2B) are not implemented.
    const Decoded beq = decode(enc::i_type(0x04, 1, 2, 3));
    EXPECT_EQ(beq.format, Format::I);
    EXPECT_FALSE(beq.recognized());
    EXPECT_FALSE(decode(enc::i_type(0x2B, 1, 2, 3)).recognized());
    EXPECT_FALSE(decode(0xFFFF'FFFFu).recognized());
}

TEST(DecoderTest, MnemonicNames) {
    EXPECT_EQ(to_string(Mnemonic::ADDI), "addi");
    EXPECT_EQ(to_string(Mnemonic::JAL), "jal");
    EXPECT_EQ(to_string(Mnemonic::Unrecognized), "???");
}
