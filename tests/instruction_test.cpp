#include <gtest/gtest.h>

#include <cstdint>

#include "instruction.hpp"

TEST(Decode, ExtractsOperandFields) {
    Instruction in = decode(0xD12F);
    EXPECT_EQ(in.op, Op::Drw);
    EXPECT_EQ(in.word, 0xD12F);
    EXPECT_EQ(in.x, 0x1);
    EXPECT_EQ(in.y, 0x2);
    EXPECT_EQ(in.n, 0xF);
    EXPECT_EQ(in.kk, 0x2F);
    EXPECT_EQ(in.nnn, 0x12F);
}

TEST(Decode, ClassifiesEveryForm) {
    struct Case { uint16_t word; Op op; };
    const Case cases[] = {
        {0x00E0, Op::Cls},    {0x00EE, Op::Ret},    {0x0123, Op::Sys},
        {0x1234, Op::Jp},     {0x2345, Op::Call},   {0x3A12, Op::SeImm},
        {0x4A12, Op::SneImm}, {0x5AB0, Op::SeReg},  {0x6A12, Op::LdImm},
        {0x7A12, Op::AddImm}, {0x8AB0, Op::LdReg},  {0x8AB1, Op::Or},
        {0x8AB2, Op::And},    {0x8AB3, Op::Xor},    {0x8AB4, Op::AddReg},
        {0x8AB5, Op::Sub},    {0x8AB6, Op::Shr},    {0x8AB7, Op::Subn},
        {0x8ABE, Op::Shl},    {0x9AB0, Op::SneReg}, {0xA123, Op::LdI},
        {0xB123, Op::JpV0},   {0xCA12, Op::Rnd},    {0xDAB5, Op::Drw},
        {0xEA9E, Op::Skp},    {0xEAA1, Op::Sknp},   {0xFA07, Op::LdVxDt},
        {0xFA0A, Op::LdVxK},  {0xFA15, Op::LdDtVx}, {0xFA18, Op::LdStVx},
        {0xFA1E, Op::AddIVx}, {0xFA29, Op::LdFVx},  {0xFA33, Op::LdBVx},
        {0xFA55, Op::LdIVx},  {0xFA65, Op::LdVxI},
    };
    for (const Case& c : cases)
        EXPECT_EQ(decode(c.word).op, c.op) << std::hex << c.word;
}

TEST(Decode, RejectsUnassignedEncodings) {
    const uint16_t words[] = {0x5AB1, 0x9AB1, 0x8AB8, 0x8ABF, 0xE000, 0xEA9F, 0xF000, 0xFA56, 0xFFFF};
    for (uint16_t w : words)
        EXPECT_EQ(decode(w).op, Op::Unknown) << std::hex << w;
}

TEST(Decode, SysIsDistinctFromClsAndRet) {
    EXPECT_EQ(decode(0x0000).op, Op::Sys);
    EXPECT_EQ(decode(0x00E1).op, Op::Sys);
    EXPECT_EQ(decode(0x00EF).op, Op::Sys);
}

TEST(Disassemble, ConventionalMnemonics) {
    EXPECT_EQ(disassemble(decode(0x00E0)), "CLS");
    EXPECT_EQ(disassemble(decode(0x00EE)), "RET");
    EXPECT_EQ(disassemble(decode(0x0123)), "SYS $123");
    EXPECT_EQ(disassemble(decode(0x1300)), "JP $300");
    EXPECT_EQ(disassemble(decode(0x2ABC)), "CALL $ABC");
    EXPECT_EQ(disassemble(decode(0x6A2A)), "LD VA, $2A");
    EXPECT_EQ(disassemble(decode(0x7105)), "ADD V1, $05");
    EXPECT_EQ(disassemble(decode(0x8124)), "ADD V1, V2");
    EXPECT_EQ(disassemble(decode(0x8F0E)), "SHL VF, V0");
    EXPECT_EQ(disassemble(decode(0xA22A)), "LD I, $22A");
    EXPECT_EQ(disassemble(decode(0xB300)), "JP V0, $300");
    EXPECT_EQ(disassemble(decode(0xC3FF)), "RND V3, $FF");
    EXPECT_EQ(disassemble(decode(0xD015)), "DRW V0, V1, 5");
    EXPECT_EQ(disassemble(decode(0xE49E)), "SKP V4");
    EXPECT_EQ(disassemble(decode(0xE4A1)), "SKNP V4");
    EXPECT_EQ(disassemble(decode(0xF207)), "LD V2, DT");
    EXPECT_EQ(disassemble(decode(0xF20A)), "LD V2, K");
    EXPECT_EQ(disassemble(decode(0xF215)), "LD DT, V2");
    EXPECT_EQ(disassemble(decode(0xF218)), "LD ST, V2");
    EXPECT_EQ(disassemble(decode(0xF21E)), "ADD I, V2");
    EXPECT_EQ(disassemble(decode(0xF229)), "LD F, V2");
    EXPECT_EQ(disassemble(decode(0xF233)), "LD B, V2");
    EXPECT_EQ(disassemble(decode(0xF255)), "LD [I], V2");
    EXPECT_EQ(disassemble(decode(0xF265)), "LD V2, [I]");
}

TEST(Disassemble, UnknownWordsAreShownAsData) {
    EXPECT_EQ(disassemble(decode(0xFFFF)), ".DW $FFFF");
    EXPECT_EQ(disassemble(decode(0x5121)), ".DW $5121");
}

TEST(OpName, SharedMnemonics) {
    EXPECT_STREQ(op_name(Op::SeImm), "SE");
    EXPECT_STREQ(op_name(Op::SeReg), "SE");
    EXPECT_STREQ(op_name(Op::LdVxI), "LD");
    EXPECT_STREQ(op_name(Op::Unknown), ".DW");
}
