// include/instruction.hpp
#pragma once
#include <cstdint>
#include <string>

// CHIP-8 instructions are 16 bits, stored big-endian.
//
//   nnn - lowest 12 bits (address)
//   n   - lowest 4 bits
//   x   - low nibble of the high byte
//   y   - high nibble of the low byte
//   kk  - lowest 8 bits
enum class Op : uint8_t {
    Sys,     // 0nnn  machine-language call (not executable)
    Cls,     // 00E0
    Ret,     // 00EE
    Jp,      // 1nnn
    Call,    // 2nnn
    SeImm,   // 3xkk
    SneImm,  // 4xkk
    SeReg,   // 5xy0
    LdImm,   // 6xkk
    AddImm,  // 7xkk
    LdReg,   // 8xy0
    Or,      // 8xy1
    And,     // 8xy2
    Xor,     // 8xy3
    AddReg,  // 8xy4
    Sub,     // 8xy5
    Shr,     // 8xy6
    Subn,    // 8xy7
    Shl,     // 8xyE
    SneReg,  // 9xy0
    LdI,     // Annn
    JpV0,    // Bnnn
    Rnd,     // Cxkk
    Drw,     // Dxyn
    Skp,     // Ex9E
    Sknp,    // ExA1
    LdVxDt,  // Fx07
    LdVxK,   // Fx0A
    LdDtVx,  // Fx15
    LdStVx,  // Fx18
    AddIVx,  // Fx1E
    LdFVx,   // Fx29
    LdBVx,   // Fx33
    LdIVx,   // Fx55
    LdVxI,   // Fx65
    Unknown,
};

struct Instruction {
    Op       op{Op::Unknown};
    uint16_t word{0};
    uint8_t  x{0}, y{0}, n{0}, kk{0};
    uint16_t nnn{0};
};

Instruction decode(uint16_t word);

const char* op_name(Op op);

// Conventional mnemonic, e.g. "LD V1, $2A" or "DRW V0, V1, 5".
std::string disassemble(const Instruction& in);
