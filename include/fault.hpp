// include/fault.hpp
#pragma once
#include <cstdint>
#include <ostream>
#include <string>

enum class Fault : uint8_t {
    None,
    // ROM image does not fit between 0x200 and 0xFFF
    RomTooLarge,
    // fetched word is not a CHIP-8 instruction (or is 0nnn SYS)
    UnknownInstruction,
    // CALL with all 16 return slots in use
    StackOverflow,
    // RET with an empty call stack
    StackUnderflow,
};

struct FaultInfo {
    Fault    kind{Fault::None};
    uint16_t word{0};       // instruction word that faulted
    uint16_t address{0};    // PC at fetch

    explicit operator bool() const { return kind != Fault::None; }
};

const char* fault_name(Fault f);
std::string describe(const FaultInfo& f);
std::ostream& operator<<(std::ostream& os, Fault f);
