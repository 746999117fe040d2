// include/trace.hpp
#pragma once
#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "instruction.hpp"

// Explicit run state: Fx0A parks the CPU in WaitKey instead of blocking.
enum class RunState { Running, WaitKey, Halted };

enum class BusDir { Read, Write };

struct BusEvent {
    uint64_t cycle;        // instruction number
    BusDir dir;            // memory direction
    uint16_t address;      // memory address
    uint8_t data;          // byte transferred
    std::string note;      // e.g., "opcode hi", "sprite row", "bcd tens"
};

struct TraceFrame {
    // Snapshot after each executed instruction
    uint64_t cycle;
    uint16_t pc;                  // PC at fetch
    uint16_t opcode;              // fetched word
    Op op;
    uint16_t i;
    uint8_t sp;
    std::array<uint8_t, 16> v;
    RunState state;
    std::vector<BusEvent> events; // memory traffic of this instruction
};

const char* run_state_name(RunState s);
