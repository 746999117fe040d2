// include/config.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <iostream> // logs

namespace cfg {
    // --- Timing ---
    inline constexpr std::uint32_t kInstructionsPerFrame = 10;  // ~600 instr/s at 60 Hz
    inline constexpr std::uint32_t kFrameHz              = 60;
    inline constexpr int           kMaxCatchUpFrames     = 5;   // frames run at once after a stall
    inline constexpr std::uint32_t kMaxInstructionsPerFrame = 10000; // keeps one tick well under a frame

    // --- Frontends ---
    inline constexpr int         kDisplayScale = 10;
    inline constexpr std::size_t kTraceLimit   = 4096;          // 0 disables the timeline

    // --- Audio ---
    inline constexpr int kToneHz      = 440;
    inline constexpr int kSampleRate  = 44100;
    inline constexpr int kToneVolume  = 3000;

    // --- Quick log flags ---
    inline constexpr bool kLogFaults = true;   // fatal faults when the core halts
    inline constexpr bool kLogKeys   = false;  // key-wait resume / keypad edges
    inline constexpr bool kLogLoad   = true;   // ROM loads

    // Simple conditional logging macro
    #define CHIP8_LOG_IF(flag, msg)            \
        do {                                   \
            if (flag) {                        \
                std::cerr << msg << '\n';      \
            }                                  \
        } while (0)
} // namespace cfg
