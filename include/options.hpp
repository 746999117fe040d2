// include/options.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "config.hpp"
#include "cpu.hpp"

// Command-line options shared by the CLI and the GUI.
struct Options {
    std::string rom_path;                           // empty: built-in demo
    bool        hex{false};                         // ROM is a text hex dump
    uint32_t    instructions_per_frame{cfg::kInstructionsPerFrame};
    Quirks      quirks;
    int         scale{cfg::kDisplayScale};
    size_t      trace_limit{cfg::kTraceLimit};
    bool        help{false};
};

// Returns false (after a tagged message on stderr) on a malformed command line.
bool parse_options(int argc, char** argv, Options& out);

// "shift", "jump" or "loadstore"; toggles the named quirk on.
bool enable_quirk(const std::string& name, Quirks& q);

// Reads opts.rom_path (or the demo) into bytes.
bool read_rom(const Options& opts, std::vector<uint8_t>& bytes);

// Clamp an instructions-per-frame request into [1, cfg::kMaxInstructionsPerFrame].
uint32_t clamp_ipf(long requested);

// Whole-token hex number no larger than `max`; false on junk or overflow.
bool parse_hex_value(const std::string& text, unsigned long max, unsigned long& out);

// ASCII lowercase; bytes outside ASCII pass through unchanged.
std::string lowercase(std::string s);

const char* usage_text();
