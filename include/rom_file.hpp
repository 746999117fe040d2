// include/rom_file.hpp
#pragma once
#include <cstdint>
#include <string>
#include <vector>

// Raw .ch8 image.
bool read_file_binary(const std::string& path, std::vector<uint8_t>& out);

// Text file of hex bytes separated by spaces/newlines, e.g.:
//   A2 2A  ; LD I, $22A
//   0xD0,0x05
bool read_file_hexbytes(const std::string& path, std::vector<uint8_t>& out);

// Same parser over an in-memory string; `origin` names the source in log lines.
bool parse_hexbytes(const std::string& text, std::vector<uint8_t>& out, const std::string& origin = "<text>");

std::vector<uint8_t> demo_program();
