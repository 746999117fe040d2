#include "options.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

#include "rom_file.hpp"

static bool parse_number(const std::string& s, long& out) {
    if (s.empty()) return false;
    size_t used = 0;
    try { out = std::stol(s, &used, 0); }
    catch (const std::exception&) { return false; }
    return used == s.size();
}

bool enable_quirk(const std::string& name, Quirks& q) {
    if (name == "shift")     { q.shift_uses_vy = true; return true; }
    if (name == "jump")      { q.jump_uses_vx = true; return true; }
    if (name == "loadstore") { q.load_store_increments_i = true; return true; }
    return false;
}

bool parse_options(int argc, char** argv, Options& out) {
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto value = [&](const char* flag, std::string& v) {
            if (i + 1 >= argc) {
                std::cerr << "[args] " << flag << " requires a value\n";
                return false;
            }
            v = argv[++i];
            return true;
        };

        if (a == "-h" || a == "--help") {
            out.help = true;
        } else if (a == "--hex") {
            out.hex = true;
        } else if (a == "--ipf" || a == "--scale" || a == "--trace") {
            std::string v; long n = 0;
            if (!value(a.c_str(), v)) return false;
            if (!parse_number(v, n) || n < 0 || (n == 0 && a != "--trace") ||
                (a == "--ipf" && n > static_cast<long>(cfg::kMaxInstructionsPerFrame))) {
                std::cerr << "[args] bad value '" << v << "' for " << a << "\n";
                return false;
            }
            if (a == "--ipf")        out.instructions_per_frame = static_cast<uint32_t>(n);
            else if (a == "--scale") out.scale = static_cast<int>(n);
            else                     out.trace_limit = static_cast<size_t>(n);
        } else if (a == "--quirk") {
            std::string v;
            if (!value("--quirk", v)) return false;
            if (!enable_quirk(v, out.quirks)) {
                std::cerr << "[args] unknown quirk '" << v << "' (shift, jump, loadstore)\n";
                return false;
            }
        } else if (!a.empty() && a[0] == '-') {
            std::cerr << "[args] unknown option '" << a << "'\n";
            return false;
        } else {
            out.rom_path = a;
        }
    }
    return true;
}

uint32_t clamp_ipf(long requested) {
    if (requested < 1) return 1;
    if (requested > static_cast<long>(cfg::kMaxInstructionsPerFrame)) return cfg::kMaxInstructionsPerFrame;
    return static_cast<uint32_t>(requested);
}

bool parse_hex_value(const std::string& text, unsigned long max, unsigned long& out) {
    if (text.empty() || !std::isxdigit(static_cast<unsigned char>(text[0]))) return false;
    size_t used = 0;
    unsigned long v = 0;
    try { v = std::stoul(text, &used, 16); }
    catch (const std::exception&) { return false; }
    if (used != text.size() || v > max) return false;
    out = v;
    return true;
}

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return c < 0x80 ? static_cast<char>(std::tolower(c)) : static_cast<char>(c);
    });
    return s;
}

bool read_rom(const Options& opts, std::vector<uint8_t>& bytes) {
    if (opts.rom_path.empty()) {
        bytes = demo_program();
        return true;
    }
    return opts.hex ? read_file_hexbytes(opts.rom_path, bytes)
                    : read_file_binary(opts.rom_path, bytes);
}

const char* usage_text() {
    return
R"(usage: chip8vm_cli|chip8vm_gui [options] [ROM]
  ROM               .ch8 image (or hex text with --hex); built-in demo if omitted
  --hex             ROM file is whitespace-separated hex bytes
  --ipf N           instructions per 60 Hz frame (default 10, at most 10000)
  --quirk NAME      shift | jump | loadstore (repeatable)
  --scale N         pixel scale for the GUI display (default 10)
  --trace N         timeline ring size, 0 disables (default 4096)
)";
}
