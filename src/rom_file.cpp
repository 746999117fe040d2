#include "rom_file.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>

bool read_file_binary(const std::string& path, std::vector<uint8_t>& out) {
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        std::cerr << "[loadbin] cannot open '" << path << "'\n";
        return false;
    }
    out.clear();
    char chunk[4096];
    while (f.read(chunk, sizeof(chunk)) || f.gcount() > 0) {
        out.insert(out.end(), chunk, chunk + f.gcount());
        if (!f) break;
    }
    if (f.bad()) {
        std::cerr << "[loadbin] read error on '" << path << "'\n";
        out.clear();
        return false;
    }
    return true;
}

bool read_file_hexbytes(const std::string& path, std::vector<uint8_t>& out) {
    std::ifstream f(path);
    if (!f) {
        std::cerr << "[loadhex] cannot open '" << path << "'\n";
        return false;
    }
    std::ostringstream text;
    text << f.rdbuf();
    return parse_hexbytes(text.str(), out, path);
}

bool parse_hexbytes(const std::string& text, std::vector<uint8_t>& out, const std::string& origin) {
    out.clear();
    std::istringstream in(text);
    std::string line;
    size_t lineno = 0;
    auto is_hex = [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
    };

    while (std::getline(in, line)) {
        ++lineno;
        // strip comment markers: # ... ; ... // ...
        auto cut = line.find_first_of("#;");
        if (cut != std::string::npos) line.resize(cut);
        cut = line.find("//");
        if (cut != std::string::npos) line.resize(cut);
        // commas separate as well as whitespace
        std::replace(line.begin(), line.end(), ',', ' ');

        std::istringstream iss(line);
        std::string tok;
        while (iss >> tok) {
            tok.erase(std::remove(tok.begin(), tok.end(), '_'), tok.end());
            if (tok.size() > 2 && tok[0] == '0' && (tok[1] == 'x' || tok[1] == 'X')) {
                tok = tok.substr(2);
            }
            if (tok.empty()) continue;

            if (!std::all_of(tok.begin(), tok.end(), is_hex)) {
                std::cerr << "[loadhex] non-hex token '" << tok
                          << "' at " << origin << ":" << lineno << "\n";
                return false;
            }
            // "A22A" style words are accepted as two bytes, big-endian
            if (tok.size() > 2 && tok.size() % 2 == 0) {
                for (size_t i = 0; i < tok.size(); i += 2)
                    out.push_back(static_cast<uint8_t>(std::stoul(tok.substr(i, 2), nullptr, 16)));
                continue;
            }
            if (tok.size() > 2) {
                std::cerr << "[loadhex] byte out of range '" << tok
                          << "' at " << origin << ":" << lineno << "\n";
                return false;
            }
            out.push_back(static_cast<uint8_t>(std::stoul(tok, nullptr, 16)));
        }
    }
    if (out.empty()) {
        std::cerr << "[loadhex] no bytes read from " << origin << "\n";
        return false;
    }
    return true;
}
