// include/display.hpp
#pragma once
#include <array>
#include <cstddef>
#include <cstdint>

// 64x32 monochrome framebuffer. Coordinates always wrap; nothing is clipped.
struct Display {
    static constexpr int WIDTH  = 64;
    static constexpr int HEIGHT = 32;

    std::array<bool, WIDTH * HEIGHT> pixels{};

    static std::size_t index(int x, int y) {
        x %= WIDTH;  if (x < 0) x += WIDTH;
        y %= HEIGHT; if (y < 0) y += HEIGHT;
        return static_cast<std::size_t>(y) * WIDTH + static_cast<std::size_t>(x);
    }

    bool get(int x, int y) const { return pixels[index(x, y)]; }

    // XOR one pixel on; returns true if it was lit before (collision).
    bool flip(int x, int y) {
        bool& p = pixels[index(x, y)];
        bool was = p;
        p = !p;
        return was;
    }

    void clear() { pixels.fill(false); }

    std::size_t lit_count() const {
        std::size_t n = 0;
        for (bool p : pixels) n += p ? 1 : 0;
        return n;
    }
};
