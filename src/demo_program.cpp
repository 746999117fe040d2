#include <vector>
#include <cstdint>

// Built-in ROM used when no file is given: shows the 16 font glyphs in turn,
// half a second each, with a short beep on every change.
std::vector<uint8_t> demo_program() {
    std::vector<uint8_t> p;
    auto emit16=[&](uint16_t w){ p.push_back(w >> 8); p.push_back(w & 0xFF); };
    emit16(0x00E0);                                       // 200 CLS
    emit16(0x6000);                                       // 202 LD V0, 0      digit
    emit16(0x611C);                                       // 204 LD V1, 28     x
    emit16(0x620D);                                       // 206 LD V2, 13     y
    // loop:
    emit16(0xF029);                                       // 208 LD F, V0
    emit16(0xD125);                                       // 20A DRW V1, V2, 5
    emit16(0x631E);                                       // 20C LD V3, 30
    emit16(0xF315);                                       // 20E LD DT, V3
    emit16(0x6404);                                       // 210 LD V4, 4
    emit16(0xF418);                                       // 212 LD ST, V4
    // wait:
    emit16(0xF307);                                       // 214 LD V3, DT
    emit16(0x3300);                                       // 216 SE V3, 0
    emit16(0x1214);                                       // 218 JP wait
    emit16(0xD125);                                       // 21A DRW V1, V2, 5 (erase)
    emit16(0x7001);                                       // 21C ADD V0, 1
    emit16(0x650F);                                       // 21E LD V5, $0F
    emit16(0x8052);                                       // 220 AND V0, V5
    emit16(0x1208);                                       // 222 JP loop
    return p;
}
