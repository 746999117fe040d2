// gui/app.cpp
// SDL2 + Dear ImGui frontend for the CHIP-8 core (SDL_Renderer2 backend).
// Owns the renderer, keyboard and audio collaborators; the core only sees
// set_key() before each frame and is read after it.
#include <algorithm>
#include <array>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

#include <SDL.h>

#include "imgui.h"
#include "backends/imgui_impl_sdl2.h"
#include "backends/imgui_impl_sdlrenderer2.h"  // SDL2 renderer v2 backend

#include "clock.hpp"
#include "cpu.hpp"
#include "options.hpp"
#include "rom_file.hpp"

// 1 2 3 4 / Q W E R / A S D F / Z X C V  ->  1 2 3 C / 4 5 6 D / 7 8 9 E / A 0 B F
static const SDL_Scancode KEYMAP[CPU::NUM_KEYS] = {
    SDL_SCANCODE_X,                                            // 0
    SDL_SCANCODE_1, SDL_SCANCODE_2, SDL_SCANCODE_3,            // 1 2 3
    SDL_SCANCODE_Q, SDL_SCANCODE_W, SDL_SCANCODE_E,            // 4 5 6
    SDL_SCANCODE_A, SDL_SCANCODE_S, SDL_SCANCODE_D,            // 7 8 9
    SDL_SCANCODE_Z, SDL_SCANCODE_C,                            // A B
    SDL_SCANCODE_4, SDL_SCANCODE_R, SDL_SCANCODE_F, SDL_SCANCODE_V, // C D E F
};

// Keypad layout as drawn on the original COSMAC VIP
static const uint8_t PAD_LAYOUT[16] = {
    0x1, 0x2, 0x3, 0xC,
    0x4, 0x5, 0x6, 0xD,
    0x7, 0x8, 0x9, 0xE,
    0xA, 0x0, 0xB, 0xF,
};

struct Tone {
    double phase{0.0};
    double step{static_cast<double>(cfg::kToneHz) / cfg::kSampleRate};
};

static void toneCallback(void* userdata, Uint8* stream, int len) {
    Tone* tone = static_cast<Tone*>(userdata);
    Sint16* out = reinterpret_cast<Sint16*>(stream);
    const int samples = len / static_cast<int>(sizeof(Sint16));
    for (int i = 0; i < samples; ++i) {
        out[i] = static_cast<Sint16>(tone->phase < 0.5 ? cfg::kToneVolume : -cfg::kToneVolume);
        tone->phase += tone->step;
        if (tone->phase >= 1.0) tone->phase -= 1.0;
    }
}

// Helper: give windows an initial position/size (first run only).
static inline void PlaceFirstUse(const ImVec2& pos, const ImVec2& size) {
    ImGui::SetNextWindowPos(pos, ImGuiCond_FirstUseEver);
    ImGui::SetNextWindowSize(size, ImGuiCond_FirstUseEver);
}

// 8 bytes per row over the 12-bit address space; the opcode at PC is green,
// the byte at I is yellow.
static void memoryHexView(const CPU& cpu, uint16_t base, int rows) {
    const ImVec4 pcColor(0.4f, 1.0f, 0.4f, 1.0f);
    const ImVec4 iColor(1.0f, 0.9f, 0.3f, 1.0f);
    ImGui::PushStyleVar(ImGuiStyleVar_ItemSpacing, ImVec2(6, 2));
    for (int r = 0; r < rows; ++r) {
        const uint16_t row = static_cast<uint16_t>((base + r * 8) & CPU::ADDR_MASK);
        ImGui::Text("%03X:", (unsigned)row);
        for (int c = 0; c < 8; ++c) {
            const uint16_t a = static_cast<uint16_t>((row + c) & CPU::ADDR_MASK);
            ImGui::SameLine();
            if (a == cpu.PC || a == ((cpu.PC + 1) & CPU::ADDR_MASK))
                ImGui::TextColored(pcColor, "%02X", cpu.mem[a]);
            else if (a == (cpu.I & CPU::ADDR_MASK))
                ImGui::TextColored(iColor, "%02X", cpu.mem[a]);
            else
                ImGui::Text("%02X", cpu.mem[a]);
        }
    }
    ImGui::PopStyleVar();
}

static void displayView(const Display& d, float scale) {
    ImDrawList* dl = ImGui::GetWindowDrawList();
    const ImVec2 origin = ImGui::GetCursorScreenPos();
    const ImVec2 size(Display::WIDTH * scale, Display::HEIGHT * scale);
    dl->AddRectFilled(origin, ImVec2(origin.x + size.x, origin.y + size.y), IM_COL32(10, 20, 10, 255));
    for (int y = 0; y < Display::HEIGHT; ++y) {
        for (int x = 0; x < Display::WIDTH; ++x) {
            if (!d.get(x, y)) continue;
            ImVec2 a(origin.x + x * scale, origin.y + y * scale);
            dl->AddRectFilled(a, ImVec2(a.x + scale, a.y + scale), IM_COL32(80, 255, 80, 255));
        }
    }
    ImGui::Dummy(size);
}

static bool loadRom(CPU& cpu, const std::string& path, bool hex, std::vector<uint8_t>& rom, std::string& status) {
    std::vector<uint8_t> buf;
    bool ok = true;
    if (path.empty()) buf = demo_program();
    else              ok = hex ? read_file_hexbytes(path, buf) : read_file_binary(path, buf);
    if (!ok) { status = "failed to read '" + path + "'"; return false; }
    FaultInfo f = cpu.load_program(buf);
    if (f) { status = describe(f); return false; }
    rom = buf;
    status = "loaded " + std::to_string(buf.size()) + " bytes";
    return true;
}

int main(int argc, char** argv) {
    Options opts;
    if (!parse_options(argc, argv, opts)) { std::fprintf(stderr, "%s", usage_text()); return 2; }
    if (opts.help) { std::printf("%s", usage_text()); return 0; }

    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_AUDIO | SDL_INIT_TIMER) != 0) {
        std::fprintf(stderr, "[gui] SDL Error: %s\n", SDL_GetError());
        return 1;
    }

    SDL_Window* window = SDL_CreateWindow(
        "CHIP-8 VM",
        SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
        1600, 1000,
        SDL_WINDOW_RESIZABLE | SDL_WINDOW_ALLOW_HIGHDPI);
    if (!window) { std::fprintf(stderr, "[gui] SDL_CreateWindow failed: %s\n", SDL_GetError()); SDL_Quit(); return 1; }

    SDL_Renderer* renderer = SDL_CreateRenderer(window, -1,
        SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
    if (!renderer) { std::fprintf(stderr, "[gui] SDL_CreateRenderer failed: %s\n", SDL_GetError()); SDL_DestroyWindow(window); SDL_Quit(); return 1; }

    // --- Audio: square wave while ST != 0 ---
    Tone tone;
    SDL_AudioSpec want{}, have{};
    want.freq = cfg::kSampleRate;
    want.format = AUDIO_S16SYS;
    want.channels = 1;
    want.samples = 512;
    want.callback = toneCallback;
    want.userdata = &tone;
    SDL_AudioDeviceID audio = SDL_OpenAudioDevice(nullptr, 0, &want, &have, 0);
    if (audio == 0) {
        std::fprintf(stderr, "[gui] no audio device (%s); running silent\n", SDL_GetError());
    } else {
        tone.step = static_cast<double>(cfg::kToneHz) / have.freq;
    }

    // --- ImGui init ---
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.FontGlobalScale = 1.5f;
    ImGui::StyleColorsDark();

    if (!ImGui_ImplSDL2_InitForSDLRenderer(window, renderer)) {
        std::fprintf(stderr, "[gui] ImGui_ImplSDL2_InitForSDLRenderer failed\n");
        SDL_DestroyRenderer(renderer); SDL_DestroyWindow(window); SDL_Quit(); return 1;
    }
    if (!ImGui_ImplSDLRenderer2_Init(renderer)) {
        std::fprintf(stderr, "[gui] ImGui_ImplSDLRenderer2_Init failed\n");
        ImGui_ImplSDL2_Shutdown(); SDL_DestroyRenderer(renderer); SDL_DestroyWindow(window); SDL_Quit(); return 1;
    }

    // --- CPU init ---
    CPU cpu;
    cpu.quirks = opts.quirks;
    cpu.trace_limit = opts.trace_limit;
    std::vector<uint8_t> rom;
    std::string status;
    bool romHex = opts.hex;
    static char romPath[512] = "";
    std::snprintf(romPath, sizeof(romPath), "%s", opts.rom_path.c_str());
    loadRom(cpu, opts.rom_path, romHex, rom, status);

    bool running = true;
    bool autoRun = !cpu.halted() && !rom.empty();
    int  instrPerFrame = static_cast<int>(opts.instructions_per_frame);
    float scale = static_cast<float>(opts.scale);
    uint16_t memBase = CPU::PROGRAM_START;
    std::array<bool, CPU::NUM_KEYS> padHeld{};
    FramePacer pacer;

    while (running) {
        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            ImGui_ImplSDL2_ProcessEvent(&event);
            if (event.type == SDL_QUIT) running = false;
            if (event.type == SDL_WINDOWEVENT &&
                event.window.event == SDL_WINDOWEVENT_CLOSE &&
                event.window.windowID == SDL_GetWindowID(window)) running = false;
        }

        // Input is written before the frame's instructions run.
        const Uint8* kb = SDL_GetKeyboardState(nullptr);
        for (uint8_t k = 0; k < CPU::NUM_KEYS; ++k) {
            bool down = padHeld[k] || (!io.WantCaptureKeyboard && kb[KEYMAP[k]]);
            cpu.set_key(k, down);
        }

        int due = pacer.frames_due();
        if (autoRun) {
            for (int i = 0; i < due; ++i) {
                FaultInfo f = cpu.tick(static_cast<uint32_t>(instrPerFrame));
                if (f) { status = describe(f); autoRun = false; break; }
            }
        }
        if (audio) SDL_PauseAudioDevice(audio, cpu.beeping() ? 0 : 1);

        ImGui_ImplSDL2_NewFrame();
        ImGui_ImplSDLRenderer2_NewFrame();
        ImGui::NewFrame();

        // ---- Display ----
        PlaceFirstUse({20,20}, {Display::WIDTH * scale + 40, Display::HEIGHT * scale + 60});
        ImGui::Begin("Display");
        displayView(cpu.framebuffer(), scale);
        ImGui::End();

        // ---- Controls ----
        PlaceFirstUse({20,420}, {700,260});
        ImGui::Begin("Controls");
        ImGui::Text("PC:%03X  I:%03X  cyc:%llu  frames:%llu  %s",
                    cpu.PC, cpu.I, (unsigned long long)cpu.cycles, (unsigned long long)cpu.frames,
                    run_state_name(cpu.state));
        if (ImGui::Button("Step Instr")) { FaultInfo f = cpu.step_instr(); if (f) status = describe(f); } ImGui::SameLine();
        if (ImGui::Button("Step Frame")) { FaultInfo f = cpu.tick(static_cast<uint32_t>(instrPerFrame)); if (f) status = describe(f); } ImGui::SameLine();
        ImGui::Checkbox("Run", &autoRun); ImGui::SameLine();
        if (ImGui::Button("Reset")) { FaultInfo f = cpu.load_program(rom); status = f ? describe(f) : "reset"; }
        ImGui::SetNextItemWidth(140); ImGui::InputInt("instr/frame", &instrPerFrame);
        instrPerFrame = static_cast<int>(clamp_ipf(instrPerFrame));
        ImGui::SetNextItemWidth(140); ImGui::SliderFloat("scale", &scale, 2.0f, 20.0f, "%.0f");
        ImGui::Separator();
        ImGui::Checkbox("shift uses VY", &cpu.quirks.shift_uses_vy); ImGui::SameLine();
        ImGui::Checkbox("Bxnn uses VX", &cpu.quirks.jump_uses_vx); ImGui::SameLine();
        ImGui::Checkbox("Fx55/65 bump I", &cpu.quirks.load_store_increments_i);
        ImGui::Separator();
        ImGui::SetNextItemWidth(360); ImGui::InputText("ROM", romPath, IM_ARRAYSIZE(romPath)); ImGui::SameLine();
        ImGui::Checkbox("hex", &romHex); ImGui::SameLine();
        if (ImGui::Button("Load")) {
            if (loadRom(cpu, romPath, romHex, rom, status)) autoRun = true;
        }
        if (cpu.halted()) ImGui::TextColored(ImVec4(1, 0.3f, 0.3f, 1), "%s", describe(cpu.fault).c_str());
        else              ImGui::TextUnformatted(status.c_str());
        ImGui::End();

        // ---- Registers & Timers ----
        PlaceFirstUse({740,20}, {420,300});
        ImGui::Begin("Registers & Timers");
        for (int r = 0; r < 16; ++r) {
            ImGui::Text("V%X:%02X", r, cpu.V[r]);
            if (r % 4 != 3) ImGui::SameLine();
        }
        ImGui::Separator();
        ImGui::Text("I:%04X  PC:%03X  SP:%X", cpu.I, cpu.PC, cpu.SP);
        ImGui::Text("DT:%3u  ST:%3u %s", (unsigned)cpu.DT, (unsigned)cpu.ST, cpu.beeping() ? "(beep)" : "");
        ImGui::Text("next: %s", disassemble(decode(cpu.fetch(cpu.PC))).c_str());
        ImGui::End();

        // ---- Stack ----
        PlaceFirstUse({740,340}, {420,200});
        ImGui::Begin("Stack");
        if (cpu.SP == 0) ImGui::TextDisabled("(empty)");
        for (int i = cpu.SP - 1; i >= 0; --i) ImGui::Text("[%2d] %03X", i, cpu.stack[i]);
        ImGui::End();

        // ---- Keypad ----
        PlaceFirstUse({740,560}, {420,300});
        ImGui::Begin("Keypad");
        for (int i = 0; i < 16; ++i) {
            uint8_t k = PAD_LAYOUT[i];
            char label[8]; std::snprintf(label, sizeof(label), "%X", k);
            bool lit = cpu.keys[k];
            if (lit) ImGui::PushStyleColor(ImGuiCol_Button, ImVec4(0.2f, 0.7f, 0.2f, 1));
            ImGui::Button(label, ImVec2(60, 50));
            padHeld[k] = ImGui::IsItemActive();
            if (lit) ImGui::PopStyleColor();
            if (i % 4 != 3) ImGui::SameLine();
        }
        if (cpu.waiting_for_key()) ImGui::Text("waiting for key -> V%X", cpu.wait_register);
        ImGui::End();

        // ---- Memory ----
        PlaceFirstUse({1180,20}, {400,560});
        ImGui::Begin("Memory");
        static char baseBuf[8] = "200";
        ImGui::SetNextItemWidth(120);
        if (ImGui::InputText("Base (hex)", baseBuf, IM_ARRAYSIZE(baseBuf),
            ImGuiInputTextFlags_CharsHexadecimal | ImGuiInputTextFlags_CharsNoBlank)) {
            unsigned v = 0; if (std::sscanf(baseBuf, "%x", &v) == 1) memBase = static_cast<uint16_t>(v & CPU::ADDR_MASK);
        }
        ImGui::BeginChild("hex", ImVec2(0, 0), true);
        memoryHexView(cpu, memBase, 32);
        ImGui::EndChild();
        ImGui::End();

        // ---- Timeline ----
        PlaceFirstUse({1180,600}, {400,380});
        ImGui::Begin("Timeline");
        static int maxRows = 256; ImGui::SliderInt("Rows", &maxRows, 16, 2000);
        int total = static_cast<int>(cpu.timeline.size());
        int start = std::max(0, total - maxRows);
        ImGui::BeginChild("tl", ImVec2(0, 0), true);
        for (int i = start; i < total; ++i) {
            const TraceFrame& t = cpu.timeline[i];
            // keyed by cycle so an expanded row stays open while the ring scrolls
            ImGui::PushID(static_cast<int>(t.cycle & 0x7FFFFFFF));
            const bool open = ImGui::TreeNode("row", "#%llu %03X %04X %-16s I=%03X VF=%02X %s",
                (unsigned long long)t.cycle, t.pc, t.opcode, disassemble(decode(t.opcode)).c_str(),
                t.i, t.v[0xF], run_state_name(t.state));
            if (open) {
                for (const BusEvent& e : t.events)
                    ImGui::BulletText("%s [%03X] = %02X  %s",
                        (e.dir == BusDir::Read ? "RD" : "WR"), e.address, e.data, e.note.c_str());
                ImGui::TreePop();
            }
            ImGui::PopID();
        }
        ImGui::EndChild();
        ImGui::End();

        ImGui::Render();
        SDL_SetRenderDrawColor(renderer, 25, 25, 25, 255);
        SDL_RenderClear(renderer);
        ImGui_ImplSDLRenderer2_RenderDrawData(ImGui::GetDrawData(), renderer);
        SDL_RenderPresent(renderer);
        if (!autoRun) pacer.restart();
    }

    if (audio) SDL_CloseAudioDevice(audio);
    ImGui_ImplSDLRenderer2_Shutdown();
    ImGui_ImplSDL2_Shutdown();
    ImGui::DestroyContext();

    SDL_DestroyRenderer(renderer);
    SDL_DestroyWindow(window);
    SDL_Quit();
    return 0;
}
