// include/cpu.hpp
#pragma once
#include <array>
#include <cstdint>
#include <deque>
#include <functional>
#include <vector>

#include "config.hpp"
#include "display.hpp"
#include "fault.hpp"
#include "instruction.hpp"
#include "trace.hpp"

// Behaviours that real CHIP-8 interpreters disagree on. Defaults follow
// CHIP-48/SUPER-CHIP, which most ROMs in circulation are written for.
struct Quirks {
    bool shift_uses_vy{false};            // 8xy6/8xyE: Vx = Vy >> 1 / Vy << 1
    bool jump_uses_vx{false};             // Bxnn: jump to xnn + Vx instead of nnn + V0
    bool load_store_increments_i{false};  // Fx55/Fx65: I += x + 1 afterwards
};

struct CPU {
    // Memory map
    static constexpr size_t   MEM_SIZE      = 4096;
    static constexpr uint16_t ADDR_MASK     = 0x0FFF;
    static constexpr uint16_t FONT_BASE     = 0x050;
    static constexpr uint16_t FONT_GLYPH    = 5;        // bytes per glyph
    static constexpr uint16_t PROGRAM_START = 0x200;
    static constexpr size_t   MAX_ROM_SIZE  = MEM_SIZE - PROGRAM_START;
    static constexpr size_t   STACK_DEPTH   = 16;
    static constexpr size_t   NUM_KEYS      = 16;

    // Registers
    std::array<uint8_t, 16> V{};     // V0..VF, VF doubles as carry/borrow/collision flag
    uint16_t I{0};
    uint16_t PC{PROGRAM_START};
    uint8_t  SP{0};
    std::array<uint16_t, STACK_DEPTH> stack{};
    uint8_t  DT{0};                  // delay timer, 60 Hz
    uint8_t  ST{0};                  // sound timer, 60 Hz; nonzero = tone

    // Memory / IO
    std::array<uint8_t, MEM_SIZE> mem{};
    Display display;
    std::array<bool, NUM_KEYS> keys{};

    Quirks quirks;

    // Control / internal state
    RunState  state{RunState::Running};
    FaultInfo fault;                 // what halted us, if anything
    uint64_t  cycles{0};             // instructions executed
    uint64_t  frames{0};             // ticks completed
    uint8_t   wait_register{0};      // Fx0A destination
    std::array<bool, NUM_KEYS> wait_snapshot{};

    // Visual trace timeline (one frame per executed instruction)
    std::deque<TraceFrame> timeline;
    size_t trace_limit{cfg::kTraceLimit};

    CPU();

    // API
    void      reset();
    FaultInfo load_program(const std::vector<uint8_t>& bytes);
    void      set_random_source(std::function<uint8_t()> source);

    // Run controls
    FaultInfo step_instr();                           // one dispatch (or one key-wait poll)
    FaultInfo tick(uint32_t instructions_per_frame);  // one 60 Hz frame: N dispatches, then timers
    void      tick_timers();

    // Collaborator accessors
    const Display& framebuffer() const { return display; }
    uint8_t sound_timer() const { return ST; }
    bool    beeping() const { return ST != 0; }
    void    set_key(uint8_t index, bool pressed);

    bool halted() const { return state == RunState::Halted; }
    bool waiting_for_key() const { return state == RunState::WaitKey; }
    uint16_t fetch(uint16_t addr) const;

private:
    std::function<uint8_t()> random_byte;

    // Helpers used by implementation
    void      push_event(std::vector<BusEvent>& ev, BusDir dir, uint16_t addr, uint8_t data, const char* note);
    uint8_t   read(uint16_t addr, std::vector<BusEvent>& ev, const char* note = "");
    void      write(uint16_t addr, uint8_t data, std::vector<BusEvent>& ev, const char* note = "");
    FaultInfo execute(const Instruction& in, uint16_t at, std::vector<BusEvent>& ev);
    bool      poll_key_wait();
    void      draw_sprite(const Instruction& in, std::vector<BusEvent>& ev);
    FaultInfo halt(Fault kind, uint16_t word, uint16_t at);
    void      record(uint16_t at, const Instruction& in, std::vector<BusEvent>& ev);
};
