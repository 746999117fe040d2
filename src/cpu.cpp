#include "cpu.hpp"

#include <algorithm>
#include <random>
#include <utility>

static const uint8_t FONT_SET[16 * CPU::FONT_GLYPH] = {
    0xF0, 0x90, 0x90, 0x90, 0xF0, // 0
    0x20, 0x60, 0x20, 0x20, 0x70, // 1
    0xF0, 0x10, 0xF0, 0x80, 0xF0, // 2
    0xF0, 0x10, 0xF0, 0x10, 0xF0, // 3
    0x90, 0x90, 0xF0, 0x10, 0x10, // 4
    0xF0, 0x80, 0xF0, 0x10, 0xF0, // 5
    0xF0, 0x80, 0xF0, 0x90, 0xF0, // 6
    0xF0, 0x10, 0x20, 0x40, 0x40, // 7
    0xF0, 0x90, 0xF0, 0x90, 0xF0, // 8
    0xF0, 0x90, 0xF0, 0x10, 0xF0, // 9
    0xF0, 0x90, 0xF0, 0x90, 0x90, // A
    0xE0, 0x90, 0xE0, 0x90, 0xE0, // B
    0xF0, 0x80, 0x80, 0x80, 0xF0, // C
    0xE0, 0x90, 0x90, 0x90, 0xE0, // D
    0xF0, 0x80, 0xF0, 0x80, 0xF0, // E
    0xF0, 0x80, 0xF0, 0x80, 0x80, // F
};

static std::function<uint8_t()> default_random_source() {
    return [engine = std::mt19937(std::random_device{}()),
            dist = std::uniform_int_distribution<int>(0, 255)]() mutable {
        return static_cast<uint8_t>(dist(engine));
    };
}

const char* run_state_name(RunState s) {
    switch (s) {
        case RunState::Running: return "RUN";
        case RunState::WaitKey: return "KEY";
        case RunState::Halted:  return "HLT";
    }
    return "?";
}

CPU::CPU() : random_byte(default_random_source()) {
    reset();
}

void CPU::reset() {
    mem.fill(0);
    std::copy(std::begin(FONT_SET), std::end(FONT_SET), mem.begin() + FONT_BASE);
    V.fill(0);
    I = 0;
    PC = PROGRAM_START;
    SP = 0;
    stack.fill(0);
    DT = ST = 0;
    display.clear();
    keys.fill(false);
    state = RunState::Running;
    fault = FaultInfo{};
    cycles = 0;
    frames = 0;
    wait_register = 0;
    wait_snapshot.fill(false);
    timeline.clear();
}

FaultInfo CPU::load_program(const std::vector<uint8_t>& bytes) {
    if (bytes.size() > MAX_ROM_SIZE) {
        CHIP8_LOG_IF(cfg::kLogLoad, "[chip8] ROM of " << bytes.size() << " bytes exceeds the "
                     << MAX_ROM_SIZE << " byte program area");
        return FaultInfo{Fault::RomTooLarge, 0, PROGRAM_START};
    }
    reset();
    std::copy(bytes.begin(), bytes.end(), mem.begin() + PROGRAM_START);
    CHIP8_LOG_IF(cfg::kLogLoad, "[chip8] loaded " << bytes.size() << " bytes at 0x200");
    return FaultInfo{};
}

void CPU::set_random_source(std::function<uint8_t()> source) {
    random_byte = source ? std::move(source) : default_random_source();
}

void CPU::set_key(uint8_t index, bool pressed) {
    if (index >= NUM_KEYS) return;
    keys[index] = pressed;
}

uint16_t CPU::fetch(uint16_t addr) const {
    return static_cast<uint16_t>(mem[addr & ADDR_MASK] << 8 | mem[(addr + 1) & ADDR_MASK]);
}

void CPU::push_event(std::vector<BusEvent>& ev, BusDir dir, uint16_t addr, uint8_t data, const char* note) {
    if (trace_limit == 0) return;
    ev.push_back(BusEvent{cycles, dir, addr, data, note});
}

uint8_t CPU::read(uint16_t addr, std::vector<BusEvent>& ev, const char* note) {
    addr &= ADDR_MASK;
    uint8_t v = mem[addr];
    push_event(ev, BusDir::Read, addr, v, note);
    return v;
}

void CPU::write(uint16_t addr, uint8_t data, std::vector<BusEvent>& ev, const char* note) {
    addr &= ADDR_MASK;
    mem[addr] = data;
    push_event(ev, BusDir::Write, addr, data, note);
}

FaultInfo CPU::halt(Fault kind, uint16_t word, uint16_t at) {
    state = RunState::Halted;
    PC = at;
    fault = FaultInfo{kind, word, at};
    CHIP8_LOG_IF(cfg::kLogFaults, "[chip8] halted: " << describe(fault));
    return fault;
}

void CPU::record(uint16_t at, const Instruction& in, std::vector<BusEvent>& ev) {
    if (trace_limit == 0) return;
    timeline.push_back(TraceFrame{cycles, at, in.word, in.op, I, SP, V, state, std::move(ev)});
    while (timeline.size() > trace_limit) timeline.pop_front();
}

// Resume a parked Fx0A once a key goes from released to pressed.
bool CPU::poll_key_wait() {
    for (uint8_t k = 0; k < NUM_KEYS; ++k) {
        if (keys[k] && !wait_snapshot[k]) {
            V[wait_register] = k;
            state = RunState::Running;
            PC = static_cast<uint16_t>((PC + 2) & ADDR_MASK);
            CHIP8_LOG_IF(cfg::kLogKeys, "[chip8] key " << int(k) << " -> V" << std::hex << int(wait_register) << std::dec);
            return true;
        }
    }
    wait_snapshot = keys;
    return false;
}

void CPU::draw_sprite(const Instruction& in, std::vector<BusEvent>& ev) {
    const int x0 = V[in.x] % Display::WIDTH;
    const int y0 = V[in.y] % Display::HEIGHT;
    bool collision = false;
    for (int row = 0; row < in.n; ++row) {
        uint8_t bits = read(static_cast<uint16_t>(I + row), ev, "sprite row");
        for (int bit = 0; bit < 8; ++bit) {
            if (bits & (0x80 >> bit)) {
                if (display.flip(x0 + bit, y0 + row)) collision = true;
            }
        }
    }
    V[0xF] = collision ? 1 : 0;
}

FaultInfo CPU::step_instr() {
    if (state == RunState::Halted) return fault;
    if (state == RunState::WaitKey) {
        poll_key_wait();
        return FaultInfo{};
    }

    std::vector<BusEvent> ev; // events emitted by this instruction
    const uint16_t at = PC;
    uint8_t hi = read(at, ev, "opcode hi");
    uint8_t lo = read(static_cast<uint16_t>(at + 1), ev, "opcode lo");
    Instruction in = decode(static_cast<uint16_t>(hi << 8 | lo));

    PC = static_cast<uint16_t>((at + 2) & ADDR_MASK);
    FaultInfo f = execute(in, at, ev);
    if (!f) {
        record(at, in, ev);
        cycles++;
    }
    return f;
}

FaultInfo CPU::execute(const Instruction& in, uint16_t at, std::vector<BusEvent>& ev) {
    uint8_t& vx = V[in.x];
    const uint8_t vy = V[in.y];

    switch (in.op) {
        case Op::Cls: display.clear(); break;
        case Op::Ret:
            if (SP == 0) return halt(Fault::StackUnderflow, in.word, at);
            PC = stack[--SP];
            break;
        case Op::Jp: PC = in.nnn; break;
        case Op::Call:
            if (SP >= STACK_DEPTH) return halt(Fault::StackOverflow, in.word, at);
            stack[SP++] = PC;
            PC = in.nnn;
            break;

        case Op::SeImm:  if (vx == in.kk) PC = static_cast<uint16_t>((PC + 2) & ADDR_MASK); break;
        case Op::SneImm: if (vx != in.kk) PC = static_cast<uint16_t>((PC + 2) & ADDR_MASK); break;
        case Op::SeReg:  if (vx == vy)    PC = static_cast<uint16_t>((PC + 2) & ADDR_MASK); break;
        case Op::SneReg: if (vx != vy)    PC = static_cast<uint16_t>((PC + 2) & ADDR_MASK); break;

        case Op::LdImm:  vx = in.kk; break;
        case Op::AddImm: vx = static_cast<uint8_t>(vx + in.kk); break; // no carry
        case Op::LdReg:  vx = vy; break;
        case Op::Or:     vx |= vy; break;
        case Op::And:    vx &= vy; break;
        case Op::Xor:    vx ^= vy; break;

        // VF is written last so it wins when x == F.
        case Op::AddReg: {
            uint16_t sum = static_cast<uint16_t>(vx + vy);
            vx = static_cast<uint8_t>(sum);
            V[0xF] = sum > 0xFF ? 1 : 0;
            break;
        }
        case Op::Sub: {
            uint8_t a = vx;
            vx = static_cast<uint8_t>(a - vy);
            V[0xF] = a >= vy ? 1 : 0;
            break;
        }
        case Op::Subn: {
            uint8_t a = vx;
            vx = static_cast<uint8_t>(vy - a);
            V[0xF] = vy >= a ? 1 : 0;
            break;
        }
        case Op::Shr: {
            uint8_t src = quirks.shift_uses_vy ? vy : vx;
            vx = static_cast<uint8_t>(src >> 1);
            V[0xF] = src & 0x01;
            break;
        }
        case Op::Shl: {
            uint8_t src = quirks.shift_uses_vy ? vy : vx;
            vx = static_cast<uint8_t>(src << 1);
            V[0xF] = (src >> 7) & 0x01;
            break;
        }

        case Op::LdI: I = in.nnn; break;
        case Op::JpV0: {
            uint16_t target = quirks.jump_uses_vx
                ? static_cast<uint16_t>(in.nnn + vx)
                : static_cast<uint16_t>(in.nnn + V[0]);
            PC = target & ADDR_MASK;
            break;
        }
        case Op::Rnd: vx = random_byte() & in.kk; break;
        case Op::Drw: draw_sprite(in, ev); break;

        case Op::Skp:  if (keys[vx & 0x0F])  PC = static_cast<uint16_t>((PC + 2) & ADDR_MASK); break;
        case Op::Sknp: if (!keys[vx & 0x0F]) PC = static_cast<uint16_t>((PC + 2) & ADDR_MASK); break;

        case Op::LdVxDt: vx = DT; break;
        case Op::LdVxK:
            state = RunState::WaitKey;
            wait_register = in.x;
            wait_snapshot = keys;
            PC = at;  // stay on Fx0A until a key arrives
            break;
        case Op::LdDtVx: DT = vx; break;
        case Op::LdStVx: ST = vx; break;
        case Op::AddIVx: I = static_cast<uint16_t>(I + vx); break;
        case Op::LdFVx:  I = static_cast<uint16_t>(FONT_BASE + (vx & 0x0F) * FONT_GLYPH); break;
        case Op::LdBVx:
            write(I,                             static_cast<uint8_t>(vx / 100),       ev, "bcd hundreds");
            write(static_cast<uint16_t>(I + 1),  static_cast<uint8_t>((vx / 10) % 10), ev, "bcd tens");
            write(static_cast<uint16_t>(I + 2),  static_cast<uint8_t>(vx % 10),        ev, "bcd ones");
            break;
        case Op::LdIVx:
            for (int r = 0; r <= in.x; ++r)
                write(static_cast<uint16_t>(I + r), V[r], ev, "store V");
            if (quirks.load_store_increments_i) I = static_cast<uint16_t>(I + in.x + 1);
            break;
        case Op::LdVxI:
            for (int r = 0; r <= in.x; ++r)
                V[r] = read(static_cast<uint16_t>(I + r), ev, "load V");
            if (quirks.load_store_increments_i) I = static_cast<uint16_t>(I + in.x + 1);
            break;

        // 0nnn targeted native RCA 1802 routines; there is nothing to run.
        case Op::Sys:
        case Op::Unknown:
            return halt(Fault::UnknownInstruction, in.word, at);
    }
    return FaultInfo{};
}

void CPU::tick_timers() {
    if (DT > 0) --DT;
    if (ST > 0) --ST;
}

FaultInfo CPU::tick(uint32_t instructions_per_frame) {
    if (state == RunState::Halted) return fault;
    for (uint32_t n = 0; n < instructions_per_frame; ++n) {
        FaultInfo f = step_instr();
        if (f) return f;
        if (state == RunState::WaitKey) break;  // yield to the frame loop
    }
    tick_timers();
    frames++;
    return FaultInfo{};
}
