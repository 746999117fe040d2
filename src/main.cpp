// src/main.cpp
#include <iostream>
#include <iomanip>
#include <sstream>
#include <vector>
#include <set>
#include <cstdint>
#include <algorithm>
#include <chrono>
#include <thread>

#include "clock.hpp"
#include "cpu.hpp"
#include "options.hpp"
#include "rom_file.hpp"

static std::string hex16(uint16_t v){ std::ostringstream o; o<<std::hex<<std::uppercase<<std::setw(4)<<std::setfill('0')<<int(v); return o.str(); }
static std::string hex8(uint8_t v){ std::ostringstream o; o<<std::hex<<std::uppercase<<std::setw(2)<<std::setfill('0')<<int(v); return o.str(); }

// Hex operand from the prompt, folded into the 4K address space.
static uint16_t parse_addr(const std::string& s){
    return static_cast<uint16_t>(std::stoul(s, nullptr, 16) & CPU::ADDR_MASK);
}

static std::string disasm_one(const CPU& c, uint16_t pc) {
    const uint16_t word = c.fetch(pc);
    std::ostringstream out;
    out << hex16(pc) << ":  " << hex16(word) << "   " << disassemble(decode(word));
    return out.str();
}

static void disasm_range(const CPU& c, uint16_t start, int count_instrs) {
    uint16_t pc = start;
    for (int i = 0; i < count_instrs; ++i) {
        std::cout << (pc == c.PC ? "> " : "  ") << disasm_one(c, pc) << "\n";
        pc = uint16_t((pc + 2) & CPU::ADDR_MASK);
    }
}

static void print_regs(const CPU& c){
    std::cout << "PC="<<hex16(c.PC)
              << "  I="<<hex16(c.I)
              << "  SP="<<hex8(c.SP)
              << "  DT="<<hex8(c.DT)
              << "  ST="<<hex8(c.ST)
              << "  state="<< run_state_name(c.state)
              << "  cycles="<<std::dec<<c.cycles
              << "  frames="<<c.frames << "\n";
    for (int r = 0; r < 16; ++r) {
        std::cout << 'V' << std::hex << std::uppercase << r << std::dec << '=' << hex8(c.V[r])
                  << (r % 8 == 7 ? "\n" : "  ");
    }
    std::cout << "next: " << disasm_one(c, c.PC) << "\n";
    if (c.halted()) std::cout << "* " << describe(c.fault) << "\n";
}

static void dump_mem(const CPU& c, uint16_t base, int rows=8, int cols=16){
    for(int r=0;r<rows;r++){
        uint16_t addr = uint16_t((base + r*cols) & CPU::ADDR_MASK);
        std::cout<<hex16(addr)<<": ";
        for(int ccol=0;ccol<cols;ccol++){
            std::cout<<hex8(c.mem[(addr+ccol) & CPU::ADDR_MASK])<<' ';
        }
        std::cout<<"\n";
    }
}

static void print_screen(const CPU& c){
    const Display& d = c.framebuffer();
    std::cout << '+' << std::string(Display::WIDTH, '-') << "+\n";
    for (int y = 0; y < Display::HEIGHT; ++y) {
        std::cout << '|';
        for (int x = 0; x < Display::WIDTH; ++x) std::cout << (d.get(x, y) ? '#' : ' ');
        std::cout << "|\n";
    }
    std::cout << '+' << std::string(Display::WIDTH, '-') << "+\n";
}

static void print_stack(const CPU& c){
    if (c.SP == 0) { std::cout << "(stack empty)\n"; return; }
    for (int i = c.SP - 1; i >= 0; --i)
        std::cout << "  [" << i << "] " << hex16(c.stack[i]) << "\n";
}

// Print the last K trace frames (instruction-by-instruction bus view)
static void print_trace(const CPU& c, int k){
    if(c.timeline.empty()){ std::cout<<"(no trace yet)\n"; return; }
    int start = (int)std::max(0, (int)c.timeline.size()-k);
    for(int i=start;i<(int)c.timeline.size();++i){
        const auto& t = c.timeline[i];
        std::cout<< std::dec << t.cycle << "  "
                 << hex16(t.pc) << "  "
                 << hex16(t.opcode) << "  "
                 << std::left << std::setw(18) << std::setfill(' ') << disassemble(decode(t.opcode)) << std::right
                 << " I=" << hex16(t.i) << " SP=" << hex8(t.sp) << " VF=" << hex8(t.v[0xF])
                 << "  " << run_state_name(t.state) << "  events:" << t.events.size() << "\n";
        for(const auto& e: t.events){
            std::cout<<"    " << (e.dir==BusDir::Read? "RD":"WR")
                     <<" ["<<hex16(e.address)<<"] = "<<hex8(e.data)
                     <<"  " << e.note << "\n";
        }
    }
}

static bool report(const FaultInfo& f){
    if (f) std::cout << "* Fault: " << describe(f) << "\n";
    return static_cast<bool>(f);
}

static bool load_into(CPU& cpu, const std::vector<uint8_t>& buf, const char* tag){
    FaultInfo f = cpu.load_program(buf);
    if (f) std::cout << "[" << tag << "] " << describe(f) << " (" << buf.size() << " bytes, max "
                     << CPU::MAX_ROM_SIZE << ")\n";
    else   std::cout << "[" << tag << "] loaded " << std::dec << buf.size() << " bytes at 0200\n";
    return !f;
}

int main(int argc, char** argv){
    Options opts;
    if (!parse_options(argc, argv, opts)) { std::cerr << usage_text(); return 2; }
    if (opts.help) { std::cout << usage_text(); return 0; }

    std::vector<uint8_t> rom;
    if (!read_rom(opts, rom)) return 1;

    CPU cpu;
    cpu.quirks = opts.quirks;
    cpu.trace_limit = opts.trace_limit;
    if (cpu.load_program(rom)) { std::cerr << "[chip8] ROM too large for the program area\n"; return 1; }
    uint32_t ipf = opts.instructions_per_frame;

    std::set<uint16_t> breakpoints;

    std::cout << "CHIP-8 VM (CLI)\n";
    std::cout << "Type 'help' for commands.\n\n";
    print_regs(cpu);

    std::string line;
    while (true){
        std::cout << "\n> " << std::flush;
        if(!std::getline(std::cin, line)) break;

        std::istringstream iss(line);
        std::string cmd; iss >> cmd;
        if(cmd.empty()) continue;

        // normalize lowercase
        cmd = lowercase(cmd);

        try {
        if(cmd=="q" || cmd=="quit" || cmd=="exit"){
            break;
        }
        else if(cmd=="help" || cmd=="h" || cmd=="?"){
            std::cout <<
R"(Commands:
  s                 execute one instruction
  f [N]             run N frames (default 1): ipf instructions + one timer tick each
  r N               run N instructions
  g [SECONDS]       run frames in real time (60 Hz) until fault or timeout (default 10s);
                    breakpoints are checked at frame boundaries only
  p                 print registers
  m ADDR [ROWS]     hex dump from ADDR (8 rows of 16 unless ROWS given)
  w ADDR BYTE       poke BYTE into memory (hex operands, 12-bit address)
  b ADDR            break when PC reaches ADDR
  bl                list breakpoints with the instruction at each
  bc [ADDR]         remove one breakpoint, or all of them
  t [K]             last K timeline entries with bus events (default 20)
  d [ADDR] [N]      disassemble N instructions from ADDR (default PC, 16)
  screen            print the 64x32 display
  key K 0|1         release/press hex key K
  stack             print the call stack
  ipf N             set instructions per frame
  quirk NAME        toggle shift | jump | loadstore
  reset             reload the current ROM
  sleep MS          sleep for MS milliseconds
  loadbin FILE      load a binary ROM at 0200
  loadhex FILE      load a hex-text ROM at 0200
  help              this text
  quit              exit
)";
        }
        else if(cmd=="s"){
            report(cpu.step_instr());
            print_regs(cpu);
        }
        else if(cmd=="f"){
            int n=1; iss>>n; if(n<=0) n=1;
            for(int i=0;i<n;i++){
                if(report(cpu.tick(ipf))) break;
            }
            print_regs(cpu);
        }
        else if(cmd=="r"){
            int n=1; iss>>n;
            for(int i=0;i<n && !cpu.halted();i++){
                // a breakpoint stops before its instruction, except on the first step
                if(i>0 && breakpoints.count(cpu.PC)) { std::cout<<"* break at "<<hex16(cpu.PC)<<"\n"; break; }
                if(report(cpu.step_instr())) break;
            }
            print_regs(cpu);
        }
        else if(cmd=="g"){
            int seconds=10; iss>>seconds; if(seconds<=0) seconds=10;
            FramePacer pacer;
            const uint64_t stop = cpu.frames + uint64_t(seconds) * cfg::kFrameHz;
            bool done = false;
            while(!done && cpu.frames < stop){
                for(int due = pacer.frames_due(); due > 0 && !done; --due){
                    if(report(cpu.tick(ipf))) done = true;
                    else if(breakpoints.count(cpu.PC)) { std::cout<<"* break at "<<hex16(cpu.PC)<<"\n"; done = true; }
                }
                if(!done) pacer.wait_for_next();
            }
            print_regs(cpu);
        }
        else if(cmd=="p"){
            print_regs(cpu);
        }
        else if(cmd=="m"){
            std::string at; int rows=8;
            if(!(iss>>at)){ std::cout<<"usage: m ADDR [ROWS]\n"; continue; }
            iss>>rows;
            dump_mem(cpu, parse_addr(at), rows > 0 ? rows : 8, 16);
        }
        else if(cmd=="w"){
            std::string at, byte;
            if(!(iss>>at>>byte)){ std::cout<<"usage: w ADDR BYTE\n"; continue; }
            unsigned long value = 0;
            if(!parse_hex_value(byte, 0xFF, value)){ std::cout<<"usage: w ADDR BYTE (BYTE is 00..FF)\n"; continue; }
            const uint16_t addr = parse_addr(at);
            cpu.mem[addr] = static_cast<uint8_t>(value);
            std::cout<<"["<<hex16(addr)<<"] <- "<<hex8(cpu.mem[addr])<<"\n";
        }
        else if(cmd=="b" || cmd=="bc"){
            std::string at; iss>>at;
            if(at.empty()){
                if(cmd=="b"){ std::cout<<"usage: b ADDR\n"; continue; }
                breakpoints.clear();
                std::cout<<"all breakpoints removed\n";
            } else if(cmd=="b"){
                breakpoints.insert(parse_addr(at));
                std::cout<<"break at "<<hex16(parse_addr(at))<<"\n";
            } else {
                const bool had = breakpoints.erase(parse_addr(at)) != 0;
                std::cout<<(had ? "removed " : "no breakpoint at ")<<hex16(parse_addr(at))<<"\n";
            }
        }
        else if(cmd=="bl"){
            if(breakpoints.empty()) std::cout<<"(no breakpoints)\n";
            for(uint16_t at: breakpoints) std::cout<<"  "<<hex16(at)<<"  "<<disassemble(decode(cpu.fetch(at)))<<"\n";
        }
        else if(cmd=="t"){
            int k=20; iss>>k;
            print_trace(cpu, k > 0 ? k : 20);
        }
        else if(cmd=="d"){
            std::string at; int n = 16;
            iss >> at >> n;
            disasm_range(cpu, at.empty() ? cpu.PC : parse_addr(at), n > 0 ? n : 16);
        }
        else if(cmd=="screen"){
            print_screen(cpu);
        }
        else if(cmd=="key"){
            std::string skey; int down=1; iss>>skey>>down;
            if(skey.empty()){ std::cout<<"usage: key K 0|1\n"; continue; }
            unsigned long k = 0;
            if(!parse_hex_value(skey, CPU::NUM_KEYS - 1, k)){ std::cout<<"key must be 0..F\n"; continue; }
            cpu.set_key((uint8_t)k, down != 0);
            std::cout<<"Key "<<std::hex<<std::uppercase<<k<<std::dec<<(down ? " down" : " up")<<"\n";
        }
        else if(cmd=="stack"){
            print_stack(cpu);
        }
        else if(cmd=="ipf"){
            int n=0; iss>>n;
            if(n<=0){ std::cout<<"ipf="<<ipf<<"\n"; continue; }
            ipf = clamp_ipf(n);
            std::cout<<"ipf="<<ipf<<"\n";
        }
        else if(cmd=="quirk"){
            std::string name; iss>>name;
            Quirks& q = cpu.quirks;
            if(name=="shift")          q.shift_uses_vy = !q.shift_uses_vy;
            else if(name=="jump")      q.jump_uses_vx = !q.jump_uses_vx;
            else if(name=="loadstore") q.load_store_increments_i = !q.load_store_increments_i;
            else if(!name.empty()){ std::cout<<"usage: quirk shift|jump|loadstore\n"; continue; }
            std::cout<<"shift="<<q.shift_uses_vy<<" jump="<<q.jump_uses_vx
                     <<" loadstore="<<q.load_store_increments_i<<"\n";
        }
        else if(cmd=="reset"){
            load_into(cpu, rom, "reset");
            print_regs(cpu);
        }
        else if(cmd=="sleep"){
            int ms=0; iss>>ms; if(ms>0) std::this_thread::sleep_for(std::chrono::milliseconds(ms));
        }
        else if (cmd=="loadbin" || cmd=="loadhex") {
            std::string path; iss >> path;
            if(path.empty()){ std::cout<<"usage: "<<cmd<<" <path>\n"; continue; }
            std::vector<uint8_t> buf;
            bool ok = (cmd=="loadbin") ? read_file_binary(path, buf) : read_file_hexbytes(path, buf);
            if(!ok) { std::cout<<"["<<cmd<<"] failed to read '"<<path<<"'\n"; continue; }
            if(load_into(cpu, buf, cmd.c_str())) rom = buf;
        }
        else {
            std::cout<<"Unknown command. Type 'help'.\n";
        }
        }
        catch (const std::exception& e) {
            std::cout<<"bad argument ("<<e.what()<<")\n";
        }
    }

    return 0;
}
