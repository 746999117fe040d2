#include "instruction.hpp"

#include <iomanip>
#include <sstream>

Instruction decode(uint16_t word) {
    Instruction in;
    in.word = word;
    in.x    = static_cast<uint8_t>((word >> 8) & 0x0F);
    in.y    = static_cast<uint8_t>((word >> 4) & 0x0F);
    in.n    = static_cast<uint8_t>(word & 0x000F);
    in.kk   = static_cast<uint8_t>(word & 0x00FF);
    in.nnn  = static_cast<uint16_t>(word & 0x0FFF);

    switch (word >> 12) {
        case 0x0:
            if (word == 0x00E0)      in.op = Op::Cls;
            else if (word == 0x00EE) in.op = Op::Ret;
            else                     in.op = Op::Sys;
            break;
        case 0x1: in.op = Op::Jp; break;
        case 0x2: in.op = Op::Call; break;
        case 0x3: in.op = Op::SeImm; break;
        case 0x4: in.op = Op::SneImm; break;
        case 0x5: in.op = (in.n == 0) ? Op::SeReg : Op::Unknown; break;
        case 0x6: in.op = Op::LdImm; break;
        case 0x7: in.op = Op::AddImm; break;
        case 0x8:
            switch (in.n) {
                case 0x0: in.op = Op::LdReg; break;
                case 0x1: in.op = Op::Or; break;
                case 0x2: in.op = Op::And; break;
                case 0x3: in.op = Op::Xor; break;
                case 0x4: in.op = Op::AddReg; break;
                case 0x5: in.op = Op::Sub; break;
                case 0x6: in.op = Op::Shr; break;
                case 0x7: in.op = Op::Subn; break;
                case 0xE: in.op = Op::Shl; break;
                default:  in.op = Op::Unknown; break;
            }
            break;
        case 0x9: in.op = (in.n == 0) ? Op::SneReg : Op::Unknown; break;
        case 0xA: in.op = Op::LdI; break;
        case 0xB: in.op = Op::JpV0; break;
        case 0xC: in.op = Op::Rnd; break;
        case 0xD: in.op = Op::Drw; break;
        case 0xE:
            if (in.kk == 0x9E)      in.op = Op::Skp;
            else if (in.kk == 0xA1) in.op = Op::Sknp;
            else                    in.op = Op::Unknown;
            break;
        case 0xF:
            switch (in.kk) {
                case 0x07: in.op = Op::LdVxDt; break;
                case 0x0A: in.op = Op::LdVxK; break;
                case 0x15: in.op = Op::LdDtVx; break;
                case 0x18: in.op = Op::LdStVx; break;
                case 0x1E: in.op = Op::AddIVx; break;
                case 0x29: in.op = Op::LdFVx; break;
                case 0x33: in.op = Op::LdBVx; break;
                case 0x55: in.op = Op::LdIVx; break;
                case 0x65: in.op = Op::LdVxI; break;
                default:   in.op = Op::Unknown; break;
            }
            break;
    }
    return in;
}

const char* op_name(Op op) {
    switch (op) {
        case Op::Sys:     return "SYS";
        case Op::Cls:     return "CLS";
        case Op::Ret:     return "RET";
        case Op::Jp:      return "JP";
        case Op::Call:    return "CALL";
        case Op::SeImm:   return "SE";
        case Op::SneImm:  return "SNE";
        case Op::SeReg:   return "SE";
        case Op::LdImm:   return "LD";
        case Op::AddImm:  return "ADD";
        case Op::LdReg:   return "LD";
        case Op::Or:      return "OR";
        case Op::And:     return "AND";
        case Op::Xor:     return "XOR";
        case Op::AddReg:  return "ADD";
        case Op::Sub:     return "SUB";
        case Op::Shr:     return "SHR";
        case Op::Subn:    return "SUBN";
        case Op::Shl:     return "SHL";
        case Op::SneReg:  return "SNE";
        case Op::LdI:     return "LD";
        case Op::JpV0:    return "JP";
        case Op::Rnd:     return "RND";
        case Op::Drw:     return "DRW";
        case Op::Skp:     return "SKP";
        case Op::Sknp:    return "SKNP";
        case Op::LdVxDt:  return "LD";
        case Op::LdVxK:   return "LD";
        case Op::LdDtVx:  return "LD";
        case Op::LdStVx:  return "LD";
        case Op::AddIVx:  return "ADD";
        case Op::LdFVx:   return "LD";
        case Op::LdBVx:   return "LD";
        case Op::LdIVx:   return "LD";
        case Op::LdVxI:   return "LD";
        case Op::Unknown: return ".DW";
    }
    return "?";
}

static std::string vreg(uint8_t r) {
    std::ostringstream o; o << 'V' << std::uppercase << std::hex << int(r); return o.str();
}
static std::string hex8s(uint8_t v) {
    std::ostringstream o; o << '$' << std::uppercase << std::hex << std::setfill('0') << std::setw(2) << int(v); return o.str();
}
static std::string hex12s(uint16_t v) {
    std::ostringstream o; o << '$' << std::uppercase << std::hex << std::setfill('0') << std::setw(3) << int(v); return o.str();
}
static std::string hex16s(uint16_t v) {
    std::ostringstream o; o << '$' << std::uppercase << std::hex << std::setfill('0') << std::setw(4) << int(v); return o.str();
}

std::string disassemble(const Instruction& in) {
    std::ostringstream out;
    out << op_name(in.op);
    switch (in.op) {
        case Op::Cls:
        case Op::Ret:
            break;
        case Op::Sys:
        case Op::Jp:
        case Op::Call:
            out << ' ' << hex12s(in.nnn); break;
        case Op::SeImm:
        case Op::SneImm:
        case Op::LdImm:
        case Op::AddImm:
        case Op::Rnd:
            out << ' ' << vreg(in.x) << ", " << hex8s(in.kk); break;
        case Op::SeReg:
        case Op::LdReg:
        case Op::Or:
        case Op::And:
        case Op::Xor:
        case Op::AddReg:
        case Op::Sub:
        case Op::Shr:
        case Op::Subn:
        case Op::Shl:
        case Op::SneReg:
            out << ' ' << vreg(in.x) << ", " << vreg(in.y); break;
        case Op::LdI:    out << " I, " << hex12s(in.nnn); break;
        case Op::JpV0:   out << " V0, " << hex12s(in.nnn); break;
        case Op::Drw:    out << ' ' << vreg(in.x) << ", " << vreg(in.y) << ", " << int(in.n); break;
        case Op::Skp:
        case Op::Sknp:   out << ' ' << vreg(in.x); break;
        case Op::LdVxDt: out << ' ' << vreg(in.x) << ", DT"; break;
        case Op::LdVxK:  out << ' ' << vreg(in.x) << ", K"; break;
        case Op::LdDtVx: out << " DT, " << vreg(in.x); break;
        case Op::LdStVx: out << " ST, " << vreg(in.x); break;
        case Op::AddIVx: out << " I, " << vreg(in.x); break;
        case Op::LdFVx:  out << " F, " << vreg(in.x); break;
        case Op::LdBVx:  out << " B, " << vreg(in.x); break;
        case Op::LdIVx:  out << " [I], " << vreg(in.x); break;
        case Op::LdVxI:  out << ' ' << vreg(in.x) << ", [I]"; break;
        case Op::Unknown:
            out << ' ' << hex16s(in.word); break;
    }
    return out.str();
}
