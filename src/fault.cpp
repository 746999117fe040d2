#include "fault.hpp"

#include <iomanip>
#include <sstream>

const char* fault_name(Fault f) {
    switch (f) {
        case Fault::None:               return "None";
        case Fault::RomTooLarge:        return "RomTooLarge";
        case Fault::UnknownInstruction: return "UnknownInstruction";
        case Fault::StackOverflow:      return "StackOverflow";
        case Fault::StackUnderflow:     return "StackUnderflow";
    }
    return "?";
}

std::string describe(const FaultInfo& f) {
    std::ostringstream o;
    o << fault_name(f.kind);
    if (f.kind == Fault::None || f.kind == Fault::RomTooLarge) return o.str();
    o << std::hex << std::uppercase << std::setfill('0')
      << " {word=" << std::setw(4) << f.word
      << ", address=" << std::setw(4) << f.address << "}";
    return o.str();
}

std::ostream& operator<<(std::ostream& os, Fault f) {
    return os << fault_name(f);
}
