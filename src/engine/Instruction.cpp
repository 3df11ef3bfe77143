// src/engine/Instruction.cpp
#include "engine/Instruction.hpp"
#include "engine/EngineErrors.hpp"
#include <sstream>

namespace engine {

static uint64_t checkedField(uint64_t value, const char* name, uint64_t opcode) {
    if (value > FIELD_MAX) {
        std::ostringstream oss;
        oss << "field '" << name << "' = " << value
            << " does not fit in " << FIELD_BITS << " bits (opcode 0x"
            << std::hex << opcode << ")";
        throw EncodingOverflow(oss.str());
    }
    return value;
}

Word encode(uint64_t opcode, uint64_t target, uint64_t op1, uint64_t op2) {
    uint64_t v = checkedField(opcode, "opcode", opcode)
               | (checkedField(target, "target", opcode) << 16)
               | (checkedField(op1, "op1", opcode) << 32)
               | (checkedField(op2, "op2", opcode) << 48);
    Word w{};
    for (size_t i = 0; i < WORD_BYTES; ++i) {
        w[i] = static_cast<uint8_t>(v >> (8 * i));
    }
    return w;
}

Word encode(const Instruction& ins) {
    return encode(ins.opcode, ins.target, ins.op1, ins.op2);
}

uint64_t wordValue(const Word& w) {
    uint64_t v = 0;
    for (size_t i = 0; i < WORD_BYTES; ++i) {
        v |= static_cast<uint64_t>(w[i]) << (8 * i);
    }
    return v;
}

} // namespace engine
