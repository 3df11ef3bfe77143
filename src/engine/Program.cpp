// src/engine/Program.cpp
#include "engine/Program.hpp"
#include <algorithm>
#include <ostream>
#include <stdexcept>

namespace engine {

Program::Program(std::vector<Instruction> instructions)
  : instructions_(std::move(instructions))
{
    if (instructions_.empty() || instructions_.back().opcode != op::HALT) {
        throw std::invalid_argument("program must end with HALT");
    }
    bytes_.reserve(instructions_.size() * WORD_BYTES);
    for (const auto& ins : instructions_) {
        Word w = encode(ins);
        bytes_.insert(bytes_.end(), w.begin(), w.end());
    }
}

size_t Program::count(uint32_t opcode) const {
    return static_cast<size_t>(std::count_if(instructions_.begin(), instructions_.end(),
        [opcode](const Instruction& i) { return i.opcode == opcode; }));
}

void Program::write(std::ostream& out) const {
    out.write(reinterpret_cast<const char*>(bytes_.data()),
              static_cast<std::streamsize>(bytes_.size()));
}

} // namespace engine
