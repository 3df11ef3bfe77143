// include/engine/Program.hpp
#ifndef ENGINE_PROGRAM_HPP
#define ENGINE_PROGRAM_HPP

#include "engine/Instruction.hpp"
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace engine {

/// Encoded instruction stream terminated by HALT. Immutable once built.
class Program {
public:
    // Encodes every instruction; throws EncodingOverflow on a bad field and
    // std::invalid_argument if the stream does not end with HALT.
    explicit Program(std::vector<Instruction> instructions);

    size_t size() const { return instructions_.size(); }
    size_t byteSize() const { return bytes_.size(); }

    const std::vector<Instruction>& instructions() const { return instructions_; }
    const std::vector<uint8_t>& bytes() const { return bytes_; }

    size_t count(uint32_t opcode) const;

    void write(std::ostream& out) const;

private:
    std::vector<Instruction> instructions_;
    std::vector<uint8_t>     bytes_;
};

} // namespace engine

#endif // ENGINE_PROGRAM_HPP
