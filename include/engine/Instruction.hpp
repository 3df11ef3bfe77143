// include/engine/Instruction.hpp
#ifndef ENGINE_INSTRUCTION_HPP
#define ENGINE_INSTRUCTION_HPP

#include <array>
#include <cstddef>
#include <cstdint>

namespace engine {

namespace op {
    constexpr uint32_t INIT     = 0x01;
    constexpr uint32_t MEASURE  = 0x07;
    constexpr uint32_t GROVER   = 0x08;
    constexpr uint32_t ORACLE   = 0x0B;
    constexpr uint32_t STORE_LO = 0x17;
    constexpr uint32_t STORE_HI = 0x18;
    constexpr uint32_t HALT     = 0xFF;
}

// Canonical layout: opcode:16 | target:16 | op1:16 | op2:16, little-endian.
constexpr unsigned FIELD_BITS = 16;
constexpr uint64_t FIELD_MAX  = (1ULL << FIELD_BITS) - 1;
constexpr std::size_t WORD_BYTES = 8;

using Word = std::array<uint8_t, WORD_BYTES>;

struct Instruction {
    uint32_t opcode = 0;
    uint32_t target = 0;
    uint32_t op1 = 0;
    uint32_t op2 = 0;
};

/// Packs one instruction into its 8-byte word.
/// Throws EncodingOverflow when a field does not fit in 16 bits.
Word encode(uint64_t opcode, uint64_t target = 0, uint64_t op1 = 0, uint64_t op2 = 0);
Word encode(const Instruction& ins);

uint64_t wordValue(const Word& w);

} // namespace engine

#endif // ENGINE_INSTRUCTION_HPP
