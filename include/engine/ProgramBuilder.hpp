// include/engine/ProgramBuilder.hpp
#ifndef ENGINE_PROGRAMBUILDER_HPP
#define ENGINE_PROGRAMBUILDER_HPP

#include "engine/Program.hpp"
#include "math/SearchSpace.hpp"
#include <cstdint>
#include <gmpxx.h>

namespace engine {

// Hard limits of the external engine; exceeding them crashes it.
struct EngineLimits {
    uint32_t radix         = 3;
    uint32_t maxDepth      = 10;
    uint32_t maxChunks     = 4096;
    uint32_t registerCount = 4096;
};

// Registers reserved for the program's inputs. One 64-bit limb per register,
// least significant limb at the base. Chunk result slots must stay clear of
// both ranges.
struct RegisterLayout {
    uint32_t offsetBase   = 4000;
    uint32_t offsetLimbs  = 32;
    uint32_t modulusBase  = 4032;
    uint32_t modulusLimbs = 64;
};

struct BuilderConfig {
    EngineLimits   limits;
    RegisterLayout layout;
    uint32_t       divisorOracle = 0x0C;
};

class ProgramBuilder {
public:
    explicit ProgramBuilder(const BuilderConfig& cfg);

    /// INIT each chunk, load N, run iterationCount rounds of
    /// (offset store, divisor oracle, diffusion) per chunk, MEASURE, HALT.
    /// Throws SizeExceeded when the block does not fit the engine.
    Program build(const mpz_class& N,
                  uint32_t chunkDepth,
                  const math::SearchBlock& block,
                  uint32_t iterationCount) const;

    // Rejects a depth or an N that no block of the search could encode.
    // Throws SizeExceeded.
    void checkSearch(const mpz_class& N, uint32_t chunkDepth) const;

    // Largest activeChunks a program can use with this layout.
    uint64_t maxActiveChunks() const;

    const BuilderConfig& config() const { return cfg_; }

private:
    void validateLayout() const;
    void checkDepth(uint32_t chunkDepth) const;
    static void checkLimbs(const char* what, size_t needed, uint32_t reserved);
    void storeLimbs(std::vector<Instruction>& out,
                    uint32_t baseRegister,
                    const std::vector<uint64_t>& limbs) const;

    BuilderConfig cfg_;
};

} // namespace engine

#endif // ENGINE_PROGRAMBUILDER_HPP
