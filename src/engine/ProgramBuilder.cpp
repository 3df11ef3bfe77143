/*
 * TritFactor - chunked divisor search driven by an external qutrit engine
 *
 * The candidate interval [0, ceil(sqrt(N))) is cut into chunk-aligned blocks.
 * Each block is compiled into a .qbin program, executed by the engine in its
 * own process, and every measured candidate is checked with GMP.
 *
 * This code is released as free software.
 */
#include "engine/ProgramBuilder.hpp"
#include "engine/EngineErrors.hpp"
#include "util/GmpUtils.hpp"
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace engine {

// registers are addressed through a 16-bit instruction field
static constexpr uint64_t REGISTER_FIELD_LIMIT = 0x10000;

static bool overlaps(uint64_t aBegin, uint64_t aEnd, uint64_t bBegin, uint64_t bEnd) {
    return aBegin < bEnd && bBegin < aEnd;
}

ProgramBuilder::ProgramBuilder(const BuilderConfig& cfg)
  : cfg_(cfg)
{
    validateLayout();
}

void ProgramBuilder::validateLayout() const {
    const auto& L = cfg_.layout;
    const auto& E = cfg_.limits;
    if (L.offsetLimbs == 0 || L.modulusLimbs == 0) {
        throw SizeExceeded("register layout needs at least one limb for offset and modulus");
    }
    const uint64_t offEnd = uint64_t(L.offsetBase) + L.offsetLimbs;
    const uint64_t modEnd = uint64_t(L.modulusBase) + L.modulusLimbs;
    if (offEnd > E.registerCount || modEnd > E.registerCount) {
        std::ostringstream oss;
        oss << "register layout exceeds the engine register file (" << E.registerCount
            << " registers): offset [" << L.offsetBase << ", " << offEnd
            << "), modulus [" << L.modulusBase << ", " << modEnd << ")";
        throw SizeExceeded(oss.str());
    }
    if (offEnd > REGISTER_FIELD_LIMIT || modEnd > REGISTER_FIELD_LIMIT) {
        std::ostringstream oss;
        oss << "register layout ends past the 16-bit register field: offset [" << L.offsetBase
            << ", " << offEnd << "), modulus [" << L.modulusBase << ", " << modEnd << ")";
        throw SizeExceeded(oss.str());
    }
    if (overlaps(L.offsetBase, offEnd, L.modulusBase, modEnd)) {
        throw SizeExceeded("offset and modulus register ranges overlap");
    }
    if (maxActiveChunks() == 0) {
        throw SizeExceeded("register layout leaves no room for chunk result slots");
    }
}

void ProgramBuilder::checkDepth(uint32_t chunkDepth) const {
    if (chunkDepth == 0 || chunkDepth > cfg_.limits.maxDepth) {
        std::ostringstream oss;
        oss << "chunk depth " << chunkDepth << " outside [1, " << cfg_.limits.maxDepth << "]";
        throw SizeExceeded(oss.str());
    }
}

void ProgramBuilder::checkLimbs(const char* what, size_t needed, uint32_t reserved) {
    if (needed > reserved) {
        std::ostringstream oss;
        oss << what << " needs " << needed << " limbs, layout reserves " << reserved;
        throw SizeExceeded(oss.str());
    }
}

void ProgramBuilder::checkSearch(const mpz_class& N, uint32_t chunkDepth) const {
    checkDepth(chunkDepth);
    checkLimbs("modulus", util::toLimbs64(N).size(), cfg_.layout.modulusLimbs);

    // highest chunk offset any block of [0, ceil(sqrt(N))) can store
    const mpz_class states = math::chunkStates(chunkDepth, cfg_.limits.radix);
    const mpz_class limit  = math::searchLimit(N);
    const mpz_class chunks = util::ceilDiv(limit, states);
    const mpz_class maxOffset = chunks > 0 ? mpz_class((chunks - 1) * states) : mpz_class(0);
    checkLimbs("chunk offset", util::toLimbs64(maxOffset).size(), cfg_.layout.offsetLimbs);
}

uint64_t ProgramBuilder::maxActiveChunks() const {
    const auto& L = cfg_.layout;
    uint64_t n = cfg_.limits.maxChunks;
    // chunks occupy [0, n); the first reserved register caps n
    n = std::min<uint64_t>(n, L.offsetBase);
    n = std::min<uint64_t>(n, L.modulusBase);
    return n;
}

void ProgramBuilder::storeLimbs(std::vector<Instruction>& out,
                                uint32_t baseRegister,
                                const std::vector<uint64_t>& limbs) const {
    for (size_t i = 0; i < limbs.size(); ++i) {
        const uint64_t limb = limbs[i];
        const uint32_t reg  = baseRegister + static_cast<uint32_t>(i);
        out.push_back({op::STORE_LO, reg,
                       static_cast<uint32_t>(limb & 0xFFFF),
                       static_cast<uint32_t>((limb >> 16) & 0xFFFF)});
        out.push_back({op::STORE_HI, reg,
                       static_cast<uint32_t>((limb >> 32) & 0xFFFF),
                       static_cast<uint32_t>((limb >> 48) & 0xFFFF)});
    }
}

Program ProgramBuilder::build(const mpz_class& N,
                              uint32_t chunkDepth,
                              const math::SearchBlock& block,
                              uint32_t iterationCount) const {
    const auto& L = cfg_.layout;
    const auto& E = cfg_.limits;

    checkDepth(chunkDepth);
    if (block.activeChunks <= 0) {
        throw std::invalid_argument("search block has no active chunk");
    }
    const uint64_t maxChunks = maxActiveChunks();
    if (!util::fitsU64(block.activeChunks) || util::toU64(block.activeChunks) > maxChunks) {
        std::ostringstream oss;
        oss << "block needs " << block.activeChunks.get_str()
            << " chunks, engine limit with this register layout is " << maxChunks;
        throw SizeExceeded(oss.str());
    }
    const uint32_t active = static_cast<uint32_t>(util::toU64(block.activeChunks));

    const std::vector<uint64_t> modulus = util::toLimbs64(N);
    checkLimbs("modulus", modulus.size(), L.modulusLimbs);

    const mpz_class states    = math::chunkStates(chunkDepth, E.radix);
    const mpz_class maxOffset = (block.blockStart + active - 1) * states;
    const size_t offsetLimbs  = util::toLimbs64(maxOffset).size();
    checkLimbs("chunk offset", offsetLimbs, L.offsetLimbs);

    std::vector<Instruction> prog;
    prog.reserve(active * (2 + static_cast<size_t>(iterationCount) * (2 * offsetLimbs + 2))
                 + 2 * modulus.size() + 1);

    for (uint32_t c = 0; c < active; ++c) {
        prog.push_back({op::INIT, c, chunkDepth, 0});
    }

    storeLimbs(prog, L.modulusBase, modulus);

    for (uint32_t k = 0; k < iterationCount; ++k) {
        for (uint32_t c = 0; c < active; ++c) {
            std::vector<uint64_t> offset = util::toLimbs64((block.blockStart + c) * states);
            // same width for every chunk so a short offset clears stale high limbs
            offset.resize(offsetLimbs, 0);
            storeLimbs(prog, L.offsetBase, offset);
            prog.push_back({op::ORACLE, c, cfg_.divisorOracle, 0});
            prog.push_back({op::GROVER, c, 0, 0});
        }
    }

    for (uint32_t c = 0; c < active; ++c) {
        prog.push_back({op::MEASURE, c, 0, 0});
    }
    prog.push_back({op::HALT, 0, 0, 0});

    return Program(std::move(prog));
}

} // namespace engine
