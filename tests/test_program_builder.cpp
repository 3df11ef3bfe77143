#include "engine/EngineErrors.hpp"
#include "engine/ProgramBuilder.hpp"
#include "math/SearchSpace.hpp"

#include <boost/test/unit_test.hpp>
#include <stdexcept>
#include <vector>

using namespace engine;

namespace {

math::SearchBlock block(unsigned long start, unsigned long count, uint32_t depth) {
    const mpz_class states = math::chunkStates(depth);
    math::SearchBlock b;
    b.blockStart     = start;
    b.activeChunks   = count;
    b.candidateBegin = b.blockStart * states;
    b.candidateEnd   = (b.blockStart + b.activeChunks) * states;
    return b;
}

bool sameInstruction(const Instruction& a, const Instruction& b) {
    return a.opcode == b.opcode && a.target == b.target && a.op1 == b.op1 && a.op2 == b.op2;
}

} // namespace

BOOST_AUTO_TEST_SUITE(program_builder_tests)

BOOST_AUTO_TEST_CASE(single_chunk_program_layout)
{
    ProgramBuilder builder{BuilderConfig{}};
    Program p = builder.build(21, 2, block(0, 1, 2), 1);

    const std::vector<Instruction> expected = {
        {op::INIT, 0, 2, 0},
        {op::STORE_LO, 4032, 21, 0},
        {op::STORE_HI, 4032, 0, 0},
        {op::STORE_LO, 4000, 0, 0},
        {op::STORE_HI, 4000, 0, 0},
        {op::ORACLE, 0, 0x0C, 0},
        {op::GROVER, 0, 0, 0},
        {op::MEASURE, 0, 0, 0},
        {op::HALT, 0, 0, 0},
    };
    BOOST_REQUIRE_EQUAL(p.size(), expected.size());
    for (size_t i = 0; i < expected.size(); ++i) {
        BOOST_CHECK_MESSAGE(sameInstruction(p.instructions()[i], expected[i]), "instruction " << i);
    }
}

BOOST_AUTO_TEST_CASE(every_chunk_is_initialized_oracled_and_measured)
{
    ProgramBuilder builder{BuilderConfig{}};
    const uint32_t iters = 3;
    Program p = builder.build(mpz_class("1000000007"), 4, block(7, 12, 4), iters);

    BOOST_CHECK_EQUAL(p.count(op::INIT), 12u);
    BOOST_CHECK_EQUAL(p.count(op::ORACLE), 12u * iters);
    BOOST_CHECK_EQUAL(p.count(op::GROVER), 12u * iters);
    BOOST_CHECK_EQUAL(p.count(op::MEASURE), 12u);
    BOOST_CHECK_EQUAL(p.instructions().back().opcode, op::HALT);

    // chunk targets stay local to the program
    for (const auto& ins : p.instructions()) {
        if (ins.opcode == op::INIT || ins.opcode == op::MEASURE || ins.opcode == op::ORACLE) {
            BOOST_CHECK_LT(ins.target, 12u);
        }
    }
}

BOOST_AUTO_TEST_CASE(offset_store_precedes_each_oracle)
{
    ProgramBuilder builder{BuilderConfig{}};
    // offsets (5 + c) * 81
    Program p = builder.build(mpz_class("999999999989"), 4, block(5, 3, 4), 1);
    const auto& ins = p.instructions();
    unsigned seen = 0;
    for (size_t i = 0; i < ins.size(); ++i) {
        if (ins[i].opcode != op::ORACLE) continue;
        BOOST_REQUIRE_GE(i, 2u);
        BOOST_CHECK_EQUAL(ins[i - 2].opcode, op::STORE_LO);
        BOOST_CHECK_EQUAL(ins[i - 2].target, 4000u);
        BOOST_CHECK_EQUAL(ins[i - 2].op1, (5u + seen) * 81u);
        BOOST_CHECK_EQUAL(ins[i - 1].opcode, op::STORE_HI);
        ++seen;
    }
    BOOST_CHECK_EQUAL(seen, 3u);
}

BOOST_AUTO_TEST_CASE(large_modulus_uses_several_limbs)
{
    ProgramBuilder builder{BuilderConfig{}};
    mpz_class N = (mpz_class(1) << 130) + 3;
    Program p = builder.build(N, 2, block(0, 1, 2), 0);
    unsigned modulusStores = 0;
    for (const auto& ins : p.instructions()) {
        if ((ins.opcode == op::STORE_LO || ins.opcode == op::STORE_HI)
            && ins.target >= 4032 && ins.target < 4096) {
            ++modulusStores;
        }
    }
    BOOST_CHECK_EQUAL(modulusStores, 6u);
}

BOOST_AUTO_TEST_CASE(limits_are_enforced)
{
    ProgramBuilder builder{BuilderConfig{}};
    BOOST_CHECK_EQUAL(builder.maxActiveChunks(), 4000u);
    BOOST_CHECK_THROW(builder.build(21, 0, block(0, 1, 1), 1), SizeExceeded);
    BOOST_CHECK_THROW(builder.build(21, 11, block(0, 1, 11), 1), SizeExceeded);
    BOOST_CHECK_THROW(builder.build(21, 2, block(0, 4001, 2), 1), SizeExceeded);
    BOOST_CHECK_NO_THROW(builder.build(21, 2, block(0, 4000, 2), 0));
    BOOST_CHECK_THROW(builder.build(21, 2, block(0, 0, 2), 1), std::invalid_argument);

    mpz_class huge = mpz_class(1) << (64 * 64);
    BOOST_CHECK_THROW(builder.build(huge, 2, block(0, 1, 2), 1), SizeExceeded);
}

BOOST_AUTO_TEST_CASE(whole_search_is_checked_up_front)
{
    ProgramBuilder builder{BuilderConfig{}};
    BOOST_CHECK_NO_THROW(builder.checkSearch(21, 2));
    BOOST_CHECK_NO_THROW(builder.checkSearch(mpz_class("341550071728321"), 10));
    BOOST_CHECK_THROW(builder.checkSearch(21, 0), SizeExceeded);
    BOOST_CHECK_THROW(builder.checkSearch(21, 11), SizeExceeded);
    BOOST_CHECK_THROW(builder.checkSearch(mpz_class(1) << (64 * 64), 2), SizeExceeded);

    BuilderConfig narrow;
    narrow.layout.offsetLimbs = 1;
    ProgramBuilder oneLimb{narrow};
    // sqrt(2^126) = 2^63: every offset still fits one limb
    BOOST_CHECK_NO_THROW(oneLimb.checkSearch(mpz_class(1) << 126, 2));
    BOOST_CHECK_THROW(oneLimb.checkSearch(mpz_class(1) << 200, 2), SizeExceeded);
}

BOOST_AUTO_TEST_CASE(bad_register_layouts_are_rejected)
{
    BuilderConfig overlap;
    overlap.layout.offsetBase = 4030;
    BOOST_CHECK_THROW(ProgramBuilder{overlap}, SizeExceeded);

    BuilderConfig outside;
    outside.layout.modulusBase = 4040;
    BOOST_CHECK_THROW(ProgramBuilder{outside}, SizeExceeded);

    BuilderConfig noRoom;
    noRoom.layout.offsetBase = 0;
    BOOST_CHECK_THROW(ProgramBuilder{noRoom}, SizeExceeded);

    // 16-bit register field: a bigger register file does not lift that
    BuilderConfig beyondField;
    beyondField.limits.registerCount = 70000;
    beyondField.layout.modulusBase   = 65530;
    BOOST_CHECK_THROW(ProgramBuilder{beyondField}, SizeExceeded);

    BuilderConfig lastRegister;
    lastRegister.limits.registerCount = 70000;
    lastRegister.layout.modulusBase   = 0x10000 - 64;
    BOOST_CHECK_NO_THROW(ProgramBuilder{lastRegister});

    BuilderConfig small;
    small.limits.maxChunks = 16;
    BOOST_CHECK_EQUAL(ProgramBuilder{small}.maxActiveChunks(), 16u);
}

BOOST_AUTO_TEST_SUITE_END()
