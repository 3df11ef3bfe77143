#include "math/Verifier.hpp"
#include "util/GmpUtils.hpp"

#include <boost/test/unit_test.hpp>
#include <stdexcept>

using math::Verifier;

BOOST_AUTO_TEST_SUITE(verifier_tests)

BOOST_AUTO_TEST_CASE(accepts_only_proper_divisors)
{
    BOOST_CHECK(Verifier::isFactor(21, 3));
    BOOST_CHECK(Verifier::isFactor(21, 7));
    BOOST_CHECK(!Verifier::isFactor(21, 1));
    BOOST_CHECK(!Verifier::isFactor(21, 21));
    BOOST_CHECK(!Verifier::isFactor(21, 0));
    BOOST_CHECK(!Verifier::isFactor(21, 42));
    BOOST_CHECK(!Verifier::isFactor(21, 5));
    BOOST_CHECK(!Verifier::isFactor(21, -3));
}

BOOST_AUTO_TEST_CASE(big_numbers)
{
    const mpz_class p("170141183460469231731687303715884105727");   // 2^127 - 1
    const mpz_class q("618970019642690137449562111");               // 2^89 - 1
    BOOST_CHECK(Verifier::isFactor(p * q, q));
    BOOST_CHECK(!Verifier::isFactor(p * q, q + 2));
}

BOOST_AUTO_TEST_CASE(parse_big_int_formats)
{
    BOOST_CHECK_EQUAL(util::parseBigInt("341550071728321"), mpz_class("341550071728321"));
    BOOST_CHECK_EQUAL(util::parseBigInt("0x4d"), 77);
    BOOST_CHECK_EQUAL(util::parseBigInt("1_000_003"), 1000003);
    BOOST_CHECK_THROW(util::parseBigInt(""), std::invalid_argument);
    BOOST_CHECK_THROW(util::parseBigInt("0x"), std::invalid_argument);
    BOOST_CHECK_THROW(util::parseBigInt("12a"), std::invalid_argument);
    BOOST_CHECK_THROW(util::parseBigInt("-5"), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(limb_helpers)
{
    const mpz_class v = (mpz_class(7) << 64) + 9;
    auto limbs = util::toLimbs64(v);
    BOOST_REQUIRE_EQUAL(limbs.size(), 2u);
    BOOST_CHECK_EQUAL(limbs[0], 9u);
    BOOST_CHECK_EQUAL(limbs[1], 7u);
    BOOST_CHECK_EQUAL(util::fromLimbs64(limbs), v);
    BOOST_CHECK_EQUAL(util::toLimbs64(0).size(), 1u);
    BOOST_CHECK(!util::fitsU64(v));
    BOOST_CHECK_THROW(util::toU64(v), std::out_of_range);
    BOOST_CHECK_EQUAL(util::toU64(mpz_class("18446744073709551615")), 18446744073709551615ULL);
}

BOOST_AUTO_TEST_SUITE_END()
