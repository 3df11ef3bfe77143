#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <gmpxx.h>
#include <gmp.h>

// GMP helpers shared by the program builder, the parser and the CLI
namespace util {
    // Decimal, or hexadecimal with a 0x prefix. Throws std::invalid_argument.
    mpz_class parseBigInt(const std::string& text);

    std::vector<uint64_t> toLimbs64(const mpz_class& value);
    mpz_class fromLimbs64(const std::vector<uint64_t>& limbs);

    uint64_t toU64(const mpz_class& value);
    bool fitsU64(const mpz_class& value);

    mpz_class ceilSqrt(const mpz_class& n);
    mpz_class ipow(uint32_t base, uint32_t exp);
    mpz_class ceilDiv(const mpz_class& a, const mpz_class& b);

}
