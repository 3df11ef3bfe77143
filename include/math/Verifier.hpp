#pragma once
#include <gmpxx.h>

namespace math {

class Verifier {
public:
    // 1 < candidate < N and candidate | N
    static bool isFactor(const mpz_class& N, const mpz_class& candidate);
};

} // namespace math
