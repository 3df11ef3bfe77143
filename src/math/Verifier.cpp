#include "math/Verifier.hpp"

namespace math {

bool Verifier::isFactor(const mpz_class& N, const mpz_class& candidate) {
    if (candidate <= 1 || candidate >= N) {
        return false;
    }
    return mpz_divisible_p(N.get_mpz_t(), candidate.get_mpz_t()) != 0;
}

} // namespace math
