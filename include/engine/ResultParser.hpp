// include/engine/ResultParser.hpp
#ifndef ENGINE_RESULTPARSER_HPP
#define ENGINE_RESULTPARSER_HPP

#include "math/SearchSpace.hpp"
#include <cstdint>
#include <string>
#include <vector>
#include <gmpxx.h>

namespace engine {

/// Scans engine output for
///   "[MEAS] Measuring chunk <c> => <v>"   local measurement of chunk c
///   "Factor found: 0x<hex>"               direct factor report
/// Everything else is ignored. Duplicates are passed through untouched.
class ResultParser {
public:
    ResultParser(const math::SearchBlock& block, const mpz_class& chunkStates);

    // Candidates carried by this line, in global coordinates.
    std::vector<mpz_class> feed(const std::string& line);

    size_t recognized() const { return recognized_; }
    size_t measurements() const { return measurements_; }
    size_t factorReports() const { return factorReports_; }

    static mpz_class recombine(const mpz_class& localValue,
                               const mpz_class& blockStart,
                               uint64_t localChunk,
                               const mpz_class& chunkStates);

private:
    math::SearchBlock block_;
    mpz_class         chunkStates_;
    size_t            recognized_    = 0;
    size_t            measurements_  = 0;
    size_t            factorReports_ = 0;
};

} // namespace engine

#endif // ENGINE_RESULTPARSER_HPP
