// include/math/SearchSpace.hpp
#ifndef MATH_SEARCHSPACE_HPP
#define MATH_SEARCHSPACE_HPP

#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>
#include <gmpxx.h>

namespace math {

constexpr uint32_t ENGINE_RADIX = 3;

/// A run of consecutive chunks. Chunk blockStart + i holds the candidates
/// [(blockStart + i) * chunkStates, (blockStart + i + 1) * chunkStates),
/// clipped to [candidateBegin, candidateEnd).
struct SearchBlock {
    mpz_class blockStart;
    mpz_class activeChunks;
    mpz_class candidateBegin;
    mpz_class candidateEnd;
};

mpz_class chunkStates(uint32_t chunkDepth, uint32_t radix = ENGINE_RADIX);

// Upper bound (exclusive) of the candidate interval: ceil(sqrt(N)).
mpz_class searchLimit(const mpz_class& N);

/// Cuts [0, ceil(sqrt(N))) into at most workerCount chunk-aligned blocks.
/// Throws std::invalid_argument for N < 2, workerCount == 0 or depth == 0.
std::vector<SearchBlock> partition(const mpz_class& N,
                                   uint32_t chunkDepth,
                                   unsigned workerCount,
                                   uint32_t radix = ENGINE_RADIX);

/// Splits every block wider than maxChunks into consecutive sub-blocks.
std::vector<SearchBlock> capBlocks(const std::vector<SearchBlock>& blocks,
                                   const mpz_class& chunkStates,
                                   uint64_t maxChunks);

/// Thread-safe lazy version of capBlocks: hands out sub-blocks one by one
/// so a huge interval is never materialized.
class BlockQueue {
public:
    BlockQueue(std::vector<SearchBlock> blocks, mpz_class chunkStates, uint64_t maxChunks);

    std::optional<SearchBlock> next();
    const mpz_class& total() const { return total_; }
    uint64_t handedOut() const;

private:
    std::vector<SearchBlock> blocks_;
    mpz_class chunkStates_;
    uint64_t maxChunks_;
    mpz_class total_;

    mutable std::mutex mtx_;
    size_t blockIndex_ = 0;
    mpz_class consumed_ = 0;
    uint64_t handedOut_ = 0;
};

} // namespace math

#endif // MATH_SEARCHSPACE_HPP
