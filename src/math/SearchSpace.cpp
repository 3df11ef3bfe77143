#include "math/SearchSpace.hpp"
#include "util/GmpUtils.hpp"
#include <stdexcept>
#include <utility>

namespace math {

mpz_class chunkStates(uint32_t chunkDepth, uint32_t radix) {
    return util::ipow(radix, chunkDepth);
}

mpz_class searchLimit(const mpz_class& N) {
    return util::ceilSqrt(N);
}

static SearchBlock makeBlock(const mpz_class& start,
                             const mpz_class& count,
                             const mpz_class& states,
                             const mpz_class& limit) {
    SearchBlock b;
    b.blockStart     = start;
    b.activeChunks   = count;
    b.candidateBegin = start * states;
    mpz_class end    = (start + count) * states;
    b.candidateEnd   = end < limit ? end : limit;
    return b;
}

std::vector<SearchBlock> partition(const mpz_class& N,
                                   uint32_t chunkDepth,
                                   unsigned workerCount,
                                   uint32_t radix) {
    if (N < 2) {
        throw std::invalid_argument("N must be >= 2, got " + N.get_str());
    }
    if (workerCount == 0) {
        throw std::invalid_argument("worker count must be >= 1");
    }
    if (chunkDepth == 0 || radix < 2) {
        throw std::invalid_argument("chunk depth must be >= 1");
    }

    const mpz_class states   = chunkStates(chunkDepth, radix);
    const mpz_class limit    = searchLimit(N);
    const mpz_class total    = util::ceilDiv(limit, states);
    const mpz_class perBlock = util::ceilDiv(total, mpz_class(workerCount));

    std::vector<SearchBlock> blocks;
    for (mpz_class start = 0; start < total; start += perBlock) {
        mpz_class left  = total - start;
        mpz_class count = left < perBlock ? left : perBlock;
        blocks.push_back(makeBlock(start, count, states, limit));
    }
    return blocks;
}

std::vector<SearchBlock> capBlocks(const std::vector<SearchBlock>& blocks,
                                   const mpz_class& chunkStates,
                                   uint64_t maxChunks) {
    BlockQueue queue(blocks, chunkStates, maxChunks);
    std::vector<SearchBlock> out;
    while (auto b = queue.next()) {
        out.push_back(std::move(*b));
    }
    return out;
}

BlockQueue::BlockQueue(std::vector<SearchBlock> blocks, mpz_class chunkStates, uint64_t maxChunks)
  : blocks_(std::move(blocks))
  , chunkStates_(std::move(chunkStates))
  , maxChunks_(maxChunks)
  , total_(0)
{
    if (maxChunks_ == 0) {
        throw std::invalid_argument("maxChunks must be >= 1");
    }
    const mpz_class cap(util::fromLimbs64({maxChunks_}));
    for (const auto& b : blocks_) {
        total_ += util::ceilDiv(b.activeChunks, cap);
    }
}

std::optional<SearchBlock> BlockQueue::next() {
    std::lock_guard<std::mutex> lk(mtx_);
    const mpz_class cap(util::fromLimbs64({maxChunks_}));
    while (blockIndex_ < blocks_.size()) {
        const SearchBlock& b = blocks_[blockIndex_];
        if (consumed_ >= b.activeChunks) {
            ++blockIndex_;
            consumed_ = 0;
            continue;
        }
        mpz_class left  = b.activeChunks - consumed_;
        mpz_class count = left < cap ? left : cap;
        mpz_class start = b.blockStart + consumed_;
        consumed_ += count;
        ++handedOut_;

        SearchBlock sub;
        sub.blockStart     = start;
        sub.activeChunks   = count;
        sub.candidateBegin = start * chunkStates_;
        mpz_class end      = (start + count) * chunkStates_;
        sub.candidateEnd   = end < b.candidateEnd ? end : b.candidateEnd;
        return sub;
    }
    return std::nullopt;
}

uint64_t BlockQueue::handedOut() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return handedOut_;
}

} // namespace math
