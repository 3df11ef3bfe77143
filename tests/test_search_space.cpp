#include "math/SearchSpace.hpp"
#include "util/GmpUtils.hpp"

#include <boost/test/unit_test.hpp>
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace math;

BOOST_AUTO_TEST_SUITE(search_space_tests)

BOOST_AUTO_TEST_CASE(search_limit_is_ceil_sqrt)
{
    BOOST_CHECK_EQUAL(searchLimit(21), 5);
    BOOST_CHECK_EQUAL(searchLimit(25), 5);
    BOOST_CHECK_EQUAL(searchLimit(26), 6);
    BOOST_CHECK_EQUAL(searchLimit(2), 2);
    BOOST_CHECK_EQUAL(chunkStates(4), 81);
    BOOST_CHECK_EQUAL(chunkStates(3, 2), 8);
}

BOOST_AUTO_TEST_CASE(partition_small_example)
{
    auto blocks = partition(1000, 1, 3);
    BOOST_REQUIRE_EQUAL(blocks.size(), 3u);
    BOOST_CHECK_EQUAL(blocks[0].blockStart, 0);
    BOOST_CHECK_EQUAL(blocks[0].activeChunks, 4);
    BOOST_CHECK_EQUAL(blocks[1].blockStart, 4);
    BOOST_CHECK_EQUAL(blocks[1].candidateBegin, 12);
    BOOST_CHECK_EQUAL(blocks[2].blockStart, 8);
    BOOST_CHECK_EQUAL(blocks[2].activeChunks, 3);
    BOOST_CHECK_EQUAL(blocks[2].candidateEnd, 32);
}

BOOST_AUTO_TEST_CASE(partition_never_exceeds_worker_count_or_leaves_empty_blocks)
{
    auto blocks = partition(21, 2, 8);
    BOOST_REQUIRE_EQUAL(blocks.size(), 1u);
    BOOST_CHECK_EQUAL(blocks[0].activeChunks, 1);
    BOOST_CHECK_EQUAL(blocks[0].candidateEnd, 5);

    for (unsigned w = 1; w <= 9; ++w) {
        auto bs = partition(100160063, 2, w);
        BOOST_CHECK_LE(bs.size(), w);
        for (const auto& b : bs) BOOST_CHECK_GT(b.activeChunks, 0);
    }
}

BOOST_AUTO_TEST_CASE(partition_covers_interval_exactly)
{
    const char* samples[] = {"2", "3", "97", "1000", "100160063", "341550071728321",
                             "123456789012345678901234567890"};
    for (const char* s : samples) {
        const mpz_class N(s);
        for (uint32_t depth : {1u, 2u, 4u}) {
            for (unsigned workers : {1u, 3u, 7u}) {
                auto blocks = partition(N, depth, workers);
                BOOST_REQUIRE(!blocks.empty());
                mpz_class expect = 0;
                mpz_class nextChunk = 0;
                for (const auto& b : blocks) {
                    BOOST_CHECK_EQUAL(b.candidateBegin, expect);
                    BOOST_CHECK_EQUAL(b.blockStart, nextChunk);
                    BOOST_CHECK_LT(b.candidateBegin, b.candidateEnd);
                    expect = b.candidateEnd;
                    nextChunk += b.activeChunks;
                }
                BOOST_CHECK_EQUAL(expect, searchLimit(N));
            }
        }
    }
}

BOOST_AUTO_TEST_CASE(partition_rejects_bad_input)
{
    BOOST_CHECK_THROW(partition(1, 2, 1), std::invalid_argument);
    BOOST_CHECK_THROW(partition(0, 2, 1), std::invalid_argument);
    BOOST_CHECK_THROW(partition(21, 2, 0), std::invalid_argument);
    BOOST_CHECK_THROW(partition(21, 0, 1), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(cap_blocks_splits_and_preserves_coverage)
{
    auto blocks = partition(1000, 1, 1);
    BOOST_REQUIRE_EQUAL(blocks.size(), 1u);
    BOOST_REQUIRE_EQUAL(blocks[0].activeChunks, 11);

    auto capped = capBlocks(blocks, chunkStates(1), 4);
    BOOST_REQUIRE_EQUAL(capped.size(), 3u);
    BOOST_CHECK_EQUAL(capped[0].activeChunks, 4);
    BOOST_CHECK_EQUAL(capped[1].blockStart, 4);
    BOOST_CHECK_EQUAL(capped[1].candidateBegin, 12);
    BOOST_CHECK_EQUAL(capped[2].activeChunks, 3);
    BOOST_CHECK_EQUAL(capped[2].candidateEnd, 32);

    auto same = capBlocks(blocks, chunkStates(1), 4096);
    BOOST_REQUIRE_EQUAL(same.size(), 1u);
    BOOST_CHECK_EQUAL(same[0].candidateEnd, blocks[0].candidateEnd);
}

BOOST_AUTO_TEST_CASE(block_queue_hands_out_each_sub_block_once)
{
    // 228162 chunks of 81 candidates
    const mpz_class N("341550071728321");
    BlockQueue queue(partition(N, 4, 3), chunkStates(4), 1000);
    BOOST_CHECK_EQUAL(queue.total(), 231);

    std::atomic<uint64_t> chunks{0};
    std::vector<std::thread> pool;
    for (int t = 0; t < 4; ++t) {
        pool.emplace_back([&] {
            while (auto b = queue.next()) chunks += util::toU64(b->activeChunks);
        });
    }
    for (auto& th : pool) th.join();

    BOOST_CHECK_EQUAL(chunks.load(), 228162u);
    BOOST_CHECK_EQUAL(queue.handedOut(), 231u);
    BOOST_CHECK(!queue.next());
}

BOOST_AUTO_TEST_SUITE_END()
