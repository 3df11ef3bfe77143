#include "util/TeeBuf.hpp"

#include <boost/test/unit_test.hpp>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

BOOST_AUTO_TEST_SUITE(tee_buf_tests)

BOOST_AUTO_TEST_CASE(both_targets_receive_everything)
{
    std::stringbuf console, log;
    std::mutex mtx;
    util::TeeBuf tee(&console, &log, mtx);
    std::ostream os(&tee);
    os << "N = " << 21 << '\n' << std::flush;
    BOOST_CHECK_EQUAL(console.str(), "N = 21\n");
    BOOST_CHECK_EQUAL(log.str(), "N = 21\n");
}

BOOST_AUTO_TEST_CASE(concurrent_lines_are_not_interleaved)
{
    // two tees sharing one log target, as stdout and stderr do
    std::stringbuf out, err, log;
    std::mutex mtx;
    util::TeeBuf teeOut(&out, &log, mtx);
    util::TeeBuf teeErr(&err, &log, mtx);

    const std::string line = "[W0]   [MEAS] Measuring chunk 95 => 0\n";
    const int perThread = 500;
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&, t] {
            std::ostream os(t % 2 ? &teeErr : &teeOut);
            for (int i = 0; i < perThread; ++i) {
                os << line;
            }
        });
    }
    for (auto& th : threads) th.join();

    std::istringstream in(log.str());
    std::string got;
    int count = 0;
    while (std::getline(in, got)) {
        BOOST_REQUIRE_EQUAL(got + "\n", line);
        ++count;
    }
    BOOST_CHECK_EQUAL(count, 8 * perThread);
    BOOST_CHECK_EQUAL(out.str().size(), 4 * perThread * line.size());
}

BOOST_AUTO_TEST_SUITE_END()
