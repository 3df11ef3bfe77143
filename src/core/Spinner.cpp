// src/core/Spinner.cpp
/*
 * TritFactor - chunked divisor search driven by an external qutrit engine
 *
 * The candidate interval [0, ceil(sqrt(N))) is cut into chunk-aligned blocks.
 * Each block is compiled into a .qbin program, executed by the engine in its
 * own process, and every measured candidate is checked with GMP.
 *
 * This code is released as free software.
 */
#include "core/Spinner.hpp"
#include "util/Color.hpp"
#include <iomanip>
#include <iostream>

namespace core {

void Spinner::displayProgress(uint64_t blocksDone,
                              const mpz_class& blocksTotal,
                              double elapsedTime,
                              unsigned round,
                              unsigned rounds)
{
    static const char symbols[] = {'|','/','-','\\'};

    double pct = 100.0;
    if (blocksTotal > 0) {
        pct = 100.0 * static_cast<double>(blocksDone) / blocksTotal.get_d();
    }

    double rate = elapsedTime > 0 ? blocksDone / elapsedTime : 0.0;
    double remaining = 0.0;
    if (rate > 0 && blocksTotal > blocksDone) {
        mpz_class left = blocksTotal - mpz_class(blocksDone);
        remaining = left.get_d() / rate;
    }

    const char* color = (pct < 50.0) ? util::Color::use(util::Color::RED)
                        : (pct < 90.0) ? util::Color::use(util::Color::YELLOW)
                                       : util::Color::use(util::Color::GREEN);

    uint64_t sec  = static_cast<uint64_t>(remaining);
    uint64_t days = sec / 86400; sec %= 86400;
    uint64_t hrs  = sec / 3600;  sec %= 3600;
    uint64_t min  = sec / 60;    sec %= 60;

    std::cout
    << "\r" << color << symbols[tick_++ % 4] << " "
    << "Progress: "  << std::fixed << std::setprecision(2) << pct << "% | "
    << "Blocks: "    << blocksDone << "/" << blocksTotal     << " | "
    << "Round: "     << round << "/" << rounds               << " | "
    << "Elapsed: "   << std::fixed << std::setprecision(1) << elapsedTime << "s | "
    << "ETA: "       << days << "d " << hrs << "h "
                    << min  << "m " << sec << "s"
    << util::Color::use(util::Color::RESET) << std::flush;
    drawn_ = true;
}

void Spinner::finish() {
    if (drawn_) {
        std::cout << "\n" << std::flush;
        drawn_ = false;
    }
}

} // namespace core
