/*
 * TritFactor - chunked divisor search driven by an external qutrit engine
 *
 * The candidate interval [0, ceil(sqrt(N))) is cut into chunk-aligned blocks.
 * Each block is compiled into a .qbin program, executed by the engine in its
 * own process, and every measured candidate is checked with GMP.
 *
 * This code is released as free software.
 */
#include "core/Printer.hpp"
#include "math/SearchSpace.hpp"
#include "util/Color.hpp"
#include <iomanip>
#include <iostream>
#include <sstream>

namespace core {

void Printer::banner(const io::CliOptions& o, const mpz_class& N, uint32_t maxActiveChunks) {
    std::cout << util::Color::use(util::Color::CYAN) << "TritFactor : divisor search on an external qutrit engine"
              << util::Color::use(util::Color::RESET) << "\n"
              << "Factoring : " << Printer::formatNumber(N) << "\n"
              << "Search limit : " << math::searchLimit(N) << "\n"
              << "Chunk depth : " << o.depth << " (" << math::chunkStates(o.depth) << " states per chunk)\n"
              << "Workers : " << o.workers << " | Iterations : " << o.iterations
              << " | Rounds : " << o.rounds << "\n"
              << "Chunks per program : " << maxActiveChunks << "\n"
              << "Engine : " << o.engine_path << "\n"
              << "Worker timeout : " << o.timeout_s << " s";
    if (o.search_timeout_s > 0) {
        std::cout << " | Search timeout : " << o.search_timeout_s << " s";
    }
    std::cout << "\nSave path : " << o.save_path << "\n";
    if (o.debug) {
        std::cout << "\n Debug mode is activated. Raw engine output will be displayed.\n";
    }
}

void Printer::workerSummary(const SearchResult& result) {
    for (const auto& r : result.reports) {
        std::cout << "  [W" << r.workerId << "] chunks "
                  << r.block.blockStart << "+" << r.block.activeChunks
                  << " " << toString(r.state);
        if (!r.reason.empty()) std::cout << " (" << r.reason << ")";
        std::cout << " " << std::fixed << std::setprecision(2) << r.elapsed << "s"
                  << ", " << r.linesRead << " lines, "
                  << r.candidatesChecked << " candidates\n";
    }
    if (result.lateReports > 0) {
        std::cout << "  " << result.lateReports << " late factor report(s) discarded\n";
    }
}

void Printer::finalReport(const mpz_class& N,
                          const SearchResult& result,
                          double elapsed,
                          const std::string& jsonResult) {
    switch (result.status) {
        case SearchStatus::Found:
            std::cout << "\n" << util::Color::use(util::Color::BOLD_GREEN)
                      << N << " = " << result.factor << " * " << result.cofactor
                      << util::Color::use(util::Color::RESET) << "\n";
            break;
        case SearchStatus::NotFound:
            std::cout << "\n" << util::Color::use(util::Color::YELLOW) << "No factor of " << N << " found after "
                      << result.roundsRun << " round(s)." << util::Color::use(util::Color::RESET) << "\n";
            break;
        case SearchStatus::TimedOut:
            std::cout << "\n" << util::Color::use(util::Color::RED) << "Search for a factor of " << N
                      << " timed out." << util::Color::use(util::Color::RESET) << "\n";
            break;
        case SearchStatus::Interrupted:
            std::cout << "\n" << util::Color::use(util::Color::RED) << "Search interrupted by user."
                      << util::Color::use(util::Color::RESET) << "\n";
            break;
    }

    std::cout << "\nJSON result:\n" << jsonResult << std::endl;
    std::cout << "\nTotal elapsed time: " << elapsed << " seconds.\n";
}

std::string Printer::formatNumber(const mpz_class& N) {
    std::ostringstream oss;
    std::string digits = N.get_str(10);
    if (digits.size() > 40) {
        oss << digits.substr(0, 12) << "..." << digits.substr(digits.size() - 12)
            << " (" << digits.size() << " digits)";
    } else {
        oss << digits;
    }
    oss << " [" << mpz_sizeinbase(N.get_mpz_t(), 2) << " bits]";
    return oss.str();
}

} // namespace core
