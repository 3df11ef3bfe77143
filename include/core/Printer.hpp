// core/Printer.hpp
#ifndef CORE_PRINTER_HPP
#define CORE_PRINTER_HPP

#include "core/Scheduler.hpp"
#include "io/CliParser.hpp"
#include <string>
#include <gmpxx.h>

namespace core {

class Printer {
public:
    static void banner(const io::CliOptions& opts, const mpz_class& N, uint32_t maxActiveChunks);
    static void workerSummary(const SearchResult& result);
    static void finalReport(const mpz_class& N,
                            const SearchResult& result,
                            double elapsed,
                            const std::string& jsonResult);
    static std::string formatNumber(const mpz_class& N);
};

} // namespace core

#endif
