#ifndef IO_JSONBUILDER_HPP
#define IO_JSONBUILDER_HPP

#include "io/CliParser.hpp"
#include <cstdint>
#include <string>
#include <gmpxx.h>

namespace io {

// Everything one finished search contributes to its JSON line.
struct ResultRecord {
    std::string status;          // "F" factor found, "NF" not found, "TO" timed out, "INT" interrupted
    mpz_class   N;
    mpz_class   factor;          // 0 when none
    mpz_class   cofactor;
    unsigned    workers = 0;
    unsigned    rounds = 0;
    uint64_t    blocks = 0;
    double      elapsed = 0.0;
};

class JsonBuilder {
public:
    static std::string generate(const CliOptions& opts, const ResultRecord& record);

    // 8 uppercase hex digits identifying N, used to name per-job files.
    static std::string digest(const mpz_class& N);

    static std::string timestamp();

    // Write JSON string to a file.
    static void write(const std::string& json,
                      const std::string& path);
};

} // namespace io

#endif // IO_JSONBUILDER_HPP
