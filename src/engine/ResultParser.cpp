// src/engine/ResultParser.cpp
#include "engine/ResultParser.hpp"
#include "util/GmpUtils.hpp"
#include <regex>

namespace engine {

static const std::regex& measureRe() {
    static const std::regex re(R"(\[MEAS\]\s*Measuring chunk\s+(\d+)\s*=>\s*(\d+))");
    return re;
}

static const std::regex& factorRe() {
    static const std::regex re(R"(Factor found:\s*0[xX]([0-9a-fA-F]+))");
    return re;
}

ResultParser::ResultParser(const math::SearchBlock& block, const mpz_class& chunkStates)
  : block_(block)
  , chunkStates_(chunkStates)
{}

mpz_class ResultParser::recombine(const mpz_class& localValue,
                                  const mpz_class& blockStart,
                                  uint64_t localChunk,
                                  const mpz_class& chunkStates) {
    mpz_class chunk = blockStart + util::fromLimbs64({localChunk});
    return localValue + chunk * chunkStates;
}

std::vector<mpz_class> ResultParser::feed(const std::string& line) {
    std::vector<mpz_class> out;
    std::smatch m;

    if (std::regex_search(line, m, measureRe())) {
        mpz_class chunk(m[1].str(), 10);
        mpz_class local(m[2].str(), 10);
        // out-of-block chunk numbers are engine noise
        if (chunk < block_.activeChunks && util::fitsU64(chunk)) {
            ++recognized_;
            ++measurements_;
            out.push_back(recombine(local, block_.blockStart, util::toU64(chunk), chunkStates_));
        }
    }

    if (std::regex_search(line, m, factorRe())) {
        ++recognized_;
        ++factorReports_;
        out.emplace_back(m[1].str(), 16);
    }
    return out;
}

} // namespace engine
