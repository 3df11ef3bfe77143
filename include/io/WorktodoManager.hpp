// src/io/WorktodoManager.hpp
#pragma once

#include "io/CliParser.hpp"
#include <string>
#include <gmpxx.h>

namespace io {

class WorktodoManager {
public:
    explicit WorktodoManager(const io::CliOptions& opts);

    // <save_path>/<digest>_factor_result.json; returns the path written.
    std::string saveIndividualJson(const mpz_class& N,
                                   const std::string& jsonResult) const;

    void appendToResultsTxt(const std::string& jsonResult) const;

private:
    const io::CliOptions& options_;
};

} // namespace io
