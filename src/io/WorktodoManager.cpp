/*
 * TritFactor - chunked divisor search driven by an external qutrit engine
 *
 * The candidate interval [0, ceil(sqrt(N))) is cut into chunk-aligned blocks.
 * Each block is compiled into a .qbin program, executed by the engine in its
 * own process, and every measured candidate is checked with GMP.
 *
 * This code is released as free software.
 */
// src/io/WorktodoManager.cpp
#include "io/WorktodoManager.hpp"
#include "io/JsonBuilder.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>

namespace io {

WorktodoManager::WorktodoManager(const io::CliOptions& opts)
  : options_(opts)
{}

std::string WorktodoManager::saveIndividualJson(const mpz_class& N,
                                                const std::string& jsonResult) const
{
    // ex: ./save/1A2B3C4D_factor_result.json
    std::error_code ec;
    std::filesystem::create_directories(options_.save_path, ec);
    std::string file = options_.save_path + "/"
                     + JsonBuilder::digest(N) + "_factor_result.json";
    JsonBuilder::write(jsonResult, file);
    std::cout << "JSON result written to: " << file << "\n";
    return file;
}

void WorktodoManager::appendToResultsTxt(const std::string& jsonResult) const
{
    // ex: ./save/results.txt
    std::error_code ec;
    std::filesystem::create_directories(options_.save_path, ec);
    std::string resultPath = options_.save_path + "/results.txt";
    std::ofstream resOut(resultPath, std::ios::app);
    if (resOut) {
        resOut << jsonResult << "\n";
        std::cout << "Result appended to: " << resultPath << "\n";
    } else {
        std::cerr << "Cannot open " << resultPath << " for appending\n";
    }
}

} // namespace io
