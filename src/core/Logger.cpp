// src/core/Logger.cpp
/*
 * TritFactor - chunked divisor search driven by an external qutrit engine
 *
 * The candidate interval [0, ceil(sqrt(N))) is cut into chunk-aligned blocks.
 * Each block is compiled into a .qbin program, executed by the engine in its
 * own process, and every measured candidate is checked with GMP.
 *
 * This code is released as free software.
 */
#include "core/Logger.hpp"
#include "io/CliParser.hpp"
#include <fstream>
#include <vector>
#include <string>
#include <iostream>
#include <cstdarg>
#include <cstdio>

namespace core {

Logger::Logger(const std::string& logFile)
  : _logFile(logFile)
{}

void Logger::logStart(const io::CliOptions& options) {
    logmsg("=== Start : N=%s, depth=%u, workers=%u, iters=%u\n",
           options.number.c_str(),
           options.depth,
           options.workers,
           options.iterations);
}

void Logger::logEnd(double elapsed) {
    logmsg("=== End : elapsed=%.3f s\n", elapsed);
    flush_log();
}

void Logger::logmsg(const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    char buf[1024];
    vsnprintf(buf, sizeof(buf), fmt, ap);
    va_end(ap);
    std::lock_guard<std::mutex> lk(_mtx);
    _messages.emplace_back(buf);
}

void Logger::flush_log() {
    std::lock_guard<std::mutex> lk(_mtx);
    if (_logFile.empty()) {
        _messages.clear();
        return;
    }
    std::ofstream out(_logFile, std::ios::app);
    if (!out) {
        std::cerr << "Cannot open " << _logFile << " for appending\n";
        return;
    }
    for (auto& m : _messages) {
        out << m;
    }
    _messages.clear();
}

} // namespace core
