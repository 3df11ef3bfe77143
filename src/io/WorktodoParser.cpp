/*
 * TritFactor - chunked divisor search driven by an external qutrit engine
 *
 * The candidate interval [0, ceil(sqrt(N))) is cut into chunk-aligned blocks.
 * Each block is compiled into a .qbin program, executed by the engine in its
 * own process, and every measured candidate is checked with GMP.
 *
 * This code is released as free software.
 */
#include "io/WorktodoParser.hpp"
#include "util/GmpUtils.hpp"
#include "util/StringUtils.hpp"
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace io {

WorktodoParser::WorktodoParser(const std::string& filename)
  : filename_(filename)
{}

static bool isIntegerToken(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    return true;
}

static uint32_t toU32(const std::string& s) {
    unsigned long v = std::stoul(s);
    if (v > 0xFFFFFFFFUL) throw std::out_of_range(s);
    return static_cast<uint32_t>(v);
}

std::optional<WorktodoEntry> WorktodoParser::parse() {
    std::ifstream file(filename_);
    if (!file.is_open()) {
        std::cerr << "Cannot open " << filename_ << "\n";
        return std::nullopt;
    }

    std::string line;
    while (std::getline(file, line)) {
        std::string t = util::trim(line);
        if (t.empty() || t[0] == '#') continue;

        auto top = util::split(t, '=');
        if (top.size() != 2 || util::trim(top[0]) != "Factor") continue;

        auto parts = util::split(top[1], ',');
        for (auto& p : parts) p = util::trim(p);
        if (parts.empty() || parts.size() > 3 || parts[0].empty()) {
            std::cerr << "Skipping malformed worktodo line: " << line << "\n";
            continue;
        }

        try {
            util::parseBigInt(parts[0]);

            WorktodoEntry entry;
            entry.number  = parts[0];
            entry.rawLine = line;
            if (parts.size() >= 2) {
                if (!isIntegerToken(parts[1])) throw std::invalid_argument(parts[1]);
                entry.depth = toU32(parts[1]);
            }
            if (parts.size() == 3) {
                if (!isIntegerToken(parts[2])) throw std::invalid_argument(parts[2]);
                entry.iterations = toU32(parts[2]);
            }
            std::cout << "Loaded N=" << entry.number << " from " << filename_ << "\n";
            return entry;
        } catch (const std::exception&) {
            std::cerr << "Skipping malformed worktodo line: " << line << "\n";
        }
    }
    return std::nullopt;
}

bool WorktodoParser::removeFirstProcessed(const WorktodoEntry& entry) {
    namespace fs = std::filesystem;
    const fs::path src(filename_);
    const fs::path savePath = src.parent_path() / "worktodo_save.txt";

    std::ifstream inFile(filename_);
    std::ofstream tempFile(filename_ + ".tmp");
    std::ofstream saveFile(savePath, std::ios::app);
    if (!inFile || !tempFile || !saveFile) return false;

    std::string line;
    bool skipped = false;
    while (std::getline(inFile, line)) {
        if (!skipped && line == entry.rawLine) {
            skipped = true;
            saveFile << line << "\n";
            continue;
        }
        tempFile << line << "\n";
    }

    inFile.close();
    tempFile.close();
    saveFile.close();

    std::error_code ec;
    fs::rename(filename_ + ".tmp", src, ec);
    if (ec) {
        std::cerr << "Cannot update " << filename_ << ": " << ec.message() << "\n";
        fs::remove(filename_ + ".tmp", ec);
        return false;
    }
    return skipped;
}

} // namespace io
