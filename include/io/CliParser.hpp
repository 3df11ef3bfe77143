// CliParser.hpp
#ifndef IO_CLIPARSER_HPP
#define IO_CLIPARSER_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace io {

struct CliOptions {
    std::string number;                      // N as typed: decimal or 0x hex
    uint32_t depth = 4;
    unsigned workers = 0;                    // 0: hardware concurrency
    uint32_t iterations = 5;
    std::string engine_path;
    uint64_t timeout_s = 120;                // per worker
    uint64_t search_timeout_s = 0;           // whole search, 0 = none
    uint64_t grace_ms = 500;
    unsigned rounds = 1;
    uint32_t max_chunks = 4096;
    uint32_t max_depth = 10;
    uint32_t registers = 4096;
    uint32_t offset_reg = 4000;
    uint32_t modulus_reg = 4032;
    uint32_t oracle = 0x0C;
    bool debug = false;
    std::string save_path = ".";
    std::string config_path;
    std::string worktodo_path = "worktodo.txt";
    bool from_worktodo = false;
};

class CliParser {
public:
    // Throws std::invalid_argument on a malformed or out-of-range value.
    // -h and -v print and exit.
    static CliOptions parse(int argc, char** argv);
};

void printUsage(const char* progName);

} // namespace io

#endif // IO_CLIPARSER_HPP
