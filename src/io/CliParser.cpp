// CliParser.cpp
/*
 * TritFactor - chunked divisor search driven by an external qutrit engine
 *
 * The candidate interval [0, ceil(sqrt(N))) is cut into chunk-aligned blocks.
 * Each block is compiled into a .qbin program, executed by the engine in its
 * own process, and every measured candidate is checked with GMP.
 *
 * This code is released as free software.
 */
#include "io/CliParser.hpp"
#include "util/PathUtils.hpp"
#include "core/Version.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <thread>

namespace io {

void printUsage(const char* progName) {
    std::cout << "Usage: " << progName << " <N> [-engine <path>] [-depth <d>] [-workers <n>] [-iters <k>]" << std::endl;
    std::cout << "              [-timeout <s>] [-search_timeout <s>] [-grace <ms>] [-rounds <n>]" << std::endl;
    std::cout << "              [-f <path>] [-worktodo <path>] [-config <path>] [-debug]" << std::endl;
    std::cout << std::endl;
    std::cout << "  <N>                  : Number to factor, decimal or hexadecimal with 0x prefix (required unless -worktodo is used)" << std::endl;
    std::cout << "  -engine <path>       : (Optional) qutrit engine executable (default: qutrit_engine next to this program, then ./qutrit_engine)" << std::endl;
    std::cout << "  -depth <d>           : (Optional) chunk depth, each chunk covers 3^d candidates (default: 4)" << std::endl;
    std::cout << "  -workers <n>         : (Optional) number of concurrent engine processes (default: hardware threads)" << std::endl;
    std::cout << "  -iters <k>           : (Optional) oracle + diffusion rounds per chunk (default: 5)" << std::endl;
    std::cout << "  -timeout <s>         : (Optional) wall-clock limit for one engine run in seconds (default: 120)" << std::endl;
    std::cout << "  -search_timeout <s>  : (Optional) limit for the whole search in seconds, 0 disables it (default: 0)" << std::endl;
    std::cout << "  -grace <ms>          : (Optional) delay between SIGTERM and SIGKILL when stopping an engine (default: 500)" << std::endl;
    std::cout << "  -rounds <n>          : (Optional) repeat the whole search up to n times while no factor is found (default: 1)" << std::endl;
    std::cout << "  -max_chunks <n>      : (Optional) engine chunk limit per program (default: 4096)" << std::endl;
    std::cout << "  -max_depth <n>       : (Optional) engine chunk depth limit (default: 10)" << std::endl;
    std::cout << "  -registers <n>       : (Optional) engine register file size (default: 4096)" << std::endl;
    std::cout << "  -offset_reg <r>      : (Optional) first register of the offset range (default: 4000)" << std::endl;
    std::cout << "  -modulus_reg <r>     : (Optional) first register of the modulus range (default: 4032)" << std::endl;
    std::cout << "  -oracle <id>         : (Optional) divisor-test oracle id (default: 0x0C)" << std::endl;
    std::cout << "  -f <path>            : (Optional) directory for results.txt and JSON results (default: current directory)" << std::endl;
    std::cout << "  -worktodo <path>     : (Optional) read N from a worktodo file (default: ./worktodo.txt)" << std::endl;
    std::cout << "  -config <path>       : (Optional) load options from a config file" << std::endl;
    std::cout << "  -debug               : (Optional) echo raw engine output per worker" << std::endl;
    std::cout << std::endl;
    std::cout << "Example:\n  " << progName << " 0x4d -depth 3 -workers 4 -iters 5 -timeout 60 \\\n"
              << "            -engine ./qutrit_engine -f ./results -config ./mydir/settings.cfg" << std::endl;
}

static uint64_t parseUnsigned(const char* opt, const char* text, uint64_t maxValue) {
    if (text == nullptr || *text == '\0' || *text == '-') {
        throw std::invalid_argument(std::string(opt) + " expects a non-negative integer");
    }
    char* end = nullptr;
    errno = 0;
    unsigned long long v = std::strtoull(text, &end, 0);
    if (errno != 0 || end == text || *end != '\0' || v > maxValue) {
        throw std::invalid_argument(std::string(opt) + ": invalid value '" + text + "'");
    }
    return static_cast<uint64_t>(v);
}

static std::string resolveEnginePath() {
    std::string candidate;
    try {
        candidate = util::getExecutableDir() + "/qutrit_engine";
    } catch (const std::runtime_error&) {
        candidate.clear();
    }
    if (!candidate.empty() && std::filesystem::exists(candidate)) {
        return candidate;
    }
    return "./qutrit_engine";
}

CliOptions CliParser::parse(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-h") == 0
         || std::strcmp(argv[i], "--help") == 0
         || std::strcmp(argv[i], "-help") == 0)
        {
            printUsage(argv[0]);
            std::exit(EXIT_SUCCESS);
        }
    }
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-v") == 0
        || std::strcmp(argv[i], "--version") == 0
        || std::strcmp(argv[i], "-version") == 0)
        {
            std::cout << "tritfactor Release v" << core::TRITFACTOR_VERSION << "\n";
            std::exit(EXIT_SUCCESS);
        }
    }
    constexpr uint64_t U32 = std::numeric_limits<uint32_t>::max();
    CliOptions opts;

    for (int i = 1; i < argc; ++i) {
        const char* a = argv[i];
        const bool hasValue = i + 1 < argc;
        if (std::strcmp(a, "-engine") == 0 && hasValue) {
            opts.engine_path = argv[++i];
        }
        else if (std::strcmp(a, "-depth") == 0 && hasValue) {
            opts.depth = static_cast<uint32_t>(parseUnsigned(a, argv[++i], U32));
        }
        else if (std::strcmp(a, "-workers") == 0 && hasValue) {
            opts.workers = static_cast<unsigned>(parseUnsigned(a, argv[++i], 1024));
            if (opts.workers == 0) {
                throw std::invalid_argument("-workers must be >= 1");
            }
        }
        else if (std::strcmp(a, "-iters") == 0 && hasValue) {
            opts.iterations = static_cast<uint32_t>(parseUnsigned(a, argv[++i], U32));
        }
        else if (std::strcmp(a, "-timeout") == 0 && hasValue) {
            opts.timeout_s = parseUnsigned(a, argv[++i], 86400ULL * 365);
        }
        else if (std::strcmp(a, "-search_timeout") == 0 && hasValue) {
            opts.search_timeout_s = parseUnsigned(a, argv[++i], 86400ULL * 365);
        }
        else if (std::strcmp(a, "-grace") == 0 && hasValue) {
            opts.grace_ms = parseUnsigned(a, argv[++i], 600000);
        }
        else if (std::strcmp(a, "-rounds") == 0 && hasValue) {
            opts.rounds = static_cast<unsigned>(parseUnsigned(a, argv[++i], 1000000));
            if (opts.rounds == 0) opts.rounds = 1;
        }
        else if (std::strcmp(a, "-max_chunks") == 0 && hasValue) {
            opts.max_chunks = static_cast<uint32_t>(parseUnsigned(a, argv[++i], U32));
        }
        else if (std::strcmp(a, "-max_depth") == 0 && hasValue) {
            opts.max_depth = static_cast<uint32_t>(parseUnsigned(a, argv[++i], U32));
        }
        else if (std::strcmp(a, "-registers") == 0 && hasValue) {
            opts.registers = static_cast<uint32_t>(parseUnsigned(a, argv[++i], U32));
        }
        else if (std::strcmp(a, "-offset_reg") == 0 && hasValue) {
            opts.offset_reg = static_cast<uint32_t>(parseUnsigned(a, argv[++i], 0xFFFF));
        }
        else if (std::strcmp(a, "-modulus_reg") == 0 && hasValue) {
            opts.modulus_reg = static_cast<uint32_t>(parseUnsigned(a, argv[++i], 0xFFFF));
        }
        else if (std::strcmp(a, "-oracle") == 0 && hasValue) {
            opts.oracle = static_cast<uint32_t>(parseUnsigned(a, argv[++i], 0xFFFF));
        }
        else if (std::strcmp(a, "-f") == 0 && hasValue) {
            opts.save_path = argv[++i];
        }
        else if (std::strcmp(a, "-worktodo") == 0 && hasValue) {
            opts.worktodo_path = argv[++i];
        }
        else if (std::strcmp(a, "-config") == 0 && hasValue) {
            opts.config_path = argv[++i];
        }
        else if (std::strcmp(a, "-debug") == 0) {
            opts.debug = true;
        }
        else if (a[0] == '-' && !(a[1] >= '0' && a[1] <= '9')) {
            throw std::invalid_argument(std::string("unknown or incomplete option ") + a);
        }
        else {
            opts.number = a;
        }
    }

    if (opts.workers == 0) {
        opts.workers = std::max(1u, std::thread::hardware_concurrency());
    }
    if (opts.engine_path.empty()) {
        opts.engine_path = resolveEnginePath();
    }
    return opts;
}

} // namespace io
