// tests/fake_engine.cpp
// Stand-in for qutrit_engine: decodes a .qbin program, answers the divisor
// oracle classically (N < 2^64) and prints measurement lines.
//
// FAKE_ENGINE_MODE:
//   normal         measure the smallest divisor offset of every marked chunk
//   hexfactor      unmarked measurements, then "Factor found: 0x..." per hit
//   hang           ignore SIGTERM and never answer
//   crash          print a stray line and exit 3
//   silent         exit 0 without output
//   stall_on_miss  like normal, but block forever when nothing was marked
// FAKE_ENGINE_OFFSET_REG / FAKE_ENGINE_MODULUS_REG override 4000 / 4032.
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <map>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace {

constexpr uint32_t INIT     = 0x01;
constexpr uint32_t MEASURE  = 0x07;
constexpr uint32_t GROVER   = 0x08;
constexpr uint32_t ORACLE   = 0x0B;
constexpr uint32_t STORE_LO = 0x17;
constexpr uint32_t STORE_HI = 0x18;
constexpr uint32_t HALT     = 0xFF;
constexpr uint32_t DIVISOR_ORACLE = 0x0C;

struct Chunk {
    uint32_t depth = 0;
    uint64_t offset = 0;
    bool     marked = false;
    bool     hit = false;
    uint64_t value = 0;
};

uint32_t envReg(const char* name, uint32_t def) {
    const char* v = std::getenv(name);
    return v ? static_cast<uint32_t>(std::strtoul(v, nullptr, 0)) : def;
}

uint64_t ipow3(uint32_t d) {
    uint64_t s = 1;
    while (d--) s *= 3;
    return s;
}

[[noreturn]] void blockForever() {
    for (;;) std::this_thread::sleep_for(std::chrono::seconds(1));
}

} // namespace

int main(int argc, char** argv) {
    const char* m = std::getenv("FAKE_ENGINE_MODE");
    const std::string mode = m ? m : "normal";

    if (mode == "hang") {
        std::signal(SIGTERM, SIG_IGN);
        blockForever();
    }
    if (mode == "silent") return 0;
    if (mode == "crash") {
        std::printf("segmentation fault in chunk allocator\n");
        std::fflush(stdout);
        return 3;
    }

    if (argc < 2) {
        std::fprintf(stderr, "usage: %s <program.qbin>\n", argv[0]);
        return 64;
    }
    std::ifstream in(argv[1], std::ios::binary);
    if (!in) {
        std::fprintf(stderr, "cannot open %s\n", argv[1]);
        return 66;
    }

    const uint32_t offsetReg  = envReg("FAKE_ENGINE_OFFSET_REG", 4000);
    const uint32_t modulusReg = envReg("FAKE_ENGINE_MODULUS_REG", 4032);

    std::unordered_map<uint32_t, uint64_t> regs;
    std::map<uint32_t, Chunk> chunks;
    std::vector<uint32_t> measured;

    std::printf("Qutrit engine (fake) loaded %s\n", argv[1]);

    unsigned char w[8];
    bool halted = false;
    while (!halted && in.read(reinterpret_cast<char*>(w), 8)) {
        uint64_t word = 0;
        for (int i = 7; i >= 0; --i) word = (word << 8) | w[i];
        const uint32_t opc = static_cast<uint32_t>(word & 0xFFFF);
        const uint32_t tgt = static_cast<uint32_t>((word >> 16) & 0xFFFF);
        const uint64_t a   = (word >> 32) & 0xFFFF;
        const uint64_t b   = (word >> 48) & 0xFFFF;

        switch (opc) {
            case INIT:
                chunks[tgt].depth = static_cast<uint32_t>(a);
                break;
            case STORE_LO: {
                uint64_t& r = regs[tgt];
                r = (r & 0xFFFFFFFF00000000ULL) | a | (b << 16);
                break;
            }
            case STORE_HI: {
                uint64_t& r = regs[tgt];
                r = (r & 0xFFFFFFFFULL) | (a << 32) | (b << 48);
                break;
            }
            case ORACLE: {
                Chunk& c = chunks[tgt];
                c.offset = regs[offsetReg];
                if (a != DIVISOR_ORACLE) break;
                const uint64_t n = regs[modulusReg];
                const uint64_t s = ipow3(c.depth);
                for (uint64_t v = 0; v < s; ++v) {
                    const uint64_t cand = c.offset + v;
                    if (cand > 1 && cand < n && n % cand == 0) {
                        c.hit = true;
                        c.value = v;
                        break;
                    }
                }
                c.marked = true;
                break;
            }
            case GROVER:
                break;
            case MEASURE:
                measured.push_back(tgt);
                break;
            case HALT:
                halted = true;
                break;
            default:
                std::fprintf(stderr, "unknown opcode 0x%02x\n", opc);
                return 65;
        }
    }

    bool anyHit = false;
    for (uint32_t c : measured) {
        const Chunk& ch = chunks[c];
        anyHit = anyHit || ch.hit;
        const uint64_t s = ipow3(ch.depth ? ch.depth : 1);
        // a miss still collapses to something; (c * 7 + 1) mod 3^d keeps it deterministic
        uint64_t v = (mode != "hexfactor" && ch.hit) ? ch.value : (c * 7ULL + 1) % s;
        std::printf("  [MEAS] Measuring chunk %u => %llu\n", c, static_cast<unsigned long long>(v));
        std::fflush(stdout);
    }
    if (mode == "hexfactor") {
        for (uint32_t c : measured) {
            const Chunk& ch = chunks[c];
            if (!ch.hit) continue;
            std::printf("Factor found: 0x%llx\n", static_cast<unsigned long long>(ch.offset + ch.value));
            std::fflush(stdout);
        }
    }
    if (mode == "stall_on_miss" && !anyHit) {
        blockForever();
    }
    std::printf("Engine halted.\n");
    return 0;
}
