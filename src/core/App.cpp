// src/core/App.cpp
/*
 * TritFactor - chunked divisor search driven by an external qutrit engine
 *
 * The candidate interval [0, ceil(sqrt(N))) is cut into chunk-aligned blocks.
 * Each block is compiled into a .qbin program, executed by the engine in its
 * own process, and every measured candidate is checked with GMP.
 *
 * This code is released as free software.
 */
#include "core/App.hpp"
#include "core/AlgoUtils.hpp"
#include "core/Printer.hpp"
#include "io/JsonBuilder.hpp"
#include "io/WorktodoManager.hpp"
#include "util/GmpUtils.hpp"
#include <algorithm>
#include <csignal>
#include <cstring>
#include <iostream>
#include <stdexcept>

using core::algo::parseConfigFile;
using core::algo::interrupted;
using core::algo::handle_sigint;

namespace core {

App::App(int argc, char** argv)
  : argc_(argc)
  , argv_(argv)
  , logger("tritfactor_jobs.log")
{}

std::vector<std::string> App::mergeConfig(int argc, char** argv) {
    std::vector<std::string> merged;
    merged.push_back(argc > 0 ? argv[0] : "tritfactor");
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-config") == 0 && i+1 < argc) {
            auto cfg_args = parseConfigFile(argv[i+1]);
            merged.insert(merged.end(), cfg_args.begin(), cfg_args.end());
            i++;
        } else {
            merged.emplace_back(argv[i]);
        }
    }
    return merged;
}

SchedulerConfig App::makeSchedulerConfig(const io::CliOptions& o) {
    SchedulerConfig cfg;
    cfg.chunkDepth     = o.depth;
    cfg.workerCount    = o.workers;
    cfg.iterationCount = o.iterations;
    cfg.workerTimeout  = std::chrono::milliseconds(o.timeout_s * 1000);
    cfg.searchTimeout  = std::chrono::milliseconds(o.search_timeout_s * 1000);
    cfg.rounds         = o.rounds;
    cfg.debug          = o.debug;

    auto& lim = cfg.builder.limits;
    lim.maxDepth      = o.max_depth;
    lim.maxChunks     = o.max_chunks;
    lim.registerCount = o.registers;

    // the range placed lower ends where the upper one starts
    auto& lay = cfg.builder.layout;
    lay.offsetBase  = o.offset_reg;
    lay.modulusBase = o.modulus_reg;
    auto room = [](uint32_t base, uint32_t end) { return end > base ? end - base : 0u; };
    if (o.offset_reg < o.modulus_reg) {
        lay.offsetLimbs  = std::min<uint32_t>(32, room(o.offset_reg, o.modulus_reg));
        lay.modulusLimbs = std::min<uint32_t>(64, room(o.modulus_reg, o.registers));
    } else {
        lay.modulusLimbs = std::min<uint32_t>(64, room(o.modulus_reg, o.offset_reg));
        lay.offsetLimbs  = std::min<uint32_t>(32, room(o.offset_reg, o.registers));
    }
    cfg.builder.divisorOracle = o.oracle;

    cfg.executor.enginePath = o.engine_path;
    cfg.executor.killGrace  = std::chrono::milliseconds(o.grace_ms);
    return cfg;
}

int App::run() {
    try {
        auto merged = mergeConfig(argc_, argv_);
        std::vector<char*> c_argv;
        for (auto& s : merged)
            c_argv.push_back(const_cast<char*>(s.c_str()));
        c_argv.push_back(nullptr);
        options = io::CliParser::parse(static_cast<int>(merged.size()), c_argv.data());

        io::WorktodoParser wp{options.worktodo_path};
        if (options.number.empty()) {
            worktodoEntry_ = wp.parse();
        }
        if (worktodoEntry_) {
            options.number = worktodoEntry_->number;
            if (worktodoEntry_->depth)      options.depth = *worktodoEntry_->depth;
            if (worktodoEntry_->iterations) options.iterations = *worktodoEntry_->iterations;
            options.from_worktodo = true;
        }
        if (options.number.empty()) {
            std::cerr << "Error: no valid entry in " << options.worktodo_path
                      << " and no number provided on the command line\n";
            io::printUsage(argv_[0]);
            return EXIT_ERROR;
        }

        int rc = runSearch();
        if (worktodoEntry_ && rc != EXIT_ERROR && !interrupted) {
            if (!wp.removeFirstProcessed(*worktodoEntry_)) {
                std::cerr << "Warning: could not remove the processed entry from "
                          << options.worktodo_path << "\n";
            }
        }
        return rc;
    } catch (const std::exception& e) {
        spinner.finish();
        std::cerr << "Error: " << e.what() << std::endl;
        logger.logmsg("Error: %s\n", e.what());
        logger.flush_log();
        return EXIT_ERROR;
    }
}

int App::runSearch() {
    const mpz_class N = util::parseBigInt(options.number);
    if (N < 2) {
        throw std::invalid_argument("N must be >= 2, got " + N.get_str());
    }

    interrupted = false;
    std::signal(SIGINT, handle_sigint);

    Scheduler scheduler(makeSchedulerConfig(options), &logger);
    engine::ProgramBuilder probe(scheduler.config().builder);
    Printer::banner(options, N, probe.maxActiveChunks());
    logger.logStart(options);

    timer.start();
    SearchResult result = scheduler.run(N,
        [this](uint64_t done, const mpz_class& total, double elapsed, unsigned round) {
            spinner.displayProgress(done, total, elapsed, round, options.rounds);
        });
    spinner.finish();
    const double elapsed = timer.elapsed();
    std::signal(SIGINT, SIG_DFL);

    if (options.debug) Printer::workerSummary(result);

    io::ResultRecord rec;
    switch (result.status) {
        case SearchStatus::Found:       rec.status = "F";   break;
        case SearchStatus::NotFound:    rec.status = "NF";  break;
        case SearchStatus::TimedOut:    rec.status = "TO";  break;
        case SearchStatus::Interrupted: rec.status = "INT"; break;
    }
    rec.N        = N;
    rec.factor   = result.factor;
    rec.cofactor = result.cofactor;
    rec.workers  = options.workers;
    rec.rounds   = result.roundsRun;
    rec.blocks   = result.blocksRun;
    rec.elapsed  = elapsed;
    const std::string json = io::JsonBuilder::generate(options, rec);

    Printer::finalReport(N, result, elapsed, json);

    io::WorktodoManager wm(options);
    wm.saveIndividualJson(N, json);
    wm.appendToResultsTxt(json);

    if (result.status == SearchStatus::Found) {
        logger.logmsg("Factor found by worker %d: %s\n", result.winner, result.factor.get_str().c_str());
    } else {
        logger.logmsg("No factor: %s\n", toString(result.status));
    }
    logger.logEnd(elapsed);

    return result.status == SearchStatus::Found ? EXIT_FOUND : EXIT_NO_FACTOR;
}

} // namespace core
