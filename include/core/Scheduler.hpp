// include/core/Scheduler.hpp
#ifndef CORE_SCHEDULER_HPP
#define CORE_SCHEDULER_HPP

#include "core/Logger.hpp"
#include "core/WorkerTask.hpp"
#include "engine/Executor.hpp"
#include "engine/ProgramBuilder.hpp"
#include "math/SearchSpace.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <vector>
#include <gmpxx.h>

namespace core {

struct SchedulerConfig {
    uint32_t                  chunkDepth     = 4;
    unsigned                  workerCount    = 1;
    uint32_t                  iterationCount = 5;
    std::chrono::milliseconds workerTimeout{120000};
    std::chrono::milliseconds searchTimeout{0};   // 0: unbounded
    unsigned                  rounds = 1;
    bool                      debug  = false;
    engine::BuilderConfig     builder;
    engine::ExecutorConfig    executor;
};

enum class SearchStatus { Found, NotFound, TimedOut, Interrupted };

const char* toString(SearchStatus s);

struct SearchResult {
    SearchStatus              status = SearchStatus::NotFound;
    mpz_class                 factor;
    mpz_class                 cofactor;
    int                       winner = -1;
    unsigned                  roundsRun = 0;
    uint64_t                  blocksRun = 0;
    size_t                    lateReports = 0;
    std::vector<WorkerReport> reports;
};

/// Partitions [0, ceil(sqrt(N))) and runs the blocks on a bounded pool of
/// worker threads, each driving one engine process at a time. The first
/// verified factor wins and every other engine is killed.
class Scheduler {
public:
    using ProgressFn = std::function<void(uint64_t done, const mpz_class& total,
                                          double elapsed, unsigned round)>;

    explicit Scheduler(SchedulerConfig cfg, Logger* logger = nullptr);

    static std::vector<math::SearchBlock> partition(const mpz_class& N,
                                                    uint32_t chunkDepth,
                                                    unsigned workerCount,
                                                    uint32_t radix = math::ENGINE_RADIX);

    /// Full search including retry rounds. NotFound is a normal outcome.
    /// Throws std::invalid_argument for N < 2 and engine errors that make
    /// every block fail the same way (missing engine, bad layout).
    SearchResult run(const mpz_class& N, ProgressFn progress = {});

    // One pass over the whole interval.
    SearchStatus dispatch(const mpz_class& N, unsigned round, SearchResult& result,
                          const ProgressFn& progress);

    const SchedulerConfig& config() const { return cfg_; }

private:
    void onAccepted(int workerId);
    void cancelAll(int exceptWorker);

    SchedulerConfig         cfg_;
    Logger*                 logger_;
    engine::ProgramBuilder  builder_;
    engine::Executor        executor_;

    std::mutex                                 mtx_;
    std::condition_variable                    cv_;
    std::map<int, std::shared_ptr<WorkerTask>> active_;
    std::atomic<bool>                          stop_{false};
    std::atomic<int>                           nextWorkerId_{0};
};

} // namespace core

#endif // CORE_SCHEDULER_HPP
