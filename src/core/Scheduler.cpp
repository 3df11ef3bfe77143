/*
 * TritFactor - chunked divisor search driven by an external qutrit engine
 *
 * The candidate interval [0, ceil(sqrt(N))) is cut into chunk-aligned blocks.
 * Each block is compiled into a .qbin program, executed by the engine in its
 * own process, and every measured candidate is checked with GMP.
 *
 * This code is released as free software.
 */
#include "core/Scheduler.hpp"
#include "core/AlgoUtils.hpp"
#include "engine/EngineErrors.hpp"
#include "math/Verifier.hpp"
#include "util/Timer.hpp"
#include <algorithm>
#include <optional>
#include <stdexcept>
#include <thread>

namespace core {

const char* toString(SearchStatus s) {
    switch (s) {
        case SearchStatus::Found:       return "found";
        case SearchStatus::NotFound:    return "not found";
        case SearchStatus::TimedOut:    return "timed out";
        case SearchStatus::Interrupted: return "interrupted";
    }
    return "?";
}

Scheduler::Scheduler(SchedulerConfig cfg, Logger* logger)
  : cfg_(std::move(cfg))
  , logger_(logger)
  , builder_(cfg_.builder)
  , executor_(cfg_.executor)
{
    if (cfg_.workerCount == 0) {
        throw std::invalid_argument("worker count must be >= 1");
    }
    if (cfg_.rounds == 0) cfg_.rounds = 1;
}

std::vector<math::SearchBlock> Scheduler::partition(const mpz_class& N,
                                                    uint32_t chunkDepth,
                                                    unsigned workerCount,
                                                    uint32_t radix) {
    return math::partition(N, chunkDepth, workerCount, radix);
}

SearchResult Scheduler::run(const mpz_class& N, ProgressFn progress) {
    if (N < 2) {
        throw std::invalid_argument("N must be >= 2, got " + N.get_str());
    }
    // fail fast instead of letting every worker discover it
    if (!engine::Executor::isExecutable(cfg_.executor.enginePath)) {
        throw engine::ExecutorNotFound(cfg_.executor.enginePath);
    }
    // a depth or N no block can encode is a configuration error, not a miss
    builder_.checkSearch(N, cfg_.chunkDepth);

    SearchResult result;

    // the root itself lies outside [0, ceil(sqrt(N)))
    if (mpz_perfect_square_p(N.get_mpz_t()) && N > 1) {
        mpz_class r;
        mpz_sqrt(r.get_mpz_t(), N.get_mpz_t());
        result.status   = SearchStatus::Found;
        result.factor   = r;
        result.cofactor = r;
        if (logger_) logger_->logmsg("N is a perfect square, root %s\n", r.get_str().c_str());
        return result;
    }

    SearchStatus status = SearchStatus::NotFound;
    for (unsigned round = 1; round <= cfg_.rounds; ++round) {
        result.roundsRun = round;
        if (logger_) logger_->logmsg("Round %u/%u\n", round, cfg_.rounds);
        status = dispatch(N, round, result, progress);
        if (status != SearchStatus::NotFound) break;
    }
    result.status = status;
    if (status == SearchStatus::Found) {
        result.cofactor = N / result.factor;
    }
    return result;
}

SearchStatus Scheduler::dispatch(const mpz_class& N, unsigned round, SearchResult& result,
                                 const ProgressFn& progress) {
    const mpz_class states = math::chunkStates(cfg_.chunkDepth, cfg_.builder.limits.radix);
    math::BlockQueue queue(partition(N, cfg_.chunkDepth, cfg_.workerCount, cfg_.builder.limits.radix),
                           states,
                           builder_.maxActiveChunks());

    ResultSlot slot;
    SearchContext ctx;
    ctx.N              = N;
    ctx.chunkDepth     = cfg_.chunkDepth;
    ctx.iterationCount = cfg_.iterationCount;
    ctx.chunkStates    = states;
    ctx.workerTimeout  = cfg_.workerTimeout;
    ctx.debug          = cfg_.debug;
    ctx.builder        = &builder_;
    ctx.executor       = &executor_;
    ctx.slot           = &slot;
    ctx.logger         = logger_;

    stop_ = false;
    uint64_t done = 0;
    unsigned running = cfg_.workerCount;
    std::vector<WorkerReport> reports;

    auto workerLoop = [&]() {
        while (!stop_) {
            auto block = queue.next();
            if (!block) break;
            const int id = nextWorkerId_++;
            auto task = std::make_shared<WorkerTask>(id, std::move(*block), ctx,
                                                     [this](int w) { onAccepted(w); });
            {
                std::lock_guard<std::mutex> lk(mtx_);
                active_[id] = task;
            }
            // registered after a cancelAll snapshot: cancel ourselves
            if (stop_) task->requestCancel();

            WorkerReport rep = task->run();
            task->retire();
            {
                std::lock_guard<std::mutex> lk(mtx_);
                active_.erase(id);
                reports.push_back(std::move(rep));
                ++done;
            }
            cv_.notify_all();
        }
        {
            std::lock_guard<std::mutex> lk(mtx_);
            --running;
        }
        cv_.notify_all();
    };

    std::vector<std::thread> threads;
    threads.reserve(cfg_.workerCount);
    for (unsigned t = 0; t < cfg_.workerCount; ++t) {
        threads.emplace_back(workerLoop);
    }

    util::Timer timer;
    std::optional<SearchStatus> forced;
    for (;;) {
        uint64_t doneNow = 0;
        {
            std::unique_lock<std::mutex> lk(mtx_);
            cv_.wait_for(lk, std::chrono::seconds(1), [&] { return running == 0; });
            if (running == 0) break;
            doneNow = done;
        }
        if (!forced && algo::interrupted) {
            forced = SearchStatus::Interrupted;
        } else if (!forced && timer.expired(cfg_.searchTimeout)) {
            forced = SearchStatus::TimedOut;
        }
        if (forced && !stop_.exchange(true)) {
            if (logger_) logger_->logmsg("Search %s, cancelling workers\n", toString(*forced));
            cancelAll(-1);
        }
        if (progress) progress(doneNow, queue.total(), timer.elapsed(), round);
    }
    for (auto& th : threads) th.join();
    if (progress) progress(done, queue.total(), timer.elapsed(), round);

    result.blocksRun += queue.handedOut();
    result.lateReports += slot.lateOffers();
    for (auto& r : reports) result.reports.push_back(std::move(r));

    if (auto w = slot.winner()) {
        result.factor = w->factor;
        result.winner = w->workerId;
        return SearchStatus::Found;
    }

    return forced ? *forced : SearchStatus::NotFound;
}

void Scheduler::onAccepted(int workerId) {
    stop_ = true;
    if (logger_) logger_->logmsg("[W%d] accepted, cancelling the other workers\n", workerId);
    cancelAll(workerId);
}

void Scheduler::cancelAll(int exceptWorker) {
    std::vector<std::shared_ptr<WorkerTask>> victims;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        for (auto& kv : active_) {
            if (kv.first != exceptWorker) victims.push_back(kv.second);
        }
    }
    for (auto& t : victims) t->requestCancel();
    const auto deadline = std::chrono::steady_clock::now() + cfg_.executor.killGrace;
    for (auto& t : victims) t->enforceCancel(deadline);
}

} // namespace core
