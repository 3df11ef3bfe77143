// include/core/WorkerTask.hpp
#ifndef CORE_WORKERTASK_HPP
#define CORE_WORKERTASK_HPP

#include "core/Logger.hpp"
#include "core/ResultSlot.hpp"
#include "engine/Executor.hpp"
#include "engine/ProgramBuilder.hpp"
#include "math/SearchSpace.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <gmpxx.h>

namespace core {

enum class WorkerState { Idle, Dispatched, Running, Succeeded, Failed, TimedOut, Terminal };

const char* toString(WorkerState s);

struct WorkerReport {
    int               workerId = -1;
    math::SearchBlock block;
    WorkerState       state = WorkerState::Idle;
    std::string       reason;
    mpz_class         candidate;
    bool              accepted = false;
    double            elapsed = 0.0;
    size_t            linesRead = 0;
    size_t            candidatesChecked = 0;
    int               exitCode = -1;
};

// Read-only inputs shared by every worker of one dispatch.
struct SearchContext {
    mpz_class                     N;
    uint32_t                      chunkDepth = 0;
    uint32_t                      iterationCount = 0;
    mpz_class                     chunkStates;
    std::chrono::milliseconds     workerTimeout{0};
    bool                          debug = false;
    const engine::ProgramBuilder* builder  = nullptr;
    const engine::Executor*       executor = nullptr;
    ResultSlot*                   slot     = nullptr;
    Logger*                       logger   = nullptr;
};

/// One block searched by one engine process:
/// build program -> run engine -> parse lines -> verify candidates.
class WorkerTask {
public:
    using AcceptedFn = std::function<void(int workerId)>;

    WorkerTask(int workerId,
               math::SearchBlock block,
               const SearchContext& ctx,
               AcceptedFn onAccepted);

    // Runs on the worker thread. Every error ends up in the report.
    WorkerReport run();

    // Cancellation is driven from outside: SIGTERM first, then SIGKILL at
    // the deadline if the engine is still alive.
    void requestCancel();
    void enforceCancel(std::chrono::steady_clock::time_point deadline);

    int id() const { return id_; }
    WorkerState state() const;

    // Outcome consumed by the scheduler.
    void retire();

private:
    void transition(WorkerState s);
    void attach(engine::ExecutionStream* stream);
    void detach();
    void log(const char* what, const std::string& detail);

    int                  id_;
    math::SearchBlock    block_;
    const SearchContext& ctx_;
    AcceptedFn           onAccepted_;

    mutable std::mutex   stateMtx_;
    WorkerState          state_ = WorkerState::Idle;

    std::mutex               streamMtx_;
    engine::ExecutionStream* stream_ = nullptr;
    std::atomic<bool>        cancelled_{false};
};

} // namespace core

#endif // CORE_WORKERTASK_HPP
