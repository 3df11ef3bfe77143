/*
 * TritFactor - chunked divisor search driven by an external qutrit engine
 *
 * The candidate interval [0, ceil(sqrt(N))) is cut into chunk-aligned blocks.
 * Each block is compiled into a .qbin program, executed by the engine in its
 * own process, and every measured candidate is checked with GMP.
 *
 * This code is released as free software.
 */
#include "core/WorkerTask.hpp"
#include "engine/EngineErrors.hpp"
#include "engine/ResultParser.hpp"
#include "math/Verifier.hpp"
#include "util/Timer.hpp"
#include <csignal>
#include <iostream>
#include <memory>
#include <sstream>

namespace core {

const char* toString(WorkerState s) {
    switch (s) {
        case WorkerState::Idle:       return "idle";
        case WorkerState::Dispatched: return "dispatched";
        case WorkerState::Running:    return "running";
        case WorkerState::Succeeded:  return "succeeded";
        case WorkerState::Failed:     return "failed";
        case WorkerState::TimedOut:   return "timed out";
        case WorkerState::Terminal:   return "terminal";
    }
    return "?";
}

WorkerTask::WorkerTask(int workerId,
                       math::SearchBlock block,
                       const SearchContext& ctx,
                       AcceptedFn onAccepted)
  : id_(workerId)
  , block_(std::move(block))
  , ctx_(ctx)
  , onAccepted_(std::move(onAccepted))
{
    transition(WorkerState::Dispatched);
}

void WorkerTask::transition(WorkerState s) {
    std::lock_guard<std::mutex> lk(stateMtx_);
    state_ = s;
}

WorkerState WorkerTask::state() const {
    std::lock_guard<std::mutex> lk(stateMtx_);
    return state_;
}

void WorkerTask::retire() {
    transition(WorkerState::Terminal);
}

void WorkerTask::attach(engine::ExecutionStream* stream) {
    std::lock_guard<std::mutex> lk(streamMtx_);
    stream_ = stream;
    if (cancelled_) {
        stream_->signal(SIGKILL);
    }
}

void WorkerTask::detach() {
    std::lock_guard<std::mutex> lk(streamMtx_);
    stream_ = nullptr;
}

void WorkerTask::requestCancel() {
    std::lock_guard<std::mutex> lk(streamMtx_);
    cancelled_ = true;
    if (stream_) stream_->signal(SIGTERM);
}

void WorkerTask::enforceCancel(std::chrono::steady_clock::time_point deadline) {
    std::lock_guard<std::mutex> lk(streamMtx_);
    if (stream_ && !stream_->waitExit(deadline)) {
        stream_->signal(SIGKILL);
    }
}

void WorkerTask::log(const char* what, const std::string& detail) {
    if (!ctx_.logger) return;
    ctx_.logger->logmsg("[W%d] chunks %s+%s: %s%s%s\n",
                        id_,
                        block_.blockStart.get_str().c_str(),
                        block_.activeChunks.get_str().c_str(),
                        what,
                        detail.empty() ? "" : " - ",
                        detail.c_str());
}

WorkerReport WorkerTask::run() {
    WorkerReport rep;
    rep.workerId = id_;
    rep.block    = block_;

    util::Timer timer;
    std::unique_ptr<engine::ExecutionStream> stream;

    auto finish = [&](WorkerState s, const std::string& reason) {
        detach();
        rep.state   = s;
        rep.reason  = reason;
        rep.elapsed = timer.elapsed();
        if (stream) {
            rep.linesRead = stream->linesRead();
            rep.exitCode  = stream->exitCode();
        }
        transition(s);
        log(toString(s), reason);
        return rep;
    };

    if (cancelled_) {
        return finish(WorkerState::Failed, "cancelled before launch");
    }
    transition(WorkerState::Running);

    try {
        engine::Program program = ctx_.builder->build(ctx_.N, ctx_.chunkDepth, block_, ctx_.iterationCount);
        stream = ctx_.executor->run(program, ctx_.workerTimeout);
        attach(stream.get());

        engine::ResultParser parser(block_, ctx_.chunkStates);
        std::string line;
        bool found = false;
        while (!found && stream->nextLine(line)) {
            if (ctx_.debug) {
                std::ostringstream oss;
                oss << "[W" << id_ << "] " << line << "\n";
                std::cout << oss.str() << std::flush;
            }
            for (const auto& candidate : parser.feed(line)) {
                ++rep.candidatesChecked;
                if (!math::Verifier::isFactor(ctx_.N, candidate)) continue;
                rep.candidate = candidate;
                rep.accepted  = ctx_.slot->offer(id_, candidate);
                found = true;
                break;
            }
        }

        if (found) {
            // sibling cancellation first, then our own engine
            if (rep.accepted && onAccepted_) onAccepted_(id_);
            stream->terminate();
            return finish(WorkerState::Succeeded,
                          std::string(rep.accepted ? "factor " : "late factor ")
                          + rep.candidate.get_str());
        }
        if (cancelled_) {
            return finish(WorkerState::Failed, "cancelled");
        }
        const int code = stream->exitCode();
        if (parser.recognized() == 0) {
            if (code != 0) throw engine::ExecutionFailed(code);
            throw engine::ParseEmpty("no measurement or factor line in "
                                     + std::to_string(stream->linesRead()) + " lines of output");
        }
        std::ostringstream oss;
        oss << "no factor among " << rep.candidatesChecked << " candidates";
        if (code != 0) oss << " (exit code " << code << ")";
        return finish(WorkerState::Failed, oss.str());
    } catch (const engine::TimedOut& e) {
        return finish(WorkerState::TimedOut, e.what());
    } catch (const std::exception& e) {
        return finish(WorkerState::Failed, cancelled_ ? std::string("cancelled") : std::string(e.what()));
    }
}

} // namespace core
