// include/engine/EngineProcess.hpp
#pragma once
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <sys/types.h>

namespace engine {

struct ExecEvent {
    enum class Kind { Line, Exited };
    Kind        kind = Kind::Line;
    std::string text;
    int         exitCode = 0;
};

// Producer/consumer queue between the reader thread and a worker.
class LineChannel {
public:
    enum class Status { Ok, Closed, Timeout };

    void push(ExecEvent ev);
    Status pop(ExecEvent& out, std::chrono::steady_clock::time_point deadline);

private:
    std::mutex              mtx_;
    std::condition_variable cv_;
    std::deque<ExecEvent>   queue_;
    bool                    closed_ = false;
};

/// One running engine process, started in its own process group with its
/// stdout on a pipe. A reader thread turns the pipe into Line events and
/// emits a final Exited event once the process has been reaped.
class EngineProcess {
public:
    EngineProcess(const std::string& enginePath,
                  const std::string& programPath,
                  std::chrono::milliseconds killGrace);
    ~EngineProcess();

    EngineProcess(const EngineProcess&) = delete;
    EngineProcess& operator=(const EngineProcess&) = delete;

    LineChannel& channel() { return channel_; }

    // SIGTERM to the group; SIGKILL if still alive after the grace period,
    // then a bounded wait for the reaper. exitCode() stays -1 only if the
    // process outlives even that.
    // Safe to call from any thread, any number of times.
    void terminate();
    void signal(int sig);
    bool waitExit(std::chrono::steady_clock::time_point deadline);

    bool exited() const;
    int  exitCode() const;
    pid_t pid() const { return pid_; }

private:
    void readerLoop();

    pid_t                     pid_ = -1;
    int                       fd_  = -1;
    std::chrono::milliseconds grace_;
    LineChannel               channel_;

    mutable std::mutex        mtx_;
    std::condition_variable   exitedCv_;
    bool                      reaped_   = false;
    int                       exitCode_ = -1;

    std::thread               reader_;
};

} // namespace engine
