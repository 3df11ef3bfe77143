/*
 * TritFactor - chunked divisor search driven by an external qutrit engine
 *
 * The candidate interval [0, ceil(sqrt(N))) is cut into chunk-aligned blocks.
 * Each block is compiled into a .qbin program, executed by the engine in its
 * own process, and every measured candidate is checked with GMP.
 *
 * This code is released as free software.
 */
#include "engine/EngineProcess.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <stdexcept>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

namespace engine {

void LineChannel::push(ExecEvent ev) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (closed_) return;
        if (ev.kind == ExecEvent::Kind::Exited) closed_ = true;
        queue_.push_back(std::move(ev));
    }
    cv_.notify_all();
}

LineChannel::Status LineChannel::pop(ExecEvent& out,
                                     std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lk(mtx_);
    if (!cv_.wait_until(lk, deadline, [this] { return !queue_.empty(); })) {
        return Status::Timeout;
    }
    out = std::move(queue_.front());
    queue_.pop_front();
    return out.kind == ExecEvent::Kind::Exited ? Status::Closed : Status::Ok;
}

EngineProcess::EngineProcess(const std::string& enginePath,
                             const std::string& programPath,
                             std::chrono::milliseconds killGrace)
  : grace_(killGrace)
{
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0) {
        throw std::runtime_error(std::string("pipe2 failed: ") + std::strerror(errno));
    }

    // argv is prepared before fork: the child may only call async-signal-safe functions
    std::vector<std::string> args{enginePath, programPath};
    std::vector<char*> exec_args;
    for (auto& s : args) exec_args.push_back(const_cast<char*>(s.c_str()));
    exec_args.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close(fds[0]);
        close(fds[1]);
        throw std::runtime_error(std::string("fork failed: ") + std::strerror(err));
    }
    if (pid == 0) {
        setpgid(0, 0);
        dup2(fds[1], STDOUT_FILENO);
        execv(exec_args[0], exec_args.data());
        _exit(127);
    }

    setpgid(pid, pid);
    close(fds[1]);
    pid_ = pid;
    fd_  = fds[0];
    reader_ = std::thread([this] { readerLoop(); });
}

EngineProcess::~EngineProcess() {
    terminate();
    if (reader_.joinable()) reader_.join();
}

void EngineProcess::readerLoop() {
    std::string pending;
    char buf[4096];
    for (;;) {
        ssize_t n = read(fd_, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (n == 0) break;
        pending.append(buf, static_cast<size_t>(n));
        size_t pos;
        while ((pos = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, pos);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            channel_.push({ExecEvent::Kind::Line, std::move(line), 0});
            pending.erase(0, pos + 1);
        }
    }
    if (!pending.empty()) {
        channel_.push({ExecEvent::Kind::Line, std::move(pending), 0});
    }
    close(fd_);
    fd_ = -1;

    // Wait without reaping so the pid stays valid for signal() until reaped_ is set.
    siginfo_t info;
    std::memset(&info, 0, sizeof(info));
    while (waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT) != 0 && errno == EINTR) {}

    int code = -1;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        int status = 0;
        pid_t r;
        while ((r = waitpid(pid_, &status, 0)) < 0 && errno == EINTR) {}
        if (r == pid_) {
            if (WIFEXITED(status))        code = WEXITSTATUS(status);
            else if (WIFSIGNALED(status)) code = 128 + WTERMSIG(status);
        }
        reaped_   = true;
        exitCode_ = code;
    }
    exitedCv_.notify_all();
    channel_.push({ExecEvent::Kind::Exited, std::string(), code});
}

void EngineProcess::signal(int sig) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (reaped_ || pid_ <= 0) return;
    // whole group: a wrapper script must not leave its children behind
    if (kill(-pid_, sig) != 0) {
        kill(pid_, sig);
    }
}

static constexpr std::chrono::milliseconds KILL_REAP_WAIT{2000};

bool EngineProcess::waitExit(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lk(mtx_);
    return exitedCv_.wait_until(lk, deadline, [this] { return reaped_; });
}

void EngineProcess::terminate() {
    if (exited()) return;
    signal(SIGTERM);
    if (!waitExit(std::chrono::steady_clock::now() + grace_)) {
        signal(SIGKILL);
        // SIGKILL cannot be ignored; wait for the reaper so exitCode() is set
        waitExit(std::chrono::steady_clock::now() + KILL_REAP_WAIT);
    }
}

bool EngineProcess::exited() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return reaped_;
}

int EngineProcess::exitCode() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return exitCode_;
}

} // namespace engine
