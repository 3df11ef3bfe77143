/*
 * TritFactor - chunked divisor search driven by an external qutrit engine
 *
 * The candidate interval [0, ceil(sqrt(N))) is cut into chunk-aligned blocks.
 * Each block is compiled into a .qbin program, executed by the engine in its
 * own process, and every measured candidate is checked with GMP.
 *
 * This code is released as free software.
 */
#include "engine/Executor.hpp"
#include "engine/EngineErrors.hpp"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <stdexcept>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace engine {

TempProgramFile::TempProgramFile(const Program& program, const std::string& dir) {
    fs::path base = dir.empty() ? fs::temp_directory_path() : fs::path(dir);
    std::string tmpl = (base / "tritfactor-XXXXXX.qbin").string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    int fd = mkstemps(buf.data(), 5);
    if (fd < 0) {
        throw std::runtime_error("Cannot create temporary program file in " + base.string()
                                 + ": " + std::strerror(errno));
    }
    path_ = buf.data();

    const auto& bytes = program.bytes();
    size_t off = 0;
    while (off < bytes.size()) {
        ssize_t n = write(fd, bytes.data() + off, bytes.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            close(fd);
            unlink(path_.c_str());
            throw std::runtime_error("Failed to write " + path_ + ": " + std::strerror(err));
        }
        off += static_cast<size_t>(n);
    }
    if (close(fd) != 0) {
        int err = errno;
        unlink(path_.c_str());
        throw std::runtime_error("Failed to close " + path_ + ": " + std::strerror(err));
    }
}

TempProgramFile::~TempProgramFile() {
    if (!path_.empty()) {
        std::error_code ec;
        fs::remove(path_, ec);
    }
}

ExecutionStream::ExecutionStream(const Program& program,
                                 const ExecutorConfig& cfg,
                                 std::chrono::milliseconds timeout)
  : artifact_(program, cfg.tempDir)
  , process_(std::make_unique<EngineProcess>(cfg.enginePath, artifact_.path(), cfg.killGrace))
  , timeout_(timeout)
  , deadline_(std::chrono::steady_clock::now() + timeout)
{}

bool ExecutionStream::nextLine(std::string& line) {
    if (finished_) return false;
    ExecEvent ev;
    switch (process_->channel().pop(ev, deadline_)) {
        case LineChannel::Status::Ok:
            ++linesRead_;
            line = std::move(ev.text);
            return true;
        case LineChannel::Status::Closed:
            finished_ = true;
            exitCode_ = ev.exitCode;
            return false;
        case LineChannel::Status::Timeout:
            break;
    }
    process_->terminate();
    finished_ = true;
    exitCode_ = process_->exitCode();
    throw TimedOut("engine did not finish within "
                   + std::to_string(timeout_.count() / 1000.0) + " s");
}

void ExecutionStream::terminate() {
    process_->terminate();
}

void ExecutionStream::signal(int sig) {
    process_->signal(sig);
}

bool ExecutionStream::waitExit(std::chrono::steady_clock::time_point deadline) {
    return process_->waitExit(deadline);
}

Executor::Executor(ExecutorConfig cfg)
  : cfg_(std::move(cfg))
{}

bool Executor::isExecutable(const std::string& path) {
    struct stat st;
    if (path.empty() || stat(path.c_str(), &st) != 0) return false;
    return S_ISREG(st.st_mode) && access(path.c_str(), X_OK) == 0;
}

std::unique_ptr<ExecutionStream> Executor::run(const Program& program,
                                               std::chrono::milliseconds timeout) const {
    if (!isExecutable(cfg_.enginePath)) {
        throw ExecutorNotFound(cfg_.enginePath);
    }
    return std::make_unique<ExecutionStream>(program, cfg_, timeout);
}

} // namespace engine
