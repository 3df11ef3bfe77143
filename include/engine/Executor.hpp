// include/engine/Executor.hpp
#ifndef ENGINE_EXECUTOR_HPP
#define ENGINE_EXECUTOR_HPP

#include "engine/EngineProcess.hpp"
#include "engine/Program.hpp"
#include <chrono>
#include <memory>
#include <string>

namespace engine {

struct ExecutorConfig {
    std::string               enginePath = "./qutrit_engine";
    std::chrono::milliseconds killGrace{500};
    std::string               tempDir;   // empty: system temp directory
};

// Program written to a unique temporary file; removed when destroyed.
class TempProgramFile {
public:
    TempProgramFile(const Program& program, const std::string& dir);
    ~TempProgramFile();

    TempProgramFile(const TempProgramFile&) = delete;
    TempProgramFile& operator=(const TempProgramFile&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

/// Output of one engine run, consumed line by line.
class ExecutionStream {
public:
    ExecutionStream(const Program& program,
                    const ExecutorConfig& cfg,
                    std::chrono::milliseconds timeout);

    /// Blocks until the next output line. Returns false once the engine has
    /// exited and every line was consumed. Kills the engine and throws
    /// TimedOut when the deadline passes first.
    bool nextLine(std::string& line);

    // Forcibly stops the engine; the reading thread then sees the exit.
    void terminate();
    void signal(int sig);
    bool waitExit(std::chrono::steady_clock::time_point deadline);

    bool finished() const { return finished_; }
    int  exitCode() const { return exitCode_; }
    size_t linesRead() const { return linesRead_; }
    const std::string& programPath() const { return artifact_.path(); }

private:
    // declaration order: the process dies before its program file is removed
    TempProgramFile                       artifact_;
    std::unique_ptr<EngineProcess>        process_;
    std::chrono::milliseconds             timeout_;
    std::chrono::steady_clock::time_point deadline_;
    bool                                  finished_  = false;
    int                                   exitCode_  = -1;
    size_t                                linesRead_ = 0;
};

class Executor {
public:
    explicit Executor(ExecutorConfig cfg);

    // Throws ExecutorNotFound before anything is written or launched.
    std::unique_ptr<ExecutionStream> run(const Program& program,
                                         std::chrono::milliseconds timeout) const;

    static bool isExecutable(const std::string& path);
    const ExecutorConfig& config() const { return cfg_; }

private:
    ExecutorConfig cfg_;
};

} // namespace engine

#endif // ENGINE_EXECUTOR_HPP
