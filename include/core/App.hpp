#ifndef CORE_APP_HPP
#define CORE_APP_HPP

#include "core/Logger.hpp"
#include "core/Scheduler.hpp"
#include "core/Spinner.hpp"
#include "io/CliParser.hpp"
#include "io/WorktodoParser.hpp"
#include "util/Timer.hpp"
#include <optional>
#include <string>
#include <vector>

namespace core {

enum ExitCode : int {
    EXIT_FOUND     = 0,
    EXIT_NO_FACTOR = 1,
    EXIT_ERROR     = 2,
};

/// Top-level application driver.
class App {
public:
    App(int argc, char** argv);
    int run();

    // argv with every "-config <file>" replaced by the file's tokens.
    static std::vector<std::string> mergeConfig(int argc, char** argv);
    static SchedulerConfig makeSchedulerConfig(const io::CliOptions& opts);

private:
    int runSearch();

    int                                argc_;
    char**                             argv_;
    io::CliOptions                     options;
    std::optional<io::WorktodoEntry>   worktodoEntry_;
    Spinner                            spinner;
    Logger                             logger;
    util::Timer                        timer;
};

} // namespace core

#endif // CORE_APP_HPP
