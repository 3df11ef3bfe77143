// io/WorktodoParser.hpp
#pragma once
#include <optional>
#include <string>
#include <cstdint>

namespace io {

// One "Factor=<N>[,<depth>[,<iterations>]]" line.
struct WorktodoEntry {
    std::string number;
    std::optional<uint32_t> depth;
    std::optional<uint32_t> iterations;
    std::string rawLine;
};

class WorktodoParser {
public:
    explicit WorktodoParser(const std::string& filename);

    // First well-formed entry; malformed lines are reported and skipped.
    std::optional<WorktodoEntry> parse();

    // Moves the line of `entry` to worktodo_save.txt next to the file.
    bool removeFirstProcessed(const WorktodoEntry& entry);

private:
    std::string filename_;
};

} // namespace io
