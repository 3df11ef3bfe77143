// include/engine/EngineErrors.hpp
#ifndef ENGINE_ENGINEERRORS_HPP
#define ENGINE_ENGINEERRORS_HPP

#include <stdexcept>
#include <string>

namespace engine {

class EngineError : public std::runtime_error {
public:
    explicit EngineError(const std::string& what) : std::runtime_error(what) {}
};

// An instruction field does not fit its 16-bit slot.
class EncodingOverflow : public EngineError {
public:
    explicit EncodingOverflow(const std::string& what) : EngineError(what) {}
};

// Program would address more chunks/registers/depth than the engine has.
class SizeExceeded : public EngineError {
public:
    explicit SizeExceeded(const std::string& what) : EngineError(what) {}
};

class ExecutorNotFound : public EngineError {
public:
    explicit ExecutorNotFound(const std::string& path)
      : EngineError("engine executable not found: " + path) {}
};

class TimedOut : public EngineError {
public:
    explicit TimedOut(const std::string& what) : EngineError(what) {}
};

class ExecutionFailed : public EngineError {
public:
    explicit ExecutionFailed(int exitCode)
      : EngineError("engine exited with code " + std::to_string(exitCode))
      , exitCode_(exitCode) {}
    int exitCode() const { return exitCode_; }
private:
    int exitCode_;
};

// Engine finished without a single recognizable line.
class ParseEmpty : public EngineError {
public:
    explicit ParseEmpty(const std::string& what) : EngineError(what) {}
};

} // namespace engine

#endif // ENGINE_ENGINEERRORS_HPP
