#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/agent_errors.hpp"

namespace toolpilot::runtime {

enum class StreamKind {
    Stdout,
    Stderr
};

struct ExecutionRequest {
    std::string executable;                   // bare name (PATH lookup) or path
    std::vector<std::string> args;
    std::filesystem::path working_directory;  // empty: caller's current directory
    std::uint32_t timeout_seconds = 60;       // 0: no limit
    bool capture_stdout = true;
    bool capture_stderr = true;
};

struct CapturedStream {
    std::vector<std::string> lines;  // line terminators stripped

    // Lines joined back together, each followed by '\n'.
    std::string text() const;
};

struct ExecutionResult {
    int exit_code = -1;  // -1: killed on timeout, or never started
    std::optional<CapturedStream> stdout_capture;  // absent when not captured
    std::optional<CapturedStream> stderr_capture;
    std::int64_t elapsed_ms = 0;
    bool timed_out = false;
    std::optional<core::errors::AgentError> error;  // spawn failure or timeout

    bool success() const { return !error.has_value() && !timed_out && exit_code == 0; }
};

// Receives every captured line as it arrives, on the supervising thread.
using OutputSink = std::function<void(StreamKind, const std::string&)>;

// Mirrors stdout lines to std::cout and stderr lines to std::cerr.
OutputSink console_sink();

// Bare names are searched on PATH; names containing '/' must point at an
// executable file. Returns an absolute path.
core::errors::Result<std::string> resolve_executable(const std::string& name);

class ProcessEngine {
public:
    struct Options {
        // How long readers may keep draining after the child is gone.
        std::chrono::milliseconds reader_grace{1000};
    };

    explicit ProcessEngine(OutputSink sink = console_sink());
    ProcessEngine(OutputSink sink, Options options);

    // Never throws for process-level failures: invalid working directory,
    // unresolvable executable, spawn failure and timeout all come back as a
    // failed ExecutionResult.
    ExecutionResult execute(const ExecutionRequest& request) const;

private:
    OutputSink sink_;
    Options options_;
};

}  // namespace toolpilot::runtime
