#include "runtime/process_engine.hpp"

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <poll.h>
#include <sstream>
#include <sys/stat.h>
#include <sys/wait.h>
#include <system_error>
#include <thread>
#include <unistd.h>
#include <utility>
#include <variant>
#include "core/logging/logger.hpp"
#include "runtime/event_queue.hpp"

namespace toolpilot::runtime {

using core::errors::AgentError;
using core::errors::ErrorCategory;

namespace {

constexpr int kReaderPollMs = 100;

struct LineEvent {
    StreamKind stream;
    std::string line;
};

struct StreamClosedEvent {
    StreamKind stream;
};

struct ProcessExitEvent {
    int wait_status;
};

using EngineEvent = std::variant<LineEvent, StreamClosedEvent, ProcessExitEvent>;

std::int64_t elapsed_since(const std::chrono::steady_clock::time_point started) {
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                             std::chrono::steady_clock::now() - started)
                             .count();
    return elapsed < 0 ? 0 : static_cast<std::int64_t>(elapsed);
}

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
        fd = -1;
    }
}

bool is_executable_file(const std::filesystem::path& path) {
    struct stat info {};
    if (stat(path.c_str(), &info) != 0) {
        return false;
    }
    return S_ISREG(info.st_mode) && access(path.c_str(), X_OK) == 0;
}

std::string strip_carriage_return(std::string line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

// Line-oriented reader for one pipe. Each complete line goes to the stream's
// own accumulator and to the shared queue; EOF posts a StreamClosedEvent.
void read_stream(int fd, const StreamKind kind, std::vector<std::string>& lines,
                 EventQueue<EngineEvent>& queue, const std::atomic_bool& stop) {
    auto emit = [&](std::string line) {
        lines.push_back(line);
        queue.push(LineEvent{kind, std::move(line)});
    };

    std::string pending;
    char buffer[4096];
    while (!stop.load()) {
        pollfd pfd{fd, POLLIN, 0};
        const int ready = poll(&pfd, 1, kReaderPollMs);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (ready == 0) {
            continue;
        }

        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            break;
        }
        if (n == 0) {
            break;
        }

        pending.append(buffer, static_cast<std::size_t>(n));
        std::size_t newline = 0;
        while ((newline = pending.find('\n')) != std::string::npos) {
            emit(strip_carriage_return(pending.substr(0, newline)));
            pending.erase(0, newline + 1);
        }
    }
    if (!pending.empty()) {
        emit(strip_carriage_return(std::move(pending)));
    }
    close_fd(fd);
    queue.push(StreamClosedEvent{kind});
}

ExecutionResult spawn_failure(ExecutionResult result, AgentError error,
                              const std::chrono::steady_clock::time_point started) {
    result.exit_code = -1;
    result.error = std::move(error);
    result.elapsed_ms = elapsed_since(started);
    LOG_DEBUG("ProcessEngine: " + core::errors::describe(result.error.value()));
    return result;
}

}  // namespace

std::string CapturedStream::text() const {
    std::string out;
    for (const auto& line : lines) {
        out += line;
        out += '\n';
    }
    return out;
}

OutputSink console_sink() {
    return [](const StreamKind stream, const std::string& line) {
        if (stream == StreamKind::Stdout) {
            std::cout << line << std::endl;
        } else {
            std::cerr << line << std::endl;
        }
    };
}

core::errors::Result<std::string> resolve_executable(const std::string& name) {
    if (name.empty()) {
        return AgentError{ErrorCategory::NotFound, "Executable name is empty.",
                          "executable_not_found"};
    }

    if (name.find('/') != std::string::npos) {
        std::error_code ec;
        const auto absolute = std::filesystem::absolute(name, ec);
        if (ec || !is_executable_file(absolute)) {
            return AgentError{ErrorCategory::NotFound,
                              "Executable not found: " + name, "executable_not_found"};
        }
        return absolute.string();
    }

    const char* env_path = std::getenv("PATH");
    const std::string search_path =
        (env_path != nullptr && *env_path != '\0') ? env_path : "/usr/local/bin:/usr/bin:/bin";
    std::istringstream dirs(search_path);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) {
            dir = ".";
        }
        std::error_code ec;
        const auto candidate = std::filesystem::absolute(std::filesystem::path(dir) / name, ec);
        if (!ec && is_executable_file(candidate)) {
            return candidate.string();
        }
    }
    return AgentError{ErrorCategory::NotFound,
                      "Executable not found on PATH: " + name, "executable_not_found"};
}

ProcessEngine::ProcessEngine(OutputSink sink) : ProcessEngine(std::move(sink), Options{}) {}

ProcessEngine::ProcessEngine(OutputSink sink, Options options)
    : sink_(std::move(sink)), options_(options) {}

ExecutionResult ProcessEngine::execute(const ExecutionRequest& request) const {
    const auto started = std::chrono::steady_clock::now();
    ExecutionResult result;

    std::error_code ec;
    const std::filesystem::path cwd = request.working_directory.empty()
                                          ? std::filesystem::current_path(ec)
                                          : request.working_directory;
    if (ec || !std::filesystem::is_directory(cwd, ec) || ec) {
        return spawn_failure(std::move(result),
                             AgentError{ErrorCategory::Input,
                                        "Working directory does not exist: " + cwd.string(),
                                        "invalid_working_directory"},
                             started);
    }

    auto resolved = resolve_executable(request.executable);
    if (core::errors::is_error(resolved)) {
        return spawn_failure(std::move(result), core::errors::get_error(resolved), started);
    }
    const std::string executable = core::errors::get_value(resolved);

    // argv and every descriptor are prepared before fork so the child only
    // calls async-signal-safe functions.
    std::vector<std::string> arg_storage;
    arg_storage.reserve(request.args.size() + 1);
    arg_storage.push_back(request.executable);
    for (const auto& arg : request.args) {
        arg_storage.push_back(arg);
    }
    std::vector<char*> argv;
    argv.reserve(arg_storage.size() + 1);
    for (auto& arg : arg_storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);
    const std::string cwd_text = cwd.string();

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int exec_error_pipe[2] = {-1, -1};
    int dev_null = open("/dev/null", O_RDWR | O_CLOEXEC);
    auto close_all = [&]() {
        close_fd(stdout_pipe[0]);
        close_fd(stdout_pipe[1]);
        close_fd(stderr_pipe[0]);
        close_fd(stderr_pipe[1]);
        close_fd(exec_error_pipe[0]);
        close_fd(exec_error_pipe[1]);
        close_fd(dev_null);
    };

    if (dev_null < 0 ||
        (request.capture_stdout && pipe2(stdout_pipe, O_CLOEXEC) != 0) ||
        (request.capture_stderr && pipe2(stderr_pipe, O_CLOEXEC) != 0) ||
        pipe2(exec_error_pipe, O_CLOEXEC) != 0) {
        close_all();
        return spawn_failure(std::move(result),
                             AgentError{ErrorCategory::Internal,
                                        "Failed to create process pipes.",
                                        "pipe_creation_failed"},
                             started);
    }

    const pid_t pid = fork();
    if (pid < 0) {
        close_all();
        return spawn_failure(std::move(result),
                             AgentError{ErrorCategory::Internal,
                                        "Failed to fork process.", "spawn_failed"},
                             started);
    }

    if (pid == 0) {
        auto fail = [&](const int code) {
            const int err = errno;
            static_cast<void>(write(exec_error_pipe[1], &err, sizeof(err)));
            _exit(code);
        };
        // Own process group, so a timeout kill reaches grandchildren too.
        static_cast<void>(setpgid(0, 0));
        if (chdir(cwd_text.c_str()) != 0) {
            fail(126);
        }
        if (dup2(dev_null, STDIN_FILENO) < 0 ||
            dup2(request.capture_stdout ? stdout_pipe[1] : dev_null, STDOUT_FILENO) < 0 ||
            dup2(request.capture_stderr ? stderr_pipe[1] : dev_null, STDERR_FILENO) < 0) {
            fail(126);
        }
        execv(executable.c_str(), argv.data());
        fail(127);
    }

    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(exec_error_pipe[1]);
    close_fd(dev_null);

    int exec_errno = 0;
    ssize_t reported = 0;
    do {
        reported = read(exec_error_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (reported < 0 && errno == EINTR);
    close_fd(exec_error_pipe[0]);
    if (reported == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        close_fd(stdout_pipe[0]);
        close_fd(stderr_pipe[0]);
        return spawn_failure(std::move(result),
                             AgentError{ErrorCategory::Internal,
                                        "Failed to start " + executable + ": " +
                                            std::strerror(exec_errno),
                                        "spawn_failed"},
                             started);
    }

    LOG_DEBUG("ProcessEngine: started pid " + std::to_string(pid) + " (" + executable + ")");

    EventQueue<EngineEvent> queue;
    std::atomic_bool stop_readers{false};
    std::vector<std::string> stdout_lines;
    std::vector<std::string> stderr_lines;
    std::vector<std::thread> readers;
    int open_streams = 0;
    if (request.capture_stdout) {
        readers.emplace_back(read_stream, stdout_pipe[0], StreamKind::Stdout,
                             std::ref(stdout_lines), std::ref(queue),
                             std::cref(stop_readers));
        stdout_pipe[0] = -1;  // owned by the reader now
        ++open_streams;
    }
    if (request.capture_stderr) {
        readers.emplace_back(read_stream, stderr_pipe[0], StreamKind::Stderr,
                             std::ref(stderr_lines), std::ref(queue),
                             std::cref(stop_readers));
        stderr_pipe[0] = -1;
        ++open_streams;
    }

    std::thread waiter([pid, &queue]() {
        int status = 0;
        pid_t waited = 0;
        do {
            waited = waitpid(pid, &status, 0);
        } while (waited < 0 && errno == EINTR);
        queue.push(ProcessExitEvent{waited == pid ? status : -1});
    });

    bool exited = false;
    int wait_status = 0;
    auto handle = [&](EngineEvent& event) {
        if (auto* line = std::get_if<LineEvent>(&event)) {
            if (sink_) {
                sink_(line->stream, line->line);
            }
        } else if (std::get_if<StreamClosedEvent>(&event) != nullptr) {
            --open_streams;
        } else if (auto* exit_event = std::get_if<ProcessExitEvent>(&event)) {
            exited = true;
            wait_status = exit_event->wait_status;
        }
    };

    const bool has_deadline = request.timeout_seconds > 0;
    const auto deadline = started + std::chrono::seconds(request.timeout_seconds);
    while (!exited) {
        // Checked on every pass; steady output never leaves the queue empty.
        if (has_deadline && std::chrono::steady_clock::now() >= deadline) {
            if (kill(-pid, SIGKILL) != 0) {
                static_cast<void>(kill(pid, SIGKILL));
            }
            result.timed_out = true;
            LOG_WARN("ProcessEngine: pid " + std::to_string(pid) + " exceeded " +
                     std::to_string(request.timeout_seconds) + "s, killed");
            break;
        }
        auto event = has_deadline ? queue.wait_pop_until(deadline) : queue.wait_pop();
        if (event.has_value()) {
            handle(*event);
        }
    }

    // After a kill the waiter still reports the exit; keep mirroring meanwhile.
    while (!exited) {
        auto event = queue.wait_pop();
        handle(*event);
    }

    const auto grace_deadline = std::chrono::steady_clock::now() + options_.reader_grace;
    while (open_streams > 0) {
        auto event = queue.wait_pop_until(grace_deadline);
        if (!event.has_value()) {
            LOG_DEBUG("ProcessEngine: output streams still open after grace period");
            break;
        }
        handle(*event);
    }
    stop_readers.store(true);
    for (auto& reader : readers) {
        reader.join();
    }
    waiter.join();
    for (auto& event : queue.drain()) {
        handle(event);
    }

    if (result.timed_out) {
        result.exit_code = -1;
        result.error = AgentError{ErrorCategory::Timeout,
                                  "Process timed out after " +
                                      std::to_string(request.timeout_seconds) + " seconds",
                                  "process_timeout"};
    } else if (WIFEXITED(wait_status)) {
        result.exit_code = WEXITSTATUS(wait_status);
    } else if (WIFSIGNALED(wait_status)) {
        result.exit_code = 128 + WTERMSIG(wait_status);
    } else {
        result.exit_code = -1;
    }

    if (request.capture_stdout) {
        result.stdout_capture = CapturedStream{std::move(stdout_lines)};
    }
    if (request.capture_stderr) {
        result.stderr_capture = CapturedStream{std::move(stderr_lines)};
    }
    result.elapsed_ms = elapsed_since(started);
    LOG_DEBUG("ProcessEngine: pid " + std::to_string(pid) + " finished with exit code " +
              std::to_string(result.exit_code) + " in " +
              std::to_string(result.elapsed_ms) + "ms");
    return result;
}

}  // namespace toolpilot::runtime
