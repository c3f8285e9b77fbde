#include <sys/types.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include <gtest/gtest.h>
#include "core/config/session_id.hpp"
#include "core/errors/agent_errors.hpp"
#include "runtime/process_engine.hpp"

namespace {

using toolpilot::core::errors::ErrorCategory;
using toolpilot::core::errors::get_error;
using toolpilot::core::errors::get_value;
using toolpilot::core::errors::is_error;
using toolpilot::runtime::ExecutionRequest;
using toolpilot::runtime::ProcessEngine;
using toolpilot::runtime::StreamKind;

struct RecordedLine {
    StreamKind stream;
    std::string text;
};

class RecordingEngine {
public:
    RecordingEngine()
        : engine_([this](StreamKind stream, const std::string& line) {
              lines_.push_back(RecordedLine{stream, line});
          }) {}

    const ProcessEngine& engine() const { return engine_; }
    const std::vector<RecordedLine>& lines() const { return lines_; }

private:
    std::vector<RecordedLine> lines_;
    ProcessEngine engine_;
};

ExecutionRequest shell(const std::string& script, std::uint32_t timeout_seconds = 10) {
    ExecutionRequest request;
    request.executable = "/bin/sh";
    request.args = {"-c", script};
    request.timeout_seconds = timeout_seconds;
    return request;
}

// True once pid has exited; a zombie waiting to be reaped counts as gone.
bool process_gone(const pid_t pid) {
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    if (!stat.is_open()) {
        return true;
    }
    std::string content;
    std::getline(stat, content);
    const auto name_end = content.rfind(')');
    if (name_end == std::string::npos || name_end + 2 >= content.size()) {
        return true;
    }
    const char state = content[name_end + 2];
    return state == 'Z' || state == 'X';
}

TEST(ProcessEngineTest, CapturesStdoutLines) {
    RecordingEngine recorder;
    const auto result = recorder.engine().execute(shell("printf 'line1\\nline2\\n'"));

    EXPECT_TRUE(result.success());
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_FALSE(result.timed_out);
    ASSERT_TRUE(result.stdout_capture.has_value());
    EXPECT_EQ(result.stdout_capture->lines, (std::vector<std::string>{"line1", "line2"}));
    EXPECT_EQ(result.stdout_capture->text(), "line1\nline2\n");
    ASSERT_TRUE(result.stderr_capture.has_value());
    EXPECT_TRUE(result.stderr_capture->text().empty());
    EXPECT_GE(result.elapsed_ms, 0);

    ASSERT_EQ(recorder.lines().size(), 2u);
    EXPECT_EQ(recorder.lines()[0].stream, StreamKind::Stdout);
    EXPECT_EQ(recorder.lines()[0].text, "line1");
}

TEST(ProcessEngineTest, CapturesStderrAndNonZeroExit) {
    RecordingEngine recorder;
    const auto result = recorder.engine().execute(shell("echo oops >&2; exit 3"));

    EXPECT_FALSE(result.success());
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_FALSE(result.error.has_value());
    ASSERT_TRUE(result.stderr_capture.has_value());
    EXPECT_EQ(result.stderr_capture->lines, (std::vector<std::string>{"oops"}));
    ASSERT_EQ(recorder.lines().size(), 1u);
    EXPECT_EQ(recorder.lines()[0].stream, StreamKind::Stderr);
}

TEST(ProcessEngineTest, KeepsLastLineWithoutNewlineAndStripsCarriageReturn) {
    RecordingEngine recorder;
    const auto result = recorder.engine().execute(shell("printf 'a\\r\\nb'"));
    ASSERT_TRUE(result.stdout_capture.has_value());
    EXPECT_EQ(result.stdout_capture->lines, (std::vector<std::string>{"a", "b"}));
}

TEST(ProcessEngineTest, PreservesOrderOfManyLines) {
    RecordingEngine recorder;
    const auto result = recorder.engine().execute(shell("i=0; while [ $i -lt 200 ]; do echo $i; i=$((i+1)); done"));
    ASSERT_TRUE(result.stdout_capture.has_value());
    ASSERT_EQ(result.stdout_capture->lines.size(), 200u);
    for (std::size_t i = 0; i < 200; ++i) {
        EXPECT_EQ(result.stdout_capture->lines[i], std::to_string(i));
    }
}

TEST(ProcessEngineTest, KillsProcessOnTimeout) {
    RecordingEngine recorder;
    const auto result = recorder.engine().execute(shell("echo started; sleep 5", 1));

    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.exit_code, -1);
    EXPECT_FALSE(result.success());
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->category, ErrorCategory::Timeout);
    EXPECT_EQ(result.error->code, "process_timeout");
    EXPECT_GE(result.elapsed_ms, 1000);
    EXPECT_LT(result.elapsed_ms, 5000);
    ASSERT_TRUE(result.stdout_capture.has_value());
    EXPECT_EQ(result.stdout_capture->lines, (std::vector<std::string>{"started"}));
}

TEST(ProcessEngineTest, TimesOutWhileOutputKeepsArriving) {
    ProcessEngine engine([](StreamKind, const std::string&) {});
    const auto result = engine.execute(shell("while :; do echo tick; done", 1));

    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.exit_code, -1);
    EXPECT_GE(result.elapsed_ms, 1000);
    EXPECT_LT(result.elapsed_ms, 5000);
    ASSERT_TRUE(result.stdout_capture.has_value());
    EXPECT_FALSE(result.stdout_capture->lines.empty());
    EXPECT_EQ(result.stdout_capture->lines.front(), "tick");
}

TEST(ProcessEngineTest, TimeoutKillsBackgroundChildrenToo) {
    // A long grace period makes a surviving grandchild, which keeps stdout
    // open, show up in the elapsed time.
    ProcessEngine engine([](StreamKind, const std::string&) {},
                         ProcessEngine::Options{std::chrono::milliseconds(5000)});
    const auto result = engine.execute(shell("sleep 30 & echo $!; wait", 1));

    EXPECT_TRUE(result.timed_out);
    EXPECT_LT(result.elapsed_ms, 4000);
    ASSERT_TRUE(result.stdout_capture.has_value());
    ASSERT_EQ(result.stdout_capture->lines.size(), 1u);

    const pid_t sleeper = static_cast<pid_t>(std::stol(result.stdout_capture->lines[0]));
    bool gone = process_gone(sleeper);
    for (int i = 0; i < 100 && !gone; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        gone = process_gone(sleeper);
    }
    EXPECT_TRUE(gone);
}

TEST(ProcessEngineTest, OmitsStreamsThatAreNotCaptured) {
    RecordingEngine recorder;
    auto request = shell("echo out; echo err >&2");
    request.capture_stdout = false;
    const auto result = recorder.engine().execute(request);

    EXPECT_TRUE(result.success());
    EXPECT_FALSE(result.stdout_capture.has_value());
    ASSERT_TRUE(result.stderr_capture.has_value());
    EXPECT_EQ(result.stderr_capture->lines, (std::vector<std::string>{"err"}));
}

TEST(ProcessEngineTest, RunsInRequestedWorkingDirectory) {
    const auto dir = std::filesystem::current_path() /
                     (".tmp_process_engine_" + toolpilot::core::config::generate_id(""));
    std::filesystem::create_directories(dir);

    RecordingEngine recorder;
    auto request = shell("pwd");
    request.working_directory = dir;
    const auto result = recorder.engine().execute(request);

    ASSERT_TRUE(result.stdout_capture.has_value());
    ASSERT_EQ(result.stdout_capture->lines.size(), 1u);
    EXPECT_EQ(std::filesystem::canonical(result.stdout_capture->lines[0]),
              std::filesystem::canonical(dir));

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}

TEST(ProcessEngineTest, RejectsMissingWorkingDirectory) {
    RecordingEngine recorder;
    auto request = shell("echo never");
    request.working_directory = std::filesystem::current_path() / "__missing_engine_dir__";
    const auto result = recorder.engine().execute(request);

    EXPECT_FALSE(result.success());
    EXPECT_EQ(result.exit_code, -1);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->category, ErrorCategory::Input);
    EXPECT_EQ(result.error->code, "invalid_working_directory");
    EXPECT_GE(result.elapsed_ms, 0);
    EXPECT_TRUE(recorder.lines().empty());
}

TEST(ProcessEngineTest, ReportsMissingExecutable) {
    RecordingEngine recorder;
    ExecutionRequest request;
    request.executable = "definitely-not-a-real-binary-toolpilot";
    const auto result = recorder.engine().execute(request);

    EXPECT_FALSE(result.success());
    EXPECT_EQ(result.exit_code, -1);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->category, ErrorCategory::NotFound);
    EXPECT_EQ(result.error->code, "executable_not_found");
}

TEST(ProcessEngineTest, ResolvesExecutablesOnPath) {
    auto found = toolpilot::runtime::resolve_executable("sh");
    ASSERT_FALSE(is_error(found));
    EXPECT_TRUE(std::filesystem::path(get_value(found)).is_absolute());

    auto missing = toolpilot::runtime::resolve_executable("./no/such/tool");
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "executable_not_found");
}

TEST(ProcessEngineTest, MapsSignalDeathToExitCode) {
    RecordingEngine recorder;
    const auto result = recorder.engine().execute(shell("kill -TERM $$"));
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.exit_code, 128 + 15);
}

}  // namespace
