#include <gtest/gtest.h>

#include <cerrno>
#include <chrono>
#include <string>
#include <signal.h>

#include "sandbox/sandbox_executor.hpp"
#include "test_support.hpp"

using codebox::sandbox::CapturePaths;
using codebox::sandbox::ExecutionState;
using codebox::sandbox::SandboxCommand;
using codebox::sandbox::SandboxExecutor;
using codebox::testing::TempDir;

namespace {

class SandboxExecutorTest : public ::testing::Test {
protected:
    codebox::sandbox::ExecResult RunShell(const std::string& script,
                                          std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
        SandboxCommand command{};
        command.program = "/bin/sh";
        command.args = {"-c", script};
        return executor_.Run(command, Capture(), timeout);
    }

    CapturePaths Capture() const {
        return CapturePaths{temp_.Path() / "stdout.log", temp_.Path() / "stderr.log"};
    }

    TempDir temp_;
    SandboxExecutor executor_;
};

}  // namespace

TEST_F(SandboxExecutorTest, CapturesOutputAndZeroExit) {
    const auto result = RunShell("echo hello; echo warn >&2");
    EXPECT_EQ(result.state, ExecutionState::kCompleted);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.output, "hello\n");
    EXPECT_EQ(result.error, "warn\n");
    EXPECT_GE(result.execution_time_ms, 0);
}

TEST_F(SandboxExecutorTest, NonZeroExitIsReportedNotThrown) {
    const auto result = RunShell("exit 2");
    EXPECT_EQ(result.state, ExecutionState::kCompleted);
    EXPECT_EQ(result.exit_code, 2);
}

TEST_F(SandboxExecutorTest, SignalDeathMapsTo128PlusSignal) {
    const auto result = RunShell("kill -9 $$");
    EXPECT_EQ(result.state, ExecutionState::kCompleted);
    EXPECT_EQ(result.exit_code, 128 + 9);
}

TEST_F(SandboxExecutorTest, StandardInputIsClosed) {
    const auto result = RunShell("cat; echo done");
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.output, "done\n");
}

TEST_F(SandboxExecutorTest, DeadlineKillsProcessAndKeepsPartialOutput) {
    const auto timeout = std::chrono::milliseconds(300);
    const auto result = RunShell("echo $$; sleep 30", timeout);

    EXPECT_EQ(result.state, ExecutionState::kTimedOut);
    EXPECT_EQ(result.exit_code, SandboxExecutor::kTimeoutExitCode);
    EXPECT_GE(result.execution_time_ms, timeout.count());
    EXPECT_LT(result.execution_time_ms, timeout.count() + 250);
    EXPECT_NE(result.error.find("timed out after 300 ms"), std::string::npos);

    ASSERT_FALSE(result.output.empty());
    const pid_t pid = static_cast<pid_t>(std::stol(result.output));
    EXPECT_EQ(::kill(pid, 0), -1);
    EXPECT_EQ(errno, ESRCH);
}

TEST_F(SandboxExecutorTest, DeadlineIsNotExtendedByProcessIgnoringTerm) {
    const auto timeout = std::chrono::milliseconds(500);
    const auto before = std::chrono::steady_clock::now();
    const auto result = RunShell("trap '' TERM; sleep 30", timeout);
    const auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - before);

    EXPECT_EQ(result.state, ExecutionState::kTimedOut);
    EXPECT_EQ(result.exit_code, SandboxExecutor::kTimeoutExitCode);
    EXPECT_GE(result.execution_time_ms, timeout.count());
    EXPECT_LT(result.execution_time_ms, 750);
    EXPECT_LT(waited.count(), 1500);
}

TEST_F(SandboxExecutorTest, MissingRuntimeIsFailedState) {
    SandboxCommand command{};
    command.program = "/nonexistent/runtime";
    command.args = {"run"};
    const auto result = executor_.Run(command, Capture(), std::chrono::seconds(1));
    EXPECT_EQ(result.state, ExecutionState::kFailed);
    EXPECT_EQ(result.exit_code, SandboxExecutor::kFailedExitCode);
    EXPECT_TRUE(result.output.empty());
    EXPECT_NE(result.error.find("runtime not found"), std::string::npos);
}

TEST_F(SandboxExecutorTest, UncheckableRuntimePathIsFailedStateNotException) {
    SandboxCommand command{};
    command.program = "/" + std::string(5000, 'a') + "/runtime";
    command.args = {"run"};
    codebox::sandbox::ExecResult result{};
    EXPECT_NO_THROW(result = executor_.Run(command, Capture(), std::chrono::seconds(1)));
    EXPECT_EQ(result.state, ExecutionState::kFailed);
    EXPECT_EQ(result.exit_code, SandboxExecutor::kFailedExitCode);
    EXPECT_NE(result.error.find("runtime not found"), std::string::npos);
}

TEST_F(SandboxExecutorTest, RuntimeRejectionStatusIsFailedState) {
    const auto result = RunShell("echo 'daemon unreachable' >&2; exit 125");
    EXPECT_EQ(result.state, ExecutionState::kFailed);
    EXPECT_EQ(result.exit_code, SandboxExecutor::kFailedExitCode);
    EXPECT_EQ(result.error, "daemon unreachable\n");
}
