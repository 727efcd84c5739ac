#include "sandbox/sandbox_executor.hpp"

#include <boost/process.hpp>
#include <algorithm>
#include <cerrno>
#include <fstream>
#include <sstream>
#include <thread>
#include <utility>
#include <vector>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include "sandbox/errors.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace codebox::sandbox {
namespace bp = boost::process;
namespace {

constexpr std::chrono::milliseconds kPollInterval(10);
constexpr std::chrono::seconds kContainerRemoveTimeout(10);

enum class WaitOutcome {
    kExited,
    kDeadline,
    kLost
};

WaitOutcome WaitUntil(pid_t pid, std::chrono::steady_clock::time_point deadline, int& status) {
    while (true) {
        const auto waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            return WaitOutcome::kExited;
        }
        if (waited < 0) {
            if (errno == EINTR) {
                continue;
            }
            return WaitOutcome::kLost;
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return WaitOutcome::kDeadline;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(kPollInterval, remaining));
    }
}

void WaitBlocking(pid_t pid, int& status) {
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return;
        }
    }
}

int DecodeStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

boost::filesystem::path ResolveProgram(const std::string& program) {
    if (program.find('/') != std::string::npos) {
        boost::filesystem::path path(program);
        boost::system::error_code ec;
        if (!boost::filesystem::exists(path, ec)) {
            throw RuntimeUnavailableError("runtime not found: " + program +
                                          (ec ? " (" + ec.message() + ")" : std::string()));
        }
        return path;
    }
    auto path = bp::search_path(program);
    if (path.empty()) {
        throw RuntimeUnavailableError("runtime not found in PATH: " + program);
    }
    return path;
}

std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::in | std::ios::binary);
    if (!input.is_open()) {
        return {};
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

}  // namespace

const char* ToString(ExecutionState state) {
    switch (state) {
        case ExecutionState::kPending: return "pending";
        case ExecutionState::kRunning: return "running";
        case ExecutionState::kCompleted: return "completed";
        case ExecutionState::kTimedOut: return "timed_out";
        case ExecutionState::kFailed: return "failed";
    }
    return "unknown";
}

SandboxExecutor::SandboxExecutor(std::string runtime)
    : runtime_(std::move(runtime)) {}

ExecResult SandboxExecutor::Run(const SandboxCommand& command,
                                const CapturePaths& capture,
                                std::chrono::milliseconds timeout) const {
    ExecResult result{};
    const auto start = std::chrono::steady_clock::now();
    utils::Log(utils::LogLevel::kDebug, "exec", "launch",
               {{"command", command.ToString()}, {"timeout_ms", std::to_string(timeout.count())}});

    try {
        const auto program = ResolveProgram(command.program);
        bp::group group;
        bp::child child_process(
            bp::exe = program,
            bp::args = command.args,
            bp::std_in < bp::null,
            bp::std_out > capture.stdout_path.string(),
            bp::std_err > capture.stderr_path.string(),
            group);
        result.state = ExecutionState::kRunning;

        const pid_t pid = child_process.id();
        int status = 0;
        auto outcome = WaitUntil(pid, start + timeout, status);
        result.execution_time_ms = utils::ElapsedMs(start, std::chrono::steady_clock::now());
        if (outcome == WaitOutcome::kDeadline) {
            // The client only forwards signals; rm -f below stops the container.
            result.state = ExecutionState::kTimedOut;
            std::error_code ec;
            group.terminate(ec);
            if (ec) {
                utils::Log(utils::LogLevel::kDebug, "exec", "process group already gone",
                           {{"error", ec.message()}});
                ::kill(pid, SIGKILL);
            }
            WaitBlocking(pid, status);
        }
        // reaped above
        child_process.detach();
        group.detach();

        if (result.state == ExecutionState::kTimedOut) {
            if (!command.container_name.empty()) {
                RemoveContainer(command.container_name);
            }
            result.exit_code = kTimeoutExitCode;
        } else if (outcome == WaitOutcome::kLost) {
            result.state = ExecutionState::kFailed;
            result.exit_code = kFailedExitCode;
        } else {
            result.exit_code = DecodeStatus(status);
            result.state = result.exit_code == kFailedExitCode ? ExecutionState::kFailed
                                                               : ExecutionState::kCompleted;
        }
    } catch (const bp::process_error& ex) {
        result.state = ExecutionState::kFailed;
        result.exit_code = kFailedExitCode;
        result.error = std::string("Error: exec failed: ") + ex.what();
    } catch (const RuntimeUnavailableError& ex) {
        result.state = ExecutionState::kFailed;
        result.exit_code = kFailedExitCode;
        result.error = std::string("Error: ") + ex.what();
    }

    if (result.state == ExecutionState::kFailed && !result.error.empty()) {
        result.execution_time_ms = utils::ElapsedMs(start, std::chrono::steady_clock::now());
        utils::Log(utils::LogLevel::kError, "exec", "launch failed", {{"error", result.error}});
        return result;
    }

    result.output = ReadFile(capture.stdout_path);
    result.error = ReadFile(capture.stderr_path);
    if (result.state == ExecutionState::kTimedOut) {
        if (!result.error.empty() && result.error.back() != '\n') {
            result.error += '\n';
        }
        result.error += "Execution timed out after " + std::to_string(timeout.count()) + " ms";
    } else if (result.state == ExecutionState::kFailed && result.error.empty()) {
        result.error = "Error: sandbox runtime failed";
    }
    utils::Log(utils::LogLevel::kInfo, "exec", "finished",
               {{"state", ToString(result.state)},
                {"exit_code", std::to_string(result.exit_code)},
                {"time_ms", std::to_string(result.execution_time_ms)}});
    return result;
}

void SandboxExecutor::RemoveContainer(const std::string& container_name) const {
    try {
        const auto program = ResolveProgram(runtime_);
        bp::child remover(
            bp::exe = program,
            bp::args = std::vector<std::string>{"rm", "-f", container_name},
            bp::std_in < bp::null,
            bp::std_out > bp::null,
            bp::std_err > bp::null);
        int status = 0;
        const pid_t pid = remover.id();
        const auto outcome = WaitUntil(
            pid, std::chrono::steady_clock::now() + kContainerRemoveTimeout, status);
        if (outcome == WaitOutcome::kDeadline) {
            ::kill(pid, SIGKILL);
            WaitBlocking(pid, status);
        }
        remover.detach();
        if (outcome != WaitOutcome::kExited || DecodeStatus(status) != 0) {
            utils::Log(utils::LogLevel::kWarn, "exec", "container removal did not succeed",
                       {{"container", container_name}});
        }
    } catch (const bp::process_error& ex) {
        utils::Log(utils::LogLevel::kWarn, "exec", "container removal failed",
                   {{"container", container_name}, {"error", ex.what()}});
    } catch (const RuntimeUnavailableError& ex) {
        utils::Log(utils::LogLevel::kWarn, "exec", "container removal failed",
                   {{"container", container_name}, {"error", ex.what()}});
    }
}

}  // namespace codebox::sandbox
