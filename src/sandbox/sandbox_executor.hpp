#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

#include "sandbox/command_builder.hpp"

namespace codebox::sandbox {

// Pending -> Running -> {Completed, TimedOut, Failed}. Terminal states are final.
enum class ExecutionState {
    kPending,
    kRunning,
    kCompleted,
    kTimedOut,
    kFailed
};

const char* ToString(ExecutionState state);

struct ExecResult {
    ExecutionState state = ExecutionState::kPending;
    int exit_code = -1;
    std::string output;
    std::string error;
    std::int64_t execution_time_ms = 0;
};

// Host-side files the child's stdout/stderr are redirected into. They must
// not be reachable from inside the sandbox.
struct CapturePaths {
    std::filesystem::path stdout_path;
    std::filesystem::path stderr_path;
};

class SandboxExecutor {
public:
    static constexpr int kTimeoutExitCode = 124;
    // Same status docker run uses when the daemon rejects a run.
    static constexpr int kFailedExitCode = 125;

    explicit SandboxExecutor(std::string runtime = "docker");

    // Runs the command until it exits or the timeout elapses. On timeout the
    // whole process group is killed at once and the named container, if any,
    // is force-removed before returning.

    ExecResult Run(const SandboxCommand& command,
                   const CapturePaths& capture,
                   std::chrono::milliseconds timeout) const;

private:
    void RemoveContainer(const std::string& container_name) const;

    std::string runtime_;
};

}  // namespace codebox::sandbox
