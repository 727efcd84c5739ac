#include "executor/execution_service.hpp"

#include <chrono>
#include <utility>

#include "sandbox/availability_probe.hpp"
#include "sandbox/errors.hpp"
#include "sandbox/source_writer.hpp"
#include "sandbox/workspace.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace codebox::executor {
namespace {

ExecutionResult FailedResult(const std::string& message,
                             std::chrono::steady_clock::time_point start) {
    ExecutionResult result{};
    result.state = sandbox::ExecutionState::kFailed;
    result.exit_code = sandbox::SandboxExecutor::kFailedExitCode;
    result.stderr_text = message;
    result.execution_time_ms = utils::ElapsedMs(start, std::chrono::steady_clock::now());
    return result;
}

}  // namespace

nlohmann::json ToJson(const ExecutionResult& result) {
    nlohmann::json json = {
        {"stdout", result.stdout_text},
        {"stderr", result.stderr_text},
        {"exitCode", result.exit_code},
        {"executionTimeMs", result.execution_time_ms},
        {"state", sandbox::ToString(result.state)}
    };
    if (result.memory_usage.has_value()) {
        json["memoryUsage"] = *result.memory_usage;
    }
    return json;
}

ExecutionService::ExecutionService(config::ExecutorConfig config, sandbox::LanguageRegistry registry)
    : config_(std::move(config))
    , registry_(std::move(registry))
    , builder_(config_, registry_)
    , executor_(config_.runtime)
    , limiter_(config_.max_concurrent > 0 ? static_cast<std::size_t>(config_.max_concurrent) : 0) {}

ExecutionResult ExecutionService::Execute(const std::string& code, const ExecutionOptions& options) {
    ConcurrencyLimiter::Slot slot(limiter_);

    // Failure here propagates: no session exists yet.
    auto workspace = sandbox::Workspace::Create(config_.scratch_root, sandbox::GenerateSessionId());
    const auto start = std::chrono::steady_clock::now();
    utils::Log(utils::LogLevel::kInfo, "executor", "execute",
               {{"session", workspace.SessionId()},
                {"language", options.language},
                {"code_bytes", std::to_string(code.size())}});

    try {
        const int timeout_ms = options.timeout_ms.value_or(config_.default_timeout_ms);
        if (timeout_ms <= 0) {
            throw sandbox::InvalidOptionsError("timeout must be positive: " + std::to_string(timeout_ms));
        }
        const auto source = sandbox::WriteSource(code, workspace.SourceDir(), options.language, registry_);

        sandbox::RunConstraints constraints{};
        constraints.memory_limit = options.memory_limit;
        constraints.network_disabled = options.network_disabled;
        constraints.container_name = "codebox-" + workspace.SessionId();
        const auto command = builder_.Build(source, workspace.SourceDir(), options.language, constraints);

        const auto exec = executor_.Run(
            command,
            sandbox::CapturePaths{workspace.StdoutPath(), workspace.StderrPath()},
            std::chrono::milliseconds(timeout_ms));

        ExecutionResult result{};
        result.state = exec.state;
        result.exit_code = exec.exit_code;
        result.stdout_text = exec.output;
        result.stderr_text = exec.error;
        result.execution_time_ms = exec.execution_time_ms;
        return result;
    } catch (const sandbox::FilesystemError& ex) {
        utils::Log(utils::LogLevel::kError, "executor", "workspace i/o failed",
                   {{"session", workspace.SessionId()}, {"error", ex.what()}});
        return FailedResult(std::string("Error: ") + ex.what(), start);
    } catch (const sandbox::InvalidOptionsError& ex) {
        utils::Log(utils::LogLevel::kWarn, "executor", "rejected options",
                   {{"session", workspace.SessionId()}, {"error", ex.what()}});
        return FailedResult(std::string("Error: ") + ex.what(), start);
    }
}

bool ExecutionService::IsAvailable() const {
    return sandbox::IsRuntimeAvailable(config_.runtime);
}

}  // namespace codebox::executor
