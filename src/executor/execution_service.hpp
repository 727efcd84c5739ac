#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "config/config_schema.hpp"
#include "executor/concurrency_limiter.hpp"
#include "nlohmann/json.hpp"
#include "sandbox/command_builder.hpp"
#include "sandbox/language_registry.hpp"
#include "sandbox/sandbox_executor.hpp"

namespace codebox::executor {

struct ExecutionOptions {
    std::string language;
    std::optional<int> timeout_ms;
    std::optional<std::string> memory_limit;
    std::optional<bool> network_disabled;
};

struct ExecutionResult {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = 0;
    std::int64_t execution_time_ms = 0;
    std::optional<std::int64_t> memory_usage;
    sandbox::ExecutionState state = sandbox::ExecutionState::kPending;
};

nlohmann::json ToJson(const ExecutionResult& result);

// Runs one untrusted program per call in a fresh sandbox. Safe to call from
// many threads at once; calls share nothing but the scratch root.
class ExecutionService {
public:
    ExecutionService(config::ExecutorConfig config, sandbox::LanguageRegistry registry);
    ExecutionService(const ExecutionService&) = delete;
    ExecutionService& operator=(const ExecutionService&) = delete;

    // Always returns a well-formed result, except when the workspace itself
    // cannot be created: that raises sandbox::FilesystemError.
    ExecutionResult Execute(const std::string& code, const ExecutionOptions& options);

    bool IsAvailable() const;

    const config::ExecutorConfig& Config() const { return config_; }
    const sandbox::LanguageRegistry& Registry() const { return registry_; }

private:
    const config::ExecutorConfig config_;
    const sandbox::LanguageRegistry registry_;
    sandbox::CommandBuilder builder_;
    sandbox::SandboxExecutor executor_;
    ConcurrencyLimiter limiter_;
};

}  // namespace codebox::executor
