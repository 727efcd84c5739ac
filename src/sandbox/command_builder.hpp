#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "sandbox/language_registry.hpp"

namespace codebox::sandbox {

struct RunConstraints {
    std::optional<std::string> memory_limit;
    std::optional<bool> network_disabled;
    // Lets the supervisor remove the container after a timeout. Empty omits --name.
    std::string container_name;
};

// argv for an isolated run. Executed directly, never through a shell.
struct SandboxCommand {
    std::string program;
    std::vector<std::string> args;
    std::string container_name;

    std::string ToString() const;
};

class CommandBuilder {
public:
    CommandBuilder(const config::ExecutorConfig& config, const LanguageRegistry& registry);

    // Throws InvalidOptionsError when a constraint or path fails validation.
    SandboxCommand Build(const std::filesystem::path& source_file,
                         const std::filesystem::path& source_dir,
                         const std::string& language,
                         const RunConstraints& constraints) const;

    static bool IsValidMemoryLimit(const std::string& value);

private:
    const config::ExecutorConfig& config_;
    const LanguageRegistry& registry_;
};

}  // namespace codebox::sandbox
