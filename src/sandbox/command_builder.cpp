#include "sandbox/command_builder.hpp"

#include <regex>
#include <unistd.h>

#include "sandbox/errors.hpp"
#include "utils/common.hpp"

namespace codebox::sandbox {
namespace {

bool IsValidCpus(const std::string& value) {
    static const std::regex kPattern("^[0-9]+(\\.[0-9]+)?$");
    return std::regex_match(value, kPattern);
}

bool IsValidContainerName(const std::string& value) {
    static const std::regex kPattern("^[a-zA-Z0-9][a-zA-Z0-9_.-]*$");
    return std::regex_match(value, kPattern);
}

// -v uses ':' as its separator, so a path containing one cannot be mounted.
void ValidateMountPath(const std::filesystem::path& path, const char* what) {
    const auto text = path.string();
    if (!path.is_absolute() || text.find(':') != std::string::npos ||
        text.find('\n') != std::string::npos) {
        throw InvalidOptionsError(std::string("unusable ") + what + ": " + text);
    }
}

}  // namespace

std::string SandboxCommand::ToString() const {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(program);
    argv.insert(argv.end(), args.begin(), args.end());
    return utils::Join(argv, " ");
}

CommandBuilder::CommandBuilder(const config::ExecutorConfig& config,
                               const LanguageRegistry& registry)
    : config_(config)
    , registry_(registry) {}

// Zero means "unlimited" to docker, so it is not a valid limit.
bool CommandBuilder::IsValidMemoryLimit(const std::string& value) {
    static const std::regex kPattern("^0*[1-9][0-9]*[bkmg]?$", std::regex::icase);
    return std::regex_match(value, kPattern);
}

SandboxCommand CommandBuilder::Build(const std::filesystem::path& source_file,
                                     const std::filesystem::path& source_dir,
                                     const std::string& language,
                                     const RunConstraints& constraints) const {
    ValidateMountPath(source_dir, "workspace path");
    ValidateMountPath(config_.container_workdir, "container workdir");
    const auto filename = source_file.filename().string();
    if (filename.empty() || filename.front() == '-') {
        throw InvalidOptionsError("unusable source file name: " + filename);
    }

    const auto memory = constraints.memory_limit.value_or(config_.default_memory_limit);
    if (!IsValidMemoryLimit(memory)) {
        throw InvalidOptionsError("invalid memory limit: " + memory);
    }
    if (!config_.cpus.empty() && !IsValidCpus(config_.cpus)) {
        throw InvalidOptionsError("invalid cpus value: " + config_.cpus);
    }
    if (!constraints.container_name.empty() && !IsValidContainerName(constraints.container_name)) {
        throw InvalidOptionsError("invalid container name: " + constraints.container_name);
    }
    const bool network_disabled =
        constraints.network_disabled.value_or(config_.network_disabled_by_default);

    const auto profile = registry_.Resolve(language);

    SandboxCommand command{};
    command.program = config_.runtime;
    command.container_name = constraints.container_name;
    auto& args = command.args;
    args.push_back("run");
    args.push_back("--rm");
    if (!constraints.container_name.empty()) {
        args.push_back("--name");
        args.push_back(constraints.container_name);
    }
    if (network_disabled) {
        args.push_back("--network=none");
    }
    args.push_back("--memory");
    args.push_back(memory);
    if (!config_.cpus.empty()) {
        args.push_back("--cpus");
        args.push_back(config_.cpus);
    }
    if (config_.pids_limit > 0) {
        args.push_back("--pids-limit");
        args.push_back(std::to_string(config_.pids_limit));
    }
    if (config_.run_as_host_user) {
        args.push_back("--user");
        args.push_back(std::to_string(::getuid()) + ":" + std::to_string(::getgid()));
    }
    args.push_back("-v");
    args.push_back(source_dir.string() + ":" + config_.container_workdir);
    args.push_back("-w");
    args.push_back(config_.container_workdir);
    args.push_back(profile.image);
    args.insert(args.end(), profile.command.begin(), profile.command.end());
    args.push_back(filename);
    return command;
}

}  // namespace codebox::sandbox
