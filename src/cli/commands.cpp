#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/config_loader.hpp"
#include "executor/execution_service.hpp"
#include "sandbox/errors.hpp"
#include "sandbox/language_registry.hpp"
#include "utils/logging.hpp"
#include "nlohmann/json.hpp"

namespace {

constexpr const char* kUsage =
    "Usage: codebox_cli run <language> <file|-> [--timeout-ms N] [--memory 256m] "
    "[--network|--no-network]\n"
    "       codebox_cli check\n"
    "       codebox_cli languages";

std::optional<std::string> ReadSource(const std::string& path) {
    if (path == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }
    std::ifstream input(path, std::ios::in | std::ios::binary);
    if (!input.is_open()) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

int RunCode(codebox::executor::ExecutionService& service, const std::vector<std::string>& args) {
    if (args.size() < 2) {
        std::cout << kUsage << std::endl;
        return 1;
    }
    codebox::executor::ExecutionOptions options{};
    options.language = args[0];
    const auto& path = args[1];
    for (std::size_t i = 2; i < args.size(); ++i) {
        const auto& flag = args[i];
        if (flag == "--timeout-ms" && i + 1 < args.size()) {
            try {
                options.timeout_ms = std::stoi(args[++i]);
            } catch (const std::logic_error&) {
                std::cout << "Invalid --timeout-ms value: " << args[i] << std::endl;
                return 1;
            }
        } else if (flag == "--memory" && i + 1 < args.size()) {
            options.memory_limit = args[++i];
        } else if (flag == "--network") {
            options.network_disabled = false;
        } else if (flag == "--no-network") {
            options.network_disabled = true;
        } else {
            std::cout << "Unknown option: " << flag << std::endl;
            std::cout << kUsage << std::endl;
            return 1;
        }
    }

    const auto code = ReadSource(path);
    if (!code) {
        std::cout << "Failed to read source file: " << path << std::endl;
        return 1;
    }

    try {
        const auto result = service.Execute(*code, options);
        std::cout << codebox::executor::ToJson(result).dump(2) << std::endl;
        return result.state == codebox::sandbox::ExecutionState::kCompleted ? 0 : 1;
    } catch (const codebox::sandbox::FilesystemError& ex) {
        std::cout << "Failed to create workspace: " << ex.what() << std::endl;
        return 1;
    }
}

int CheckRuntime(const codebox::executor::ExecutionService& service) {
    if (service.IsAvailable()) {
        std::cout << "available" << std::endl;
        return 0;
    }
    std::cout << "unavailable" << std::endl;
    return 1;
}

int ListLanguages(const codebox::executor::ExecutionService& service) {
    nlohmann::json json = nlohmann::json::array();
    for (const auto& id : service.Registry().Languages()) {
        const auto profile = service.Registry().Resolve(id);
        json.push_back({
            {"id", profile.id},
            {"image", profile.image},
            {"extension", profile.extension},
            {"command", profile.command}
        });
    }
    std::cout << json.dump(2) << std::endl;
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cout << kUsage << std::endl;
        return 1;
    }

    const auto config = codebox::config::LoadConfig();
    codebox::utils::LogConfig log_config{};
    log_config.min_level = codebox::utils::ParseLogLevel(config.logging.level, log_config.min_level);
    codebox::utils::SetLogConfig(log_config);

    codebox::executor::ExecutionService service(
        config.executor,
        codebox::sandbox::LanguageRegistry(config.languages));

    const std::string command = argv[1];
    const std::vector<std::string> args(argv + 2, argv + argc);
    if (command == "run") {
        return RunCode(service, args);
    }
    if (command == "check") {
        return CheckRuntime(service);
    }
    if (command == "languages") {
        return ListLanguages(service);
    }

    std::cout << kUsage << std::endl;
    return 1;
}
