#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include "utils/logging.hpp"

namespace codebox::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

std::filesystem::path GetConfigPath() {
    const auto explicit_path = GetEnv("CODEBOX_CONFIG");
    if (!explicit_path.empty()) {
        return explicit_path;
    }
    return GetHomePath() / ".codebox" / "config.json";
}

bool ParseBool(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::logic_error&) {
        utils::Log(utils::LogLevel::kWarn, "config", "ignoring non-integer value",
                   {{"value", value}});
        return fallback;
    }
}

void ApplyString(const nlohmann::json& source, const char* key, std::string& target) {
    if (source.contains(key) && source[key].is_string()) {
        target = source[key].get<std::string>();
    }
}

void ApplyInt(const nlohmann::json& source, const char* key, int& target) {
    if (source.contains(key) && source[key].is_number_integer()) {
        target = source[key].get<int>();
    }
}

void ApplyBool(const nlohmann::json& source, const char* key, bool& target) {
    if (source.contains(key) && source[key].is_boolean()) {
        target = source[key].get<bool>();
    }
}

void ApplyExecutorConfig(ExecutorConfig& target, const nlohmann::json& executor) {
    if (!executor.is_object()) {
        return;
    }
    ApplyString(executor, "runtime", target.runtime);
    ApplyString(executor, "scratchRoot", target.scratch_root);
    ApplyInt(executor, "defaultTimeoutMs", target.default_timeout_ms);
    ApplyString(executor, "defaultMemoryLimit", target.default_memory_limit);
    ApplyBool(executor, "networkDisabledByDefault", target.network_disabled_by_default);
    ApplyString(executor, "containerWorkdir", target.container_workdir);
    ApplyBool(executor, "runAsHostUser", target.run_as_host_user);
    ApplyString(executor, "cpus", target.cpus);
    ApplyInt(executor, "pidsLimit", target.pids_limit);
    ApplyInt(executor, "maxConcurrent", target.max_concurrent);
}

void ApplyLanguages(std::vector<LanguageOverride>& target, const nlohmann::json& languages) {
    if (!languages.is_object()) {
        return;
    }
    for (const auto& item : languages.items()) {
        const auto& entry = item.value();
        if (!entry.is_object()) {
            continue;
        }
        LanguageOverride language{};
        language.id = item.key();
        ApplyString(entry, "image", language.image);
        ApplyString(entry, "extension", language.extension);
        if (entry.contains("command") && entry["command"].is_array()) {
            for (const auto& token : entry["command"]) {
                if (token.is_string()) {
                    language.command.push_back(token.get<std::string>());
                }
            }
        }
        target.push_back(std::move(language));
    }
}

}  // namespace

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }
    if (data.contains("executor")) {
        ApplyExecutorConfig(config.executor, data["executor"]);
    }
    if (data.contains("languages")) {
        ApplyLanguages(config.languages, data["languages"]);
    }
    if (data.contains("logging") && data["logging"].is_object()) {
        ApplyString(data["logging"], "level", config.logging.level);
    }
}

Config LoadConfigFromFile(const std::filesystem::path& path) {
    Config config{};
    if (!std::filesystem::exists(path)) {
        return config;
    }
    std::ifstream input(path);
    if (!input.is_open()) {
        utils::Log(utils::LogLevel::kWarn, "config", "cannot open config file",
                   {{"path", path.string()}});
        return config;
    }
    try {
        nlohmann::json data;
        input >> data;
        ApplyConfigFromJson(config, data);
    } catch (const nlohmann::json::exception& ex) {
        utils::Log(utils::LogLevel::kWarn, "config", "keeping defaults on parse error",
                   {{"path", path.string()}, {"error", ex.what()}});
        return Config{};
    }
    return config;
}

Config LoadConfig() {
    auto config = LoadConfigFromFile(GetConfigPath());

    const auto runtime = GetEnvFallback("CODEBOX_EXECUTOR__RUNTIME", "CODEBOX_RUNTIME");
    if (!runtime.empty()) {
        config.executor.runtime = runtime;
    }

    const auto scratch_root = GetEnvFallback(
        "CODEBOX_EXECUTOR__SCRATCH_ROOT",
        "CODEBOX_SCRATCH_ROOT");
    if (!scratch_root.empty()) {
        config.executor.scratch_root = scratch_root;
    }

    const auto timeout_ms = GetEnvFallback(
        "CODEBOX_EXECUTOR__DEFAULT_TIMEOUT_MS",
        "CODEBOX_TIMEOUT_MS");
    if (!timeout_ms.empty()) {
        config.executor.default_timeout_ms = ParseInt(timeout_ms, config.executor.default_timeout_ms);
    }

    const auto memory_limit = GetEnvFallback(
        "CODEBOX_EXECUTOR__DEFAULT_MEMORY_LIMIT",
        "CODEBOX_MEMORY_LIMIT");
    if (!memory_limit.empty()) {
        config.executor.default_memory_limit = memory_limit;
    }

    const auto network_disabled = GetEnvFallback(
        "CODEBOX_EXECUTOR__NETWORK_DISABLED_BY_DEFAULT",
        "CODEBOX_NETWORK_DISABLED");
    if (!network_disabled.empty()) {
        config.executor.network_disabled_by_default = ParseBool(network_disabled);
    }

    const auto max_concurrent = GetEnvFallback(
        "CODEBOX_EXECUTOR__MAX_CONCURRENT",
        "CODEBOX_MAX_CONCURRENT");
    if (!max_concurrent.empty()) {
        config.executor.max_concurrent = ParseInt(max_concurrent, config.executor.max_concurrent);
    }

    const auto log_level = GetEnvFallback("CODEBOX_LOGGING__LEVEL", "CODEBOX_LOG_LEVEL");
    if (!log_level.empty()) {
        config.logging.level = log_level;
    }

    return config;
}

}  // namespace codebox::config
