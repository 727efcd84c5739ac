#pragma once

#include <string>
#include <vector>

namespace codebox::config {

struct ExecutorConfig {
    std::string runtime = "docker";
    std::string scratch_root = "/tmp/code-execution";
    int default_timeout_ms = 10000;
    std::string default_memory_limit = "256m";
    bool network_disabled_by_default = true;
    std::string container_workdir = "/code";
    // Adds --user <uid>:<gid> so guest files stay owned by the host user.
    bool run_as_host_user = true;
    std::string cpus;
    int pids_limit = 0;
    int max_concurrent = 0;
};

struct LanguageOverride {
    std::string id;
    std::string image;
    std::string extension;
    std::vector<std::string> command;
};

struct LoggingConfig {
    std::string level = "info";
};

struct Config {
    ExecutorConfig executor;
    std::vector<LanguageOverride> languages;
    LoggingConfig logging;
};

}  // namespace codebox::config
