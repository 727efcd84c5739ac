#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "config/config_schema.hpp"

namespace codebox::sandbox {

struct LanguageProfile {
    std::string id;
    std::string image;
    std::string extension;
    // argv run inside the container; the source file name is appended last.
    std::vector<std::string> command;
};

class LanguageRegistry {
public:
    // Built-in profiles only.
    LanguageRegistry();
    // Built-in profiles with config overrides applied on top.
    explicit LanguageRegistry(const std::vector<config::LanguageOverride>& overrides);

    std::optional<LanguageProfile> Find(const std::string& id) const;
    // Never fails: unknown ids resolve to the generic shell profile.
    LanguageProfile Resolve(const std::string& id) const;
    std::vector<std::string> Languages() const;
    bool Register(LanguageProfile profile);

    static const LanguageProfile& Fallback();
    static bool IsValidId(const std::string& id);

private:
    std::map<std::string, LanguageProfile> profiles_;
};

}  // namespace codebox::sandbox
