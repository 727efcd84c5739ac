#include "sandbox/language_registry.hpp"

#include <algorithm>
#include <cctype>

#include "utils/logging.hpp"

namespace codebox::sandbox {
namespace {

std::vector<LanguageProfile> BuiltinProfiles() {
    return {
        {"javascript", "node:18-alpine", "js", {"node"}},
        {"typescript", "node:18-alpine", "ts", {"ts-node"}},
        {"python", "python:3.10-alpine", "py", {"python"}},
        {"java", "openjdk:17-alpine", "java", {"java"}},
        {"go", "golang:1.19-alpine", "go", {"go", "run"}},
        // $0 is the source file name appended by the command builder
        {"rust", "rust:1.67-alpine", "rs",
         {"sh", "-c", "rustc -o /tmp/output \"$0\" && /tmp/output"}},
        {"ruby", "ruby:3.2-alpine", "rb", {"ruby"}},
        {"php", "php:8.2-alpine", "php", {"php"}},
        {"csharp", "mcr.microsoft.com/dotnet/sdk:7.0-alpine", "cs", {"dotnet", "run"}},
        {"c", "gcc:13", "c",
         {"sh", "-c", "gcc -O2 -o /tmp/program \"$0\" && /tmp/program"}},
        {"cpp", "gcc:13", "cpp",
         {"sh", "-c", "g++ -O2 -std=c++17 -o /tmp/program \"$0\" && /tmp/program"}},
    };
}

// The extension becomes part of the file name passed into the container.
bool IsValidExtension(const std::string& extension) {
    return !extension.empty() &&
           std::all_of(extension.begin(), extension.end(), [](unsigned char c) {
               return std::islower(c) || std::isdigit(c);
           });
}

bool IsValidImage(const std::string& image) {
    return !image.empty() && image.front() != '-' &&
           std::none_of(image.begin(), image.end(), [](unsigned char c) {
               return std::isspace(c) || std::iscntrl(c);
           });
}

}  // namespace

LanguageRegistry::LanguageRegistry() {
    for (auto& profile : BuiltinProfiles()) {
        auto id = profile.id;
        profiles_.emplace(std::move(id), std::move(profile));
    }
}

LanguageRegistry::LanguageRegistry(const std::vector<config::LanguageOverride>& overrides)
    : LanguageRegistry() {
    for (const auto& entry : overrides) {
        LanguageProfile profile{};
        auto existing = Find(entry.id);
        if (existing) {
            profile = *existing;
        }
        profile.id = entry.id;
        if (!entry.image.empty()) {
            profile.image = entry.image;
        }
        if (!entry.extension.empty()) {
            profile.extension = entry.extension;
        }
        if (!entry.command.empty()) {
            profile.command = entry.command;
        }
        if (!Register(std::move(profile))) {
            utils::Log(utils::LogLevel::kWarn, "languages", "rejected language override",
                       {{"id", entry.id}});
        }
    }
}

std::optional<LanguageProfile> LanguageRegistry::Find(const std::string& id) const {
    auto it = profiles_.find(id);
    if (it == profiles_.end()) {
        return std::nullopt;
    }
    return it->second;
}

LanguageProfile LanguageRegistry::Resolve(const std::string& id) const {
    auto profile = Find(id);
    if (profile) {
        return *profile;
    }
    utils::Log(utils::LogLevel::kDebug, "languages", "unknown language, using fallback",
               {{"id", id}});
    return Fallback();
}

std::vector<std::string> LanguageRegistry::Languages() const {
    std::vector<std::string> ids;
    ids.reserve(profiles_.size());
    for (const auto& [id, _] : profiles_) {
        ids.push_back(id);
    }
    return ids;
}

bool LanguageRegistry::Register(LanguageProfile profile) {
    if (!IsValidId(profile.id) || !IsValidExtension(profile.extension) ||
        !IsValidImage(profile.image) || profile.command.empty()) {
        return false;
    }
    auto id = profile.id;
    profiles_[id] = std::move(profile);
    return true;
}

const LanguageProfile& LanguageRegistry::Fallback() {
    static const LanguageProfile kFallback{"", "alpine:latest", "txt", {"sh"}};
    return kFallback;
}

bool LanguageRegistry::IsValidId(const std::string& id) {
    return !id.empty() && std::all_of(id.begin(), id.end(), [](unsigned char c) {
        return std::islower(c) || std::isdigit(c) || c == '_' || c == '+' || c == '#' || c == '-';
    });
}

}  // namespace codebox::sandbox
