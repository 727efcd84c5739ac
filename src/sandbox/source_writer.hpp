#pragma once

#include <filesystem>
#include <string>

#include "sandbox/language_registry.hpp"

namespace codebox::sandbox {

// Writes `code` verbatim to <source_dir>/code.<ext> and returns that path.
// Throws IoError when the file cannot be written. No size limit is applied.
std::filesystem::path WriteSource(const std::string& code,
                                  const std::filesystem::path& source_dir,
                                  const std::string& language,
                                  const LanguageRegistry& registry);

}  // namespace codebox::sandbox
