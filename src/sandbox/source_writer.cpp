#include "sandbox/source_writer.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>

#include "sandbox/errors.hpp"

namespace codebox::sandbox {

std::filesystem::path WriteSource(const std::string& code,
                                  const std::filesystem::path& source_dir,
                                  const std::string& language,
                                  const LanguageRegistry& registry) {
    const auto profile = registry.Resolve(language);
    const auto path = source_dir / ("code." + profile.extension);

    std::ofstream output(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        throw IoError("cannot open " + path.string() + ": " + std::strerror(errno));
    }
    output.write(code.data(), static_cast<std::streamsize>(code.size()));
    output.flush();
    if (!output) {
        throw IoError("cannot write " + path.string() + ": " + std::strerror(errno));
    }
    return path;
}

}  // namespace codebox::sandbox
