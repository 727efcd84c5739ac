#pragma once

#include <filesystem>
#include <string>

namespace codebox::sandbox {

// Random UUIDv4, safe to use as a single path component.
std::string GenerateSessionId();

// Per-session scratch area: <scratch_root>/<session_id>/ holding the mounted
// src/ directory and the host-side capture files. Removed on destruction.
class Workspace {
public:
    static Workspace Create(const std::filesystem::path& scratch_root,
                            const std::string& session_id);

    Workspace(Workspace&& other) noexcept;
    Workspace& operator=(Workspace&& other) noexcept;
    Workspace(const Workspace&) = delete;
    Workspace& operator=(const Workspace&) = delete;
    ~Workspace();

    const std::string& SessionId() const { return session_id_; }
    const std::filesystem::path& Root() const { return root_; }
    std::filesystem::path SourceDir() const { return root_ / "src"; }
    std::filesystem::path StdoutPath() const { return root_ / "stdout.log"; }
    std::filesystem::path StderrPath() const { return root_ / "stderr.log"; }

    // Idempotent; failures are logged, never thrown. Returns false if the
    // directory could not be removed.
    bool Remove() noexcept;

private:
    Workspace(std::string session_id, std::filesystem::path root);

    std::string session_id_;
    std::filesystem::path root_;
    bool owned_ = false;
};

}  // namespace codebox::sandbox
