#include "sandbox/workspace.hpp"

#include <system_error>
#include <utility>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include "sandbox/errors.hpp"
#include "utils/logging.hpp"

namespace codebox::sandbox {
namespace {

bool IsSafeComponent(const std::string& name) {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    return name.find('/') == std::string::npos && name.find('\0') == std::string::npos;
}

// Sandboxed code may strip permissions from directories it created, which
// makes remove_all fail. Symlinks are never followed.
void RestoreOwnerAccess(const std::filesystem::path& dir) {
    std::error_code ec;
    std::filesystem::permissions(dir, std::filesystem::perms::owner_all,
                                 std::filesystem::perm_options::add, ec);
    std::filesystem::directory_iterator it(dir, ec);
    const std::filesystem::directory_iterator end{};
    for (; !ec && it != end; it.increment(ec)) {
        std::error_code status_ec;
        if (std::filesystem::is_directory(it->symlink_status(status_ec)) && !status_ec) {
            RestoreOwnerAccess(it->path());
        }
    }
}

}  // namespace

std::string GenerateSessionId() {
    // random_generator is not thread-safe; one per thread.
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

Workspace Workspace::Create(const std::filesystem::path& scratch_root,
                            const std::string& session_id) {
    if (!IsSafeComponent(session_id)) {
        throw FilesystemError("invalid session id: " + session_id);
    }
    std::error_code ec;
    std::filesystem::create_directories(scratch_root, ec);
    if (ec) {
        throw FilesystemError("cannot create scratch root " + scratch_root.string() + ": " +
                              ec.message());
    }
    const auto root = scratch_root / session_id;
    if (!std::filesystem::create_directory(root, ec)) {
        throw FilesystemError("cannot create workspace " + root.string() + ": " +
                              (ec ? ec.message() : std::string("already exists")));
    }
    Workspace workspace(session_id, root);
    if (!std::filesystem::create_directory(workspace.SourceDir(), ec)) {
        throw FilesystemError("cannot create source directory in " + root.string() + ": " +
                              (ec ? ec.message() : std::string("already exists")));
    }
    utils::Log(utils::LogLevel::kDebug, "workspace", "created", {{"path", root.string()}});
    return workspace;
}

Workspace::Workspace(std::string session_id, std::filesystem::path root)
    : session_id_(std::move(session_id))
    , root_(std::move(root))
    , owned_(true) {}

Workspace::Workspace(Workspace&& other) noexcept
    : session_id_(std::move(other.session_id_))
    , root_(std::move(other.root_))
    , owned_(std::exchange(other.owned_, false)) {}

Workspace& Workspace::operator=(Workspace&& other) noexcept {
    if (this != &other) {
        Remove();
        session_id_ = std::move(other.session_id_);
        root_ = std::move(other.root_);
        owned_ = std::exchange(other.owned_, false);
    }
    return *this;
}

Workspace::~Workspace() {
    Remove();
}

bool Workspace::Remove() noexcept {
    if (!owned_) {
        return true;
    }
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
    if (ec) {
        utils::Log(utils::LogLevel::kWarn, "workspace", "restoring permissions for cleanup",
                   {{"path", root_.string()}, {"error", ec.message()}});
        ec.clear();
        RestoreOwnerAccess(root_);
        std::filesystem::remove_all(root_, ec);
    }
    if (ec) {
        utils::Log(utils::LogLevel::kError, "workspace", "cleanup failed",
                   {{"path", root_.string()}, {"error", ec.message()}});
        return false;
    }
    owned_ = false;
    utils::Log(utils::LogLevel::kDebug, "workspace", "removed", {{"path", root_.string()}});
    return true;
}

}  // namespace codebox::sandbox
