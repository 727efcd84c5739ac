#pragma once

#include <stdexcept>
#include <string>

namespace codebox::sandbox {

// Workspace creation, write, or removal failed on the host filesystem.
class FilesystemError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class IoError : public FilesystemError {
public:
    using FilesystemError::FilesystemError;
};

// The container runtime could not be started or rejected the run.
class RuntimeUnavailableError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class InvalidOptionsError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

}  // namespace codebox::sandbox
