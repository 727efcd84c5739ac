#pragma once

#include <chrono>
#include <string>

namespace codebox::sandbox {

// Asks the runtime for its server version, which needs a reachable daemon.
// Never throws; failure details are logged.
bool IsRuntimeAvailable(const std::string& runtime,
                        std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

}  // namespace codebox::sandbox
