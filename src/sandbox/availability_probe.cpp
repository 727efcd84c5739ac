#include "sandbox/availability_probe.hpp"

#include <boost/process.hpp>
#include <string>
#include <system_error>
#include <vector>

#include "utils/logging.hpp"

namespace codebox::sandbox {
namespace bp = boost::process;

bool IsRuntimeAvailable(const std::string& runtime, std::chrono::milliseconds timeout) {
    try {
        const auto program = runtime.find('/') != std::string::npos
            ? boost::filesystem::path(runtime)
            : bp::search_path(runtime);
        if (program.empty() || !boost::filesystem::exists(program)) {
            utils::Log(utils::LogLevel::kWarn, "probe", "runtime is not available",
                       {{"runtime", runtime}, {"error", "not found"}});
            return false;
        }
        bp::child child_process(
            bp::exe = program,
            bp::args = std::vector<std::string>{"version", "--format", "{{.Server.Version}}"},
            bp::std_in < bp::null,
            bp::std_out > bp::null,
            bp::std_err > bp::null);
        if (!child_process.wait_for(timeout)) {
            std::error_code ec;
            child_process.terminate(ec);
            utils::Log(utils::LogLevel::kWarn, "probe", "runtime is not available",
                       {{"runtime", runtime}, {"error", "version query timed out"}});
            return false;
        }
        if (child_process.exit_code() != 0) {
            utils::Log(utils::LogLevel::kWarn, "probe", "runtime is not available",
                       {{"runtime", runtime},
                        {"exit_code", std::to_string(child_process.exit_code())}});
            return false;
        }
        return true;
    } catch (const bp::process_error& ex) {
        utils::Log(utils::LogLevel::kWarn, "probe", "runtime is not available",
                   {{"runtime", runtime}, {"error", ex.what()}});
        return false;
    } catch (const boost::filesystem::filesystem_error& ex) {
        utils::Log(utils::LogLevel::kWarn, "probe", "runtime is not available",
                   {{"runtime", runtime}, {"error", ex.what()}});
        return false;
    }
}

}  // namespace codebox::sandbox
