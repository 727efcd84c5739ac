#pragma once

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>

#include "sandbox/workspace.hpp"

namespace codebox::testing {

// Stands in for `docker`: understands the flags CommandBuilder emits, then
// runs the container command inside the mounted host directory. Arguments of
// every `rm` call are appended to runtime.log next to the script.
constexpr const char* kFakeRuntimeScript = R"(#!/bin/sh
case "$1" in
  version) echo "0.0.0-fake"; exit 0 ;;
  rm) shift; echo "rm $*" >> "$(dirname "$0")/runtime.log"; exit 0 ;;
  run) shift ;;
  *) echo "fake runtime: unsupported command $1" >&2; exit 125 ;;
esac
mount=""
while [ $# -gt 0 ]; do
  case "$1" in
    --rm|--network=none) shift ;;
    --name|--memory|--cpus|--pids-limit|--user|-w) shift 2 ;;
    -v) mount="${2%%:*}"; shift 2 ;;
    -*) echo "fake runtime: unknown flag $1" >&2; exit 125 ;;
    *) break ;;
  esac
done
shift
cd "$mount" || exit 125
exec "$@"
)";

class TempDir {
public:
    TempDir()
        : path_(std::filesystem::temp_directory_path() /
                ("codebox-test-" + sandbox::GenerateSessionId())) {
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& Path() const { return path_; }

private:
    std::filesystem::path path_;
};

inline std::filesystem::path WriteFakeRuntime(const std::filesystem::path& dir) {
    const auto path = dir / "fake-runtime";
    {
        std::ofstream output(path, std::ios::out | std::ios::trunc);
        output << kFakeRuntimeScript;
    }
    std::filesystem::permissions(path, std::filesystem::perms::owner_all |
                                           std::filesystem::perms::group_read |
                                           std::filesystem::perms::group_exec);
    return path;
}

inline std::filesystem::path RuntimeLogPath(const std::filesystem::path& runtime) {
    return runtime.parent_path() / "runtime.log";
}

inline std::string ReadText(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::in | std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
}

}  // namespace codebox::testing
