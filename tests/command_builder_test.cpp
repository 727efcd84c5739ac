#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <unistd.h>

#include "config/config_schema.hpp"
#include "sandbox/command_builder.hpp"
#include "sandbox/errors.hpp"
#include "sandbox/language_registry.hpp"

using codebox::sandbox::CommandBuilder;
using codebox::sandbox::InvalidOptionsError;
using codebox::sandbox::LanguageRegistry;
using codebox::sandbox::RunConstraints;

namespace {

bool Contains(const std::vector<std::string>& args, const std::string& value) {
    return std::find(args.begin(), args.end(), value) != args.end();
}

class CommandBuilderTest : public ::testing::Test {
protected:
    codebox::config::ExecutorConfig config_;
    LanguageRegistry registry_;
    const std::filesystem::path source_dir_ = "/tmp/code-execution/abc/src";
};

}  // namespace

TEST_F(CommandBuilderTest, ComposesIsolatedRunInvocation) {
    CommandBuilder builder(config_, registry_);
    RunConstraints constraints{};
    constraints.container_name = "codebox-abc";
    const auto command = builder.Build(source_dir_ / "code.py", source_dir_, "python", constraints);

    EXPECT_EQ(command.program, "docker");
    const std::vector<std::string> expected = {
        "run", "--rm", "--name", "codebox-abc", "--network=none", "--memory", "256m",
        "--user", std::to_string(::getuid()) + ":" + std::to_string(::getgid()),
        "-v", "/tmp/code-execution/abc/src:/code", "-w", "/code",
        "python:3.10-alpine", "python", "code.py"
    };
    EXPECT_EQ(command.args, expected);
    EXPECT_EQ(command.container_name, "codebox-abc");
}

TEST_F(CommandBuilderTest, NetworkFlagFollowsOptionThenDefault) {
    CommandBuilder builder(config_, registry_);
    RunConstraints enabled{};
    enabled.network_disabled = false;
    EXPECT_FALSE(Contains(builder.Build(source_dir_ / "code.js", source_dir_, "javascript", enabled).args,
                          "--network=none"));

    config_.network_disabled_by_default = false;
    EXPECT_FALSE(Contains(builder.Build(source_dir_ / "code.js", source_dir_, "javascript", {}).args,
                          "--network=none"));

    RunConstraints disabled{};
    disabled.network_disabled = true;
    EXPECT_TRUE(Contains(builder.Build(source_dir_ / "code.js", source_dir_, "javascript", disabled).args,
                         "--network=none"));
}

TEST_F(CommandBuilderTest, AppliesRequestedMemoryAndOptionalLimits) {
    config_.cpus = "0.5";
    config_.pids_limit = 64;
    CommandBuilder builder(config_, registry_);
    RunConstraints constraints{};
    constraints.memory_limit = "512M";
    const auto args = builder.Build(source_dir_ / "code.rb", source_dir_, "ruby", constraints).args;

    auto memory = std::find(args.begin(), args.end(), "--memory");
    ASSERT_NE(memory, args.end());
    EXPECT_EQ(*(memory + 1), "512M");
    EXPECT_TRUE(Contains(args, "--cpus"));
    EXPECT_TRUE(Contains(args, "0.5"));
    EXPECT_TRUE(Contains(args, "--pids-limit"));
    EXPECT_TRUE(Contains(args, "64"));
}

TEST_F(CommandBuilderTest, RejectsMalformedMemoryLimit) {
    CommandBuilder builder(config_, registry_);
    for (const auto* value : {"", "lots", "256m --privileged", "-1m", "12q"}) {
        RunConstraints constraints{};
        constraints.memory_limit = value;
        EXPECT_THROW(builder.Build(source_dir_ / "code.py", source_dir_, "python", constraints),
                     InvalidOptionsError) << value;
    }
    EXPECT_TRUE(CommandBuilder::IsValidMemoryLimit("1024"));
    EXPECT_TRUE(CommandBuilder::IsValidMemoryLimit("2g"));
}

TEST_F(CommandBuilderTest, RejectsZeroMemoryLimitThatWouldLiftTheCeiling) {
    CommandBuilder builder(config_, registry_);
    for (const auto* value : {"0", "0m", "000g", "0B"}) {
        RunConstraints constraints{};
        constraints.memory_limit = value;
        EXPECT_THROW(builder.Build(source_dir_ / "code.py", source_dir_, "python", constraints),
                     InvalidOptionsError) << value;
    }
    EXPECT_TRUE(CommandBuilder::IsValidMemoryLimit("06m"));
    EXPECT_TRUE(CommandBuilder::IsValidMemoryLimit("10"));
}

TEST_F(CommandBuilderTest, RunsAsHostUserUnlessDisabled) {
    const auto owner = std::to_string(::getuid()) + ":" + std::to_string(::getgid());
    CommandBuilder builder(config_, registry_);
    auto args = builder.Build(source_dir_ / "code.py", source_dir_, "python", {}).args;
    auto user = std::find(args.begin(), args.end(), "--user");
    ASSERT_NE(user, args.end());
    EXPECT_EQ(*(user + 1), owner);

    config_.run_as_host_user = false;
    args = builder.Build(source_dir_ / "code.py", source_dir_, "python", {}).args;
    EXPECT_FALSE(Contains(args, "--user"));
}

TEST_F(CommandBuilderTest, RejectsUnmountablePaths) {
    CommandBuilder builder(config_, registry_);
    EXPECT_THROW(builder.Build("code.py", "relative/src", "python", {}), InvalidOptionsError);
    EXPECT_THROW(builder.Build("/tmp/a:b/code.py", "/tmp/a:b", "python", {}), InvalidOptionsError);
}

TEST_F(CommandBuilderTest, UnknownLanguageFallsBackInsteadOfFailing) {
    CommandBuilder builder(config_, registry_);
    const auto command = builder.Build(source_dir_ / "code.txt", source_dir_, "brainfuck", {});
    ASSERT_GE(command.args.size(), 3u);
    EXPECT_EQ(command.args[command.args.size() - 3], "alpine:latest");
    EXPECT_EQ(command.args[command.args.size() - 2], "sh");
    EXPECT_EQ(command.args.back(), "code.txt");
}

TEST_F(CommandBuilderTest, OnlyBasenameOfSourceReachesTheSandbox) {
    CommandBuilder builder(config_, registry_);
    for (const auto& id : registry_.Languages()) {
        const auto profile = registry_.Resolve(id);
        const auto file = source_dir_ / ("code." + profile.extension);
        const auto command = builder.Build(file, source_dir_, id, {});
        EXPECT_EQ(command.args.back(), "code." + profile.extension) << id;
        EXPECT_FALSE(Contains(command.args, file.string())) << id;
    }
}
