#include <filesystem>
#include <gtest/gtest.h>

#include "./test_utils.hpp"

#include "../src/utils/process.h"

#ifndef _WIN32

TEST(process_test, nonzero_exit_is_not_an_error) {
    utils::ShellProcessRunner runner;
    const auto r = runner.run("sh", { "-c", "echo out; echo err >&2; exit 3" });
    EXPECT_EQ(r.exitCode, 3);
    EXPECT_NE(r.combinedOutput.find("out"), std::string::npos);
    EXPECT_NE(r.combinedOutput.find("err"), std::string::npos);
}

TEST(process_test, missing_binary_is_launch_error) {
    utils::ShellProcessRunner runner;
    EXPECT_THROW(runner.run("/nonexistent/sz2zip-no-such-tool", { "-version" }), utils::ProcessLaunchError);
}

TEST(process_test, working_directory) {
    const auto dir = make_tmp_dir("process cwd");
    utils::ShellProcessRunner runner;
    utils::RunOptions options;
    options.workingDirectory = dir;
    const auto r = runner.run("pwd", {}, options);
    EXPECT_EQ(r.exitCode, 0);
    EXPECT_EQ(std::filesystem::canonical(r.combinedOutput.substr(0, r.combinedOutput.find('\n'))),
              std::filesystem::canonical(dir));
    std::filesystem::remove_all(dir);
}

TEST(process_test, arguments_pass_through_verbatim) {
    utils::ShellProcessRunner runner;
    const auto r = runner.run("printf", { "%s|", "it's", "$HOME", "a b" });
    EXPECT_EQ(r.combinedOutput, "it's|$HOME|a b|");
}

#endif // _WIN32

TEST(process_test, command_line_quoting) {
    utils::RunOptions options;
    options.workingDirectory = "/tmp/w";
#ifdef _WIN32
    EXPECT_EQ(utils::buildCommandLine("7z", { "l" }, options), "cd \"/tmp/w\" && \"7z\" \"l\"");
#else
    EXPECT_EQ(utils::buildCommandLine("7z", { "l", "a'b" }, options), "cd '/tmp/w' && '7z' 'l' 'a'\\''b'");
#endif
}
