#include <gtest/gtest.h>

#include "./test_utils.hpp"

#include "../src/core/errors.h"
#include "../src/core/extractor.h"

static env::Environment test_environment() {
    env::Environment e;
    e.platformTag = "linux-arm64";
    e.cpuCount = 2;
    return e;
}

TEST(extractor_test, extract_command) {
    FakeRunner runner;
    core::extract(runner, "7zz", "/in/a.7z", "/tmp/w", seven_zip_banner(), test_environment());
    ASSERT_EQ(runner.calls.size(), 1);
    const std::vector<std::string> expected = { "x", "-o/tmp/w", "-y", "-bd", "--", "/in/a.7z" };
    EXPECT_EQ(runner.calls[0].args, expected);
}

TEST(extractor_test, dash_prefixed_input_follows_switch_terminator) {
    FakeRunner runner;
    core::extract(runner, "7zz", "-x.7z", "/tmp/w", seven_zip_banner(), test_environment());
    ASSERT_EQ(runner.calls.size(), 1);
    const auto& args = runner.calls[0].args;
    ASSERT_GE(args.size(), 2);
    EXPECT_EQ(args[args.size() - 2], "--");
    EXPECT_EQ(args.back(), "-x.7z");
}

TEST(extractor_test, legacy_p7zip_e_fail_gives_remediation) {
    FakeRunner runner([](const recorded_call_t&) {
        return utils::ExecutionResult { 2, "ERROR: E_FAIL\n" };
    });
    try {
        core::extract(runner, "7z", "/in/a.7z", "/tmp/w", p7zip_1602_banner(), test_environment());
        FAIL() << "expected ExtractionFailure";
    } catch (const core::ExtractionFailure& e) {
        EXPECT_EQ(e.kind(), core::ExtractionFailure::Kind::KnownBrokenBinary);
        const std::string message = e.what();
        EXPECT_NE(message.find("7zz-linux-arm64"), std::string::npos);
        EXPECT_NE(message.find("CONVERT_7Z_BIN"), std::string::npos);
        EXPECT_NE(message.find("E_FAIL"), std::string::npos);
    }
}

TEST(extractor_test, e_fail_on_modern_binary_is_generic) {
    FakeRunner runner([](const recorded_call_t&) {
        return utils::ExecutionResult { 2, "ERROR: E_FAIL\n" };
    });
    try {
        core::extract(runner, "7zz", "/in/a.7z", "/tmp/w", seven_zip_banner(), test_environment());
        FAIL() << "expected ExtractionFailure";
    } catch (const core::ExtractionFailure& e) {
        EXPECT_EQ(e.kind(), core::ExtractionFailure::Kind::Generic);
        EXPECT_EQ(std::string(e.what()), "ERROR: E_FAIL\n");
    }
}

TEST(extractor_test, silent_failure_reports_exit_code) {
    FakeRunner runner([](const recorded_call_t&) {
        return utils::ExecutionResult { 8, "" };
    });
    try {
        core::extract(runner, "7zz", "/in/a.7z", "/tmp/w", seven_zip_banner(), test_environment());
        FAIL() << "expected ExtractionFailure";
    } catch (const core::ExtractionFailure& e) {
        EXPECT_EQ(e.kind(), core::ExtractionFailure::Kind::Generic);
        EXPECT_NE(std::string(e.what()).find("exitCode=8"), std::string::npos);
    }
}
