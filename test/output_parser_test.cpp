#include <gtest/gtest.h>

#include "./test_utils.hpp"

#include "../src/core/output_parser.h"

TEST(output_parser_test, signature) {
    EXPECT_TRUE(core::hasSevenZipSignature(seven_zip_banner()));
    EXPECT_TRUE(core::hasSevenZipSignature(p7zip_1602_banner()));
    EXPECT_TRUE(core::hasSevenZipSignature("7zip standalone"));
    EXPECT_FALSE(core::hasSevenZipSignature("zip error: Nothing to do!"));
    EXPECT_FALSE(core::hasSevenZipSignature(""));
}

TEST(output_parser_test, legacy_p7zip) {
    EXPECT_TRUE(core::isLegacyP7zip1602(p7zip_1602_banner()));
    EXPECT_FALSE(core::isLegacyP7zip1602(seven_zip_banner()));
}

TEST(output_parser_test, enter_password_is_encrypted_regardless_of_exit_code) {
    const std::string out = "Listing archive: secret.7z\n\nEnter password (will not be echoed):";
    EXPECT_TRUE(core::parseProbeOutput(0, out).isEncrypted);
    EXPECT_TRUE(core::parseProbeOutput(2, out).isEncrypted);
}

TEST(output_parser_test, password_markers) {
    EXPECT_TRUE(core::detectPassword("ERROR: Wrong password : a.txt"));
    EXPECT_TRUE(core::detectPassword("Path = a.txt\nEncrypted = +\n"));
    EXPECT_TRUE(core::detectPassword("ERROR: secret.7z\nCan not open encrypted archive. Wrong password?"));
    EXPECT_TRUE(core::detectPassword("Headers Error\nThe archive is encrypted"));
    EXPECT_TRUE(core::detectPassword("ERROR: Data Error in encrypted file. Wrong password?"));
    EXPECT_FALSE(core::detectPassword("Headers Error\nUnexpected end of archive"));
    EXPECT_FALSE(core::detectPassword("Path = a.txt\nEncrypted = -\n"));
}

TEST(output_parser_test, encrypted_also_flagged_invalid_stays_encrypted) {
    const std::string out = "ERROR: secret.7z\nCan not open encrypted archive. Wrong password?\n\nErrors: 1\n";
    const auto r = core::parseProbeOutput(2, out);
    EXPECT_TRUE(r.isEncrypted);
    EXPECT_TRUE(r.looksInvalid);
}

TEST(output_parser_test, invalid_archive) {
    const auto r = core::parseProbeOutput(2, "ERROR: junk.7z\njunk.7z\nCan not open the file as archive\n\nErrors: 1\n");
    EXPECT_TRUE(r.looksInvalid);
    EXPECT_FALSE(r.isRecognizedFormat);

    const auto open = core::parseProbeOutput(2, "ERROR: junk.7z : Can not open file as archive");
    EXPECT_TRUE(open.looksInvalid);
}

TEST(output_parser_test, error_summary_needs_nonzero_exit) {
    const std::string out = listing_7z(1, 0) + "\nWarnings: 1\n";
    EXPECT_FALSE(core::parseProbeOutput(0, out).looksInvalid);
    EXPECT_TRUE(core::parseProbeOutput(1, out).looksInvalid);
}

TEST(output_parser_test, valid_listing) {
    const auto r = core::parseProbeOutput(0, listing_7z(3, 2));
    EXPECT_TRUE(r.isRecognizedFormat);
    EXPECT_FALSE(r.looksInvalid);
    EXPECT_FALSE(r.isEncrypted);
    ASSERT_TRUE(r.fileCount.has_value());
    ASSERT_TRUE(r.folderCount.has_value());
    EXPECT_EQ(*r.fileCount, 3);
    EXPECT_EQ(*r.folderCount, 2);
    EXPECT_EQ(r.exitCode, 0);
    EXPECT_EQ(r.rawOutput, listing_7z(3, 2));
}

TEST(output_parser_test, zip_type_is_not_7z) {
    EXPECT_FALSE(core::parseProbeOutput(0, listing_zip(1, 0)).isRecognizedFormat);
}

TEST(output_parser_test, counts_absent) {
    const auto r = core::parseProbeOutput(0, "Type = 7z\n");
    EXPECT_FALSE(r.fileCount.has_value());
    EXPECT_FALSE(r.folderCount.has_value());
}

TEST(output_parser_test, count_must_start_the_line) {
    EXPECT_FALSE(core::parseCount("Total Files = 5\n", "Files").has_value());
    EXPECT_EQ(core::parseCount("  Files = 5\n", "Files").value_or(-1), 5);
}

TEST(output_parser_test, zip_stats_default_to_zero) {
    const auto none = core::parseZipStats("Type = zip\n");
    EXPECT_EQ(none.files, 0);
    EXPECT_EQ(none.folders, 0);
    const auto some = core::parseZipStats(listing_zip(4, 1));
    EXPECT_EQ(some.files, 4);
    EXPECT_EQ(some.folders, 1);
}

TEST(output_parser_test, argument_rejections) {
    EXPECT_TRUE(core::isArgumentRejected("Command Line Error:\nUnsupported switch:\n-mtc=on"));
    EXPECT_TRUE(core::isArgumentRejected("System ERROR:\nE_INVALIDARG"));
    EXPECT_TRUE(core::isArgumentRejected("Incorrect command line"));
    EXPECT_FALSE(core::isArgumentRejected("ERROR: No more files"));

    const std::string mmt = "Command Line Error:\nUnsupported switch:\n-mmt=8";
    EXPECT_TRUE(core::isUnsupportedSwitch(mmt));
    EXPECT_TRUE(core::mentionsMultithreadSwitch(mmt));
    EXPECT_FALSE(core::mentionsMultithreadSwitch("Unsupported switch:\n-mtm=on"));
}

TEST(output_parser_test, fatal_failure) {
    EXPECT_TRUE(core::isFatalFailure("ERROR: E_FAIL"));
    EXPECT_FALSE(core::isFatalFailure("Everything is Ok"));
}
