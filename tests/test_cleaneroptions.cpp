/**
 * @file test_cleaneroptions.cpp
 * @brief Unit tests for command line parsing
 *
 * @see parseArguments()
 */

#include <gtest/gtest.h>
#include "cleaneroptions.hpp"

#include <stdexcept>
#include <vector>

namespace {

CleanerOptions parse(std::vector<const char*> args) {
    args.insert(args.begin(), "hardlink-cleaner");
    return parseArguments(static_cast<int>(args.size()), args.data());
}

} // namespace

/**
 * @test Defaults
 * @brief A bare path browses interactively with one worker
 */
TEST(CleanerOptionsTest, Defaults) {
    CleanerOptions options = parse({"/data"});

    EXPECT_EQ(options.path, "/data");
    EXPECT_TRUE(options.interactive);
    EXPECT_FALSE(options.xdev);
    EXPECT_FALSE(options.dryRun);
    EXPECT_EQ(options.jobs, 1u);
    EXPECT_EQ(options.reportDepth, 1u);
}

/**
 * @test AllFlags
 * @brief Every value option is stored
 */
TEST(CleanerOptionsTest, AllFlags) {
    CleanerOptions options = parse({"--xdev", "--no-interactive", "-y", "--dry-run",
                                    "--save-scan", "out.json", "--fs-root", "/mnt",
                                    "--apparent-size", "-j", "8", "-v", "--log",
                                    "run.log", "/data"});

    EXPECT_TRUE(options.xdev);
    EXPECT_FALSE(options.interactive);
    EXPECT_TRUE(options.yes);
    EXPECT_TRUE(options.dryRun);
    EXPECT_EQ(options.saveScan, "out.json");
    EXPECT_EQ(options.fsRoot, "/mnt");
    EXPECT_TRUE(options.apparentSize);
    EXPECT_EQ(options.jobs, 8u);
    EXPECT_TRUE(options.verbose);
    EXPECT_EQ(options.logFile, "run.log");
}

/**
 * @test ReportDepthIsOptional
 * @brief --report takes a numeric depth only when one follows
 */
TEST(CleanerOptionsTest, ReportDepthIsOptional) {
    CleanerOptions withDepth = parse({"--report", "3", "/data"});
    EXPECT_TRUE(withDepth.report);
    EXPECT_EQ(withDepth.reportDepth, 3u);
    EXPECT_EQ(withDepth.path, "/data");
    EXPECT_FALSE(withDepth.interactive);

    CleanerOptions withoutDepth = parse({"--report", "/data"});
    EXPECT_EQ(withoutDepth.reportDepth, 1u);
    EXPECT_EQ(withoutDepth.path, "/data");
}

/**
 * @test LoadScanReplacesPath
 * @brief A loaded scan needs no path
 */
TEST(CleanerOptionsTest, LoadScanReplacesPath) {
    CleanerOptions options = parse({"--load-scan", "scan.json"});
    EXPECT_EQ(options.loadScan, "scan.json");
    EXPECT_TRUE(options.path.empty());
}

/**
 * @test HelpNeedsNothingElse
 * @brief --help skips the remaining validation
 */
TEST(CleanerOptionsTest, HelpNeedsNothingElse) {
    EXPECT_TRUE(parse({"--help"}).help);
    EXPECT_NE(usageText("hardlink-cleaner").find("--fs-root"), std::string::npos);
}

/**
 * @test RejectsInvalidInput
 * @brief Invalid combinations and values throw std::invalid_argument
 */
TEST(CleanerOptionsTest, RejectsInvalidInput) {
    EXPECT_THROW(parse({}), std::invalid_argument);
    EXPECT_THROW(parse({"--bogus", "/data"}), std::invalid_argument);
    EXPECT_THROW(parse({"/a", "/b"}), std::invalid_argument);
    EXPECT_THROW(parse({"--save-scan"}), std::invalid_argument);
    EXPECT_THROW(parse({"-j", "0", "/data"}), std::invalid_argument);
    EXPECT_THROW(parse({"-j", "many", "/data"}), std::invalid_argument);
    EXPECT_THROW(parse({"-j", "257", "/data"}), std::invalid_argument);
    EXPECT_THROW(parse({"--contained", "--report", "/data"}), std::invalid_argument);
    EXPECT_THROW(parse({"-i", "--remove-symlinks", "/data"}), std::invalid_argument);
    EXPECT_THROW(parse({"--load-scan", "s.json", "--save-scan", "s.json"}),
                 std::invalid_argument);
}
