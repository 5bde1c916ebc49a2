/**
 * @file test_deleteexecutor.cpp
 * @brief Unit tests for DeleteExecutor
 *
 * ## Test Coverage
 * - FreedBytesCountedOnce: Three links, one inode's disk usage
 * - DryRunDeletesNothing / UnconfirmedAborts: Nothing touched
 * - DryRunMatchesRealRun: Same plan and estimate, tree unchanged
 * - PartialFailureContinues: One failing path, the rest is removed
 * - CancellationStops: A tripped token stops before the next path
 * - EstimateForIncompletePlan: Links outside the search are flagged
 * - ExecutePathsReportsVanished / RefusesDirectories: Batch path lists
 * - ScanPurgeScenario: Scan, mark, purge, delete end to end
 *
 * @see DeleteExecutor
 */

#include "hardlinktest.hpp"
#include "deleteexecutor.hpp"
#include "filescanner.hpp"

#include <set>
#include <type_traits>

namespace {

/**
 * @brief Remover that fails chosen paths and removes the rest for real
 */
class FailingRemover : public IPathRemover {
public:
    std::set<std::string> failing;
    std::errc error = std::errc::permission_denied;
    std::vector<std::string> attempts;

    bool remove(const std::string& path, std::error_code& ec) override {
        attempts.push_back(path);
        if (failing.count(path) > 0) {
            ec = std::make_error_code(error);
            return false;
        }
        return m_real.remove(path, ec);
    }

private:
    FilesystemRemover m_real;
};

} // namespace

/**
 * @class DeleteExecutorTest
 * @brief Builds purge plans straight from files on disk
 */
class DeleteExecutorTest : public HardlinkTest {
protected:
    /** @brief Plan with one inode holding all the given paths */
    PurgePlan planFor(const std::vector<std::filesystem::path>& paths) {
        PurgePlan plan;
        plan.searchRoot = test_dir.string();
        for (const auto& path : paths) {
            DiskEntry entry = entryOf(path);
            PurgeInode& inode = plan.inodes[entry.identity];
            inode.identity = entry.identity;
            inode.diskUsage = entry.diskUsage;
            inode.linkCount = entry.linkCount;
            inode.paths.push_back(path.string());
        }
        return plan;
    }

    static DeleteOptions confirmed() {
        DeleteOptions options;
        options.confirmed = true;
        return options;
    }
};

/**
 * @test FreedBytesCountedOnce
 * @brief Removing every link of a file frees its disk usage once
 */
TEST_F(DeleteExecutorTest, FreedBytesCountedOnce) {
    auto a = createSizedFile("a", 9000);
    auto b = createLink("a", "x/b");
    auto c = createLink("a", "y/c");
    const std::uint64_t usage = entryOf(a).diskUsage;

    DeleteExecutor executor(log);
    DeleteReport report = executor.execute(planFor({a, b, c}), confirmed());

    EXPECT_EQ(report.plannedPaths, 3u);
    EXPECT_EQ(report.deletedPaths, 3u);
    EXPECT_EQ(report.failedPaths, 0u);
    EXPECT_EQ(report.freedBytes, usage);
    EXPECT_TRUE(report.success());
    EXPECT_FALSE(std::filesystem::exists(a));
    EXPECT_FALSE(std::filesystem::exists(b));
    EXPECT_FALSE(std::filesystem::exists(c));
    EXPECT_EQ(log.count("delete-result"), 1u);
}

/**
 * @test DryRunDeletesNothing
 * @brief A dry run reports the estimate and leaves every file in place
 */
TEST_F(DeleteExecutorTest, DryRunDeletesNothing) {
    auto a = createSizedFile("a", 5000);
    auto b = createLink("a", "b");
    PurgePlan plan = planFor({a, b});

    DeleteOptions options;
    options.dryRun = true;
    DeleteExecutor executor(log);
    DeleteReport report = executor.execute(plan, options);

    EXPECT_TRUE(report.dryRun);
    EXPECT_EQ(report.deletedPaths, 0u);
    EXPECT_EQ(report.plannedPaths, 2u);
    EXPECT_EQ(report.freedBytes, plan.estimatedBytes());
    EXPECT_TRUE(std::filesystem::exists(a));
    EXPECT_TRUE(std::filesystem::exists(b));
}

/**
 * @test UnconfirmedAborts
 * @brief Without confirmation nothing is deleted and the report is aborted
 */
TEST_F(DeleteExecutorTest, UnconfirmedAborts) {
    auto a = createSizedFile("a", 100);

    DeleteExecutor executor(log);
    DeleteReport report = executor.execute(planFor({a}), DeleteOptions());

    EXPECT_TRUE(report.aborted);
    EXPECT_FALSE(report.success());
    EXPECT_EQ(report.deletedPaths, 0u);
    EXPECT_TRUE(std::filesystem::exists(a));
}

/**
 * @test PartialFailureContinues
 * @brief A failing path is reported, other paths and inodes still go
 *
 * The inode with a surviving link frees nothing.
 */
TEST_F(DeleteExecutorTest, PartialFailureContinues) {
    auto a = createSizedFile("a", 4000);
    auto b = createLink("a", "b");
    auto other = createSizedFile("other", 6000);
    const std::uint64_t otherUsage = entryOf(other).diskUsage;

    FailingRemover remover;
    remover.failing.insert(b.string());

    DeleteExecutor executor(log, remover);
    DeleteReport report = executor.execute(planFor({a, b, other}), confirmed());

    EXPECT_EQ(report.deletedPaths, 2u);
    EXPECT_EQ(report.failedPaths, 1u);
    EXPECT_EQ(report.freedBytes, otherUsage);
    EXPECT_FALSE(report.success());
    EXPECT_EQ(report.errors.count, 1u);
    EXPECT_EQ(remover.attempts.size(), 3u);
    EXPECT_TRUE(std::filesystem::exists(b));
    EXPECT_FALSE(std::filesystem::exists(a));
    EXPECT_FALSE(std::filesystem::exists(other));
    EXPECT_GE(log.count(LogLevel::Error), 1u);
}

/**
 * @test VanishedPathIsWarning
 * @brief A path removed behind our back counts as failed with a warning
 */
TEST_F(DeleteExecutorTest, VanishedPathIsWarning) {
    auto a = createSizedFile("a", 100);
    PurgePlan plan = planFor({a});
    std::filesystem::remove(a);

    DeleteExecutor executor(log);
    DeleteReport report = executor.execute(plan, confirmed());

    EXPECT_EQ(report.failedPaths, 1u);
    EXPECT_EQ(report.freedBytes, 0u);
    EXPECT_EQ(log.count(LogLevel::Error), 0u);
}

/**
 * @test CancellationStops
 * @brief A tripped token stops the loop before the next path
 */
TEST_F(DeleteExecutorTest, CancellationStops) {
    auto a = createSizedFile("a", 100);
    auto b = createSizedFile("b", 100);

    CancellationToken token;
    token.cancel();
    DeleteOptions options = confirmed();
    options.cancel = &token;

    DeleteExecutor executor(log);
    DeleteReport report = executor.execute(planFor({a, b}), options);

    EXPECT_TRUE(report.cancelled);
    EXPECT_EQ(report.deletedPaths, 0u);
    EXPECT_TRUE(std::filesystem::exists(a));
    EXPECT_TRUE(std::filesystem::exists(b));
}

/**
 * @test EstimateForIncompletePlan
 * @brief Links missing from the plan make the freed size an estimate
 */
TEST_F(DeleteExecutorTest, EstimateForIncompletePlan) {
    auto a = createSizedFile("a", 100);
    auto outside = createLink("a", "elsewhere");
    PurgePlan plan = planFor({a});

    DeleteExecutor executor(log);
    DeleteReport report = executor.execute(plan, confirmed());

    EXPECT_TRUE(report.estimateOnly);
    EXPECT_EQ(report.incomplete.size(), 1u);
    EXPECT_EQ(report.deletedPaths, 1u);
    EXPECT_TRUE(std::filesystem::exists(outside));
}

/**
 * @test ExecutePathsReportsVanished
 * @brief Paths that no longer exist are planned and failed
 */
TEST_F(DeleteExecutorTest, ExecutePathsReportsVanished) {
    auto link = createSymlink("nowhere", "dangling");

    DeleteExecutor executor(log);
    DeleteReport report = executor.executePaths(
        {link.string(), (test_dir / "gone").string()}, confirmed());

    EXPECT_EQ(report.plannedPaths, 2u);
    EXPECT_EQ(report.deletedPaths, 1u);
    EXPECT_EQ(report.failedPaths, 1u);
    EXPECT_FALSE(std::filesystem::exists(std::filesystem::symlink_status(link)));
}

/**
 * @test RefusesDirectories
 * @brief A directory in the path list is never removed
 */
TEST_F(DeleteExecutorTest, RefusesDirectories) {
    auto dir = createDir("keep");

    DeleteExecutor executor(log);
    DeleteReport report = executor.executePaths({dir.string()}, confirmed());

    EXPECT_EQ(report.failedPaths, 1u);
    EXPECT_TRUE(std::filesystem::is_directory(dir));
    EXPECT_EQ(log.count(LogLevel::Error), 1u);
}

/**
 * @test ScanPurgeScenario
 * @brief Shared file in two directories next to an unrelated file
 *
 * The scan counts the shared file once, marking it finds both links, and
 * deleting frees exactly its disk usage.
 */
TEST_F(DeleteExecutorTest, ScanPurgeScenario) {
    auto a = createSizedFile("tree/one/A", 100 * 1024);
    auto b = createLink("tree/one/A", "tree/two/B");
    auto c = createSizedFile("tree/C", 50 * 1024);
    const std::uint64_t usageA = entryOf(a).diskUsage;
    const std::uint64_t usageC = entryOf(c).diskUsage;

    FileScanner scanner(log);
    ScanResult scan = scanner.scan(test_dir / "tree", ScanOptions());
    EXPECT_EQ(scan.totalBytes(), usageA + usageC);

    SelectionModel selection(scan);
    selection.mark(scan.tree.findByPath(a.string()));

    PurgeOptions purgeOptions;
    purgeOptions.searchRoot = test_dir.string();
    PurgeEngine engine(log);
    PurgePlan plan = engine.discover(selection.purgeTargets(), purgeOptions);

    EXPECT_EQ(plan.allPaths(), (std::vector<std::string>{a.string(), b.string()}));
    EXPECT_EQ(plan.estimatedBytes(), usageA);

    DeleteExecutor executor(log);
    DeleteReport report = executor.execute(plan, confirmed());

    EXPECT_EQ(report.deletedPaths, 2u);
    EXPECT_EQ(report.freedBytes, usageA);
    EXPECT_FALSE(std::filesystem::exists(a));
    EXPECT_FALSE(std::filesystem::exists(b));
    EXPECT_TRUE(std::filesystem::exists(c));
}

/**
 * @test DryRunMatchesRealRun
 * @brief A dry run plans what a real run deletes and changes nothing
 *
 * The tree is scanned again after the dry run and compared entry by entry.
 */
TEST_F(DeleteExecutorTest, DryRunMatchesRealRun) {
    createSizedFile("tree/a/one", 3000);
    createLink("tree/a/one", "tree/b/one-link");
    createSizedFile("tree/b/two", 2000);

    FileScanner scanner(log);
    ScanResult before = scanner.scan(test_dir / "tree", ScanOptions());
    SelectionModel selection(before);
    selection.mark(before.tree.root());

    PurgeOptions purgeOptions;
    purgeOptions.searchRoot = test_dir.string();
    PurgeEngine engine(log);
    PurgePlan plan = engine.discover(selection.purgeTargets(), purgeOptions);

    DeleteOptions dry;
    dry.dryRun = true;
    DeleteExecutor executor(log);
    DeleteReport dryReport = executor.execute(plan, dry);

    ScanResult after = scanner.scan(test_dir / "tree", ScanOptions());
    ASSERT_EQ(after.tree.size(), before.tree.size());
    for (NodeHandle h = 0; h < before.tree.size(); ++h) {
        EXPECT_EQ(after.tree.pathOf(h), before.tree.pathOf(h));
        EXPECT_EQ(after.tree.node(h).entry.identity, before.tree.node(h).entry.identity);
    }
    EXPECT_EQ(after.totalBytes(), before.totalBytes());

    PurgePlan again = engine.discover(selection.purgeTargets(), purgeOptions);
    EXPECT_EQ(again.allPaths(), plan.allPaths());

    DeleteReport realReport = executor.execute(again, confirmed());
    EXPECT_EQ(realReport.deletedPaths, dryReport.plannedPaths);
    EXPECT_EQ(realReport.freedBytes, dryReport.freedBytes);
}

/**
 * @test NotCopyable
 * @brief The executor refers to its own remover, so copies are disabled
 */
TEST(DeleteExecutorTraits, NotCopyable) {
    EXPECT_FALSE(std::is_copy_constructible<DeleteExecutor>::value);
    EXPECT_FALSE(std::is_copy_assignable<DeleteExecutor>::value);
}
