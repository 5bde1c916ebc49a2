/**
 * @file hardlinktest.hpp
 * @brief Shared fixture for tests that build real trees with hardlinks
 */

#ifndef HARDLINKTEST_HPP
#define HARDLINKTEST_HPP

#include <gtest/gtest.h>

#include "fileidentity.hpp"
#include "ilogsink.hpp"

#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <unistd.h>
#include <vector>

/**
 * @brief Log sink keeping every event for assertions
 */
class RecordingLogSink : public ILogSink {
public:
    void log(const LogEvent& event) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        events.push_back(event);
    }

    /** @brief Number of events with the given name */
    size_t count(const std::string& name) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        size_t n = 0;
        for (const auto& event : events) {
            if (event.event == name) n++;
        }
        return n;
    }

    /** @brief Number of events at the given level */
    size_t count(LogLevel level) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        size_t n = 0;
        for (const auto& event : events) {
            if (event.level == level) n++;
        }
        return n;
    }

    std::vector<LogEvent> events;

private:
    mutable std::mutex m_mutex;
};

/**
 * @class HardlinkTest
 * @brief Temporary directory with helpers for files, hardlinks and symlinks
 *
 * Every test gets its own directory below temp_directory_path(), named after
 * the test and the process id, so test binaries can run in parallel. The
 * directory is removed after the test.
 */
class HardlinkTest : public ::testing::Test {
protected:
    /** @brief Path to temporary test directory */
    std::filesystem::path test_dir;

    RecordingLogSink log;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = std::string(info->test_suite_name()) + "_" + info->name();
        for (auto& c : name) {
            if (c == '/') c = '_';
        }

        test_dir = std::filesystem::temp_directory_path() /
                   ("hardlink_" + name + "_" + std::to_string(::getpid()));
        std::filesystem::remove_all(test_dir);
        std::filesystem::create_directories(test_dir);
        // Canonical so expected paths compare equal to scanned ones
        test_dir = std::filesystem::canonical(test_dir);
    }

    void TearDown() override {
        // Cleanup
        std::error_code ec;
        std::filesystem::permissions(test_dir, std::filesystem::perms::owner_all,
                                     std::filesystem::perm_options::add, ec);
        std::filesystem::remove_all(test_dir, ec);
    }

    /** @brief Creates a file with the given content, parents included */
    std::filesystem::path createFile(const std::string& name, const std::string& content) {
        auto path = test_dir / name;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream file(path, std::ios::binary);
        file << content;
        return path;
    }

    /** @brief Creates a file of bytes non-zero bytes (never sparse) */
    std::filesystem::path createSizedFile(const std::string& name, size_t bytes) {
        return createFile(name, std::string(bytes, 'x'));
    }

    std::filesystem::path createDir(const std::string& name) {
        auto path = test_dir / name;
        std::filesystem::create_directories(path);
        return path;
    }

    /** @brief Adds another directory entry for an existing file */
    std::filesystem::path createLink(const std::string& existing, const std::string& name) {
        auto path = test_dir / name;
        std::filesystem::create_directories(path.parent_path());
        std::filesystem::create_hard_link(test_dir / existing, path);
        return path;
    }

    std::filesystem::path createSymlink(const std::string& target, const std::string& name) {
        auto path = test_dir / name;
        std::filesystem::create_directories(path.parent_path());
        std::filesystem::create_symlink(target, path);
        return path;
    }

    /** @brief lstat() facts of a path, failing the test if it is missing */
    DiskEntry entryOf(const std::filesystem::path& path) {
        DiskEntry entry;
        std::error_code ec;
        EXPECT_TRUE(readDiskEntry(path, entry, ec)) << path << ": " << ec.message();
        return entry;
    }

    /** @brief true when running as root, where permission tests are moot */
    static bool runningAsRoot() { return ::geteuid() == 0; }
};

#endif // HARDLINKTEST_HPP
