/**
 * @file test_streamlogsink.cpp
 * @brief Unit tests for the console and file log sink
 *
 * @see StreamLogSink
 */

#include "hardlinktest.hpp"
#include "streamlogsink.hpp"

#include <regex>
#include <sstream>

class StreamLogSinkTest : public HardlinkTest {
protected:
    static std::string readAll(const std::filesystem::path& path) {
        std::ifstream in(path);
        std::ostringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }
};

/**
 * @test FormatLine
 * @brief Lines read "YYYY-MM-DD HH:MM:SS LEVEL message"
 */
TEST_F(StreamLogSinkTest, FormatLine) {
    std::string line = StreamLogSink::formatLine({LogLevel::Warn, "x", "Disk almost full"});

    EXPECT_TRUE(std::regex_match(
        line, std::regex(R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2} WARNING Disk almost full)")))
        << line;
}

/**
 * @test ThresholdFilters
 * @brief Events below the threshold are dropped
 */
TEST_F(StreamLogSinkTest, ThresholdFilters) {
    std::ostringstream out;
    StreamLogSink sink(out, LogLevel::Info);

    sink.debug("scan-start", "hidden");
    sink.info("scan-done", "shown");
    sink.error("delete-error", "failure");

    std::string text = out.str();
    EXPECT_EQ(text.find("hidden"), std::string::npos);
    EXPECT_NE(text.find("INFO shown"), std::string::npos);
    EXPECT_NE(text.find("ERROR failure"), std::string::npos);
}

/**
 * @test MutedConsoleStillWritesFile
 * @brief Muting the console keeps the log file going
 */
TEST_F(StreamLogSinkTest, MutedConsoleStillWritesFile) {
    auto file = test_dir / "run.log";
    std::ostringstream out;
    StreamLogSink sink(out, LogLevel::Debug, file.string());
    ASSERT_TRUE(sink.fileOpen());

    sink.setConsoleMuted(true);
    sink.info("purge-found", "while browsing");
    sink.setConsoleMuted(false);
    sink.info("delete-result", "after browsing");

    EXPECT_EQ(out.str().find("while browsing"), std::string::npos);
    EXPECT_NE(out.str().find("after browsing"), std::string::npos);

    std::string logged = readAll(file);
    EXPECT_NE(logged.find("while browsing"), std::string::npos);
    EXPECT_NE(logged.find("after browsing"), std::string::npos);
}

/**
 * @test UnwritableLogFile
 * @brief A log file that cannot be opened is reported, console still works
 */
TEST_F(StreamLogSinkTest, UnwritableLogFile) {
    std::ostringstream out;
    StreamLogSink sink(out, LogLevel::Info, (test_dir / "no/such/dir/run.log").string());

    EXPECT_FALSE(sink.fileOpen());
    sink.info("scan-done", "still logged");
    EXPECT_NE(out.str().find("still logged"), std::string::npos);
}
