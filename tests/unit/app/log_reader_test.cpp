/**
 * Tests for log reading helpers used by `servherd logs`.
 */

#include <gtest/gtest.h>
#include <servherd/app/log_reader.h>
#include <servherd/common/time_parser.h>

#include "temp_dir_scope.hpp"

#include <fstream>
#include <mutex>
#include <thread>

using namespace servherd;
using namespace servherd::app;
using namespace std::chrono_literals;
using servherd::test_support::TempDirScope;

namespace {

void writeFile(const std::filesystem::path& path, const std::string& content,
               std::ios::openmode mode = std::ios::trunc) {
    std::ofstream out(path, std::ios::out | mode);
    out << content;
}

} // namespace

// ============================================================================
// Reading and selection
// ============================================================================

TEST(LogReaderTest, ReadSkipsEmptyLines) {
    auto tmp = TempDirScope::unique_under("servherd-logs");
    writeFile(tmp / "out.log", "one\n\ntwo\r\nthree");
    auto lines = readLogLines(tmp / "out.log");
    ASSERT_TRUE(lines);
    EXPECT_EQ(lines.value(), (std::vector<std::string>{"one", "two", "three"}));
}

TEST(LogReaderTest, MissingFileIsAnError) {
    auto tmp = TempDirScope::unique_under("servherd-logs");
    auto lines = readLogLines(tmp / "missing.log");
    ASSERT_FALSE(lines);
    EXPECT_EQ(lines.error().code, ErrorCode::IOError);
}

TEST(LogReaderTest, ParsesLeadingTimestamp) {
    auto ts = parseLogTimestamp("2024-01-15T10:30:00.000Z: listening on 3000");
    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(common::TimeParser::formatISO8601(*ts), "2024-01-15T10:30:00.000Z");

    EXPECT_FALSE(parseLogTimestamp("no stamp here").has_value());
    EXPECT_FALSE(parseLogTimestamp("error: something broke").has_value());
}

TEST(LogReaderTest, FilterKeepsRecentAndUnstampedLines) {
    std::vector<std::string> lines{
        "2024-01-15T10:00:00.000Z: old",
        "continuation without stamp",
        "2024-01-15T12:00:00.000Z: new",
    };
    auto since = common::TimeParser::parseISO8601("2024-01-15T11:00:00Z");
    ASSERT_TRUE(since.has_value());
    auto kept = filterLogsByTime(lines, *since);
    EXPECT_EQ(kept, (std::vector<std::string>{"continuation without stamp",
                                              "2024-01-15T12:00:00.000Z: new"}));
}

TEST(LogReaderTest, SelectHeadOrTail) {
    std::vector<std::string> lines{"a", "b", "c", "d"};
    EXPECT_EQ(selectLines(lines, std::nullopt, 2), (std::vector<std::string>{"c", "d"}));
    EXPECT_EQ(selectLines(lines, 3, 2), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(selectLines(lines, std::nullopt, 50), lines);
    EXPECT_TRUE(selectLines({}, std::nullopt, 5).empty());
}

// ============================================================================
// Following
// ============================================================================

TEST(LogReaderTest, FollowEmitsOnlyAppendedLines) {
    auto tmp = TempDirScope::unique_under("servherd-logs");
    const auto path = tmp / "out.log";
    writeFile(path, "before\n");

    std::mutex mu;
    std::vector<std::string> seen;
    std::stop_source source;
    std::jthread follower([&]() {
        followLog(
            path, source.get_token(),
            [&](const std::string& line) {
                std::lock_guard lock(mu);
                seen.push_back(line);
            },
            20ms);
    });

    std::this_thread::sleep_for(100ms);
    writeFile(path, "after\n", std::ios::app);
    for (int i = 0; i < 200; ++i) {
        {
            std::lock_guard lock(mu);
            if (!seen.empty())
                break;
        }
        std::this_thread::sleep_for(10ms);
    }
    source.request_stop();
    follower.join();

    std::lock_guard lock(mu);
    EXPECT_EQ(seen, (std::vector<std::string>{"after"}));
}
