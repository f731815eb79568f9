/**
 * Tests for error_hints.h - follow-up suggestions printed under failed commands.
 */

#include <gtest/gtest.h>
#include <servherd/cli/error_hints.h>

using namespace servherd;
using namespace servherd::cli;

TEST(ErrorHintsTest, DaemonProblemsPointAtDaemonLog) {
    for (const char* msg : {"Failed to connect to daemon", "connect(socket): No such file",
                            "Connection refused"}) {
        auto hint = getErrorHint(ErrorCode::BackendConnectionFailed, msg);
        EXPECT_NE(hint.hint.find("daemon.log"), std::string::npos) << msg;
        EXPECT_EQ(hint.command, "servherd-daemon --foreground --log-level debug") << msg;
    }
}

TEST(ErrorHintsTest, ServerNotFoundSuggestsList) {
    auto hint = getErrorHint(ErrorCode::ServerNotFound, "Server \"web\" not found in registry");
    EXPECT_EQ(hint.hint, "List registered servers");
    EXPECT_EQ(hint.command, "servherd list");
}

TEST(ErrorHintsTest, InvalidArgumentNamesCommandHelp) {
    auto hint = getErrorHint(ErrorCode::InvalidArgument, "bad flags", "stop");
    EXPECT_EQ(hint.hint, "Check command syntax");
    EXPECT_EQ(hint.command, "servherd stop --help");

    EXPECT_EQ(getErrorHint(ErrorCode::InvalidArgument, "bad flags").command, "servherd --help");
}

TEST(ErrorHintsTest, PermissionDeniedHasNoCommand) {
    auto hint = getErrorHint(ErrorCode::IOError, "open: Permission denied");
    EXPECT_EQ(hint.hint, "Check file/directory permissions");
    EXPECT_TRUE(hint.command.empty());
}

TEST(ErrorHintsTest, UnknownCodesHaveNoHint) {
    auto hint = getErrorHint(ErrorCode::InternalError, "boom");
    EXPECT_TRUE(hint.hint.empty());
    EXPECT_TRUE(hint.command.empty());
    EXPECT_EQ(formatErrorWithHint(ErrorCode::InternalError, "boom"), "boom");
}

TEST(ErrorHintsTest, FormatAppendsHintAndCommand) {
    EXPECT_EQ(formatErrorWithHint(ErrorCode::ServerNotFound, "Server \"web\" not found"),
              "Server \"web\" not found\n  Hint: List registered servers\n  Try: servherd list");
    EXPECT_EQ(formatErrorWithHint(ErrorCode::Timeout, "Timed out"),
              "Timed out\n  Hint: The daemon did not answer in time");
}
