#include <gtest/gtest.h>
#include <cerrno>
#include <string>
#include <thread>
#include "FileSystem/ErrorClassifier.h"
#include "FileSystem/ErrorContext.h"

using namespace Steadfast::Core::IO;

TEST(ErrorContext, CapturesCallerLocation) {
    const auto line = __LINE__ + 1;
    ErrorContext ctx("rename");

    EXPECT_EQ(ctx.operation(), "rename");
    EXPECT_EQ(ctx.origin().line(), line);
    EXPECT_NE(std::string(ctx.origin().file_name()).find("ErrorContextTests.cpp"), std::string::npos);
    EXPECT_EQ(ctx.callerThread(), std::this_thread::get_id());
}

TEST(ErrorContext, EnrichBuildsTraceWithoutTouchingTheError) {
    ErrorContext ctx("unlink");
    auto error = makeOsError(EACCES, "/protected/file");
    const auto originalMessage = error.message;

    ctx.enrich(error);

    EXPECT_EQ(error.code, FileError::AccessDenied);
    EXPECT_EQ(error.message, originalMessage);
    EXPECT_EQ(error.path, "/protected/file");
    EXPECT_EQ(error.trace.rfind("unlink failed: " + originalMessage, 0), 0u) << error.trace;
    EXPECT_NE(error.trace.find("[/protected/file]"), std::string::npos);
    EXPECT_NE(error.trace.find(ctx.callSite()), std::string::npos);
    EXPECT_NE(error.trace.find("ErrorContextTests.cpp"), std::string::npos);
}

TEST(ErrorContext, CopiedContextKeepsTheOriginalThread) {
    ErrorContext ctx("stat");
    std::thread::id seen;
    std::thread worker([&seen, copy = ctx] { seen = copy.callerThread(); });
    worker.join();
    EXPECT_EQ(seen, std::this_thread::get_id());
}

TEST(ErrorContext, DescribeFallsBackToCodeName) {
    ErrorContext ctx("copy");
    FileErrorInfo error;
    error.code = FileError::SameFile;
    EXPECT_EQ(ctx.describe(error).rfind("copy failed: SameFile", 0), 0u);
}
