#include <gtest/gtest.h>
#include <cerrno>
#include "FileSystem/ErrorClassifier.h"

using namespace Steadfast::Core::IO;
using Action = RecoveryDecision::Action;

namespace {
    FileErrorInfo err(FileError code) {
        FileErrorInfo e;
        e.code = code;
        e.path = "/some/path";
        return e;
    }
}

TEST(ErrorClassifier, NotFoundOnDeleteIsIgnored) {
    for (auto kind : {OperationKind::Remove, OperationKind::Unlink, OperationKind::Rmdir}) {
        EXPECT_EQ(classify(err(FileError::FileNotFound), kind).action, Action::Ignore) << operationKindName(kind);
    }
}

TEST(ErrorClassifier, NotFoundElsewhereFails) {
    for (auto kind : {OperationKind::Stat, OperationKind::ReadFile, OperationKind::Rename, OperationKind::Copy}) {
        EXPECT_EQ(classify(err(FileError::FileNotFound), kind).action, Action::Fail) << operationKindName(kind);
    }
}

TEST(ErrorClassifier, AlreadyExistsOnDirectoryCreationIsIgnored) {
    EXPECT_EQ(classify(err(FileError::AlreadyExists), OperationKind::Mkdir).action, Action::Ignore);
    EXPECT_EQ(classify(err(FileError::AlreadyExists), OperationKind::EnsureDir).action, Action::Ignore);
    EXPECT_EQ(classify(err(FileError::AlreadyExists), OperationKind::Link).action, Action::Fail);
}

TEST(ErrorClassifier, BusyPromptsForBusy) {
    auto d = classify(err(FileError::Busy), OperationKind::WriteFile);
    EXPECT_EQ(d, RecoveryDecision::retryAfterUserChoice(PromptKind::Busy));
}

TEST(ErrorClassifier, AccessDeniedPromptsForAccess) {
    auto d = classify(err(FileError::AccessDenied), OperationKind::Unlink);
    EXPECT_EQ(d, RecoveryDecision::retryAfterUserChoice(PromptKind::AccessDenied));
}

TEST(ErrorClassifier, RmdirRetriesWithinBudgetThenFails) {
    ClassifyContext ctx;
    ctx.rmdirBudget = RetryBudget{3, std::chrono::milliseconds(100)};

    for (auto code : {FileError::Busy, FileError::AccessDenied, FileError::Unknown}) {
        ctx.attempt = 1;
        EXPECT_EQ(classify(err(code), OperationKind::Rmdir, ctx),
                  RecoveryDecision::retryAfterDelay(std::chrono::milliseconds(100)));
        ctx.attempt = 2;
        EXPECT_EQ(classify(err(code), OperationKind::Rmdir, ctx).action, Action::RetryAfterDelay);
        ctx.attempt = 3;
        EXPECT_EQ(classify(err(code), OperationKind::Rmdir, ctx).action, Action::Fail);
    }
}

TEST(ErrorClassifier, RmdirNeverPrompts) {
    ClassifyContext ctx;
    ctx.attempt = 1;
    EXPECT_EQ(classify(err(FileError::IOError), OperationKind::Rmdir, ctx).action, Action::Fail);
    EXPECT_EQ(classify(err(FileError::Busy), OperationKind::Rmdir, ctx).prompt, PromptKind::None);
}

TEST(ErrorClassifier, RenameOntoDirectoryWithAccessDeniedFails) {
    ClassifyContext ctx;
    ctx.destinationIsDirectory = true;
    EXPECT_EQ(classify(err(FileError::AccessDenied), OperationKind::Rename, ctx).action, Action::Fail);

    ctx.destinationIsDirectory = false;
    EXPECT_EQ(classify(err(FileError::AccessDenied), OperationKind::Rename, ctx),
              RecoveryDecision::retryAfterUserChoice(PromptKind::AccessDenied));
}

TEST(ErrorClassifier, OtherCodesFail) {
    for (auto code : {FileError::IOError, FileError::Unknown, FileError::SameFile, FileError::AlreadyExists}) {
        EXPECT_EQ(classify(err(code), OperationKind::WriteFile).action, Action::Fail) << fileErrorToString(code);
    }
}

TEST(ErrorClassifier, ErrnoNormalization) {
    EXPECT_EQ(errnoToFileError(ENOENT), FileError::FileNotFound);
    EXPECT_EQ(errnoToFileError(EBUSY), FileError::Busy);
    EXPECT_EQ(errnoToFileError(ETXTBSY), FileError::Busy);
    EXPECT_EQ(errnoToFileError(EACCES), FileError::AccessDenied);
    EXPECT_EQ(errnoToFileError(EPERM), FileError::AccessDenied);
    EXPECT_EQ(errnoToFileError(EEXIST), FileError::AlreadyExists);
    EXPECT_EQ(errnoToFileError(ENOTEMPTY), FileError::IOError);
    EXPECT_EQ(errnoToFileError(ENOSPC), FileError::IOError);
    EXPECT_EQ(errnoToFileError(EPROTO), FileError::Unknown);
}

TEST(ErrorClassifier, MakeOsErrorKeepsErrnoAndPath) {
    auto e = makeOsError(EBUSY, "/locked/file");
    EXPECT_EQ(e.code, FileError::Busy);
    EXPECT_EQ(e.path, "/locked/file");
    ASSERT_TRUE(e.systemError.has_value());
    EXPECT_EQ(e.systemError->value(), EBUSY);
    EXPECT_FALSE(e.message.empty());
}
