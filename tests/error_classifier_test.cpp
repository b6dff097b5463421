#include "packfetch/error_classifier.hpp"

#include <cerrno>

#include <gtest/gtest.h>

using namespace packfetch;

namespace {

std::vector<RecoveryAction> actions(std::initializer_list<RecoveryAction> list) {
    return std::vector<RecoveryAction>(list);
}

} // namespace

TEST(ErrorClassifierTest, ConnectionFailuresAreRetryableNetworkErrors) {
    const auto record = classify(RawError{FailureKind::Connection, 0, 0, "Couldn't connect to server"});
    EXPECT_EQ(record.category, ErrorCategory::Network);
    EXPECT_EQ(record.recoverable_actions, actions({RecoveryAction::Retry, RecoveryAction::Cancel}));
    EXPECT_EQ(record.raw_detail, "Couldn't connect to server");
    EXPECT_FALSE(record.message.empty());
    EXPECT_FALSE(record.recovery_suggestion.empty());
}

TEST(ErrorClassifierTest, InactivityTimeoutIsNetwork) {
    const auto record = classify(RawError{FailureKind::Timeout, 0, 0, "Operation too slow"});
    EXPECT_EQ(record.category, ErrorCategory::Network);
    EXPECT_TRUE(record.allows(RecoveryAction::Retry));
}

TEST(ErrorClassifierTest, MissingResourcesOfferReportMissing) {
    for (const int status : {404, 410}) {
        const auto record = classify(RawError{FailureKind::HttpStatus, status, 0, "GET failed"});
        EXPECT_EQ(record.category, ErrorCategory::NotFound) << status;
        EXPECT_EQ(record.recoverable_actions, actions({RecoveryAction::Cancel, RecoveryAction::ReportMissing}));
        EXPECT_FALSE(record.allows(RecoveryAction::Retry));
    }
    EXPECT_EQ(classify(RawError{FailureKind::MissingResource, 0, 0, "no such file"}).category,
              ErrorCategory::NotFound);
}

TEST(ErrorClassifierTest, ServerErrorsAreRetryable) {
    const auto record = classify(RawError{FailureKind::HttpStatus, 503, 0, "GET returned HTTP 503"});
    EXPECT_EQ(record.category, ErrorCategory::Server);
    EXPECT_EQ(record.recoverable_actions, actions({RecoveryAction::Retry, RecoveryAction::Cancel}));
}

TEST(ErrorClassifierTest, ClientErrorsOtherThanMissingAreNotRetried) {
    const auto record = classify(RawError{FailureKind::HttpStatus, 403, 0, "GET returned HTTP 403"});
    EXPECT_EQ(record.category, ErrorCategory::Server);
    EXPECT_EQ(record.recoverable_actions, actions({RecoveryAction::Cancel}));
}

TEST(ErrorClassifierTest, StorageFailuresOfferClearCache) {
    const auto full = classify(RawError{FailureKind::StorageFull, 0, ENOSPC, "No space left on device"});
    EXPECT_EQ(full.category, ErrorCategory::Storage);
    EXPECT_EQ(full.recoverable_actions, actions({RecoveryAction::ClearCache, RecoveryAction::Cancel}));

    const auto write = classify(RawError{FailureKind::StorageWrite, 0, EIO, "I/O error"});
    EXPECT_EQ(write.category, ErrorCategory::Storage);
    EXPECT_TRUE(write.allows(RecoveryAction::ClearCache));

    const auto by_errno = classify(RawError{FailureKind::StorageWrite, 0, ENOSPC, "write"});
    EXPECT_EQ(by_errno.category, ErrorCategory::Storage);
}

TEST(ErrorClassifierTest, PermissionFailuresOnlyCancel) {
    const auto denied = classify(RawError{FailureKind::PermissionDenied, 0, EACCES, "Permission denied"});
    EXPECT_EQ(denied.category, ErrorCategory::Permission);
    EXPECT_EQ(denied.recoverable_actions, actions({RecoveryAction::Cancel}));

    const auto readonly = classify(RawError{FailureKind::StorageWrite, 0, EROFS, "Read-only file system"});
    EXPECT_EQ(readonly.category, ErrorCategory::Permission);
}

TEST(ErrorClassifierTest, ManifestMismatchIsNotFound) {
    const auto record = classify(RawError{FailureKind::ManifestMismatch, 200, 0, "size differs"});
    EXPECT_EQ(record.category, ErrorCategory::NotFound);
    EXPECT_TRUE(record.allows(RecoveryAction::ReportMissing));
}

TEST(ErrorClassifierTest, UnknownFailuresAreClassifiedByTheirText) {
    EXPECT_EQ(classify(RawError{FailureKind::Unknown, 0, 0, "QuotaExceededError: quota reached"}).category,
              ErrorCategory::Storage);
    EXPECT_EQ(classify(RawError{FailureKind::Unknown, 0, 0, "operation not allowed"}).category,
              ErrorCategory::Permission);
    EXPECT_EQ(classify(RawError{FailureKind::Unknown, 0, 0, "request timed out"}).category,
              ErrorCategory::Network);
    EXPECT_EQ(classify(RawError{FailureKind::Unknown, 0, 0, "something odd"}).category, ErrorCategory::Network);
}

TEST(ErrorClassifierTest, EveryRecordOffersAtLeastOneAction) {
    for (const auto kind : {FailureKind::Connection, FailureKind::Timeout, FailureKind::HttpStatus,
                            FailureKind::StorageWrite, FailureKind::StorageFull, FailureKind::PermissionDenied,
                            FailureKind::MissingResource, FailureKind::ManifestMismatch, FailureKind::Unknown}) {
        const auto record = classify(RawError{kind, 500, 0, "detail"});
        EXPECT_FALSE(record.recoverable_actions.empty()) << toString(kind);
        EXPECT_TRUE(record.allows(RecoveryAction::Cancel)) << toString(kind);
    }
}
