#include "packfetch/retry_controller.hpp"

#include "packfetch/errors.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace packfetch;
using namespace packfetch::test;

namespace {

RetryPolicy fastPolicy(int attempts = 3) {
    RetryPolicy policy;
    policy.max_attempts = attempts;
    policy.base_delay = std::chrono::milliseconds(0);
    return policy;
}

void ignoreChunk(std::uint64_t, std::optional<std::uint64_t>) {}

TransferError networkFailure(const std::string& detail = "connection reset by peer") {
    return TransferError(RawError{FailureKind::Connection, 0, 0, detail});
}

} // namespace

TEST(RetryPolicyTest, DelaysDoubleFromTheBase) {
    RetryPolicy policy;
    EXPECT_EQ(policy.delayBefore(1), std::chrono::milliseconds(2000));
    EXPECT_EQ(policy.delayBefore(2), std::chrono::milliseconds(4000));
    EXPECT_EQ(policy.delayBefore(3), std::chrono::milliseconds(8000));

    policy.exponential = false;
    EXPECT_EQ(policy.delayBefore(3), std::chrono::milliseconds(2000));
}

TEST(RetryControllerTest, SucceedsOnFirstAttempt) {
    FakeExecutor executor;
    RetryController controller(executor, fastPolicy());
    TransferSignal signal;
    const auto descriptor = makeResource("lib", ComponentGroup::Libraries, 100);

    int retries = 0;
    const auto outcome = controller.attempt(descriptor, 0, ignoreChunk,
                                            [&](int, int, const ErrorRecord&) { ++retries; }, signal);
    EXPECT_EQ(outcome.kind, AttemptOutcome::Kind::Completed);
    EXPECT_EQ(outcome.attempts, 1);
    EXPECT_EQ(outcome.result.total_bytes, 100u);
    EXPECT_FALSE(outcome.error.has_value());
    EXPECT_EQ(retries, 0);
}

TEST(RetryControllerTest, ThreeNetworkFailuresExhaustTheAttempts) {
    FakeExecutor executor([](const ResourceDescriptor&, std::uint64_t, const ChunkCallback&,
                             const TransferSignal&) -> TransferResult { throw networkFailure(); });
    RetryController controller(executor, fastPolicy());
    TransferSignal signal;
    const auto descriptor = makeResource("model", ComponentGroup::Model, 200);

    std::vector<std::pair<int, int>> retries;
    const auto outcome = controller.attempt(
        descriptor, 0, ignoreChunk,
        [&](int attempt, int max_attempts, const ErrorRecord&) { retries.emplace_back(attempt, max_attempts); },
        signal);

    EXPECT_EQ(outcome.kind, AttemptOutcome::Kind::Failed);
    EXPECT_EQ(outcome.attempts, 3);
    EXPECT_EQ(executor.calls().size(), 3u);
    EXPECT_EQ(retries, (std::vector<std::pair<int, int>>{{2, 3}, {3, 3}}));
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->category, ErrorCategory::Network);
    EXPECT_EQ(outcome.error->recoverable_actions,
              (std::vector<RecoveryAction>{RecoveryAction::Retry, RecoveryAction::Cancel}));
}

TEST(RetryControllerTest, RecoversAfterATransientFailureAndResumesFromReportedBytes) {
    int calls = 0;
    FakeExecutor executor([&](const ResourceDescriptor& descriptor, std::uint64_t offset,
                              const ChunkCallback& on_chunk, const TransferSignal&) -> TransferResult {
        if (++calls == 1) {
            on_chunk(offset + 40, descriptor.expected_bytes);
            throw networkFailure();
        }
        on_chunk(*descriptor.expected_bytes, descriptor.expected_bytes);
        return TransferResult{*descriptor.expected_bytes, false};
    });
    RetryController controller(executor, fastPolicy());
    TransferSignal signal;
    const auto descriptor = makeResource("model", ComponentGroup::Model, 200);

    const auto outcome = controller.attempt(descriptor, 10, ignoreChunk, nullptr, signal);
    EXPECT_EQ(outcome.kind, AttemptOutcome::Kind::Completed);
    EXPECT_EQ(outcome.attempts, 2);

    const auto history = executor.calls();
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].offset, 10u);
    EXPECT_EQ(history[1].offset, 50u);
}

TEST(RetryControllerTest, NonResumableResourcesRetryFromZero) {
    int calls = 0;
    FakeExecutor executor([&](const ResourceDescriptor&, std::uint64_t offset, const ChunkCallback& on_chunk,
                              const TransferSignal&) -> TransferResult {
        if (++calls == 1) {
            on_chunk(offset + 30, std::nullopt);
            throw networkFailure();
        }
        return TransferResult{64, false};
    });
    RetryController controller(executor, fastPolicy());
    TransferSignal signal;
    const auto descriptor = makeResource("index", ComponentGroup::SearchIndex, std::nullopt, false);

    const auto outcome = controller.attempt(descriptor, 0, ignoreChunk, nullptr, signal);
    EXPECT_EQ(outcome.kind, AttemptOutcome::Kind::Completed);
    const auto history = executor.calls();
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[1].offset, 0u);
}

TEST(RetryControllerTest, DeterministicNotFoundUsesEveryAttempt) {
    FakeExecutor executor([](const ResourceDescriptor&, std::uint64_t, const ChunkCallback&,
                             const TransferSignal&) -> TransferResult {
        throw TransferError(RawError{FailureKind::HttpStatus, 404, 0, "GET returned HTTP 404"});
    });
    RetryController controller(executor, fastPolicy());
    TransferSignal signal;

    int retries = 0;
    const auto outcome = controller.attempt(makeResource("gone", ComponentGroup::Model, 10), 0, ignoreChunk,
                                            [&](int, int, const ErrorRecord&) { ++retries; }, signal);
    EXPECT_EQ(outcome.kind, AttemptOutcome::Kind::Failed);
    EXPECT_EQ(outcome.attempts, 3);
    EXPECT_EQ(executor.calls().size(), 3u);
    EXPECT_EQ(retries, 2);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->category, ErrorCategory::NotFound);
}

TEST(RetryControllerTest, InterruptionIsNotAFailure) {
    FakeExecutor executor([](const ResourceDescriptor&, std::uint64_t offset, const ChunkCallback&,
                             const TransferSignal&) -> TransferResult {
        throw TransferInterrupted(offset + 25, false);
    });
    RetryController controller(executor, fastPolicy());
    TransferSignal signal;

    const auto outcome =
        controller.attempt(makeResource("lib", ComponentGroup::Libraries, 100), 5, ignoreChunk, nullptr, signal);
    EXPECT_EQ(outcome.kind, AttemptOutcome::Kind::Interrupted);
    EXPECT_EQ(outcome.bytes_so_far, 30u);
    EXPECT_FALSE(outcome.error.has_value());
}

TEST(RetryControllerTest, CancelDuringBackoffEndsWithoutFurtherAttempts) {
    TransferSignal signal;
    FakeExecutor executor([](const ResourceDescriptor&, std::uint64_t, const ChunkCallback&,
                             const TransferSignal&) -> TransferResult { throw networkFailure(); });
    RetryPolicy policy;
    policy.base_delay = std::chrono::milliseconds(60000);
    RetryController controller(executor, policy);

    const auto started = std::chrono::steady_clock::now();
    const auto outcome = controller.attempt(makeResource("lib", ComponentGroup::Libraries, 100), 0, ignoreChunk,
                                            [&](int, int, const ErrorRecord&) { signal.requestCancel(); }, signal);
    EXPECT_EQ(outcome.kind, AttemptOutcome::Kind::Interrupted);
    EXPECT_EQ(executor.calls().size(), 1u);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(10));
}

TEST(RetryControllerTest, StopRequestedBeforeStartSkipsTheTransfer) {
    FakeExecutor executor;
    RetryController controller(executor, fastPolicy());
    TransferSignal signal;
    signal.requestPause();

    const auto outcome =
        controller.attempt(makeResource("lib", ComponentGroup::Libraries, 100), 0, ignoreChunk, nullptr, signal);
    EXPECT_EQ(outcome.kind, AttemptOutcome::Kind::Interrupted);
    EXPECT_TRUE(executor.calls().empty());
}
