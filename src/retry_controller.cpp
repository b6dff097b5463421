#include "packfetch/retry_controller.hpp"

#include "packfetch/error_classifier.hpp"
#include "packfetch/errors.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace packfetch {

std::chrono::milliseconds RetryPolicy::delayBefore(int retry) const {
    if (!exponential || retry <= 1) {
        return base_delay;
    }
    const int shift = std::min(retry - 1, 16);
    return base_delay * (1LL << shift);
}

RetryController::RetryController(TransferExecutor& executor, RetryPolicy policy)
    : executor_(executor), policy_(policy) {
    policy_.max_attempts = std::max(1, policy_.max_attempts);
}

AttemptOutcome RetryController::attempt(const ResourceDescriptor& descriptor,
                                        std::uint64_t resume_offset,
                                        const ChunkCallback& on_chunk,
                                        const RetryCallback& on_retry,
                                        const TransferSignal& signal) {
    AttemptOutcome outcome;
    outcome.bytes_so_far = resume_offset;
    RawError last_error;

    const ChunkCallback track = [&](std::uint64_t bytes, std::optional<std::uint64_t> total) {
        outcome.bytes_so_far = bytes;
        on_chunk(bytes, total);
    };

    for (int attempt = 1; attempt <= policy_.max_attempts; ++attempt) {
        if (signal.stopRequested()) {
            outcome.kind = AttemptOutcome::Kind::Interrupted;
            return outcome;
        }

        outcome.attempts = attempt;
        const auto offset = descriptor.supports_resume ? outcome.bytes_so_far : 0;
        try {
            outcome.result = executor_.fetch(descriptor, offset, track, signal);
            outcome.kind = AttemptOutcome::Kind::Completed;
            outcome.bytes_so_far = outcome.result.total_bytes;
            outcome.error.reset();
            return outcome;
        } catch (const TransferInterrupted& ex) {
            outcome.kind = AttemptOutcome::Kind::Interrupted;
            outcome.bytes_so_far = ex.bytesSoFar();
            return outcome;
        } catch (const TransferError& ex) {
            last_error = ex.raw();
        }

        if (signal.stopRequested()) {
            outcome.kind = AttemptOutcome::Kind::Interrupted;
            return outcome;
        }

        auto record = classify(last_error);
        spdlog::warn("Attempt {}/{} for {} failed: {} ({})", attempt, policy_.max_attempts, descriptor.id,
                     last_error.detail, toString(record.category));

        if (attempt == policy_.max_attempts) {
            outcome.error = std::move(record);
            break;
        }

        if (on_retry) {
            on_retry(attempt + 1, policy_.max_attempts, record);
        }
        if (signal.waitFor(policy_.delayBefore(attempt))) {
            outcome.kind = AttemptOutcome::Kind::Interrupted;
            return outcome;
        }
    }

    outcome.kind = AttemptOutcome::Kind::Failed;
    if (!outcome.error) {
        outcome.error = classify(last_error);
    }
    return outcome;
}

} // namespace packfetch
