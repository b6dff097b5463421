#pragma once

#include "error_record.hpp"
#include "transfer_executor.hpp"

#include <chrono>
#include <functional>
#include <optional>

namespace packfetch {

struct RetryPolicy {
    int max_attempts{3};
    std::chrono::milliseconds base_delay{2000};
    bool exponential{true};

    // Delay before the given retry (1 = first retry).
    [[nodiscard]] std::chrono::milliseconds delayBefore(int retry) const;
};

struct AttemptOutcome {
    enum class Kind {
        Completed,
        Interrupted,
        Failed,
    };

    Kind kind{Kind::Failed};
    TransferResult result;
    std::optional<ErrorRecord> error;
    int attempts{0};
    std::uint64_t bytes_so_far{0};
};

// Called before each retry with the upcoming attempt number, the limit and the
// classified error that caused it.
using RetryCallback = std::function<void(int attempt, int max_attempts, const ErrorRecord& cause)>;

class RetryController {
public:
    RetryController(TransferExecutor& executor, RetryPolicy policy);

    [[nodiscard]] AttemptOutcome attempt(const ResourceDescriptor& descriptor,
                                         std::uint64_t resume_offset,
                                         const ChunkCallback& on_chunk,
                                         const RetryCallback& on_retry,
                                         const TransferSignal& signal);

    [[nodiscard]] const RetryPolicy& policy() const { return policy_; }

private:
    TransferExecutor& executor_;
    RetryPolicy policy_;
};

} // namespace packfetch
