#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace packfetch {

// Cooperative stop request shared by the orchestrator, the retry loop and the executor.
// Pause asks a transfer to stop at the next chunk boundary; cancel aborts promptly.
class TransferSignal {
public:
    void requestPause();
    void requestCancel();

    [[nodiscard]] bool pauseRequested() const;
    [[nodiscard]] bool cancelled() const;
    [[nodiscard]] bool stopRequested() const;

    // Sleeps up to `duration`. Returns true if a stop was requested meanwhile.
    bool waitFor(std::chrono::milliseconds duration) const;

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool pause_{false};
    bool cancel_{false};
};

using TransferSignalPtr = std::shared_ptr<TransferSignal>;

} // namespace packfetch
