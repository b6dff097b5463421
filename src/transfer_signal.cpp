#include "packfetch/transfer_signal.hpp"

namespace packfetch {

void TransferSignal::requestPause() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pause_ = true;
    }
    cv_.notify_all();
}

void TransferSignal::requestCancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancel_ = true;
    }
    cv_.notify_all();
}

bool TransferSignal::pauseRequested() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pause_;
}

bool TransferSignal::cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancel_;
}

bool TransferSignal::stopRequested() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pause_ || cancel_;
}

bool TransferSignal::waitFor(std::chrono::milliseconds duration) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, duration, [this] { return pause_ || cancel_; });
}

} // namespace packfetch
