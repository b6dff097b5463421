#include "packfetch/event_queue.hpp"

#include <utility>

namespace packfetch {

std::string_view toString(EventKind kind) {
    switch (kind) {
        case EventKind::Progress:
            return "progress";
        case EventKind::ResourceStatus:
            return "resourceStatus";
        case EventKind::Retrying:
            return "retrying";
        case EventKind::QuotaWarning:
            return "quotaWarning";
        case EventKind::ResumeOffered:
            return "resumeOffered";
        case EventKind::Paused:
            return "paused";
        case EventKind::Completed:
            return "completed";
        case EventKind::Failed:
            return "failed";
        case EventKind::Cancelled:
            return "cancelled";
    }
    return "progress";
}

void EventQueue::push(SessionEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        events_.push_back(std::move(event));
    }
    cv_.notify_one();
}

std::optional<SessionEvent> EventQueue::pop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !events_.empty() || closed_; })) {
        return std::nullopt;
    }
    if (events_.empty()) {
        return std::nullopt;
    }
    auto event = std::move(events_.front());
    events_.pop_front();
    return event;
}

std::optional<SessionEvent> EventQueue::tryPop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (events_.empty()) {
        return std::nullopt;
    }
    auto event = std::move(events_.front());
    events_.pop_front();
    return event;
}

void EventQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool EventQueue::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::size_t EventQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

} // namespace packfetch
