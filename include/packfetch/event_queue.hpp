#pragma once

#include "session_event.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace packfetch {

// Many producers (orchestrator workers), one consumer (the UI layer).
class EventQueue {
public:
    void push(SessionEvent event);

    // Blocks up to `timeout`; std::nullopt on timeout or once closed and drained.
    [[nodiscard]] std::optional<SessionEvent> pop(std::chrono::milliseconds timeout);
    [[nodiscard]] std::optional<SessionEvent> tryPop();

    void close();
    [[nodiscard]] bool closed() const;
    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<SessionEvent> events_;
    bool closed_{false};
};

} // namespace packfetch
