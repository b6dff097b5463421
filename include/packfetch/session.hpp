#pragma once

#include "error_record.hpp"
#include "types.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace packfetch {

using Clock = std::chrono::system_clock;

struct ResourceProgress {
    std::uint64_t bytes_transferred{0};
    std::optional<std::uint64_t> bytes_expected;
    ResourceStatus status{ResourceStatus::Pending};
    // Set when a partial transfer could not be resumed and began again at byte 0.
    bool restarted_from_zero{false};
};

struct DownloadSession {
    std::string session_id;
    std::string tier;
    SessionPhase phase{SessionPhase::Idle};
    std::map<std::string, ResourceProgress> resources;
    Clock::time_point started_at{};
    Clock::time_point last_checkpoint_at{};
    bool paused{false};
    std::optional<ErrorRecord> last_error;

    // Bytes counted toward the manifest total: resources of unknown size are excluded
    // and nothing counts beyond its expected size.
    [[nodiscard]] std::uint64_t accountedBytes() const;
    [[nodiscard]] bool allComplete() const;
    [[nodiscard]] std::size_t countWithStatus(ResourceStatus status) const;
};

// 0..100. Reaches 100 only when every resource is complete.
[[nodiscard]] double overallPercent(const DownloadSession& session, std::uint64_t total_expected_bytes);

[[nodiscard]] std::string newSessionId();

} // namespace packfetch
