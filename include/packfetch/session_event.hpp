#pragma once

#include "error_record.hpp"
#include "quota_monitor.hpp"
#include "types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace packfetch {

enum class EventKind {
    Progress,
    ResourceStatus,
    Retrying,
    QuotaWarning,
    ResumeOffered,
    Paused,
    Completed,
    Failed,
    Cancelled,
};

[[nodiscard]] std::string_view toString(EventKind kind);

struct SessionEvent {
    EventKind kind{EventKind::Progress};
    std::string tier;
    SessionPhase phase{SessionPhase::Idle};

    std::optional<ComponentGroup> component_group;
    std::string resource_id;
    ResourceStatus resource_status{ResourceStatus::Pending};
    std::uint64_t bytes_transferred{0};
    std::optional<std::uint64_t> bytes_expected;
    std::optional<double> overall_percent;
    bool restarted_from_zero{false};

    int attempt{0};
    int max_attempts{0};
    std::optional<ErrorRecord> error;
    std::optional<QuotaEstimate> quota;
    std::string message;
};

} // namespace packfetch
