#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace packfetch {

enum class ComponentGroup {
    Libraries,
    Model,
    SearchIndex,
};

enum class ResourceStatus {
    Pending,
    InProgress,
    Complete,
    Failed,
};

enum class SessionPhase {
    Idle,
    Downloading,
    Paused,
    Completed,
    Failed,
    Cancelled,
};

[[nodiscard]] std::string_view toString(ComponentGroup group);
[[nodiscard]] std::string_view toString(ResourceStatus status);
[[nodiscard]] std::string_view toString(SessionPhase phase);

// Return std::nullopt for names that are not part of the closed set.
[[nodiscard]] std::optional<ComponentGroup> componentGroupFromString(std::string_view name);
[[nodiscard]] std::optional<ResourceStatus> resourceStatusFromString(std::string_view name);
[[nodiscard]] std::optional<SessionPhase> sessionPhaseFromString(std::string_view name);

// Completed and cancelled sessions have no checkpoint; failed ones stay resumable.
[[nodiscard]] bool isTerminal(SessionPhase phase);

struct ResourceDescriptor {
    std::string id;
    std::string source_url;
    std::optional<std::uint64_t> expected_bytes;
    ComponentGroup component_group{ComponentGroup::Libraries};
    std::string destination_key;
    bool supports_resume{true};
    // Lowercase hex digest the finished file must match.
    std::optional<std::string> sha256;
};

struct PackageManifest {
    std::string tier;
    std::vector<ResourceDescriptor> resources;
    std::uint64_t total_expected_bytes{0};

    [[nodiscard]] const ResourceDescriptor* find(std::string_view resource_id) const;
    // Groups in first-appearance order.
    [[nodiscard]] std::vector<ComponentGroup> componentGroups() const;
};

} // namespace packfetch
