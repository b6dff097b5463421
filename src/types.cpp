#include "packfetch/types.hpp"

#include <algorithm>

namespace packfetch {

std::string_view toString(ComponentGroup group) {
    switch (group) {
        case ComponentGroup::Libraries:
            return "libraries";
        case ComponentGroup::Model:
            return "model";
        case ComponentGroup::SearchIndex:
            return "searchIndex";
    }
    return "libraries";
}

std::string_view toString(ResourceStatus status) {
    switch (status) {
        case ResourceStatus::Pending:
            return "pending";
        case ResourceStatus::InProgress:
            return "inProgress";
        case ResourceStatus::Complete:
            return "complete";
        case ResourceStatus::Failed:
            return "failed";
    }
    return "pending";
}

std::string_view toString(SessionPhase phase) {
    switch (phase) {
        case SessionPhase::Idle:
            return "idle";
        case SessionPhase::Downloading:
            return "downloading";
        case SessionPhase::Paused:
            return "paused";
        case SessionPhase::Completed:
            return "completed";
        case SessionPhase::Failed:
            return "failed";
        case SessionPhase::Cancelled:
            return "cancelled";
    }
    return "idle";
}

std::optional<ComponentGroup> componentGroupFromString(std::string_view name) {
    for (auto group : {ComponentGroup::Libraries, ComponentGroup::Model, ComponentGroup::SearchIndex}) {
        if (toString(group) == name) {
            return group;
        }
    }
    return std::nullopt;
}

std::optional<ResourceStatus> resourceStatusFromString(std::string_view name) {
    for (auto status : {ResourceStatus::Pending, ResourceStatus::InProgress,
                        ResourceStatus::Complete, ResourceStatus::Failed}) {
        if (toString(status) == name) {
            return status;
        }
    }
    return std::nullopt;
}

std::optional<SessionPhase> sessionPhaseFromString(std::string_view name) {
    for (auto phase : {SessionPhase::Idle, SessionPhase::Downloading, SessionPhase::Paused,
                       SessionPhase::Completed, SessionPhase::Failed, SessionPhase::Cancelled}) {
        if (toString(phase) == name) {
            return phase;
        }
    }
    return std::nullopt;
}

bool isTerminal(SessionPhase phase) {
    return phase == SessionPhase::Completed || phase == SessionPhase::Cancelled;
}

const ResourceDescriptor* PackageManifest::find(std::string_view resource_id) const {
    const auto it = std::find_if(resources.begin(), resources.end(),
                                 [&](const ResourceDescriptor& d) { return d.id == resource_id; });
    return it == resources.end() ? nullptr : &*it;
}

std::vector<ComponentGroup> PackageManifest::componentGroups() const {
    std::vector<ComponentGroup> groups;
    for (const auto& descriptor : resources) {
        if (std::find(groups.begin(), groups.end(), descriptor.component_group) == groups.end()) {
            groups.push_back(descriptor.component_group);
        }
    }
    return groups;
}

} // namespace packfetch
