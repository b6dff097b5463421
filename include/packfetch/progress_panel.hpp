#pragma once

#include "session_event.hpp"
#include "types.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace packfetch {

// Terminal view of one download session, fed from the event queue.
class ProgressPanel {
public:
    struct ResourceRow {
        std::string id;
        ComponentGroup group{ComponentGroup::Libraries};
        ResourceStatus status{ResourceStatus::Pending};
        std::uint64_t bytes_transferred{0};
        std::optional<std::uint64_t> bytes_expected;
        bool restarted_from_zero{false};
        std::string note;
    };

    explicit ProgressPanel(const PackageManifest& manifest);

    void apply(const SessionEvent& event);
    [[nodiscard]] std::string build() const;
    void redraw(std::ostream& out);

    // True once a Paused, Completed, Failed or Cancelled event was applied.
    [[nodiscard]] bool finished() const { return finished_; }
    [[nodiscard]] SessionPhase phase() const { return phase_; }

    static std::string formatResourceLine(const ResourceRow& row);
    static std::string formatSize(std::uint64_t bytes);

private:
    ResourceRow* findRow(const std::string& id);
    void addNotice(std::string notice);

    std::string tier_;
    std::vector<ResourceRow> rows_;
    SessionPhase phase_{SessionPhase::Idle};
    std::optional<double> overall_percent_;
    std::deque<std::string> notices_;
    bool finished_{false};
    std::size_t previous_lines_{0};
};

} // namespace packfetch
