#include "packfetch/progress_panel.hpp"

#include "packfetch/error_record.hpp"

#include <algorithm>
#include <utility>

#include <fmt/format.h>

namespace packfetch {

namespace {
constexpr std::size_t max_notices = 4;
} // namespace

ProgressPanel::ProgressPanel(const PackageManifest& manifest) : tier_(manifest.tier) {
    rows_.reserve(manifest.resources.size());
    for (const auto& descriptor : manifest.resources) {
        ResourceRow row;
        row.id = descriptor.id;
        row.group = descriptor.component_group;
        row.bytes_expected = descriptor.expected_bytes;
        rows_.push_back(std::move(row));
    }
}

void ProgressPanel::apply(const SessionEvent& event) {
    phase_ = event.phase;
    if (event.overall_percent) {
        overall_percent_ = event.overall_percent;
    }

    if (!event.resource_id.empty()) {
        if (auto* row = findRow(event.resource_id)) {
            row->status = event.resource_status;
            row->bytes_transferred = event.bytes_transferred;
            if (event.bytes_expected) {
                row->bytes_expected = event.bytes_expected;
            }
            row->restarted_from_zero = event.restarted_from_zero;
            if (event.kind == EventKind::Retrying) {
                row->note = event.message;
            } else if (event.resource_status == ResourceStatus::Failed && event.error) {
                row->note = event.error->message;
            } else {
                row->note.clear();
            }
        }
    }

    switch (event.kind) {
        case EventKind::QuotaWarning:
        case EventKind::ResumeOffered:
            addNotice(event.message);
            break;
        case EventKind::Failed:
            if (event.error) {
                addNotice(fmt::format("{} ({})", event.error->message, event.error->recovery_suggestion));
            }
            finished_ = true;
            break;
        case EventKind::Completed:
            overall_percent_ = 100.0;
            finished_ = true;
            break;
        case EventKind::Paused:
        case EventKind::Cancelled:
            finished_ = true;
            break;
        default:
            break;
    }
}

std::string ProgressPanel::build() const {
    std::string panel;
    panel.reserve(rows_.size() * 128 + 256);
    panel.append("==================================================\n");
    panel += fmt::format("Offline package '{}' ({} resources) - {}\n", tier_, rows_.size(), toString(phase_));
    panel.append("--------------------------------------------------\n");

    for (const auto& row : rows_) {
        panel += formatResourceLine(row);
        panel.push_back('\n');
    }

    panel.append("--------------------------------------------------\n");
    if (overall_percent_) {
        panel += fmt::format("Overall: {:.1f}%", *overall_percent_);
    } else {
        panel.append("Overall: N/A");
    }
    panel.push_back('\n');
    for (const auto& notice : notices_) {
        panel += fmt::format("! {}\n", notice);
    }
    panel.append("==================================================\n");

    return panel;
}

void ProgressPanel::redraw(std::ostream& out) {
    const auto panel = build();
    const auto current_lines = static_cast<std::size_t>(std::count(panel.begin(), panel.end(), '\n'));
    if (previous_lines_ > 0) {
        out << "\033[" << previous_lines_ << "F\033[J";
    }
    out << panel << std::flush;
    previous_lines_ = current_lines;
}

std::string ProgressPanel::formatResourceLine(const ResourceRow& row) {
    std::string name = row.id;
    if (name.size() > 20) {
        name = name.substr(0, 20);
    }

    std::string line;
    line.reserve(256);

    if (row.bytes_expected && *row.bytes_expected > 0) {
        const double ratio = std::min(1.0, static_cast<double>(row.bytes_transferred) /
                                               static_cast<double>(*row.bytes_expected));
        const int percent = static_cast<int>(ratio * 100.0);
        constexpr int bar_width = 30;
        const int bar_pos = static_cast<int>(ratio * bar_width);

        std::string bar;
        bar.reserve(static_cast<std::size_t>(bar_width) * 3);
        for (int i = 0; i < bar_width; ++i) {
            bar += (i < bar_pos) ? "█" : "░";
        }

        line += fmt::format("{:<20} [{}] {:>3}% ({}/{})", name, bar, percent, formatSize(row.bytes_transferred),
                            formatSize(*row.bytes_expected));
    } else {
        line += fmt::format("{:<20} [size unknown] {}", name, formatSize(row.bytes_transferred));
    }

    switch (row.status) {
        case ResourceStatus::Complete:
            line.append("  done");
            break;
        case ResourceStatus::Failed:
            line += fmt::format("  failed: {}", row.note);
            break;
        case ResourceStatus::Pending:
            line.append("  waiting");
            break;
        case ResourceStatus::InProgress:
            if (!row.note.empty()) {
                line += fmt::format("  {}", row.note);
            }
            break;
    }
    if (row.restarted_from_zero) {
        line.append("  (restarted)");
    }

    return line;
}

std::string ProgressPanel::formatSize(std::uint64_t bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    const double value = static_cast<double>(bytes);
    if (bytes >= static_cast<std::uint64_t>(GB)) {
        return fmt::format("{:.1f} GB", value / GB);
    } else if (bytes >= static_cast<std::uint64_t>(MB)) {
        return fmt::format("{:.1f} MB", value / MB);
    } else if (bytes >= static_cast<std::uint64_t>(KB)) {
        return fmt::format("{:.1f} KB", value / KB);
    } else {
        return fmt::format("{} B", bytes);
    }
}

ProgressPanel::ResourceRow* ProgressPanel::findRow(const std::string& id) {
    const auto it = std::find_if(rows_.begin(), rows_.end(), [&](const ResourceRow& row) { return row.id == id; });
    return it == rows_.end() ? nullptr : &*it;
}

void ProgressPanel::addNotice(std::string notice) {
    if (notice.empty()) {
        return;
    }
    notices_.push_back(std::move(notice));
    while (notices_.size() > max_notices) {
        notices_.pop_front();
    }
}

} // namespace packfetch
