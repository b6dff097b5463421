#include "packfetch/session.hpp"

#include <algorithm>
#include <random>

#include <fmt/format.h>

namespace packfetch {

std::uint64_t DownloadSession::accountedBytes() const {
    std::uint64_t total = 0;
    for (const auto& [id, progress] : resources) {
        if (progress.bytes_expected) {
            total += std::min(progress.bytes_transferred, *progress.bytes_expected);
        }
    }
    return total;
}

bool DownloadSession::allComplete() const {
    return !resources.empty() && countWithStatus(ResourceStatus::Complete) == resources.size();
}

std::size_t DownloadSession::countWithStatus(ResourceStatus status) const {
    return static_cast<std::size_t>(std::count_if(
        resources.begin(), resources.end(),
        [status](const auto& entry) { return entry.second.status == status; }));
}

double overallPercent(const DownloadSession& session, std::uint64_t total_expected_bytes) {
    if (session.allComplete()) {
        return 100.0;
    }
    if (total_expected_bytes == 0) {
        return 0.0;
    }
    const double ratio = static_cast<double>(session.accountedBytes()) /
                         static_cast<double>(total_expected_bytes);
    return std::min(ratio * 100.0, 99.9);
}

std::string newSessionId() {
    static thread_local std::mt19937_64 engine{std::random_device{}()};
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            Clock::now().time_since_epoch()).count();
    return fmt::format("{:x}-{:08x}", millis, static_cast<std::uint32_t>(engine()));
}

} // namespace packfetch
