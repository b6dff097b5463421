#include "packfetch/quota_monitor.hpp"

#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

namespace packfetch {

namespace {

// Nearest existing ancestor, so space() works before the cache directory is created.
fs::path existingAncestor(fs::path path) {
    std::error_code ec;
    while (!path.empty() && !fs::exists(path, ec)) {
        const auto parent = path.parent_path();
        if (parent == path) {
            break;
        }
        path = parent;
    }
    return path.empty() ? fs::current_path() : path;
}

} // namespace

FilesystemQuotaSource::FilesystemQuotaSource(const ResourceCache& cache, std::optional<std::uint64_t> quota_cap)
    : cache_(cache), quota_cap_(quota_cap) {}

QuotaEstimate FilesystemQuotaSource::estimate() {
    QuotaEstimate estimate;
    estimate.used_bytes = cache_.usedBytes();

    const auto space = fs::space(existingAncestor(fs::absolute(cache_.root())));
    const std::uint64_t filesystem_limit = estimate.used_bytes + static_cast<std::uint64_t>(space.available);
    estimate.quota_bytes = quota_cap_ ? std::min(*quota_cap_, filesystem_limit) : filesystem_limit;
    estimate.available_bytes =
        estimate.quota_bytes > estimate.used_bytes ? estimate.quota_bytes - estimate.used_bytes : 0;
    return estimate;
}

StorageQuotaMonitor::StorageQuotaMonitor(QuotaSource& source, double high_water_ratio)
    : source_(source), high_water_ratio_(high_water_ratio) {}

QuotaEstimate StorageQuotaMonitor::checkQuota() {
    return source_.estimate();
}

bool StorageQuotaMonitor::fits(const QuotaEstimate& estimate, std::uint64_t additional_bytes) const {
    return additional_bytes <= estimate.available_bytes;
}

bool StorageQuotaMonitor::aboveHighWater(const QuotaEstimate& estimate) const {
    return estimate.quota_bytes > 0 && estimate.usageRatio() >= high_water_ratio_;
}

} // namespace packfetch
