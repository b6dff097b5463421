#pragma once

#include "resource_cache.hpp"

#include <cstdint>
#include <optional>

namespace packfetch {

struct QuotaEstimate {
    std::uint64_t used_bytes{0};
    std::uint64_t available_bytes{0};
    std::uint64_t quota_bytes{0};

    [[nodiscard]] double usageRatio() const {
        return quota_bytes == 0 ? 0.0 : static_cast<double>(used_bytes) / static_cast<double>(quota_bytes);
    }
};

class QuotaSource {
public:
    virtual ~QuotaSource() = default;
    [[nodiscard]] virtual QuotaEstimate estimate() = 0;
};

// Usage is what the cache directory holds; the quota is the configured cap, or
// usage plus the free space of the filesystem when no cap is set.
class FilesystemQuotaSource final : public QuotaSource {
public:
    explicit FilesystemQuotaSource(const ResourceCache& cache,
                                   std::optional<std::uint64_t> quota_cap = std::nullopt);

    [[nodiscard]] QuotaEstimate estimate() override;

private:
    const ResourceCache& cache_;
    std::optional<std::uint64_t> quota_cap_;
};

// Quota estimates are advisory: the monitor reports, it never stops a download.
class StorageQuotaMonitor {
public:
    explicit StorageQuotaMonitor(QuotaSource& source, double high_water_ratio = 0.8);

    // Throws std::filesystem::filesystem_error when the estimate cannot be taken.
    [[nodiscard]] QuotaEstimate checkQuota();
    [[nodiscard]] bool fits(const QuotaEstimate& estimate, std::uint64_t additional_bytes) const;
    [[nodiscard]] bool aboveHighWater(const QuotaEstimate& estimate) const;
    [[nodiscard]] double highWaterRatio() const { return high_water_ratio_; }

private:
    QuotaSource& source_;
    double high_water_ratio_;
};

} // namespace packfetch
