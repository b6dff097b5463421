#include "packfetch/quota_monitor.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace packfetch;
using namespace packfetch::test;

TEST(QuotaMonitorTest, UsageAtEightyFivePercentIsAboveHighWater) {
    FakeQuotaSource source({850, 150, 1000});
    StorageQuotaMonitor monitor(source);

    const auto estimate = monitor.checkQuota();
    EXPECT_DOUBLE_EQ(estimate.usageRatio(), 0.85);
    EXPECT_TRUE(monitor.aboveHighWater(estimate));
    EXPECT_DOUBLE_EQ(monitor.highWaterRatio(), 0.8);
}

TEST(QuotaMonitorTest, HighWaterBoundaryIsInclusive) {
    FakeQuotaSource source({800, 200, 1000});
    StorageQuotaMonitor monitor(source);
    EXPECT_TRUE(monitor.aboveHighWater(monitor.checkQuota()));

    source.set({799, 201, 1000});
    EXPECT_FALSE(monitor.aboveHighWater(monitor.checkQuota()));
}

TEST(QuotaMonitorTest, UnknownQuotaNeverWarns) {
    FakeQuotaSource source({0, 0, 0});
    StorageQuotaMonitor monitor(source);
    const auto estimate = monitor.checkQuota();
    EXPECT_DOUBLE_EQ(estimate.usageRatio(), 0.0);
    EXPECT_FALSE(monitor.aboveHighWater(estimate));
}

TEST(QuotaMonitorTest, FitsComparesAgainstAvailableBytes) {
    FakeQuotaSource source({600, 400, 1000});
    StorageQuotaMonitor monitor(source);
    const auto estimate = monitor.checkQuota();
    EXPECT_TRUE(monitor.fits(estimate, 400));
    EXPECT_FALSE(monitor.fits(estimate, 401));
}

TEST(FilesystemQuotaSourceTest, CountsCacheUsageAgainstTheCap) {
    TempDir dir;
    ResourceCache cache(dir / "cache");
    writeFile(cache.root() / "models" / "a.bin", 600);
    writeFile(cache.root() / "search" / "b.db", 250);

    FilesystemQuotaSource source(cache, 1000);
    const auto estimate = source.estimate();
    EXPECT_EQ(estimate.used_bytes, 850u);
    EXPECT_LE(estimate.quota_bytes, 1000u);
    EXPECT_EQ(estimate.available_bytes, estimate.quota_bytes - estimate.used_bytes);
}

TEST(FilesystemQuotaSourceTest, WorksBeforeTheCacheExists) {
    TempDir dir;
    ResourceCache cache(dir / "not" / "created" / "yet");

    FilesystemQuotaSource source(cache);
    const auto estimate = source.estimate();
    EXPECT_EQ(estimate.used_bytes, 0u);
    EXPECT_GT(estimate.quota_bytes, 0u);
}
