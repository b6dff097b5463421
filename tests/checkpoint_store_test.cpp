#include "packfetch/checkpoint_store.hpp"
#include "packfetch/error_classifier.hpp"
#include "packfetch/errors.hpp"

#include "test_support.hpp"

#include <thread>

#include <gtest/gtest.h>

using namespace packfetch;
using namespace packfetch::test;

namespace {

DownloadSession sampleSession(const std::string& tier) {
    DownloadSession session;
    session.session_id = newSessionId();
    session.tier = tier;
    session.phase = SessionPhase::Paused;
    session.paused = true;
    session.started_at = Clock::now() - std::chrono::minutes(5);
    session.last_checkpoint_at = Clock::now();
    session.resources["r1"] = {100, 100, ResourceStatus::Complete, false};
    session.resources["r2"] = {100, 200, ResourceStatus::InProgress, true};
    session.resources["r3"] = {0, std::nullopt, ResourceStatus::Pending, false};
    return session;
}

} // namespace

class CheckpointStoreTest : public ::testing::Test {
protected:
    TempDir dir_;
};

TEST_F(CheckpointStoreTest, LoadReturnsNothingForUnknownTier) {
    SqliteCheckpointStore store(dir_ / "checkpoints.db");
    EXPECT_FALSE(store.load("minimal").has_value());
    EXPECT_TRUE(store.loadAll().empty());
}

TEST_F(CheckpointStoreTest, SaveThenLoadRestoresEveryField) {
    SqliteCheckpointStore store(dir_ / "checkpoints.db");
    auto session = sampleSession("standard");
    session.last_error = classify(RawError{FailureKind::Connection, 0, 0, "connection reset"});
    store.save(session);

    const auto loaded = store.load("standard");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->session_id, session.session_id);
    EXPECT_EQ(loaded->phase, SessionPhase::Paused);
    EXPECT_TRUE(loaded->paused);
    EXPECT_EQ(std::chrono::duration_cast<std::chrono::milliseconds>(loaded->started_at.time_since_epoch()),
              std::chrono::duration_cast<std::chrono::milliseconds>(session.started_at.time_since_epoch()));

    ASSERT_EQ(loaded->resources.size(), 3u);
    const auto& r2 = loaded->resources.at("r2");
    EXPECT_EQ(r2.bytes_transferred, 100u);
    EXPECT_EQ(r2.bytes_expected, std::optional<std::uint64_t>(200));
    EXPECT_EQ(r2.status, ResourceStatus::InProgress);
    EXPECT_TRUE(r2.restarted_from_zero);
    EXPECT_FALSE(loaded->resources.at("r3").bytes_expected.has_value());

    ASSERT_TRUE(loaded->last_error.has_value());
    EXPECT_EQ(loaded->last_error->category, ErrorCategory::Network);
    EXPECT_EQ(loaded->last_error->recoverable_actions,
              (std::vector<RecoveryAction>{RecoveryAction::Retry, RecoveryAction::Cancel}));
    EXPECT_EQ(loaded->last_error->raw_detail, "connection reset");
}

TEST_F(CheckpointStoreTest, SaveReplacesPreviousSnapshot) {
    SqliteCheckpointStore store(dir_ / "checkpoints.db");
    auto session = sampleSession("full");
    store.save(session);

    session.resources.erase("r3");
    session.resources["r2"].bytes_transferred = 150;
    session.phase = SessionPhase::Downloading;
    session.paused = false;
    store.save(session);

    const auto loaded = store.load("full");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->phase, SessionPhase::Downloading);
    EXPECT_EQ(loaded->resources.size(), 2u);
    EXPECT_EQ(loaded->resources.at("r2").bytes_transferred, 150u);
    EXPECT_FALSE(loaded->last_error.has_value());
}

TEST_F(CheckpointStoreTest, SnapshotsSurviveReopening) {
    const auto path = dir_ / "checkpoints.db";
    {
        SqliteCheckpointStore store(path);
        store.save(sampleSession("minimal"));
        store.save(sampleSession("standard"));
    }

    SqliteCheckpointStore reopened(path);
    const auto all = reopened.loadAll();
    EXPECT_EQ(all.size(), 2u);
    const auto minimal = reopened.load("minimal");
    ASSERT_TRUE(minimal.has_value());
    EXPECT_EQ(minimal->resources.at("r1").status, ResourceStatus::Complete);
}

TEST_F(CheckpointStoreTest, RemoveDeletesOnlyThatTier) {
    SqliteCheckpointStore store(dir_ / "checkpoints.db");
    store.save(sampleSession("minimal"));
    store.save(sampleSession("standard"));

    store.remove("minimal");
    EXPECT_FALSE(store.load("minimal").has_value());
    ASSERT_TRUE(store.load("standard").has_value());
    EXPECT_EQ(store.load("standard")->resources.size(), 3u);

    store.remove("minimal");
    EXPECT_EQ(store.loadAll().size(), 1u);
}

TEST_F(CheckpointStoreTest, DirectoryInPlaceOfDatabaseThrows) {
    const auto path = dir_ / "not-a-db";
    std::filesystem::create_directories(path);
    EXPECT_THROW(SqliteCheckpointStore store(path), CheckpointStoreError);
}

TEST_F(CheckpointStoreTest, TierClaimIsExclusiveUntilReleased) {
    SqliteCheckpointStore store(dir_ / "checkpoints.db");
    const auto lease = std::chrono::milliseconds(60000);

    EXPECT_TRUE(store.claim("standard", "first", lease));
    EXPECT_FALSE(store.claim("standard", "second", lease));
    EXPECT_TRUE(store.claim("standard", "first", lease));
    EXPECT_TRUE(store.claim("minimal", "second", lease));

    store.release("standard", "second");
    EXPECT_FALSE(store.claim("standard", "second", lease));

    store.release("standard", "first");
    EXPECT_TRUE(store.claim("standard", "second", lease));
}

TEST_F(CheckpointStoreTest, StaleClaimCanBeTakenOver) {
    const auto path = dir_ / "checkpoints.db";
    {
        SqliteCheckpointStore crashed(path);
        ASSERT_TRUE(crashed.claim("full", "crashed", std::chrono::milliseconds(60000)));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    SqliteCheckpointStore store(path);
    EXPECT_FALSE(store.claim("full", "next", std::chrono::milliseconds(60000)));
    EXPECT_TRUE(store.claim("full", "next", std::chrono::milliseconds(5)));
}
