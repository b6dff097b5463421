#pragma once

#include "session.hpp"

#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct sqlite3;

namespace packfetch {

// Durable snapshots of download sessions, one per tier. Implementations copy what
// they are given; they never keep a reference to a live session.
class CheckpointStore {
public:
    virtual ~CheckpointStore() = default;

    virtual void save(const DownloadSession& session) = 0;
    [[nodiscard]] virtual std::optional<DownloadSession> load(const std::string& tier) = 0;
    [[nodiscard]] virtual std::vector<DownloadSession> loadAll() = 0;
    virtual void remove(const std::string& tier) = 0;

    // Records `owner` as the one downloading `tier`. Refused while a different owner
    // refreshed its claim within `lease`; claiming again refreshes the claim.
    [[nodiscard]] virtual bool claim(const std::string& tier, const std::string& owner,
                                     std::chrono::milliseconds lease) = 0;
    virtual void release(const std::string& tier, const std::string& owner) = 0;
};

class SqliteCheckpointStore final : public CheckpointStore {
public:
    explicit SqliteCheckpointStore(const std::filesystem::path& db_path);
    ~SqliteCheckpointStore() override;

    SqliteCheckpointStore(const SqliteCheckpointStore&) = delete;
    SqliteCheckpointStore& operator=(const SqliteCheckpointStore&) = delete;

    void save(const DownloadSession& session) override;
    [[nodiscard]] std::optional<DownloadSession> load(const std::string& tier) override;
    [[nodiscard]] std::vector<DownloadSession> loadAll() override;
    void remove(const std::string& tier) override;
    [[nodiscard]] bool claim(const std::string& tier, const std::string& owner,
                             std::chrono::milliseconds lease) override;
    void release(const std::string& tier, const std::string& owner) override;

private:
    void exec(const char* sql);
    void ensureSchema();
    [[nodiscard]] std::vector<DownloadSession> query(const std::optional<std::string>& tier);
    void loadResources(DownloadSession& session);
    void deleteResources(const std::string& tier);

    sqlite3* db_{};
    std::mutex mutex_;
};

} // namespace packfetch
