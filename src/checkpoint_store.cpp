#include "packfetch/checkpoint_store.hpp"

#include "packfetch/errors.hpp"

#include <memory>
#include <sstream>
#include <utility>

#include <spdlog/spdlog.h>
#include <sqlite3.h>

namespace packfetch {

namespace {

using Statement = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

std::int64_t toMillis(Clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

Clock::time_point fromMillis(std::int64_t millis) {
    return Clock::time_point{std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds{millis})};
}

std::string columnText(sqlite3_stmt* stmt, int column) {
    const auto* text = sqlite3_column_text(stmt, column);
    return text ? std::string{reinterpret_cast<const char*>(text)} : std::string{};
}

void bindText(sqlite3_stmt* stmt, int index, std::string_view value) {
    sqlite3_bind_text(stmt, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

std::string joinActions(const std::vector<RecoveryAction>& actions) {
    std::string joined;
    for (const auto action : actions) {
        if (!joined.empty()) {
            joined.push_back(',');
        }
        joined.append(toString(action));
    }
    return joined;
}

std::vector<RecoveryAction> splitActions(const std::string& joined) {
    std::vector<RecoveryAction> actions;
    std::istringstream in(joined);
    std::string name;
    while (std::getline(in, name, ',')) {
        for (auto action : {RecoveryAction::Retry, RecoveryAction::Cancel,
                            RecoveryAction::ClearCache, RecoveryAction::ReportMissing}) {
            if (toString(action) == name) {
                actions.push_back(action);
            }
        }
    }
    return actions;
}

std::optional<ErrorCategory> categoryFromString(const std::string& name) {
    for (auto category : {ErrorCategory::Network, ErrorCategory::Storage, ErrorCategory::Server,
                          ErrorCategory::NotFound, ErrorCategory::Permission}) {
        if (toString(category) == name) {
            return category;
        }
    }
    return std::nullopt;
}

} // namespace

SqliteCheckpointStore::SqliteCheckpointStore(const std::filesystem::path& db_path) {
    if (db_path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(db_path.parent_path(), ec);
    }
    if (sqlite3_open(db_path.string().c_str(), &db_) != SQLITE_OK) {
        std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw CheckpointStoreError("Cannot open checkpoint database " + db_path.string() + ": " + message);
    }
    sqlite3_busy_timeout(db_, 5000);
    try {
        ensureSchema();
    } catch (const CheckpointStoreError&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteCheckpointStore::~SqliteCheckpointStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void SqliteCheckpointStore::exec(const char* sql) {
    char* error = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "unknown error";
        sqlite3_free(error);
        throw CheckpointStoreError("SQLite error: " + message);
    }
}

void SqliteCheckpointStore::ensureSchema() {
    exec("CREATE TABLE IF NOT EXISTS sessions ("
         "  tier TEXT PRIMARY KEY,"
         "  session_id TEXT NOT NULL,"
         "  phase TEXT NOT NULL,"
         "  paused INTEGER NOT NULL DEFAULT 0,"
         "  started_at INTEGER NOT NULL,"
         "  updated_at INTEGER NOT NULL,"
         "  error_category TEXT,"
         "  error_message TEXT,"
         "  error_suggestion TEXT,"
         "  error_actions TEXT,"
         "  error_detail TEXT"
         ");");
    exec("CREATE TABLE IF NOT EXISTS resources ("
         "  tier TEXT NOT NULL,"
         "  resource_id TEXT NOT NULL,"
         "  bytes_transferred INTEGER NOT NULL,"
         "  bytes_expected INTEGER,"
         "  status TEXT NOT NULL,"
         "  restarted INTEGER NOT NULL DEFAULT 0,"
         "  PRIMARY KEY (tier, resource_id)"
         ");");
    exec("CREATE TABLE IF NOT EXISTS owners ("
         "  tier TEXT PRIMARY KEY,"
         "  owner TEXT NOT NULL,"
         "  heartbeat_at INTEGER NOT NULL"
         ");");
}

void SqliteCheckpointStore::save(const DownloadSession& session) {
    std::lock_guard<std::mutex> lock(mutex_);

    exec("BEGIN IMMEDIATE;");
    try {
        {
            sqlite3_stmt* raw = nullptr;
            if (sqlite3_prepare_v2(db_,
                    "INSERT INTO sessions (tier, session_id, phase, paused, started_at, updated_at,"
                    " error_category, error_message, error_suggestion, error_actions, error_detail)"
                    " VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)"
                    " ON CONFLICT(tier) DO UPDATE SET session_id = excluded.session_id,"
                    " phase = excluded.phase, paused = excluded.paused, started_at = excluded.started_at,"
                    " updated_at = excluded.updated_at, error_category = excluded.error_category,"
                    " error_message = excluded.error_message, error_suggestion = excluded.error_suggestion,"
                    " error_actions = excluded.error_actions, error_detail = excluded.error_detail;",
                    -1, &raw, nullptr) != SQLITE_OK) {
                throw CheckpointStoreError(std::string{"Cannot prepare session upsert: "} + sqlite3_errmsg(db_));
            }
            Statement stmt{raw, &sqlite3_finalize};

            bindText(raw, 1, session.tier);
            bindText(raw, 2, session.session_id);
            bindText(raw, 3, toString(session.phase));
            sqlite3_bind_int(raw, 4, session.paused ? 1 : 0);
            sqlite3_bind_int64(raw, 5, toMillis(session.started_at));
            sqlite3_bind_int64(raw, 6, toMillis(session.last_checkpoint_at));
            if (session.last_error) {
                const auto& error = *session.last_error;
                bindText(raw, 7, toString(error.category));
                bindText(raw, 8, error.message);
                bindText(raw, 9, error.recovery_suggestion);
                bindText(raw, 10, joinActions(error.recoverable_actions));
                bindText(raw, 11, error.raw_detail);
            } else {
                for (int i = 7; i <= 11; ++i) {
                    sqlite3_bind_null(raw, i);
                }
            }
            if (sqlite3_step(raw) != SQLITE_DONE) {
                throw CheckpointStoreError(std::string{"Cannot write session checkpoint: "} + sqlite3_errmsg(db_));
            }
        }

        deleteResources(session.tier);

        {
            sqlite3_stmt* raw = nullptr;
            if (sqlite3_prepare_v2(db_,
                    "INSERT INTO resources (tier, resource_id, bytes_transferred, bytes_expected,"
                    " status, restarted) VALUES (?, ?, ?, ?, ?, ?);",
                    -1, &raw, nullptr) != SQLITE_OK) {
                throw CheckpointStoreError(std::string{"Cannot prepare resource upsert: "} + sqlite3_errmsg(db_));
            }
            Statement stmt{raw, &sqlite3_finalize};

            for (const auto& [resource_id, progress] : session.resources) {
                sqlite3_reset(raw);
                sqlite3_clear_bindings(raw);
                bindText(raw, 1, session.tier);
                bindText(raw, 2, resource_id);
                sqlite3_bind_int64(raw, 3, static_cast<sqlite3_int64>(progress.bytes_transferred));
                if (progress.bytes_expected) {
                    sqlite3_bind_int64(raw, 4, static_cast<sqlite3_int64>(*progress.bytes_expected));
                } else {
                    sqlite3_bind_null(raw, 4);
                }
                bindText(raw, 5, toString(progress.status));
                sqlite3_bind_int(raw, 6, progress.restarted_from_zero ? 1 : 0);
                if (sqlite3_step(raw) != SQLITE_DONE) {
                    throw CheckpointStoreError(std::string{"Cannot write resource checkpoint: "} +
                                               sqlite3_errmsg(db_));
                }
            }
        }

        exec("COMMIT;");
    } catch (const CheckpointStoreError&) {
        sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        throw;
    }
}

std::optional<DownloadSession> SqliteCheckpointStore::load(const std::string& tier) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto sessions = query(tier);
    if (sessions.empty()) {
        return std::nullopt;
    }
    return std::move(sessions.front());
}

std::vector<DownloadSession> SqliteCheckpointStore::loadAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    return query(std::nullopt);
}

void SqliteCheckpointStore::remove(const std::string& tier) {
    std::lock_guard<std::mutex> lock(mutex_);

    exec("BEGIN IMMEDIATE;");
    try {
        deleteResources(tier);

        sqlite3_stmt* raw = nullptr;
        if (sqlite3_prepare_v2(db_, "DELETE FROM sessions WHERE tier = ?;", -1, &raw, nullptr) != SQLITE_OK) {
            throw CheckpointStoreError(std::string{"Cannot prepare checkpoint delete: "} + sqlite3_errmsg(db_));
        }
        Statement stmt{raw, &sqlite3_finalize};
        bindText(raw, 1, tier);
        if (sqlite3_step(raw) != SQLITE_DONE) {
            throw CheckpointStoreError(std::string{"Cannot delete checkpoint: "} + sqlite3_errmsg(db_));
        }

        exec("COMMIT;");
    } catch (const CheckpointStoreError&) {
        sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        throw;
    }
}

bool SqliteCheckpointStore::claim(const std::string& tier, const std::string& owner,
                                  std::chrono::milliseconds lease) {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_,
            "INSERT INTO owners (tier, owner, heartbeat_at) VALUES (?, ?, ?)"
            " ON CONFLICT(tier) DO UPDATE SET owner = excluded.owner, heartbeat_at = excluded.heartbeat_at"
            " WHERE owners.owner = excluded.owner OR owners.heartbeat_at < ?;",
            -1, &raw, nullptr) != SQLITE_OK) {
        throw CheckpointStoreError(std::string{"Cannot prepare owner claim: "} + sqlite3_errmsg(db_));
    }
    Statement stmt{raw, &sqlite3_finalize};

    const auto now = toMillis(Clock::now());
    bindText(raw, 1, tier);
    bindText(raw, 2, owner);
    sqlite3_bind_int64(raw, 3, now);
    sqlite3_bind_int64(raw, 4, now - lease.count());
    if (sqlite3_step(raw) != SQLITE_DONE) {
        throw CheckpointStoreError(std::string{"Cannot claim tier: "} + sqlite3_errmsg(db_));
    }
    return sqlite3_changes(db_) > 0;
}

void SqliteCheckpointStore::release(const std::string& tier, const std::string& owner) {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, "DELETE FROM owners WHERE tier = ? AND owner = ?;", -1, &raw, nullptr) !=
        SQLITE_OK) {
        throw CheckpointStoreError(std::string{"Cannot prepare owner release: "} + sqlite3_errmsg(db_));
    }
    Statement stmt{raw, &sqlite3_finalize};
    bindText(raw, 1, tier);
    bindText(raw, 2, owner);
    if (sqlite3_step(raw) != SQLITE_DONE) {
        throw CheckpointStoreError(std::string{"Cannot release tier: "} + sqlite3_errmsg(db_));
    }
}

void SqliteCheckpointStore::deleteResources(const std::string& tier) {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, "DELETE FROM resources WHERE tier = ?;", -1, &raw, nullptr) != SQLITE_OK) {
        throw CheckpointStoreError(std::string{"Cannot prepare resource delete: "} + sqlite3_errmsg(db_));
    }
    Statement stmt{raw, &sqlite3_finalize};
    bindText(raw, 1, tier);
    if (sqlite3_step(raw) != SQLITE_DONE) {
        throw CheckpointStoreError(std::string{"Cannot delete resource checkpoints: "} + sqlite3_errmsg(db_));
    }
}

std::vector<DownloadSession> SqliteCheckpointStore::query(const std::optional<std::string>& tier) {
    const char* sql = tier
        ? "SELECT tier, session_id, phase, paused, started_at, updated_at, error_category, error_message,"
          " error_suggestion, error_actions, error_detail FROM sessions WHERE tier = ?;"
        : "SELECT tier, session_id, phase, paused, started_at, updated_at, error_category, error_message,"
          " error_suggestion, error_actions, error_detail FROM sessions ORDER BY updated_at DESC;";

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &raw, nullptr) != SQLITE_OK) {
        throw CheckpointStoreError(std::string{"Cannot prepare checkpoint query: "} + sqlite3_errmsg(db_));
    }
    Statement stmt{raw, &sqlite3_finalize};
    if (tier) {
        bindText(raw, 1, *tier);
    }

    std::vector<DownloadSession> sessions;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(raw)) == SQLITE_ROW) {
        DownloadSession session;
        session.tier = columnText(raw, 0);
        session.session_id = columnText(raw, 1);

        const auto phase_name = columnText(raw, 2);
        const auto phase = sessionPhaseFromString(phase_name);
        if (!phase) {
            spdlog::warn("Skipping checkpoint for tier '{}' with unknown phase '{}'", session.tier, phase_name);
            continue;
        }
        session.phase = *phase;
        session.paused = sqlite3_column_int(raw, 3) != 0;
        session.started_at = fromMillis(sqlite3_column_int64(raw, 4));
        session.last_checkpoint_at = fromMillis(sqlite3_column_int64(raw, 5));

        if (sqlite3_column_type(raw, 6) != SQLITE_NULL) {
            ErrorRecord error;
            error.category = categoryFromString(columnText(raw, 6)).value_or(ErrorCategory::Network);
            error.message = columnText(raw, 7);
            error.recovery_suggestion = columnText(raw, 8);
            error.recoverable_actions = splitActions(columnText(raw, 9));
            error.raw_detail = columnText(raw, 10);
            session.last_error = std::move(error);
        }

        sessions.push_back(std::move(session));
    }
    if (rc != SQLITE_DONE) {
        throw CheckpointStoreError(std::string{"Cannot read checkpoints: "} + sqlite3_errmsg(db_));
    }

    for (auto& session : sessions) {
        loadResources(session);
    }
    return sessions;
}

void SqliteCheckpointStore::loadResources(DownloadSession& session) {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_,
            "SELECT resource_id, bytes_transferred, bytes_expected, status, restarted"
            " FROM resources WHERE tier = ?;",
            -1, &raw, nullptr) != SQLITE_OK) {
        throw CheckpointStoreError(std::string{"Cannot prepare resource query: "} + sqlite3_errmsg(db_));
    }
    Statement stmt{raw, &sqlite3_finalize};
    bindText(raw, 1, session.tier);

    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(raw)) == SQLITE_ROW) {
        ResourceProgress progress;
        progress.bytes_transferred = static_cast<std::uint64_t>(sqlite3_column_int64(raw, 1));
        if (sqlite3_column_type(raw, 2) != SQLITE_NULL) {
            progress.bytes_expected = static_cast<std::uint64_t>(sqlite3_column_int64(raw, 2));
        }
        progress.status = resourceStatusFromString(columnText(raw, 3)).value_or(ResourceStatus::Pending);
        progress.restarted_from_zero = sqlite3_column_int(raw, 4) != 0;
        session.resources.emplace(columnText(raw, 0), progress);
    }
    if (rc != SQLITE_DONE) {
        throw CheckpointStoreError(std::string{"Cannot read resource checkpoints: "} + sqlite3_errmsg(db_));
    }
}

} // namespace packfetch
