#pragma once

#include "checkpoint_store.hpp"
#include "event_queue.hpp"
#include "manifest_resolver.hpp"
#include "quota_monitor.hpp"
#include "resource_cache.hpp"
#include "retry_controller.hpp"
#include "session.hpp"
#include "transfer_signal.hpp"

#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace packfetch {

struct OrchestratorConfig {
    std::chrono::milliseconds checkpoint_interval{5000};
    std::chrono::milliseconds quota_check_interval{30000};
    // A tier claimed by another orchestrator stays locked until that claim is this old.
    std::chrono::milliseconds owner_lease{15000};
    RetryPolicy retry;
};

struct QuotaStatus {
    bool warning{false};
    double percent{0.0};
    std::optional<QuotaEstimate> estimate;
};

// Drives one download session at a time through its state machine:
//
//   idle -> downloading -> {paused, completed, failed, cancelled}
//   paused -> downloading, failed -> downloading, any -> cancelled
//
// Component groups run in parallel, one worker thread each; resources inside a
// group run in manifest order. All session mutations happen under one mutex, and
// checkpoints are written under it too, so persisted progress never goes backwards.
class SessionOrchestrator {
public:
    SessionOrchestrator(const ManifestResolver& resolver,
                        CheckpointStore& store,
                        TransferExecutor& executor,
                        StorageQuotaMonitor& quota,
                        const ResourceCache& cache,
                        EventQueue& events,
                        OrchestratorConfig config = {});
    // Pauses an active download, which persists it, and waits for the workers.
    ~SessionOrchestrator();

    SessionOrchestrator(const SessionOrchestrator&) = delete;
    SessionOrchestrator& operator=(const SessionOrchestrator&) = delete;

    // Looks for interrupted sessions in the checkpoint store and offers each one
    // through a ResumeOffered event. Nothing is discarded.
    std::vector<DownloadSession> initialize();

    // Rehydrates the checkpoint for `tier` when there is one, otherwise begins a fresh
    // session. Throws InvalidTierError, ManifestError or SessionStateError, the latter
    // also when another process is downloading the tier.
    void start(const std::string& tier);
    bool pause();
    // Continues a paused or failed session, or the first offered checkpoint when no
    // session is loaded. Throws SessionStateError when there is nothing to resume.
    void resume();
    // Stops transfers, deletes the checkpoint and drops the session. Returns false
    // when there was nothing to cancel.
    bool cancel();
    // Deletes cached resource files along with the loaded or offered sessions.
    // Refused while downloading.
    std::uint64_t clearCache();

    void wait();
    [[nodiscard]] bool waitFor(std::chrono::milliseconds timeout);

    [[nodiscard]] SessionPhase phase() const;
    [[nodiscard]] std::optional<DownloadSession> snapshot() const;
    [[nodiscard]] std::optional<PackageManifest> manifest() const;
    [[nodiscard]] std::optional<double> overallPercent() const;
    [[nodiscard]] QuotaStatus checkQuotaWarning();
    // True while downloading with no checkpoint written in the last interval; the
    // caller should confirm before abandoning the process.
    [[nodiscard]] bool unloadGuardActive() const;

private:
    void startLocked(const std::string& tier);
    void claimLocked(const std::string& tier);
    void joinWorker();
    void launchLocked();
    void run(TransferSignalPtr signal);
    void renewClaim(const std::string& tier, TransferSignal& signal);
    void processGroup(ComponentGroup group, const TransferSignal& signal);
    void finish();

    void onChunk(const ResourceDescriptor& descriptor, std::uint64_t bytes, std::optional<std::uint64_t> total);
    void onRetry(const ResourceDescriptor& descriptor, int attempt, int max_attempts, const ErrorRecord& cause);

    DownloadSession buildSession(const PackageManifest& manifest, const std::optional<DownloadSession>& existing);
    // Returns the storage error when the checkpoint could not be written.
    std::optional<ErrorRecord> persistLocked();
    void checkQuotaLocked(bool force);
    [[nodiscard]] SessionEvent makeEventLocked(EventKind kind) const;
    void emitResourceLocked(const ResourceDescriptor& descriptor, EventKind kind);

    const ManifestResolver& resolver_;
    CheckpointStore& store_;
    StorageQuotaMonitor& quota_;
    const ResourceCache& cache_;
    EventQueue& events_;
    OrchestratorConfig config_;
    RetryController retry_;
    std::string owner_id_;

    std::mutex control_mutex_;
    std::thread worker_;

    mutable std::mutex mutex_;
    std::condition_variable run_done_;
    std::condition_variable groups_done_;
    bool running_{false};
    std::size_t active_groups_{0};
    bool claim_lost_{false};
    bool cancel_requested_{false};
    std::unique_ptr<DownloadSession> session_;
    std::optional<PackageManifest> manifest_;
    TransferSignalPtr signal_;
    SessionPhase last_phase_{SessionPhase::Idle};
    std::vector<DownloadSession> offers_;
    std::map<std::string, std::uint64_t> persisted_bytes_;
    Clock::time_point last_quota_check_{};
    std::optional<QuotaEstimate> last_quota_;
    bool quota_warned_{false};
};

} // namespace packfetch
