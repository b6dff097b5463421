#include "packfetch/session_orchestrator.hpp"

#include "packfetch/error_classifier.hpp"
#include "packfetch/errors.hpp"

#include <algorithm>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace packfetch {

SessionOrchestrator::SessionOrchestrator(const ManifestResolver& resolver,
                                         CheckpointStore& store,
                                         TransferExecutor& executor,
                                         StorageQuotaMonitor& quota,
                                         const ResourceCache& cache,
                                         EventQueue& events,
                                         OrchestratorConfig config)
    : resolver_(resolver),
      store_(store),
      quota_(quota),
      cache_(cache),
      events_(events),
      config_(config),
      retry_(executor, config.retry),
      owner_id_(newSessionId()) {}

SessionOrchestrator::~SessionOrchestrator() {
    pause();
    std::lock_guard<std::mutex> control(control_mutex_);
    joinWorker();
}

std::vector<DownloadSession> SessionOrchestrator::initialize() {
    auto sessions = store_.loadAll();

    std::lock_guard<std::mutex> lock(mutex_);
    offers_.clear();
    for (auto& session : sessions) {
        if (isTerminal(session.phase)) {
            continue;
        }
        if (session_ && session_->tier == session.tier) {
            continue;
        }

        SessionEvent event;
        event.kind = EventKind::ResumeOffered;
        event.tier = session.tier;
        event.phase = session.phase;
        event.error = session.last_error;
        try {
            const auto manifest = resolver_.resolve(session.tier);
            event.overall_percent = packfetch::overallPercent(session, manifest.total_expected_bytes);
        } catch (const ManifestError& ex) {
            spdlog::warn("Checkpoint for tier '{}' does not match a known package: {}", session.tier, ex.what());
        }
        event.message = fmt::format("Interrupted '{}' download found ({} of {} resources complete)", session.tier,
                                    session.countWithStatus(ResourceStatus::Complete), session.resources.size());
        spdlog::info(event.message);

        events_.push(std::move(event));
        offers_.push_back(std::move(session));
    }
    return offers_;
}

void SessionOrchestrator::start(const std::string& tier) {
    std::lock_guard<std::mutex> control(control_mutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session_ && session_->phase == SessionPhase::Downloading) {
            throw SessionStateError(fmt::format("A download of '{}' is already running", session_->tier));
        }
    }
    joinWorker();

    std::lock_guard<std::mutex> lock(mutex_);
    startLocked(tier);
}

bool SessionOrchestrator::pause() {
    std::lock_guard<std::mutex> control(control_mutex_);
    std::lock_guard<std::mutex> lock(mutex_);
    if (!session_ || session_->phase != SessionPhase::Downloading) {
        return false;
    }

    session_->paused = true;
    session_->phase = SessionPhase::Paused;
    last_phase_ = SessionPhase::Paused;
    signal_->requestPause();
    const auto failure = persistLocked();
    if (failure) {
        session_->last_error = failure;
    }

    auto event = makeEventLocked(EventKind::Paused);
    if (failure) {
        event.error = failure;
        event.message = fmt::format("Download paused, but its progress was not saved: {}", failure->raw_detail);
    } else {
        event.message = "Download paused";
    }
    events_.push(std::move(event));
    spdlog::info("Paused '{}' download", session_->tier);
    return true;
}

void SessionOrchestrator::resume() {
    std::lock_guard<std::mutex> control(control_mutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session_ && session_->phase == SessionPhase::Downloading) {
            return;
        }
    }
    joinWorker();

    std::lock_guard<std::mutex> lock(mutex_);
    if (!session_) {
        if (offers_.empty()) {
            throw SessionStateError("No interrupted download to resume");
        }
        startLocked(offers_.front().tier);
        return;
    }

    auto& session = *session_;
    if (session.phase != SessionPhase::Paused && session.phase != SessionPhase::Failed) {
        throw SessionStateError(fmt::format("Cannot resume a {} session", toString(session.phase)));
    }
    claimLocked(session.tier);

    session.paused = false;
    session.last_error.reset();
    for (auto& [id, progress] : session.resources) {
        if (progress.status == ResourceStatus::Failed) {
            progress.status = ResourceStatus::Pending;
        }
    }
    session.phase = SessionPhase::Downloading;
    last_phase_ = SessionPhase::Downloading;
    signal_ = std::make_shared<TransferSignal>();
    cancel_requested_ = false;
    claim_lost_ = false;

    persistLocked();
    spdlog::info("Resuming '{}' download at {:.1f}%", session.tier,
                 packfetch::overallPercent(session, manifest_->total_expected_bytes));
    events_.push(makeEventLocked(EventKind::Progress));
    launchLocked();
}

bool SessionOrchestrator::cancel() {
    std::lock_guard<std::mutex> control(control_mutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancel_requested_ = true;
        if (signal_) {
            signal_->requestCancel();
        }
    }
    joinWorker();

    std::lock_guard<std::mutex> lock(mutex_);
    cancel_requested_ = false;

    std::string tier;
    std::optional<PackageManifest> manifest = manifest_;
    std::map<std::string, ResourceProgress> progress;
    if (session_) {
        tier = session_->tier;
        progress = session_->resources;
    } else if (!offers_.empty()) {
        tier = offers_.front().tier;
        progress = offers_.front().resources;
        try {
            manifest = resolver_.resolve(tier);
        } catch (const ManifestError& ex) {
            spdlog::warn("Cannot resolve '{}' to remove partial files: {}", tier, ex.what());
        }
    } else {
        return false;
    }

    session_.reset();
    manifest_.reset();
    signal_.reset();
    persisted_bytes_.clear();
    last_phase_ = SessionPhase::Cancelled;
    offers_.erase(std::remove_if(offers_.begin(), offers_.end(),
                                 [&](const DownloadSession& offer) { return offer.tier == tier; }),
                  offers_.end());

    if (manifest) {
        for (const auto& descriptor : manifest->resources) {
            const auto it = progress.find(descriptor.id);
            if (it == progress.end() || it->second.status != ResourceStatus::Complete) {
                cache_.discardPartial(descriptor);
            }
        }
    }

    store_.remove(tier);

    SessionEvent event;
    event.kind = EventKind::Cancelled;
    event.tier = tier;
    event.phase = SessionPhase::Cancelled;
    event.message = "Download cancelled";
    events_.push(std::move(event));
    spdlog::info("Cancelled '{}' download", tier);
    return true;
}

std::uint64_t SessionOrchestrator::clearCache() {
    std::lock_guard<std::mutex> control(control_mutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session_ && session_->phase == SessionPhase::Downloading) {
            throw SessionStateError("Pause or cancel the download before clearing the cache");
        }
    }
    joinWorker();

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& offer : offers_) {
        store_.remove(offer.tier);
    }
    offers_.clear();
    if (session_) {
        store_.remove(session_->tier);
        session_.reset();
        manifest_.reset();
        persisted_bytes_.clear();
        last_phase_ = SessionPhase::Idle;
    }
    return cache_.clear();
}

void SessionOrchestrator::wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    run_done_.wait(lock, [this] { return !running_; });
}

bool SessionOrchestrator::waitFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return run_done_.wait_for(lock, timeout, [this] { return !running_; });
}

SessionPhase SessionOrchestrator::phase() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_ ? session_->phase : last_phase_;
}

std::optional<DownloadSession> SessionOrchestrator::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!session_) {
        return std::nullopt;
    }
    return *session_;
}

std::optional<PackageManifest> SessionOrchestrator::manifest() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return manifest_;
}

std::optional<double> SessionOrchestrator::overallPercent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!session_ || !manifest_) {
        return std::nullopt;
    }
    return packfetch::overallPercent(*session_, manifest_->total_expected_bytes);
}

QuotaStatus SessionOrchestrator::checkQuotaWarning() {
    std::lock_guard<std::mutex> lock(mutex_);
    checkQuotaLocked(true);

    QuotaStatus status;
    if (last_quota_) {
        status.estimate = last_quota_;
        status.percent = last_quota_->usageRatio() * 100.0;
        status.warning = quota_.aboveHighWater(*last_quota_);
    }
    return status;
}

bool SessionOrchestrator::unloadGuardActive() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_ && session_->phase == SessionPhase::Downloading &&
           Clock::now() - session_->last_checkpoint_at >= config_.checkpoint_interval;
}

void SessionOrchestrator::startLocked(const std::string& tier) {
    auto manifest = resolver_.resolve(tier);

    auto existing = store_.load(tier);
    if (existing && isTerminal(existing->phase)) {
        existing.reset();
    }
    claimLocked(tier);

    auto session = buildSession(manifest, existing);
    session.phase = SessionPhase::Downloading;
    session.paused = false;
    session.last_error.reset();
    for (auto& [id, progress] : session.resources) {
        if (progress.status == ResourceStatus::Failed) {
            progress.status = ResourceStatus::Pending;
        }
    }

    persisted_bytes_.clear();
    if (existing) {
        for (const auto& [id, progress] : existing->resources) {
            persisted_bytes_[id] = progress.bytes_transferred;
        }
    }

    session_ = std::make_unique<DownloadSession>(std::move(session));
    manifest_ = std::move(manifest);
    signal_ = std::make_shared<TransferSignal>();
    cancel_requested_ = false;
    claim_lost_ = false;
    quota_warned_ = false;
    last_phase_ = SessionPhase::Downloading;
    offers_.erase(std::remove_if(offers_.begin(), offers_.end(),
                                 [&](const DownloadSession& offer) { return offer.tier == tier; }),
                  offers_.end());

    const auto accounted = session_->accountedBytes();
    if (existing) {
        spdlog::info("Resuming '{}' session {} at {:.1f}%", tier, session_->session_id,
                     packfetch::overallPercent(*session_, manifest_->total_expected_bytes));
    } else {
        spdlog::info("Starting '{}' session {} ({} resources, {} bytes)", tier, session_->session_id,
                     manifest_->resources.size(), manifest_->total_expected_bytes);
    }

    checkQuotaLocked(true);
    const auto remaining = manifest_->total_expected_bytes - std::min(accounted, manifest_->total_expected_bytes);
    if (last_quota_ && !quota_.fits(*last_quota_, remaining)) {
        auto event = makeEventLocked(EventKind::QuotaWarning);
        event.quota = last_quota_;
        event.message = fmt::format("Package needs {} more bytes but only {} are available", remaining,
                                    last_quota_->available_bytes);
        spdlog::warn(event.message);
        events_.push(std::move(event));
    }

    persistLocked();
    events_.push(makeEventLocked(EventKind::Progress));
    launchLocked();
}

void SessionOrchestrator::claimLocked(const std::string& tier) {
    if (!store_.claim(tier, owner_id_, config_.owner_lease)) {
        throw SessionStateError(fmt::format("'{}' is already being downloaded by another process", tier));
    }
}

void SessionOrchestrator::joinWorker() {
    if (worker_.joinable()) {
        worker_.join();
    }
}

void SessionOrchestrator::launchLocked() {
    running_ = true;
    worker_ = std::thread(&SessionOrchestrator::run, this, signal_);
}

void SessionOrchestrator::run(TransferSignalPtr signal) {
    std::vector<ComponentGroup> groups;
    std::string tier;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        groups = manifest_->componentGroups();
        tier = session_->tier;
        active_groups_ = groups.size();
    }

    std::vector<std::thread> workers;
    workers.reserve(groups.size());
    for (const auto group : groups) {
        workers.emplace_back([this, group, signal] {
            processGroup(group, *signal);
            std::lock_guard<std::mutex> lock(mutex_);
            --active_groups_;
            groups_done_.notify_all();
        });
    }
    renewClaim(tier, *signal);
    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    finish();

    try {
        store_.release(tier, owner_id_);
    } catch (const CheckpointStoreError& ex) {
        spdlog::warn("Failed to release '{}': {}", tier, ex.what());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    run_done_.notify_all();
}

void SessionOrchestrator::renewClaim(const std::string& tier, TransferSignal& signal) {
    const auto every = std::max(config_.owner_lease / 3, std::chrono::milliseconds(1));

    std::unique_lock<std::mutex> lock(mutex_);
    while (!groups_done_.wait_for(lock, every, [this] { return active_groups_ == 0; })) {
        if (claim_lost_) {
            continue;
        }
        try {
            if (!store_.claim(tier, owner_id_, config_.owner_lease)) {
                spdlog::error("Another process took over '{}', stopping transfers", tier);
                claim_lost_ = true;
                signal.requestPause();
            }
        } catch (const CheckpointStoreError& ex) {
            spdlog::warn("Failed to renew claim on '{}': {}", tier, ex.what());
        }
    }
}

void SessionOrchestrator::processGroup(ComponentGroup group, const TransferSignal& signal) {
    std::vector<ResourceDescriptor> descriptors;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& descriptor : manifest_->resources) {
            if (descriptor.component_group == group) {
                descriptors.push_back(descriptor);
            }
        }
    }

    for (const auto& descriptor : descriptors) {
        if (signal.stopRequested()) {
            return;
        }

        std::uint64_t offset = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (cancel_requested_) {
                return;
            }
            auto& progress = session_->resources[descriptor.id];
            if (progress.status == ResourceStatus::Complete) {
                continue;
            }
            if (!descriptor.supports_resume && progress.bytes_transferred > 0) {
                spdlog::info("{} cannot be resumed, restarting from byte 0", descriptor.id);
                progress.bytes_transferred = 0;
                progress.restarted_from_zero = true;
            }
            offset = progress.bytes_transferred;
            progress.status = ResourceStatus::InProgress;
            emitResourceLocked(descriptor, EventKind::ResourceStatus);
        }

        AttemptOutcome outcome;
        try {
            outcome = retry_.attempt(
                descriptor, offset,
                [this, &descriptor](std::uint64_t bytes, std::optional<std::uint64_t> total) {
                    onChunk(descriptor, bytes, total);
                },
                [this, &descriptor](int attempt, int max_attempts, const ErrorRecord& cause) {
                    onRetry(descriptor, attempt, max_attempts, cause);
                },
                signal);
        } catch (const std::exception& ex) {
            outcome.kind = AttemptOutcome::Kind::Failed;
            outcome.error = classify(RawError{FailureKind::Unknown, 0, 0, ex.what()});
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (cancel_requested_) {
            return;
        }
        auto& progress = session_->resources[descriptor.id];
        switch (outcome.kind) {
            case AttemptOutcome::Kind::Completed:
                progress.status = ResourceStatus::Complete;
                progress.bytes_transferred = descriptor.expected_bytes
                    ? std::min(outcome.result.total_bytes, *descriptor.expected_bytes)
                    : outcome.result.total_bytes;
                progress.restarted_from_zero = progress.restarted_from_zero || outcome.result.restarted_from_zero;
                spdlog::info("{} complete ({} bytes)", descriptor.id, outcome.result.total_bytes);
                persistLocked();
                emitResourceLocked(descriptor, EventKind::ResourceStatus);
                break;
            case AttemptOutcome::Kind::Interrupted:
                if (descriptor.supports_resume) {
                    progress.bytes_transferred = descriptor.expected_bytes
                        ? std::min(outcome.bytes_so_far, *descriptor.expected_bytes)
                        : outcome.bytes_so_far;
                }
                return;
            case AttemptOutcome::Kind::Failed:
                progress.status = ResourceStatus::Failed;
                session_->last_error = outcome.error;
                spdlog::error("{} failed after {} attempt(s): {}", descriptor.id, outcome.attempts,
                              outcome.error ? outcome.error->message : "unknown error");
                emitResourceLocked(descriptor, EventKind::ResourceStatus);
                return;
        }
    }
}

void SessionOrchestrator::finish() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancel_requested_ || !session_) {
        return;
    }

    auto& session = *session_;
    if (session.paused) {
        if (auto failure = persistLocked()) {
            session.last_error = failure;
        }
        return;
    }
    if (claim_lost_) {
        session.phase = SessionPhase::Paused;
        session.paused = true;
        last_phase_ = SessionPhase::Paused;
        auto event = makeEventLocked(EventKind::Paused);
        event.message = "Download stopped because another process took it over";
        events_.push(std::move(event));
        return;
    }

    if (session.countWithStatus(ResourceStatus::Failed) > 0) {
        session.phase = SessionPhase::Failed;
        last_phase_ = SessionPhase::Failed;
        if (!session.last_error) {
            session.last_error = classify(RawError{});
        }
        spdlog::error("Download of '{}' failed: {} ({})", session.tier, session.last_error->message,
                      toString(session.last_error->category));
        if (auto failure = persistLocked()) {
            session.last_error = failure;
        }

        auto event = makeEventLocked(EventKind::Failed);
        event.error = session.last_error;
        event.message = session.last_error->message;
        events_.push(std::move(event));
        return;
    }

    if (session.allComplete()) {
        session.phase = SessionPhase::Completed;
        last_phase_ = SessionPhase::Completed;
        try {
            store_.remove(session.tier);
        } catch (const CheckpointStoreError& ex) {
            spdlog::error("Failed to delete checkpoint for '{}': {}", session.tier, ex.what());
        }
        persisted_bytes_.clear();

        auto event = makeEventLocked(EventKind::Completed);
        event.message = "All offline resources downloaded";
        events_.push(std::move(event));
        spdlog::info("Download of '{}' complete", session.tier);
        return;
    }

    session.phase = SessionPhase::Paused;
    session.paused = true;
    last_phase_ = SessionPhase::Paused;
    persistLocked();
    events_.push(makeEventLocked(EventKind::Paused));
}

void SessionOrchestrator::onChunk(const ResourceDescriptor& descriptor,
                                  std::uint64_t bytes,
                                  std::optional<std::uint64_t> total) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancel_requested_ || !session_) {
        return;
    }

    auto& progress = session_->resources[descriptor.id];
    progress.bytes_transferred = descriptor.expected_bytes ? std::min(bytes, *descriptor.expected_bytes) : bytes;

    auto event = makeEventLocked(EventKind::Progress);
    event.component_group = descriptor.component_group;
    event.resource_id = descriptor.id;
    event.resource_status = progress.status;
    event.bytes_transferred = progress.bytes_transferred;
    event.bytes_expected = descriptor.expected_bytes ? descriptor.expected_bytes : total;
    event.restarted_from_zero = progress.restarted_from_zero;
    events_.push(std::move(event));

    if (Clock::now() - session_->last_checkpoint_at >= config_.checkpoint_interval) {
        persistLocked();
    }
    checkQuotaLocked(false);
}

void SessionOrchestrator::onRetry(const ResourceDescriptor& descriptor,
                                  int attempt,
                                  int max_attempts,
                                  const ErrorRecord& cause) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancel_requested_ || !session_) {
        return;
    }

    auto event = makeEventLocked(EventKind::Retrying);
    event.component_group = descriptor.component_group;
    event.resource_id = descriptor.id;
    event.resource_status = ResourceStatus::InProgress;
    event.bytes_transferred = session_->resources[descriptor.id].bytes_transferred;
    event.bytes_expected = descriptor.expected_bytes;
    event.attempt = attempt;
    event.max_attempts = max_attempts;
    event.error = cause;
    event.message = fmt::format("retrying (attempt {}/{})", attempt, max_attempts);
    spdlog::info("{}: {} after {}", descriptor.id, event.message, cause.message);
    events_.push(std::move(event));
}

DownloadSession SessionOrchestrator::buildSession(const PackageManifest& manifest,
                                                  const std::optional<DownloadSession>& existing) {
    DownloadSession session;
    session.tier = manifest.tier;
    if (existing) {
        session.session_id = existing->session_id;
        session.started_at = existing->started_at;
        session.last_checkpoint_at = existing->last_checkpoint_at;
    } else {
        session.session_id = newSessionId();
        session.started_at = Clock::now();
    }

    for (const auto& descriptor : manifest.resources) {
        ResourceProgress progress;
        progress.bytes_expected = descriptor.expected_bytes;

        if (existing) {
            const auto it = existing->resources.find(descriptor.id);
            if (it != existing->resources.end() && it->second.bytes_expected == descriptor.expected_bytes) {
                progress = it->second;
                if (progress.bytes_expected) {
                    progress.bytes_transferred = std::min(progress.bytes_transferred, *progress.bytes_expected);
                }
            }
        }

        if (progress.status != ResourceStatus::Complete && cache_.isCached(descriptor)) {
            spdlog::info("{} already cached", descriptor.id);
            progress.status = ResourceStatus::Complete;
            progress.bytes_transferred = descriptor.expected_bytes.value_or(progress.bytes_transferred);
        }
        session.resources[descriptor.id] = progress;
    }
    return session;
}

std::optional<ErrorRecord> SessionOrchestrator::persistLocked() {
    if (!session_ || claim_lost_) {
        return std::nullopt;
    }

    const auto now = Clock::now();
    DownloadSession checkpoint = *session_;
    checkpoint.last_checkpoint_at = now;
    for (auto& [id, progress] : checkpoint.resources) {
        const auto it = persisted_bytes_.find(id);
        if (it != persisted_bytes_.end() && progress.bytes_transferred < it->second) {
            progress.bytes_transferred = it->second;
        }
    }

    try {
        store_.save(checkpoint);
    } catch (const CheckpointStoreError& ex) {
        spdlog::error("Failed to persist checkpoint for '{}': {}", checkpoint.tier, ex.what());
        auto record = classify(RawError{FailureKind::StorageWrite, 0, 0, ex.what()});
        record.message = "Download progress could not be saved";
        return record;
    }

    session_->last_checkpoint_at = now;
    for (const auto& [id, progress] : checkpoint.resources) {
        persisted_bytes_[id] = progress.bytes_transferred;
    }
    return std::nullopt;
}

void SessionOrchestrator::checkQuotaLocked(bool force) {
    const auto now = Clock::now();
    if (!force && now - last_quota_check_ < config_.quota_check_interval) {
        return;
    }
    last_quota_check_ = now;

    QuotaEstimate estimate;
    try {
        estimate = quota_.checkQuota();
    } catch (const std::exception& ex) {
        spdlog::warn("Storage quota check failed: {}", ex.what());
        return;
    }
    last_quota_ = estimate;

    if (!quota_.aboveHighWater(estimate)) {
        quota_warned_ = false;
        return;
    }
    if (quota_warned_) {
        return;
    }
    quota_warned_ = true;

    auto event = makeEventLocked(EventKind::QuotaWarning);
    event.quota = estimate;
    event.message = fmt::format("Storage is {:.0f}% full ({} of {} bytes used)", estimate.usageRatio() * 100.0,
                                estimate.used_bytes, estimate.quota_bytes);
    spdlog::warn(event.message);
    events_.push(std::move(event));
}

SessionEvent SessionOrchestrator::makeEventLocked(EventKind kind) const {
    SessionEvent event;
    event.kind = kind;
    if (session_) {
        event.tier = session_->tier;
        event.phase = session_->phase;
        if (manifest_) {
            event.overall_percent = packfetch::overallPercent(*session_, manifest_->total_expected_bytes);
        }
    } else {
        event.phase = last_phase_;
    }
    return event;
}

void SessionOrchestrator::emitResourceLocked(const ResourceDescriptor& descriptor, EventKind kind) {
    const auto& progress = session_->resources[descriptor.id];

    auto event = makeEventLocked(kind);
    event.component_group = descriptor.component_group;
    event.resource_id = descriptor.id;
    event.resource_status = progress.status;
    event.bytes_transferred = progress.bytes_transferred;
    event.bytes_expected = descriptor.expected_bytes;
    event.restarted_from_zero = progress.restarted_from_zero;
    if (progress.status == ResourceStatus::Failed) {
        event.error = session_->last_error;
    }
    events_.push(std::move(event));
}

} // namespace packfetch
