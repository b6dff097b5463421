#include "packfetch/checkpoint_store.hpp"
#include "packfetch/curl_transfer_executor.hpp"
#include "packfetch/detail/curl_utils.hpp"
#include "packfetch/errors.hpp"
#include "packfetch/event_queue.hpp"
#include "packfetch/manifest_resolver.hpp"
#include "packfetch/progress_panel.hpp"
#include "packfetch/quota_monitor.hpp"
#include "packfetch/resource_cache.hpp"
#include "packfetch/session_orchestrator.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace {

std::atomic<int> interrupt_count{0};

void onInterrupt(int) {
    interrupt_count.fetch_add(1);
}

struct Options {
    std::filesystem::path cache_dir{"packfetch-cache"};
    std::filesystem::path checkpoint_db{"packfetch-checkpoints.db"};
    std::string manifest_source;
    std::string origin{"https://example.com"};
    std::optional<std::uint64_t> quota_cap;
    int max_attempts{3};
    std::chrono::milliseconds base_delay{2000};
    std::string log_file;
    bool verbose{false};
    std::string command;
    std::string tier;
};

void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName << " [options] <command> [tier]" << std::endl;
    std::cerr << "Commands:\n"
              << "  tiers              List package tiers and what is cached\n"
              << "  download <tier>    Download (or continue) an offline package\n"
              << "  resume             Continue the interrupted download\n"
              << "  status             Show interrupted downloads\n"
              << "  cancel             Cancel the interrupted download and delete its checkpoint\n"
              << "  clear-cache        Delete cached resources\n"
              << "  quota              Show storage usage\n"
              << "Options:\n"
              << "  -c <dir>         Cache directory (default: ./packfetch-cache, env PACKFETCH_CACHE_DIR)\n"
              << "  -s <file>        Checkpoint database (default: ./packfetch-checkpoints.db)\n"
              << "  -m <src>         Manifest catalog: JSON file or http(s) URL (default: built-in)\n"
              << "  -o <url>         Origin URL for the built-in catalog\n"
              << "  -q <bytes>       Storage quota cap (default: filesystem capacity)\n"
              << "  -r <n>           Max attempts per resource (default: 3)\n"
              << "  -w <ms>          Base retry delay in milliseconds (default: 2000)\n"
              << "  -l <file>        Also write logs to a file\n"
              << "  -v               Verbose logging\n"
              << "  -h, --help       Show this message" << std::endl;
}

std::uint64_t parseNumber(const std::string& text, const std::string& what) {
    try {
        std::size_t consumed = 0;
        const auto value = std::stoull(text, &consumed);
        if (consumed != text.size()) {
            throw std::invalid_argument(text);
        }
        return value;
    } catch (const std::logic_error&) {
        throw std::runtime_error("Invalid " + what + ": " + text);
    }
}

void setupLogging(const Options& options) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!options.log_file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.log_file));
    }
    auto logger = std::make_shared<spdlog::logger>("packfetch", sinks.begin(), sinks.end());
    logger->set_level(options.verbose ? spdlog::level::debug : spdlog::level::info);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(std::move(logger));
}

packfetch::ManifestResolver loadResolver(const Options& options) {
    const auto& source = options.manifest_source;
    if (source.empty()) {
        return packfetch::ManifestResolver::builtin(options.origin);
    }
    if (source.rfind("http://", 0) == 0 || source.rfind("https://", 0) == 0 || source.rfind("file://", 0) == 0) {
        spdlog::debug("Fetching manifest catalog from {}", source);
        return packfetch::ManifestResolver::fromJson(
            packfetch::detail::httpGetText(source, std::chrono::seconds(30)));
    }
    return packfetch::ManifestResolver::fromFile(source);
}

// Drains events into the panel until the session run ends. The first Ctrl-C pauses
// right away when progress is checkpointed; otherwise it only warns and a second
// Ctrl-C pauses.
void followSession(packfetch::SessionOrchestrator& orchestrator, packfetch::EventQueue& events) {
    const auto manifest = orchestrator.manifest();
    if (!manifest) {
        return;
    }

    packfetch::ProgressPanel panel(*manifest);
    int handled_interrupts = 0;
    bool pause_requested = false;
    while (true) {
        while (auto event = events.pop(std::chrono::milliseconds(200))) {
            panel.apply(*event);
            if (events.size() == 0) {
                break;
            }
        }
        panel.redraw(std::cout);

        const int interrupts = interrupt_count.load();
        if (interrupts > handled_interrupts && !pause_requested) {
            handled_interrupts = interrupts;
            if (interrupts == 1 && orchestrator.unloadGuardActive()) {
                spdlog::warn("Progress since the last checkpoint is not saved yet. "
                             "Press Ctrl-C again to pause and exit.");
            } else {
                pause_requested = true;
                orchestrator.pause();
            }
        }

        if (orchestrator.waitFor(std::chrono::milliseconds(0)) && events.size() == 0) {
            break;
        }
    }

    while (auto event = events.tryPop()) {
        panel.apply(*event);
    }
    panel.redraw(std::cout);

    switch (panel.phase()) {
        case packfetch::SessionPhase::Completed:
            std::cout << "Offline package ready." << std::endl;
            break;
        case packfetch::SessionPhase::Paused: {
            const auto session = orchestrator.snapshot();
            if (session && session->last_error && session->last_error->category == packfetch::ErrorCategory::Storage) {
                std::cout << fmt::format("Download paused, but progress was not saved: {}\n{}",
                                         session->last_error->raw_detail,
                                         session->last_error->recovery_suggestion)
                          << std::endl;
            } else {
                std::cout << "Download paused. Run 'packfetch resume' to continue." << std::endl;
            }
            break;
        }
        case packfetch::SessionPhase::Failed: {
            const auto session = orchestrator.snapshot();
            if (session && session->last_error) {
                std::cout << fmt::format("Download failed: {}\n{}", session->last_error->message,
                                         session->last_error->recovery_suggestion)
                          << std::endl;
            }
            break;
        }
        default:
            break;
    }
}

void printTiers(const packfetch::ManifestResolver& resolver, const packfetch::ResourceCache& cache) {
    for (const auto& tier : resolver.tiers()) {
        const auto manifest = resolver.resolve(tier);
        const auto info = cache.inspect(manifest);
        std::cout << fmt::format("{:<10} {:>2} resources  {:>10}  cached {}/{}{}", tier, manifest.resources.size(),
                                 packfetch::ProgressPanel::formatSize(manifest.total_expected_bytes),
                                 info.cached_resources, info.total_resources,
                                 info.complete() ? "  (ready offline)" : "")
                  << std::endl;
    }
}

void printStatus(const std::vector<packfetch::DownloadSession>& sessions,
                 const packfetch::ManifestResolver& resolver) {
    if (sessions.empty()) {
        std::cout << "No interrupted downloads." << std::endl;
        return;
    }
    for (const auto& session : sessions) {
        std::string percent = "N/A";
        try {
            const auto manifest = resolver.resolve(session.tier);
            percent = fmt::format("{:.1f}%", packfetch::overallPercent(session, manifest.total_expected_bytes));
        } catch (const packfetch::ManifestError& ex) {
            spdlog::warn("{}", ex.what());
        }
        std::cout << fmt::format("{} ({}): {} at {}, {}/{} resources complete", session.tier, session.session_id,
                                 packfetch::toString(session.phase), percent,
                                 session.countWithStatus(packfetch::ResourceStatus::Complete),
                                 session.resources.size())
                  << std::endl;
        for (const auto& [id, progress] : session.resources) {
            std::cout << fmt::format("  {:<20} {:<11} {}", id, packfetch::toString(progress.status),
                                     packfetch::ProgressPanel::formatSize(progress.bytes_transferred))
                      << std::endl;
        }
        if (session.last_error) {
            std::cout << fmt::format("  last error: {} ({})", session.last_error->message,
                                     packfetch::toString(session.last_error->category))
                      << std::endl;
        }
    }
}

} // namespace

int main(int argc, char** argv) {
    try {
        Options options;
        if (const char* env_cache = std::getenv("PACKFETCH_CACHE_DIR")) {
            options.cache_dir = env_cache;
        }

        int arg_index = 1;
        while (arg_index < argc && argv[arg_index][0] == '-') {
            const std::string option = argv[arg_index];

            if (option == "-h" || option == "--help") {
                printUsage(argv[0]);
                return 0;
            }
            if (option == "-v") {
                options.verbose = true;
                ++arg_index;
                continue;
            }
            if (arg_index + 1 >= argc) {
                printUsage(argv[0]);
                return 1;
            }

            const std::string value = argv[arg_index + 1];
            if (option == "-c") {
                options.cache_dir = value;
            } else if (option == "-s") {
                options.checkpoint_db = value;
            } else if (option == "-m") {
                options.manifest_source = value;
            } else if (option == "-o") {
                options.origin = value;
            } else if (option == "-q") {
                options.quota_cap = parseNumber(value, "quota");
            } else if (option == "-r") {
                const auto attempts = parseNumber(value, "attempt count");
                if (attempts == 0 || attempts > 20) {
                    throw std::runtime_error("Attempt count must be between 1 and 20.");
                }
                options.max_attempts = static_cast<int>(attempts);
            } else if (option == "-w") {
                options.base_delay = std::chrono::milliseconds(parseNumber(value, "retry delay"));
            } else if (option == "-l") {
                options.log_file = value;
            } else {
                printUsage(argv[0]);
                return 1;
            }
            arg_index += 2;
        }

        if (arg_index >= argc) {
            printUsage(argv[0]);
            return 1;
        }
        options.command = argv[arg_index++];
        if (options.command == "download") {
            if (arg_index >= argc) {
                printUsage(argv[0]);
                return 1;
            }
            options.tier = argv[arg_index++];
        }
        if (arg_index != argc) {
            printUsage(argv[0]);
            return 1;
        }

        setupLogging(options);
        packfetch::detail::ensureCurlInitialized();

        const auto resolver = loadResolver(options);
        packfetch::ResourceCache cache(options.cache_dir);

        if (options.command == "tiers") {
            printTiers(resolver, cache);
            return 0;
        }

        packfetch::FilesystemQuotaSource quota_source(cache, options.quota_cap);
        packfetch::StorageQuotaMonitor quota(quota_source);

        if (options.command == "quota") {
            const auto estimate = quota.checkQuota();
            std::cout << fmt::format("Used {} of {} ({:.1f}%), {} available{}",
                                     packfetch::ProgressPanel::formatSize(estimate.used_bytes),
                                     packfetch::ProgressPanel::formatSize(estimate.quota_bytes),
                                     estimate.usageRatio() * 100.0,
                                     packfetch::ProgressPanel::formatSize(estimate.available_bytes),
                                     quota.aboveHighWater(estimate) ? "  - storage almost full" : "")
                      << std::endl;
            return 0;
        }

        packfetch::SqliteCheckpointStore store(options.checkpoint_db);
        packfetch::CurlTransferExecutor executor(cache);
        packfetch::EventQueue events;

        packfetch::OrchestratorConfig config;
        config.retry.max_attempts = options.max_attempts;
        config.retry.base_delay = options.base_delay;
        packfetch::SessionOrchestrator orchestrator(resolver, store, executor, quota, cache, events, config);

        const auto offers = orchestrator.initialize();

        if (options.command == "status") {
            printStatus(offers, resolver);
        } else if (options.command == "cancel") {
            if (orchestrator.cancel()) {
                std::cout << "Download cancelled; checkpoint and partial files removed." << std::endl;
            } else {
                std::cout << "Nothing to cancel." << std::endl;
            }
        } else if (options.command == "clear-cache") {
            const auto freed = orchestrator.clearCache();
            std::cout << fmt::format("Cleared {} from {}", packfetch::ProgressPanel::formatSize(freed),
                                     cache.root().string())
                      << std::endl;
        } else if (options.command == "download" || options.command == "resume") {
            std::signal(SIGINT, onInterrupt);
            if (options.command == "download") {
                orchestrator.start(options.tier);
            } else {
                orchestrator.resume();
            }
            followSession(orchestrator, events);
            orchestrator.wait();
            return orchestrator.phase() == packfetch::SessionPhase::Failed ? 2 : 0;
        } else {
            printUsage(argv[0]);
            return 1;
        }
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}
