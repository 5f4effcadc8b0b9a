/**
 * @file components.hpp
 * @brief Event-driven observers of a session
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * StatsComponent stats(bus);
 * orchestrator.run(config, "docs", SyncMode::Push);
 * stats.print_summary();
 */

#pragma once

#include "mist/events/event_bus.hpp"
#include "mist/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace mist::events {

/**
 * @brief Logs every session event through spdlog
 *
 * Per-file events go to debug, lifecycle events to info, anything that
 * went wrong to warn/error.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<SessionStartedEvent>([](const SessionStartedEvent& e) {
            spdlog::info("[{}] {} started (staging {})", e.profile, e.mode, e.staging_path.string());
        });

        bus_.subscribe<StageChangedEvent>([](const StageChangedEvent& e) {
            spdlog::debug("[{}] {} -> {}", e.profile, e.from, e.to);
        });

        bus_.subscribe<ArtifactEncryptedEvent>([](const ArtifactEncryptedEvent& e) {
            spdlog::debug("[Encrypted] path={} bytes={}{}", e.relative_path, e.bytes, e.reused ? " (unchanged)" : "");
        });

        bus_.subscribe<ArtifactDecryptedEvent>([](const ArtifactDecryptedEvent& e) {
            spdlog::debug("[Decrypted] path={} bytes={}", e.relative_path, e.bytes);
        });

        bus_.subscribe<LocalFileInstalledEvent>([](const LocalFileInstalledEvent& e) {
            spdlog::debug("[Installed] path={}", e.relative_path);
        });

        bus_.subscribe<LocalFileRemovedEvent>([](const LocalFileRemovedEvent& e) {
            spdlog::info("[Removed] path={} (deleted on remote)", e.relative_path);
        });

        bus_.subscribe<TransportCompletedEvent>([](const TransportCompletedEvent& e) {
            spdlog::info("[{}] {} -> {} ({} changed, {}ms)",
                         e.operation, e.source, e.destination, e.changed_files, e.duration.count());
        });

        bus_.subscribe<StagingCleanupFailedEvent>([](const StagingCleanupFailedEvent& e) {
            spdlog::warn("Staging directory {} could not be removed: {}", e.path.string(), e.reason);
        });

        bus_.subscribe<SessionFinishedEvent>([](const SessionFinishedEvent& e) {
            if (e.succeeded) {
                spdlog::info("[{}] {} done in {}ms", e.profile, e.mode, e.duration.count());
            } else {
                spdlog::error("[{}] {} failed: {}", e.profile, e.mode, e.error);
            }
        });
    }

private:
    EventBus& bus_;
};

/**
 * @brief Per-run counters
 *
 * USAGE:
 * StatsComponent stats(bus);
 * // ...run...
 * stats.get_stats().files_encrypted.load();
 */
class StatsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> files_encrypted{0};
        std::atomic<uint64_t> files_reused{0};
        std::atomic<uint64_t> bytes_encrypted{0};
        std::atomic<uint64_t> files_decrypted{0};
        std::atomic<uint64_t> bytes_decrypted{0};
        std::atomic<uint64_t> files_installed{0};
        std::atomic<uint64_t> files_removed{0};
        std::atomic<uint64_t> cleanup_failures{0};
    };

    explicit StatsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<ArtifactEncryptedEvent>([this](const ArtifactEncryptedEvent& e) {
            if (e.reused) {
                stats_.files_reused++;
            } else {
                stats_.files_encrypted++;
                stats_.bytes_encrypted += e.bytes;
            }
        });

        bus_.subscribe<ArtifactDecryptedEvent>([this](const ArtifactDecryptedEvent& e) {
            stats_.files_decrypted++;
            stats_.bytes_decrypted += e.bytes;
        });

        bus_.subscribe<LocalFileInstalledEvent>([this](const LocalFileInstalledEvent&) {
            stats_.files_installed++;
        });

        bus_.subscribe<LocalFileRemovedEvent>([this](const LocalFileRemovedEvent&) {
            stats_.files_removed++;
        });

        bus_.subscribe<StagingCleanupFailedEvent>([this](const StagingCleanupFailedEvent&) {
            stats_.cleanup_failures++;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_summary() const {
        spdlog::info("Encrypted {} file(s) ({} bytes), {} unchanged", stats_.files_encrypted.load(),
                     stats_.bytes_encrypted.load(), stats_.files_reused.load());
        spdlog::info("Decrypted {} file(s) ({} bytes), installed {}, removed {}", stats_.files_decrypted.load(),
                     stats_.bytes_decrypted.load(), stats_.files_installed.load(), stats_.files_removed.load());
        if (stats_.cleanup_failures.load() > 0) {
            spdlog::warn("{} staging cleanup failure(s)", stats_.cleanup_failures.load());
        }
    }

private:
    EventBus& bus_;
    Stats stats_;
};

} // namespace mist::events
