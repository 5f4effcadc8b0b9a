/**
 * @file events.hpp
 * @brief Event type definitions for a mist session
 *
 * WHY THIS FILE EXISTS:
 * The orchestrator, the encryption gateway and the staging area report
 * progress by emitting events instead of logging directly. The CLI wires a
 * LoggerComponent and a StatsComponent to the bus; tests subscribe their
 * own handlers to observe what happened.
 *
 * NAMING CONVENTION:
 * - Events are past-tense: ArtifactEncryptedEvent, SessionFinishedEvent
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace mist::events {

// ════════════════════════════════════════════════════════
// Session lifecycle
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted once the profile lock and staging area are held
 */
struct SessionStartedEvent {
    std::string profile;
    std::string mode;
    std::filesystem::path staging_path;
};

/**
 * @brief Emitted on every status transition of the session
 */
struct StageChangedEvent {
    std::string profile;
    std::string from;
    std::string to;
};

/**
 * @brief Emitted when the session reaches Done or Failed
 *
 * WHO SUBSCRIBES:
 * - Logger (final line of the run)
 * - Stats (prints the summary)
 */
struct SessionFinishedEvent {
    std::string profile;
    std::string mode;
    bool succeeded = false;
    std::string error;  ///< Empty on success
    std::chrono::milliseconds duration{0};
};

// ════════════════════════════════════════════════════════
// File events
// ════════════════════════════════════════════════════════

/**
 * @brief A plaintext file now has an artifact in the ciphertext tree
 *
 * `reused` is true when the previous artifact was copied from the cache
 * instead of invoking the encryption backend.
 */
struct ArtifactEncryptedEvent {
    std::string relative_path;
    std::uint64_t bytes = 0;
    bool reused = false;
};

struct ArtifactDecryptedEvent {
    std::string relative_path;
    std::uint64_t bytes = 0;
};

/**
 * @brief A decrypted file was written into the local directory
 */
struct LocalFileInstalledEvent {
    std::string relative_path;
};

/**
 * @brief A local file was removed because the remote side deleted it
 */
struct LocalFileRemovedEvent {
    std::string relative_path;
};

// ════════════════════════════════════════════════════════
// Transport / cleanup
// ════════════════════════════════════════════════════════

struct TransportCompletedEvent {
    std::string operation;  ///< "mirror" or "reconcile"
    std::string source;
    std::string destination;
    std::size_t changed_files = 0;
    std::chrono::milliseconds duration{0};
};

/**
 * @brief Best-effort staging removal failed (never fatal)
 */
struct StagingCleanupFailedEvent {
    std::filesystem::path path;
    std::string reason;
};

} // namespace mist::events
