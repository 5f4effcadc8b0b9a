/**
 * @file orchestrator.hpp
 * @brief Drives one push, pull or sync run of a profile
 *
 * WHY THIS FILE EXISTS:
 * This is the only place that knows the order of things: lock the profile,
 * create the staging area, encrypt or decrypt through the gateway, hand
 * ciphertext to the sync engine, and clean up no matter how the run ends.
 *
 * FLOW (Push):
 *   lock -> staging -> [Staging] encrypt local -> [Transporting] mirror to
 *   remote -> [Done] -> release staging -> unlock
 *
 * Every failure short-circuits to Failed with the staging area still
 * released. Nothing is retried.
 */

#pragma once

#include "mist/config/profile.hpp"
#include "mist/core/cancellation.hpp"
#include "mist/crypto/backend.hpp"
#include "mist/events/event_bus.hpp"
#include "mist/sync/engine.hpp"
#include "mist/sync/session.hpp"
#include "mist/sync/types.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace mist::sync {

/**
 * @brief Terminal result of SyncOrchestrator::run
 */
struct SessionReport {
    std::string profile;
    SyncMode mode = SyncMode::Sync;
    SessionStatus status = SessionStatus::Idle;
    std::optional<Error> error;             ///< Set when status == Failed
    std::filesystem::path staging_path;     ///< Empty if no staging area was created
    bool staging_removed = true;

    std::size_t files_encrypted = 0;
    std::size_t files_reused = 0;
    std::size_t files_decrypted = 0;
    std::size_t files_installed = 0;
    std::size_t files_removed = 0;
    std::chrono::milliseconds duration{0};

    [[nodiscard]] bool succeeded() const noexcept { return status == SessionStatus::Done; }
};

/// Asked before destroying data on either side; true means go ahead.
using ConfirmCallback = std::function<bool(const std::string& question)>;

struct OrchestratorOptions {
    bool assume_yes = false;                    ///< Skip every confirmation
    ConfirmCallback confirm;                    ///< Unset means "no"
    const CancellationToken* cancel = nullptr;
    std::filesystem::path home;                 ///< For the default staging root
};

class SyncOrchestrator {
public:
    SyncOrchestrator(crypto::EncryptionBackend& backend,
                     SyncEngine& engine,
                     events::EventBus& bus,
                     OrchestratorOptions options);

    /**
     * @brief Look `profile_name` up in `config` and run it
     *
     * An unknown profile yields a Failed report carrying NotFound.
     */
    SessionReport run(const config::Configuration& config, const std::string& profile_name, SyncMode mode);

    SessionReport run(const config::Profile& profile, SyncMode mode);

private:
    struct Run;

    Result<void> execute(Run& run);
    Result<void> run_push(Run& run);
    Result<void> run_pull(Run& run);
    Result<void> run_sync(Run& run);

    Result<void> advance(Run& run, SessionStatus next);
    Result<void> check_cancelled() const;
    Result<void> ask(const std::string& question) const;

    crypto::EncryptionBackend& backend_;
    SyncEngine& engine_;
    events::EventBus& bus_;
    OrchestratorOptions options_;
};

} // namespace mist::sync
