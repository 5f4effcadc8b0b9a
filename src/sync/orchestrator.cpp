#include "mist/sync/orchestrator.hpp"
#include "mist/crypto/gateway.hpp"
#include "mist/events/events.hpp"
#include "mist/staging/profile_lock.hpp"
#include "mist/staging/staging_area.hpp"
#include "mist/sync/artifact_cache.hpp"

#include <spdlog/spdlog.h>

#include <map>
#include <set>
#include <system_error>

namespace mist::sync {
namespace fs = std::filesystem;

struct SyncOrchestrator::Run {
    const config::Profile& profile;
    SyncSession session;
    SessionReport& report;
    staging::StagingArea* staging = nullptr;
    ArtifactCache* cache = nullptr;

    [[nodiscard]] Endpoint remote() const { return Endpoint{profile.remote_host, profile.remote_path}; }
    [[nodiscard]] Endpoint ciphertext() const { return Endpoint{"", staging->ciphertext_dir().string()}; }
};

namespace {

bool has_entries(const fs::path& dir) {
    std::error_code ec;
    return fs::is_directory(dir, ec) && fs::directory_iterator(dir, ec) != fs::directory_iterator();
}

void count_encrypted(SessionReport& report, const crypto::TreeManifest& manifest) {
    for (const auto& entry : manifest.entries) {
        if (entry.reused) {
            ++report.files_reused;
        } else {
            ++report.files_encrypted;
        }
    }
}

} // namespace

SyncOrchestrator::SyncOrchestrator(crypto::EncryptionBackend& backend,
                                   SyncEngine& engine,
                                   events::EventBus& bus,
                                   OrchestratorOptions options)
    : backend_(backend), engine_(engine), bus_(bus), options_(std::move(options)) {}

SessionReport SyncOrchestrator::run(const config::Configuration& config,
                                    const std::string& profile_name,
                                    SyncMode mode) {
    auto profile = config.lookup(profile_name);
    if (profile.is_ok()) {
        return run(profile.value(), mode);
    }

    SessionReport report;
    report.profile = profile_name;
    report.mode = mode;
    report.status = SessionStatus::Failed;
    report.error = profile.error();
    bus_.emit(events::SessionFinishedEvent{profile_name, to_string(mode), false, profile.error().describe(), {}});
    return report;
}

SessionReport SyncOrchestrator::run(const config::Profile& profile, SyncMode mode) {
    SessionReport report;
    report.profile = profile.name;
    report.mode = mode;

    Run run{profile, SyncSession(profile.name, mode), report};

    auto outcome = execute(run);
    if (outcome.is_error()) {
        Error error = outcome.error();
        if (error.profile.empty()) {
            error.with_profile(profile.name);
        }
        if (auto res = run.session.fail(error); res.is_error()) {
            spdlog::error("[{}] {}", profile.name, res.error().describe());
        }
        report.error = std::move(error);
    }

    report.status = run.session.status();
    report.duration = run.session.elapsed();
    bus_.emit(events::SessionFinishedEvent{profile.name, to_string(mode), report.succeeded(),
                                           report.error ? report.error->describe() : std::string{},
                                           report.duration});
    return report;
}

Result<void> SyncOrchestrator::execute(Run& run) {
    const auto& profile = run.profile;

    if (auto res = check_cancelled(); res.is_error()) {
        return res;
    }

    std::error_code ec;
    if (run.session.mode() != SyncMode::Pull && !fs::is_directory(profile.local_path, ec)) {
        return Err<void>(Error{ErrorCode::Filesystem, "Local directory does not exist"}
                             .with_path(profile.local_path));
    }

    const fs::path staging_root = profile.staging_root(options_.home);

    // Nothing below this point may run twice for the same profile
    auto lock = staging::ProfileLock::acquire(staging_root, profile.name);
    if (lock.is_error()) {
        return Err<void>(lock.error());
    }

    auto area = staging::StagingArea::acquire(profile, staging_root);
    if (area.is_error()) {
        return Err<void>(area.error());
    }
    staging::StagingArea& staging = area.value();
    staging.on_cleanup_failure([this](const fs::path& path, const std::string& reason) {
        bus_.emit(events::StagingCleanupFailedEvent{path, reason});
    });
    run.staging = &staging;
    run.report.staging_path = staging.path();
    run.report.staging_removed = false;

    ArtifactCache cache = ArtifactCache::open(staging_root, profile.name);
    run.cache = &cache;

    bus_.emit(events::SessionStartedEvent{profile.name, to_string(run.session.mode()), staging.path()});

    Result<void> outcome = Ok();
    switch (run.session.mode()) {
        case SyncMode::Push:
            outcome = run_push(run);
            break;
        case SyncMode::Pull:
            outcome = run_pull(run);
            break;
        case SyncMode::Sync:
            outcome = run_sync(run);
            break;
    }

    run.report.staging_removed = staging.release();
    run.staging = nullptr;
    return outcome;
}

Result<void> SyncOrchestrator::run_push(Run& run) {
    const auto& profile = run.profile;
    const Endpoint remote = run.remote();

    if (auto res = backend_.check_recipient(profile.recipient); res.is_error()) {
        return res;
    }

    auto exists = engine_.probe(remote);
    if (exists.is_error()) {
        return Err<void>(exists.error());
    }
    if (exists.value() && run.cache->empty()) {
        auto res = ask("Remote directory " + remote.to_string() +
                       " already exists and has never been pushed from this machine; its contents will be "
                       "replaced. Continue?");
        if (res.is_error()) {
            return res;
        }
    }

    if (auto res = advance(run, SessionStatus::Staging); res.is_error()) {
        return res;
    }
    crypto::EncryptionGateway gateway(backend_, bus_, options_.cancel);
    auto manifest = gateway.encrypt(profile.local_path, profile.recipient, run.staging->ciphertext_dir(), run.cache);
    if (manifest.is_error()) {
        return Err<void>(manifest.error());
    }
    count_encrypted(run.report, manifest.value());

    if (auto res = advance(run, SessionStatus::Transporting); res.is_error()) {
        return res;
    }
    const auto started = std::chrono::steady_clock::now();
    if (auto res = engine_.mirror(run.ciphertext(), remote); res.is_error()) {
        return res;
    }
    bus_.emit(events::TransportCompletedEvent{
        "mirror", run.ciphertext().to_string(), remote.to_string(), manifest.value().entries.size(),
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started)});

    if (auto res = run.cache->commit(run.staging->ciphertext_dir(), manifest.value(), profile.recipient);
        res.is_error()) {
        spdlog::warn("Artifact cache not updated, next run re-encrypts everything: {}", res.error().describe());
    }

    return advance(run, SessionStatus::Done);
}

Result<void> SyncOrchestrator::run_pull(Run& run) {
    const auto& profile = run.profile;
    const Endpoint remote = run.remote();

    auto exists = engine_.probe(remote);
    if (exists.is_error()) {
        return Err<void>(exists.error());
    }
    if (!exists.value()) {
        return Err<void>(ErrorCode::EngineFailure, "Remote directory " + remote.to_string() + " does not exist");
    }

    if (has_entries(profile.local_path)) {
        auto res = ask("Local directory " + profile.local_path.string() +
                       " is not empty; files from the remote will overwrite local copies. Continue?");
        if (res.is_error()) {
            return res;
        }
    }

    if (auto res = advance(run, SessionStatus::Transporting); res.is_error()) {
        return res;
    }
    const auto started = std::chrono::steady_clock::now();
    if (auto res = engine_.mirror(remote, run.ciphertext()); res.is_error()) {
        return res;
    }

    if (auto res = advance(run, SessionStatus::Staging); res.is_error()) {
        return res;
    }
    crypto::EncryptionGateway gateway(backend_, bus_, options_.cancel);
    auto manifest = gateway.decrypt(run.staging->ciphertext_dir(), run.staging->plaintext_dir());
    if (manifest.is_error()) {
        return Err<void>(manifest.error());
    }
    run.report.files_decrypted = manifest.value().entries.size();
    bus_.emit(events::TransportCompletedEvent{
        "mirror", remote.to_string(), run.ciphertext().to_string(), manifest.value().entries.size(),
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started)});

    auto installed = crypto::install_tree(run.staging->plaintext_dir(), profile.local_path, bus_, options_.cancel);
    if (installed.is_error()) {
        return Err<void>(installed.error());
    }
    run.report.files_installed = installed.value().size();

    if (auto res = run.cache->commit(run.staging->ciphertext_dir(), manifest.value(), profile.recipient);
        res.is_error()) {
        spdlog::warn("Artifact cache not updated, next run re-encrypts everything: {}", res.error().describe());
    }

    return advance(run, SessionStatus::Done);
}

Result<void> SyncOrchestrator::run_sync(Run& run) {
    const auto& profile = run.profile;
    const Endpoint remote = run.remote();

    if (auto res = backend_.check_recipient(profile.recipient); res.is_error()) {
        return res;
    }

    if (auto res = advance(run, SessionStatus::Staging); res.is_error()) {
        return res;
    }
    crypto::EncryptionGateway gateway(backend_, bus_, options_.cancel);
    auto encrypted = gateway.encrypt(profile.local_path, profile.recipient, run.staging->ciphertext_dir(), run.cache);
    if (encrypted.is_error()) {
        return Err<void>(encrypted.error());
    }
    count_encrypted(run.report, encrypted.value());

    if (auto res = advance(run, SessionStatus::Reconciling); res.is_error()) {
        return res;
    }
    const auto started = std::chrono::steady_clock::now();
    auto changes = engine_.reconcile(run.staging->ciphertext_dir(), remote);
    if (changes.is_error()) {
        return Err<void>(changes.error());
    }
    bus_.emit(events::TransportCompletedEvent{
        "reconcile", run.ciphertext().to_string(), remote.to_string(), changes.value().changes.size(),
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started)});

    if (auto res = advance(run, SessionStatus::Staging); res.is_error()) {
        return res;
    }

    std::set<std::string> refreshed;
    std::vector<std::string> deleted;
    for (const auto& change : changes.value().changes) {
        auto plain = crypto::plaintext_name(change.path);
        if (!plain) {
            return Err<void>(Error{ErrorCode::UnsupportedFileType, "Remote holds a file that is not an artifact"}
                                 .with_path(run.staging->ciphertext_dir() / change.path));
        }
        if (change.kind == FileChange::Kind::Deleted) {
            deleted.push_back(*plain);
        } else {
            refreshed.insert(*plain);
        }
    }

    // Plaintext digests of the reconciled tree, for the cache
    std::map<std::string, crypto::ManifestEntry> merged;
    for (const auto& entry : encrypted.value().entries) {
        merged[entry.path] = entry;
    }

    if (!refreshed.empty()) {
        auto decrypted = gateway.decrypt(run.staging->ciphertext_dir(), run.staging->plaintext_dir(), refreshed);
        if (decrypted.is_error()) {
            return Err<void>(decrypted.error());
        }
        run.report.files_decrypted = decrypted.value().entries.size();
        for (const auto& entry : decrypted.value().entries) {
            merged[entry.path] = entry;
        }

        auto installed = crypto::install_tree(run.staging->plaintext_dir(), profile.local_path, bus_, options_.cancel);
        if (installed.is_error()) {
            return Err<void>(installed.error());
        }
        run.report.files_installed = installed.value().size();
    }

    for (const auto& relative : deleted) {
        if (auto res = check_cancelled(); res.is_error()) {
            return res;
        }
        merged.erase(relative);

        const fs::path target = profile.local_path / relative;
        std::error_code ec;
        if (!fs::is_regular_file(fs::symlink_status(target, ec))) {
            continue;
        }
        if (!fs::remove(target, ec) || ec) {
            return Err<void>(Error{ErrorCode::Filesystem, "Cannot remove file deleted on the remote: " + ec.message()}
                                 .with_path(target));
        }
        ++run.report.files_removed;
        bus_.emit(events::LocalFileRemovedEvent{relative});
    }

    crypto::TreeManifest reconciled;
    reconciled.root = run.staging->ciphertext_dir();
    for (auto& [path, entry] : merged) {
        reconciled.entries.push_back(std::move(entry));
    }
    if (auto res = run.cache->commit(run.staging->ciphertext_dir(), reconciled, profile.recipient); res.is_error()) {
        spdlog::warn("Artifact cache not updated, next run re-encrypts everything: {}", res.error().describe());
    }

    return advance(run, SessionStatus::Done);
}

Result<void> SyncOrchestrator::advance(Run& run, SessionStatus next) {
    // A pending interrupt wins over the next step
    if (next != SessionStatus::Done) {
        if (auto res = check_cancelled(); res.is_error()) {
            return res;
        }
    }

    const SessionStatus from = run.session.status();
    if (auto res = run.session.transition_to(next); res.is_error()) {
        return res;
    }
    bus_.emit(events::StageChangedEvent{run.profile.name, to_string(from), to_string(next)});
    return Ok();
}

Result<void> SyncOrchestrator::check_cancelled() const {
    if (options_.cancel != nullptr && options_.cancel->is_cancelled()) {
        return Err<void>(ErrorCode::Cancelled, "Interrupted");
    }
    return Ok();
}

Result<void> SyncOrchestrator::ask(const std::string& question) const {
    if (options_.assume_yes) {
        return Ok();
    }
    if (options_.confirm && options_.confirm(question)) {
        return Ok();
    }
    // An interrupt while the prompt is open reads as "no" from the terminal.
    if (auto res = check_cancelled(); res.is_error()) {
        return res;
    }
    return Err<void>(ErrorCode::Declined, "Aborted: " + question);
}

} // namespace mist::sync
