#pragma once

#include "mist/core/cancellation.hpp"
#include "mist/sync/engine.hpp"

#include <string>
#include <vector>

namespace mist::sync {

/**
 * @brief SyncEngine backed by rsync (one-way) and unison (bidirectional)
 *
 * Remote endpoints are reached through ssh; nothing beyond a POSIX shell,
 * rsync and unison is needed on the remote host.
 *
 * EXIT STATUS MAPPING:
 * - ssh 255, rsync 5/10/12/30/35/255  -> TransportFailure
 * - unison 1 (some files skipped)     -> success with a warning
 * - any other non-zero status         -> EngineFailure
 */
class RsyncUnisonEngine : public SyncEngine {
public:
    struct Options {
        std::string ssh_program = "ssh";
        std::string rsync_program = "rsync";
        std::string unison_program = "unison";
        bool batch = false;  ///< Let unison resolve without asking (--assume-yes)
        const CancellationToken* cancel = nullptr;
    };

    RsyncUnisonEngine() = default;
    explicit RsyncUnisonEngine(Options options) : options_(std::move(options)) {}

    Result<bool> probe(const Endpoint& endpoint) override;
    Result<void> mirror(const Endpoint& source, const Endpoint& destination) override;
    Result<ChangeSet> reconcile(const std::filesystem::path& local_replica, const Endpoint& remote) override;

    [[nodiscard]] std::vector<std::string> probe_command(const Endpoint& endpoint) const;
    [[nodiscard]] std::vector<std::string> prepare_command(const Endpoint& endpoint) const;
    [[nodiscard]] std::vector<std::string> mirror_command(const Endpoint& source, const Endpoint& destination) const;
    [[nodiscard]] std::vector<std::string> reconcile_command(const std::filesystem::path& local_replica,
                                                             const Endpoint& remote) const;

    static Result<void> classify_rsync_exit(int exit_code, const std::string& output);
    static Result<void> classify_unison_exit(int exit_code, const std::string& output);

private:
    Result<void> prepare(const Endpoint& destination);

    Options options_;
};

/// Quote `text` for a POSIX shell ('a b' -> "'a b'").
std::string shell_quote(const std::string& text);

} // namespace mist::sync
