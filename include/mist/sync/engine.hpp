#pragma once

#include "mist/core/result.hpp"
#include "mist/sync/types.hpp"

#include <filesystem>

namespace mist::sync {

/**
 * @brief Directory reconciliation capability
 *
 * ERRORS:
 * - TransportFailure  the remote side could not be reached
 * - EngineFailure     the engine ran and reported failure
 * - Cancelled
 */
class SyncEngine {
public:
    virtual ~SyncEngine() = default;

    /// Does the directory at `endpoint` exist?
    virtual Result<bool> probe(const Endpoint& endpoint) = 0;

    /**
     * @brief One-way mirror: make `destination` identical to `source`
     *
     * Files present only in `destination` are deleted. Missing destination
     * directories are created.
     */
    virtual Result<void> mirror(const Endpoint& source, const Endpoint& destination) = 0;

    /**
     * @brief Bidirectional reconciliation using the engine's own conflict policy
     *
     * Returns the files the engine changed in `local_replica`.
     */
    virtual Result<ChangeSet> reconcile(const std::filesystem::path& local_replica, const Endpoint& remote) = 0;
};

} // namespace mist::sync
