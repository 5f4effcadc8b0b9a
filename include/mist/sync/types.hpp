#pragma once

#include <optional>
#include <string>
#include <vector>

namespace mist::sync {

enum class SyncMode {
    Push,
    Pull,
    Sync
};

enum class SessionStatus {
    Idle,
    Staging,
    Transporting,
    Reconciling,
    Done,
    Failed
};

const char* to_string(SyncMode mode) noexcept;
const char* to_string(SessionStatus status) noexcept;

/**
 * @brief A directory reachable through the sync engine
 *
 * An empty host means a local path.
 */
struct Endpoint {
    std::string host;
    std::string path;

    [[nodiscard]] bool is_remote() const noexcept { return !host.empty(); }
    [[nodiscard]] std::string to_string() const { return is_remote() ? host + ":" + path : path; }
};

/**
 * @brief One file the bidirectional engine changed on the local replica
 */
struct FileChange {
    enum class Kind {
        Added,
        Modified,
        Deleted
    };

    Kind kind = Kind::Added;
    std::string path;  ///< Relative to the replica root (POSIX style)
};

struct ChangeSet {
    std::vector<FileChange> changes;

    [[nodiscard]] bool empty() const noexcept { return changes.empty(); }
    [[nodiscard]] std::size_t count(FileChange::Kind kind) const noexcept;
};

const char* to_string(FileChange::Kind kind) noexcept;

} // namespace mist::sync
