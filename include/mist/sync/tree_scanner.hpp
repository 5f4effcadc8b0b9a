#pragma once

#include "mist/core/result.hpp"
#include "mist/sync/types.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>

namespace mist::sync {

struct FileState {
    std::uint64_t size = 0;
    std::string digest;  ///< FNV-1a hex of the contents

    bool operator==(const FileState& other) const { return size == other.size && digest == other.digest; }
    bool operator!=(const FileState& other) const { return !(*this == other); }
};

/// Relative path (POSIX style) -> state, ordered for stable diffs.
using TreeSnapshot = std::map<std::string, FileState>;

/**
 * @brief Snapshots a directory and diffs snapshots into a ChangeSet
 *
 * Used around the bidirectional engine run: whatever differs between the
 * snapshot taken before and the one taken after is what the engine
 * changed on the local replica. Only regular files are recorded.
 */
class TreeScanner {
public:
    /**
     * @brief Record every regular file under `root`
     *
     * A missing root yields an empty snapshot.
     */
    static Result<TreeSnapshot> snapshot(const std::filesystem::path& root);

    /// Added / Modified / Deleted going from `before` to `after`.
    static ChangeSet diff(const TreeSnapshot& before, const TreeSnapshot& after);
};

} // namespace mist::sync
