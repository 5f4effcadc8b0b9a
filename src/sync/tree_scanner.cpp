#include "mist/sync/tree_scanner.hpp"
#include "mist/core/hash.hpp"

#include <system_error>

namespace fs = std::filesystem;

namespace mist::sync {

Result<TreeSnapshot> TreeScanner::snapshot(const fs::path& root) {
    TreeSnapshot result;

    std::error_code ec;
    if (root.empty() || !fs::exists(root, ec)) {
        return Ok(std::move(result));
    }
    if (!fs::is_directory(root, ec)) {
        return Err<TreeSnapshot>(Error{ErrorCode::Filesystem, "Not a directory"}.with_path(root));
    }

    fs::recursive_directory_iterator it(root, ec);
    fs::recursive_directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
        if (it->is_symlink(ec) || !it->is_regular_file(ec)) {
            continue;
        }

        const std::string normalized = it->path().lexically_relative(root).generic_string();
        auto digest = hash_file(it->path());
        if (digest.is_error()) {
            return Err<TreeSnapshot>(digest.error());
        }

        FileState state;
        state.size = it->file_size(ec);
        state.digest = std::move(digest.value());
        result.emplace(normalized, std::move(state));
    }

    if (ec) {
        return Err<TreeSnapshot>(Error{ErrorCode::Filesystem, "Failed to scan directory: " + ec.message()}
                                     .with_path(root));
    }
    return Ok(std::move(result));
}

ChangeSet TreeScanner::diff(const TreeSnapshot& before, const TreeSnapshot& after) {
    ChangeSet result;

    for (const auto& [path, state] : after) {
        auto known = before.find(path);
        if (known == before.end()) {
            result.changes.push_back({FileChange::Kind::Added, path});
        } else if (known->second != state) {
            result.changes.push_back({FileChange::Kind::Modified, path});
        }
    }

    // Detect deletions
    for (const auto& [path, state] : before) {
        if (after.find(path) == after.end()) {
            result.changes.push_back({FileChange::Kind::Deleted, path});
        }
    }

    return result;
}

} // namespace mist::sync
