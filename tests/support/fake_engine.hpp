#pragma once

#include "mist/sync/engine.hpp"
#include "mist/sync/tree_scanner.hpp"

#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <system_error>
#include <vector>

namespace mist::test_support {

/**
 * @brief SyncEngine whose "remote hosts" are directories on local disk
 *
 * host "h" and path "/remote/docs" map to <remote_root>/h/remote/docs.
 * reconcile() keeps one archive per replica pair, like unison, and
 * propagates whichever side changed since the last run. Files changed on
 * both sides are left alone and recorded in `conflicts`.
 */
class FakeEngine : public sync::SyncEngine {
public:
    explicit FakeEngine(std::filesystem::path remote_root) : remote_root_(std::move(remote_root)) {}

    std::filesystem::path resolve(const sync::Endpoint& endpoint) const {
        if (!endpoint.is_remote()) {
            return endpoint.path;
        }
        return remote_root_ / endpoint.host / std::filesystem::path(endpoint.path).relative_path();
    }

    Result<bool> probe(const sync::Endpoint& endpoint) override {
        if (unreachable) {
            return Err<bool>(ErrorCode::TransportFailure, "host unreachable");
        }
        std::error_code ec;
        return Ok(std::filesystem::is_directory(resolve(endpoint), ec));
    }

    Result<void> mirror(const sync::Endpoint& source, const sync::Endpoint& destination) override {
        ++mirror_calls;
        if (on_mirror) {
            on_mirror();
        }
        if (unreachable) {
            return Err<void>(ErrorCode::TransportFailure, "host unreachable");
        }
        if (mirror_error) {
            return Err<void>(*mirror_error);
        }

        const auto from = resolve(source);
        const auto to = resolve(destination);
        mirrored_trees.push_back(from);

        auto wanted = sync::TreeScanner::snapshot(from);
        auto present = sync::TreeScanner::snapshot(to);
        if (wanted.is_error() || present.is_error()) {
            return Err<void>(ErrorCode::EngineFailure, "scan failed");
        }

        std::error_code ec;
        std::filesystem::create_directories(to, ec);
        for (const auto& [path, state] : present.value()) {
            if (wanted.value().count(path) == 0) {
                std::filesystem::remove(to / path, ec);
            }
        }
        for (const auto& [path, state] : wanted.value()) {
            auto existing = present.value().find(path);
            if (existing != present.value().end() && existing->second == state) {
                continue;
            }
            std::filesystem::create_directories((to / path).parent_path(), ec);
            std::filesystem::copy_file(from / path, to / path, std::filesystem::copy_options::overwrite_existing, ec);
            if (ec) {
                return Err<void>(ErrorCode::EngineFailure, "copy failed: " + ec.message());
            }
        }
        return Ok();
    }

    Result<sync::ChangeSet> reconcile(const std::filesystem::path& local_replica,
                                      const sync::Endpoint& remote) override {
        ++reconcile_calls;
        if (on_reconcile) {
            on_reconcile();
        }
        if (unreachable) {
            return Err<sync::ChangeSet>(ErrorCode::TransportFailure, "host unreachable");
        }

        const auto remote_dir = resolve(remote);
        std::error_code ec;
        std::filesystem::create_directories(remote_dir, ec);

        auto local_state = sync::TreeScanner::snapshot(local_replica);
        auto remote_state = sync::TreeScanner::snapshot(remote_dir);
        if (local_state.is_error() || remote_state.is_error()) {
            return Err<sync::ChangeSet>(ErrorCode::EngineFailure, "scan failed");
        }
        const auto& L = local_state.value();
        const auto& R = remote_state.value();
        auto& archive = archives_[local_replica.string() + "|" + remote_dir.string()];

        std::set<std::string> paths;
        const sync::TreeSnapshot* trees[] = {&L, &R, &archive};
        for (const auto* tree : trees) {
            for (const auto& [path, state] : *tree) {
                paths.insert(path);
            }
        }

        auto lookup = [](const sync::TreeSnapshot& tree, const std::string& path) -> std::optional<sync::FileState> {
            auto it = tree.find(path);
            return it == tree.end() ? std::nullopt : std::optional<sync::FileState>(it->second);
        };

        sync::ChangeSet changes;
        for (const auto& path : paths) {
            const auto l = lookup(L, path);
            const auto r = lookup(R, path);
            const auto a = lookup(archive, path);
            const bool local_changed = l != a;
            const bool remote_changed = r != a;

            if (!remote_changed || l == r) {
                if (local_changed) {
                    propagate(local_replica / path, remote_dir / path, l.has_value());
                }
                continue;
            }
            if (local_changed) {
                conflicts.push_back(path);
                continue;
            }

            propagate(remote_dir / path, local_replica / path, r.has_value());
            if (!r) {
                changes.changes.push_back({sync::FileChange::Kind::Deleted, path});
            } else if (!l) {
                changes.changes.push_back({sync::FileChange::Kind::Added, path});
            } else {
                changes.changes.push_back({sync::FileChange::Kind::Modified, path});
            }
        }

        auto settled = sync::TreeScanner::snapshot(local_replica);
        if (settled.is_ok()) {
            archive = settled.value();
            for (const auto& path : conflicts) {
                archive.erase(path);
            }
        }
        return Ok(std::move(changes));
    }

    bool unreachable = false;
    std::optional<Error> mirror_error;
    std::function<void()> on_mirror;
    std::function<void()> on_reconcile;

    int mirror_calls = 0;
    int reconcile_calls = 0;
    std::vector<std::filesystem::path> mirrored_trees;
    std::vector<std::string> conflicts;

private:
    static void propagate(const std::filesystem::path& from, const std::filesystem::path& to, bool exists) {
        std::error_code ec;
        if (!exists) {
            std::filesystem::remove(to, ec);
            return;
        }
        std::filesystem::create_directories(to.parent_path(), ec);
        std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing, ec);
    }

    std::filesystem::path remote_root_;
    std::map<std::string, sync::TreeSnapshot> archives_;
};

} // namespace mist::test_support
