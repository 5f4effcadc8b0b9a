#include "mist/sync/artifact_cache.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>
#include <system_error>

namespace mist::sync {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr int kManifestVersion = 1;
constexpr const char* kManifestFile = "manifest.json";
constexpr const char* kArtifactsDir = "artifacts";

json manifest_to_json(const std::string& profile,
                      const std::string& recipient,
                      const std::map<std::string, ArtifactCache::Entry>& entries) {
    json j;
    j["version"] = kManifestVersion;
    j["profile"] = profile;
    j["recipient"] = recipient;
    j["files"] = json::object();
    for (const auto& [path, entry] : entries) {
        j["files"][path] = json{{"artifact", crypto::artifact_name(path)}, {"digest", entry.digest}, {"size", entry.size}};
    }
    return j;
}

/// False when `j` is not a manifest this version wrote; outputs may be partly filled.
bool manifest_from_json(const json& j,
                        std::string& recipient,
                        std::map<std::string, ArtifactCache::Entry>& entries) {
    if (j.is_discarded() || !j.is_object()) {
        return false;
    }
    const auto version = j.find("version");
    if (version == j.end() || !version->is_number_integer() || version->get<int>() != kManifestVersion) {
        return false;
    }

    if (const auto stored = j.find("recipient"); stored != j.end()) {
        if (!stored->is_string()) {
            return false;
        }
        recipient = stored->get<std::string>();
    }

    const auto files = j.find("files");
    if (files == j.end()) {
        return true;
    }
    if (!files->is_object()) {
        return false;
    }
    for (auto it = files->begin(); it != files->end(); ++it) {
        const json& record = it.value();
        if (!record.is_object()) {
            continue;
        }
        const auto digest = record.find("digest");
        const auto size = record.find("size");
        if (digest == record.end() || !digest->is_string()) {
            return false;
        }
        if (size != record.end() && !size->is_number_unsigned()) {
            return false;
        }
        ArtifactCache::Entry entry;
        entry.digest = digest->get<std::string>();
        entry.size = size == record.end() ? 0 : size->get<std::uint64_t>();
        if (!entry.digest.empty()) {
            entries.emplace(it.key(), std::move(entry));
        }
    }
    return true;
}

Result<void> write_text(const fs::path& path, const std::string& text) {
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output) {
        return Err<void>(Error{ErrorCode::Filesystem, "Cannot write file"}.with_path(path));
    }
    output << text;
    output.flush();
    if (!output) {
        return Err<void>(Error{ErrorCode::Filesystem, "Failed writing file"}.with_path(path));
    }
    return Ok();
}

} // namespace

fs::path ArtifactCache::cache_path(const fs::path& staging_root, const std::string& profile_name) {
    return staging_root / (profile_name + ".cache");
}

ArtifactCache ArtifactCache::open(const fs::path& staging_root, const std::string& profile_name) {
    ArtifactCache cache(cache_path(staging_root, profile_name), profile_name);

    std::ifstream input(cache.path_ / kManifestFile, std::ios::binary);
    if (!input) {
        return cache;
    }

    std::ostringstream buffer;
    buffer << input.rdbuf();
    const auto manifest = json::parse(buffer.str(), nullptr, false);
    if (!manifest_from_json(manifest, cache.recipient_, cache.entries_)) {
        spdlog::warn("Ignoring unreadable artifact cache manifest in {}", cache.path_.string());
        cache.recipient_.clear();
        cache.entries_.clear();
        return cache;
    }

    spdlog::debug("Artifact cache for [{}]: {} file(s)", profile_name, cache.entries_.size());
    return cache;
}

std::optional<fs::path> ArtifactCache::find_artifact(const std::string& relative_path,
                                                     const std::string& digest,
                                                     const std::string& recipient) const {
    if (recipient != recipient_) {
        return std::nullopt;
    }
    auto it = entries_.find(relative_path);
    if (it == entries_.end() || it->second.digest != digest) {
        return std::nullopt;
    }

    fs::path artifact = path_ / kArtifactsDir / crypto::artifact_name(relative_path);
    std::error_code ec;
    if (!fs::is_regular_file(artifact, ec)) {
        return std::nullopt;
    }
    return artifact;
}

Result<void> ArtifactCache::commit(const fs::path& ciphertext,
                                   const crypto::TreeManifest& manifest,
                                   const std::string& recipient) {
    const fs::path next = path_.string() + ".next";
    std::error_code ec;
    fs::remove_all(next, ec);
    fs::create_directories(next / kArtifactsDir, ec);
    if (ec) {
        return Err<void>(Error{ErrorCode::Filesystem, "Cannot create cache directory: " + ec.message()}
                             .with_path(next));
    }
    fs::permissions(next, fs::perms::owner_all, fs::perm_options::replace, ec);

    std::map<std::string, Entry> entries;
    for (const auto& file : manifest.entries) {
        const std::string artifact = crypto::artifact_name(file.path);
        const fs::path source = ciphertext / artifact;
        const fs::path target = next / kArtifactsDir / artifact;

        if (!fs::is_regular_file(source, ec)) {
            spdlog::debug("No artifact for {} in {}, not caching it", file.path, ciphertext.string());
            continue;
        }
        fs::create_directories(target.parent_path(), ec);
        if (!ec) {
            fs::copy_file(source, target, fs::copy_options::overwrite_existing, ec);
        }
        if (ec) {
            const std::string reason = ec.message();
            fs::remove_all(next, ec);
            return Err<void>(Error{ErrorCode::Filesystem, "Cannot cache artifact: " + reason}.with_path(source));
        }
        entries.emplace(file.path, Entry{file.digest, file.size});
    }

    if (auto res = write_text(next / kManifestFile, manifest_to_json(profile_, recipient, entries).dump(2));
        res.is_error()) {
        fs::remove_all(next, ec);
        return res;
    }

    fs::remove_all(path_, ec);
    fs::rename(next, path_, ec);
    if (ec) {
        return Err<void>(Error{ErrorCode::Filesystem, "Cannot replace artifact cache: " + ec.message()}
                             .with_path(path_));
    }

    recipient_ = recipient;
    entries_ = std::move(entries);
    spdlog::debug("Artifact cache for [{}] updated ({} file(s))", profile_, entries_.size());
    return Ok();
}

} // namespace mist::sync
