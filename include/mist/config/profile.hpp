#pragma once

#include "mist/core/result.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mist::config {

/**
 * @brief One synchronized directory pairing
 */
struct Profile {
    std::string name;
    std::filesystem::path local_path;                   ///< Plaintext directory
    std::string remote_host;                            ///< ssh destination, e.g. "user@host"
    std::string remote_path;                            ///< Ciphertext directory on remote_host
    std::string recipient;                              ///< Encryption key id / fingerprint
    std::optional<std::filesystem::path> staging_path;  ///< Staging root override
    std::optional<std::string> gpg_program;             ///< Alternative gpg binary
    bool armor = false;                                 ///< ASCII-armored artifacts

    /// Configured staging root, or default_staging_root(home).
    [[nodiscard]] std::filesystem::path staging_root(const std::filesystem::path& home) const;

    /// "host:path" for log lines.
    [[nodiscard]] std::string remote_spec() const { return remote_host + ":" + remote_path; }
};

/**
 * @brief Immutable set of profiles loaded from one configuration file
 *
 * Produced once per invocation and passed by const reference; nothing
 * mutates it after load.
 */
class Configuration {
public:
    /**
     * @brief Load the first existing file among `search_paths`
     *
     * `home` is used to expand a leading "~/" in path values.
     */
    static Result<Configuration> load(const std::vector<std::filesystem::path>& search_paths,
                                      const std::filesystem::path& home);

    /**
     * @brief Parse configuration text that did not come from disk
     */
    static Result<Configuration> parse(const std::string& text,
                                       const std::filesystem::path& origin,
                                       const std::filesystem::path& home);

    /// Exact, case-sensitive lookup.
    [[nodiscard]] Result<Profile> lookup(const std::string& name) const;

    [[nodiscard]] const std::filesystem::path& origin() const noexcept { return origin_; }
    [[nodiscard]] std::size_t size() const noexcept { return profiles_.size(); }
    [[nodiscard]] std::vector<std::string> profile_names() const;

private:
    Configuration() = default;

    std::filesystem::path origin_;
    std::map<std::string, Profile> profiles_;
};

/// $HOME/.config/mist/mist.yaml, $HOME/.config/mist.yaml, $HOME/.mist.yaml
std::vector<std::filesystem::path> default_search_paths(const std::filesystem::path& home);

/// $HOME/.cache/mist
std::filesystem::path default_staging_root(const std::filesystem::path& home);

/// Replace a leading "~" or "~/" with `home`.
std::filesystem::path expand_home(const std::string& value, const std::filesystem::path& home);

/// True when one path equals or contains the other (lexically normalized).
bool paths_overlap(const std::filesystem::path& a, const std::filesystem::path& b);

} // namespace mist::config
