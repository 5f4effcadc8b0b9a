#include "mist/config/profile.hpp"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <array>
#include <fstream>
#include <set>
#include <sstream>
#include <system_error>

namespace mist::config {
namespace fs = std::filesystem;

namespace {

struct KeySpec {
    const char* canonical;
    const char* alias;  // key name used by older configuration files
};

constexpr std::array<KeySpec, 7> kKnownKeys{{
    {"local_path", "folder"},
    {"remote_host", "ssh_address"},
    {"remote_path", nullptr},
    {"recipient", "gpg_id"},
    {"staging_path", "temp_folder"},
    {"gpg_program", nullptr},
    {"armor", nullptr},
}};

constexpr std::array<const char*, 4> kRequiredKeys{{"local_path", "remote_host", "remote_path", "recipient"}};

Error profile_error(ErrorCode code, const std::string& profile, const std::string& field, const std::string& msg) {
    Error error{code, msg};
    error.with_profile(profile).with_field(field);
    return error;
}

// "/a/b/" -> "/a/b"
fs::path normalized(const fs::path& path) {
    fs::path normal = path.lexically_normal();
    if (!normal.has_filename() && normal.has_relative_path()) {
        normal = normal.parent_path();
    }
    return normal;
}

const KeySpec* find_key_spec(const std::string& key) {
    for (const auto& spec : kKnownKeys) {
        if (key == spec.canonical || (spec.alias != nullptr && key == spec.alias)) {
            return &spec;
        }
    }
    return nullptr;
}

struct Entry {
    std::string key;  // spelling used in the file
    YAML::Node value;
};

using Entries = std::map<std::string, Entry>;

int line_of(const YAML::Node& node) {
    return node.Mark().line + 1;
}

/**
 * Fold aliases into canonical keys; rejects a key given under both names
 * or given twice.
 */
Result<Entries> canonical_entries(const std::string& profile, const YAML::Node& body) {
    Entries entries;
    for (auto it = body.begin(); it != body.end(); ++it) {
        if (!it->first.IsScalar()) {
            return Err<Entries>(ErrorCode::ParseError, "line " + std::to_string(line_of(it->first)) +
                                                           ": keys in profile [" + profile + "] must be plain names");
        }
        const std::string key = it->first.Scalar();
        const KeySpec* spec = find_key_spec(key);
        if (spec == nullptr) {
            spdlog::warn("Configuration: ignoring unknown key '{}' in profile [{}] (line {})",
                         key, profile, line_of(it->first));
            continue;
        }
        auto [found, inserted] = entries.emplace(spec->canonical, Entry{key, it->second});
        if (!inserted) {
            std::ostringstream oss;
            oss << "line " << line_of(it->first) << ": '" << key << "' duplicates '" << found->second.key
                << "' in profile [" << profile << "]";
            return Err<Entries>(ErrorCode::ParseError, oss.str());
        }
    }
    return Ok(std::move(entries));
}

Result<std::string> string_field(const Entries& entries, const std::string& profile, const std::string& key) {
    auto it = entries.find(key);
    if (it == entries.end()) {
        return Err<std::string>(ErrorCode::NotFound, key);
    }
    const YAML::Node& value = it->second.value;
    if (value.IsNull()) {
        return Ok(std::string{});
    }
    if (!value.IsScalar()) {
        return Err<std::string>(profile_error(ErrorCode::InvalidValue, profile, key,
                                              "Expected a string value for '" + key + "'"));
    }
    return Ok(value.Scalar());
}

Result<Profile> build_profile(const std::string& name, const YAML::Node& body, const fs::path& home) {
    if (!body.IsMap()) {
        return Err<Profile>(profile_error(ErrorCode::ParseError, name, "",
                                          "line " + std::to_string(line_of(body)) + ": profile [" + name +
                                              "] must be a mapping of keys to values"));
    }

    auto entries_result = canonical_entries(name, body);
    if (entries_result.is_error()) {
        return Err<Profile>(entries_result.error());
    }
    const auto& entries = entries_result.value();

    for (const char* key : kRequiredKeys) {
        auto value = string_field(entries, name, key);
        if (value.is_error() && value.error().code != ErrorCode::NotFound) {
            return Err<Profile>(value.error());
        }
        if (value.is_error() || value.value().empty()) {
            return Err<Profile>(profile_error(ErrorCode::MissingField, name, key,
                                              "Profile [" + name + "] is missing '" + key + "'"));
        }
    }

    Profile profile;
    profile.name = name;
    profile.local_path = normalized(expand_home(string_field(entries, name, "local_path").value(), home));
    profile.remote_host = string_field(entries, name, "remote_host").value();
    profile.remote_path = string_field(entries, name, "remote_path").value();
    profile.recipient = string_field(entries, name, "recipient").value();

    auto staging = string_field(entries, name, "staging_path");
    if (staging.is_ok()) {
        if (staging.value().empty()) {
            return Err<Profile>(profile_error(ErrorCode::InvalidValue, name, "staging_path",
                                              "'staging_path' must not be empty"));
        }
        profile.staging_path = normalized(expand_home(staging.value(), home));
    } else if (staging.error().code != ErrorCode::NotFound) {
        return Err<Profile>(staging.error());
    }

    auto gpg_program = string_field(entries, name, "gpg_program");
    if (gpg_program.is_ok()) {
        profile.gpg_program = expand_home(gpg_program.value(), home).string();
    } else if (gpg_program.error().code != ErrorCode::NotFound) {
        return Err<Profile>(gpg_program.error());
    }

    if (auto armor = entries.find("armor"); armor != entries.end()) {
        const YAML::Node& value = armor->second.value;
        bool parsed = false;
        if (!value.IsScalar() || !YAML::convert<bool>::decode(value, parsed)) {
            return Err<Profile>(profile_error(ErrorCode::InvalidValue, name, "armor",
                                              "Expected true or false for 'armor'"));
        }
        profile.armor = parsed;
    }

    if (profile.staging_path) {
        if (paths_overlap(*profile.staging_path, profile.local_path)) {
            return Err<Profile>(profile_error(ErrorCode::InvalidValue, name, "staging_path",
                                              "'staging_path' must not overlap 'local_path'"));
        }
        if (*profile.staging_path == normalized(profile.remote_path)) {
            return Err<Profile>(profile_error(ErrorCode::InvalidValue, name, "staging_path",
                                              "'staging_path' must not equal 'remote_path'"));
        }
    }

    return Ok(std::move(profile));
}

} // namespace

fs::path Profile::staging_root(const fs::path& home) const {
    return staging_path ? *staging_path : default_staging_root(home);
}

Result<Configuration> Configuration::load(const std::vector<fs::path>& search_paths, const fs::path& home) {
    for (const auto& candidate : search_paths) {
        std::error_code ec;
        if (!fs::is_regular_file(candidate, ec)) {
            spdlog::debug("Configuration: {} not found", candidate.string());
            continue;
        }

        std::ifstream input(candidate, std::ios::binary);
        if (!input) {
            return Err<Configuration>(Error{ErrorCode::Filesystem, "Failed to open configuration file"}
                                          .with_path(candidate));
        }
        std::ostringstream buffer;
        buffer << input.rdbuf();

        spdlog::debug("Configuration: loading {}", candidate.string());
        return parse(buffer.str(), candidate, home);
    }

    std::string tried;
    for (const auto& candidate : search_paths) {
        tried += "\n  " + candidate.string();
    }
    return Err<Configuration>(ErrorCode::NoFileFound, "No configuration file found; looked in:" + tried);
}

Result<Configuration> Configuration::parse(const std::string& text, const fs::path& origin, const fs::path& home) {
    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        Error error{ErrorCode::ParseError,
                    e.mark.is_null() ? e.msg : "line " + std::to_string(e.mark.line + 1) + ": " + e.msg};
        error.with_path(origin);
        return Err<Configuration>(std::move(error));
    }

    Configuration config;
    config.origin_ = origin;
    if (root.IsNull()) {
        return Ok(std::move(config));
    }
    if (!root.IsMap()) {
        return Err<Configuration>(Error{ErrorCode::ParseError, "Top level must map profile names to profiles"}
                                      .with_path(origin));
    }

    // yaml-cpp keeps every pair of a mapping, so a repeated profile name
    // shows up twice here.
    std::set<std::string> seen;
    for (auto it = root.begin(); it != root.end(); ++it) {
        if (!it->first.IsScalar()) {
            return Err<Configuration>(Error{ErrorCode::ParseError, "line " + std::to_string(line_of(it->first)) +
                                                                       ": profile names must be plain strings"}
                                          .with_path(origin));
        }
        const std::string name = it->first.Scalar();
        if (!seen.insert(name).second) {
            Error error{ErrorCode::DuplicateProfile,
                        "Profile [" + name + "] is defined more than once (again at line " +
                            std::to_string(line_of(it->first)) + ")"};
            error.with_profile(name).with_path(origin);
            return Err<Configuration>(std::move(error));
        }
    }

    for (auto it = root.begin(); it != root.end(); ++it) {
        const std::string name = it->first.Scalar();
        auto profile = build_profile(name, it->second, home);
        if (profile.is_error()) {
            Error error = profile.error();
            error.with_path(origin);
            return Err<Configuration>(std::move(error));
        }
        config.profiles_.emplace(name, std::move(profile.value()));
    }

    return Ok(std::move(config));
}

Result<Profile> Configuration::lookup(const std::string& name) const {
    auto it = profiles_.find(name);
    if (it == profiles_.end()) {
        Error error{ErrorCode::NotFound, "Profile [" + name + "] not found in " + origin_.string()};
        error.with_profile(name);
        return Err<Profile>(std::move(error));
    }
    return Ok(it->second);
}

std::vector<std::string> Configuration::profile_names() const {
    std::vector<std::string> names;
    names.reserve(profiles_.size());
    for (const auto& [name, _] : profiles_) {
        names.push_back(name);
    }
    return names;
}

std::vector<fs::path> default_search_paths(const fs::path& home) {
    return {
        home / ".config" / "mist" / "mist.yaml",
        home / ".config" / "mist.yaml",
        home / ".mist.yaml",
    };
}

fs::path default_staging_root(const fs::path& home) {
    return home / ".cache" / "mist";
}

fs::path expand_home(const std::string& value, const fs::path& home) {
    if (value == "~") {
        return home;
    }
    if (value.size() >= 2 && value[0] == '~' && value[1] == '/') {
        return home / value.substr(2);
    }
    return fs::path(value);
}

bool paths_overlap(const fs::path& a, const fs::path& b) {
    const auto lhs = normalized(a);
    const auto rhs = normalized(b);

    auto is_prefix = [](const fs::path& prefix, const fs::path& path) {
        auto q = path.begin();
        for (auto p = prefix.begin(); p != prefix.end(); ++p, ++q) {
            if (q == path.end() || *p != *q) {
                return false;
            }
        }
        return true;
    };

    return is_prefix(lhs, rhs) || is_prefix(rhs, lhs);
}

} // namespace mist::config
