#pragma once

#include "mist/core/result.hpp"
#include "mist/sync/types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace mist::cli {

constexpr const char* kVersion = "0.3.0";

struct CliOptions {
    std::string profile;
    sync::SyncMode mode = sync::SyncMode::Sync;
    bool assume_yes = false;
    std::optional<std::filesystem::path> config_path;
    bool verbose = false;
    bool quiet = false;
    bool help = false;
    bool version = false;
};

/**
 * @brief Parse argv (without the program name)
 *
 * Usage mistakes come back as ErrorCode::InvalidValue; the caller prints
 * usage() and exits with exit_code::kUsage.
 */
Result<CliOptions> parse_arguments(const std::vector<std::string>& args);

std::string usage(const std::string& program);

} // namespace mist::cli
