#include "mist/cli/options.hpp"

namespace mist::cli {

namespace {

Result<CliOptions> usage_error(std::string message) {
    return Err<CliOptions>(ErrorCode::InvalidValue, std::move(message));
}

} // namespace

Result<CliOptions> parse_arguments(const std::vector<std::string>& args) {
    CliOptions options;
    bool push = false;
    bool pull = false;
    bool positional_only = false;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (!positional_only && arg == "--") {
            positional_only = true;
        } else if (!positional_only && (arg == "-p" || arg == "--push")) {
            push = true;
        } else if (!positional_only && (arg == "-P" || arg == "--pull")) {
            pull = true;
        } else if (!positional_only && (arg == "-y" || arg == "--assume-yes")) {
            options.assume_yes = true;
        } else if (!positional_only && (arg == "-v" || arg == "--verbose")) {
            options.verbose = true;
        } else if (!positional_only && (arg == "-q" || arg == "--quiet")) {
            options.quiet = true;
        } else if (!positional_only && (arg == "-h" || arg == "--help")) {
            options.help = true;
        } else if (!positional_only && arg == "--version") {
            options.version = true;
        } else if (!positional_only && (arg == "-c" || arg == "--config")) {
            if (i + 1 >= args.size()) {
                return usage_error(arg + " requires a file argument");
            }
            options.config_path = std::filesystem::path(args[++i]);
        } else if (!positional_only && arg.rfind("--config=", 0) == 0) {
            options.config_path = std::filesystem::path(arg.substr(9));
        } else if (!positional_only && arg.size() > 1 && arg[0] == '-') {
            return usage_error("Unknown option '" + arg + "'");
        } else if (options.profile.empty()) {
            options.profile = arg;
        } else {
            return usage_error("Unexpected argument '" + arg + "'");
        }
    }

    if (options.help || options.version) {
        return Ok(std::move(options));
    }

    if (push && pull) {
        return usage_error("--push and --pull are mutually exclusive");
    }
    if (options.verbose && options.quiet) {
        return usage_error("--verbose and --quiet are mutually exclusive");
    }
    if (options.profile.empty()) {
        return usage_error("Missing PROFILE");
    }

    options.mode = push ? sync::SyncMode::Push : pull ? sync::SyncMode::Pull : sync::SyncMode::Sync;
    return Ok(std::move(options));
}

std::string usage(const std::string& program) {
    return "Usage: " + program + " [options] PROFILE\n"
           "\n"
           "Keep a local directory in sync with an encrypted copy on an ssh host.\n"
           "Without --push or --pull both sides are reconciled.\n"
           "\n"
           "Options:\n"
           "  -p, --push          Mirror the local directory to the remote\n"
           "  -P, --pull          Mirror the remote into the local directory\n"
           "  -y, --assume-yes    Do not ask before overwriting anything\n"
           "  -c, --config FILE   Read profiles from FILE only\n"
           "  -v, --verbose       Log every file\n"
           "  -q, --quiet         Only log warnings and errors\n"
           "  -h, --help          Show this help\n"
           "      --version       Show the version\n"
           "\n"
           "Exit status: 0 done, 1 declined, 2 usage, 3 configuration, 4 encryption,\n"
           "5 sync engine, 6 already running, 7 local I/O, 130 interrupted.\n";
}

} // namespace mist::cli
