#include "mist/sync/rsync_unison_engine.hpp"
#include "mist/process/command.hpp"
#include "mist/sync/tree_scanner.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <system_error>

namespace mist::sync {
namespace fs = std::filesystem;

namespace {

constexpr int kSshConnectionFailure = 255;

// rsync exit codes that mean the other end was never (or no longer) reachable
constexpr int kRsyncTransportCodes[] = {5, 10, 12, 30, 35, 255};

std::string last_line(const std::string& output) {
    const auto end = output.find_last_not_of("\r\n");
    if (end == std::string::npos) {
        return {};
    }
    const auto newline = output.find_last_of('\n', end);
    const auto start = newline == std::string::npos ? 0 : newline + 1;
    return output.substr(start, end - start + 1);
}

std::string with_trailing_slash(std::string path) {
    if (path.empty() || path.back() != '/') {
        path.push_back('/');
    }
    return path;
}

std::string rsync_spec(const Endpoint& endpoint) {
    const std::string path = with_trailing_slash(endpoint.path);
    return endpoint.is_remote() ? endpoint.host + ":" + path : path;
}

Error command_error(ErrorCode code, const std::string& tool, int exit_code, const std::string& output) {
    std::string message = tool + " exited with status " + std::to_string(exit_code);
    const std::string detail = last_line(output);
    if (!detail.empty()) {
        message += ": " + detail;
    }
    return Error{code, std::move(message)};
}

} // namespace

std::string shell_quote(const std::string& text) {
    std::string quoted = "'";
    for (char c : text) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted.push_back(c);
        }
    }
    quoted.push_back('\'');
    return quoted;
}

std::vector<std::string> RsyncUnisonEngine::probe_command(const Endpoint& endpoint) const {
    return {options_.ssh_program, endpoint.host, "test -d " + shell_quote(endpoint.path)};
}

std::vector<std::string> RsyncUnisonEngine::prepare_command(const Endpoint& endpoint) const {
    return {options_.ssh_program, endpoint.host, "mkdir -p " + shell_quote(endpoint.path)};
}

std::vector<std::string> RsyncUnisonEngine::mirror_command(const Endpoint& source, const Endpoint& destination) const {
    return {options_.rsync_program, "-a", "--delete", "--checksum", "--protect-args",
            "-e", options_.ssh_program, rsync_spec(source), rsync_spec(destination)};
}

std::vector<std::string> RsyncUnisonEngine::reconcile_command(const fs::path& local_replica,
                                                              const Endpoint& remote) const {
    std::vector<std::string> argv{options_.unison_program, local_replica.string()};
    // ssh://host//abs/path for absolute remote paths, ssh://host/rel for home-relative ones
    argv.push_back("ssh://" + remote.host + "/" + remote.path);
    argv.insert(argv.end(), {"-auto", "-times", "-perms", "0", "-ui", "text", "-sshcmd", options_.ssh_program});
    if (options_.batch) {
        argv.emplace_back("-batch");
    }
    return argv;
}

Result<void> RsyncUnisonEngine::classify_rsync_exit(int exit_code, const std::string& output) {
    if (exit_code == 0) {
        return Ok();
    }
    if (exit_code == process::kExecFailedStatus) {
        return Err<void>(ErrorCode::EngineFailure, "rsync could not be executed");
    }
    const bool transport = std::find(std::begin(kRsyncTransportCodes), std::end(kRsyncTransportCodes),
                                     exit_code) != std::end(kRsyncTransportCodes);
    return Err<void>(command_error(transport ? ErrorCode::TransportFailure : ErrorCode::EngineFailure,
                                   "rsync", exit_code, output));
}

Result<void> RsyncUnisonEngine::classify_unison_exit(int exit_code, const std::string& output) {
    if (exit_code == 0) {
        return Ok();
    }
    if (exit_code == 1) {
        spdlog::warn("unison skipped some files; run again without --assume-yes to resolve them");
        return Ok();
    }
    if (exit_code == process::kExecFailedStatus) {
        return Err<void>(ErrorCode::EngineFailure, "unison could not be executed");
    }
    const bool transport = output.find("Lost connection") != std::string::npos ||
                           output.find("Connection refused") != std::string::npos ||
                           output.find("Could not resolve hostname") != std::string::npos;
    return Err<void>(command_error(transport ? ErrorCode::TransportFailure : ErrorCode::EngineFailure,
                                   "unison", exit_code, output));
}

Result<bool> RsyncUnisonEngine::probe(const Endpoint& endpoint) {
    if (!endpoint.is_remote()) {
        std::error_code ec;
        return Ok(fs::is_directory(endpoint.path, ec));
    }

    process::CommandOptions opts;
    opts.cancel = options_.cancel;
    auto run = process::run_command(probe_command(endpoint), opts);
    if (run.is_error()) {
        return Err<bool>(run.error());
    }

    const auto& result = run.value();
    if (result.exit_code == kSshConnectionFailure || result.exit_code == process::kExecFailedStatus) {
        return Err<bool>(command_error(ErrorCode::TransportFailure, "ssh", result.exit_code, result.output));
    }
    return Ok(result.exit_code == 0);
}

Result<void> RsyncUnisonEngine::prepare(const Endpoint& destination) {
    if (!destination.is_remote()) {
        std::error_code ec;
        fs::create_directories(destination.path, ec);
        if (ec) {
            return Err<void>(Error{ErrorCode::Filesystem, "Cannot create directory: " + ec.message()}
                                 .with_path(destination.path));
        }
        return Ok();
    }

    process::CommandOptions opts;
    opts.cancel = options_.cancel;
    auto run = process::run_command(prepare_command(destination), opts);
    if (run.is_error()) {
        return Err<void>(run.error());
    }

    const auto& result = run.value();
    if (result.success()) {
        return Ok();
    }
    const ErrorCode code = (result.exit_code == kSshConnectionFailure || result.exit_code == process::kExecFailedStatus)
                               ? ErrorCode::TransportFailure
                               : ErrorCode::EngineFailure;
    return Err<void>(command_error(code, "ssh", result.exit_code, result.output));
}

Result<void> RsyncUnisonEngine::mirror(const Endpoint& source, const Endpoint& destination) {
    if (auto res = prepare(destination); res.is_error()) {
        return res;
    }

    process::CommandOptions opts;
    opts.cancel = options_.cancel;
    auto run = process::run_command(mirror_command(source, destination), opts);
    if (run.is_error()) {
        return Err<void>(run.error());
    }
    return classify_rsync_exit(run.value().exit_code, run.value().output);
}

Result<ChangeSet> RsyncUnisonEngine::reconcile(const fs::path& local_replica, const Endpoint& remote) {
    if (auto res = prepare(remote); res.is_error()) {
        return Err<ChangeSet>(res.error());
    }

    auto before = TreeScanner::snapshot(local_replica);
    if (before.is_error()) {
        return Err<ChangeSet>(before.error());
    }

    process::CommandOptions opts;
    opts.cancel = options_.cancel;
    // Interactive unison needs the terminal
    opts.capture_output = options_.batch;
    auto run = process::run_command(reconcile_command(local_replica, remote), opts);
    if (run.is_error()) {
        return Err<ChangeSet>(run.error());
    }
    if (auto res = classify_unison_exit(run.value().exit_code, run.value().output); res.is_error()) {
        return Err<ChangeSet>(res.error());
    }

    auto after = TreeScanner::snapshot(local_replica);
    if (after.is_error()) {
        return Err<ChangeSet>(after.error());
    }
    return Ok(TreeScanner::diff(before.value(), after.value()));
}

} // namespace mist::sync
