#include "mist/process/command.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace mist::process {
namespace {

Error spawn_error(const std::string& what) {
    return Error{ErrorCode::Filesystem, what + ": " + std::strerror(errno)};
}

void terminate_child(pid_t pid) {
    ::kill(pid, SIGTERM);
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
}

CommandResult decode_status(int status) {
    CommandResult result;
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signaled = true;
        result.exit_code = 128 + WTERMSIG(status);
    }
    return result;
}

bool cancelled(const CommandOptions& options) {
    return options.cancel != nullptr && options.cancel->is_cancelled();
}

} // namespace

std::string format_command(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& arg : argv) {
        if (!out.empty()) {
            out += ' ';
        }
        out += arg;
    }
    return out;
}

Result<CommandResult> run_command(const std::vector<std::string>& argv, const CommandOptions& options) {
    if (argv.empty()) {
        return Err<CommandResult>(ErrorCode::Filesystem, "Empty command line");
    }

    int pipefd[2] = {-1, -1};
    if (options.capture_output && ::pipe(pipefd) == -1) {
        return Err<CommandResult>(spawn_error("Failed to create output pipe"));
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    spdlog::debug("exec: {}", format_command(argv));

    const pid_t pid = ::fork();
    if (pid < 0) {
        if (options.capture_output) {
            ::close(pipefd[0]);
            ::close(pipefd[1]);
        }
        return Err<CommandResult>(spawn_error("Failed to fork"));
    }

    if (pid == 0) {
        if (options.capture_output) {
            ::dup2(pipefd[1], STDOUT_FILENO);
            ::dup2(pipefd[1], STDERR_FILENO);
            ::close(pipefd[0]);
            ::close(pipefd[1]);
        }
        ::execvp(args[0], args.data());
        _exit(kExecFailedStatus);
    }

    std::string output;
    if (options.capture_output) {
        ::close(pipefd[1]);
        char buffer[4096];
        bool open = true;
        while (open) {
            if (cancelled(options)) {
                ::close(pipefd[0]);
                terminate_child(pid);
                return Err<CommandResult>(ErrorCode::Cancelled, "Interrupted while running " + argv.front());
            }
            pollfd pfd{pipefd[0], POLLIN, 0};
            const int ready = ::poll(&pfd, 1, static_cast<int>(options.poll_interval.count()));
            if (ready < 0) {
                if (errno == EINTR) {
                    continue;
                }
                break;
            }
            if (ready == 0) {
                continue;
            }
            const ssize_t n = ::read(pipefd[0], buffer, sizeof(buffer));
            if (n > 0) {
                output.append(buffer, static_cast<std::size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                open = false;
            }
        }
        ::close(pipefd[0]);
    }

    int status = 0;
    while (true) {
        if (cancelled(options)) {
            terminate_child(pid);
            return Err<CommandResult>(ErrorCode::Cancelled, "Interrupted while running " + argv.front());
        }
        const pid_t done = ::waitpid(pid, &status, WNOHANG);
        if (done == pid) {
            break;
        }
        if (done < 0 && errno != EINTR) {
            return Err<CommandResult>(spawn_error("Failed to wait for " + argv.front()));
        }
        std::this_thread::sleep_for(options.poll_interval);
    }

    CommandResult result = decode_status(status);
    result.output = std::move(output);
    if (!result.output.empty()) {
        spdlog::debug("{} output:\n{}", argv.front(), result.output);
    }
    return Ok(std::move(result));
}

} // namespace mist::process
