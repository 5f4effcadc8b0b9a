#pragma once

#include "mist/core/cancellation.hpp"
#include "mist/core/result.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace mist::process {

/// Exit status reported when the program could not be executed at all.
constexpr int kExecFailedStatus = 127;

struct CommandOptions {
    bool capture_output = true;                 ///< Collect stdout+stderr instead of inheriting them
    const CancellationToken* cancel = nullptr;  ///< Polled while the child runs
    std::chrono::milliseconds poll_interval{50};
};

struct CommandResult {
    int exit_code = 0;
    bool signaled = false;  ///< Child was terminated by a signal
    std::string output;     ///< Captured stdout+stderr (empty unless capture_output)

    [[nodiscard]] bool success() const noexcept { return !signaled && exit_code == 0; }
};

/**
 * @brief Run argv[0] with execvp and wait for it
 *
 * Never goes through a shell. When the cancellation token fires the child
 * gets SIGTERM, is reaped, and the call fails with ErrorCode::Cancelled.
 */
Result<CommandResult> run_command(const std::vector<std::string>& argv,
                                  const CommandOptions& options = {});

/// Render argv for log lines ("gpg --batch ...").
std::string format_command(const std::vector<std::string>& argv);

} // namespace mist::process
