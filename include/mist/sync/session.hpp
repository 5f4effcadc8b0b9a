#pragma once

#include "mist/core/result.hpp"
#include "mist/sync/types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace mist::sync {

/**
 * @brief Runtime state of one invocation
 *
 * Each mode walks a fixed linear plan:
 *   Push  Idle -> Staging -> Transporting -> Done
 *   Pull  Idle -> Transporting -> Staging -> Done
 *   Sync  Idle -> Staging -> Reconciling -> Staging -> Done
 *
 * fail() is accepted from any non-terminal status; Done and Failed are
 * final.
 */
class SyncSession {
public:
    SyncSession(std::string profile, SyncMode mode);

    [[nodiscard]] const std::string& profile() const noexcept { return profile_; }
    [[nodiscard]] SyncMode mode() const noexcept { return mode_; }
    [[nodiscard]] SessionStatus status() const noexcept;
    [[nodiscard]] bool finished() const noexcept { return failed() || status() == SessionStatus::Done; }
    [[nodiscard]] bool failed() const noexcept { return failure_.has_value(); }
    [[nodiscard]] const std::optional<Error>& failure() const noexcept { return failure_; }

    /// Next status the plan expects, nullopt once finished.
    [[nodiscard]] std::optional<SessionStatus> next() const noexcept;

    /**
     * @brief Advance to `next_status`
     *
     * Only the next step of the plan is accepted.
     */
    Result<void> transition_to(SessionStatus next_status);

    Result<void> fail(Error reason);

    [[nodiscard]] std::chrono::milliseconds elapsed() const;

    /// Status sequence for `mode`, starting at Idle and ending at Done.
    static std::vector<SessionStatus> plan_for(SyncMode mode);

private:
    std::string profile_;
    SyncMode mode_;
    std::vector<SessionStatus> plan_;
    std::size_t step_ = 0;
    std::optional<Error> failure_;
    std::chrono::steady_clock::time_point started_at_;
};

} // namespace mist::sync
