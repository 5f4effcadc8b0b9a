#include "mist/sync/session.hpp"

#include <algorithm>

namespace mist::sync {

const char* to_string(SyncMode mode) noexcept {
    switch (mode) {
        case SyncMode::Push: return "push";
        case SyncMode::Pull: return "pull";
        case SyncMode::Sync: return "sync";
    }
    return "unknown";
}

const char* to_string(SessionStatus status) noexcept {
    switch (status) {
        case SessionStatus::Idle: return "Idle";
        case SessionStatus::Staging: return "Staging";
        case SessionStatus::Transporting: return "Transporting";
        case SessionStatus::Reconciling: return "Reconciling";
        case SessionStatus::Done: return "Done";
        case SessionStatus::Failed: return "Failed";
    }
    return "Unknown";
}

const char* to_string(FileChange::Kind kind) noexcept {
    switch (kind) {
        case FileChange::Kind::Added: return "added";
        case FileChange::Kind::Modified: return "modified";
        case FileChange::Kind::Deleted: return "deleted";
    }
    return "unknown";
}

std::size_t ChangeSet::count(FileChange::Kind kind) const noexcept {
    return static_cast<std::size_t>(std::count_if(changes.begin(), changes.end(),
                                                  [kind](const FileChange& change) { return change.kind == kind; }));
}

std::vector<SessionStatus> SyncSession::plan_for(SyncMode mode) {
    switch (mode) {
        case SyncMode::Push:
            return {SessionStatus::Idle, SessionStatus::Staging, SessionStatus::Transporting, SessionStatus::Done};
        case SyncMode::Pull:
            return {SessionStatus::Idle, SessionStatus::Transporting, SessionStatus::Staging, SessionStatus::Done};
        case SyncMode::Sync:
            return {SessionStatus::Idle, SessionStatus::Staging, SessionStatus::Reconciling,
                    SessionStatus::Staging, SessionStatus::Done};
    }
    return {SessionStatus::Idle, SessionStatus::Done};
}

SyncSession::SyncSession(std::string profile, SyncMode mode)
    : profile_(std::move(profile)),
      mode_(mode),
      plan_(plan_for(mode)),
      started_at_(std::chrono::steady_clock::now()) {}

SessionStatus SyncSession::status() const noexcept {
    return failed() ? SessionStatus::Failed : plan_[step_];
}

std::optional<SessionStatus> SyncSession::next() const noexcept {
    if (finished() || step_ + 1 >= plan_.size()) {
        return std::nullopt;
    }
    return plan_[step_ + 1];
}

Result<void> SyncSession::transition_to(SessionStatus next_status) {
    if (next_status == SessionStatus::Failed) {
        return Err<void>(ErrorCode::InvalidValue, "Use fail() to enter Failed");
    }

    const auto expected = next();
    if (!expected || *expected != next_status) {
        return Err<void>(ErrorCode::InvalidValue,
                         std::string("Illegal session transition ") + to_string(status()) + " -> " +
                             to_string(next_status) + " for " + to_string(mode_));
    }

    ++step_;
    return Ok();
}

Result<void> SyncSession::fail(Error reason) {
    if (finished()) {
        return Err<void>(ErrorCode::InvalidValue,
                         std::string("Session already finished as ") + to_string(status()));
    }
    failure_ = std::move(reason);
    return Ok();
}

std::chrono::milliseconds SyncSession::elapsed() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at_);
}

} // namespace mist::sync
