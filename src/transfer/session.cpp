#include "bulkup/transfer/session.hpp"

#include <spdlog/spdlog.h>

namespace bulkup::transfer {
namespace {

bool is_terminal(SessionState state) {
    return state == SessionState::Complete || state == SessionState::Cancelled || state == SessionState::Failed;
}

// Forward edges only; Failed is handled separately
bool is_next_stage(SessionState current, SessionState target) {
    switch (current) {
        case SessionState::Idle:
            return target == SessionState::Discovering;
        case SessionState::Discovering:
            return target == SessionState::Transferring || target == SessionState::Cancelled;
        case SessionState::Transferring:
            return target == SessionState::Complete || target == SessionState::Cancelled;
        case SessionState::Complete:
        case SessionState::Cancelled:
        case SessionState::Failed:
            return false;
    }
    return false;
}


} // namespace

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "idle";
        case SessionState::Discovering: return "discovering";
        case SessionState::Transferring: return "transferring";
        case SessionState::Complete: return "complete";
        case SessionState::Cancelled: return "cancelled";
        case SessionState::Failed: return "failed";
    }
    return "unknown";
}

UploadSession::UploadSession(std::string session_id, std::string local_root) {
    info_.session_id = std::move(session_id);
    info_.local_root = std::move(local_root);
    info_.state = SessionState::Idle;
    last_transition_ = std::chrono::system_clock::now();
}

bool UploadSession::finished() const noexcept {
    return is_terminal(info_.state);
}

Result<void> UploadSession::start() {
    if (info_.state != SessionState::Idle) {
        return Err<void>(ErrorCode::InvalidArgument, std::string("Session already started"));
    }
    info_.started_at = std::chrono::system_clock::now();
    return transition_to(SessionState::Discovering);
}

Result<void> UploadSession::transition_to(SessionState next_state) {
    if (info_.state == next_state) {
        return Ok();
    }
    if (!can_transition(next_state)) {
        return Err<void>(ErrorCode::InvalidArgument,
                         std::string("Illegal session transition ") + to_string(info_.state) +
                         " -> " + to_string(next_state));
    }

    spdlog::debug("Session {}: {} -> {}", info_.session_id, to_string(info_.state), to_string(next_state));
    info_.state = next_state;
    last_transition_ = std::chrono::system_clock::now();
    return Ok();
}

Result<void> UploadSession::mark_failed(std::string error_message) {
    if (is_terminal(info_.state)) {
        return Err<void>(ErrorCode::InvalidArgument, std::string("Session already finished"));
    }
    info_.last_error = std::move(error_message);
    return transition_to(SessionState::Failed);
}

void UploadSession::update_pending(std::size_t files_pending, std::uint64_t bytes_pending) {
    info_.files_pending = files_pending;
    info_.bytes_pending = bytes_pending;
}

bool UploadSession::can_transition(SessionState target) const noexcept {
    if (is_terminal(info_.state)) {
        return false;
    }
    return target == SessionState::Failed || is_next_stage(info_.state, target);
}

} // namespace bulkup::transfer
