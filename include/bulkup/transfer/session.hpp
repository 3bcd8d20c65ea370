#pragma once

#include "bulkup/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace bulkup::transfer {

enum class SessionState {
    Idle,
    Discovering,
    Transferring,
    Complete,
    Cancelled,
    Failed
};

const char* to_string(SessionState state);

/**
 * @brief High-level summary of an active or finished upload run
 */
struct UploadSessionInfo {
    std::string session_id;
    std::string local_root;
    std::chrono::system_clock::time_point started_at{};
    SessionState state = SessionState::Idle;
    std::size_t files_pending = 0;
    std::uint64_t bytes_pending = 0;
    std::string last_error; ///< Populated when state == Failed
};

class UploadSession {
public:
    UploadSession(std::string session_id, std::string local_root);

    [[nodiscard]] const std::string& session_id() const noexcept { return info_.session_id; }
    [[nodiscard]] SessionState state() const noexcept { return info_.state; }
    [[nodiscard]] const UploadSessionInfo& info() const noexcept { return info_; }
    [[nodiscard]] bool finished() const noexcept;

    Result<void> start();
    Result<void> transition_to(SessionState next_state);
    Result<void> mark_failed(std::string error_message);

    void update_pending(std::size_t files_pending, std::uint64_t bytes_pending);

    [[nodiscard]] std::chrono::system_clock::time_point last_transition() const noexcept {
        return last_transition_;
    }

private:
    [[nodiscard]] bool can_transition(SessionState target) const noexcept;

    UploadSessionInfo info_;
    std::chrono::system_clock::time_point last_transition_{};
};

} // namespace bulkup::transfer
