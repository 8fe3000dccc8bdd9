#pragma once

#include "atx/core/result.hpp"
#include "atx/transfer/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace atx::transfer {

enum class SequenceState {
    Planned,
    Initializing,
    Transferring,
    Finalizing,
    Completed,
    PartiallyFailed,
    Failed
};

std::string_view sequence_state_name(SequenceState state) noexcept;

[[nodiscard]] bool is_terminal(SequenceState state) noexcept;

struct StateTransition {
    SequenceState state;
    std::chrono::system_clock::time_point at;
};

/**
 * @brief Lifecycle of one sequence through initialize, transfer and finalize
 *
 * Planned -> Initializing -> Transferring -> Finalizing -> {Completed,
 * PartiallyFailed, Failed}. Any non-terminal state may fall to Failed.
 * Illegal transitions return InvalidConfig and leave the state untouched.
 *
 * THREAD SAFETY: owned by the sequence driver thread; not synchronized.
 */
class SequenceSession {
public:
    SequenceSession(std::uint32_t sequence_id, SequenceKind kind);

    [[nodiscard]] std::uint32_t sequence_id() const noexcept { return sequence_id_; }
    [[nodiscard]] SequenceKind kind() const noexcept { return kind_; }
    [[nodiscard]] SequenceState state() const noexcept { return state_; }
    [[nodiscard]] const std::string& upload_session_id() const noexcept { return upload_session_id_; }
    [[nodiscard]] const std::string& last_error() const noexcept { return last_error_; }
    [[nodiscard]] const std::vector<StateTransition>& history() const noexcept { return history_; }

    Result<void> transition_to(SequenceState next_state);
    Result<void> mark_failed(std::string error_message);

    void set_upload_session_id(std::string id) { upload_session_id_ = std::move(id); }

private:
    [[nodiscard]] bool can_transition(SequenceState target) const noexcept;

    std::uint32_t sequence_id_;
    SequenceKind kind_;
    SequenceState state_ = SequenceState::Planned;
    std::string upload_session_id_;
    std::string last_error_;
    std::vector<StateTransition> history_;
};

} // namespace atx::transfer
