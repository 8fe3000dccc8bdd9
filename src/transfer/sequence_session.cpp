#include "atx/transfer/sequence_session.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <map>

namespace atx::transfer {
namespace {

bool is_progressive(SequenceState current, SequenceState target) {
    static const std::map<SequenceState, std::vector<SequenceState>> transitions {
        {SequenceState::Planned, {SequenceState::Initializing}},
        {SequenceState::Initializing, {SequenceState::Transferring}},
        {SequenceState::Transferring, {SequenceState::Finalizing}},
        {SequenceState::Finalizing, {SequenceState::Completed, SequenceState::PartiallyFailed}},
    };

    if (target == SequenceState::Failed) {
        return true;
    }

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed_list = it->second;
    return std::find(allowed_list.begin(), allowed_list.end(), target) != allowed_list.end();
}

} // namespace

std::string_view sequence_state_name(SequenceState state) noexcept {
    switch (state) {
        case SequenceState::Planned: return "planned";
        case SequenceState::Initializing: return "initializing";
        case SequenceState::Transferring: return "transferring";
        case SequenceState::Finalizing: return "finalizing";
        case SequenceState::Completed: return "completed";
        case SequenceState::PartiallyFailed: return "partially_failed";
        case SequenceState::Failed: return "failed";
    }
    return "unknown";
}

bool is_terminal(SequenceState state) noexcept {
    return state == SequenceState::Completed ||
           state == SequenceState::PartiallyFailed ||
           state == SequenceState::Failed;
}

SequenceSession::SequenceSession(std::uint32_t sequence_id, SequenceKind kind)
    : sequence_id_(sequence_id), kind_(kind) {
    history_.push_back({state_, std::chrono::system_clock::now()});
}

Result<void> SequenceSession::transition_to(SequenceState next_state) {
    if (state_ == next_state) {
        return Ok();
    }

    if (!can_transition(next_state)) {
        return Err<void>(ErrorCode::InvalidConfig,
            "Illegal sequence state transition " + std::string(sequence_state_name(state_)) +
            " -> " + std::string(sequence_state_name(next_state)));
    }

    spdlog::debug("[SequenceState] sequence={} {} -> {}", sequence_id_,
                  sequence_state_name(state_), sequence_state_name(next_state));
    state_ = next_state;
    history_.push_back({state_, std::chrono::system_clock::now()});
    return Ok();
}

Result<void> SequenceSession::mark_failed(std::string error_message) {
    if (is_terminal(state_)) {
        return Err<void>(ErrorCode::InvalidConfig,
            "Sequence " + std::to_string(sequence_id_) + " already finished as " +
            std::string(sequence_state_name(state_)));
    }
    last_error_ = std::move(error_message);
    return transition_to(SequenceState::Failed);
}

bool SequenceSession::can_transition(SequenceState target) const noexcept {
    if (state_ == target) {
        return true;
    }
    if (is_terminal(state_)) {
        return false;
    }
    return is_progressive(state_, target);
}

} // namespace atx::transfer
