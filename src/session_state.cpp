#include "session_state.h"
#include <stdexcept>
#include <utility>

namespace interview_coach {

std::optional<int> BehavioralContext::average_clarity() const {
    if (evaluations == 0) return std::nullopt;
    return (clarity_total + evaluations / 2) / evaluations;
}

std::optional<int> BehavioralContext::average_honesty() const {
    if (evaluations == 0) return std::nullopt;
    return (honesty_total + evaluations / 2) / evaluations;
}

SessionState::SessionState(CandidateMetadata candidate, SkillTree plan, int max_turns)
    : candidate_(std::move(candidate)),
      skill_tree_(std::move(plan)),
      max_turns_(max_turns),
      session_start_(iso_timestamp_now()) {}

void SessionState::ensure_mutable() const {
    if (closed_) {
        throw std::logic_error("session is closed");
    }
}

SkillTree& SessionState::skill_tree() {
    ensure_mutable();
    return skill_tree_;
}

BehavioralContext& SessionState::behavior() {
    ensure_mutable();
    return behavior_;
}

SessionStats& SessionState::stats() {
    ensure_mutable();
    return stats_;
}

int SessionState::begin_turn(std::string agent_visible_message,
                             std::optional<std::string> user_message) {
    ensure_mutable();
    if (open_turn_) {
        throw std::logic_error("turn " + std::to_string(open_turn_->turn_id) + " is still open");
    }

    Turn turn;
    turn.turn_id = ++turn_counter_;
    turn.agent_visible_message = std::move(agent_visible_message);
    turn.user_message = std::move(user_message);
    open_turn_ = std::move(turn);
    return turn_counter_;
}

void SessionState::append_note(std::string note) {
    ensure_mutable();
    if (!open_turn_) {
        throw std::logic_error("no open turn to annotate");
    }
    open_turn_->internal_thoughts.push_back(std::move(note));
}

const std::vector<std::string>& SessionState::open_notes() const {
    if (!open_turn_) {
        throw std::logic_error("no open turn");
    }
    return open_turn_->internal_thoughts;
}

const Turn& SessionState::close_turn() {
    ensure_mutable();
    if (!open_turn_) {
        throw std::logic_error("no open turn to close");
    }
    turns_.push_back(std::move(*open_turn_));
    open_turn_.reset();
    return turns_.back();
}

void SessionState::set_termination_reason(TerminationReason reason) {
    ensure_mutable();
    termination_reason_ = reason;
}

void SessionState::close() {
    ensure_mutable();
    if (open_turn_) {
        close_turn();
    }
    closed_ = true;
}

} // namespace interview_coach
