#pragma once

#include "common.h"
#include "core/types.h"
#include "skill_tree.h"
#include <deque>
#include <optional>
#include <string>
#include <vector>

namespace interview_coach {

class StrategicPlanner;

/**
 * @brief Who is being interviewed, for what (immutable after session start)
 */
struct CandidateMetadata {
    std::string name;
    std::string role;
    std::string target_grade;
    std::string experience;
};

/**
 * @brief One exchange: the agent message shown, the candidate reply, and internal notes
 *
 * The closing turn has no user_message.
 */
struct Turn {
    int turn_id = 0;
    std::string agent_visible_message;
    std::optional<std::string> user_message;
    std::vector<std::string> internal_thoughts;
};

/**
 * @brief Running communication signals, written by BehavioralEvaluator
 */
struct BehavioralContext {
    Demeanor demeanor = Demeanor::Normal;
    StressLevel stress_level = StressLevel::Low;
    Engagement engagement = Engagement::Medium;
    int evaluations = 0;
    int clarity_total = 0;
    int honesty_total = 0;

    /// Rounded mean clarity, or nullopt before the first evaluation
    std::optional<int> average_clarity() const;
    std::optional<int> average_honesty() const;
};

/**
 * @brief Counters reported at the end of the interview
 */
struct SessionStats {
    int answers = 0;
    int questions = 0;
    int off_topic = 0;
    int hallucinations = 0;
    int contradictions = 0;
    int degraded_evaluations = 0;
};

/**
 * @brief Planner-private memory carried between turns
 */
struct PlannerMemory {
    std::deque<int> recent_scores;  ///< trailing technical scores, oldest first
    int expert_streak = 0;          ///< consecutive expert-depth answers
};

/**
 * @brief The single mutable aggregate of one interview
 *
 * Turn lifecycle: begin_turn() opens a turn, append_note() adds internal
 * notes, close_turn() freezes it into history. After close() every mutator
 * throws std::logic_error.
 */
class SessionState {
public:
    SessionState(CandidateMetadata candidate, SkillTree plan, int max_turns);

    const CandidateMetadata& candidate() const { return candidate_; }

    const SkillTree& skill_tree() const { return skill_tree_; }
    SkillTree& skill_tree();

    Protocol protocol() const { return protocol_; }
    const PlannerMemory& planner_memory() const { return planner_memory_; }

    const BehavioralContext& behavior() const { return behavior_; }
    BehavioralContext& behavior();

    const SessionStats& stats() const { return stats_; }
    SessionStats& stats();

    /// Number of turns opened so far (id of the latest turn)
    int turn_counter() const { return turn_counter_; }
    int max_turns() const { return max_turns_; }

    const std::vector<Turn>& turns() const { return turns_; }
    bool has_open_turn() const { return open_turn_.has_value(); }

    /**
     * @brief Open the next turn
     * @return The new turn id (previous id + 1)
     * @throws std::logic_error if a turn is already open or the session is closed
     */
    int begin_turn(std::string agent_visible_message, std::optional<std::string> user_message);

    /// @throws std::logic_error if no turn is open
    void append_note(std::string note);

    /// Notes of the open turn so far
    const std::vector<std::string>& open_notes() const;

    /// Freeze the open turn into history and return it
    const Turn& close_turn();

    bool closed() const { return closed_; }
    bool terminating() const { return termination_reason_ != TerminationReason::None; }
    TerminationReason termination_reason() const { return termination_reason_; }

    /// Record why the session ends; the closing turn may still be written
    void set_termination_reason(TerminationReason reason);

    /// Make the session read-only. Any open turn is closed first.
    void close();

    const std::string& session_start() const { return session_start_; }

private:
    friend class StrategicPlanner;

    void ensure_mutable() const;

    CandidateMetadata candidate_;
    SkillTree skill_tree_;
    Protocol protocol_ = Protocol::Standard;
    PlannerMemory planner_memory_;
    BehavioralContext behavior_;
    SessionStats stats_;

    int turn_counter_ = 0;
    int max_turns_;
    std::vector<Turn> turns_;
    std::optional<Turn> open_turn_;

    bool closed_ = false;
    TerminationReason termination_reason_ = TerminationReason::None;
    std::string session_start_;
};

} // namespace interview_coach
