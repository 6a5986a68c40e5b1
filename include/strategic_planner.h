#pragma once

#include "core/types.h"
#include "session_state.h"
#include "technical_evaluator.h"
#include <deque>
#include <optional>
#include <string>

namespace interview_coach {

/**
 * @brief Everything the planner decided for one turn
 */
struct PlannerDecision {
    Directive directive = Directive::AskFollowup;
    Protocol protocol = Protocol::Standard;
    size_t cursor = 0;
    bool topic_advanced = false;
    bool terminate = false;
    TerminationReason reason = TerminationReason::None;
    bool degraded = false;  ///< technical evaluation was missing; neutral score used

    std::deque<int> recent_scores;
    int expert_streak = 0;

    std::string thought;
};

/**
 * @brief The decision core: chooses directive, protocol and cursor each turn
 *
 * plan() is pure; commit() is the only writer of the protocol, the skill
 * tree cursor and the planner memory.
 *
 * Rules, in order:
 *  1. stop terminates (protocol and cursor untouched)
 *  2. turn_counter + 1 >= max_turns terminates, whatever the intent
 *  3. question: answer it and re-pose, no question slot used
 *  4. off_topic: redirect, no question slot used
 *  5. answer: protocol transition over the trailing score window, then
 *     follow up on an uncovered topic or advance to the next uncovered one
 */
class StrategicPlanner {
public:
    StrategicPlanner() = default;

    /**
     * @param technical Skeptic result for an answer turn; nullopt means the
     *        evaluation degraded (or the intent was not an answer)
     */
    PlannerDecision plan(const SessionState& state, Intent intent,
                         const std::optional<TechnicalEvaluation>& technical) const;

    /**
     * @brief Write the decision into the session
     * @throws std::logic_error if the decision would move the cursor backwards
     */
    void commit(SessionState& state, const PlannerDecision& decision) const;

    /**
     * @brief Protocol transition over a full score window
     * @param current Protocol before this answer
     * @param window Trailing scores, oldest first
     * @param expert_streak Consecutive expert-depth answers under the current protocol
     */
    static Protocol next_protocol(Protocol current, const std::deque<int>& window, int expert_streak);

    /// Protocol-flavoured directive for a regular answer turn
    static Directive flavour(Protocol protocol, Directive base);

    /// "[Planner]: ..." note text for a decision
    static std::string format_note(const PlannerDecision& decision);
};

} // namespace interview_coach
