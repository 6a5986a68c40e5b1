/**
 * Skill tree and session state bookkeeping.
 * Asserts:
 * - A topic takes exactly two evaluated answers and is covered at two.
 * - Scoring a covered topic is a logic error.
 * - The cursor only moves forward.
 * - Both score policies (last value, rounded average).
 * - Turn ids are 1, 2, 3 ... and a closed session rejects mutation.
 *
 * Run from build dir: ./test_skill_tree
 */

#include "session_state.h"
#include "skill_tree.h"
#include "strategic_planner.h"
#include "technical_evaluator.h"
#include "test_support.h"
#include <iostream>
#include <stdexcept>

using namespace interview_coach;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

template<typename F>
static bool throws_logic_error(F&& f) {
    try {
        f();
    } catch (const std::logic_error&) {
        return true;
    }
    return false;
}

int main() {
    auto provider = std::make_shared<ScriptedProvider>();

    // --- construction ---
    {
        SkillTree tree(test_support::topics(3));
        ASSERT(tree.size() == 3);
        ASSERT(tree.cursor() == 0);
        ASSERT(!tree.exhausted());
        ASSERT(tree.active_topic() != nullptr);
        ASSERT(tree.active_topic()->label() == "Topic 1");
        ASSERT(tree.active_topic()->required_questions() == 2);
        ASSERT(!tree.active_topic()->score().has_value());
        ASSERT(tree.covered_count() == 0);

        SkillTree empty;
        ASSERT(empty.exhausted());
        ASSERT(empty.active_topic() == nullptr);
        ASSERT(!empty.next_uncovered(0).has_value());
    }

    // --- quota and last-value policy ---
    {
        SessionState state(test_support::candidate(), SkillTree(test_support::topics(2)), 10);
        TechnicalEvaluator skeptic(provider, ScorePolicy::LastValue);

        TechnicalEvaluation first = test_support::technical(9);
        first.correct_answer = "Use a context with cancellation";
        skeptic.apply(state, first);
        const Topic& topic = state.skill_tree().at(0);
        ASSERT(topic.questions_asked() == 1);
        ASSERT(!topic.covered());
        ASSERT(topic.score() == 9);
        ASSERT(topic.correct_answer() == std::string("Use a context with cancellation"));

        skeptic.apply(state, test_support::technical(4));
        ASSERT(topic.questions_asked() == 2);
        ASSERT(topic.covered());
        ASSERT(topic.score() == 4);
        ASSERT(topic.score_history().size() == 2);
        ASSERT(topic.correct_answer() == std::string("Use a context with cancellation"));
        ASSERT(state.skill_tree().covered_count() == 1);

        // Cursor still on the covered topic until the planner moves it
        ASSERT(throws_logic_error([&] { skeptic.apply(state, test_support::technical(7)); }));
        ASSERT(topic.questions_asked() == 2);
        ASSERT(state.skill_tree().next_uncovered(0) == size_t(1));
    }

    // --- average policy ---
    {
        SessionState state(test_support::candidate(), SkillTree(test_support::topics(1)), 10);
        TechnicalEvaluator skeptic(provider, ScorePolicy::Average);
        skeptic.apply(state, test_support::technical(9));
        ASSERT(state.skill_tree().at(0).score() == 9);
        skeptic.apply(state, test_support::technical(4));
        ASSERT(state.skill_tree().at(0).score() == 7);  // (9 + 4) / 2 rounded
        ASSERT(state.skill_tree().at(0).covered());
    }

    // --- cursor moves forward only ---
    {
        SessionState state(test_support::candidate(), SkillTree(test_support::topics(3)), 10);
        StrategicPlanner planner;

        PlannerDecision forward;
        forward.protocol = state.protocol();
        forward.cursor = 2;
        planner.commit(state, forward);
        ASSERT(state.skill_tree().cursor() == 2);

        PlannerDecision backward = forward;
        backward.cursor = 1;
        ASSERT(throws_logic_error([&] { planner.commit(state, backward); }));
        ASSERT(state.skill_tree().cursor() == 2);

        PlannerDecision past_end = forward;
        past_end.cursor = 4;
        ASSERT(throws_logic_error([&] { planner.commit(state, past_end); }));

        PlannerDecision to_end = forward;
        to_end.cursor = 3;
        planner.commit(state, to_end);
        ASSERT(state.skill_tree().exhausted());
        ASSERT(state.skill_tree().active_topic() == nullptr);
    }

    // --- evaluator with nothing to score ---
    {
        SessionState state(test_support::candidate(), SkillTree(), 10);
        TechnicalEvaluator skeptic(provider);
        ASSERT(throws_logic_error([&] { skeptic.apply(state, test_support::technical(5)); }));
    }

    // --- turn ids and session lifecycle ---
    {
        SessionState state(test_support::candidate(), SkillTree(test_support::topics(2)), 10);
        ASSERT(state.turn_counter() == 0);
        ASSERT(!state.session_start().empty());

        int first = state.begin_turn("Tell me about yourself.", std::string("I build services."));
        ASSERT(first == 1);
        ASSERT(throws_logic_error([&] { state.begin_turn("again", std::nullopt); }));
        state.append_note("[Router]: answer");
        ASSERT(state.open_notes().size() == 1);
        const Turn& closed = state.close_turn();
        ASSERT(closed.turn_id == 1);
        ASSERT(closed.internal_thoughts.size() == 1);
        ASSERT(throws_logic_error([&] { state.append_note("late"); }));

        int second = state.begin_turn("Next?", std::string("Sure."));
        ASSERT(second == 2);
        state.close_turn();

        state.set_termination_reason(TerminationReason::CandidateStop);
        ASSERT(state.terminating());
        int closing = state.begin_turn("Report", std::nullopt);
        ASSERT(closing == 3);
        state.close();
        ASSERT(state.closed());
        ASSERT(!state.has_open_turn());
        ASSERT(state.turns().size() == 3);
        ASSERT(!state.turns().back().user_message.has_value());
        for (size_t i = 0; i < state.turns().size(); ++i) {
            ASSERT(state.turns()[i].turn_id == static_cast<int>(i + 1));
        }

        ASSERT(throws_logic_error([&] { state.begin_turn("more", std::nullopt); }));
        ASSERT(throws_logic_error([&] { state.stats(); }));
        ASSERT(throws_logic_error([&] { state.skill_tree(); }));
        ASSERT(state.termination_reason() == TerminationReason::CandidateStop);
    }

    // --- behavioural averages ---
    {
        BehavioralContext context;
        ASSERT(!context.average_clarity().has_value());
        context.evaluations = 2;
        context.clarity_total = 13;
        context.honesty_total = 16;
        ASSERT(context.average_clarity() == 7);
        ASSERT(context.average_honesty() == 8);
    }

    if (failed > 0) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All skill tree tests passed.\n";
    return 0;
}
