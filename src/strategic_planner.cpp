#include "strategic_planner.h"
#include "core/constants.h"
#include "logger.h"
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace interview_coach {

namespace {

void finish_terminate(PlannerDecision& decision, TerminationReason reason, const std::string& why) {
    decision.terminate = true;
    decision.reason = reason;
    decision.directive = Directive::Terminate;
    decision.thought += (decision.thought.empty() ? "" : " ") + why;
}

} // namespace

PlannerDecision StrategicPlanner::plan(const SessionState& state, Intent intent,
                                       const std::optional<TechnicalEvaluation>& technical) const {
    const SkillTree& tree = state.skill_tree();
    const PlannerMemory& memory = state.planner_memory();

    PlannerDecision decision;
    decision.protocol = state.protocol();
    decision.cursor = tree.cursor();
    decision.recent_scores = memory.recent_scores;
    decision.expert_streak = memory.expert_streak;

    // Rule 1
    if (intent == Intent::Stop) {
        finish_terminate(decision, TerminationReason::CandidateStop, "Candidate asked to stop.");
        return decision;
    }

    switch (intent) {
        case Intent::Question:
            decision.directive = Directive::AnswerQuestion;
            decision.thought = "Candidate asked a question; answer it and re-pose the pending one.";
            break;

        case Intent::OffTopic:
            decision.directive = Directive::Redirect;
            decision.thought = "Off-topic message; steer back to the pending question.";
            break;

        case Intent::Answer: {
            int score = constants::scoring::NEUTRAL_SCORE;
            if (technical) {
                score = technical->score;
            } else {
                decision.degraded = true;
                decision.thought = "Degraded evaluation: neutral score used, topic stays open.";
            }

            decision.recent_scores.push_back(score);
            while (decision.recent_scores.size() > constants::planner::SCORE_WINDOW) {
                decision.recent_scores.pop_front();
            }
            decision.expert_streak = (technical && technical->depth == Depth::Expert)
                                         ? decision.expert_streak + 1
                                         : 0;

            Protocol previous = decision.protocol;
            decision.protocol = next_protocol(previous, decision.recent_scores, decision.expert_streak);
            if (decision.protocol != previous) {
                // Stress test needs its expert streak under speedrun itself
                if (decision.protocol == Protocol::Speedrun) decision.expert_streak = 0;
                std::string change = std::string("Protocol ") + to_string(previous) + " -> " +
                                     to_string(decision.protocol) + ".";
                decision.thought += (decision.thought.empty() ? "" : " ") + change;
            }

            const Topic* active = tree.active_topic();
            if (!active) {
                finish_terminate(decision, TerminationReason::PlanExhausted, "No topics left.");
                break;
            }

            if (!active->covered()) {
                decision.directive = flavour(decision.protocol, Directive::AskFollowup);
            } else {
                auto next = tree.next_uncovered(tree.cursor() + 1);
                if (!next) {
                    decision.cursor = tree.size();
                    finish_terminate(decision, TerminationReason::PlanExhausted,
                                     "All topics covered.");
                    break;
                }
                decision.cursor = *next;
                decision.topic_advanced = true;
                decision.directive = flavour(decision.protocol, Directive::AdvanceTopic);
                std::string move = "Topic '" + active->label() + "' covered, next: '" +
                                   tree.at(*next).label() + "'.";
                decision.thought += (decision.thought.empty() ? "" : " ") + move;
            }
            break;
        }

        case Intent::Stop:
            break;
    }

    // Rule 2
    if (!decision.terminate && state.turn_counter() + 1 >= state.max_turns()) {
        finish_terminate(decision, TerminationReason::TurnLimit, "Turn limit reached.");
    }

    LOG_PLANNER(std::string("directive=") + to_string(decision.directive) +
                " protocol=" + to_string(decision.protocol) +
                " cursor=" + std::to_string(decision.cursor));
    return decision;
}

void StrategicPlanner::commit(SessionState& state, const PlannerDecision& decision) const {
    SkillTree& tree = state.skill_tree();
    if (decision.cursor != tree.cursor()) {
        tree.advance_to(decision.cursor);
    }
    state.protocol_ = decision.protocol;
    state.planner_memory_.recent_scores = decision.recent_scores;
    state.planner_memory_.expert_streak = decision.expert_streak;
}

Protocol StrategicPlanner::next_protocol(Protocol current, const std::deque<int>& window, int expert_streak) {
    if (window.size() < constants::planner::SCORE_WINDOW) {
        return current;
    }

    bool all_low = std::all_of(window.begin(), window.end(), [](int s) {
        return s <= constants::planner::RESCUE_MAX_SCORE;
    });
    bool all_high = std::all_of(window.begin(), window.end(), [](int s) {
        return s >= constants::planner::SPEEDRUN_MIN_SCORE;
    });
    bool all_band = std::all_of(window.begin(), window.end(), [](int s) {
        return s >= constants::planner::STANDARD_BAND_MIN && s <= constants::planner::STANDARD_BAND_MAX;
    });

    if (all_low) {
        return Protocol::Rescue;
    }
    if (current == Protocol::Speedrun && expert_streak >= constants::planner::STRESS_EXPERT_STREAK) {
        return Protocol::StressTest;
    }
    if (all_high && current != Protocol::StressTest) {
        return Protocol::Speedrun;
    }
    if (all_band) {
        return Protocol::Standard;
    }
    return current;
}

Directive StrategicPlanner::flavour(Protocol protocol, Directive base) {
    switch (protocol) {
        case Protocol::Standard:   return base;
        case Protocol::Rescue:     return Directive::Rescue;
        case Protocol::Speedrun:   return Directive::SpeedrunNext;
        case Protocol::StressTest: return Directive::StressProbe;
    }
    return base;
}

std::string StrategicPlanner::format_note(const PlannerDecision& decision) {
    std::ostringstream oss;
    oss << "[Planner]: " << to_string(decision.directive) << " (protocol "
        << to_string(decision.protocol) << ")";
    if (decision.terminate) {
        oss << ", terminating: " << to_string(decision.reason);
    }
    if (!decision.thought.empty()) {
        oss << ". " << decision.thought;
    }
    return oss.str();
}

} // namespace interview_coach
