/**
 * End-to-end turn loop over a scripted provider.
 * Asserts:
 * - Scenario A: steady high scores reach speedrun by turn 2, cursor 2 after turn 4.
 * - Scenario B: "stop" on turn 1 ends the interview with a report.
 * - Scenario C: a failed technical evaluation degrades the turn, the topic stays open.
 * - Out-of-range, oversized and fractional scores degrade the turn the same way.
 * - Scenario D: off-topic replies run into the turn limit; records never exceed max_turns.
 * - Turn ids are gap-free, the closing turn carries no user message.
 * - Generation retry and early termination, reporting retry and fallback,
 *   provider timeouts, plan fallback, interrupts.
 *
 * Run from build dir: ./test_interview_engine
 */

#include "interview_engine.h"
#include "logger.h"
#include "test_support.h"
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace interview_coach;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

namespace {

bool ids_gap_free(const SessionState& state) {
    const auto& turns = state.turns();
    for (size_t i = 0; i < turns.size(); ++i) {
        if (turns[i].turn_id != static_cast<int>(i + 1)) return false;
    }
    return true;
}

bool any_note_contains(const std::vector<std::string>& notes, const std::string& needle) {
    for (const auto& note : notes) {
        if (note.find(needle) != std::string::npos) return true;
    }
    return false;
}

} // namespace

int main() {
    Logger::initialize(LogLevel::ERROR);

    // --- Scenario A: speedrun ---
    {
        auto provider = test_support::provider_with_defaults(5, 9, "deep");
        InterviewEngine engine(test_support::test_config(10), provider);

        auto opening = engine.start(test_support::candidate());
        ASSERT(opening.is_ok());
        ASSERT(opening.value().directive == Directive::Opening);
        ASSERT(!opening.value().terminal);
        ASSERT(opening.value().agent_message == "Next question, please.");
        ASSERT(engine.phase() == TurnPhase::AwaitingInput);
        ASSERT(engine.state().skill_tree().size() == 5);

        auto t1 = engine.process_message("Hash maps use buckets and chaining.");
        ASSERT(t1.is_ok());
        ASSERT(t1.value().turn_id == 1);
        ASSERT(t1.value().intent == Intent::Answer);
        ASSERT(t1.value().protocol == Protocol::Standard);
        ASSERT(t1.value().directive == Directive::AskFollowup);
        ASSERT(any_note_contains(t1.value().notes, "[Router]"));
        ASSERT(any_note_contains(t1.value().notes, "[Skeptic]"));
        ASSERT(any_note_contains(t1.value().notes, "[Empath]"));
        ASSERT(any_note_contains(t1.value().notes, "[Planner]"));

        auto t2 = engine.process_message("Open addressing probes the next slot.");
        ASSERT(t2.is_ok());
        ASSERT(t2.value().protocol == Protocol::Speedrun);
        ASSERT(engine.state().protocol() == Protocol::Speedrun);
        ASSERT(engine.state().skill_tree().cursor() == 1);

        engine.process_message("Answer three.");
        auto t4 = engine.process_message("Answer four.");
        ASSERT(t4.is_ok());
        ASSERT(t4.value().turn_id == 4);
        ASSERT(t4.value().protocol == Protocol::Speedrun);
        ASSERT(t4.value().directive == Directive::SpeedrunNext);
        ASSERT(engine.state().skill_tree().cursor() == 2);
        ASSERT(engine.state().skill_tree().at(0).covered());
        ASSERT(engine.state().skill_tree().at(1).covered());
        ASSERT(engine.state().stats().answers == 4);
        ASSERT(engine.is_active());
        ASSERT(ids_gap_free(engine.state()));
        ASSERT(engine.state().turns().size() == 4);
        ASSERT(engine.state().turns()[0].agent_visible_message == "Next question, please.");
        ASSERT(provider->call_count(AgentRole::Skeptic) == 4);
        ASSERT(provider->call_count(AgentRole::Empath) == 4);
    }

    // --- Scenario B: stop on turn 1 ---
    {
        auto provider = test_support::provider_with_defaults(5);
        InterviewEngine engine(test_support::test_config(10), provider);
        engine.start(test_support::candidate());

        auto t1 = engine.process_message("stop");
        ASSERT(t1.is_ok());
        ASSERT(t1.value().terminal);
        ASSERT(t1.value().intent == Intent::Stop);
        ASSERT(t1.value().reason == TerminationReason::CandidateStop);
        ASSERT(t1.value().agent_message.find("INTERVIEW REPORT") != std::string::npos);
        ASSERT(!engine.is_active());
        ASSERT(engine.phase() == TurnPhase::Terminal);
        ASSERT(engine.state().closed());
        ASSERT(engine.state().termination_reason() == TerminationReason::CandidateStop);
        ASSERT(engine.state().turns().size() == 2);
        ASSERT(!engine.state().turns().back().user_message.has_value());
        ASSERT(engine.state().skill_tree().cursor() == 0);
        ASSERT(provider->call_count(AgentRole::Router) == 0);
        ASSERT(provider->call_count(AgentRole::Skeptic) == 0);
        ASSERT(engine.verdict().has_value());
        ASSERT(!engine.verdict()->fallback);
        ASSERT(engine.verdict()->level == Level::Middle);
        ASSERT(!engine.final_report().empty());

        auto late = engine.process_message("one more thing");
        ASSERT(late.is_error());
        ASSERT(late.error().type == ErrorType::InvalidState);
        ASSERT(engine.interrupt().is_error());
    }

    // --- Scenario C: degraded technical evaluation on turn 3 ---
    {
        auto provider = test_support::provider_with_defaults(5, 6);
        provider->push_response(AgentRole::Skeptic, test_support::skeptic_reply(6));
        provider->push_response(AgentRole::Skeptic, test_support::skeptic_reply(6));
        provider->push_failure(AgentRole::Skeptic, make_provider_error("HTTP 500"));
        InterviewEngine engine(test_support::test_config(10), provider);
        engine.start(test_support::candidate());

        engine.process_message("first answer");
        engine.process_message("second answer");
        ASSERT(engine.state().skill_tree().cursor() == 1);

        auto t3 = engine.process_message("third answer");
        ASSERT(t3.is_ok());
        ASSERT(!t3.value().terminal);
        ASSERT(t3.value().directive == Directive::AskFollowup);
        ASSERT(any_note_contains(t3.value().notes, "degraded"));
        ASSERT(engine.state().stats().degraded_evaluations == 1);
        ASSERT(engine.state().skill_tree().cursor() == 1);
        ASSERT(engine.state().skill_tree().at(1).questions_asked() == 0);
        ASSERT(!engine.state().skill_tree().at(1).covered());
        ASSERT(engine.state().planner_memory().recent_scores.back() == 5);
        ASSERT(engine.state().behavior().evaluations == 3);

        auto t4 = engine.process_message("fourth answer");
        ASSERT(t4.is_ok());
        ASSERT(engine.state().skill_tree().at(1).questions_asked() == 1);
    }

    // --- unusable technical scores degrade the turn like a failed call ---
    {
        std::vector<test_support::json> bad_scores = {
            test_support::skeptic_reply(11),
            test_support::skeptic_reply(-1),
            test_support::skeptic_reply(6),
            test_support::skeptic_reply(6)
        };
        bad_scores[2]["score"] = 4294967305LL;  // 2^32 + 9
        bad_scores[3]["score"] = 6.5;

        for (const auto& reply : bad_scores) {
            auto provider = test_support::provider_with_defaults(3, 6);
            provider->push_response(AgentRole::Skeptic, reply);
            InterviewEngine engine(test_support::test_config(10), provider);
            engine.start(test_support::candidate());

            auto t1 = engine.process_message("an answer with a broken score");
            ASSERT(t1.is_ok());
            ASSERT(!t1.value().terminal);
            ASSERT(any_note_contains(t1.value().notes, "degraded"));
            ASSERT(engine.state().stats().degraded_evaluations == 1);
            ASSERT(engine.state().skill_tree().at(0).questions_asked() == 0);
            ASSERT(!engine.state().skill_tree().at(0).score().has_value());
            ASSERT(engine.state().planner_memory().recent_scores.back() == 5);
        }
    }

    // --- out-of-range behavioural ratings are not folded into the averages ---
    {
        std::vector<test_support::json> bad_ratings = {
            test_support::empath_reply(11, 8),
            test_support::empath_reply(7, 0),
            test_support::empath_reply(7, 8)
        };
        bad_ratings[2]["clarity"] = 4294967303LL;

        for (const auto& reply : bad_ratings) {
            auto provider = test_support::provider_with_defaults(3, 6);
            provider->push_response(AgentRole::Empath, reply);
            InterviewEngine engine(test_support::test_config(10), provider);
            engine.start(test_support::candidate());

            auto t1 = engine.process_message("an answer");
            ASSERT(t1.is_ok());
            ASSERT(any_note_contains(t1.value().notes, "[Empath]: evaluation degraded"));
            ASSERT(engine.state().behavior().evaluations == 0);
            ASSERT(engine.state().skill_tree().at(0).questions_asked() == 1);
        }
    }

    // --- Scenario D: off-topic until the turn limit ---
    {
        auto provider = test_support::provider_with_defaults(5);
        provider->set_default(AgentRole::Router, test_support::router_reply("off_topic"));
        InterviewEngine engine(test_support::test_config(4), provider);
        engine.start(test_support::candidate());

        int processed = 0;
        Result<TurnOutcome> outcome = engine.process_message("what's the weather like?");
        while (outcome.is_ok() && !outcome.value().terminal && processed < 20) {
            ASSERT(outcome.value().directive == Directive::Redirect);
            processed++;
            outcome = engine.process_message("nice weather today");
        }
        ASSERT(outcome.is_ok());
        ASSERT(outcome.value().terminal);
        ASSERT(outcome.value().reason == TerminationReason::TurnLimit);
        ASSERT(processed == 2);
        ASSERT(static_cast<int>(engine.state().turns().size()) <= 4);
        ASSERT(engine.state().turns().size() == 4);
        ASSERT(ids_gap_free(engine.state()));
        ASSERT(engine.state().stats().off_topic == 3);
        ASSERT(engine.state().skill_tree().at(0).questions_asked() == 0);
        ASSERT(provider->call_count(AgentRole::Skeptic) == 0);
    }

    // --- minimum turn budget ---
    {
        auto provider = test_support::provider_with_defaults(3);
        InterviewEngine engine(test_support::test_config(1), provider);  // clamped to 2
        engine.start(test_support::candidate());
        auto t1 = engine.process_message("my only answer");
        ASSERT(t1.is_ok());
        ASSERT(t1.value().terminal);
        ASSERT(t1.value().reason == TerminationReason::TurnLimit);
        ASSERT(engine.state().turns().size() == 2);
        ASSERT(engine.state().skill_tree().at(0).questions_asked() == 1);
    }

    // --- questions answered without using a slot ---
    {
        auto provider = test_support::provider_with_defaults(3);
        provider->push_response(AgentRole::Router, test_support::router_reply("question"));
        InterviewEngine engine(test_support::test_config(10), provider);
        engine.start(test_support::candidate());
        auto t1 = engine.process_message("Which database does the team use?");
        ASSERT(t1.is_ok());
        ASSERT(t1.value().directive == Directive::AnswerQuestion);
        ASSERT(engine.state().stats().questions == 1);
        ASSERT(engine.state().skill_tree().at(0).questions_asked() == 0);
    }

    // --- hallucinated claim ---
    {
        auto provider = test_support::provider_with_defaults(3);
        auto reply = test_support::skeptic_reply(1, "hallucinated", "superficial");
        reply["correct_answer"] = "There is no such feature in Python 4.0";
        reply["fictional_term_detected"] = true;
        provider->push_response(AgentRole::Skeptic, reply);
        InterviewEngine engine(test_support::test_config(10), provider);
        engine.start(test_support::candidate());
        auto t1 = engine.process_message("Python 4.0 removed the GIL with quantum threads.");
        ASSERT(t1.is_ok());
        ASSERT(engine.state().stats().hallucinations == 1);
        auto voice_request = provider->last_request(AgentRole::Voice);
        ASSERT(voice_request.has_value());
        ASSERT(voice_request->prompt.find("There is no such feature in Python 4.0") != std::string::npos);
        ASSERT(engine.state().skill_tree().at(0).correct_answer().has_value());
    }

    // --- generation retry succeeds ---
    {
        auto provider = test_support::provider_with_defaults(3);
        InterviewEngine engine(test_support::test_config(10), provider);
        engine.start(test_support::candidate());
        provider->push_failure(AgentRole::Voice, make_schema_error("empty message"));
        auto t1 = engine.process_message("an answer");
        ASSERT(t1.is_ok());
        ASSERT(!t1.value().terminal);
        ASSERT(provider->call_count(AgentRole::Voice) == 3);
        ASSERT(engine.is_active());
    }

    // --- generation fails twice: early termination ---
    {
        auto provider = test_support::provider_with_defaults(3);
        InterviewEngine engine(test_support::test_config(10), provider);
        engine.start(test_support::candidate());
        provider->push_failure(AgentRole::Voice, make_provider_error("HTTP 503"));
        provider->push_failure(AgentRole::Voice, make_provider_error("HTTP 503"));
        auto t1 = engine.process_message("an answer");
        ASSERT(t1.is_ok());
        ASSERT(t1.value().terminal);
        ASSERT(t1.value().reason == TerminationReason::GenerationFailure);
        ASSERT(any_note_contains(t1.value().notes, "generation failed"));
        ASSERT(engine.state().turns().size() == 2);
        ASSERT(engine.state().skill_tree().at(0).questions_asked() == 1);
        ASSERT(engine.verdict().has_value());
    }

    // --- opening generation fails ---
    {
        auto provider = test_support::provider_with_defaults(3);
        provider->push_failure(AgentRole::Voice, make_provider_error("HTTP 503"));
        provider->push_failure(AgentRole::Voice, make_provider_error("HTTP 503"));
        InterviewEngine engine(test_support::test_config(10), provider);
        auto opening = engine.start(test_support::candidate());
        ASSERT(opening.is_ok());
        ASSERT(opening.value().terminal);
        ASSERT(opening.value().reason == TerminationReason::GenerationFailure);
        ASSERT(engine.state().turns().size() == 1);
        ASSERT(!engine.state().turns()[0].user_message.has_value());
        ASSERT(engine.process_message("hello").is_error());
    }

    // --- reporting: retry then fallback ---
    {
        auto provider = test_support::provider_with_defaults(3);
        provider->push_failure(AgentRole::Reporter, make_parse_error("truncated JSON"));
        InterviewEngine engine(test_support::test_config(10), provider);
        engine.start(test_support::candidate());
        engine.process_message("stop");
        ASSERT(engine.verdict().has_value());
        ASSERT(!engine.verdict()->fallback);
        ASSERT(provider->call_count(AgentRole::Reporter) == 2);
    }
    {
        auto provider = test_support::provider_with_defaults(3);
        for (int i = 0; i < 3; ++i) {
            provider->push_failure(AgentRole::Reporter, make_provider_error("HTTP 500"));
        }
        InterviewEngine engine(test_support::test_config(10), provider);
        engine.start(test_support::candidate());
        engine.process_message("a real answer about indexes");
        auto t2 = engine.process_message("stop");
        ASSERT(t2.is_ok());
        ASSERT(t2.value().terminal);
        ASSERT(provider->call_count(AgentRole::Reporter) == 3);
        ASSERT(engine.verdict()->fallback);
        ASSERT(engine.verdict()->level == Level::Unknown);
        ASSERT(engine.verdict()->recommendation == Recommendation::Unknown);
        ASSERT(engine.verdict()->confidence == 0);
        ASSERT(engine.verdict()->topics.size() == 3);
        ASSERT(engine.verdict()->topics[0].questions_asked == 1);
        ASSERT(engine.state().turns().size() == 3);
    }

    // --- plan generation falls back ---
    {
        auto provider = test_support::provider_with_defaults(3);
        provider->push_failure(AgentRole::Planner, make_provider_error("HTTP 401"));
        InterviewEngine engine(test_support::test_config(10), provider);
        auto opening = engine.start(test_support::candidate());
        ASSERT(opening.is_ok());
        ASSERT(engine.state().skill_tree().size() == 2);
        ASSERT(engine.state().skill_tree().at(0).label() == "Core skills for Backend Developer");
        ASSERT(any_note_contains(opening.value().notes, "fallback plan"));

        auto t1 = engine.process_message("an answer");
        ASSERT(t1.is_ok());
        ASSERT(any_note_contains(engine.state().turns()[0].internal_thoughts, "fallback plan"));
        ASSERT(engine.start(test_support::candidate()).is_error());
    }

    // --- interrupt ---
    {
        auto provider = test_support::provider_with_defaults(3);
        InterviewEngine engine(test_support::test_config(10), provider);
        ASSERT(engine.interrupt().is_error());
        engine.start(test_support::candidate());
        engine.process_message("an answer");
        auto closing = engine.interrupt();
        ASSERT(closing.is_ok());
        ASSERT(closing.value().terminal);
        ASSERT(closing.value().reason == TerminationReason::Interrupted);
        ASSERT(engine.state().termination_reason() == TerminationReason::Interrupted);
        ASSERT(engine.state().turns().size() == 2);
        ASSERT(ids_gap_free(engine.state()));
        ASSERT(engine.interrupt().is_error());
    }

    // --- provider timeout degrades the evaluation ---
    {
        auto provider = test_support::provider_with_defaults(3);
        provider->set_delay_ms(AgentRole::Skeptic, 800);
        Config config = test_support::test_config(10);
        config.llm.timeout_ms = 150;
        InterviewEngine engine(config, provider);
        engine.start(test_support::candidate());

        auto started = std::chrono::steady_clock::now();
        auto t1 = engine.process_message("an answer that takes long to grade");
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count();
        ASSERT(t1.is_ok());
        ASSERT(!t1.value().terminal);
        ASSERT(any_note_contains(t1.value().notes, "timed out"));
        ASSERT(engine.state().stats().degraded_evaluations == 1);
        ASSERT(engine.state().skill_tree().at(0).questions_asked() == 0);
        ASSERT(engine.state().behavior().evaluations == 1);
        ASSERT(elapsed < 700);

        // Let the abandoned worker finish before the process tears down
        std::this_thread::sleep_for(std::chrono::milliseconds(1000));
    }

    Logger::shutdown();

    if (failed > 0) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All interview engine tests passed.\n";
    return 0;
}
