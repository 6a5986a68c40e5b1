#pragma once

#include "behavioral_evaluator.h"
#include "config.h"
#include "errors.h"
#include "inference_provider.h"
#include "intent_classifier.h"
#include "plan_generator.h"
#include "report_generator.h"
#include "response_generator.h"
#include "session_state.h"
#include "state_machine.h"
#include "strategic_planner.h"
#include "technical_evaluator.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace interview_coach {

class SessionRecorder;

/**
 * @brief What one call into the engine produced
 */
struct TurnOutcome {
    int turn_id = 0;  ///< 0 for the opening message
    Intent intent = Intent::OffTopic;
    Directive directive = Directive::Opening;
    Protocol protocol = Protocol::Standard;
    std::string agent_message;  ///< next interviewer message, or the closing text with the report
    std::vector<std::string> notes;  ///< internal notes of the processed turn
    bool terminal = false;
    TerminationReason reason = TerminationReason::None;
};

/**
 * Per-turn orchestration: router → (skeptic ∥ empath, answers only) →
 * planner → voice, or reporter when the planner terminates.
 *
 * Owns one SessionState; turns are strictly sequential. Every provider call
 * runs with a deadline on a worker that owns copies of its inputs, and
 * results are applied on the calling thread afterwards.
 */
class InterviewEngine {
public:
    InterviewEngine(const Config& config,
                    std::shared_ptr<InferenceProvider> provider,
                    SessionRecorder* recorder = nullptr);
    ~InterviewEngine();

    InterviewEngine(const InterviewEngine&) = delete;
    InterviewEngine& operator=(const InterviewEngine&) = delete;

    /**
     * @brief Build the plan and produce the opening message
     * @param scenario Names the session log file (may be empty)
     * @return InvalidState if already started
     */
    Result<TurnOutcome> start(const CandidateMetadata& candidate, const std::string& scenario = "");

    /**
     * @brief Process one candidate message
     * @return InvalidState if the session is not awaiting input
     */
    Result<TurnOutcome> process_message(const std::string& message);

    /**
     * @brief End the interview now (EOF, Ctrl-C); the report and log are still produced
     */
    Result<TurnOutcome> interrupt();

    bool is_active() const;
    TurnPhase phase() const;

    /// @throws std::logic_error before start()
    const SessionState& state() const;

    const std::optional<Verdict>& verdict() const { return verdict_; }
    const std::string& final_report() const { return final_report_; }
    const std::string& log_path() const { return log_path_; }

    /// Stop phrases beyond the built-in ones
    void add_stop_phrase(const std::string& phrase);

private:
    Result<Reply> generate_reply(const ResponseRequest& request);
    Verdict generate_verdict();
    TurnOutcome finish(TerminationReason reason, TurnOutcome outcome);
    ResponseRequest build_response_request(int turn_id, Directive directive, bool topic_advanced,
                                           const std::string& candidate_message,
                                           const std::optional<TechnicalEvaluation>& technical) const;
    void record_closed_turn(const Turn& turn);

    Config config_;
    std::shared_ptr<InferenceProvider> provider_;
    SessionRecorder* recorder_;

    std::shared_ptr<IntentClassifier> classifier_;
    std::shared_ptr<TechnicalEvaluator> skeptic_;
    std::shared_ptr<BehavioralEvaluator> empath_;
    std::shared_ptr<ResponseGenerator> voice_;
    std::shared_ptr<ReportGenerator> reporter_;
    std::shared_ptr<PlanGenerator> plan_generator_;
    StrategicPlanner planner_;
    StateMachine state_machine_;

    std::unique_ptr<SessionState> state_;
    std::string last_agent_message_;
    std::vector<std::string> carry_notes_;  ///< session-start notes, attached to the first turn
    std::optional<Verdict> verdict_;
    std::string final_report_;
    std::string log_path_;
};

} // namespace interview_coach
