#include "interview_engine.h"
#include "core/async_call.h"
#include "common.h"
#include "logger.h"
#include "session_recorder.h"
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace interview_coach {

namespace {

std::string farewell_for(TerminationReason reason) {
    switch (reason) {
        case TerminationReason::CandidateStop:
            return "Understood, let's stop here. Thank you for your time.";
        case TerminationReason::TurnLimit:
        case TerminationReason::PlanExhausted:
            return "That's all the questions I have for today. Thank you for your time.";
        case TerminationReason::GenerationFailure:
            return "We have to end the interview early because of a technical problem. Thank you for your time.";
        case TerminationReason::Interrupted:
            return "The interview was interrupted.";
        case TerminationReason::None:
            break;
    }
    return "Thank you for your time.";
}

// Milliseconds left until a shared deadline; 0 keeps "no deadline"
int remaining_ms(TimePoint start, int timeout_ms) {
    if (timeout_ms <= 0) return 0;
    int64_t left = timeout_ms - ms_since(start);
    return static_cast<int>(std::max<int64_t>(1, left));
}

} // namespace

InterviewEngine::InterviewEngine(const Config& config,
                                 std::shared_ptr<InferenceProvider> provider,
                                 SessionRecorder* recorder)
    : config_(config)
    , provider_(std::move(provider))
    , recorder_(recorder)
{
    if (!provider_) {
        throw std::invalid_argument("InterviewEngine needs an inference provider");
    }
    config_.validate();
    classifier_ = std::make_shared<IntentClassifier>(provider_);
    skeptic_ = std::make_shared<TechnicalEvaluator>(provider_, config_.interview.score_policy);
    empath_ = std::make_shared<BehavioralEvaluator>(provider_);
    voice_ = std::make_shared<ResponseGenerator>(provider_);
    reporter_ = std::make_shared<ReportGenerator>(provider_);
    plan_generator_ = std::make_shared<PlanGenerator>(
        provider_, static_cast<size_t>(config_.interview.max_topics));
}

InterviewEngine::~InterviewEngine() = default;

void InterviewEngine::add_stop_phrase(const std::string& phrase) {
    classifier_->add_stop_phrase(phrase);
}

bool InterviewEngine::is_active() const {
    return state_ && !state_machine_.is_terminal();
}

TurnPhase InterviewEngine::phase() const {
    return state_machine_.get_state();
}

const SessionState& InterviewEngine::state() const {
    if (!state_) {
        throw std::logic_error("interview has not started");
    }
    return *state_;
}

Result<TurnOutcome> InterviewEngine::start(const CandidateMetadata& candidate, const std::string& scenario) {
    if (state_) {
        return make_invalid_state_error("interview already started");
    }

    const int timeout_ms = config_.llm.timeout_ms;

    auto plan_start = Clock::now();
    auto plan_generator = plan_generator_;
    auto planned = call_with_timeout<std::vector<Topic>>(
        [plan_generator, candidate]() { return plan_generator->generate(candidate); },
        timeout_ms, "plan generation");

    std::vector<Topic> topics;
    if (planned.is_ok()) {
        topics = planned.value();
        std::ostringstream oss;
        oss << "[Planner]: plan of " << topics.size() << " topics:";
        for (const auto& topic : topics) {
            oss << " " << topic.id() << "." << topic.label() << " (" << to_string(topic.difficulty()) << ")";
        }
        carry_notes_.push_back(oss.str());
    } else {
        LOG_WARN("Plan generation failed, using fallback plan: " + describe(planned.error()));
        topics = PlanGenerator::fallback_plan(candidate);
        carry_notes_.push_back("[Planner]: plan generation failed (" + describe(planned.error()) +
                               "), using fallback plan");
    }
    LOG_PLANNER("Plan ready in " + std::to_string(ms_since(plan_start)) + "ms, " +
                std::to_string(topics.size()) + " topics");

    state_ = std::make_unique<SessionState>(candidate, SkillTree(std::move(topics)),
                                            config_.interview.max_turns);
    if (recorder_) {
        recorder_->start_session(candidate, state_->session_start(), scenario);
    }
    state_machine_.on_planned(false);

    ResponseRequest request = build_response_request(0, Directive::Opening, false, "", std::nullopt);
    auto reply = generate_reply(request);

    TurnOutcome outcome;
    outcome.turn_id = 0;
    outcome.directive = Directive::Opening;
    outcome.protocol = state_->protocol();

    if (reply.is_error()) {
        carry_notes_.push_back("[Voice]: opening generation failed: " + describe(reply.error()));
        state_machine_.on_generated(false);
        return finish(TerminationReason::GenerationFailure, outcome);
    }

    if (!reply.value().thought.empty()) {
        carry_notes_.push_back("[Voice]: " + reply.value().thought);
    }
    state_machine_.on_generated(true);
    last_agent_message_ = reply.value().message;
    outcome.agent_message = last_agent_message_;
    outcome.notes = carry_notes_;
    LOG_ENGINE("Interview started for " + candidate.name + " (" + candidate.role + ")");
    return outcome;
}

Result<TurnOutcome> InterviewEngine::process_message(const std::string& message) {
    if (!state_) {
        return make_invalid_state_error("interview has not started");
    }
    if (!state_machine_.accepts_input()) {
        return make_invalid_state_error(std::string("not accepting input in phase ") +
                                        to_string(state_machine_.get_state()));
    }

    const int timeout_ms = config_.llm.timeout_ms;
    auto turn_start = Clock::now();

    state_machine_.on_message_received();
    const int turn_id = state_->begin_turn(last_agent_message_, message);
    for (auto& note : carry_notes_) {
        state_->append_note(std::move(note));
    }
    carry_notes_.clear();
    LOG_TRACE(turn_id, "received", "chars=" + std::to_string(message.size()));

    TurnOutcome outcome;
    outcome.turn_id = turn_id;

    // Router
    ClassifierInput classifier_input;
    classifier_input.message = message;
    classifier_input.pending_question = last_agent_message_;
    classifier_input.question_pending = state_->skill_tree().active_topic() != nullptr;

    auto classifier = classifier_;
    auto classified = call_with_timeout<Classification>(
        [classifier, classifier_input]() -> Result<Classification> {
            return classifier->classify(classifier_input);
        },
        timeout_ms, "router");

    Classification classification;
    if (classified.is_ok()) {
        classification = classified.value();
    } else {
        classification.intent = Intent::OffTopic;
        classification.ambiguous = true;
        classification.thought = "classification unavailable (" + describe(classified.error()) + ")";
    }
    const Intent intent = classification.intent;
    outcome.intent = intent;
    {
        std::string note = std::string("[Router]: ") + to_string(intent);
        if (classification.fast_path) note += " (fast path)";
        if (!classification.thought.empty()) note += ". " + classification.thought;
        state_->append_note(note);
    }
    LOG_TRACE(turn_id, "router", std::string("intent=") + to_string(intent) +
              " fast_path=" + (classification.fast_path ? "1" : "0"));

    SessionStats& stats = state_->stats();
    if (intent == Intent::Question) stats.questions++;
    if (intent == Intent::OffTopic) stats.off_topic++;
    state_machine_.on_classified(intent);

    // Skeptic and Empath, answers only
    std::optional<TechnicalEvaluation> technical;
    if (intent == Intent::Answer) {
        stats.answers++;
        const Topic* topic = state_->skill_tree().active_topic();
        if (topic) {
            EvaluationInput input;
            input.turn_id = turn_id;
            input.message = message;
            input.question = last_agent_message_;
            input.topic_label = topic->label();
            input.difficulty = topic->difficulty();
            input.candidate = state_->candidate();

            auto eval_start = Clock::now();
            std::shared_ptr<const TechnicalEvaluator> skeptic = skeptic_;
            std::shared_ptr<const BehavioralEvaluator> empath = empath_;
            AsyncCall<TechnicalEvaluation> skeptic_call(
                [skeptic, input]() { return skeptic->evaluate(input); }, "skeptic");
            AsyncCall<BehavioralEvaluation> empath_call(
                [empath, input]() { return empath->evaluate(input); }, "empath");

            auto tech = skeptic_call.get(timeout_ms);
            auto behavioral = empath_call.get(remaining_ms(eval_start, timeout_ms));

            if (tech.is_ok()) {
                skeptic_->apply(*state_, tech.value());
                technical = tech.value();
                state_->append_note(TechnicalEvaluator::format_note(tech.value()));
                if (tech.value().hallucination()) stats.hallucinations++;
                if (tech.value().contradiction_detected) stats.contradictions++;
            } else {
                stats.degraded_evaluations++;
                LOG_WARN("Technical evaluation degraded: " + describe(tech.error()));
                state_->append_note("[Skeptic]: evaluation degraded (" + describe(tech.error()) +
                                    "), answer not counted");
            }

            if (behavioral.is_ok()) {
                empath_->apply(state_->behavior(), behavioral.value());
                state_->append_note(BehavioralEvaluator::format_note(behavioral.value()));
            } else {
                LOG_WARN("Behavioral evaluation degraded: " + describe(behavioral.error()));
                state_->append_note("[Empath]: evaluation degraded (" + describe(behavioral.error()) + ")");
            }
            LOG_TRACE(turn_id, "evaluate", "ms=" + std::to_string(ms_since(eval_start)) +
                      " technical=" + (tech.is_ok() ? std::to_string(tech.value().score) : "degraded"));
        }
        state_machine_.on_evaluated();
    }

    // Planner
    PlannerDecision decision = planner_.plan(*state_, intent, technical);
    planner_.commit(*state_, decision);
    state_->append_note(StrategicPlanner::format_note(decision));
    state_machine_.on_planned(decision.terminate);
    LOG_TRACE(turn_id, "planner", std::string("directive=") + to_string(decision.directive) +
              " protocol=" + to_string(decision.protocol) + " cursor=" + std::to_string(decision.cursor));

    outcome.directive = decision.directive;
    outcome.protocol = decision.protocol;

    if (decision.terminate) {
        return finish(decision.reason, outcome);
    }

    // Voice
    ResponseRequest request = build_response_request(turn_id, decision.directive, decision.topic_advanced,
                                                      message, technical);
    auto reply = generate_reply(request);
    if (reply.is_error()) {
        state_->append_note("[Voice]: generation failed: " + describe(reply.error()));
        state_machine_.on_generated(false);
        return finish(TerminationReason::GenerationFailure, outcome);
    }
    if (!reply.value().thought.empty()) {
        state_->append_note("[Voice]: " + reply.value().thought);
    }

    const Turn& closed = state_->close_turn();
    outcome.notes = closed.internal_thoughts;
    record_closed_turn(closed);
    state_machine_.on_generated(true);

    last_agent_message_ = reply.value().message;
    outcome.agent_message = last_agent_message_;
    LOG_TRACE(turn_id, "done", "ms=" + std::to_string(ms_since(turn_start)));
    return outcome;
}

Result<TurnOutcome> InterviewEngine::interrupt() {
    if (!state_) {
        return make_invalid_state_error("interview has not started");
    }
    if (state_machine_.is_terminal()) {
        return make_invalid_state_error("interview already finished");
    }
    state_machine_.on_interrupted();
    TurnOutcome outcome;
    outcome.turn_id = state_->turn_counter();
    outcome.directive = Directive::Terminate;
    outcome.protocol = state_->protocol();
    return finish(TerminationReason::Interrupted, outcome);
}

Result<Reply> InterviewEngine::generate_reply(const ResponseRequest& request) {
    const int attempts = 1 + config_.retry.generation_retries;
    std::shared_ptr<const ResponseGenerator> voice = voice_;
    Error last_error = make_invalid_state_error("no generation attempt made");

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        auto reply = call_with_timeout<Reply>(
            [voice, request]() { return voice->generate(request); },
            config_.llm.timeout_ms, "voice");
        if (reply.is_ok()) {
            LOG_VOICE(std::string(to_string(request.directive)) + ": " + reply.value().message);
            return reply;
        }
        last_error = reply.error();
        LOG_WARN("Voice attempt " + std::to_string(attempt) + "/" + std::to_string(attempts) +
                 " failed: " + describe(last_error));
    }
    return last_error;
}

Verdict InterviewEngine::generate_verdict() {
    const int attempts = 1 + config_.retry.reporting_retries;
    // The worker reads a snapshot; a late reporter never sees the closing turn being written
    std::shared_ptr<const SessionState> snapshot = std::make_shared<SessionState>(*state_);
    std::shared_ptr<const ReportGenerator> reporter = reporter_;
    Error last_error = make_invalid_state_error("no report attempt made");

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        auto verdict = call_with_timeout<Verdict>(
            [reporter, snapshot]() { return reporter->generate(*snapshot); },
            config_.llm.timeout_ms, "reporter");
        if (verdict.is_ok()) {
            LOG_REPORTER(std::string("Verdict: ") + to_string(verdict.value().level) + ", " +
                         to_string(verdict.value().recommendation));
            return verdict.value();
        }
        last_error = verdict.error();
        LOG_WARN("Report attempt " + std::to_string(attempt) + "/" + std::to_string(attempts) +
                 " failed: " + describe(last_error));
    }
    LOG_ERROR("Report generation failed, using fallback verdict: " + describe(last_error));
    return ReportGenerator::fallback_verdict(*state_, describe(last_error));
}

TurnOutcome InterviewEngine::finish(TerminationReason reason, TurnOutcome outcome) {
    state_->set_termination_reason(reason);
    LOG_ENGINE(std::string("Terminating: ") + to_string(reason));

    std::vector<std::string> notes;
    if (state_->has_open_turn()) {
        const Turn& closed = state_->close_turn();
        notes = closed.internal_thoughts;
        record_closed_turn(closed);
    }

    verdict_ = generate_verdict();
    final_report_ = ReportGenerator::format_report(*verdict_, *state_);

    // Closing turn: the report itself, no candidate reply
    std::string closing = farewell_for(reason) + "\n\n" + final_report_;
    state_->begin_turn(closing, std::nullopt);
    for (auto& note : carry_notes_) {
        state_->append_note(std::move(note));
    }
    carry_notes_.clear();
    if (verdict_->fallback) {
        state_->append_note("[Reporter]: fallback verdict. " + verdict_->reasoning);
    } else {
        std::ostringstream oss;
        oss << "[Reporter]: " << to_string(verdict_->level) << ", " << to_string(verdict_->recommendation)
            << " (confidence " << verdict_->confidence << "%)";
        if (!verdict_->thought.empty()) oss << ". " << verdict_->thought;
        state_->append_note(oss.str());
    }
    const Turn& closing_turn = state_->close_turn();
    if (notes.empty()) {
        notes = closing_turn.internal_thoughts;
    }
    record_closed_turn(closing_turn);
    state_->close();

    if (recorder_) {
        auto written = recorder_->finalize_session(*verdict_, reason, final_report_);
        if (written.is_ok()) {
            log_path_ = written.value();
        } else {
            LOG_ERROR("Session log not finalized: " + describe(written.error()));
        }
    }
    state_machine_.on_report_ready();

    outcome.agent_message = closing;
    outcome.notes = std::move(notes);
    outcome.terminal = true;
    outcome.reason = reason;
    return outcome;
}

ResponseRequest InterviewEngine::build_response_request(
    int turn_id, Directive directive, bool topic_advanced, const std::string& candidate_message,
    const std::optional<TechnicalEvaluation>& technical) const {
    ResponseRequest request;
    request.turn_id = turn_id;
    request.directive = directive;
    request.protocol = state_->protocol();
    request.topic_advanced = topic_advanced;
    request.candidate = state_->candidate();
    request.candidate_message = candidate_message;

    if (const Topic* topic = state_->skill_tree().active_topic()) {
        request.topic_label = topic->label();
        request.difficulty = topic->difficulty();
    }

    const auto& turns = state_->turns();
    size_t keep = static_cast<size_t>(std::max(0, config_.llm.context_max_turns_to_send));
    size_t first = turns.size() > keep ? turns.size() - keep : 0;
    request.recent_turns.assign(turns.begin() + static_cast<std::ptrdiff_t>(first), turns.end());

    if (technical) {
        request.challenge_claim = technical->hallucination();
        request.correction = technical->correct_answer;
    }
    return request;
}

void InterviewEngine::record_closed_turn(const Turn& turn) {
    if (recorder_) {
        recorder_->record_turn(turn);
    }
}

} // namespace interview_coach
