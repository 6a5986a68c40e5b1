#include "technical_evaluator.h"
#include "logger.h"
#include "utils.h"
#include <cmath>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace interview_coach {

namespace {

const char* SKEPTIC_SYSTEM_PROMPT =
    "You are a strict technical interviewer checking a candidate's answer for correctness. "
    "Score it from 0 to 10 against the expectations for the target grade. Classify accuracy "
    "(accurate, partially_correct, incorrect, hallucinated) and depth (superficial, adequate, "
    "deep, expert). Flag invented technologies or facts as hallucinated, and flag claims that "
    "contradict earlier statements. If the answer is wrong, give the correct answer briefly. "
    "Reply with a JSON object.";

json skeptic_schema() {
    return {
        {"type", "object"},
        {"properties", {
            {"score", {{"type", "integer"}, {"minimum", constants::scoring::MIN_TECHNICAL_SCORE},
                       {"maximum", constants::scoring::MAX_TECHNICAL_SCORE}}},
            {"accuracy", {{"type", "string"},
                          {"enum", {"accurate", "partially_correct", "incorrect", "hallucinated"}}}},
            {"depth", {{"type", "string"}, {"enum", {"superficial", "adequate", "deep", "expert"}}}},
            {"issues", {{"type", "array"}, {"items", {{"type", "string"}}}}},
            {"correct_answer", {{"type", "string"}}},
            {"contradiction_detected", {{"type", "boolean"}}},
            {"fictional_term_detected", {{"type", "boolean"}}},
            {"internal_thought", {{"type", "string"}}}
        }},
        {"required", {"score", "accuracy", "depth", "internal_thought"}}
    };
}

} // namespace

TechnicalEvaluator::TechnicalEvaluator(std::shared_ptr<InferenceProvider> provider, ScorePolicy policy)
    : provider_(std::move(provider)), policy_(policy) {}

Result<TechnicalEvaluation> TechnicalEvaluator::evaluate(const EvaluationInput& input) const {
    InferenceRequest request;
    request.role = AgentRole::Skeptic;
    request.system_prompt = SKEPTIC_SYSTEM_PROMPT;
    request.context = {
        {"question", input.question},
        {"answer", input.message},
        {"topic", input.topic_label},
        {"difficulty", to_string(input.difficulty)},
        {"role", input.candidate.role},
        {"target_grade", input.candidate.target_grade}
    };

    std::ostringstream prompt;
    prompt << "Position: " << input.candidate.role << " (" << input.candidate.target_grade << ")\n"
           << "Topic: " << input.topic_label << " [" << to_string(input.difficulty) << "]\n"
           << "Question: " << input.question << "\n"
           << "Candidate's answer: " << input.message;
    request.prompt = prompt.str();
    request.schema = skeptic_schema();
    request.schema_name = "technical_evaluation";

    auto response = provider_->invoke(request);
    if (response.is_error()) {
        return response.error();
    }

    auto parsed = parse(response.value().data);
    if (parsed.is_ok()) {
        LOG_SKEPTIC("turn " + std::to_string(input.turn_id) + " score=" +
                    std::to_string(parsed.value().score));
    }
    return parsed;
}

Result<TechnicalEvaluation> TechnicalEvaluator::parse(const json& data) {
    if (!data.is_object()) {
        return make_schema_error("technical evaluation is not an object");
    }
    if (!data.contains("score") || !data["score"].is_number()) {
        return make_schema_error("technical evaluation has no numeric score");
    }

    // Range-check before narrowing so oversized integers cannot wrap into range
    double raw = data["score"].get<double>();
    if (!(raw >= constants::scoring::MIN_TECHNICAL_SCORE &&
          raw <= constants::scoring::MAX_TECHNICAL_SCORE)) {
        return make_schema_error("technical score out of range: " + data["score"].dump());
    }
    if (raw != std::floor(raw)) {
        return make_schema_error("technical score must be an integer");
    }
    TechnicalEvaluation evaluation;
    evaluation.score = static_cast<int>(raw);

    if (!data.contains("accuracy") || !data["accuracy"].is_string()) {
        return make_schema_error("technical evaluation has no accuracy");
    }
    auto accuracy = parse_accuracy(data["accuracy"].get<std::string>());
    if (!accuracy) {
        return make_schema_error("unknown accuracy: " + data["accuracy"].get<std::string>());
    }
    evaluation.accuracy = *accuracy;

    if (!data.contains("depth") || !data["depth"].is_string()) {
        return make_schema_error("technical evaluation has no depth");
    }
    auto depth = parse_depth(data["depth"].get<std::string>());
    if (!depth) {
        return make_schema_error("unknown depth: " + data["depth"].get<std::string>());
    }
    evaluation.depth = *depth;

    if (data.contains("internal_thought") && data["internal_thought"].is_string()) {
        evaluation.thought = data["internal_thought"].get<std::string>();
    }
    if (data.contains("issues") && data["issues"].is_array()) {
        for (const auto& issue : data["issues"]) {
            if (!issue.is_string()) continue;
            if (evaluation.issues.size() >= constants::scoring::MAX_ISSUES) break;
            evaluation.issues.push_back(issue.get<std::string>());
        }
    }
    if (data.contains("correct_answer") && data["correct_answer"].is_string()) {
        std::string correct = utils::trim_copy(data["correct_answer"].get<std::string>());
        if (!correct.empty()) evaluation.correct_answer = correct;
    }
    if (data.contains("contradiction_detected") && data["contradiction_detected"].is_boolean()) {
        evaluation.contradiction_detected = data["contradiction_detected"].get<bool>();
    }
    if (data.contains("fictional_term_detected") && data["fictional_term_detected"].is_boolean()) {
        evaluation.fictional_term_detected = data["fictional_term_detected"].get<bool>();
    }
    return evaluation;
}

void TechnicalEvaluator::apply(SessionState& state, const TechnicalEvaluation& evaluation) const {
    SkillTree& tree = state.skill_tree();
    Topic* topic = tree.active_topic_mut();
    if (!topic) {
        throw std::logic_error("no active topic to score");
    }
    topic->record_answer(evaluation.score, policy_, evaluation.thought, evaluation.correct_answer);
}

std::string TechnicalEvaluator::format_note(const TechnicalEvaluation& evaluation) {
    std::ostringstream oss;
    oss << "[Skeptic]: [" << evaluation.score << "/10] " << to_string(evaluation.accuracy)
        << "/" << to_string(evaluation.depth);
    if (!evaluation.thought.empty()) {
        oss << " " << evaluation.thought;
    }
    if (!evaluation.issues.empty()) {
        oss << " Issues: " << utils::join(evaluation.issues, "; ");
    }
    if (evaluation.hallucination()) {
        oss << " (hallucination)";
    }
    return oss.str();
}

} // namespace interview_coach
