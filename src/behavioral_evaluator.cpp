#include "behavioral_evaluator.h"
#include "logger.h"
#include <cmath>
#include <sstream>

using json = nlohmann::json;

namespace interview_coach {

namespace {

const char* EMPATH_SYSTEM_PROMPT =
    "You observe a candidate's communication in a technical interview, not the technical "
    "correctness. Rate clarity and honesty from 1 to 10 (admitting 'I don't know' is honest), "
    "engagement and stress as low/medium/high, and the demeanor as one of normal, verbose, "
    "silent, arrogant, stuck, nervous. Optionally recommend a protocol: standard, rescue, "
    "speedrun or stress_test. Reply with a JSON object.";

json empath_schema() {
    return {
        {"type", "object"},
        {"properties", {
            {"clarity", {{"type", "integer"}, {"minimum", constants::scoring::MIN_BEHAVIORAL_SCORE},
                         {"maximum", constants::scoring::MAX_BEHAVIORAL_SCORE}}},
            {"honesty", {{"type", "integer"}, {"minimum", constants::scoring::MIN_BEHAVIORAL_SCORE},
                         {"maximum", constants::scoring::MAX_BEHAVIORAL_SCORE}}},
            {"engagement", {{"type", "string"}, {"enum", {"low", "medium", "high"}}}},
            {"stress_level", {{"type", "string"}, {"enum", {"low", "medium", "high"}}}},
            {"demeanor", {{"type", "string"},
                          {"enum", {"normal", "verbose", "silent", "arrogant", "stuck", "nervous"}}}},
            {"recommended_protocol", {{"type", "string"},
                                      {"enum", {"standard", "rescue", "speedrun", "stress_test"}}}},
            {"internal_thought", {{"type", "string"}}}
        }},
        {"required", {"clarity", "honesty", "engagement", "stress_level", "internal_thought"}}
    };
}

Result<int> read_rating(const json& data, const char* field) {
    if (!data.contains(field) || !data[field].is_number()) {
        return make_schema_error(std::string("behavioral evaluation has no numeric ") + field);
    }
    double raw = data[field].get<double>();
    if (!(raw >= constants::scoring::MIN_BEHAVIORAL_SCORE &&
          raw <= constants::scoring::MAX_BEHAVIORAL_SCORE)) {
        return make_schema_error(std::string(field) + " out of range: " + data[field].dump());
    }
    if (raw != std::floor(raw)) {
        return make_schema_error(std::string(field) + " must be an integer");
    }
    return static_cast<int>(raw);
}

} // namespace

BehavioralEvaluator::BehavioralEvaluator(std::shared_ptr<InferenceProvider> provider)
    : provider_(std::move(provider)) {}

Result<BehavioralEvaluation> BehavioralEvaluator::evaluate(const EvaluationInput& input) const {
    InferenceRequest request;
    request.role = AgentRole::Empath;
    request.system_prompt = EMPATH_SYSTEM_PROMPT;
    request.context = {
        {"question", input.question},
        {"answer", input.message},
        {"target_grade", input.candidate.target_grade}
    };
    request.prompt = "Question: " + input.question + "\nCandidate's answer: " + input.message;
    request.schema = empath_schema();
    request.schema_name = "behavioral_evaluation";

    auto response = provider_->invoke(request);
    if (response.is_error()) {
        return response.error();
    }
    auto parsed = parse(response.value().data);
    if (parsed.is_ok()) {
        LOG_EMPATH("turn " + std::to_string(input.turn_id) + " demeanor=" +
                   to_string(parsed.value().demeanor));
    }
    return parsed;
}

Result<BehavioralEvaluation> BehavioralEvaluator::parse(const json& data) {
    if (!data.is_object()) {
        return make_schema_error("behavioral evaluation is not an object");
    }

    BehavioralEvaluation evaluation;

    auto clarity = read_rating(data, "clarity");
    if (clarity.is_error()) return clarity.error();
    evaluation.clarity = clarity.value();

    auto honesty = read_rating(data, "honesty");
    if (honesty.is_error()) return honesty.error();
    evaluation.honesty = honesty.value();

    if (!data.contains("engagement") || !data["engagement"].is_string()) {
        return make_schema_error("behavioral evaluation has no engagement");
    }
    auto engagement = parse_engagement(data["engagement"].get<std::string>());
    if (!engagement) {
        return make_schema_error("unknown engagement: " + data["engagement"].get<std::string>());
    }
    evaluation.engagement = *engagement;

    if (!data.contains("stress_level") || !data["stress_level"].is_string()) {
        return make_schema_error("behavioral evaluation has no stress_level");
    }
    auto stress = parse_stress_level(data["stress_level"].get<std::string>());
    if (!stress) {
        return make_schema_error("unknown stress_level: " + data["stress_level"].get<std::string>());
    }
    evaluation.stress_level = *stress;

    // Optional fields: unknown values are dropped rather than rejected
    if (data.contains("demeanor") && data["demeanor"].is_string()) {
        evaluation.demeanor = parse_demeanor(data["demeanor"].get<std::string>()).value_or(Demeanor::Normal);
    }
    if (data.contains("recommended_protocol") && data["recommended_protocol"].is_string()) {
        evaluation.recommended_protocol = parse_protocol(data["recommended_protocol"].get<std::string>());
    }
    if (data.contains("internal_thought") && data["internal_thought"].is_string()) {
        evaluation.thought = data["internal_thought"].get<std::string>();
    }
    return evaluation;
}

void BehavioralEvaluator::apply(BehavioralContext& context, const BehavioralEvaluation& evaluation) const {
    context.demeanor = evaluation.demeanor;
    context.stress_level = evaluation.stress_level;
    context.engagement = evaluation.engagement;
    context.evaluations++;
    context.clarity_total += evaluation.clarity;
    context.honesty_total += evaluation.honesty;
}

std::string BehavioralEvaluator::format_note(const BehavioralEvaluation& evaluation) {
    std::ostringstream oss;
    oss << "[Empath]: clarity " << evaluation.clarity << "/10, honesty " << evaluation.honesty
        << "/10, engagement " << to_string(evaluation.engagement)
        << ", stress " << to_string(evaluation.stress_level)
        << ", demeanor " << to_string(evaluation.demeanor);
    if (evaluation.recommended_protocol) {
        oss << ", suggests " << to_string(*evaluation.recommended_protocol);
    }
    if (!evaluation.thought.empty()) {
        oss << ". " << evaluation.thought;
    }
    return oss.str();
}

} // namespace interview_coach
