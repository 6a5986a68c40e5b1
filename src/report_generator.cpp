#include "report_generator.h"
#include "core/constants.h"
#include "logger.h"
#include "utils.h"
#include <cmath>
#include <sstream>

using json = nlohmann::json;

namespace interview_coach {

namespace {

const char* REPORTER_SYSTEM_PROMPT =
    "You write the final assessment of a technical interview. Use the topic scores, the "
    "interviewers' internal notes and the statistics. Decide the level (junior, middle, "
    "senior), a hiring recommendation (strong_hire, hire, no_hire) and your confidence from "
    "0 to 100. Rate soft skills, list a learning roadmap for the knowledge gaps with concrete "
    "resources. Reply with a JSON object.";

json reporter_schema() {
    return {
        {"type", "object"},
        {"properties", {
            {"level", {{"type", "string"}, {"enum", {"junior", "middle", "senior"}}}},
            {"recommendation", {{"type", "string"}, {"enum", {"strong_hire", "hire", "no_hire"}}}},
            {"confidence", {{"type", "integer"}, {"minimum", constants::scoring::MIN_CONFIDENCE},
                            {"maximum", constants::scoring::MAX_CONFIDENCE}}},
            {"reasoning", {{"type", "string"}}},
            {"soft_skills", {
                {"type", "object"},
                {"properties", {
                    {"clarity", {{"type", "integer"}}},
                    {"honesty", {{"type", "integer"}}},
                    {"engagement", {{"type", "integer"}}},
                    {"notes", {{"type", "string"}}}
                }}
            }},
            {"roadmap", {{"type", "array"}, {"items", {{"type", "string"}}}}},
            {"resources", {{"type", "array"}, {"items", {{"type", "string"}}}}},
            {"internal_thought", {{"type", "string"}}}
        }},
        {"required", {"level", "recommendation", "confidence", "reasoning"}}
    };
}

/// Integer field within [min, max]; absent, fractional or out-of-range values give nullopt
std::optional<int> bounded_int(const json& object, const char* field, int min, int max) {
    if (!object.contains(field) || !object[field].is_number()) {
        return std::nullopt;
    }
    double raw = object[field].get<double>();
    if (!(raw >= min && raw <= max) || raw != std::floor(raw)) {
        return std::nullopt;
    }
    return static_cast<int>(raw);
}

std::vector<std::string> string_list(const json& data, const char* field) {
    std::vector<std::string> items;
    if (data.contains(field) && data[field].is_array()) {
        for (const auto& item : data[field]) {
            if (item.is_string()) items.push_back(item.get<std::string>());
        }
    }
    return items;
}

json session_digest(const SessionState& state) {
    json topics = json::array();
    for (const auto& topic : state.skill_tree().topics()) {
        json entry;
        entry["topic"] = topic.label();
        entry["difficulty"] = to_string(topic.difficulty());
        entry["questions_asked"] = topic.questions_asked();
        entry["covered"] = topic.covered();
        entry["score"] = topic.score() ? json(*topic.score()) : json(nullptr);
        entry["feedback"] = topic.feedback();
        topics.push_back(entry);
    }

    json dialogue = json::array();
    for (const auto& turn : state.turns()) {
        json entry;
        entry["turn_id"] = turn.turn_id;
        entry["interviewer"] = turn.agent_visible_message;
        entry["candidate"] = turn.user_message ? json(*turn.user_message) : json(nullptr);
        entry["notes"] = turn.internal_thoughts;
        dialogue.push_back(entry);
    }

    const SessionStats& stats = state.stats();
    const BehavioralContext& behavior = state.behavior();
    return {
        {"candidate", {
            {"name", state.candidate().name},
            {"role", state.candidate().role},
            {"target_grade", state.candidate().target_grade},
            {"experience", state.candidate().experience}
        }},
        {"topics", topics},
        {"dialogue", dialogue},
        {"stats", {
            {"answers", stats.answers},
            {"questions", stats.questions},
            {"off_topic", stats.off_topic},
            {"hallucinations", stats.hallucinations},
            {"contradictions", stats.contradictions},
            {"degraded_evaluations", stats.degraded_evaluations}
        }},
        {"behavior", {
            {"demeanor", to_string(behavior.demeanor)},
            {"stress_level", to_string(behavior.stress_level)},
            {"average_clarity", behavior.average_clarity() ? json(*behavior.average_clarity()) : json(nullptr)},
            {"average_honesty", behavior.average_honesty() ? json(*behavior.average_honesty()) : json(nullptr)}
        }},
        {"final_protocol", to_string(state.protocol())},
        {"termination_reason", to_string(state.termination_reason())}
    };
}

std::string score_text(const std::optional<int>& score) {
    return score ? std::to_string(*score) + "/10" : std::string("n/a");
}

} // namespace

bool TopicSummary::confirmed() const {
    return score && *score >= constants::scoring::CONFIRMED_SKILL_THRESHOLD;
}

std::vector<TopicSummary> Verdict::confirmed_skills() const {
    std::vector<TopicSummary> result;
    for (const auto& topic : topics) {
        if (topic.confirmed()) result.push_back(topic);
    }
    return result;
}

std::vector<TopicSummary> Verdict::knowledge_gaps() const {
    std::vector<TopicSummary> result;
    for (const auto& topic : topics) {
        if (topic.score && !topic.confirmed()) result.push_back(topic);
    }
    return result;
}

ReportGenerator::ReportGenerator(std::shared_ptr<InferenceProvider> provider)
    : provider_(std::move(provider)) {}

Result<Verdict> ReportGenerator::generate(const SessionState& state) const {
    InferenceRequest request;
    request.role = AgentRole::Reporter;
    request.system_prompt = REPORTER_SYSTEM_PROMPT;
    request.context = session_digest(state);
    request.prompt = "Interview record:\n" + request.context.dump(2);
    request.schema = reporter_schema();
    request.schema_name = "verdict";

    auto response = provider_->invoke(request);
    if (response.is_error()) {
        return response.error();
    }
    return parse(response.value().data, state);
}

Result<Verdict> ReportGenerator::parse(const json& data, const SessionState& state) {
    if (!data.is_object()) {
        return make_schema_error("verdict is not an object");
    }

    Verdict verdict;

    if (!data.contains("level") || !data["level"].is_string()) {
        return make_schema_error("verdict has no level");
    }
    auto level = parse_level(data["level"].get<std::string>());
    if (!level) {
        return make_schema_error("unknown level: " + data["level"].get<std::string>());
    }
    verdict.level = *level;

    if (!data.contains("recommendation") || !data["recommendation"].is_string()) {
        return make_schema_error("verdict has no recommendation");
    }
    auto recommendation = parse_recommendation(data["recommendation"].get<std::string>());
    if (!recommendation) {
        return make_schema_error("unknown recommendation: " + data["recommendation"].get<std::string>());
    }
    verdict.recommendation = *recommendation;

    if (!data.contains("confidence") || !data["confidence"].is_number()) {
        return make_schema_error("verdict has no numeric confidence");
    }
    auto confidence = bounded_int(data, "confidence", constants::scoring::MIN_CONFIDENCE,
                                  constants::scoring::MAX_CONFIDENCE);
    if (!confidence) {
        return make_schema_error("confidence out of range: " + data["confidence"].dump());
    }
    verdict.confidence = *confidence;

    if (data.contains("reasoning") && data["reasoning"].is_string()) {
        verdict.reasoning = data["reasoning"].get<std::string>();
    }
    if (data.contains("internal_thought") && data["internal_thought"].is_string()) {
        verdict.thought = data["internal_thought"].get<std::string>();
    }

    const BehavioralContext& behavior = state.behavior();
    verdict.soft_skills.clarity = behavior.average_clarity();
    verdict.soft_skills.honesty = behavior.average_honesty();
    if (data.contains("soft_skills") && data["soft_skills"].is_object()) {
        const json& soft = data["soft_skills"];
        const int lo = constants::scoring::MIN_BEHAVIORAL_SCORE;
        const int hi = constants::scoring::MAX_BEHAVIORAL_SCORE;
        if (auto clarity = bounded_int(soft, "clarity", lo, hi)) verdict.soft_skills.clarity = clarity;
        if (auto honesty = bounded_int(soft, "honesty", lo, hi)) verdict.soft_skills.honesty = honesty;
        verdict.soft_skills.engagement = bounded_int(soft, "engagement", lo, hi);
        if (soft.contains("notes") && soft["notes"].is_string()) {
            verdict.soft_skills.notes = soft["notes"].get<std::string>();
        }
    }

    verdict.roadmap = string_list(data, "roadmap");
    verdict.resources = string_list(data, "resources");
    verdict.topics = summarize_topics(state.skill_tree());

    if (verdict.topics.size() != state.skill_tree().size()) {
        return make_schema_error("topic summaries incomplete");
    }
    return verdict;
}

std::vector<TopicSummary> ReportGenerator::summarize_topics(const SkillTree& tree) {
    std::vector<TopicSummary> summaries;
    summaries.reserve(tree.size());
    for (const auto& topic : tree.topics()) {
        TopicSummary summary;
        summary.topic_id = topic.id();
        summary.topic = topic.label();
        summary.score = topic.score();
        summary.questions_asked = topic.questions_asked();
        summary.covered = topic.covered();
        summary.feedback = topic.feedback();
        summary.correct_answer = topic.correct_answer();
        summaries.push_back(std::move(summary));
    }
    return summaries;
}

Verdict ReportGenerator::fallback_verdict(const SessionState& state, const std::string& reason) {
    Verdict verdict;
    verdict.fallback = true;
    verdict.reasoning = "Report generation failed: " + reason;
    verdict.topics = summarize_topics(state.skill_tree());
    verdict.soft_skills.clarity = state.behavior().average_clarity();
    verdict.soft_skills.honesty = state.behavior().average_honesty();
    return verdict;
}

std::string ReportGenerator::format_report(const Verdict& verdict, const SessionState& state) {
    std::ostringstream oss;
    const CandidateMetadata& candidate = state.candidate();

    oss << "==================== INTERVIEW REPORT ====================\n";
    oss << "Candidate: " << candidate.name << "\n";
    oss << "Position: " << candidate.role << " (target: " << candidate.target_grade << ")\n";
    oss << "Level: " << to_string(verdict.level)
        << " | Recommendation: " << to_string(verdict.recommendation)
        << " | Confidence: " << verdict.confidence << "%\n";
    if (verdict.fallback) {
        oss << "(automatic assessment unavailable)\n";
    }

    oss << "\nTopics:\n";
    for (const auto& topic : verdict.topics) {
        oss << "  - " << topic.topic << ": " << score_text(topic.score)
            << " (" << topic.questions_asked << "/" << constants::interview::QUESTIONS_PER_TOPIC
            << " questions)\n";
    }

    auto confirmed = verdict.confirmed_skills();
    if (!confirmed.empty()) {
        oss << "\nConfirmed skills:\n";
        for (const auto& topic : confirmed) {
            oss << "  + " << topic.topic << " (" << score_text(topic.score) << ")\n";
        }
    }

    auto gaps = verdict.knowledge_gaps();
    if (!gaps.empty()) {
        oss << "\nKnowledge gaps:\n";
        for (const auto& topic : gaps) {
            oss << "  - " << topic.topic << " (" << score_text(topic.score) << ")";
            if (topic.correct_answer) {
                oss << ": " << *topic.correct_answer;
            }
            oss << "\n";
        }
    }

    oss << "\nSoft skills: clarity " << score_text(verdict.soft_skills.clarity)
        << ", honesty " << score_text(verdict.soft_skills.honesty)
        << ", engagement " << score_text(verdict.soft_skills.engagement) << "\n";
    if (!verdict.soft_skills.notes.empty()) {
        oss << "  " << verdict.soft_skills.notes << "\n";
    }

    const SessionStats& stats = state.stats();
    oss << "\nStatistics: " << stats.answers << " answers, " << stats.questions
        << " candidate questions, " << stats.off_topic << " off-topic, "
        << stats.hallucinations << " hallucinations\n";

    if (!verdict.roadmap.empty()) {
        oss << "\nRoadmap:\n";
        for (const auto& step : verdict.roadmap) oss << "  * " << step << "\n";
    }
    if (!verdict.resources.empty()) {
        oss << "\nResources:\n";
        for (const auto& resource : verdict.resources) oss << "  * " << resource << "\n";
    }
    if (!verdict.reasoning.empty()) {
        oss << "\n" << verdict.reasoning << "\n";
    }
    oss << "==========================================================";
    return oss.str();
}

} // namespace interview_coach
