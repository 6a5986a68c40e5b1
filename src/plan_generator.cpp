#include "plan_generator.h"
#include "core/constants.h"
#include "logger.h"
#include "utils.h"
#include <sstream>

using json = nlohmann::json;

namespace interview_coach {

namespace {

const char* PLANNER_SYSTEM_PROMPT =
    "You plan a technical interview. Propose concrete, checkable topics for the position "
    "and grade (for example 'Python GIL and multithreading', not 'Python'). Order them "
    "from easier to harder. Reply with a JSON object.";

json planner_schema() {
    return {
        {"type", "object"},
        {"properties", {
            {"topics", {
                {"type", "array"},
                {"items", {
                    {"type", "object"},
                    {"properties", {
                        {"topic", {{"type", "string"}}},
                        {"difficulty", {{"type", "string"}, {"enum", {"easy", "medium", "hard", "expert"}}}},
                        {"rationale", {{"type", "string"}}}
                    }},
                    {"required", {"topic", "difficulty"}}
                }}
            }},
            {"internal_thought", {{"type", "string"}}}
        }},
        {"required", {"topics"}}
    };
}

} // namespace

PlanGenerator::PlanGenerator(std::shared_ptr<InferenceProvider> provider, size_t max_topics)
    : provider_(std::move(provider)), max_topics_(max_topics) {}

Result<std::vector<Topic>> PlanGenerator::generate(const CandidateMetadata& candidate) const {
    InferenceRequest request;
    request.role = AgentRole::Planner;
    request.system_prompt = PLANNER_SYSTEM_PROMPT;
    request.context = {
        {"role", candidate.role},
        {"target_grade", candidate.target_grade},
        {"experience", candidate.experience}
    };

    std::ostringstream prompt;
    prompt << "Position: " << candidate.role << "\n"
           << "Target grade: " << candidate.target_grade << "\n"
           << "Experience: " << candidate.experience << "\n"
           << "Propose " << constants::interview::REQUESTED_MIN_TOPICS << "-"
           << constants::interview::REQUESTED_MAX_TOPICS << " topics.";
    request.prompt = prompt.str();
    request.schema = planner_schema();
    request.schema_name = "interview_plan";

    auto response = provider_->invoke(request);
    if (response.is_error()) {
        return response.error();
    }
    return parse(response.value().data, max_topics_);
}

Result<std::vector<Topic>> PlanGenerator::parse(const json& data, size_t max_topics) {
    if (!data.is_object() || !data.contains("topics") || !data["topics"].is_array()) {
        return make_schema_error("plan has no topics array");
    }

    std::vector<Topic> topics;
    for (const auto& item : data["topics"]) {
        if (topics.size() >= max_topics) break;

        std::string label;
        Difficulty difficulty = Difficulty::Medium;
        std::string rationale;

        if (item.is_string()) {
            label = item.get<std::string>();
        } else if (item.is_object() && item.contains("topic") && item["topic"].is_string()) {
            label = item["topic"].get<std::string>();
            if (item.contains("difficulty") && item["difficulty"].is_string()) {
                difficulty = parse_difficulty(item["difficulty"].get<std::string>()).value_or(Difficulty::Medium);
            }
            if (item.contains("rationale") && item["rationale"].is_string()) {
                rationale = item["rationale"].get<std::string>();
            }
        }

        utils::trim(label);
        if (label.empty()) continue;
        topics.emplace_back(static_cast<int>(topics.size()) + 1, label, difficulty, rationale);
    }

    if (topics.empty()) {
        return make_schema_error("plan contains no usable topics");
    }
    return topics;
}

std::vector<Topic> PlanGenerator::fallback_plan(const CandidateMetadata& candidate) {
    std::vector<Topic> topics;
    topics.emplace_back(1, "Core skills for " + candidate.role, Difficulty::Medium);
    topics.emplace_back(2, "Practical experience: " +
                               utils::truncate_utf8(candidate.experience,
                                                    constants::interview::FALLBACK_EXPERIENCE_CHARS),
                        Difficulty::Medium);
    return topics;
}

} // namespace interview_coach
