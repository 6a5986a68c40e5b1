#pragma once

#include "core/types.h"
#include "errors.h"
#include "inference_provider.h"
#include "session_state.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace interview_coach {

struct TopicSummary {
    int topic_id = 0;
    std::string topic;
    std::optional<int> score;
    int questions_asked = 0;
    bool covered = false;
    std::string feedback;
    std::optional<std::string> correct_answer;

    /// Scored at or above the confirmed-skill threshold
    bool confirmed() const;
};

struct SoftSkills {
    std::optional<int> clarity;
    std::optional<int> honesty;
    std::optional<int> engagement;
    std::string notes;
};

/**
 * @brief Final assessment of the candidate
 *
 * A fallback verdict (report generation failed) has Unknown level and
 * recommendation, zero confidence, and still carries the topic summaries.
 */
struct Verdict {
    Level level = Level::Unknown;
    Recommendation recommendation = Recommendation::Unknown;
    int confidence = 0;  ///< 0..100
    std::string reasoning;
    std::vector<TopicSummary> topics;
    SoftSkills soft_skills;
    std::vector<std::string> roadmap;
    std::vector<std::string> resources;
    std::string thought;
    bool fallback = false;

    std::vector<TopicSummary> confirmed_skills() const;
    std::vector<TopicSummary> knowledge_gaps() const;
};

/**
 * @brief Reporter: reads the terminal session and produces the verdict
 */
class ReportGenerator {
public:
    explicit ReportGenerator(std::shared_ptr<InferenceProvider> provider);

    /// Single attempt; the caller owns retries
    Result<Verdict> generate(const SessionState& state) const;

    /**
     * @brief Validate a provider reply and attach topic summaries
     * @return SchemaViolation when level, recommendation or confidence is missing or invalid
     */
    static Result<Verdict> parse(const nlohmann::json& data, const SessionState& state);

    static std::vector<TopicSummary> summarize_topics(const SkillTree& tree);

    static Verdict fallback_verdict(const SessionState& state, const std::string& reason);

    /// Human-readable report for the console and the session log
    static std::string format_report(const Verdict& verdict, const SessionState& state);

private:
    std::shared_ptr<InferenceProvider> provider_;
};

} // namespace interview_coach
