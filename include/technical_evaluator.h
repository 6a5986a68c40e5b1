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

/**
 * @brief What the evaluators see of one answer (copied out of the session)
 */
struct EvaluationInput {
    int turn_id = 0;
    std::string message;
    std::string question;
    std::string topic_label;
    Difficulty difficulty = Difficulty::Medium;
    CandidateMetadata candidate;
};

struct TechnicalEvaluation {
    int score = 0;  ///< 0..10
    Accuracy accuracy = Accuracy::Incorrect;
    Depth depth = Depth::Superficial;
    std::string thought;
    std::vector<std::string> issues;
    std::optional<std::string> correct_answer;
    bool contradiction_detected = false;
    bool fictional_term_detected = false;

    bool hallucination() const {
        return accuracy == Accuracy::Hallucinated || fictional_term_detected;
    }
};

/**
 * @brief Skeptic: scores the technical substance of an answer
 *
 * evaluate() has no side effects and may run on a worker thread.
 * apply() is the only code path that writes topic scores and quotas.
 */
class TechnicalEvaluator {
public:
    explicit TechnicalEvaluator(std::shared_ptr<InferenceProvider> provider,
                                ScorePolicy policy = ScorePolicy::LastValue);

    Result<TechnicalEvaluation> evaluate(const EvaluationInput& input) const;

    /**
     * @brief Validate a provider reply
     * @return SchemaViolation for missing fields, unknown labels or a score outside 0..10
     */
    static Result<TechnicalEvaluation> parse(const nlohmann::json& data);

    /**
     * @brief Count the answer against the active topic
     * @throws std::logic_error if no topic is active or it is already covered
     */
    void apply(SessionState& state, const TechnicalEvaluation& evaluation) const;

    /// "[Skeptic]: [7/10] accurate/deep ..."
    static std::string format_note(const TechnicalEvaluation& evaluation);

    ScorePolicy policy() const { return policy_; }

private:
    std::shared_ptr<InferenceProvider> provider_;
    ScorePolicy policy_;
};

} // namespace interview_coach
