#pragma once

#include "core/types.h"
#include "errors.h"
#include "inference_provider.h"
#include "session_state.h"
#include "technical_evaluator.h"
#include <memory>
#include <optional>
#include <string>

namespace interview_coach {

struct BehavioralEvaluation {
    int clarity = 5;   ///< 1..10
    int honesty = 5;   ///< 1..10
    Engagement engagement = Engagement::Medium;
    StressLevel stress_level = StressLevel::Low;
    Demeanor demeanor = Demeanor::Normal;
    std::string thought;
    /// Advisory only; the planner owns the protocol
    std::optional<Protocol> recommended_protocol;
};

/**
 * @brief Empath: reads communication signals of an answer
 *
 * Runs independently of the Skeptic and never touches the skill tree.
 */
class BehavioralEvaluator {
public:
    explicit BehavioralEvaluator(std::shared_ptr<InferenceProvider> provider);

    Result<BehavioralEvaluation> evaluate(const EvaluationInput& input) const;

    static Result<BehavioralEvaluation> parse(const nlohmann::json& data);

    /// Fold one evaluation into the running behavioural context
    void apply(BehavioralContext& context, const BehavioralEvaluation& evaluation) const;

    static std::string format_note(const BehavioralEvaluation& evaluation);

private:
    std::shared_ptr<InferenceProvider> provider_;
};

} // namespace interview_coach
