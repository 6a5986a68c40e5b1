#pragma once

#include "errors.h"
#include "inference_provider.h"
#include "session_state.h"
#include "skill_tree.h"
#include <memory>
#include <vector>

namespace interview_coach {

/**
 * @brief Builds the initial topic plan for a candidate
 */
class PlanGenerator {
public:
    PlanGenerator(std::shared_ptr<InferenceProvider> provider, size_t max_topics);

    /// @return SchemaViolation if the provider yields no usable topics
    Result<std::vector<Topic>> generate(const CandidateMetadata& candidate) const;

    /// Keeps at most max_topics non-empty topics, ids numbered from 1
    static Result<std::vector<Topic>> parse(const nlohmann::json& data, size_t max_topics);

    /// "Core skills for <role>", "Practical experience: <first 50 chars>"
    static std::vector<Topic> fallback_plan(const CandidateMetadata& candidate);

private:
    std::shared_ptr<InferenceProvider> provider_;
    size_t max_topics_;
};

} // namespace interview_coach
