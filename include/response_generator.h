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
 * @brief Inputs for one outbound message (copied out of the session)
 */
struct ResponseRequest {
    int turn_id = 0;
    Directive directive = Directive::AskFollowup;
    Protocol protocol = Protocol::Standard;
    bool topic_advanced = false;
    std::string topic_label;
    Difficulty difficulty = Difficulty::Medium;
    CandidateMetadata candidate;
    std::vector<Turn> recent_turns;
    std::string candidate_message;

    /// Set when the answer contained an invented claim; the Voice pushes back briefly
    bool challenge_claim = false;
    std::optional<std::string> correction;
};

struct Reply {
    std::string message;
    std::string thought;
};

/**
 * @brief Voice: turns the planner's directive into the next interviewer message
 */
class ResponseGenerator {
public:
    explicit ResponseGenerator(std::shared_ptr<InferenceProvider> provider);

    /// @return SchemaViolation if the provider returns an empty message
    Result<Reply> generate(const ResponseRequest& request) const;

    static Result<Reply> parse(const nlohmann::json& data);

    /// Instruction text for the directive, protocol and topic
    static std::string directive_instruction(const ResponseRequest& request);

private:
    std::shared_ptr<InferenceProvider> provider_;
};

} // namespace interview_coach
