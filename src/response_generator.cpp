#include "response_generator.h"
#include "logger.h"
#include "utils.h"
#include <sstream>

using json = nlohmann::json;

namespace interview_coach {

namespace {

const char* VOICE_SYSTEM_PROMPT =
    "You are a friendly but demanding technical interviewer. Follow the director's "
    "instruction exactly. Ask at most one question per message, never reveal scores or "
    "internal notes, and keep the message short. Reply with a JSON object.";

json voice_schema() {
    return {
        {"type", "object"},
        {"properties", {
            {"message", {{"type", "string"}}},
            {"internal_thought", {{"type", "string"}}}
        }},
        {"required", {"message", "internal_thought"}}
    };
}

json turns_to_json(const std::vector<Turn>& turns) {
    json history = json::array();
    for (const auto& turn : turns) {
        json entry;
        entry["turn_id"] = turn.turn_id;
        entry["interviewer"] = turn.agent_visible_message;
        if (turn.user_message) {
            entry["candidate"] = *turn.user_message;
        }
        history.push_back(entry);
    }
    return history;
}

} // namespace

ResponseGenerator::ResponseGenerator(std::shared_ptr<InferenceProvider> provider)
    : provider_(std::move(provider)) {}

std::string ResponseGenerator::directive_instruction(const ResponseRequest& request) {
    std::ostringstream oss;
    const std::string& topic = request.topic_label;

    switch (request.directive) {
        case Directive::Opening:
            oss << "Greet " << request.candidate.name << ", mention their experience ("
                << request.candidate.experience << ") in one sentence, and ask the first question on '"
                << topic << "'.";
            break;
        case Directive::AskFollowup:
            oss << "Ask a follow-up question on '" << topic << "' that goes deeper than the last answer.";
            break;
        case Directive::AdvanceTopic:
            oss << "Acknowledge the answer briefly and move on to a new topic: '" << topic << "'.";
            break;
        case Directive::AnswerQuestion:
            oss << "Answer the candidate's question briefly and honestly, then repeat the pending "
                   "question on '" << topic << "'.";
            break;
        case Directive::Redirect:
            oss << "Politely steer the candidate back to the interview and repeat the pending question on '"
                << topic << "'.";
            break;
        case Directive::Rescue:
            oss << "The candidate is struggling. Offer a hint or a simpler sub-question on '" << topic
                << "' and keep the tone encouraging.";
            break;
        case Directive::SpeedrunNext:
            oss << "The candidate is strong. Skip basics and ask an advanced question on '" << topic << "'.";
            break;
        case Directive::StressProbe:
            oss << "Probe '" << topic << "' with an edge case or trade-off that challenges the "
                   "candidate's last claim.";
            break;
        case Directive::Terminate:
            oss << "Thank the candidate and close the interview.";
            break;
    }

    if (request.topic_advanced && request.directive != Directive::AdvanceTopic) {
        oss << " This is a new topic.";
    }
    if (request.challenge_claim) {
        oss << " The last answer contained an invented or false claim: say so briefly";
        if (request.correction) {
            oss << " (correct fact: " << *request.correction << ")";
        }
        oss << ".";
    }

    ProtocolPolicy policy = protocol_policy(request.protocol);
    oss << " Pacing: " << policy.pacing << ", difficulty " << policy.difficulty
        << ". " << policy.guidance;
    return oss.str();
}

Result<Reply> ResponseGenerator::generate(const ResponseRequest& request) const {
    InferenceRequest inference;
    inference.role = AgentRole::Voice;
    inference.system_prompt = VOICE_SYSTEM_PROMPT;

    std::string instruction = directive_instruction(request);
    inference.context = {
        {"directive", to_string(request.directive)},
        {"protocol", to_string(request.protocol)},
        {"topic", request.topic_label},
        {"difficulty", to_string(request.difficulty)},
        {"candidate", {
            {"name", request.candidate.name},
            {"role", request.candidate.role},
            {"target_grade", request.candidate.target_grade}
        }},
        {"history", turns_to_json(request.recent_turns)},
        {"candidate_message", request.candidate_message}
    };

    std::ostringstream prompt;
    prompt << "Position: " << request.candidate.role << " (" << request.candidate.target_grade << ")\n";
    prompt << "Conversation so far:\n" << inference.context["history"].dump(2) << "\n";
    if (!request.candidate_message.empty()) {
        prompt << "Candidate just said: " << request.candidate_message << "\n";
    }
    prompt << "Director's instruction: " << instruction;
    inference.prompt = prompt.str();
    inference.schema = voice_schema();
    inference.schema_name = "reply";

    auto response = provider_->invoke(inference);
    if (response.is_error()) {
        return response.error();
    }
    auto reply = parse(response.value().data);
    if (reply.is_ok()) {
        LOG_VOICE("turn " + std::to_string(request.turn_id) + " " + to_string(request.directive));
    }
    return reply;
}

Result<Reply> ResponseGenerator::parse(const json& data) {
    if (!data.is_object() || !data.contains("message") || !data["message"].is_string()) {
        return make_schema_error("reply has no message");
    }
    Reply reply;
    reply.message = utils::trim_copy(data["message"].get<std::string>());
    if (reply.message.empty()) {
        return make_schema_error("reply message is empty");
    }
    if (data.contains("internal_thought") && data["internal_thought"].is_string()) {
        reply.thought = data["internal_thought"].get<std::string>();
    }
    return reply;
}

} // namespace interview_coach
