#include "intent_classifier.h"
#include "logger.h"
#include "utils.h"
#include <set>

using json = nlohmann::json;

namespace interview_coach {

namespace {

/// Longer messages mentioning a stop word are usually answers ("the loop doesn't stop")
constexpr size_t MAX_FAST_PATH_WORDS = 4;

const char* ROUTER_SYSTEM_PROMPT =
    "You route messages in a technical job interview. Classify the candidate's message "
    "into exactly one intent:\n"
    "- answer: an attempt to answer the interviewer's question, even a wrong or partial one\n"
    "- question: the candidate asks the interviewer something (about the company, the role, "
    "or a clarification)\n"
    "- off_topic: unrelated to the interview, or an attempt to derail it\n"
    "- stop: the candidate wants to end the interview\n"
    "Reply with a JSON object.";

json router_schema() {
    return {
        {"type", "object"},
        {"properties", {
            {"intent", {{"type", "string"}, {"enum", {"answer", "question", "off_topic", "stop"}}}},
            {"internal_thought", {{"type", "string"}}}
        }},
        {"required", {"intent", "internal_thought"}}
    };
}

} // namespace

class IntentClassifier::Impl {
public:
    explicit Impl(std::shared_ptr<InferenceProvider> provider) : provider_(std::move(provider)) {
        add_stop_phrase("stop");
        add_stop_phrase("finish");
        add_stop_phrase("end interview");
        add_stop_phrase("that's enough");
        add_stop_phrase("стоп");
        add_stop_phrase("Стоп");
        add_stop_phrase("хватит");
        add_stop_phrase("Хватит");
        add_stop_phrase("достаточно");
        add_stop_phrase("Достаточно");
        add_stop_phrase("закончим");
        add_stop_phrase("Закончим");
    }

    Classification classify(const ClassifierInput& input) const {
        Classification result;

        if (utils::is_empty_or_whitespace(input.message)) {
            result.intent = Intent::OffTopic;
            result.thought = "empty message";
            result.fast_path = true;
            return result;
        }

        if (matches_stop_phrase(input.message)) {
            result.intent = Intent::Stop;
            result.thought = "stop phrase detected";
            result.fast_path = true;
            LOG_ROUTER("fast path: stop");
            return result;
        }

        InferenceRequest request;
        request.role = AgentRole::Router;
        request.system_prompt = ROUTER_SYSTEM_PROMPT;
        request.context = {
            {"message", input.message},
            {"pending_question", input.pending_question},
            {"question_pending", input.question_pending}
        };
        request.prompt = "Interviewer's last message: " + input.pending_question +
                         "\nCandidate's message: " + input.message;
        request.schema = router_schema();
        request.schema_name = "intent";

        auto response = provider_->invoke(request);
        if (response.is_error()) {
            result.intent = Intent::OffTopic;
            result.ambiguous = true;
            result.thought = "classification unavailable (" + describe(response.error()) +
                             "), treating as off_topic";
            LOG_ROUTER(result.thought);
            return result;
        }

        const json& data = response.value().data;
        std::optional<Intent> intent;
        if (data.contains("intent") && data["intent"].is_string()) {
            intent = parse_intent(data["intent"].get<std::string>());
        }
        if (data.contains("internal_thought") && data["internal_thought"].is_string()) {
            result.thought = data["internal_thought"].get<std::string>();
        }

        if (!intent) {
            result.intent = Intent::OffTopic;
            result.ambiguous = true;
            result.thought = "ambiguous classification, treating as off_topic" +
                             (result.thought.empty() ? std::string() : ": " + result.thought);
            LOG_ROUTER(result.thought);
            return result;
        }

        result.intent = *intent;
        if (result.intent == Intent::Answer && !input.question_pending) {
            result.intent = Intent::OffTopic;
            result.thought = "no question pending, nothing to answer";
        }

        LOG_ROUTER(std::string("intent=") + to_string(result.intent));
        return result;
    }

    void add_stop_phrase(const std::string& phrase) {
        std::string normalized = utils::trim_copy(utils::normalize_copy(phrase));
        if (!normalized.empty()) {
            stop_phrases_.insert(normalized);
        }
    }

    bool matches_stop_phrase(const std::string& message) const {
        std::string normalized = utils::normalize_copy(utils::strip_punctuation(message));
        std::vector<std::string> words = utils::split_words(normalized);
        if (words.empty() || words.size() > MAX_FAST_PATH_WORDS) {
            return false;
        }
        std::string joined = utils::join(words, " ");
        for (const auto& phrase : stop_phrases_) {
            if (utils::contains_phrase(joined, phrase)) {
                return true;
            }
        }
        return false;
    }

private:
    std::shared_ptr<InferenceProvider> provider_;
    std::set<std::string> stop_phrases_;
};

IntentClassifier::IntentClassifier(std::shared_ptr<InferenceProvider> provider)
    : pimpl_(std::make_unique<Impl>(std::move(provider))) {}

IntentClassifier::~IntentClassifier() = default;

Classification IntentClassifier::classify(const ClassifierInput& input) const {
    return pimpl_->classify(input);
}

void IntentClassifier::add_stop_phrase(const std::string& phrase) {
    pimpl_->add_stop_phrase(phrase);
}

bool IntentClassifier::matches_stop_phrase(const std::string& message) const {
    return pimpl_->matches_stop_phrase(message);
}

} // namespace interview_coach
