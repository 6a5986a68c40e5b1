/**
 * Router classification with a scripted provider.
 * Asserts:
 * - Short stop messages take the fast path (no provider call).
 * - Stop words inside longer answers do not stop the interview.
 * - Provider failures and unknown labels fall back to off_topic.
 * - An answer with nothing pending becomes off_topic.
 *
 * Run from build dir: ./test_intent_classifier
 */

#include "intent_classifier.h"
#include "logger.h"
#include "test_support.h"
#include <iostream>
#include <string>

using namespace interview_coach;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

namespace {

ClassifierInput input(const std::string& message, bool pending = true) {
    ClassifierInput in;
    in.message = message;
    in.pending_question = "How does a hash map handle collisions?";
    in.question_pending = pending;
    return in;
}

} // namespace

int main() {
    Logger::initialize(LogLevel::ERROR);

    // --- fast path ---
    {
        auto provider = std::make_shared<ScriptedProvider>();
        IntentClassifier classifier(provider);

        Classification c = classifier.classify(input("stop"));
        ASSERT(c.intent == Intent::Stop);
        ASSERT(c.fast_path);

        ASSERT(classifier.classify(input("Stop, please.")).intent == Intent::Stop);
        ASSERT(classifier.classify(input("That's enough!")).intent == Intent::Stop);
        ASSERT(classifier.classify(input("let's end interview")).intent == Intent::Stop);
        ASSERT(classifier.classify(input("Стоп")).intent == Intent::Stop);
        ASSERT(classifier.classify(input("хватит")).intent == Intent::Stop);
        ASSERT(provider->call_count(AgentRole::Router) == 0);

        ASSERT(classifier.matches_stop_phrase("finish"));
        ASSERT(!classifier.matches_stop_phrase("unstoppable"));
        ASSERT(!classifier.matches_stop_phrase("the loop does not stop until the channel closes"));
        ASSERT(!classifier.matches_stop_phrase(""));

        classifier.add_stop_phrase("I give up");
        ASSERT(classifier.matches_stop_phrase("ok, i give up"));
    }

    // --- empty message ---
    {
        auto provider = std::make_shared<ScriptedProvider>();
        IntentClassifier classifier(provider);
        Classification c = classifier.classify(input("   "));
        ASSERT(c.intent == Intent::OffTopic);
        ASSERT(provider->call_count(AgentRole::Router) == 0);
    }

    // --- provider path ---
    {
        auto provider = std::make_shared<ScriptedProvider>();
        provider->push_response(AgentRole::Router, test_support::router_reply("answer"));
        provider->push_response(AgentRole::Router, test_support::router_reply("question"));
        IntentClassifier classifier(provider);

        Classification answer = classifier.classify(
            input("I would stop the worker with a cancellation token and drain the queue"));
        ASSERT(answer.intent == Intent::Answer);
        ASSERT(!answer.fast_path);
        ASSERT(!answer.ambiguous);
        ASSERT(answer.thought == "routed as answer");

        Classification question = classifier.classify(input("What stack does your team use?"));
        ASSERT(question.intent == Intent::Question);
        ASSERT(provider->call_count(AgentRole::Router) == 2);

        auto request = provider->last_request(AgentRole::Router);
        ASSERT(request.has_value());
        ASSERT(request->role == AgentRole::Router);
        ASSERT(request->prompt.find("What stack does your team use?") != std::string::npos);
        ASSERT(request->schema.contains("properties"));
    }

    // --- fallbacks ---
    {
        auto provider = std::make_shared<ScriptedProvider>();
        provider->push_failure(AgentRole::Router, make_timeout_error("router timed out"));
        provider->push_response(AgentRole::Router, test_support::router_reply("maybe"));
        provider->push_response(AgentRole::Router, nlohmann::json::object());
        provider->push_response(AgentRole::Router, test_support::router_reply("answer"));
        IntentClassifier classifier(provider);

        Classification failed_call = classifier.classify(input("some text here for routing"));
        ASSERT(failed_call.intent == Intent::OffTopic);
        ASSERT(failed_call.ambiguous);

        Classification unknown = classifier.classify(input("some text here for routing"));
        ASSERT(unknown.intent == Intent::OffTopic);
        ASSERT(unknown.ambiguous);

        Classification missing = classifier.classify(input("some text here for routing"));
        ASSERT(missing.intent == Intent::OffTopic);
        ASSERT(missing.ambiguous);

        Classification nothing_pending = classifier.classify(input("here is my answer anyway", false));
        ASSERT(nothing_pending.intent == Intent::OffTopic);
        ASSERT(!nothing_pending.ambiguous);

        // Queue drained, no default configured
        Classification no_script = classifier.classify(input("one more message to route"));
        ASSERT(no_script.intent == Intent::OffTopic);
        ASSERT(no_script.ambiguous);
    }

    Logger::shutdown();

    if (failed > 0) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All intent classifier tests passed.\n";
    return 0;
}
