#pragma once

#include "core/types.h"
#include "inference_provider.h"
#include <memory>
#include <string>

namespace interview_coach {

/**
 * @brief Result of routing one candidate message
 */
struct Classification {
    Intent intent = Intent::OffTopic;
    std::string thought;     ///< short rationale, goes into the turn notes
    bool fast_path = false;  ///< decided by keyword rule, no provider call
    bool ambiguous = false;  ///< provider failed or answered outside the vocabulary
};

/**
 * @brief Minimal context the router needs
 */
struct ClassifierInput {
    std::string message;
    std::string pending_question;  ///< last agent message
    bool question_pending = true;
};

/**
 * @brief Router: maps each message to exactly one Intent
 *
 * Short messages containing a stop phrase are routed by a whole-word
 * fast path. Everything else goes to the provider; anything it cannot
 * classify falls back to OffTopic. No side effects on session state.
 */
class IntentClassifier {
public:
    explicit IntentClassifier(std::shared_ptr<InferenceProvider> provider);
    ~IntentClassifier();

    Classification classify(const ClassifierInput& input) const;

    /**
     * @brief Add a stop phrase for the fast path (matched case-insensitively, whole words)
     *
     * Not synchronized with classify(); configure before the session starts.
     */
    void add_stop_phrase(const std::string& phrase);

    /// True when the fast path alone would route the message to Stop
    bool matches_stop_phrase(const std::string& message) const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace interview_coach
