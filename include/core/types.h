#pragma once

/**
 * @file types.h
 * @brief Closed vocabularies of the interview core
 *
 * Every enum has a stable lowercase wire name (to_string) and a lenient
 * parser that returns std::nullopt for anything outside the vocabulary.
 */

#include <optional>
#include <string>

namespace interview_coach {

// =============================================================================
// Turn Routing
// =============================================================================

/// Classification of one candidate message (total: exactly one per message)
enum class Intent {
    Answer,     ///< Attempt to answer the pending question
    Question,   ///< Candidate asks the interviewer something
    OffTopic,   ///< Unrelated to the interview
    Stop        ///< Candidate wants to end the interview
};

/// Interview-wide pacing mode, written only by StrategicPlanner
enum class Protocol {
    Standard,
    Rescue,      ///< Scaffold a struggling candidate
    Speedrun,    ///< Compress remaining topics for a strong candidate
    StressTest   ///< Adversarial probing of an expert
};

/// What the Voice is told to do this turn
enum class Directive {
    Opening,         ///< Greeting plus first question, before any candidate message
    AskFollowup,     ///< Stay on the active topic
    AdvanceTopic,    ///< Move to the next uncovered topic
    AnswerQuestion,  ///< Answer the candidate, then re-pose the pending question
    Redirect,        ///< Steer an off-topic candidate back
    Rescue,
    SpeedrunNext,
    StressProbe,
    Terminate
};

// =============================================================================
// Evaluation Vocabularies
// =============================================================================

enum class Accuracy { Accurate, PartiallyCorrect, Incorrect, Hallucinated };

enum class Depth { Superficial, Adequate, Deep, Expert };

enum class Engagement { Low, Medium, High };

enum class StressLevel { Low, Medium, High };

enum class Demeanor { Normal, Verbose, Silent, Arrogant, Stuck, Nervous };

enum class Difficulty { Easy, Medium, Hard, Expert };

// =============================================================================
// Verdict Vocabularies
// =============================================================================

enum class Level { Junior, Middle, Senior, Unknown };

enum class Recommendation { StrongHire, Hire, NoHire, Unknown };

// =============================================================================
// Session Plumbing
// =============================================================================

/// Agent role tag attached to every inference request
enum class AgentRole { Router, Skeptic, Empath, Planner, Voice, Reporter };

enum class TerminationReason {
    None,
    CandidateStop,
    TurnLimit,
    PlanExhausted,
    GenerationFailure,
    Interrupted
};

/// How repeated answers on one topic combine into its score
enum class ScorePolicy {
    LastValue,  ///< Latest evaluation wins
    Average     ///< Rounded mean of all evaluations
};

const char* to_string(Intent intent);
const char* to_string(Protocol protocol);
const char* to_string(Directive directive);
const char* to_string(Accuracy accuracy);
const char* to_string(Depth depth);
const char* to_string(Engagement engagement);
const char* to_string(StressLevel level);
const char* to_string(Demeanor demeanor);
const char* to_string(Difficulty difficulty);
const char* to_string(Level level);
const char* to_string(Recommendation recommendation);
const char* to_string(AgentRole role);
const char* to_string(TerminationReason reason);
const char* to_string(ScorePolicy policy);

std::optional<Intent> parse_intent(const std::string& text);
std::optional<Protocol> parse_protocol(const std::string& text);
std::optional<Accuracy> parse_accuracy(const std::string& text);
std::optional<Depth> parse_depth(const std::string& text);
std::optional<Engagement> parse_engagement(const std::string& text);
std::optional<StressLevel> parse_stress_level(const std::string& text);
std::optional<Demeanor> parse_demeanor(const std::string& text);
std::optional<Difficulty> parse_difficulty(const std::string& text);
std::optional<Level> parse_level(const std::string& text);
std::optional<Recommendation> parse_recommendation(const std::string& text);
std::optional<ScorePolicy> parse_score_policy(const std::string& text);

/**
 * @brief Pacing parameters the Voice applies for a protocol
 */
struct ProtocolPolicy {
    const char* pacing;      ///< "normal", "slow", "fast", "relentless"
    const char* difficulty;  ///< relative to the planned topic difficulty
    int tolerance;           ///< 1 (none) .. 5 (very forgiving) for vague answers
    const char* guidance;    ///< one-line instruction for the Voice
};

ProtocolPolicy protocol_policy(Protocol protocol);

} // namespace interview_coach
