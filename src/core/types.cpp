/**
 * @file types.cpp
 * @brief Wire names and parsers for the core vocabularies
 */

#include "core/types.h"
#include "utils.h"

namespace interview_coach {

namespace {

/// Lowercase, trim, and fold spaces/hyphens into underscores ("Strong Hire" -> "strong_hire")
std::string canonical(const std::string& text) {
    std::string key = utils::normalize_copy(utils::trim_copy(text));
    for (char& c : key) {
        if (c == ' ' || c == '-') c = '_';
    }
    return key;
}

} // namespace

const char* to_string(Intent intent) {
    switch (intent) {
        case Intent::Answer:   return "answer";
        case Intent::Question: return "question";
        case Intent::OffTopic: return "off_topic";
        case Intent::Stop:     return "stop";
    }
    return "off_topic";
}

const char* to_string(Protocol protocol) {
    switch (protocol) {
        case Protocol::Standard:   return "standard";
        case Protocol::Rescue:     return "rescue";
        case Protocol::Speedrun:   return "speedrun";
        case Protocol::StressTest: return "stress_test";
    }
    return "standard";
}

const char* to_string(Directive directive) {
    switch (directive) {
        case Directive::Opening:        return "opening";
        case Directive::AskFollowup:    return "ask_followup";
        case Directive::AdvanceTopic:   return "advance_topic";
        case Directive::AnswerQuestion: return "answer_question";
        case Directive::Redirect:       return "redirect";
        case Directive::Rescue:         return "rescue";
        case Directive::SpeedrunNext:   return "speedrun_next";
        case Directive::StressProbe:    return "stress_probe";
        case Directive::Terminate:      return "terminate";
    }
    return "terminate";
}

const char* to_string(Accuracy accuracy) {
    switch (accuracy) {
        case Accuracy::Accurate:         return "accurate";
        case Accuracy::PartiallyCorrect: return "partially_correct";
        case Accuracy::Incorrect:        return "incorrect";
        case Accuracy::Hallucinated:     return "hallucinated";
    }
    return "incorrect";
}

const char* to_string(Depth depth) {
    switch (depth) {
        case Depth::Superficial: return "superficial";
        case Depth::Adequate:    return "adequate";
        case Depth::Deep:        return "deep";
        case Depth::Expert:      return "expert";
    }
    return "superficial";
}

const char* to_string(Engagement engagement) {
    switch (engagement) {
        case Engagement::Low:    return "low";
        case Engagement::Medium: return "medium";
        case Engagement::High:   return "high";
    }
    return "medium";
}

const char* to_string(StressLevel level) {
    switch (level) {
        case StressLevel::Low:    return "low";
        case StressLevel::Medium: return "medium";
        case StressLevel::High:   return "high";
    }
    return "low";
}

const char* to_string(Demeanor demeanor) {
    switch (demeanor) {
        case Demeanor::Normal:   return "normal";
        case Demeanor::Verbose:  return "verbose";
        case Demeanor::Silent:   return "silent";
        case Demeanor::Arrogant: return "arrogant";
        case Demeanor::Stuck:    return "stuck";
        case Demeanor::Nervous:  return "nervous";
    }
    return "normal";
}

const char* to_string(Difficulty difficulty) {
    switch (difficulty) {
        case Difficulty::Easy:   return "easy";
        case Difficulty::Medium: return "medium";
        case Difficulty::Hard:   return "hard";
        case Difficulty::Expert: return "expert";
    }
    return "medium";
}

const char* to_string(Level level) {
    switch (level) {
        case Level::Junior:  return "junior";
        case Level::Middle:  return "middle";
        case Level::Senior:  return "senior";
        case Level::Unknown: return "unknown";
    }
    return "unknown";
}

const char* to_string(Recommendation recommendation) {
    switch (recommendation) {
        case Recommendation::StrongHire: return "strong_hire";
        case Recommendation::Hire:       return "hire";
        case Recommendation::NoHire:     return "no_hire";
        case Recommendation::Unknown:    return "unknown";
    }
    return "unknown";
}

const char* to_string(AgentRole role) {
    switch (role) {
        case AgentRole::Router:   return "router";
        case AgentRole::Skeptic:  return "skeptic";
        case AgentRole::Empath:   return "empath";
        case AgentRole::Planner:  return "planner";
        case AgentRole::Voice:    return "voice";
        case AgentRole::Reporter: return "reporter";
    }
    return "router";
}

const char* to_string(TerminationReason reason) {
    switch (reason) {
        case TerminationReason::None:              return "none";
        case TerminationReason::CandidateStop:     return "candidate_stop";
        case TerminationReason::TurnLimit:         return "turn_limit";
        case TerminationReason::PlanExhausted:     return "plan_exhausted";
        case TerminationReason::GenerationFailure: return "generation_failure";
        case TerminationReason::Interrupted:       return "interrupted";
    }
    return "none";
}

const char* to_string(ScorePolicy policy) {
    switch (policy) {
        case ScorePolicy::LastValue: return "last_value";
        case ScorePolicy::Average:   return "average";
    }
    return "last_value";
}

std::optional<Intent> parse_intent(const std::string& text) {
    std::string key = canonical(text);
    if (key == "answer") return Intent::Answer;
    if (key == "question") return Intent::Question;
    if (key == "off_topic" || key == "offtopic") return Intent::OffTopic;
    if (key == "stop") return Intent::Stop;
    return std::nullopt;
}

std::optional<Protocol> parse_protocol(const std::string& text) {
    std::string key = canonical(text);
    if (key == "standard") return Protocol::Standard;
    if (key == "rescue") return Protocol::Rescue;
    if (key == "speedrun") return Protocol::Speedrun;
    if (key == "stress_test" || key == "stresstest") return Protocol::StressTest;
    return std::nullopt;
}

std::optional<Accuracy> parse_accuracy(const std::string& text) {
    std::string key = canonical(text);
    if (key == "accurate") return Accuracy::Accurate;
    if (key == "partially_correct" || key == "partial") return Accuracy::PartiallyCorrect;
    if (key == "incorrect") return Accuracy::Incorrect;
    if (key == "hallucinated" || key == "hallucination") return Accuracy::Hallucinated;
    return std::nullopt;
}

std::optional<Depth> parse_depth(const std::string& text) {
    std::string key = canonical(text);
    if (key == "superficial") return Depth::Superficial;
    if (key == "adequate") return Depth::Adequate;
    if (key == "deep") return Depth::Deep;
    if (key == "expert") return Depth::Expert;
    return std::nullopt;
}

std::optional<Engagement> parse_engagement(const std::string& text) {
    std::string key = canonical(text);
    if (key == "low") return Engagement::Low;
    if (key == "medium") return Engagement::Medium;
    if (key == "high") return Engagement::High;
    return std::nullopt;
}

std::optional<StressLevel> parse_stress_level(const std::string& text) {
    std::string key = canonical(text);
    if (key == "low") return StressLevel::Low;
    if (key == "medium") return StressLevel::Medium;
    if (key == "high") return StressLevel::High;
    return std::nullopt;
}

std::optional<Demeanor> parse_demeanor(const std::string& text) {
    std::string key = canonical(text);
    if (key == "normal") return Demeanor::Normal;
    if (key == "verbose") return Demeanor::Verbose;
    if (key == "silent") return Demeanor::Silent;
    if (key == "arrogant") return Demeanor::Arrogant;
    if (key == "stuck") return Demeanor::Stuck;
    if (key == "nervous") return Demeanor::Nervous;
    return std::nullopt;
}

std::optional<Difficulty> parse_difficulty(const std::string& text) {
    std::string key = canonical(text);
    if (key == "easy") return Difficulty::Easy;
    if (key == "medium") return Difficulty::Medium;
    if (key == "hard") return Difficulty::Hard;
    if (key == "expert") return Difficulty::Expert;
    return std::nullopt;
}

std::optional<Level> parse_level(const std::string& text) {
    std::string key = canonical(text);
    if (key == "junior") return Level::Junior;
    if (key == "middle") return Level::Middle;
    if (key == "senior") return Level::Senior;
    return std::nullopt;
}

std::optional<Recommendation> parse_recommendation(const std::string& text) {
    std::string key = canonical(text);
    if (key == "strong_hire") return Recommendation::StrongHire;
    if (key == "hire") return Recommendation::Hire;
    if (key == "no_hire") return Recommendation::NoHire;
    return std::nullopt;
}

std::optional<ScorePolicy> parse_score_policy(const std::string& text) {
    std::string key = canonical(text);
    if (key == "last_value" || key == "last") return ScorePolicy::LastValue;
    if (key == "average" || key == "mean") return ScorePolicy::Average;
    return std::nullopt;
}

ProtocolPolicy protocol_policy(Protocol protocol) {
    switch (protocol) {
        case Protocol::Standard:
            return {"normal", "as planned", 3,
                    "Ask one clear question at the planned difficulty."};
        case Protocol::Rescue:
            return {"slow", "lower", 5,
                    "Simplify: offer a hint or a smaller sub-question and encourage the candidate."};
        case Protocol::Speedrun:
            return {"fast", "higher", 2,
                    "Be brief, skip basics and go straight to advanced aspects."};
        case Protocol::StressTest:
            return {"relentless", "highest", 1,
                    "Challenge the candidate's claims directly with edge cases and trade-offs."};
    }
    return {"normal", "as planned", 3, "Ask one clear question at the planned difficulty."};
}

} // namespace interview_coach
