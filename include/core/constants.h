#pragma once

/**
 * @file constants.h
 * @brief Interview-wide constants and tuning parameters
 *
 * Scoring bands, window sizes and per-role model settings live here so the
 * decision policy can be read in one place.
 */

#include <cstddef>

namespace interview_coach {
namespace constants {

// =============================================================================
// Interview Shape
// =============================================================================

namespace interview {
    /// Questions asked per topic before it counts as covered
    constexpr int QUESTIONS_PER_TOPIC = 2;

    /// Default hard cap on turn records (candidate turns + closing turn)
    constexpr int DEFAULT_MAX_TURNS = 10;

    /// Smallest usable cap: one candidate turn plus the closing turn
    constexpr int MIN_MAX_TURNS = 2;

    /// Upper bound on topics kept from a generated plan
    constexpr size_t MAX_PLAN_TOPICS = 8;

    /// Topics requested from the planner role
    constexpr int REQUESTED_MIN_TOPICS = 6;
    constexpr int REQUESTED_MAX_TOPICS = 8;

    /// Characters of the experience text used in the fallback plan label
    constexpr size_t FALLBACK_EXPERIENCE_CHARS = 50;
}

// =============================================================================
// Scoring
// =============================================================================

namespace scoring {
    constexpr int MIN_TECHNICAL_SCORE = 0;
    constexpr int MAX_TECHNICAL_SCORE = 10;

    constexpr int MIN_BEHAVIORAL_SCORE = 1;
    constexpr int MAX_BEHAVIORAL_SCORE = 10;

    /// Window entry used when the technical evaluation is unavailable
    constexpr int NEUTRAL_SCORE = 5;

    /// Topics scoring at or above this are reported as confirmed skills
    constexpr int CONFIRMED_SKILL_THRESHOLD = 7;

    constexpr int MIN_CONFIDENCE = 0;
    constexpr int MAX_CONFIDENCE = 100;

    /// Issues kept per technical evaluation
    constexpr size_t MAX_ISSUES = 3;
}

// =============================================================================
// Protocol Transitions
// =============================================================================

namespace planner {
    /// Trailing technical scores considered for protocol changes (spans topics)
    constexpr size_t SCORE_WINDOW = 2;

    /// Both window scores at or below this enter rescue
    constexpr int RESCUE_MAX_SCORE = 3;

    /// Both window scores at or above this enter speedrun
    constexpr int SPEEDRUN_MIN_SCORE = 8;

    /// Both window scores inside [MIN, MAX] revert to standard
    constexpr int STANDARD_BAND_MIN = 4;
    constexpr int STANDARD_BAND_MAX = 7;

    /// Consecutive expert-depth answers under speedrun that enter stress test
    constexpr int STRESS_EXPERT_STREAK = 2;
}

// =============================================================================
// Retries
// =============================================================================

namespace retry {
    /// Extra attempts after a failed response generation
    constexpr int GENERATION_RETRIES = 1;

    /// Extra attempts after a failed or invalid report
    constexpr int REPORTING_RETRIES = 2;
}

// =============================================================================
// LLM Settings
// =============================================================================

namespace llm {
    constexpr int DEFAULT_TIMEOUT_MS = 60000;
    constexpr int CONNECT_TIMEOUT_MS = 5000;
    constexpr int DEFAULT_MAX_TOKENS = 2000;

    /// Closed turns sent to the Voice as recent history
    constexpr int CONTEXT_MAX_TURNS = 6;

    /// Per-role sampling temperature
    constexpr float ROUTER_TEMPERATURE = 0.0f;
    constexpr float SKEPTIC_TEMPERATURE = 0.1f;
    constexpr float EMPATH_TEMPERATURE = 0.3f;
    constexpr float PLANNER_TEMPERATURE = 0.4f;
    constexpr float VOICE_TEMPERATURE = 0.7f;
    constexpr float REPORTER_TEMPERATURE = 0.2f;

    /// Maximum characters of a provider body echoed into error messages
    constexpr size_t ERROR_BODY_PREVIEW = 200;
}

} // namespace constants
} // namespace interview_coach
