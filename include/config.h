#pragma once

#include "core/constants.h"
#include "core/types.h"
#include <string>

namespace interview_coach {

struct LLMConfig {
    /// OpenAI-compatible chat completions URL, or an Ollama /api/chat URL
    std::string endpoint = "https://api.openai.com/v1/chat/completions";
    std::string api_key;                      ///< Bearer token; empty = no Authorization header
    std::string model_name = "gpt-4o";        ///< Planner and Reporter (long-form reasoning)
    std::string fast_model_name = "gpt-4o-mini";  ///< Router, Skeptic, Empath, Voice
    int timeout_ms = constants::llm::DEFAULT_TIMEOUT_MS;
    int max_tokens = constants::llm::DEFAULT_MAX_TOKENS;
    int context_max_turns_to_send = constants::llm::CONTEXT_MAX_TURNS;  ///< Only send last N turns to the Voice
};

struct InterviewConfig {
    int max_turns = constants::interview::DEFAULT_MAX_TURNS;
    int max_topics = static_cast<int>(constants::interview::MAX_PLAN_TOPICS);
    ScorePolicy score_policy = ScorePolicy::LastValue;
};

struct RetryConfig {
    int generation_retries = constants::retry::GENERATION_RETRIES;
    int reporting_retries = constants::retry::REPORTING_RETRIES;
};

struct LogConfig {
    std::string level = "warn";
    std::string file;  ///< empty = console only
};

struct Config {
    LLMConfig llm;
    InterviewConfig interview;
    RetryConfig retry;
    LogConfig log;

    std::string logs_dir = "logs";

    /// Missing or unreadable files yield defaults (with a warning)
    static Config load_from_file(const std::string& path);
    void save_to_file(const std::string& path) const;

    /// OPENAI_API_KEY, OPENAI_BASE_URL, OPENAI_MODEL, OPENAI_MODEL_FAST, MAX_TURNS
    void apply_env_overrides();

    /// Clamp out-of-range values (logs a warning for each)
    void validate();
};

} // namespace interview_coach
