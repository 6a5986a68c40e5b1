#pragma once

#include "config.h"
#include "inference_provider.h"
#include <memory>
#include <optional>
#include <string>

namespace interview_coach {

/**
 * @brief HTTP inference provider over libcurl
 *
 * Speaks the OpenAI-compatible chat completions protocol, or Ollama's
 * /api/chat when the endpoint path says so. The request schema is passed as
 * a structured-output constraint and the reply content is parsed as JSON.
 * Thread-safe: every call uses its own curl handle.
 */
class LLMClient final : public InferenceProvider {
public:
    explicit LLMClient(const LLMConfig& config);
    ~LLMClient() override;

    // Non-copyable
    LLMClient(const LLMClient&) = delete;
    LLMClient& operator=(const LLMClient&) = delete;

    Result<InferenceResponse> invoke(const InferenceRequest& request) override;

    std::string name() const override;

    /// Model configured for a role (fast model for per-turn roles)
    std::string model_for(AgentRole role) const;

    static float temperature_for(AgentRole role);

    /**
     * @brief Build the HTTP body for one request
     * @param ollama true for /api/chat bodies, false for OpenAI chat completions
     */
    static nlohmann::json build_request_body(const InferenceRequest& request,
                                             const std::string& model,
                                             int max_tokens,
                                             bool ollama);

    /**
     * @brief Pull the first JSON object out of model text (tolerates ``` fences and chatter)
     */
    static std::optional<nlohmann::json> extract_json_object(const std::string& text);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace interview_coach
