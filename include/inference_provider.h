#pragma once

#include "core/types.h"
#include "errors.h"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace interview_coach {

/**
 * @brief One structured request to a language model on behalf of an agent role
 *
 * `context` carries the structured inputs (also rendered into `prompt`);
 * `schema` is a JSON Schema for the object the caller expects back.
 */
struct InferenceRequest {
    AgentRole role = AgentRole::Router;
    std::string system_prompt;
    std::string prompt;
    nlohmann::json context = nlohmann::json::object();
    nlohmann::json schema = nlohmann::json::object();
    std::string schema_name;
    int timeout_ms = 0;  ///< 0 = provider default
};

struct InferenceResponse {
    nlohmann::json data;  ///< parsed JSON object returned by the model
    std::string raw;      ///< raw model text, kept for logs
    int64_t latency_ms = 0;
};

/**
 * @brief The single capability every agent role goes through
 *
 * Implementations must be safe to call from several threads at once:
 * the two evaluators run concurrently.
 */
class InferenceProvider {
public:
    virtual ~InferenceProvider() = default;

    virtual Result<InferenceResponse> invoke(const InferenceRequest& request) = 0;

    virtual std::string name() const = 0;
};

} // namespace interview_coach
