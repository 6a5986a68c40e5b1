#pragma once

#include "inference_provider.h"
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace interview_coach {

/**
 * @brief Deterministic provider that replays queued responses per role
 *
 * Each role has a FIFO of scripted outcomes (a JSON object or an Error).
 * When a role's queue is empty its default response is used; with no
 * default the call fails with ProviderError. Thread-safe.
 */
class ScriptedProvider final : public InferenceProvider {
public:
    ScriptedProvider() = default;

    void push_response(AgentRole role, nlohmann::json data);
    void push_failure(AgentRole role, Error error);
    void set_default(AgentRole role, nlohmann::json data);

    /// Sleep before answering (for timeout tests)
    void set_delay_ms(AgentRole role, int delay_ms);

    Result<InferenceResponse> invoke(const InferenceRequest& request) override;

    std::string name() const override { return "scripted"; }

    int call_count(AgentRole role) const;
    size_t pending(AgentRole role) const;

    /// Most recent request seen for a role
    std::optional<InferenceRequest> last_request(AgentRole role) const;

    /**
     * @brief Provider with generic defaults for every role, for --offline runs
     *
     * Answers are scored as adequate, plans use generic topics for the role.
     */
    static std::shared_ptr<ScriptedProvider> with_offline_defaults();

private:
    struct Scripted {
        std::optional<nlohmann::json> data;
        Error error;
    };

    mutable std::mutex mutex_;
    std::map<AgentRole, std::deque<Scripted>> queues_;
    std::map<AgentRole, nlohmann::json> defaults_;
    std::map<AgentRole, int> delays_ms_;
    std::map<AgentRole, int> calls_;
    std::map<AgentRole, InferenceRequest> last_requests_;
};

} // namespace interview_coach
