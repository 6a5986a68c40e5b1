#include "scripted_provider.h"
#include "logger.h"
#include <chrono>
#include <thread>
#include <utility>

using json = nlohmann::json;

namespace interview_coach {

void ScriptedProvider::push_response(AgentRole role, json data) {
    std::lock_guard<std::mutex> lock(mutex_);
    Scripted entry;
    entry.data = std::move(data);
    queues_[role].push_back(std::move(entry));
}

void ScriptedProvider::push_failure(AgentRole role, Error error) {
    std::lock_guard<std::mutex> lock(mutex_);
    Scripted entry;
    entry.error = std::move(error);
    queues_[role].push_back(std::move(entry));
}

void ScriptedProvider::set_default(AgentRole role, json data) {
    std::lock_guard<std::mutex> lock(mutex_);
    defaults_[role] = std::move(data);
}

void ScriptedProvider::set_delay_ms(AgentRole role, int delay_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    delays_ms_[role] = delay_ms;
}

Result<InferenceResponse> ScriptedProvider::invoke(const InferenceRequest& request) {
    Scripted next;
    bool from_default = false;
    int delay_ms = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_[request.role]++;
        last_requests_[request.role] = request;

        auto delay = delays_ms_.find(request.role);
        if (delay != delays_ms_.end()) delay_ms = delay->second;

        auto& queue = queues_[request.role];
        if (!queue.empty()) {
            next = std::move(queue.front());
            queue.pop_front();
        } else {
            auto fallback = defaults_.find(request.role);
            if (fallback == defaults_.end()) {
                return make_provider_error(std::string("no scripted response for role ") +
                                           to_string(request.role));
            }
            next.data = fallback->second;
            from_default = true;
        }
    }

    if (delay_ms > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
    }

    if (!next.data) {
        return next.error;
    }

    InferenceResponse response;
    response.data = std::move(*next.data);
    response.raw = response.data.dump();
    response.latency_ms = delay_ms;
    if (from_default) {
        LOG_LLM(std::string("scripted default used for ") + to_string(request.role));
    }
    return response;
}

int ScriptedProvider::call_count(AgentRole role) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = calls_.find(role);
    return it == calls_.end() ? 0 : it->second;
}

size_t ScriptedProvider::pending(AgentRole role) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = queues_.find(role);
    return it == queues_.end() ? 0 : it->second.size();
}

std::optional<InferenceRequest> ScriptedProvider::last_request(AgentRole role) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = last_requests_.find(role);
    if (it == last_requests_.end()) return std::nullopt;
    return it->second;
}

std::shared_ptr<ScriptedProvider> ScriptedProvider::with_offline_defaults() {
    auto provider = std::make_shared<ScriptedProvider>();

    provider->set_default(AgentRole::Router, {
        {"intent", "answer"},
        {"internal_thought", "offline mode: every message is treated as an answer"}
    });
    provider->set_default(AgentRole::Skeptic, {
        {"score", 6},
        {"accuracy", "partially_correct"},
        {"depth", "adequate"},
        {"issues", json::array()},
        {"internal_thought", "offline mode: answers are not actually graded"}
    });
    provider->set_default(AgentRole::Empath, {
        {"clarity", 6},
        {"honesty", 7},
        {"engagement", "medium"},
        {"stress_level", "low"},
        {"demeanor", "normal"},
        {"internal_thought", "offline mode: neutral behavioural read"}
    });
    provider->set_default(AgentRole::Planner, {
        {"topics", json::array({
            {{"topic", "Language fundamentals"}, {"difficulty", "easy"}, {"rationale", "baseline"}},
            {{"topic", "Data structures and complexity"}, {"difficulty", "medium"}, {"rationale", "core skill"}},
            {{"topic", "Concurrency basics"}, {"difficulty", "medium"}, {"rationale", "common in production"}},
            {{"topic", "Testing and debugging"}, {"difficulty", "medium"}, {"rationale", "daily work"}},
            {{"topic", "System design trade-offs"}, {"difficulty", "hard"}, {"rationale", "seniority signal"}},
            {{"topic", "Recent project deep dive"}, {"difficulty", "medium"}, {"rationale", "practical experience"}}
        })},
        {"internal_thought", "offline mode: generic plan"}
    });
    provider->set_default(AgentRole::Voice, {
        {"message", "Thank you. Let's continue: could you walk me through how you would approach this topic in practice?"},
        {"internal_thought", "offline mode: canned follow-up"}
    });
    provider->set_default(AgentRole::Reporter, {
        {"level", "middle"},
        {"recommendation", "hire"},
        {"confidence", 40},
        {"reasoning", "Offline run: the verdict reflects placeholder scores only."},
        {"soft_skills", {{"clarity", 6}, {"honesty", 7}, {"engagement", 6}, {"notes", "not assessed offline"}}},
        {"roadmap", json::array({"Repeat the interview with a live model for a real assessment"})},
        {"resources", json::array()},
        {"internal_thought", "offline mode"}
    });
    return provider;
}

} // namespace interview_coach
