#pragma once

/**
 * Shared fixtures for the standalone test executables: canned provider
 * replies in the shape each agent role expects, and small builders.
 */

#include "config.h"
#include "scripted_provider.h"
#include "session_state.h"
#include "skill_tree.h"
#include "technical_evaluator.h"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <string>
#include <unistd.h>
#include <vector>

namespace test_support {

using json = nlohmann::json;
using namespace interview_coach;

inline CandidateMetadata candidate() {
    CandidateMetadata c;
    c.name = "Alex";
    c.role = "Backend Developer";
    c.target_grade = "Middle";
    c.experience = "3 years of Python and Go services, PostgreSQL, Kafka";
    return c;
}

inline std::vector<Topic> topics(size_t count) {
    std::vector<Topic> result;
    for (size_t i = 0; i < count; ++i) {
        result.emplace_back(static_cast<int>(i + 1), "Topic " + std::to_string(i + 1));
    }
    return result;
}

inline json router_reply(const std::string& intent) {
    return {{"intent", intent}, {"internal_thought", "routed as " + intent}};
}

inline json skeptic_reply(int score, const std::string& accuracy = "accurate",
                          const std::string& depth = "adequate") {
    return {
        {"score", score},
        {"accuracy", accuracy},
        {"depth", depth},
        {"issues", json::array()},
        {"internal_thought", "scored " + std::to_string(score)}
    };
}

inline json empath_reply(int clarity = 7, int honesty = 8) {
    return {
        {"clarity", clarity},
        {"honesty", honesty},
        {"engagement", "high"},
        {"stress_level", "low"},
        {"demeanor", "normal"},
        {"internal_thought", "calm and clear"}
    };
}

inline json voice_reply(const std::string& message) {
    return {{"message", message}, {"internal_thought", "next question"}};
}

inline json planner_reply(size_t count) {
    json list = json::array();
    for (size_t i = 0; i < count; ++i) {
        list.push_back({{"topic", "Topic " + std::to_string(i + 1)}, {"difficulty", "medium"}});
    }
    return {{"topics", list}, {"internal_thought", "plan"}};
}

inline json reporter_reply() {
    return {
        {"level", "middle"},
        {"recommendation", "hire"},
        {"confidence", 80},
        {"reasoning", "Solid fundamentals."},
        {"soft_skills", {{"clarity", 7}, {"honesty", 8}, {"engagement", 7}, {"notes", "communicates well"}}},
        {"roadmap", json::array({"Practice system design"})},
        {"resources", json::array({"Designing Data-Intensive Applications"})},
        {"internal_thought", "overall positive"}
    };
}

/// Provider whose per-role defaults keep any session going: every message is an answer scored `score`
inline std::shared_ptr<ScriptedProvider> provider_with_defaults(size_t topic_count, int score = 6,
                                                                const std::string& depth = "adequate") {
    auto provider = std::make_shared<ScriptedProvider>();
    provider->set_default(AgentRole::Planner, planner_reply(topic_count));
    provider->set_default(AgentRole::Router, router_reply("answer"));
    provider->set_default(AgentRole::Skeptic, skeptic_reply(score, "accurate", depth));
    provider->set_default(AgentRole::Empath, empath_reply());
    provider->set_default(AgentRole::Voice, voice_reply("Next question, please."));
    provider->set_default(AgentRole::Reporter, reporter_reply());
    return provider;
}

inline TechnicalEvaluation technical(int score, Depth depth = Depth::Adequate) {
    TechnicalEvaluation evaluation;
    evaluation.score = score;
    evaluation.accuracy = score >= 5 ? Accuracy::Accurate : Accuracy::Incorrect;
    evaluation.depth = depth;
    evaluation.thought = "scored " + std::to_string(score);
    return evaluation;
}

/// Config with short timeouts and no file sink
inline Config test_config(int max_turns) {
    Config config;
    config.interview.max_turns = max_turns;
    config.llm.timeout_ms = 2000;
    config.logs_dir = "";
    return config;
}

/// Fresh, empty directory under the system temp dir
inline std::string temp_dir(const std::string& name) {
    auto path = std::filesystem::temp_directory_path() /
                (name + "_" + std::to_string(static_cast<long>(getpid())));
    std::filesystem::remove_all(path);
    std::filesystem::create_directories(path);
    return path.string();
}

} // namespace test_support
