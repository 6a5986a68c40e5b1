#include "config.h"
#include "logger.h"
#include "path_utils.h"
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

// A key of the wrong type is skipped with a warning; the rest of the file still applies
void read_int(const json& section, const char* section_name, const char* key, int& target) {
    if (!section.contains(key)) return;
    const json& value = section[key];
    if (!value.is_number_integer()) {
        interview_coach::Logger::warn(std::string("Config ") + section_name + "." + key +
                                      " must be an integer; ignoring " + value.dump());
        return;
    }
    if (value.is_number_unsigned()
            ? value.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int>::max())
            : (value.get<int64_t>() < std::numeric_limits<int>::min() ||
               value.get<int64_t>() > std::numeric_limits<int>::max())) {
        interview_coach::Logger::warn(std::string("Config ") + section_name + "." + key +
                                      " out of range; ignoring " + value.dump());
        return;
    }
    target = static_cast<int>(value.get<int64_t>());
}

void read_string(const json& section, const char* section_name, const char* key, std::string& target) {
    if (!section.contains(key)) return;
    const json& value = section[key];
    if (!value.is_string()) {
        interview_coach::Logger::warn(std::string("Config ") + section_name + "." + key +
                                      " must be a string; ignoring " + value.dump());
        return;
    }
    target = value.get<std::string>();
}

const json* section_of(const json& j, const char* name) {
    if (!j.contains(name)) return nullptr;
    if (!j[name].is_object()) {
        interview_coach::Logger::warn(std::string("Config section ") + name + " must be an object; ignoring");
        return nullptr;
    }
    return &j[name];
}

void apply_json_to_config(interview_coach::Config& cfg, const json& j) {
    if (!j.is_object()) {
        interview_coach::Logger::warn("Config root must be an object; using defaults");
        return;
    }

    // LLM config
    if (const json* l = section_of(j, "llm")) {
        read_string(*l, "llm", "endpoint", cfg.llm.endpoint);
        read_string(*l, "llm", "api_key", cfg.llm.api_key);
        read_string(*l, "llm", "model_name", cfg.llm.model_name);
        read_string(*l, "llm", "fast_model_name", cfg.llm.fast_model_name);
        read_int(*l, "llm", "timeout_ms", cfg.llm.timeout_ms);
        read_int(*l, "llm", "max_tokens", cfg.llm.max_tokens);
        read_int(*l, "llm", "context_max_turns_to_send", cfg.llm.context_max_turns_to_send);
    }

    // Interview config
    if (const json* i = section_of(j, "interview")) {
        read_int(*i, "interview", "max_turns", cfg.interview.max_turns);
        read_int(*i, "interview", "max_topics", cfg.interview.max_topics);
        std::string name;
        read_string(*i, "interview", "score_policy", name);
        if (!name.empty()) {
            auto policy = interview_coach::parse_score_policy(name);
            if (policy) {
                cfg.interview.score_policy = *policy;
            } else {
                interview_coach::Logger::warn("Unknown score_policy \"" + name + "\"; keeping " +
                                              interview_coach::to_string(cfg.interview.score_policy));
            }
        }
    }

    // Retry config
    if (const json* r = section_of(j, "retry")) {
        read_int(*r, "retry", "generation_retries", cfg.retry.generation_retries);
        read_int(*r, "retry", "reporting_retries", cfg.retry.reporting_retries);
    }

    // Log config
    if (const json* g = section_of(j, "log")) {
        read_string(*g, "log", "level", cfg.log.level);
        read_string(*g, "log", "file", cfg.log.file);
    }

    if (j.contains("logs_dir")) {
        if (j["logs_dir"].is_string()) {
            cfg.logs_dir = j["logs_dir"].get<std::string>();
        } else {
            interview_coach::Logger::warn("Config logs_dir must be a string; ignoring " + j["logs_dir"].dump());
        }
    }
}

} // namespace

namespace interview_coach {

Config Config::load_from_file(const std::string& path) {
    Config cfg;

    std::ifstream file(expand_path(path));
    if (!file.is_open()) {
        Logger::warn("Could not open config file: " + path + ". Using defaults.");
        return cfg;
    }
    json j;
    try {
        file >> j;
        apply_json_to_config(cfg, j);
    } catch (const json::exception& e) {
        Logger::error("Error parsing config JSON: " + std::string(e.what()));
        return Config();
    }

    if (!cfg.logs_dir.empty()) cfg.logs_dir = expand_path(cfg.logs_dir);
    if (!cfg.log.file.empty()) cfg.log.file = expand_path(cfg.log.file);

    cfg.validate();
    return cfg;
}

void Config::apply_env_overrides() {
    if (const char* key = std::getenv("OPENAI_API_KEY")) {
        llm.api_key = key;
    }
    if (const char* base = std::getenv("OPENAI_BASE_URL")) {
        std::string url = base;
        while (!url.empty() && url.back() == '/') url.pop_back();
        // A bare base URL (".../v1") gets the chat completions path appended
        if (!url.empty() && url.find("/chat/completions") == std::string::npos &&
            url.find("/api/chat") == std::string::npos) {
            url += "/chat/completions";
        }
        if (!url.empty()) llm.endpoint = url;
    }
    if (const char* model = std::getenv("OPENAI_MODEL")) {
        if (*model) llm.model_name = model;
    }
    if (const char* model = std::getenv("OPENAI_MODEL_FAST")) {
        if (*model) llm.fast_model_name = model;
    }
    if (const char* turns = std::getenv("MAX_TURNS")) {
        char* end = nullptr;
        errno = 0;
        long value = std::strtol(turns, &end, 10);
        if (end != turns && *end == '\0' && errno != ERANGE &&
            value >= std::numeric_limits<int>::min() && value <= std::numeric_limits<int>::max()) {
            interview.max_turns = static_cast<int>(value);
        } else if (end != turns && *end == '\0') {
            Logger::warn(std::string("Ignoring out-of-range MAX_TURNS: ") + turns);
        } else {
            Logger::warn(std::string("Ignoring non-numeric MAX_TURNS: ") + turns);
        }
    }
    validate();
}

void Config::validate() {
    if (interview.max_turns < constants::interview::MIN_MAX_TURNS) {
        Logger::warn("max_turns " + std::to_string(interview.max_turns) + " too small; using " +
                     std::to_string(constants::interview::MIN_MAX_TURNS));
        interview.max_turns = constants::interview::MIN_MAX_TURNS;
    }
    if (interview.max_topics < 1) {
        Logger::warn("max_topics must be positive; using 1");
        interview.max_topics = 1;
    }
    if (retry.generation_retries < 0) {
        Logger::warn("generation_retries must not be negative; using 0");
        retry.generation_retries = 0;
    }
    if (retry.reporting_retries < 0) {
        Logger::warn("reporting_retries must not be negative; using 0");
        retry.reporting_retries = 0;
    }
    if (llm.context_max_turns_to_send < 0) {
        llm.context_max_turns_to_send = 0;
    }
    if (llm.timeout_ms < 0) {
        llm.timeout_ms = 0;
    }
}

void Config::save_to_file(const std::string& path) const {
    json j;

    j["llm"]["endpoint"] = llm.endpoint;
    j["llm"]["model_name"] = llm.model_name;
    j["llm"]["fast_model_name"] = llm.fast_model_name;
    j["llm"]["timeout_ms"] = llm.timeout_ms;
    j["llm"]["max_tokens"] = llm.max_tokens;
    j["llm"]["context_max_turns_to_send"] = llm.context_max_turns_to_send;
    // api_key is never written back; it comes from the environment

    j["interview"]["max_turns"] = interview.max_turns;
    j["interview"]["max_topics"] = interview.max_topics;
    j["interview"]["score_policy"] = to_string(interview.score_policy);

    j["retry"]["generation_retries"] = retry.generation_retries;
    j["retry"]["reporting_retries"] = retry.reporting_retries;

    j["log"]["level"] = log.level;
    j["log"]["file"] = log.file;

    j["logs_dir"] = logs_dir;

    std::ofstream file(expand_path(path));
    if (!file.is_open()) {
        Logger::error("Could not write config file: " + path);
        return;
    }
    file << j.dump(2) << std::endl;
}

} // namespace interview_coach
