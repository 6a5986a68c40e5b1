#include "llm_client.h"
#include "common.h"
#include "logger.h"
#include <curl/curl.h>
#include <sstream>

using json = nlohmann::json;

namespace interview_coach {

class LLMClient::Impl {
public:
    explicit Impl(const LLMConfig& config) : config_(config) {
        curl_global_init(CURL_GLOBAL_DEFAULT);
        is_ollama_ = config.endpoint.find("/api/chat") != std::string::npos;
    }

    ~Impl() {
        curl_global_cleanup();
    }

    Result<InferenceResponse> invoke(const InferenceRequest& request) {
        int timeout_ms = request.timeout_ms > 0 ? request.timeout_ms : config_.timeout_ms;
        std::string model = model_for(request.role);

        json body = LLMClient::build_request_body(request, model, config_.max_tokens, is_ollama_);
        std::string request_json = body.dump();

        LOG_LLM(std::string("POST ") + config_.endpoint + " role=" + to_string(request.role) +
                " model=" + model);

        TimePoint start = Clock::now();
        std::string response_buffer;
        long http_status = 0;

        CURL* curl = curl_easy_init();
        if (!curl) {
            return make_network_error("Failed to initialize CURL");
        }

        struct curl_slist* headers = nullptr;
        headers = curl_slist_append(headers, "Content-Type: application/json");
        if (!config_.api_key.empty()) {
            std::string auth = "Authorization: Bearer " + config_.api_key;
            headers = curl_slist_append(headers, auth.c_str());
        }

        curl_easy_setopt(curl, CURLOPT_URL, config_.endpoint.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request_json.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_buffer);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(constants::llm::CONNECT_TIMEOUT_MS));
        if (timeout_ms > 0) {
            curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
        }

        CURLcode res = curl_easy_perform(curl);
        if (res == CURLE_OK) {
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_status);
        }

        curl_slist_free_all(headers);
        curl_easy_cleanup(curl);

        if (res == CURLE_OPERATION_TIMEDOUT) {
            return make_timeout_error("LLM request timed out after " + std::to_string(timeout_ms) + "ms");
        }
        if (res != CURLE_OK) {
            return make_network_error(curl_easy_strerror(res));
        }
        if (http_status >= 400) {
            return make_provider_error("HTTP " + std::to_string(http_status) + ": " +
                                       response_buffer.substr(0, constants::llm::ERROR_BODY_PREVIEW));
        }

        std::string content;
        try {
            json response_json = json::parse(response_buffer);
            if (is_ollama_) {
                if (response_json.contains("message") && response_json["message"].contains("content") &&
                    response_json["message"]["content"].is_string()) {
                    content = response_json["message"]["content"].get<std::string>();
                } else {
                    return make_parse_error("No message.content in Ollama response");
                }
            } else {
                if (response_json.contains("choices") && response_json["choices"].is_array() &&
                    !response_json["choices"].empty() &&
                    response_json["choices"][0].contains("message") &&
                    response_json["choices"][0]["message"].contains("content") &&
                    response_json["choices"][0]["message"]["content"].is_string()) {
                    content = response_json["choices"][0]["message"]["content"].get<std::string>();
                } else {
                    return make_parse_error("No choices[0].message.content in response");
                }
            }
        } catch (const json::exception& e) {
            LOG_LLM(std::string("Response buffer: ") + response_buffer);
            return make_parse_error("JSON parse error: " + std::string(e.what()));
        }

        auto data = LLMClient::extract_json_object(content);
        if (!data) {
            return make_schema_error("Model reply is not a JSON object: " +
                                     content.substr(0, constants::llm::ERROR_BODY_PREVIEW));
        }

        InferenceResponse response;
        response.data = std::move(*data);
        response.raw = std::move(content);
        response.latency_ms = ms_since(start);

        std::ostringstream oss;
        oss << to_string(request.role) << " replied in " << response.latency_ms << "ms";
        LOG_LLM(oss.str());
        return response;
    }

    std::string model_for(AgentRole role) const {
        switch (role) {
            case AgentRole::Planner:
            case AgentRole::Reporter:
                return config_.model_name;
            case AgentRole::Router:
            case AgentRole::Skeptic:
            case AgentRole::Empath:
            case AgentRole::Voice:
                return config_.fast_model_name.empty() ? config_.model_name : config_.fast_model_name;
        }
        return config_.model_name;
    }

    bool is_ollama() const { return is_ollama_; }

private:
    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
        std::string* buffer = static_cast<std::string*>(userp);
        size_t total_size = size * nmemb;
        buffer->append(static_cast<char*>(contents), total_size);
        return total_size;
    }

    LLMConfig config_;
    bool is_ollama_;
};

LLMClient::LLMClient(const LLMConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

LLMClient::~LLMClient() = default;

Result<InferenceResponse> LLMClient::invoke(const InferenceRequest& request) {
    return pimpl_->invoke(request);
}

std::string LLMClient::name() const {
    return pimpl_->is_ollama() ? "ollama" : "openai-compatible";
}

std::string LLMClient::model_for(AgentRole role) const {
    return pimpl_->model_for(role);
}

float LLMClient::temperature_for(AgentRole role) {
    switch (role) {
        case AgentRole::Router:   return constants::llm::ROUTER_TEMPERATURE;
        case AgentRole::Skeptic:  return constants::llm::SKEPTIC_TEMPERATURE;
        case AgentRole::Empath:   return constants::llm::EMPATH_TEMPERATURE;
        case AgentRole::Planner:  return constants::llm::PLANNER_TEMPERATURE;
        case AgentRole::Voice:    return constants::llm::VOICE_TEMPERATURE;
        case AgentRole::Reporter: return constants::llm::REPORTER_TEMPERATURE;
    }
    return constants::llm::VOICE_TEMPERATURE;
}

json LLMClient::build_request_body(const InferenceRequest& request,
                                   const std::string& model,
                                   int max_tokens,
                                   bool ollama) {
    json messages = json::array();
    if (!request.system_prompt.empty()) {
        messages.push_back({{"role", "system"}, {"content", request.system_prompt}});
    }
    messages.push_back({{"role", "user"}, {"content", request.prompt}});

    json body;
    body["model"] = model;
    body["messages"] = messages;
    body["stream"] = false;

    float temperature = temperature_for(request.role);
    bool has_schema = request.schema.is_object() && !request.schema.empty();

    if (ollama) {
        body["options"]["temperature"] = temperature;
        if (max_tokens > 0) body["options"]["num_predict"] = max_tokens;
        body["format"] = has_schema ? request.schema : json("json");
    } else {
        body["temperature"] = temperature;
        if (max_tokens > 0) body["max_tokens"] = max_tokens;
        if (has_schema) {
            body["response_format"] = {
                {"type", "json_schema"},
                {"json_schema", {
                    {"name", request.schema_name.empty() ? std::string(to_string(request.role)) : request.schema_name},
                    {"schema", request.schema}
                }}
            };
        } else {
            body["response_format"] = {{"type", "json_object"}};
        }
    }
    return body;
}

std::optional<json> LLMClient::extract_json_object(const std::string& text) {
    size_t begin = text.find('{');
    size_t end = text.rfind('}');
    if (begin == std::string::npos || end == std::string::npos || end < begin) {
        return std::nullopt;
    }
    try {
        json parsed = json::parse(text.substr(begin, end - begin + 1));
        if (!parsed.is_object()) return std::nullopt;
        return parsed;
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

} // namespace interview_coach
