#include "llm_client.h"
#include "logger.h"
#include "utils.h"
#include <curl/curl.h>
#include <sstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace viva {

LLMDialect detect_dialect(const std::string& endpoint) {
    if (endpoint.find("/api/chat") != std::string::npos) return LLMDialect::Ollama;
    if (endpoint.find("/chat/completions") != std::string::npos) return LLMDialect::OpenAI;
    return LLMDialect::LlamaCpp;
}

class LLMClient::Impl {
public:
    explicit Impl(const LLMConfig& config) : config_(config) {
        curl_global_init(CURL_GLOBAL_DEFAULT);
        dialect_ = detect_dialect(config.endpoint);
    }

    ~Impl() {
        curl_global_cleanup();
    }

    Result<std::string> complete(const std::string& prompt, const llm::GenerationOptions& options) {
        int timeout_ms = options.timeout_ms > 0 ? options.timeout_ms : config_.timeout_ms;
        std::string request_json = build_request(prompt, options);

        CURL* curl = curl_easy_init();
        if (!curl) {
            return make_resource_error("Failed to initialize CURL");
        }

        struct curl_slist* headers = nullptr;
        headers = curl_slist_append(headers, "Content-Type: application/json");
        if (dialect_ == LLMDialect::OpenAI && !config_.api_key.empty()) {
            headers = curl_slist_append(headers, ("Authorization: Bearer " + config_.api_key).c_str());
        }

        std::string response_buffer;
        curl_easy_setopt(curl, CURLOPT_URL, config_.endpoint.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request_json.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_buffer);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(config_.connect_timeout_ms));
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        LOG_DEBUG("LLM request: " + utils::preview(request_json, 300));
        auto start = Clock::now();
        CURLcode res = curl_easy_perform(curl);
        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);

        curl_slist_free_all(headers);
        curl_easy_cleanup(curl);

        if (res == CURLE_OPERATION_TIMEDOUT) {
            LOG_LLM("Request timed out after " + std::to_string(ms_since(start)) + "ms");
            return make_timeout_error("Reasoning request timed out");
        }
        if (res != CURLE_OK) {
            LOG_LLM(std::string("Error: ") + curl_easy_strerror(res));
            return make_network_error(curl_easy_strerror(res));
        }
        if (status >= 400) {
            std::ostringstream oss;
            oss << "HTTP " << status << ": " << utils::preview(response_buffer, 200);
            LOG_LLM(oss.str());
            return make_network_error(oss.str());
        }

        auto parsed = parse_response(response_buffer);
        if (!parsed) {
            LOG_LLM("Error: " + parsed.error().message);
            return parsed;
        }

        std::ostringstream done;
        done << "Reply in " << ms_since(start) << "ms: \"" << utils::preview(parsed.value(), 80) << "\"";
        LOG_LLM(done.str());
        return parsed;
    }

    std::string build_request(const std::string& prompt, const llm::GenerationOptions& options) const {
        float temperature = options.temperature >= 0.0f ? options.temperature : config_.temperature;
        int max_tokens = options.max_tokens > 0 ? options.max_tokens : config_.max_tokens;
        const std::string& system_prompt = options.system_prompt.empty() ? config_.system_prompt
                                                                         : options.system_prompt;

        json request;
        if (dialect_ == LLMDialect::LlamaCpp) {
            std::ostringstream oss;
            if (!system_prompt.empty()) {
                oss << system_prompt << "\n\n";
            }
            oss << "User: " << prompt << "\nAssistant:";
            request["prompt"] = oss.str();
            request["n_predict"] = max_tokens;
            request["temperature"] = temperature;
            request["stream"] = false;
            return request.dump();
        }

        json messages = json::array();
        if (!system_prompt.empty()) {
            messages.push_back({{"role", "system"}, {"content", system_prompt}});
        }
        messages.push_back({{"role", "user"}, {"content", prompt}});

        request["model"] = config_.model_name;
        request["messages"] = messages;
        request["stream"] = false;
        if (dialect_ == LLMDialect::Ollama) {
            request["options"] = {{"temperature", temperature}, {"num_predict", max_tokens}};
        } else {
            request["temperature"] = temperature;
            request["max_tokens"] = max_tokens;
        }
        return request.dump();
    }

    Result<std::string> parse_response(const std::string& body) const {
        std::string content;
        try {
            json response_json = json::parse(body);
            switch (dialect_) {
                case LLMDialect::Ollama:
                    if (response_json.contains("message") && response_json["message"].contains("content") &&
                        response_json["message"]["content"].is_string()) {
                        content = response_json["message"]["content"].get<std::string>();
                    } else {
                        return make_parse_error("No message in Ollama response");
                    }
                    break;
                case LLMDialect::OpenAI:
                    if (response_json.contains("choices") && response_json["choices"].is_array() &&
                        !response_json["choices"].empty() &&
                        response_json["choices"][0].contains("message") &&
                        response_json["choices"][0]["message"].contains("content") &&
                        response_json["choices"][0]["message"]["content"].is_string()) {
                        content = response_json["choices"][0]["message"]["content"].get<std::string>();
                    } else {
                        return make_parse_error("No choices in completion response");
                    }
                    break;
                case LLMDialect::LlamaCpp:
                    if (response_json.contains("content") && response_json["content"].is_string()) {
                        content = response_json["content"].get<std::string>();
                    } else {
                        return make_parse_error("No content in response");
                    }
                    break;
            }
        } catch (const json::exception& e) {
            return make_parse_error("JSON parse error: " + std::string(e.what()));
        }

        utils::trim(content);
        if (content.empty()) {
            return make_parse_error("Empty reply");
        }
        return content;
    }

    LLMDialect dialect() const { return dialect_; }

private:
    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
        size_t total_size = size * nmemb;
        std::string* buffer = static_cast<std::string*>(userp);
        buffer->append(static_cast<char*>(contents), total_size);
        return total_size;
    }

    LLMConfig config_;
    LLMDialect dialect_;
};

LLMClient::LLMClient(const LLMConfig& config) : pimpl_(std::make_unique<Impl>(config)) {}
LLMClient::~LLMClient() = default;

Result<std::string> LLMClient::complete(const std::string& prompt, const llm::GenerationOptions& options) {
    return pimpl_->complete(prompt, options);
}

LLMDialect LLMClient::dialect() const {
    return pimpl_->dialect();
}

std::string LLMClient::build_request(const std::string& prompt, const llm::GenerationOptions& options) const {
    return pimpl_->build_request(prompt, options);
}

Result<std::string> LLMClient::parse_response(const std::string& body) const {
    return pimpl_->parse_response(body);
}

} // namespace viva
