#pragma once

#include "common.h"
#include "config.h"
#include "llm/reasoning_client.h"
#include <string>
#include <memory>

namespace viva {

/**
 * @brief Endpoint dialect, chosen from the endpoint path
 */
enum class LLMDialect {
    Ollama,      ///< POST /api/chat, reply in message.content
    OpenAI,      ///< POST /v1/chat/completions, reply in choices[0].message.content
    LlamaCpp     ///< POST /completion, reply in content
};

LLMDialect detect_dialect(const std::string& endpoint);

/**
 * @brief HTTP reasoning client over libcurl
 *
 * Each call performs one blocking request on the caller's thread, bounded by
 * CURLOPT_TIMEOUT_MS. Thread-safe: no state is shared between calls.
 */
class LLMClient : public llm::IReasoningClient {
public:
    explicit LLMClient(const LLMConfig& config);
    ~LLMClient() override;

    // Non-copyable
    LLMClient(const LLMClient&) = delete;
    LLMClient& operator=(const LLMClient&) = delete;

    Result<std::string> complete(const std::string& prompt,
                                 const llm::GenerationOptions& options = llm::GenerationOptions()) override;

    LLMDialect dialect() const;

    /**
     * @brief Build the JSON request body for a prompt (exposed for tests)
     */
    std::string build_request(const std::string& prompt, const llm::GenerationOptions& options) const;

    /**
     * @brief Extract the reply text from a response body
     * @return ParseError on malformed JSON or missing content
     */
    Result<std::string> parse_response(const std::string& body) const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace viva
