#pragma once

/**
 * @file reasoning_client.h
 * @brief Text-completion collaborator interface
 *
 * The dialogue engine sends one prompt per decision (intent, evaluation, follow-up
 * decision, question generation) and receives one text reply. Implementations report
 * transport failures, timeouts and empty replies as errors; callers pick the fallback.
 */

#include "errors.h"
#include <string>

namespace viva {
namespace llm {

/**
 * @brief Per-call generation options (0 / empty = use the client's configured default)
 */
struct GenerationOptions {
    float temperature = -1.0f;   ///< < 0 = client default
    int max_tokens = 0;
    int timeout_ms = 0;
    std::string system_prompt;
};

/**
 * @brief Abstract reasoning client
 *
 * Implementations must be safe to call from several session threads at once.
 */
class IReasoningClient {
public:
    virtual ~IReasoningClient() = default;

    /**
     * @brief Complete a prompt
     * @return Reply text (non-empty), or an error
     */
    virtual Result<std::string> complete(const std::string& prompt,
                                         const GenerationOptions& options = GenerationOptions()) = 0;
};

} // namespace llm
} // namespace viva
