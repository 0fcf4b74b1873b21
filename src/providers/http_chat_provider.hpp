#pragma once

#include <string>
#include <vector>

#include "providers/llm_provider.hpp"

namespace trialbench::providers {

// Plain chat completion over HTTP, speaking either the Anthropic Messages API
// or the OpenAI chat-completions API. Transport and HTTP errors come back as a
// response with finish_reason "error".
class HttpChatProvider : public LLMProvider {
public:
    explicit HttpChatProvider(ProviderSettings settings);

    LLMResponse Chat(
        const std::vector<Message>& messages,
        const std::string& model,
        int max_tokens,
        double temperature) override;

private:
    ProviderSettings settings_;
};

}  // namespace trialbench::providers
