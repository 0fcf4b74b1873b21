#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace trialbench::providers {

enum class ApiStyle {
    kAnthropic,
    kOpenAI
};

struct Message {
    std::string role;
    std::string content;
};

struct LLMResponse {
    std::string content;
    std::string finish_reason = "stop";

    bool IsError() const { return finish_reason == "error"; }
};

struct ProviderSettings {
    std::string api_key;
    // Includes the version segment, e.g. https://api.anthropic.com/v1.
    std::string api_base;
    std::string model;
    ApiStyle style = ApiStyle::kAnthropic;

    bool Usable() const { return !api_key.empty() && !api_base.empty(); }
};

class LLMProvider {
public:
    virtual ~LLMProvider() = default;
    virtual LLMResponse Chat(
        const std::vector<Message>& messages,
        const std::string& model,
        int max_tokens,
        double temperature) = 0;
};

// Picks judge credentials. Lookups consult `secrets` before the process
// environment. Order: the gateway (Anthropic style, needs ANTHROPIC_API_KEY),
// GEMINI_API_KEY, NVIDIA_API_KEY with OPENAI_BASE_URL, ANTHROPIC_API_KEY
// direct. A non-empty model_override wins, then JUDGE_MODEL.
ProviderSettings ResolveJudgeSettings(const std::map<std::string, std::string>& secrets,
                                      const std::string& gateway_url,
                                      const std::string& model_override);

std::unique_ptr<LLMProvider> CreateProvider(const ProviderSettings& settings);

}  // namespace trialbench::providers
