#include "providers/llm_provider.hpp"

#include "providers/http_chat_provider.hpp"
#include "utils/common.hpp"

namespace trialbench::providers {
namespace {

std::string Lookup(const std::map<std::string, std::string>& secrets, const char* name) {
    const auto it = secrets.find(name);
    if (it != secrets.end() && !it->second.empty()) {
        return it->second;
    }
    return utils::GetEnv(name);
}

std::string TrimSlashes(std::string value) {
    while (!value.empty() && value.back() == '/') {
        value.pop_back();
    }
    return value;
}

}  // namespace

ProviderSettings ResolveJudgeSettings(const std::map<std::string, std::string>& secrets,
                                      const std::string& gateway_url,
                                      const std::string& model_override) {
    ProviderSettings settings{};
    const auto anthropic_key = Lookup(secrets, "ANTHROPIC_API_KEY");

    if (!gateway_url.empty() && !anthropic_key.empty()) {
        settings.api_key = anthropic_key;
        settings.api_base = TrimSlashes(gateway_url) + "/v1";
        settings.model = "claude-sonnet-4-5";
        settings.style = ApiStyle::kAnthropic;
    } else if (const auto gemini_key = Lookup(secrets, "GEMINI_API_KEY"); !gemini_key.empty()) {
        settings.api_key = gemini_key;
        settings.api_base = "https://generativelanguage.googleapis.com/v1beta/openai";
        settings.model = "gemini-2.0-flash";
        settings.style = ApiStyle::kOpenAI;
    } else if (const auto nvidia_key = Lookup(secrets, "NVIDIA_API_KEY"); !nvidia_key.empty()) {
        settings.api_key = nvidia_key;
        const auto base = Lookup(secrets, "OPENAI_BASE_URL");
        settings.api_base = base.empty() ? "https://integrate.api.nvidia.com/v1" : TrimSlashes(base);
        settings.model = "meta/llama-3.3-70b-instruct";
        settings.style = ApiStyle::kOpenAI;
    } else if (!anthropic_key.empty()) {
        settings.api_key = anthropic_key;
        settings.api_base = "https://api.anthropic.com/v1";
        settings.model = "claude-sonnet-4-5";
        settings.style = ApiStyle::kAnthropic;
    }

    if (!model_override.empty()) {
        settings.model = model_override;
    } else if (const auto judge_model = Lookup(secrets, "JUDGE_MODEL"); !judge_model.empty()) {
        settings.model = judge_model;
    }
    return settings;
}

std::unique_ptr<LLMProvider> CreateProvider(const ProviderSettings& settings) {
    return std::make_unique<HttpChatProvider>(settings);
}

}  // namespace trialbench::providers
