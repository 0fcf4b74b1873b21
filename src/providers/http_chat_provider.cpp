#include "providers/http_chat_provider.hpp"

#include <memory>
#include <string>

#include "httplib.h"
#include "nlohmann/json.hpp"
#include "utils/logging.hpp"
#include "utils/url.hpp"

namespace trialbench::providers {
namespace {

using utils::LogLevel;
using utils::LogLine;

std::string MaskKey(const std::string& key) {
    if (key.size() <= 8) {
        return "****";
    }
    return key.substr(0, 4) + "****" + key.substr(key.size() - 4);
}

LLMResponse ErrorResponse(const std::string& message) {
    return LLMResponse{.content = "Error calling LLM: " + message, .finish_reason = "error"};
}

nlohmann::json BuildAnthropicPayload(const std::vector<Message>& messages,
                                     const std::string& model,
                                     int max_tokens,
                                     double temperature) {
    nlohmann::json payload;
    payload["model"] = model;
    payload["max_tokens"] = max_tokens;
    payload["temperature"] = temperature;
    payload["messages"] = nlohmann::json::array();

    std::string system_prompt;
    for (const auto& msg : messages) {
        if (msg.role == "system") {
            if (!system_prompt.empty()) {
                system_prompt.append("\n");
            }
            system_prompt.append(msg.content);
            continue;
        }
        payload["messages"].push_back({
            {"role", msg.role},
            {"content", nlohmann::json::array({{{"type", "text"}, {"text", msg.content}}})}
        });
    }
    if (!system_prompt.empty()) {
        payload["system"] = system_prompt;
    }
    return payload;
}

nlohmann::json BuildOpenAIPayload(const std::vector<Message>& messages,
                                  const std::string& model,
                                  int max_tokens,
                                  double temperature) {
    nlohmann::json payload;
    payload["model"] = model;
    payload["max_tokens"] = max_tokens;
    payload["temperature"] = temperature;
    payload["messages"] = nlohmann::json::array();
    for (const auto& msg : messages) {
        payload["messages"].push_back({{"role", msg.role}, {"content", msg.content}});
    }
    return payload;
}

LLMResponse ParseAnthropicResponse(const nlohmann::json& json) {
    LLMResponse parsed{};
    if (json.contains("content") && json["content"].is_array()) {
        for (const auto& block : json["content"]) {
            if (block.value("type", "") == "text") {
                parsed.content += block.value("text", "");
            }
        }
    }
    if (json.contains("stop_reason") && json["stop_reason"].is_string()) {
        parsed.finish_reason = json["stop_reason"].get<std::string>();
    }
    return parsed;
}

LLMResponse ParseOpenAIResponse(const nlohmann::json& json) {
    if (!json.contains("choices") || !json["choices"].is_array() || json["choices"].empty()) {
        return ErrorResponse("no choices in response");
    }
    LLMResponse parsed{};
    const auto& choice = json["choices"][0];
    if (choice.contains("message") && choice["message"].contains("content") &&
        choice["message"]["content"].is_string()) {
        parsed.content = choice["message"]["content"].get<std::string>();
    }
    if (choice.contains("finish_reason") && choice["finish_reason"].is_string()) {
        parsed.finish_reason = choice["finish_reason"].get<std::string>();
    }
    return parsed;
}

}  // namespace

HttpChatProvider::HttpChatProvider(ProviderSettings settings)
    : settings_(std::move(settings)) {}

LLMResponse HttpChatProvider::Chat(
    const std::vector<Message>& messages,
    const std::string& model,
    int max_tokens,
    double temperature) {
    if (!settings_.Usable()) {
        return ErrorResponse("no judge credentials configured");
    }
    try {
        const auto chosen_model = model.empty() ? settings_.model : model;
        const bool use_anthropic = settings_.style == ApiStyle::kAnthropic;
        const auto payload = use_anthropic
            ? BuildAnthropicPayload(messages, chosen_model, max_tokens, temperature)
            : BuildOpenAIPayload(messages, chosen_model, max_tokens, temperature);

        const auto parsed = utils::ParseUrl(settings_.api_base);
        const std::string endpoint = parsed.base_path + (use_anthropic ? "/messages" : "/chat/completions");
        const auto scheme_host_port = parsed.SchemeHostPort();
        auto client = std::make_unique<httplib::Client>(scheme_host_port);
        client->set_connection_timeout(60);
        client->set_read_timeout(180);

        LogLine(LogLevel::kDebug, "llm") << "POST " << scheme_host_port << endpoint
                                         << " model=" << chosen_model
                                         << " api_key=" << MaskKey(settings_.api_key)
                                         << " style=" << (use_anthropic ? "anthropic" : "openai");

        httplib::Headers headers;
        if (use_anthropic) {
            headers.emplace("x-api-key", settings_.api_key);
            headers.emplace("anthropic-version", "2023-06-01");
        } else {
            headers.emplace("Authorization", "Bearer " + settings_.api_key);
        }

        auto response = client->Post(endpoint, headers, payload.dump(), "application/json");
        if (!response) {
            const auto err = response.error();
            return ErrorResponse("request failed (httplib error=" + std::to_string(static_cast<int>(err)) +
                                 ", " + httplib::to_string(err) + ")");
        }
        if (response->status >= 400) {
            LogLine(LogLevel::kWarn, "llm") << "HTTP " << response->status << " body=" << response->body;
            return ErrorResponse("HTTP " + std::to_string(response->status));
        }

        const auto json = nlohmann::json::parse(response->body, nullptr, false);
        if (json.is_discarded() || !json.is_object()) {
            return ErrorResponse("invalid response");
        }
        return use_anthropic ? ParseAnthropicResponse(json) : ParseOpenAIResponse(json);
    } catch (const std::exception& ex) {
        return ErrorResponse(ex.what());
    }
}

}  // namespace trialbench::providers
