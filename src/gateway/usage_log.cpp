#include "gateway/usage_log.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include "nlohmann/json.hpp"

#include "utils/common.hpp"

namespace trialbench::gateway {
namespace {

long long CountField(const nlohmann::json& object, const char* key) {
    if (!object.is_object() || !object.contains(key)) {
        return 0;
    }
    const auto& value = object[key];
    if (value.is_number_integer()) {
        return value.get<long long>();
    }
    if (value.is_number()) {
        return static_cast<long long>(value.get<double>());
    }
    return 0;
}

bool HasAny(const nlohmann::json& object, std::initializer_list<const char*> keys) {
    if (!object.is_object()) {
        return false;
    }
    for (const auto* key : keys) {
        if (object.contains(key)) {
            return true;
        }
    }
    return false;
}

void ApplyUsageBlock(UsageRecord& record, const nlohmann::json& usage) {
    if (HasAny(usage, {"input_tokens", "output_tokens"})) {
        if (usage.contains("input_tokens")) {
            record.input_tokens = CountField(usage, "input_tokens");
        }
        if (usage.contains("output_tokens")) {
            record.output_tokens = CountField(usage, "output_tokens");
        }
        if (usage.contains("cache_creation_input_tokens")) {
            record.cache_creation_tokens = CountField(usage, "cache_creation_input_tokens");
        }
        if (usage.contains("cache_read_input_tokens")) {
            record.cache_read_tokens = CountField(usage, "cache_read_input_tokens");
        }
        return;
    }
    record.input_tokens = CountField(usage, "prompt_tokens");
    record.output_tokens = CountField(usage, "completion_tokens");
    if (usage.contains("prompt_tokens_details")) {
        record.cache_read_tokens = CountField(usage["prompt_tokens_details"], "cached_tokens");
    }
}

std::optional<UsageRecord> ExtractFromEventStream(const std::string& body, const std::string& provider) {
    UsageRecord record{};
    record.provider = provider;
    bool found = false;
    for (const auto& raw : utils::SplitLines(body)) {
        if (!utils::StartsWith(raw, "data:")) {
            continue;
        }
        const auto payload = utils::Trim(raw.substr(5));
        if (payload.empty() || payload == "[DONE]") {
            continue;
        }
        const auto event = nlohmann::json::parse(payload, nullptr, false);
        if (event.is_discarded() || !event.is_object()) {
            continue;
        }
        const auto type = event.value("type", "");
        if (type == "message_start" && event.contains("message") && event["message"].is_object()) {
            const auto& message = event["message"];
            record.model = message.value("model", record.model);
            if (message.contains("usage")) {
                ApplyUsageBlock(record, message["usage"]);
                found = true;
            }
            continue;
        }
        if (event.contains("model") && event["model"].is_string()) {
            record.model = event["model"].get<std::string>();
        }
        if (event.contains("usage") && event["usage"].is_object()) {
            ApplyUsageBlock(record, event["usage"]);
            found = true;
        }
    }
    if (!found) {
        return std::nullopt;
    }
    if (record.model.empty()) {
        record.model = "unknown";
    }
    return record;
}

}  // namespace

ModelPricing PricingFor(const std::string& model) {
    const auto lowered = utils::ToLower(model);
    if (lowered.find("opus") != std::string::npos) {
        return {15.0, 75.0, 18.75, 1.50};
    }
    if (lowered.find("haiku") != std::string::npos) {
        return {0.80, 4.0, 1.0, 0.08};
    }
    return {3.0, 15.0, 3.75, 0.30};
}

std::optional<UsageRecord> ParseUsageLine(const std::string& line) {
    const auto trimmed = utils::Trim(line);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    const auto json = nlohmann::json::parse(trimmed, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return std::nullopt;
    }
    if (!json.contains("model") || !json["model"].is_string() || json["model"].get<std::string>().empty()) {
        return std::nullopt;
    }
    UsageRecord record{};
    record.model = json["model"].get<std::string>();
    if (json.contains("provider") && json["provider"].is_string()) {
        record.provider = json["provider"].get<std::string>();
    }
    record.input_tokens = CountField(json, "input_tokens");
    record.output_tokens = CountField(json, "output_tokens");
    record.cache_creation_tokens = CountField(json, "cache_creation_input_tokens");
    record.cache_read_tokens = CountField(json, "cache_read_input_tokens");
    if (json.contains("timestamp") && json["timestamp"].is_number()) {
        record.timestamp = json["timestamp"].get<double>();
    }
    return record;
}

std::vector<UsageRecord> ParseUsageText(const std::string& text) {
    std::vector<UsageRecord> records;
    for (const auto& line : utils::SplitLines(text)) {
        if (auto record = ParseUsageLine(line)) {
            records.push_back(std::move(*record));
        }
    }
    return records;
}

std::vector<UsageRecord> ParseUsageLogs(const std::filesystem::path& log_path) {
    std::ifstream input(log_path);
    if (!input.is_open()) {
        throw std::runtime_error("reading gateway log " + log_path.string());
    }
    std::ostringstream stream;
    stream << input.rdbuf();
    return ParseUsageText(stream.str());
}

std::vector<UsageRecord> FilterWindow(const std::vector<UsageRecord>& records, double start, double end) {
    std::vector<UsageRecord> filtered;
    for (const auto& record : records) {
        if (record.timestamp <= 0.0 || (record.timestamp >= start && record.timestamp <= end)) {
            filtered.push_back(record);
        }
    }
    return filtered;
}

TokenTotals TotalUsage(const std::vector<UsageRecord>& records) {
    TokenTotals totals{};
    for (const auto& record : records) {
        totals.input_tokens += record.input_tokens;
        totals.output_tokens += record.output_tokens;
    }
    return totals;
}

double EstimateCost(const std::vector<UsageRecord>& records) {
    double total = 0.0;
    for (const auto& record : records) {
        const auto pricing = PricingFor(record.model);
        total += static_cast<double>(record.input_tokens) * pricing.input / 1e6;
        total += static_cast<double>(record.output_tokens) * pricing.output / 1e6;
        total += static_cast<double>(record.cache_creation_tokens) * pricing.cache_write / 1e6;
        total += static_cast<double>(record.cache_read_tokens) * pricing.cache_read / 1e6;
    }
    return total;
}

std::string SerializeUsageRecord(const UsageRecord& record) {
    const nlohmann::json json = {
        {"timestamp", record.timestamp},
        {"provider", record.provider},
        {"model", record.model},
        {"input_tokens", record.input_tokens},
        {"output_tokens", record.output_tokens},
        {"cache_creation_input_tokens", record.cache_creation_tokens},
        {"cache_read_input_tokens", record.cache_read_tokens}
    };
    return json.dump();
}

std::optional<UsageRecord> ExtractUsage(const std::string& body,
                                        const std::string& content_type,
                                        const std::string& provider) {
    if (content_type.find("text/event-stream") != std::string::npos ||
        utils::StartsWith(body, "event:") || utils::StartsWith(body, "data:")) {
        return ExtractFromEventStream(body, provider);
    }
    const auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded() || !json.is_object() || !json.contains("usage") || !json["usage"].is_object()) {
        return std::nullopt;
    }
    UsageRecord record{};
    record.provider = provider;
    record.model = json.value("model", "unknown");
    ApplyUsageBlock(record, json["usage"]);
    return record;
}

}  // namespace trialbench::gateway
