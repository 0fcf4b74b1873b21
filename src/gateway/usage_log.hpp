#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace trialbench::gateway {

struct UsageRecord {
    std::string provider;
    std::string model;
    long long input_tokens = 0;
    long long output_tokens = 0;
    long long cache_creation_tokens = 0;
    long long cache_read_tokens = 0;
    // Seconds since epoch; 0 when unknown.
    double timestamp = 0.0;
};

struct TokenTotals {
    long long input_tokens = 0;
    long long output_tokens = 0;

    long long Total() const { return input_tokens + output_tokens; }
};

// USD per million tokens.
struct ModelPricing {
    double input = 0.0;
    double output = 0.0;
    double cache_write = 0.0;
    double cache_read = 0.0;
};

// Unknown models are priced as sonnet.
ModelPricing PricingFor(const std::string& model);

// Returns std::nullopt for blank, malformed, or model-less lines.
std::optional<UsageRecord> ParseUsageLine(const std::string& line);
std::vector<UsageRecord> ParseUsageText(const std::string& text);
// Throws std::runtime_error when the log cannot be read.
std::vector<UsageRecord> ParseUsageLogs(const std::filesystem::path& log_path);

// Keeps records stamped within [start, end] plus unstamped records.
std::vector<UsageRecord> FilterWindow(const std::vector<UsageRecord>& records, double start, double end);

TokenTotals TotalUsage(const std::vector<UsageRecord>& records);
double EstimateCost(const std::vector<UsageRecord>& records);

std::string SerializeUsageRecord(const UsageRecord& record);

// Pulls usage out of an upstream response body. Handles Anthropic JSON,
// Anthropic server-sent events, and OpenAI-style usage blocks.
std::optional<UsageRecord> ExtractUsage(const std::string& body,
                                        const std::string& content_type,
                                        const std::string& provider);

}  // namespace trialbench::gateway
