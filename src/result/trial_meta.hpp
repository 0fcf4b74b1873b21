#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>

#include "nlohmann/json.hpp"

namespace trialbench::result {

// Every axis is optional. An axis that was not produced is absent, never 0.
struct Scores {
    std::optional<double> tests;
    std::optional<double> static_analysis;
    std::optional<double> rubric;
    std::optional<double> hidden_tests;
    std::optional<double> agent_tests;
    std::optional<double> coverage;
    std::optional<double> code_metrics;
    std::map<std::string, double> rubric_criteria;

    bool operator==(const Scores&) const = default;
};

struct TrialMeta {
    std::string orchestrator;
    std::string task;
    int trial = 0;
    int duration_s = 0;
    int exit_code = 0;
    std::string exit_reason;
    Scores scores;
    double composite_score = 0.0;
    long long total_tokens = 0;
    long long input_tokens = 0;
    long long output_tokens = 0;
    double total_cost_usd = 0.0;
    bool budget_exceeded = false;

    bool operator==(const TrialMeta&) const = default;
};

nlohmann::json ScoresToJson(const Scores& scores);
Scores ScoresFromJson(const nlohmann::json& json);

nlohmann::json TrialMetaToJson(const TrialMeta& meta);
// Throws std::runtime_error when required fields are missing or mistyped.
TrialMeta TrialMetaFromJson(const nlohmann::json& json);

std::filesystem::path TrialDir(const std::filesystem::path& run_dir,
                               const std::string& orchestrator,
                               const std::string& task,
                               int trial);

// Writes <trial_dir>/meta.json, creating trial_dir if needed.
void WriteTrialMeta(const std::filesystem::path& trial_dir, const TrialMeta& meta);
TrialMeta ReadTrialMeta(const std::filesystem::path& meta_path);

// Creates <base>/runs/<UTC stamp> and repoints <base>/latest at it.
// Returns the absolute run directory.
std::filesystem::path CreateRunDir(const std::filesystem::path& base_dir);

}  // namespace trialbench::result
