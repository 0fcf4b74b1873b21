#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace trialbench::config {

struct MountConfig {
    std::string source;
    std::string target;
};

struct OrchestratorConfig {
    std::string name;
    std::string adapter;
    std::string image;
    std::map<std::string, std::string> env;
    // Bound read-only, and only when the source exists on the host.
    std::vector<MountConfig> mounts;
};

struct RubricCriterion {
    std::string criterion;
    double weight = 0.0;
};

struct ValidationWeights {
    double tests = 0.0;
    double static_analysis = 0.0;
    double rubric = 0.0;
};

struct GreenWeights {
    double rubric = 0.0;
    double hidden_tests = 0.0;
    double agent_tests = 0.0;
    double build_lint = 0.0;
    double code_metrics = 0.0;
};

struct TaskConfig {
    std::string id;
    std::string name;
    std::string repo;
    std::string tag;
    std::string category;
    std::string validation_image;
    std::string install_cmd;
    std::string test_cmd;
    std::string build_cmd;
    std::string lint_cmd;
    int lint_baseline = 0;
    int time_limit_minutes = 0;
    std::vector<RubricCriterion> rubric;
    ValidationWeights weights;
    bool greenfield = false;
    std::string validation_tag;
    GreenWeights green_weights;
    std::string hidden_test_cmd = "npx vitest run --config validation-vitest.config.ts";
    std::string coverage_cmd =
        "npx vitest run --coverage.enabled --coverage.provider=v8 --coverage.reporter=json-summary "
        "--coverage.reportsDirectory=./coverage --exclude 'validation-tests/**'";
    std::vector<std::string> metrics_extensions{".ts", ".js", ".tsx", ".jsx"};
};

struct ProxyConfig {
    std::string command = "trialbench-proxy";
    std::string upstream;
    std::string log_dir = "logs";
    double budget_per_trial_usd = 0.0;
    std::string judge_model;
    int judge_samples = 1;
};

struct NetworkConfig {
    bool isolate = false;
    std::vector<std::string> allowlist;
};

struct SandboxConfig {
    std::string engine = "docker";
    double cpu_limit = 0.0;
    std::int64_t memory_limit_bytes = 0;
};

struct SecretsConfig {
    std::string env_file;
};

struct ResultsConfig {
    std::string dir = "results";
};

struct LoggingConfig {
    std::string level = "info";
};

struct Config {
    std::vector<OrchestratorConfig> orchestrators;
    std::vector<TaskConfig> tasks;
    int trials = 1;
    ProxyConfig proxy;
    NetworkConfig network;
    SandboxConfig sandbox;
    SecretsConfig secrets;
    ResultsConfig results;
    LoggingConfig logging;
};

}  // namespace trialbench::config
