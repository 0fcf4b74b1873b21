#include "config/config_loader.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include "nlohmann/json.hpp"
#include "utils/common.hpp"

namespace trialbench::config {
namespace {

using utils::GetEnv;

void ReadString(const nlohmann::json& source, const char* key, std::string& target) {
    if (source.contains(key) && source[key].is_string()) {
        target = source[key].get<std::string>();
    }
}

void ReadDouble(const nlohmann::json& source, const char* key, double& target) {
    if (source.contains(key) && source[key].is_number()) {
        target = source[key].get<double>();
    }
}

void ReadInt(const nlohmann::json& source, const char* key, int& target) {
    if (source.contains(key) && source[key].is_number_integer()) {
        target = source[key].get<int>();
    }
}

void ReadBool(const nlohmann::json& source, const char* key, bool& target) {
    if (source.contains(key) && source[key].is_boolean()) {
        target = source[key].get<bool>();
    }
}

void ReadStringList(const nlohmann::json& source, const char* key, std::vector<std::string>& target) {
    if (!source.contains(key) || !source[key].is_array()) {
        return;
    }
    target.clear();
    for (const auto& item : source[key]) {
        if (item.is_string()) {
            target.push_back(item.get<std::string>());
        }
    }
}

void ReadStringMap(const nlohmann::json& source, const char* key, std::map<std::string, std::string>& target) {
    if (!source.contains(key) || !source[key].is_object()) {
        return;
    }
    for (const auto& item : source[key].items()) {
        if (item.value().is_string()) {
            target[item.key()] = item.value().get<std::string>();
        } else {
            target[item.key()] = item.value().dump();
        }
    }
}

OrchestratorConfig ParseOrchestrator(const nlohmann::json& source) {
    OrchestratorConfig orchestrator{};
    if (!source.is_object()) {
        return orchestrator;
    }
    ReadString(source, "name", orchestrator.name);
    ReadString(source, "adapter", orchestrator.adapter);
    ReadString(source, "image", orchestrator.image);
    ReadStringMap(source, "env", orchestrator.env);
    if (source.contains("mounts") && source["mounts"].is_array()) {
        for (const auto& item : source["mounts"]) {
            if (!item.is_object()) {
                continue;
            }
            MountConfig mount{};
            ReadString(item, "source", mount.source);
            ReadString(item, "target", mount.target);
            orchestrator.mounts.push_back(std::move(mount));
        }
    }
    return orchestrator;
}

TaskConfig ParseTask(const nlohmann::json& source) {
    TaskConfig task{};
    if (!source.is_object()) {
        return task;
    }
    ReadString(source, "id", task.id);
    ReadString(source, "name", task.name);
    ReadString(source, "repo", task.repo);
    ReadString(source, "tag", task.tag);
    ReadString(source, "category", task.category);
    ReadString(source, "validationImage", task.validation_image);
    ReadString(source, "installCmd", task.install_cmd);
    ReadString(source, "testCmd", task.test_cmd);
    ReadString(source, "buildCmd", task.build_cmd);
    ReadString(source, "lintCmd", task.lint_cmd);
    ReadInt(source, "lintBaseline", task.lint_baseline);
    ReadInt(source, "timeLimitMinutes", task.time_limit_minutes);
    ReadBool(source, "greenfield", task.greenfield);
    ReadString(source, "validationTag", task.validation_tag);
    ReadString(source, "hiddenTestCmd", task.hidden_test_cmd);
    ReadString(source, "coverageCmd", task.coverage_cmd);
    ReadStringList(source, "metricsExtensions", task.metrics_extensions);

    if (source.contains("rubric") && source["rubric"].is_array()) {
        for (const auto& item : source["rubric"]) {
            if (!item.is_object()) {
                continue;
            }
            RubricCriterion criterion{};
            ReadString(item, "criterion", criterion.criterion);
            ReadDouble(item, "weight", criterion.weight);
            task.rubric.push_back(std::move(criterion));
        }
    }
    if (source.contains("weights") && source["weights"].is_object()) {
        const auto& weights = source["weights"];
        ReadDouble(weights, "tests", task.weights.tests);
        ReadDouble(weights, "staticAnalysis", task.weights.static_analysis);
        ReadDouble(weights, "rubric", task.weights.rubric);
    }
    if (source.contains("greenWeights") && source["greenWeights"].is_object()) {
        const auto& weights = source["greenWeights"];
        ReadDouble(weights, "rubric", task.green_weights.rubric);
        ReadDouble(weights, "hiddenTests", task.green_weights.hidden_tests);
        ReadDouble(weights, "agentTests", task.green_weights.agent_tests);
        ReadDouble(weights, "buildLint", task.green_weights.build_lint);
        ReadDouble(weights, "codeMetrics", task.green_weights.code_metrics);
    }
    return task;
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        throw std::runtime_error("top level must be an object");
    }

    if (data.contains("orchestrators") && data["orchestrators"].is_array()) {
        for (const auto& item : data["orchestrators"]) {
            config.orchestrators.push_back(ParseOrchestrator(item));
        }
    }
    if (data.contains("tasks") && data["tasks"].is_array()) {
        for (const auto& item : data["tasks"]) {
            config.tasks.push_back(ParseTask(item));
        }
    }
    ReadInt(data, "trials", config.trials);

    if (data.contains("proxy") && data["proxy"].is_object()) {
        const auto& proxy = data["proxy"];
        ReadString(proxy, "command", config.proxy.command);
        ReadString(proxy, "upstream", config.proxy.upstream);
        ReadString(proxy, "logDir", config.proxy.log_dir);
        ReadDouble(proxy, "budgetPerTrialUsd", config.proxy.budget_per_trial_usd);
        ReadString(proxy, "judgeModel", config.proxy.judge_model);
        ReadInt(proxy, "judgeSamples", config.proxy.judge_samples);
    }

    if (data.contains("network") && data["network"].is_object()) {
        const auto& network = data["network"];
        ReadBool(network, "isolate", config.network.isolate);
        ReadStringList(network, "allowlist", config.network.allowlist);
    }

    if (data.contains("sandbox") && data["sandbox"].is_object()) {
        const auto& sandbox = data["sandbox"];
        ReadString(sandbox, "engine", config.sandbox.engine);
        ReadDouble(sandbox, "cpuLimit", config.sandbox.cpu_limit);
        if (sandbox.contains("memoryLimitBytes") && sandbox["memoryLimitBytes"].is_number_integer()) {
            config.sandbox.memory_limit_bytes = sandbox["memoryLimitBytes"].get<std::int64_t>();
        }
    }

    if (data.contains("secrets") && data["secrets"].is_object()) {
        ReadString(data["secrets"], "envFile", config.secrets.env_file);
    }
    if (data.contains("results") && data["results"].is_object()) {
        ReadString(data["results"], "dir", config.results.dir);
    }
    if (data.contains("logging") && data["logging"].is_object()) {
        ReadString(data["logging"], "level", config.logging.level);
    }
}

std::string Unquote(const std::string& value) {
    if (value.size() >= 2) {
        const char first = value.front();
        if ((first == '"' || first == '\'') && value.back() == first) {
            return value.substr(1, value.size() - 2);
        }
    }
    return value;
}

}  // namespace

void ValidateConfig(Config& config) {
    if (config.orchestrators.empty()) {
        throw std::runtime_error("no orchestrators defined");
    }
    for (std::size_t i = 0; i < config.orchestrators.size(); ++i) {
        const auto& orchestrator = config.orchestrators[i];
        if (orchestrator.name.empty()) {
            throw std::runtime_error("orchestrator " + std::to_string(i) + ": name is required");
        }
        if (orchestrator.adapter.empty()) {
            throw std::runtime_error("orchestrator \"" + orchestrator.name + "\": adapter is required");
        }
        if (orchestrator.image.empty()) {
            throw std::runtime_error("orchestrator \"" + orchestrator.name + "\": image is required");
        }
    }
    if (config.tasks.empty()) {
        throw std::runtime_error("no tasks defined");
    }
    for (std::size_t i = 0; i < config.tasks.size(); ++i) {
        auto& task = config.tasks[i];
        if (task.repo.empty()) {
            throw std::runtime_error("task " + std::to_string(i) + ": repo is required");
        }
        if (task.tag.empty()) {
            throw std::runtime_error("task " + std::to_string(i) + ": tag is required");
        }
        if (task.test_cmd.empty() && !task.greenfield) {
            throw std::runtime_error("task " + std::to_string(i) + ": testCmd is required for non-greenfield tasks");
        }
        if (task.validation_image.empty()) {
            task.validation_image = "node:20";
        }
        if (task.greenfield && task.validation_tag.empty()) {
            task.validation_tag = "v1-validation";
        }
        if (task.install_cmd.empty()) {
            task.install_cmd = "npm install";
        }
    }
    if (config.trials < 1) {
        throw std::runtime_error("trials must be at least 1");
    }
    if (config.proxy.judge_samples < 1) {
        config.proxy.judge_samples = 1;
    }
}

void ApplyEnvOverrides(Config& config) {
    const auto results_dir = GetEnv("TRIALBENCH_RESULTS_DIR");
    if (!results_dir.empty()) {
        config.results.dir = results_dir;
    }

    const auto log_dir = GetEnv("TRIALBENCH_PROXY_LOG_DIR");
    if (!log_dir.empty()) {
        config.proxy.log_dir = log_dir;
    }

    const auto judge_model = GetEnv("TRIALBENCH_JUDGE_MODEL");
    if (!judge_model.empty()) {
        config.proxy.judge_model = judge_model;
    }

    const auto log_level = GetEnv("TRIALBENCH_LOG_LEVEL");
    if (!log_level.empty()) {
        config.logging.level = log_level;
    }

    const auto engine = GetEnv("TRIALBENCH_ENGINE");
    if (!engine.empty()) {
        config.sandbox.engine = engine;
    }
}

Config ParseConfig(const std::string& text) {
    const auto data = nlohmann::json::parse(text, nullptr, false);
    if (data.is_discarded()) {
        throw std::runtime_error("invalid JSON");
    }
    Config config{};
    ApplyConfigFromJson(config, data);
    ApplyEnvOverrides(config);
    ValidateConfig(config);
    return config;
}

Config LoadConfig(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        throw std::runtime_error("reading config " + path.string());
    }
    std::ostringstream stream;
    stream << input.rdbuf();
    try {
        return ParseConfig(stream.str());
    } catch (const std::exception& ex) {
        throw std::runtime_error("invalid config " + path.string() + ": " + ex.what());
    }
}

std::map<std::string, std::string> ParseEnvText(const std::string& text) {
    std::map<std::string, std::string> values;
    for (const auto& raw : utils::SplitLines(text)) {
        auto line = utils::Trim(raw);
        if (line.empty() || line.front() == '#') {
            continue;
        }
        if (utils::StartsWith(line, "export ")) {
            line = utils::Trim(line.substr(7));
        }
        const auto eq = line.find('=');
        if (eq == std::string::npos || eq == 0) {
            continue;
        }
        values[utils::Trim(line.substr(0, eq))] = Unquote(utils::Trim(line.substr(eq + 1)));
    }
    return values;
}

std::map<std::string, std::string> ParseEnvFile(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        throw std::runtime_error("reading env file " + path.string());
    }
    std::ostringstream stream;
    stream << input.rdbuf();
    return ParseEnvText(stream.str());
}

const OrchestratorConfig* FindOrchestrator(const Config& config, const std::string& name) {
    for (const auto& orchestrator : config.orchestrators) {
        if (orchestrator.name == name) {
            return &orchestrator;
        }
    }
    return nullptr;
}

}  // namespace trialbench::config
