#include "result/trial_meta.hpp"

#include <ctime>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace trialbench::result {
namespace {

void PutOptional(nlohmann::json& json, const char* key, const std::optional<double>& value) {
    if (value.has_value()) {
        json[key] = *value;
    }
}

std::optional<double> GetOptional(const nlohmann::json& json, const char* key) {
    if (json.contains(key) && json[key].is_number()) {
        return json[key].get<double>();
    }
    return std::nullopt;
}

template <typename T>
T Required(const nlohmann::json& json, const char* key) {
    if (!json.contains(key)) {
        throw std::runtime_error(std::string("meta.json: missing ") + key);
    }
    try {
        return json[key].get<T>();
    } catch (const nlohmann::json::exception& ex) {
        throw std::runtime_error(std::string("meta.json: bad ") + key + ": " + ex.what());
    }
}

std::string UtcStamp() {
    const auto now = std::time(nullptr);
    std::tm utc{};
    gmtime_r(&now, &utc);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H-%M-%S", &utc);
    return buffer;
}

}  // namespace

nlohmann::json ScoresToJson(const Scores& scores) {
    nlohmann::json json = nlohmann::json::object();
    PutOptional(json, "tests", scores.tests);
    PutOptional(json, "static_analysis", scores.static_analysis);
    PutOptional(json, "rubric", scores.rubric);
    PutOptional(json, "hidden_tests", scores.hidden_tests);
    PutOptional(json, "agent_tests", scores.agent_tests);
    PutOptional(json, "coverage", scores.coverage);
    PutOptional(json, "code_metrics", scores.code_metrics);
    if (!scores.rubric_criteria.empty()) {
        json["rubric_criteria"] = scores.rubric_criteria;
    }
    return json;
}

Scores ScoresFromJson(const nlohmann::json& json) {
    Scores scores{};
    if (!json.is_object()) {
        return scores;
    }
    scores.tests = GetOptional(json, "tests");
    scores.static_analysis = GetOptional(json, "static_analysis");
    scores.rubric = GetOptional(json, "rubric");
    scores.hidden_tests = GetOptional(json, "hidden_tests");
    scores.agent_tests = GetOptional(json, "agent_tests");
    scores.coverage = GetOptional(json, "coverage");
    scores.code_metrics = GetOptional(json, "code_metrics");
    if (json.contains("rubric_criteria") && json["rubric_criteria"].is_object()) {
        for (const auto& item : json["rubric_criteria"].items()) {
            if (item.value().is_number()) {
                scores.rubric_criteria[item.key()] = item.value().get<double>();
            }
        }
    }
    return scores;
}

nlohmann::json TrialMetaToJson(const TrialMeta& meta) {
    return {
        {"orchestrator", meta.orchestrator},
        {"task", meta.task},
        {"trial", meta.trial},
        {"duration_s", meta.duration_s},
        {"exit_code", meta.exit_code},
        {"exit_reason", meta.exit_reason},
        {"scores", ScoresToJson(meta.scores)},
        {"composite_score", meta.composite_score},
        {"total_tokens", meta.total_tokens},
        {"input_tokens", meta.input_tokens},
        {"output_tokens", meta.output_tokens},
        {"total_cost_usd", meta.total_cost_usd},
        {"budget_exceeded", meta.budget_exceeded}
    };
}

TrialMeta TrialMetaFromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw std::runtime_error("meta.json: not an object");
    }
    TrialMeta meta{};
    meta.orchestrator = Required<std::string>(json, "orchestrator");
    meta.task = Required<std::string>(json, "task");
    meta.trial = Required<int>(json, "trial");
    meta.duration_s = json.value("duration_s", 0);
    meta.exit_code = json.value("exit_code", 0);
    meta.exit_reason = json.value("exit_reason", "");
    if (json.contains("scores")) {
        meta.scores = ScoresFromJson(json["scores"]);
    }
    meta.composite_score = json.value("composite_score", 0.0);
    meta.total_tokens = json.value("total_tokens", 0LL);
    meta.input_tokens = json.value("input_tokens", 0LL);
    meta.output_tokens = json.value("output_tokens", 0LL);
    meta.total_cost_usd = json.value("total_cost_usd", 0.0);
    meta.budget_exceeded = json.value("budget_exceeded", false);
    return meta;
}

std::filesystem::path TrialDir(const std::filesystem::path& run_dir,
                               const std::string& orchestrator,
                               const std::string& task,
                               int trial) {
    return run_dir / "trials" / orchestrator / task / ("trial-" + std::to_string(trial));
}

void WriteTrialMeta(const std::filesystem::path& trial_dir, const TrialMeta& meta) {
    std::filesystem::create_directories(trial_dir);
    const auto path = trial_dir / "meta.json";
    const auto temp = trial_dir / "meta.json.tmp";
    {
        std::ofstream output(temp, std::ios::trunc);
        if (!output.is_open()) {
            throw std::runtime_error("writing " + temp.string());
        }
        output << TrialMetaToJson(meta).dump(2);
        if (!output.good()) {
            throw std::runtime_error("writing " + temp.string());
        }
    }
    std::filesystem::rename(temp, path);
}

TrialMeta ReadTrialMeta(const std::filesystem::path& meta_path) {
    std::ifstream input(meta_path);
    if (!input.is_open()) {
        throw std::runtime_error("reading meta " + meta_path.string());
    }
    std::ostringstream stream;
    stream << input.rdbuf();
    const auto json = nlohmann::json::parse(stream.str(), nullptr, false);
    if (json.is_discarded()) {
        throw std::runtime_error("parsing meta " + meta_path.string());
    }
    return TrialMetaFromJson(json);
}

std::filesystem::path CreateRunDir(const std::filesystem::path& base_dir) {
    const auto run_dir = std::filesystem::absolute(base_dir / "runs" / UtcStamp());
    std::filesystem::create_directories(run_dir);

    const auto latest = base_dir / "latest";
    std::error_code ec;
    std::filesystem::remove(latest, ec);
    std::filesystem::create_directory_symlink(run_dir, latest);
    return run_dir;
}

}  // namespace trialbench::result
