#include "validation/rubric.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "nlohmann/json.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace trialbench::validation {
namespace {

using utils::LogLevel;
using utils::LogLine;

}  // namespace

std::string TruncateDiff(const std::string& diff) {
    if (diff.size() <= kMaxDiffChars) {
        return diff;
    }
    return diff.substr(0, kMaxDiffChars) + "\n\n... [diff truncated from " + std::to_string(diff.size()) +
        " to " + std::to_string(kMaxDiffChars) + " chars] ...";
}

std::string BuildJudgePrompt(const std::string& task_description,
                             const std::string& diff,
                             const config::RubricCriterion& criterion) {
    std::ostringstream prompt;
    prompt << "You are a code review judge. Score this diff against the criterion below on a scale "
              "of 0.0 to 1.0.\n\n"
           << "Task description:\n" << task_description << "\n\n"
           << "Criterion:\n" << criterion.criterion << "\n\n"
           << "Diff:\n" << TruncateDiff(diff) << "\n\n"
           << "Respond with ONLY a JSON object of the form {\"score\": 0.8}";
    return prompt.str();
}

std::map<std::string, double> ParseJudgeResponse(const std::string& content) {
    const auto start = content.find('{');
    const auto end = content.rfind('}');
    if (start == std::string::npos || end == std::string::npos || end <= start) {
        throw std::runtime_error("parsing judge response: no JSON object found in: " +
                                 utils::Truncate(content, 200));
    }
    const auto text = content.substr(start, end - start + 1);
    const auto json = nlohmann::json::parse(text, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        throw std::runtime_error("parsing judge response: invalid JSON: " + utils::Truncate(text, 200));
    }
    std::map<std::string, double> scores;
    for (const auto& item : json.items()) {
        if (item.value().is_number()) {
            scores[item.key()] = item.value().get<double>();
        }
    }
    return scores;
}

std::optional<double> CriterionScore(const std::map<std::string, double>& reply,
                                     const std::string& criterion) {
    std::optional<double> value;
    if (const auto it = reply.find("score"); it != reply.end()) {
        value = it->second;
    } else if (const auto named = reply.find(criterion); named != reply.end()) {
        value = named->second;
    } else if (reply.size() == 1) {
        value = reply.begin()->second;
    }
    if (!value) {
        return std::nullopt;
    }
    return std::clamp(*value, 0.0, 1.0);
}

double MedianScore(std::vector<double> scores) {
    if (scores.empty()) {
        return 0.0;
    }
    std::sort(scores.begin(), scores.end());
    const auto mid = scores.size() / 2;
    if (scores.size() % 2 == 0) {
        return (scores[mid - 1] + scores[mid]) / 2.0;
    }
    return scores[mid];
}

std::optional<double> ComputeRubricScore(const std::vector<config::RubricCriterion>& rubric,
                                         const std::map<std::string, double>& scores) {
    double weighted = 0.0;
    double total = 0.0;
    for (const auto& criterion : rubric) {
        const auto it = scores.find(criterion.criterion);
        if (it == scores.end()) {
            continue;
        }
        weighted += it->second * criterion.weight;
        total += criterion.weight;
    }
    if (total <= 0.0) {
        return std::nullopt;
    }
    return weighted / total;
}

LLMRubricJudge::LLMRubricJudge(providers::LLMProvider& provider, JudgeOptions options)
    : provider_(provider)
    , options_(std::move(options)) {
    options_.samples = std::max(1, options_.samples);
}

std::map<std::string, double> LLMRubricJudge::Judge(const std::vector<config::RubricCriterion>& rubric,
                                                    const std::string& diff,
                                                    const std::string& task_description,
                                                    std::stop_token stop) {
    std::map<std::string, double> result;
    for (const auto& criterion : rubric) {
        const std::vector<providers::Message> messages{
            providers::Message{"user", BuildJudgePrompt(task_description, diff, criterion)}};
        std::vector<double> samples;
        for (int attempt = 1; attempt <= options_.samples; ++attempt) {
            if (stop.stop_requested()) {
                throw std::runtime_error("rubric judge cancelled");
            }
            const auto response = provider_.Chat(messages, options_.model, options_.max_tokens, 0.0);
            if (response.IsError()) {
                LogLine(LogLevel::kWarn, "judge") << "\"" << criterion.criterion << "\" attempt " << attempt
                                                  << ": " << response.content;
                continue;
            }
            try {
                if (const auto score = CriterionScore(ParseJudgeResponse(response.content), criterion.criterion)) {
                    samples.push_back(*score);
                } else {
                    LogLine(LogLevel::kWarn, "judge") << "\"" << criterion.criterion << "\" attempt " << attempt
                                                      << ": no score in reply";
                }
            } catch (const std::exception& ex) {
                LogLine(LogLevel::kWarn, "judge") << "\"" << criterion.criterion << "\" attempt " << attempt
                                                  << ": " << ex.what();
            }
        }
        if (!samples.empty()) {
            result[criterion.criterion] = MedianScore(samples);
        }
    }
    return result;
}

}  // namespace trialbench::validation
