#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "providers/llm_provider.hpp"

namespace trialbench::validation {

inline constexpr std::size_t kMaxDiffChars = 100000;

std::string TruncateDiff(const std::string& diff);

std::string BuildJudgePrompt(const std::string& task_description,
                             const std::string& diff,
                             const config::RubricCriterion& criterion);

// Extracts the outermost {...} from the reply and reads it as a map of numbers.
// Throws std::runtime_error when there is no object or it does not parse.
std::map<std::string, double> ParseJudgeResponse(const std::string& content);

// Picks this criterion's score out of a parsed reply: "score", then the
// criterion name, then a lone entry. Clamped to [0, 1].
std::optional<double> CriterionScore(const std::map<std::string, double>& reply,
                                     const std::string& criterion);

double MedianScore(std::vector<double> scores);

// Weighted mean over the criteria that were scored; std::nullopt when none were.
std::optional<double> ComputeRubricScore(const std::vector<config::RubricCriterion>& rubric,
                                         const std::map<std::string, double>& scores);

class RubricJudge {
public:
    virtual ~RubricJudge() = default;
    // Per-criterion scores in [0, 1]; criteria the judge could not score are absent.
    virtual std::map<std::string, double> Judge(const std::vector<config::RubricCriterion>& rubric,
                                                const std::string& diff,
                                                const std::string& task_description,
                                                std::stop_token stop) = 0;
};

struct JudgeOptions {
    std::string model;
    int samples = 1;
    int max_tokens = 1024;
};

// One prompt per criterion, asked `samples` times; the median is kept.
class LLMRubricJudge : public RubricJudge {
public:
    LLMRubricJudge(providers::LLMProvider& provider, JudgeOptions options);

    std::map<std::string, double> Judge(const std::vector<config::RubricCriterion>& rubric,
                                        const std::string& diff,
                                        const std::string& task_description,
                                        std::stop_token stop) override;

private:
    providers::LLMProvider& provider_;
    JudgeOptions options_;
};

}  // namespace trialbench::validation
