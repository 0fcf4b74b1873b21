#include "validation/composite.hpp"

#include <initializer_list>
#include <optional>
#include <utility>

namespace trialbench::validation {
namespace {

using Term = std::pair<const std::optional<double>*, double>;

double WeightedMean(std::initializer_list<Term> terms) {
    double weighted = 0.0;
    double total = 0.0;
    for (const auto& [score, weight] : terms) {
        if (!score->has_value()) {
            continue;
        }
        weighted += **score * weight;
        total += weight;
    }
    return total > 0.0 ? weighted / total : 0.0;
}

}  // namespace

config::ValidationWeights DefaultWeights() {
    return {0.5, 0.2, 0.3};
}

config::GreenWeights DefaultGreenWeights() {
    return {0.3, 0.3, 0.15, 0.15, 0.1};
}

double CompositeScore(const result::Scores& scores, config::ValidationWeights weights) {
    if (weights.tests == 0.0 && weights.static_analysis == 0.0 && weights.rubric == 0.0) {
        weights = DefaultWeights();
    }
    return WeightedMean({
        {&scores.tests, weights.tests},
        {&scores.static_analysis, weights.static_analysis},
        {&scores.rubric, weights.rubric}});
}

double GreenfieldCompositeScore(const result::Scores& scores, config::GreenWeights weights) {
    if (weights.rubric == 0.0 && weights.hidden_tests == 0.0 && weights.agent_tests == 0.0 &&
        weights.build_lint == 0.0 && weights.code_metrics == 0.0) {
        weights = DefaultGreenWeights();
    }
    return WeightedMean({
        {&scores.rubric, weights.rubric},
        {&scores.hidden_tests, weights.hidden_tests},
        {&scores.agent_tests, weights.agent_tests},
        {&scores.static_analysis, weights.build_lint},
        {&scores.code_metrics, weights.code_metrics}});
}

}  // namespace trialbench::validation
