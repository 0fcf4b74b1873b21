#pragma once

#include "config/config_schema.hpp"
#include "result/trial_meta.hpp"

namespace trialbench::validation {

// Used when every configured weight is zero.
config::ValidationWeights DefaultWeights();
config::GreenWeights DefaultGreenWeights();

// Weighted mean over the axes present in scores. Missing axes drop out of
// both numerator and denominator; no axes at all gives 0.
double CompositeScore(const result::Scores& scores, config::ValidationWeights weights);

// Build/lint is read from scores.static_analysis.
double GreenfieldCompositeScore(const result::Scores& scores, config::GreenWeights weights);

}  // namespace trialbench::validation
