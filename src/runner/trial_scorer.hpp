#pragma once

#include <filesystem>
#include <stop_token>

#include "config/config_schema.hpp"
#include "gitops/git_client.hpp"
#include "result/trial_meta.hpp"
#include "validation/rubric.hpp"
#include "validation/validation_runner.hpp"

namespace trialbench::runner {

class TrialScorer {
public:
    TrialScorer(validation::ValidationRunner& validation,
                validation::RubricJudge& judge,
                gitops::SourceControl& source_control);

    // Re-reads meta.json, computes every axis from scratch, writes the new
    // scores and composite back. A failing axis is logged and left absent.
    // Running it again on an unchanged trial gives the same result.
    result::TrialMeta ValidateAndScore(const std::filesystem::path& trial_dir,
                                       const config::TaskConfig& task,
                                       std::stop_token stop);

private:
    void ScoreStandard(const std::filesystem::path& trial_dir,
                       const config::TaskConfig& task,
                       result::TrialMeta& meta,
                       std::stop_token stop);
    void ScoreGreenfield(const std::filesystem::path& trial_dir,
                         const config::TaskConfig& task,
                         result::TrialMeta& meta,
                         std::stop_token stop);
    void ScoreRubric(const std::filesystem::path& trial_dir,
                     const config::TaskConfig& task,
                     result::Scores& scores,
                     std::stop_token stop);

    validation::ValidationRunner& validation_;
    validation::RubricJudge& judge_;
    gitops::SourceControl& source_control_;
};

}  // namespace trialbench::runner
