#include "runner/trial_scorer.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include "utils/logging.hpp"
#include "validation/code_metrics.hpp"
#include "validation/composite.hpp"
#include "validation/coverage.hpp"
#include "validation/lint.hpp"
#include "validation/test_results.hpp"

namespace trialbench::runner {
namespace {

namespace fs = std::filesystem;
using utils::LogLevel;
using utils::LogLine;

std::string ReadFileOrEmpty(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return "";
    }
    std::ostringstream stream;
    stream << input.rdbuf();
    return stream.str();
}

void ThrowIfStopped(std::stop_token stop) {
    if (stop.stop_requested()) {
        throw std::runtime_error("scoring cancelled");
    }
}

// Runs one axis; a failure is logged and leaves the axis untouched.
template <typename Fn>
void ScoreAxis(const char* axis, const result::TrialMeta& meta, std::stop_token stop, Fn&& fn) {
    ThrowIfStopped(stop);
    try {
        fn();
    } catch (const std::exception& ex) {
        LogLine(LogLevel::kWarn, "scorer") << axis << " failed for " << meta.orchestrator << "/" << meta.task
                                           << " trial " << meta.trial << ": " << ex.what();
    }
    ThrowIfStopped(stop);
}

}  // namespace

TrialScorer::TrialScorer(validation::ValidationRunner& validation,
                         validation::RubricJudge& judge,
                         gitops::SourceControl& source_control)
    : validation_(validation)
    , judge_(judge)
    , source_control_(source_control) {}

result::TrialMeta TrialScorer::ValidateAndScore(const fs::path& trial_dir,
                                                const config::TaskConfig& task,
                                                std::stop_token stop) {
    auto meta = result::ReadTrialMeta(trial_dir / "meta.json");
    if (!fs::is_directory(trial_dir / "workspace")) {
        throw std::runtime_error("trial workspace missing in " + trial_dir.string());
    }
    meta.scores = result::Scores{};

    if (task.greenfield) {
        ScoreGreenfield(trial_dir, task, meta, stop);
        meta.composite_score = validation::GreenfieldCompositeScore(meta.scores, task.green_weights);
    } else {
        ScoreStandard(trial_dir, task, meta, stop);
        meta.composite_score = validation::CompositeScore(meta.scores, task.weights);
    }

    result::WriteTrialMeta(trial_dir, meta);
    LogLine(LogLevel::kInfo, "scorer") << meta.orchestrator << "/" << meta.task << " trial " << meta.trial
                                       << " composite " << meta.composite_score;
    return meta;
}

void TrialScorer::ScoreStandard(const fs::path& trial_dir,
                                const config::TaskConfig& task,
                                result::TrialMeta& meta,
                                std::stop_token stop) {
    const auto work_dir = trial_dir / "workspace";
    auto& scores = meta.scores;

    ScoreAxis("tests", meta, stop, [&]() {
        scores.tests = validation::RunTests(validation_, work_dir, task.validation_image, task.install_cmd,
                                            task.test_cmd, stop).score;
    });
    ScoreAxis("lint", meta, stop, [&]() {
        scores.static_analysis = validation::RunLint(validation_, work_dir, task.validation_image, task.lint_cmd,
                                                     task.lint_baseline, stop).score;
    });
    ScoreAxis("rubric", meta, stop, [&]() { ScoreRubric(trial_dir, task, scores, stop); });
}

void TrialScorer::ScoreGreenfield(const fs::path& trial_dir,
                                  const config::TaskConfig& task,
                                  result::TrialMeta& meta,
                                  std::stop_token stop) {
    const auto work_dir = trial_dir / "workspace";
    auto& scores = meta.scores;

    // The agent's own tests and coverage run before hidden tests are injected.
    if (!task.test_cmd.empty()) {
        ScoreAxis("agent tests", meta, stop, [&]() {
            scores.agent_tests = validation::RunTests(validation_, work_dir, task.validation_image,
                                                      task.install_cmd, task.test_cmd, stop).score;
        });
    }
    ScoreAxis("coverage", meta, stop, [&]() {
        scores.coverage = validation::RunCoverage(validation_, work_dir, task.validation_image, task.install_cmd,
                                                  task.coverage_cmd, stop).score;
    });
    ScoreAxis("code metrics", meta, stop, [&]() {
        scores.code_metrics = validation::RunCodeMetrics(work_dir, task.metrics_extensions).score;
    });
    ScoreAxis("build/lint", meta, stop, [&]() {
        if (!task.build_cmd.empty()) {
            const auto built = validation_.RunInImage(work_dir, task.validation_image, task.build_cmd, stop);
            if (!built.Ok()) {
                LogLine(LogLevel::kWarn, "scorer") << "build failed for " << meta.task << " trial " << meta.trial
                                                   << " (exit " << built.exit_code << ")";
                scores.static_analysis = 0.0;
                return;
            }
        }
        scores.static_analysis = validation::RunLint(validation_, work_dir, task.validation_image, task.lint_cmd,
                                                     task.lint_baseline, stop).score;
    });
    ScoreAxis("hidden tests", meta, stop, [&]() {
        validation::HiddenTestInjection injection(source_control_, task.repo, task.validation_tag, work_dir);
        scores.hidden_tests = validation::RunHiddenTests(validation_, work_dir, task.validation_image,
                                                         task.install_cmd, task.hidden_test_cmd, stop).score;
    });
    ScoreAxis("rubric", meta, stop, [&]() { ScoreRubric(trial_dir, task, scores, stop); });
}

void TrialScorer::ScoreRubric(const fs::path& trial_dir,
                              const config::TaskConfig& task,
                              result::Scores& scores,
                              std::stop_token stop) {
    if (task.rubric.empty()) {
        return;
    }
    const auto diff = ReadFileOrEmpty(trial_dir / "diff.patch");
    const auto task_description = ReadFileOrEmpty(trial_dir / "task.md");
    const auto criteria = judge_.Judge(task.rubric, diff, task_description, stop);
    scores.rubric_criteria = criteria;
    scores.rubric = validation::ComputeRubricScore(task.rubric, criteria);
    if (!scores.rubric) {
        throw std::runtime_error("judge scored none of " + std::to_string(task.rubric.size()) + " criteria");
    }
}

}  // namespace trialbench::runner
