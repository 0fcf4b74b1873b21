#pragma once

#include <filesystem>
#include <stop_token>
#include <string>

#include "validation/validation_runner.hpp"

namespace trialbench::validation {

struct LintResult {
    double score = 1.0;
    std::string output;
    int issues = 0;
    int net_new_issues = 0;
    int exit_code = 0;
};

// Lines mentioning ": error", ": warning", "Error:" or "Warning:".
int CountLintIssues(const std::string& output);

// score = max(0, 1 - 0.1 * max(0, issues - baseline)).
LintResult ParseLintResults(const std::string& output, int exit_code, int baseline_issues);

// An empty lint command scores 1.0 without running anything.
LintResult RunLint(ValidationRunner& runner,
                   const std::filesystem::path& work_dir,
                   const std::string& image,
                   const std::string& lint_cmd,
                   int baseline_issues,
                   std::stop_token stop);

}  // namespace trialbench::validation
