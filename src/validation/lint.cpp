#include "validation/lint.hpp"

#include <algorithm>

#include "utils/common.hpp"

namespace trialbench::validation {

int CountLintIssues(const std::string& output) {
    int issues = 0;
    for (const auto& raw : utils::SplitLines(output)) {
        const auto line = utils::Trim(raw);
        if (line.empty()) {
            continue;
        }
        if (line.find(": error") != std::string::npos || line.find(": warning") != std::string::npos ||
            line.find("Error:") != std::string::npos || line.find("Warning:") != std::string::npos) {
            ++issues;
        }
    }
    return issues;
}

LintResult ParseLintResults(const std::string& output, int exit_code, int baseline_issues) {
    LintResult result{};
    result.output = output;
    result.exit_code = exit_code;
    if (exit_code == 0 && utils::Trim(output).empty()) {
        return result;
    }
    result.issues = CountLintIssues(output);
    result.net_new_issues = std::max(0, result.issues - baseline_issues);
    result.score = std::max(0.0, 1.0 - 0.1 * result.net_new_issues);
    return result;
}

LintResult RunLint(ValidationRunner& runner,
                   const std::filesystem::path& work_dir,
                   const std::string& image,
                   const std::string& lint_cmd,
                   int baseline_issues,
                   std::stop_token stop) {
    if (lint_cmd.empty()) {
        return LintResult{};
    }
    const auto result = runner.RunInImage(work_dir, image, lint_cmd, stop);
    return ParseLintResults(result.output, result.exit_code, baseline_issues);
}

}  // namespace trialbench::validation
