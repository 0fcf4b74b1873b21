#pragma once

#include <filesystem>
#include <stop_token>
#include <string>

#include "validation/validation_runner.hpp"

namespace trialbench::validation {

struct CoverageResult {
    double score = 0.0;
    // Percentages, 0-100.
    double lines = 0.0;
    double branches = 0.0;
    double functions = 0.0;
    double statements = 0.0;
};

// Reads an istanbul json-summary document. score = (lines + branches) / 200,
// capped at 1. Throws std::runtime_error on malformed input.
CoverageResult ParseCoverageSummary(const std::string& json_text);

// Runs install then the coverage command, then reads
// <work_dir>/coverage/coverage-summary.json.
CoverageResult RunCoverage(ValidationRunner& runner,
                           const std::filesystem::path& work_dir,
                           const std::string& image,
                           const std::string& install_cmd,
                           const std::string& coverage_cmd,
                           std::stop_token stop);

}  // namespace trialbench::validation
