#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace trialbench::validation {

struct CodeMetrics {
    double score = 0.0;
    int file_count = 0;
    int total_loc = 0;
    int max_file_loc = 0;
    std::string max_file_name;
    int test_file_count = 0;
};

// Non-blank lines outside // and /* */ comments.
int CountLoc(const std::string& text);

// File organisation (0.4 max), largest file size (0.3 max) and agent-written
// tests (0.3 max), capped at 1.
double ComputeMetricsScore(const CodeMetrics& metrics);

// Walks <work_dir>/src for the given extensions (.d.ts excluded) and the whole
// workspace for test files, skipping node_modules, .git and validation-tests.
CodeMetrics RunCodeMetrics(const std::filesystem::path& work_dir, const std::vector<std::string>& extensions);

}  // namespace trialbench::validation
