#include "validation/code_metrics.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

#include "utils/common.hpp"

namespace trialbench::validation {
namespace {

namespace fs = std::filesystem;

bool IsSkippedDir(const std::string& name) {
    return name == "node_modules" || name == ".git" || name == "validation-tests";
}

bool IsTestFile(const fs::path& rel) {
    const auto name = rel.filename().string();
    const auto ext = utils::ToLower(rel.extension().string());
    if (ext != ".ts" && ext != ".js" && ext != ".tsx" && ext != ".jsx") {
        return false;
    }
    return rel.string().find("__tests__") != std::string::npos ||
        name.find(".test.") != std::string::npos || name.find(".spec.") != std::string::npos;
}

std::string ReadFile(const fs::path& path) {
    std::ifstream input(path);
    std::ostringstream stream;
    stream << input.rdbuf();
    return stream.str();
}

}  // namespace

int CountLoc(const std::string& text) {
    int count = 0;
    bool in_block = false;
    for (const auto& raw : utils::SplitLines(text)) {
        const auto line = utils::Trim(raw);
        if (line.empty()) {
            continue;
        }
        if (in_block) {
            if (line.find("*/") != std::string::npos) {
                in_block = false;
            }
            continue;
        }
        if (utils::StartsWith(line, "/*")) {
            in_block = line.find("*/", 2) == std::string::npos;
            continue;
        }
        if (utils::StartsWith(line, "//")) {
            continue;
        }
        ++count;
    }
    return count;
}

double ComputeMetricsScore(const CodeMetrics& metrics) {
    double score = 0.0;
    if (metrics.file_count >= 3) {
        score += 0.4;
    } else if (metrics.file_count == 2) {
        score += 0.3;
    } else if (metrics.file_count == 1) {
        score += 0.1;
    }

    if (metrics.max_file_loc <= 200) {
        score += 0.3;
    } else if (metrics.max_file_loc <= 500) {
        score += 0.2;
    } else if (metrics.max_file_loc <= 800) {
        score += 0.1;
    }

    if (metrics.test_file_count >= 3) {
        score += 0.3;
    } else if (metrics.test_file_count >= 1) {
        score += 0.2;
    }
    return std::min(score, 1.0);
}

CodeMetrics RunCodeMetrics(const fs::path& work_dir, const std::vector<std::string>& extensions) {
    CodeMetrics metrics{};
    std::error_code ec;

    const auto src_dir = work_dir / "src";
    if (fs::is_directory(src_dir, ec)) {
        for (auto it = fs::recursive_directory_iterator(src_dir, ec); it != fs::recursive_directory_iterator();
             it.increment(ec)) {
            if (ec) {
                break;
            }
            if (it->is_directory() && IsSkippedDir(it->path().filename().string())) {
                it.disable_recursion_pending();
                continue;
            }
            if (!it->is_regular_file()) {
                continue;
            }
            const auto name = it->path().filename().string();
            const auto ext = utils::ToLower(it->path().extension().string());
            if (utils::EndsWith(name, ".d.ts") ||
                std::find(extensions.begin(), extensions.end(), ext) == extensions.end()) {
                continue;
            }
            const int loc = CountLoc(ReadFile(it->path()));
            ++metrics.file_count;
            metrics.total_loc += loc;
            if (loc > metrics.max_file_loc) {
                metrics.max_file_loc = loc;
                metrics.max_file_name = fs::relative(it->path(), work_dir).string();
            }
        }
    }

    for (auto it = fs::recursive_directory_iterator(work_dir, ec); it != fs::recursive_directory_iterator();
         it.increment(ec)) {
        if (ec) {
            break;
        }
        if (it->is_directory()) {
            if (IsSkippedDir(it->path().filename().string())) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (it->is_regular_file() && IsTestFile(fs::relative(it->path(), work_dir))) {
            ++metrics.test_file_count;
        }
    }

    metrics.score = ComputeMetricsScore(metrics);
    return metrics;
}

}  // namespace trialbench::validation
