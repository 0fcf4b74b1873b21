#include "validation/coverage.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "nlohmann/json.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace trialbench::validation {
namespace {

double Pct(const nlohmann::json& total, const char* key) {
    if (!total.contains(key) || !total[key].is_object()) {
        return 0.0;
    }
    const auto& detail = total[key];
    if (detail.contains("pct") && detail["pct"].is_number()) {
        return detail["pct"].get<double>();
    }
    return 0.0;
}

}  // namespace

CoverageResult ParseCoverageSummary(const std::string& json_text) {
    const auto json = nlohmann::json::parse(json_text, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        throw std::runtime_error("parsing coverage summary: invalid JSON");
    }
    if (!json.contains("total") || !json["total"].is_object()) {
        throw std::runtime_error("parsing coverage summary: missing total");
    }
    const auto& total = json["total"];
    CoverageResult result{};
    result.lines = Pct(total, "lines");
    result.branches = Pct(total, "branches");
    result.functions = Pct(total, "functions");
    result.statements = Pct(total, "statements");
    result.score = std::min(1.0, (result.lines + result.branches) / 200.0);
    return result;
}

CoverageResult RunCoverage(ValidationRunner& runner,
                           const std::filesystem::path& work_dir,
                           const std::string& image,
                           const std::string& install_cmd,
                           const std::string& coverage_cmd,
                           std::stop_token stop) {
    const auto summary_path = work_dir / "coverage" / "coverage-summary.json";
    std::error_code ec;
    std::filesystem::remove(summary_path, ec);

    if (!install_cmd.empty()) {
        const auto installed = runner.RunInImage(work_dir, image, install_cmd, stop);
        if (!installed.Ok()) {
            throw std::runtime_error("install for coverage exited " + std::to_string(installed.exit_code));
        }
    }
    const auto ran = runner.RunInImage(work_dir, image, coverage_cmd, stop);
    if (!ran.Ok()) {
        utils::LogLine(utils::LogLevel::kDebug, "validation") << "coverage command exited " << ran.exit_code;
    }

    std::ifstream input(summary_path);
    if (!input.is_open()) {
        throw std::runtime_error("reading coverage summary " + summary_path.string());
    }
    std::ostringstream stream;
    stream << input.rdbuf();
    return ParseCoverageSummary(stream.str());
}

}  // namespace trialbench::validation
