#include <gtest/gtest.h>

#include "validation/lint.hpp"
#include "validation/coverage.hpp"
#include "validation/test_results.hpp"

using namespace trialbench::validation;

// ─── Test output ───────────────────────────────────────────────

TEST(TestResultsTest, JUnitCountsFailuresAndErrors) {
    const std::string xml =
        "<?xml version=\"1.0\"?>\n"
        "<testsuite name=\"all\" tests=\"10\" failures=\"2\" errors=\"1\" time=\"0.4\">\n"
        "</testsuite>\n";
    const auto result = ParseTestResults(xml, 1);
    EXPECT_NEAR(result.score, 0.7, 1e-9);
    EXPECT_EQ(result.exit_code, 1);
}

TEST(TestResultsTest, JUnitWithNoTestsIsPerfect) {
    const auto score = ParseJUnitXml("<testsuites><testsuite tests=\"0\"></testsuite></testsuites>");
    ASSERT_TRUE(score.has_value());
    EXPECT_DOUBLE_EQ(*score, 1.0);
}

TEST(TestResultsTest, JUnitSkipsBareTestsuitesWrapper) {
    const std::string xml =
        "<?xml version=\"1.0\" encoding=\"utf-8\"?>"
        "<testsuites><testsuite name=\"pytest\" errors=\"1\" failures=\"2\" skipped=\"0\" tests=\"10\" "
        "time=\"0.12\" timestamp=\"2026-01-01T00:00:00\" hostname=\"box\">"
        "<testcase classname=\"test_app\" name=\"test_ok\" time=\"0.001\" />"
        "</testsuite></testsuites>";
    EXPECT_NEAR(ParseTestResults(xml, 1).score, 0.7, 1e-9);
}

TEST(TestResultsTest, JUnitUsesFirstSuiteWithTests) {
    const std::string xml =
        "<testsuites tests=\"0\">\n"
        "<testsuite name=\"empty\" tests=\"0\"></testsuite>\n"
        "<testsuite name=\"unit\" tests=\"4\" failures=\"1\" errors=\"0\"></testsuite>\n"
        "<testsuite name=\"e2e\" tests=\"4\" failures=\"4\" errors=\"0\"></testsuite>\n"
        "</testsuites>\n";
    const auto score = ParseJUnitXml(xml);
    ASSERT_TRUE(score.has_value());
    EXPECT_NEAR(*score, 0.75, 1e-9);
}

TEST(TestResultsTest, JUnitFailuresAboveTotalFloorAtZero) {
    const auto score = ParseJUnitXml("<testsuite tests=\"2\" failures=\"3\" errors=\"1\">");
    ASSERT_TRUE(score.has_value());
    EXPECT_DOUBLE_EQ(*score, 0.0);
}

TEST(TestResultsTest, NoXmlIsNullopt) {
    EXPECT_FALSE(ParseJUnitXml("Tests  3 passed (3)").has_value());
}

TEST(TestResultsTest, EmptyOutputFallsBackToExitCode) {
    EXPECT_DOUBLE_EQ(ParseTestResults("", 0).score, 1.0);
    EXPECT_DOUBLE_EQ(ParseTestResults("", 1).score, 0.0);
}

TEST(TestResultsTest, FreeTextCounts) {
    const auto result = ParseTestResults(" Tests  3 failed | 9 passed (12)\n", 1);
    EXPECT_NEAR(result.score, 0.75, 1e-9);
}

TEST(TestResultsTest, LastCountWins) {
    const std::string output =
        "suite a: 1 passing\n"
        "suite b: 4 passing\n"
        "1 failing\n";
    EXPECT_NEAR(ParseTestResults(output, 1).score, 0.8, 1e-9);
}

TEST(TestResultsTest, AnsiColoursAreIgnored) {
    const std::string output = "\x1b[32m5 passed\x1b[39m \x1b[31m5 failed\x1b[39m";
    EXPECT_NEAR(ParseTestResults(output, 1).score, 0.5, 1e-9);
}

TEST(TestResultsTest, OversizedCountIsIgnored) {
    EXPECT_NO_THROW(ParseTestResults("99999999999999999999 passed", 0));
    EXPECT_DOUBLE_EQ(ParseTestResults("99999999999999999999 passed", 0).score, 1.0);
    EXPECT_DOUBLE_EQ(ParseTestResults("99999999999999999999 passed", 2).score, 0.0);
}

TEST(TestResultsTest, CountsBeyondIntRangeAreScored) {
    const auto result = ParseTestResults("99999999999 passed, 99999999999 failed", 1);
    EXPECT_NEAR(result.score, 0.5, 1e-9);
}

TEST(TestResultsTest, HugeCountsDoNotOverflow) {
    const auto result = ParseTestResults("9223372036854775807 passed\n9223372036854775807 failed\n", 1);
    EXPECT_NEAR(result.score, 0.5, 1e-9);
}

// ─── Lint ──────────────────────────────────────────────────────

TEST(LintTest, CleanRunIsPerfect) {
    const auto result = ParseLintResults("", 0, 0);
    EXPECT_DOUBLE_EQ(result.score, 1.0);
    EXPECT_EQ(result.issues, 0);
}

TEST(LintTest, IssuesAboveBaselineCost) {
    const std::string output =
        "src/a.ts:1:1: error no-unused-vars\n"
        "src/b.ts:2:4: warning prefer-const\n"
        "src/c.ts:3:2: error semi\n";
    const auto result = ParseLintResults(output, 1, 1);
    EXPECT_EQ(result.issues, 3);
    EXPECT_EQ(result.net_new_issues, 2);
    EXPECT_NEAR(result.score, 0.8, 1e-9);
}

TEST(LintTest, ScoreFloorsAtZero) {
    std::string output;
    for (int i = 0; i < 15; ++i) {
        output += "file.ts:1:1: error bad\n";
    }
    EXPECT_DOUBLE_EQ(ParseLintResults(output, 1, 0).score, 0.0);
}

TEST(LintTest, BaselineAboveCountIsNotNegative) {
    const auto result = ParseLintResults("x.ts: warning one\n", 1, 5);
    EXPECT_EQ(result.net_new_issues, 0);
    EXPECT_DOUBLE_EQ(result.score, 1.0);
}

// ─── Coverage ──────────────────────────────────────────────────

TEST(CoverageTest, AveragesLinesAndBranches) {
    const std::string summary = R"({"total": {
        "lines": {"total": 100, "covered": 80, "pct": 80},
        "branches": {"total": 10, "covered": 6, "pct": 60},
        "functions": {"pct": 90},
        "statements": {"pct": 81}}})";
    const auto result = ParseCoverageSummary(summary);
    EXPECT_NEAR(result.score, 0.7, 1e-9);
    EXPECT_DOUBLE_EQ(result.functions, 90.0);
}

TEST(CoverageTest, MalformedSummaryThrows) {
    EXPECT_THROW(ParseCoverageSummary("not json"), std::runtime_error);
    EXPECT_THROW(ParseCoverageSummary("{\"files\": {}}"), std::runtime_error);
}
