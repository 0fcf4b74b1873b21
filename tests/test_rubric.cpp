#include <gtest/gtest.h>

#include <cstdlib>
#include <deque>
#include <stop_token>

#include "providers/llm_provider.hpp"
#include "validation/rubric.hpp"

using namespace trialbench;

namespace {

// Replays canned replies in order and records every prompt.
class ScriptedProvider : public providers::LLMProvider {
public:
    explicit ScriptedProvider(std::deque<providers::LLMResponse> replies)
        : replies_(std::move(replies)) {}

    providers::LLMResponse Chat(const std::vector<providers::Message>& messages,
                                const std::string& model,
                                int,
                                double) override {
        prompts.push_back(messages.front().content);
        models.push_back(model);
        if (replies_.empty()) {
            return providers::LLMResponse{"out of replies", "error"};
        }
        auto reply = replies_.front();
        replies_.pop_front();
        return reply;
    }


    std::vector<std::string> prompts;
    std::vector<std::string> models;

private:
    std::deque<providers::LLMResponse> replies_;
};

providers::LLMResponse Reply(const std::string& content) {
    return providers::LLMResponse{content, "stop"};
}

}  // namespace

TEST(RubricTest, ParsesObjectWrappedInProse) {
    const auto reply = validation::ParseJudgeResponse("Here you go:\n```json\n{\"score\": 0.75}\n```");
    ASSERT_EQ(reply.count("score"), 1u);
    EXPECT_DOUBLE_EQ(reply.at("score"), 0.75);
}

TEST(RubricTest, ReplyWithoutObjectThrows) {
    EXPECT_THROW(validation::ParseJudgeResponse("I cannot score this."), std::runtime_error);
    EXPECT_THROW(validation::ParseJudgeResponse("{not json}"), std::runtime_error);
}

TEST(RubricTest, CriterionScorePrefersScoreKeyAndClamps) {
    EXPECT_DOUBLE_EQ(*validation::CriterionScore({{"score", 1.4}, {"clarity", 0.2}}, "clarity"), 1.0);
    EXPECT_DOUBLE_EQ(*validation::CriterionScore({{"clarity", 0.2}, {"other", 0.9}}, "clarity"), 0.2);
    EXPECT_DOUBLE_EQ(*validation::CriterionScore({{"whatever", -1.0}}, "clarity"), 0.0);
    EXPECT_FALSE(validation::CriterionScore({{"a", 0.1}, {"b", 0.2}}, "clarity").has_value());
}

TEST(RubricTest, MedianOfOddAndEvenSamples) {
    EXPECT_DOUBLE_EQ(validation::MedianScore({0.9, 0.1, 0.5}), 0.5);
    EXPECT_DOUBLE_EQ(validation::MedianScore({0.2, 0.4, 0.6, 1.0}), 0.5);
}

TEST(RubricTest, WeightedAcrossScoredCriteria) {
    const std::vector<config::RubricCriterion> rubric{{"correctness", 2.0}, {"style", 1.0}, {"docs", 1.0}};
    const auto score = validation::ComputeRubricScore(rubric, {{"correctness", 0.9}, {"style", 0.3}});
    ASSERT_TRUE(score.has_value());
    EXPECT_NEAR(*score, (2.0 * 0.9 + 0.3) / 3.0, 1e-9);
    EXPECT_FALSE(validation::ComputeRubricScore(rubric, {}).has_value());
}

TEST(RubricTest, LongDiffIsTruncatedWithMarker) {
    const std::string diff(validation::kMaxDiffChars + 10, 'x');
    const auto truncated = validation::TruncateDiff(diff);
    EXPECT_NE(truncated.find("diff truncated"), std::string::npos);
    EXPECT_LT(truncated.size(), diff.size() + 100);
    EXPECT_EQ(validation::TruncateDiff("small"), "small");
}

TEST(RubricTest, JudgeKeepsMedianPerCriterion) {
    ScriptedProvider provider({Reply("{\"score\": 0.2}"), Reply("{\"score\": 0.9}"), Reply("{\"score\": 0.6}"),
                               Reply("{\"score\": 1.0}"), Reply("garbage"), Reply("{\"score\": 0.4}")});
    validation::LLMRubricJudge judge(provider, {"judge-model", 3});
    const std::vector<config::RubricCriterion> rubric{{"correctness", 1.0}, {"style", 1.0}};

    const auto scores = judge.Judge(rubric, "diff --git a/x b/x", "Add a feature", {});
    ASSERT_EQ(scores.size(), 2u);
    EXPECT_DOUBLE_EQ(scores.at("correctness"), 0.6);
    EXPECT_DOUBLE_EQ(scores.at("style"), 0.7);
    ASSERT_EQ(provider.prompts.size(), 6u);
    EXPECT_NE(provider.prompts.front().find("Add a feature"), std::string::npos);
    EXPECT_NE(provider.prompts.back().find("style"), std::string::npos);
    EXPECT_EQ(provider.models.front(), "judge-model");
}

TEST(RubricTest, UnscorableCriterionIsAbsent) {
    ScriptedProvider provider({providers::LLMResponse{"boom", "error"}, Reply("{\"score\": 0.5}")});
    validation::LLMRubricJudge judge(provider, {"m", 1});
    const auto scores = judge.Judge({{"a", 1.0}, {"b", 1.0}}, "diff", "task", {});
    EXPECT_EQ(scores.count("a"), 0u);
    EXPECT_DOUBLE_EQ(scores.at("b"), 0.5);
}

TEST(RubricTest, JudgeStopsWhenCancelled) {
    ScriptedProvider provider({Reply("{\"score\": 0.5}")});
    validation::LLMRubricJudge judge(provider, {"m", 1});
    std::stop_source source;
    source.request_stop();
    EXPECT_THROW(judge.Judge({{"a", 1.0}}, "diff", "task", source.get_token()), std::runtime_error);
    EXPECT_TRUE(provider.prompts.empty());
}

// ─── Judge credentials ─────────────────────────────────────────

class JudgeSettingsTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* name : {"ANTHROPIC_API_KEY", "GEMINI_API_KEY", "NVIDIA_API_KEY", "OPENAI_BASE_URL",
                                 "JUDGE_MODEL"}) {
            unsetenv(name);
        }
    }
};

TEST_F(JudgeSettingsTest, GatewayWinsWhenAnthropicKeyPresent) {
    const auto settings = providers::ResolveJudgeSettings(
        {{"ANTHROPIC_API_KEY", "sk-a"}, {"GEMINI_API_KEY", "g"}}, "http://localhost:4000/", "");
    EXPECT_EQ(settings.api_base, "http://localhost:4000/v1");
    EXPECT_EQ(settings.api_key, "sk-a");
    EXPECT_EQ(settings.style, providers::ApiStyle::kAnthropic);
}

TEST_F(JudgeSettingsTest, GeminiThenNvidiaThenDirectAnthropic) {
    auto settings = providers::ResolveJudgeSettings({{"ANTHROPIC_API_KEY", "sk-a"}, {"GEMINI_API_KEY", "g"}}, "", "");
    EXPECT_EQ(settings.api_key, "g");
    EXPECT_EQ(settings.style, providers::ApiStyle::kOpenAI);

    settings = providers::ResolveJudgeSettings({{"NVIDIA_API_KEY", "n"}}, "", "");
    EXPECT_EQ(settings.api_base, "https://integrate.api.nvidia.com/v1");
    EXPECT_EQ(settings.model, "meta/llama-3.3-70b-instruct");

    settings = providers::ResolveJudgeSettings({{"ANTHROPIC_API_KEY", "sk-a"}}, "", "");
    EXPECT_EQ(settings.api_base, "https://api.anthropic.com/v1");
}

TEST_F(JudgeSettingsTest, ModelOverrideBeatsJudgeModel) {
    auto settings = providers::ResolveJudgeSettings({{"GEMINI_API_KEY", "g"}, {"JUDGE_MODEL", "env-model"}}, "", "");
    EXPECT_EQ(settings.model, "env-model");
    settings = providers::ResolveJudgeSettings({{"GEMINI_API_KEY", "g"}, {"JUDGE_MODEL", "env-model"}}, "", "cfg");
    EXPECT_EQ(settings.model, "cfg");
}

TEST_F(JudgeSettingsTest, NoCredentialsIsUnusable) {
    EXPECT_FALSE(providers::ResolveJudgeSettings({}, "http://localhost:1", "").Usable());
}
