#include <gtest/gtest.h>

#include "../src/analyzer/source_analyzer.hpp"
#include "../src/orchestrator/prompt_builder.hpp"

using orchestrator::FeedbackBundle;
using orchestrator::GenerationContext;
using orchestrator::PromptBuilder;

namespace {
const char *kSource = R"(int clamp(int value, int low, int high) {
  if (value < low) {
    return low;
  }
  if (value > high) {
    return high;
  }
  return value;
}
)";

GenerationContext MakeContext() {
  analyzer::SourceAnalyzer analyzer;
  auto unit = analyzer.Parse("src/clamp.c", kSource);
  GenerationContext context;
  context.target = unit.functions.at(0);
  context.source_path = "src/clamp.c";
  context.source_text = kSource;
  context.required_assertions = 3;
  return context;
}
} // namespace

TEST(PromptBuilderTest, FirstAttempt) {
  PromptBuilder builder;
  auto prompt = builder.Build(MakeContext(), std::nullopt);

  EXPECT_NE(prompt.find("TARGET FUNCTION\n  int clamp(int value, int low, int high)\n"),
            std::string::npos);
  EXPECT_NE(prompt.find("/* ==== BEGIN src/clamp.c ==== */\n" + std::string(kSource) +
                        "/* ==== END src/clamp.c ==== */"),
            std::string::npos);
  EXPECT_NE(prompt.find("SAME-FILE FUNCTIONS clamp CALLS\n- none\n"),
            std::string::npos);
  EXPECT_NE(prompt.find("STUBS (already part of the test build, do not "
                        "redefine them)\n- none\n"),
            std::string::npos);
  EXPECT_NE(prompt.find("clamp has 2 decision points: write at least 3 "
                        "assertions"),
            std::string::npos);
  EXPECT_EQ(prompt.find("NOT STUBBED"), std::string::npos);
  EXPECT_NE(prompt.find("FEEDBACK\nnone: first attempt\n"), std::string::npos);
}

TEST(PromptBuilderTest, ListsStubsAndMissingStubs) {
  auto context = MakeContext();
  models::StubSpec stub;
  stub.signature.name = "hal_read";
  stub.code = "/* stub: hal_read */\nint hal_read(int c) { return 0; }\n";
  context.stubs.push_back(stub);
  context.not_stubbed.push_back("get_callback");

  PromptBuilder builder;
  auto prompt = builder.Build(context, std::nullopt);
  EXPECT_NE(prompt.find(stub.code), std::string::npos);
  EXPECT_NE(prompt.find("hal_read"), std::string::npos);
  EXPECT_NE(prompt.find("NOT STUBBED (no stand-in exists, avoid paths that "
                        "need them)\n- get_callback\n"),
            std::string::npos);
}

TEST(PromptBuilderTest, FeedbackIsVerbatim) {
  const std::string diagnostic =
      "candidate_unit.c:14:5: error: implicit declaration of function "
      "'clamp_values' [-Werror=implicit-function-declaration]";
  FeedbackBundle feedback;
  feedback.attempt_number = 1;
  feedback.issues.push_back(models::Issue{models::IssueKind::kCompilation,
                                          models::Severity::kBlocking,
                                          diagnostic});
  feedback.issues.push_back(models::Issue{
      models::IssueKind::kInsufficientCoverage, models::Severity::kWarning,
      "1 assertions for 3 branch paths of clamp; write at least 3"});

  PromptBuilder builder;
  auto prompt = builder.Build(MakeContext(), feedback);
  EXPECT_EQ(prompt.find("none: first attempt"), std::string::npos);
  EXPECT_NE(prompt.find("FEEDBACK: attempt 1 was rejected"), std::string::npos);
  EXPECT_NE(prompt.find("- [blocking] compilation: " + diagnostic + "\n"),
            std::string::npos);
  EXPECT_NE(prompt.find("- [warning] insufficient coverage: 1 assertions for "
                        "3 branch paths of clamp; write at least 3\n"),
            std::string::npos);
  EXPECT_NE(prompt.find("FIX HINTS\n"), std::string::npos);
}

TEST(PromptBuilderTest, FixHintsAreDeduplicated) {
  std::vector<models::Issue> issues{
      {models::IssueKind::kPrecision, models::Severity::kWarning, "first"},
      {models::IssueKind::kPrecision, models::Severity::kWarning, "second"},
      {models::IssueKind::kStructure, models::Severity::kBlocking,
       "candidate does not include unity.h"},
  };
  auto hints = PromptBuilder::FixHints(issues);
  ASSERT_EQ(hints.size(), 2u);
  EXPECT_NE(hints[0].find("TEST_ASSERT_FLOAT_WITHIN"), std::string::npos);
  EXPECT_NE(hints[1].find("unity.h"), std::string::npos);
}

TEST(PromptBuilderTest, CompilationHintsFollowTheDiagnostic) {
  auto undefined = PromptBuilder::FixHints(
      {{models::IssueKind::kCompilation, models::Severity::kBlocking,
        "undefined reference to `hal_write'"}});
  ASSERT_EQ(undefined.size(), 1u);
  EXPECT_NE(undefined[0].find("listed stubs"), std::string::npos);

  auto unrelated = PromptBuilder::FixHints(
      {{models::IssueKind::kCompilation, models::Severity::kBlocking,
        "expected ';' before '}' token"}});
  EXPECT_TRUE(unrelated.empty());
}
