#include <gtest/gtest.h>

#include "../src/analyzer/codebase.hpp"
#include "../src/analyzer/source_analyzer.hpp"
#include "../src/orchestrator/generation_orchestrator.hpp"
#include "test_fakes.hpp"

using orchestrator::GenerationOrchestrator;
using test_fakes::ScriptedProvider;

namespace {
analyzer::Codebase MakeCodebase() {
  analyzer::SourceAnalyzer source_analyzer;
  std::vector<models::SourceUnit> units;
  units.push_back(source_analyzer.Parse("src/limits.c",
                                 "/* contact: owner@example.com */\n" +
                                     std::string(test_fakes::kClampSource)));
  return analyzer::Codebase::Build(std::move(units));
}
} // namespace

TEST(GenerationOrchestratorTest, PrepareContextCarriesSourceAndRequirements) {
  auto codebase = MakeCodebase();
  ScriptedProvider provider({{"unused", std::nullopt}});
  GenerationOrchestrator orchestrator(provider, false);

  const auto *target = codebase.FindFunction({"src/limits.c", "clamp"});
  ASSERT_NE(target, nullptr);
  auto deps = codebase.CollectExternalDependencies(target->GetId());
  auto context = orchestrator.PrepareContext(codebase, *target, deps, {}, 3);

  EXPECT_EQ(context.source_path, "src/limits.c");
  EXPECT_NE(context.source_text.find("owner@example.com"), std::string::npos);
  EXPECT_EQ(context.required_assertions, 3);
  EXPECT_TRUE(context.stubs.empty());
}

TEST(GenerationOrchestratorTest, RedactionHidesComments) {
  auto codebase = MakeCodebase();
  ScriptedProvider provider({{"unused", std::nullopt}});
  GenerationOrchestrator orchestrator(provider, true);

  const auto *target = codebase.FindFunction({"src/limits.c", "clamp"});
  ASSERT_NE(target, nullptr);
  auto context =
      orchestrator.PrepareContext(codebase, *target, {}, {}, 3);
  EXPECT_EQ(context.source_text.find("owner@example.com"), std::string::npos);
  EXPECT_NE(context.source_text.find("[COMMENT REDACTED]"), std::string::npos);
  EXPECT_NE(context.source_text.find("int clamp(int value, int low, int high)"),
            std::string::npos);
}

TEST(GenerationOrchestratorTest, GenerateMakesOneCallAndPostProcesses) {
  ScriptedProvider provider(
      {{"```c\nvoid test_clamp_low(void) {\n"
        "  TEST_ASSERT_EQUAL_INT(0, clamp(-1, 0, 5));\n}\n```\n",
        std::nullopt}});
  GenerationOrchestrator orchestrator(provider, false);

  auto candidate = orchestrator.Generate("PROMPT");
  EXPECT_EQ(provider.Prompts(), (std::vector<std::string>{"PROMPT"}));
  EXPECT_EQ(candidate.rfind("#include \"unity.h\"\n", 0), 0u);
  EXPECT_EQ(candidate.find("```"), std::string::npos);
  EXPECT_NE(candidate.find("RUN_TEST(test_clamp_low);"), std::string::npos);
}

TEST(GenerationOrchestratorTest, ReplyWithoutCodeIsMalformed) {
  ScriptedProvider provider({{"```\n```\n", std::nullopt}});
  GenerationOrchestrator orchestrator(provider, false);
  try {
    orchestrator.Generate("PROMPT");
    FAIL() << "expected a provider error";
  } catch (const errors::ProviderError &e) {
    EXPECT_EQ(e.GetKind(), errors::ProviderErrorKind::kMalformedResponse);
  }
}

TEST(GenerationOrchestratorTest, ProviderErrorsPropagate) {
  ScriptedProvider provider(
      {{"slow down", errors::ProviderErrorKind::kRateLimited}});
  GenerationOrchestrator orchestrator(provider, false);
  EXPECT_THROW(orchestrator.Generate("PROMPT"), errors::ProviderError);
  EXPECT_EQ(provider.Prompts().size(), 1u);
}
