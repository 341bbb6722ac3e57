#include "prompt_builder.hpp"

#include "../helpers/helpers.hpp"

#include <algorithm>
#include <fmt/core.h>
#include <utility>

namespace orchestrator {
namespace {
void AddHint(std::vector<std::string> &hints, std::string hint) {
  if (std::find(hints.begin(), hints.end(), hint) == hints.end()) {
    hints.push_back(std::move(hint));
  }
}

bool Mentions(const std::string &text, const char *pattern) {
  return helpers::ToLower(text).find(pattern) != std::string::npos;
}
} // namespace

std::vector<std::string>
PromptBuilder::FixHints(const std::vector<models::Issue> &issues) {
  std::vector<std::string> hints;
  for (const auto &issue : issues) {
    const auto &text = issue.description;
    switch (issue.kind) {
    case models::IssueKind::kCompilation:
      if (Mentions(text, "undefined reference") ||
          Mentions(text, "implicit declaration") ||
          Mentions(text, "undeclared")) {
        AddHint(hints, "Call only functions that exist in the source under "
                       "test or in the listed stubs, and declare nothing "
                       "else.");
      }
      if (Mentions(text, "unknown type name") ||
          Mentions(text, "incomplete type")) {
        AddHint(hints, "Use only types declared by the source under test or "
                       "the headers it includes.");
      }
      if (Mentions(text, "void value not ignored")) {
        AddHint(hints, "Do not use the result of a function that returns "
                       "void; assert on its side effects instead.");
      }
      if (Mentions(text, "redefinition") ||
          Mentions(text, "conflicting types")) {
        AddHint(hints, "Do not redefine the function under test, its "
                       "same-file helpers, or the provided stubs.");
      }
      break;
    case models::IssueKind::kStructure:
      if (Mentions(text, "unity.h")) {
        AddHint(hints, "Start the file with #include \"unity.h\".");
      }
      if (Mentions(text, "markdown")) {
        AddHint(hints, "Output plain C only, without markdown fences.");
      }
      if (Mentions(text, "never calls")) {
        AddHint(hints, "Every test must call the function under test.");
      }
      break;
    case models::IssueKind::kPrecision:
      AddHint(hints, "Compare floating point values with "
                     "TEST_ASSERT_FLOAT_WITHIN(tolerance, expected, actual).");
      break;
    case models::IssueKind::kUnrealisticValues:
      AddHint(hints, "Use distinct, realistic arguments derived from the "
                     "thresholds and ranges in the source.");
      break;
    case models::IssueKind::kInsufficientCoverage:
      AddHint(hints, "Add tests until every branch of the function is "
                     "asserted on.");
      break;
    case models::IssueKind::kIsolation:
      AddHint(hints, "Define setUp() and tearDown() and reset every stub "
                     "control variable and global in both.");
      break;
    case models::IssueKind::kConsistency:
      AddHint(hints, "Never assert the same expression both true and false "
                     "within one test.");
      break;
    case models::IssueKind::kConvention:
      AddHint(hints, "Name every test function test_<function>_<scenario>.");
      break;
    }
  }
  return hints;
}

std::string
PromptBuilder::Build(const GenerationContext &context,
                     const std::optional<FeedbackBundle> &feedback) const {
  const auto &target = context.target;
  std::string prompt;

  prompt += "You are an embedded C unit test engineer using the Unity test "
            "framework. Write a complete Unity test file for one function.\n\n";

  prompt += "TARGET FUNCTION\n";
  prompt += fmt::format("  {}\n", target.Prototype());
  prompt += fmt::format("  defined in {} at line {}\n\n", context.source_path,
                        target.line);

  prompt += fmt::format("SOURCE UNDER TEST\n/* ==== BEGIN {} ==== */\n",
                        context.source_path);
  prompt += context.source_text;
  if (!helpers::EndsWith(context.source_text, "\n")) {
    prompt += '\n';
  }
  prompt += fmt::format("/* ==== END {} ==== */\n\n", context.source_path);

  prompt += fmt::format("SAME-FILE FUNCTIONS {} CALLS\n", target.name);
  if (context.internal_callees.empty()) {
    prompt += "- none\n";
  }
  for (const auto &callee : context.internal_callees) {
    prompt += fmt::format("- {}\n", callee.Prototype());
  }
  prompt += '\n';

  prompt += "STUBS (already part of the test build, do not redefine them)\n";
  if (context.stubs.empty()) {
    prompt += "- none\n";
  } else {
    for (const auto &stub : context.stubs) {
      prompt += stub.code;
    }
    prompt += "Each stub increments <name>_stub_call_count and returns "
              "<name>_stub_return; set and reset them from the tests.\n";
  }
  if (!context.not_stubbed.empty()) {
    prompt += "NOT STUBBED (no stand-in exists, avoid paths that need them)\n";
    for (const auto &name : context.not_stubbed) {
      prompt += fmt::format("- {}\n", name);
    }
  }
  prompt += '\n';

  prompt += "RULES\n";
  prompt += "1. Output only C code. No markdown, no explanations.\n";
  prompt += "2. Begin with #include \"unity.h\". The source under test is "
            "compiled into the same translation unit: do not include its .c "
            "file and do not redefine its functions.\n";
  prompt += "3. Name every test function test_<function>_<scenario> and "
            "register each one with RUN_TEST in main().\n";
  prompt += "4. Define setUp() and tearDown(); reset every stub control "
            "variable and every global the function uses in both.\n";
  prompt += fmt::format(
      "5. {} has {} decision points: write at least {} assertions so every "
      "branch is checked.\n",
      target.name, target.decision_points, context.required_assertions);
  prompt += "6. Use distinct, realistic argument values derived from the "
            "thresholds in the source. No physically impossible values.\n";
  prompt += "7. Compare floating point values with TEST_ASSERT_FLOAT_WITHIN.\n";
  prompt += "8. Never assert the same expression both true and false in one "
            "test.\n\n";

  if (!feedback.has_value() || feedback->issues.empty()) {
    prompt += "FEEDBACK\nnone: first attempt\n";
    return prompt;
  }
  prompt += fmt::format(
      "FEEDBACK: attempt {} was rejected with these issues. Fix all of them.\n",
      feedback->attempt_number);
  for (const auto &issue : feedback->issues) {
    prompt += fmt::format("- {}\n", issue.Render());
  }
  auto hints = FixHints(feedback->issues);
  if (!hints.empty()) {
    prompt += "FIX HINTS\n";
    for (const auto &hint : hints) {
      prompt += fmt::format("- {}\n", hint);
    }
  }
  return prompt;
}

} // namespace orchestrator
