#include "post_processor.hpp"

#include "../helpers/helpers.hpp"

#include <algorithm>
#include <array>
#include <regex>
#include <utility>

namespace orchestrator {
namespace {
const std::array<std::pair<const char *, const char *>, 5> kMacroFixes{{
    {"TEST_ASSERT_GREATER_THAN_EQUAL_INT", "TEST_ASSERT_GREATER_OR_EQUAL_INT"},
    {"TEST_ASSERT_LESS_THAN_EQUAL_INT", "TEST_ASSERT_LESS_OR_EQUAL_INT"},
    {"TEST_ASSERT_GREATER_THAN_OR_EQUAL_INT",
     "TEST_ASSERT_GREATER_OR_EQUAL_INT"},
    {"TEST_ASSERT_LESS_THAN_OR_EQUAL_INT", "TEST_ASSERT_LESS_OR_EQUAL_INT"},
    {"TEST_ASSERT_EQUAL_STR", "TEST_ASSERT_EQUAL_STRING"},
}};
} // namespace

std::string PostProcessor::StripFences(const std::string &text) {
  std::string result;
  for (const auto &line : helpers::SplitLines(text)) {
    if (helpers::StartsWith(helpers::SkipWhite(line), "```")) {
      continue;
    }
    result += line;
    result += '\n';
  }
  return result;
}

std::vector<std::string> PostProcessor::TestFunctions(const std::string &text) {
  static const std::regex kTestFunction(
      R"(\bvoid\s+(test_\w+)\s*\(\s*(void)?\s*\)\s*\{)");
  std::vector<std::string> names;
  for (auto it = std::sregex_iterator(text.begin(), text.end(), kTestFunction);
       it != std::sregex_iterator(); ++it) {
    auto name = (*it)[1].str();
    if (std::find(names.begin(), names.end(), name) == names.end()) {
      names.push_back(name);
    }
  }
  return names;
}

bool PostProcessor::HasMain(const std::string &text) {
  static const std::regex kMain(R"(\bint\s+main\s*\([^)]*\)\s*\{)");
  return std::regex_search(text, kMain);
}

std::string PostProcessor::Process(const std::string &candidate) const {
  std::string code = StripFences(candidate);

  for (const auto &[wrong, right] : kMacroFixes) {
    code = std::regex_replace(
        code, std::regex(std::string("\\b") + wrong + "\\b"), right);
  }

  static const std::regex kUnityInclude(R"(#\s*include\s*[<"]unity\.h[">])");
  if (!std::regex_search(code, kUnityInclude)) {
    code = "#include \"unity.h\"\n" + code;
  }

  auto tests = TestFunctions(code);
  if (!tests.empty() && !HasMain(code)) {
    code += "\nint main(void) {\n  UNITY_BEGIN();\n";
    for (const auto &test : tests) {
      code += "  RUN_TEST(" + test + ");\n";
    }
    code += "  return UNITY_END();\n}\n";
  }
  return code;
}

} // namespace orchestrator
