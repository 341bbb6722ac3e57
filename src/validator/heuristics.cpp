#include "heuristics.hpp"

#include "../analyzer/names.hpp"
#include "../analyzer/source_analyzer.hpp"
#include "../errors/errors.hpp"
#include "../helpers/helpers.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fmt/core.h>
#include <fmt/format.h>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <regex>
#include <set>

namespace validator {
namespace {
using models::Issue;
using models::IssueKind;
using models::Severity;

bool IsIdentifierChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

// True if text[0, end) closes with a type a declarator could follow,
// e.g. "extern int " or "uint8_t " or "char *".
bool EndsWithDeclarationType(const std::string &text, std::size_t end) {
  bool pointer = false;
  while (end > 0 && (std::isspace(static_cast<unsigned char>(text[end - 1])) ||
                     text[end - 1] == '*')) {
    pointer = pointer || text[end - 1] == '*';
    end--;
  }
  std::size_t begin = end;
  while (begin > 0 && IsIdentifierChar(text[begin - 1])) {
    begin--;
  }
  if (begin == end || std::isdigit(static_cast<unsigned char>(text[begin]))) {
    return false;
  }
  auto kind = analyzer::ParseNameToken(text.substr(begin, end - begin));
  if (pointer) {
    return kind == analyzer::NameKind::kType ||
           kind == analyzer::NameKind::kQualifier;
  }
  return !kind.has_value() || kind == analyzer::NameKind::kType ||
         kind == analyzer::NameKind::kQualifier ||
         kind == analyzer::NameKind::kStorage;
}

// Finds "name(" at identifier boundaries, not preceded by '.' or "->" and
// not declared by a preceding type.
std::vector<std::size_t> FindInvocations(const std::string &text,
                                         const std::string &name) {
  std::vector<std::size_t> result;
  std::size_t pos = 0;
  while ((pos = text.find(name, pos)) != std::string::npos) {
    std::size_t end = pos + name.size();
    bool starts = pos == 0 || !IsIdentifierChar(text[pos - 1]);
    bool ends = end >= text.size() || !IsIdentifierChar(text[end]);
    std::size_t before = pos;
    while (before > 0 && std::isspace(static_cast<unsigned char>(text[before - 1]))) {
      before--;
    }
    bool member = before > 0 && (text[before - 1] == '.' ||
                                 (before > 1 && text[before - 1] == '>' &&
                                  text[before - 2] == '-'));
    std::size_t open = end;
    while (open < text.size() &&
           std::isspace(static_cast<unsigned char>(text[open]))) {
      open++;
    }
    if (starts && ends && !member && open < text.size() && text[open] == '(' &&
        !EndsWithDeclarationType(text, pos)) {
      result.push_back(open);
    }
    pos = end;
  }
  return result;
}

// Splits the balanced argument list starting at the '(' at open.
std::vector<std::string> SplitArguments(const std::string &text,
                                        std::size_t open) {
  std::vector<std::string> args;
  std::string current;
  int depth = 0;
  for (std::size_t i = open; i < text.size(); ++i) {
    char c = text[i];
    if (c == '(' || c == '[' || c == '{') {
      if (depth++ == 0) {
        continue;
      }
    } else if (c == ')' || c == ']' || c == '}') {
      if (--depth == 0) {
        break;
      }
    } else if (c == ',' && depth == 1) {
      args.push_back(helpers::CollapseWhitespace(current));
      current.clear();
      continue;
    }
    current.push_back(c);
  }
  auto last = helpers::CollapseWhitespace(current);
  if (!last.empty() || !args.empty()) {
    args.push_back(last);
  }
  return args;
}

bool IsZeroLiteral(const std::string &arg) {
  static const std::regex kZero(
      R"(\(?\s*[+-]?(0+(\.0*)?|\.0+)[uUlLfF]*\s*\)?|NULL|false)");
  return std::regex_match(arg, kZero);
}

int CountAssertions(const std::string &text) {
  static const std::regex kAssertion(R"(\bTEST_ASSERT\w*\s*\()");
  return static_cast<int>(
      std::distance(std::sregex_iterator(text.begin(), text.end(), kAssertion),
                    std::sregex_iterator()));
}

std::vector<std::string> ImpossibleLiterals(const std::string &text) {
  static const std::regex kLiteral(
      R"((-\s*273\.15[fF]?)|\b(\d+(\.\d*)?[eE]\+?(\d+))[fFlL]?\b)");
  std::vector<std::string> found;
  for (auto it = std::sregex_iterator(text.begin(), text.end(), kLiteral);
       it != std::sregex_iterator(); ++it) {
    const auto &match = *it;
    if (match[1].matched) {
      found.push_back(helpers::CollapseWhitespace(match[1].str()));
      continue;
    }
    if (match[4].matched && std::atoi(match[4].str().c_str()) >= 10) {
      found.push_back(match[2].str());
    }
  }
  return found;
}

std::vector<std::string> RegisteredTests(const std::string &text) {
  static const std::regex kRunTest(R"(\bRUN_TEST\s*\(\s*(\w+))");
  std::vector<std::string> names;
  for (auto it = std::sregex_iterator(text.begin(), text.end(), kRunTest);
       it != std::sregex_iterator(); ++it) {
    names.push_back((*it)[1].str());
  }
  return names;
}

bool IsHarnessFunction(const std::string &name) {
  return name == "main" || name == "setUp" || name == "tearDown" ||
         name == "suiteSetUp" || name == "suiteTearDown";
}

void CheckStructure(const std::string &raw, const std::string &code,
                    const std::vector<models::FunctionSignature> &functions,
                    const models::FunctionSignature &target, int test_count,
                    std::vector<Issue> &issues) {
  if (raw.find("```") != std::string::npos) {
    issues.push_back({IssueKind::kStructure, Severity::kBlocking,
                      "candidate contains markdown code fences"});
  }
  static const std::regex kUnityInclude(R"(#\s*include\s*[<"]unity\.h[">])");
  if (!std::regex_search(raw, kUnityInclude)) {
    issues.push_back({IssueKind::kStructure, Severity::kBlocking,
                      "candidate does not include unity.h"});
  }
  if (test_count == 0) {
    issues.push_back({IssueKind::kStructure, Severity::kBlocking,
                      "candidate defines no test_ functions"});
    return;
  }
  bool called = std::any_of(
      functions.begin(), functions.end(),
      [&target](const models::FunctionSignature &function) {
        return function.calls.count(target.name) != 0;
      });
  if (!called && FindInvocations(code, target.name).empty()) {
    issues.push_back({IssueKind::kStructure, Severity::kBlocking,
                      fmt::format("candidate never calls {}", target.name)});
  }
}

void CheckRealism(const std::string &code,
                  const models::FunctionSignature &target,
                  std::vector<Issue> &issues) {
  for (const auto &literal : ImpossibleLiterals(code)) {
    issues.push_back(
        {IssueKind::kUnrealisticValues, Severity::kBlocking,
         fmt::format("physically impossible literal {}", literal)});
  }

  if (target.parameters.empty()) {
    return;
  }
  auto calls = CallArguments(code, target.name);
  if (calls.empty()) {
    return;
  }
  bool all_zero = std::all_of(
      calls.begin(), calls.end(), [](const std::vector<std::string> &args) {
        return !args.empty() &&
               std::all_of(args.begin(), args.end(), IsZeroLiteral);
      });
  if (all_zero) {
    issues.push_back(
        {IssueKind::kUnrealisticValues, Severity::kBlocking,
         fmt::format("every call of {} passes only zero arguments",
                     target.name)});
    return;
  }
  if (calls.size() >= 2 &&
      std::all_of(calls.begin(), calls.end(),
                  [&calls](const std::vector<std::string> &args) {
                    return args == calls.front();
                  })) {
    issues.push_back(
        {IssueKind::kUnrealisticValues, Severity::kBlocking,
         fmt::format("all {} calls of {} use the same arguments ({})",
                     calls.size(), target.name,
                     fmt::join(calls.front(), ", "))});
  }
}

void CheckConsistency(const models::FunctionSignature &function,
                      std::vector<Issue> &issues) {
  auto body = StripCommentsAndStrings(function.body);
  auto collect = [&body](const char *macro) {
    std::set<std::string> expressions;
    for (const auto &args : CallArguments(body, macro)) {
      if (!args.empty()) {
        expressions.insert(args.front());
      }
    }
    return expressions;
  };
  auto asserted_true = collect("TEST_ASSERT_TRUE");
  auto asserted_false = collect("TEST_ASSERT_FALSE");
  for (const auto &expression : asserted_true) {
    if (asserted_false.count(expression) != 0) {
      issues.push_back(
          {IssueKind::kConsistency, Severity::kBlocking,
           fmt::format("{} asserts {} both true and false", function.name,
                       expression)});
    }
  }
}
std::string Lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return text;
}

bool ContainsAny(const std::string &text,
                 std::initializer_list<const char *> words) {
  return std::any_of(words.begin(), words.end(), [&text](const char *word) {
    return text.find(word) != std::string::npos;
  });
}

void CheckEdgeCases(const std::vector<models::FunctionSignature> &functions,
                    const models::FunctionSignature &target,
                    std::vector<Issue> &issues) {
  int tests = 0;
  bool named_for_edge = false;
  for (const auto &function : functions) {
    if (!helpers::StartsWith(function.name, "test_")) {
      continue;
    }
    tests++;
    named_for_edge =
        named_for_edge ||
        ContainsAny(Lower(function.name),
                    {"min", "max", "zero", "negative", "boundary", "edge",
                     "limit", "low", "high", "below", "above", "under",
                     "over", "empty", "null", "invalid", "error", "fail"});
  }
  if (tests > 1 && !named_for_edge) {
    issues.push_back(
        {IssueKind::kInsufficientCoverage, Severity::kWarning,
         fmt::format("no test of {} is named for an edge case (min, max, "
                     "zero, negative, boundary)",
                     target.name)});
  }
}

void CheckStubResets(const std::string &code,
                     const std::vector<models::FunctionSignature> &functions,
                     const std::vector<std::string> &stub_names,
                     std::vector<Issue> &issues) {
  auto tear_down = std::find_if(
      functions.begin(), functions.end(),
      [](const models::FunctionSignature &f) { return f.name == "tearDown"; });
  if (tear_down == functions.end()) {
    return;
  }
  auto body = StripCommentsAndStrings(tear_down->body);
  for (const auto &name : stub_names) {
    if (name.empty() || code.find(name + "_stub_") == std::string::npos) {
      continue;
    }
    std::regex reset("\\b" + name + R"(_stub_call_count\s*=\s*0[uU]?\s*;)");
    if (!std::regex_search(body, reset)) {
      issues.push_back({IssueKind::kIsolation, Severity::kWarning,
                        fmt::format("tearDown does not reset {}_stub_call_count",
                                    name)});
    }
  }
}

std::optional<long long> IntegerLiteral(const std::string &text) {
  static const std::regex kInteger(
      R"(\(?\s*([+-]?)\s*(0[xX][0-9a-fA-F]{1,15}|\d{1,18})[uUlL]*\s*\)?)");
  std::smatch match;
  if (!std::regex_match(text, match, kInteger)) {
    return std::nullopt;
  }
  long long value = std::strtoll(match[2].str().c_str(), nullptr, 0);
  return match[1].str() == "-" ? -value : value;
}

void CheckAssertedLiterals(const std::string &code,
                           std::vector<Issue> &issues) {
  static const std::regex kEqual(
      R"(\bTEST_ASSERT_EQUAL(_U?INT(8|16|32|64)?|_HEX(8|16|32|64)?)?\s*\()");
  for (auto it = std::sregex_iterator(code.begin(), code.end(), kEqual);
       it != std::sregex_iterator(); ++it) {
    auto open = static_cast<std::size_t>(it->position(0) + it->length(0) - 1);
    auto args = SplitArguments(code, open);
    if (args.size() < 2) {
      continue;
    }
    auto expected = IntegerLiteral(args[0]);
    auto actual = IntegerLiteral(args[1]);
    if (!expected.has_value() || !actual.has_value()) {
      continue;
    }
    auto distance = *expected > *actual ? *expected - *actual
                                        : *actual - *expected;
    if (distance > 1000) {
      auto macro = it->str(0);
      macro.pop_back();
      issues.push_back(
          {IssueKind::kConsistency, Severity::kWarning,
           fmt::format("{}({}, {}) compares literals {} apart",
                       helpers::Trim(macro), args[0], args[1], distance)});
    }
  }
}

// Hardware idioms in the target that a host test has to simulate.
void CheckEmbeddedFeatures(const std::string &code,
                           const std::vector<models::FunctionSignature> &functions,
                           const models::FunctionSignature &target,
                           const std::string &unit_text,
                           std::vector<Issue> &issues) {
  auto source = StripCommentsAndStrings(target.declaration + "\n" + target.body);
  auto tests = Lower(code);
  std::string test_names;
  for (const auto &function : functions) {
    if (helpers::StartsWith(function.name, "test_")) {
      test_names += Lower(function.name) + '\n';
    }
  }
  auto note = [&issues, &target](const char *what) {
    issues.push_back({IssueKind::kInsufficientCoverage, Severity::kNote,
                      fmt::format("{} {}", target.name, what)});
  };

  static const std::regex kVolatile(R"(\bvolatile\b)");
  if (std::regex_search(source, kVolatile) &&
      !std::regex_search(code, kVolatile)) {
    note("reads volatile storage but no test declares volatile data");
  }

  static const std::regex kBitField(
      R"(\b(unsigned|signed|int|_Bool|bool|u?int(8|16|32|64)_t)\s+\w+\s*:\s*\d+\s*;)");
  static const std::regex kMemberAccess(R"((\.|->)\s*[A-Za-z_])");
  static const std::regex kBitOperation(
      R"(<<|>>|~|\^|&=|\|=|[\w)\]]\s*&\s*[\w(]|[^|]\|[^|])");
  if (std::regex_search(StripCommentsAndStrings(unit_text), kBitField) &&
      std::regex_search(source, kMemberAccess) &&
      !std::regex_search(code, kBitOperation)) {
    note("works on bit-fields but no test uses bit operations");
  }

  static const std::regex kStateSwitch(R"(\bswitch\s*\([^)]*state)",
                                       std::regex::icase);
  if (std::regex_search(source, kStateSwitch) &&
      !ContainsAny(tests, {"transition", "next_state", "state_change"}) &&
      test_names.find("state") == std::string::npos) {
    note("switches on a state but no test checks a state transition");
  }

  static const std::regex kWatchdog(R"(watchdog|(^|[^A-Za-z])wdt)",
                                    std::regex::icase);
  if (std::regex_search(source, kWatchdog) &&
      !ContainsAny(tests, {"timeout", "feed", "kick", "refresh", "expire"})) {
    note("services a watchdog but no test covers feeding or timeout");
  }

  static const std::regex kInterrupt(R"(interrupt|(^|[^A-Za-z])(dma|irq|isr))",
                                     std::regex::icase);
  if (std::regex_search(source, kInterrupt) &&
      !ContainsAny(tests, {"_stub_", "register", "peripheral", "mock"})) {
    note("handles DMA or interrupts but no test simulates the hardware");
  }

  static const std::regex kRegisterAddress(
      R"(\(\s*(const\s+)?volatile\b[^()]*\*\s*\)\s*\(?\s*0[xX][0-9a-fA-F]+)");
  static const std::regex kRegisterUse(R"(\bvolatile\b|reg)");
  if (std::regex_search(source, kRegisterAddress) &&
      !std::regex_search(tests, kRegisterUse)) {
    note("accesses registers at fixed addresses but no test inspects "
         "register state");
  }
}
} // namespace

int RequiredAssertions(const models::FunctionSignature &target,
                       int min_assertions) {
  return std::max(min_assertions, target.decision_points + 1);
}

std::string StripCommentsAndStrings(const std::string &text) {
  std::string result;
  result.reserve(text.size());
  std::size_t i = 0;
  while (i < text.size()) {
    char c = text[i];
    if (c == '/' && i + 1 < text.size() && text[i + 1] == '*') {
      auto end = text.find("*/", i + 2);
      i = end == std::string::npos ? text.size() : end + 2;
      result.push_back(' ');
      continue;
    }
    if (c == '/' && i + 1 < text.size() && text[i + 1] == '/') {
      while (i < text.size() && text[i] != '\n') {
        i++;
      }
      continue;
    }
    if (c == '"' || c == '\'') {
      result.push_back(c);
      i++;
      while (i < text.size() && text[i] != c && text[i] != '\n') {
        if (text[i] == '\\') {
          i++;
        }
        i++;
      }
      if (i < text.size() && text[i] == c) {
        result.push_back(c);
        i++;
      }
      continue;
    }
    result.push_back(c);
    i++;
  }
  return result;
}

std::vector<std::vector<std::string>> CallArguments(const std::string &text,
                                                    const std::string &name) {
  std::vector<std::vector<std::string>> calls;
  for (auto open : FindInvocations(text, name)) {
    calls.push_back(SplitArguments(text, open));
  }
  return calls;
}

HeuristicReport RunHeuristics(const models::FunctionSignature &target,
                              const std::string &candidate,
                              bool has_external_state,
                              const HeuristicSettings &settings,
                              const TargetEnvironment &environment) {
  HeuristicReport report;
  auto code = StripCommentsAndStrings(candidate);

  std::vector<models::FunctionSignature> functions;
  try {
    functions =
        analyzer::SourceAnalyzer().Parse("candidate.c", candidate).functions;
  } catch (const errors::StructuralAnalysisError &e) {
    report.issues.push_back({IssueKind::kStructure, Severity::kBlocking,
                             fmt::format("candidate is malformed: {}",
                                         e.what())});
  }
  functions.erase(std::remove_if(functions.begin(), functions.end(),
                                 [](const models::FunctionSignature &f) {
                                   return !f.is_definition;
                                 }),
                  functions.end());

  report.test_function_count = static_cast<int>(std::count_if(
      functions.begin(), functions.end(),
      [](const models::FunctionSignature &f) {
        return helpers::StartsWith(f.name, "test_");
      }));
  report.assertion_count = CountAssertions(code);
  report.required_assertions =
      RequiredAssertions(target, settings.min_assertions);

  CheckStructure(candidate, code, functions, target,
                 report.test_function_count, report.issues);

  if (report.assertion_count < report.required_assertions) {
    report.issues.push_back(
        {IssueKind::kInsufficientCoverage, Severity::kWarning,
         fmt::format("{} assertions for {} branch paths of {}; write at least "
                     "{}",
                     report.assertion_count, target.decision_points + 1,
                     target.name, report.required_assertions)});
  }

  CheckEdgeCases(functions, target, report.issues);
  CheckRealism(code, target, report.issues);

  if (has_external_state) {
    bool has_setup = false;
    bool has_teardown = false;
    for (const auto &function : functions) {
      has_setup = has_setup || function.name == "setUp";
      has_teardown = has_teardown || function.name == "tearDown";
    }
    if (!has_setup || !has_teardown) {
      report.issues.push_back(
          {IssueKind::kIsolation, Severity::kWarning,
           fmt::format("{} depends on stubs or globals but the candidate "
                       "lacks {}",
                       target.name,
                       !has_setup && !has_teardown ? "setUp and tearDown"
                       : !has_setup                ? "setUp"
                                                   : "tearDown")});
    }
  }
  CheckStubResets(code, functions, environment.stub_names, report.issues);

  auto registered = RegisteredTests(code);
  for (const auto &function : functions) {
    if (helpers::StartsWith(function.name, "test_") ||
        IsHarnessFunction(function.name)) {
      continue;
    }
    bool asserts = CountAssertions(StripCommentsAndStrings(function.body)) > 0;
    bool is_registered = std::find(registered.begin(), registered.end(),
                                   function.name) != registered.end();
    if (asserts || is_registered) {
      report.issues.push_back(
          {IssueKind::kConvention, Severity::kNote,
           fmt::format("{} {} but is not named test_*", function.name,
                       is_registered ? "is registered with RUN_TEST"
                                     : "contains assertions")});
    }
  }

  for (const auto &function : functions) {
    if (helpers::StartsWith(function.name, "test_")) {
      CheckConsistency(function, report.issues);
    }
  }

  CheckAssertedLiterals(code, report.issues);
  CheckEmbeddedFeatures(code, functions, target, environment.unit_text,
                        report.issues);

  static const std::regex kExactFloat(R"(\bTEST_ASSERT_EQUAL_(FLOAT|DOUBLE)\b)");
  std::smatch match;
  if (std::regex_search(code, match, kExactFloat)) {
    report.issues.push_back(
        {IssueKind::kPrecision, Severity::kWarning,
         fmt::format("{} compares floating point values exactly; use "
                     "TEST_ASSERT_FLOAT_WITHIN",
                     match[0].str())});
  }
  return report;
}

} // namespace validator
