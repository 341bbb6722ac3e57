#include <gtest/gtest.h>

#include "../src/analyzer/source_analyzer.hpp"
#include "../src/validator/heuristics.hpp"
#include "test_fakes.hpp"

#include <algorithm>

using models::IssueKind;
using models::Severity;
using validator::HeuristicReport;
using validator::HeuristicSettings;
using validator::RunHeuristics;

namespace {
models::FunctionSignature Clamp() {
  analyzer::SourceAnalyzer analyzer;
  return analyzer.Parse("src/clamp.c", test_fakes::kClampSource)
      .functions.at(0);
}

const models::Issue *FindIssue(const HeuristicReport &report, IssueKind kind) {
  auto it = std::find_if(
      report.issues.begin(), report.issues.end(),
      [kind](const models::Issue &issue) { return issue.kind == kind; });
  return it == report.issues.end() ? nullptr : &*it;
}

std::string Wrap(const std::string &tests) {
  return "#include \"unity.h\"\n\nvoid setUp(void) {}\nvoid tearDown(void) "
         "{}\n\n" +
         tests;
}
} // namespace

TEST(HeuristicsTest, RequiredAssertionsFollowBranches) {
  auto clamp = Clamp();
  EXPECT_EQ(validator::RequiredAssertions(clamp, 1), 3);
  EXPECT_EQ(validator::RequiredAssertions(clamp, 5), 5);
}

TEST(HeuristicsTest, ThoroughCandidateHasNoIssues) {
  auto report = RunHeuristics(Clamp(), test_fakes::kClampTests, false,
                              HeuristicSettings{});
  EXPECT_TRUE(report.issues.empty());
  EXPECT_EQ(report.assertion_count, 3);
  EXPECT_EQ(report.required_assertions, 3);
  EXPECT_EQ(report.test_function_count, 3);
}

TEST(HeuristicsTest, TooFewAssertionsIsACoverageWarning) {
  auto report = RunHeuristics(Clamp(), test_fakes::kClampWeakTests, false,
                              HeuristicSettings{});
  ASSERT_EQ(report.issues.size(), 1u);
  EXPECT_EQ(report.issues[0].kind, IssueKind::kInsufficientCoverage);
  EXPECT_EQ(report.issues[0].severity, Severity::kWarning);
  EXPECT_EQ(report.issues[0].description,
            "1 assertions for 3 branch paths of clamp; write at least 3");
}

TEST(HeuristicsTest, StructureProblems) {
  auto fenced = RunHeuristics(
      Clamp(), "```c\n" + std::string(test_fakes::kClampTests) + "```\n",
      false, HeuristicSettings{});
  const auto *fence = FindIssue(fenced, IssueKind::kStructure);
  ASSERT_NE(fence, nullptr);
  EXPECT_EQ(fence->description, "candidate contains markdown code fences");
  EXPECT_TRUE(fence->IsBlocking());

  auto no_tests = RunHeuristics(
      Clamp(), "#include \"unity.h\"\nint helper(void) { return 1; }\n", false,
      HeuristicSettings{});
  const auto *missing = FindIssue(no_tests, IssueKind::kStructure);
  ASSERT_NE(missing, nullptr);
  EXPECT_EQ(missing->description, "candidate defines no test_ functions");

  auto no_unity = RunHeuristics(
      Clamp(), "void test_a(void) { TEST_ASSERT_EQUAL_INT(1, clamp(1, 0, 2)); }\n",
      false, HeuristicSettings{});
  const auto *unity = FindIssue(no_unity, IssueKind::kStructure);
  ASSERT_NE(unity, nullptr);
  EXPECT_EQ(unity->description, "candidate does not include unity.h");
}

TEST(HeuristicsTest, CandidateMustCallTheTarget) {
  auto report = RunHeuristics(
      Clamp(), Wrap("void test_nothing(void) { TEST_ASSERT_TRUE(1); }\n"),
      false, HeuristicSettings{});
  const auto *issue = FindIssue(report, IssueKind::kStructure);
  ASSERT_NE(issue, nullptr);
  EXPECT_EQ(issue->description, "candidate never calls clamp");
}

TEST(HeuristicsTest, MalformedCandidate) {
  auto report = RunHeuristics(
      Clamp(), Wrap("void test_open(void) { TEST_ASSERT_TRUE(clamp(1, 0, 2);\n"),
      false, HeuristicSettings{});
  const auto *issue = FindIssue(report, IssueKind::kStructure);
  ASSERT_NE(issue, nullptr);
  EXPECT_NE(issue->description.find("candidate is malformed"),
            std::string::npos);
}

TEST(HeuristicsTest, ZeroArgumentsAreUnrealistic) {
  auto report = RunHeuristics(
      Clamp(),
      Wrap("void test_a(void) { TEST_ASSERT_EQUAL_INT(0, clamp(0, 0, 0)); }\n"
           "void test_b(void) { TEST_ASSERT_EQUAL_INT(0, clamp(0.0, NULL, 0)); }\n"),
      false, HeuristicSettings{});
  const auto *issue = FindIssue(report, IssueKind::kUnrealisticValues);
  ASSERT_NE(issue, nullptr);
  EXPECT_EQ(issue->description, "every call of clamp passes only zero arguments");
  EXPECT_TRUE(issue->IsBlocking());
}

TEST(HeuristicsTest, RepeatedArgumentsAreUnrealistic) {
  auto report = RunHeuristics(
      Clamp(),
      Wrap("void test_a(void) { TEST_ASSERT_EQUAL_INT(5, clamp(5, 0, 10)); }\n"
           "void test_b(void) { TEST_ASSERT_EQUAL_INT(5, clamp(5,  0, 10)); }\n"
           "void test_c(void) { TEST_ASSERT_EQUAL_INT(5, clamp(5, 0, 10)); }\n"),
      false, HeuristicSettings{});
  const auto *issue = FindIssue(report, IssueKind::kUnrealisticValues);
  ASSERT_NE(issue, nullptr);
  EXPECT_EQ(issue->description,
            "all 3 calls of clamp use the same arguments (5, 0, 10)");
}

TEST(HeuristicsTest, ImpossibleLiterals) {
  auto report = RunHeuristics(
      Clamp(),
      Wrap("void test_a(void) {\n  float t = -273.15f;\n  double d = 1e12;\n"
           "  TEST_ASSERT_EQUAL_INT(1, clamp(1, 0, 2));\n"
           "  TEST_ASSERT_EQUAL_INT(0, clamp(-1, 0, 2));\n"
           "  TEST_ASSERT_EQUAL_INT(2, clamp(3, 0, 2));\n}\n"),
      false, HeuristicSettings{});
  std::vector<std::string> found;
  for (const auto &issue : report.issues) {
    if (issue.kind == IssueKind::kUnrealisticValues) {
      found.push_back(issue.description);
    }
  }
  EXPECT_EQ(found, (std::vector<std::string>{
                       "physically impossible literal -273.15f",
                       "physically impossible literal 1e12"}));
}

TEST(HeuristicsTest, LiteralsInsideStringsAreIgnored) {
  auto report = RunHeuristics(
      Clamp(),
      Wrap("void test_a(void) {\n"
           "  TEST_ASSERT_EQUAL_INT_MESSAGE(1, clamp(1, 0, 2), \"-273.15\");\n"
           "  TEST_ASSERT_EQUAL_INT(0, clamp(-1, 0, 2));\n"
           "  TEST_ASSERT_EQUAL_INT(2, clamp(3, 0, 2));\n}\n"),
      false, HeuristicSettings{});
  EXPECT_EQ(FindIssue(report, IssueKind::kUnrealisticValues), nullptr);
}

TEST(HeuristicsTest, MissingSetUpWithExternalState) {
  auto candidate =
      "#include \"unity.h\"\n"
      "void test_a(void) { TEST_ASSERT_EQUAL_INT(1, clamp(1, 0, 2)); }\n";
  auto with_state =
      RunHeuristics(Clamp(), candidate, true, HeuristicSettings{});
  const auto *issue = FindIssue(with_state, IssueKind::kIsolation);
  ASSERT_NE(issue, nullptr);
  EXPECT_EQ(issue->severity, Severity::kWarning);
  EXPECT_EQ(issue->description, "clamp depends on stubs or globals but the "
                                "candidate lacks setUp and tearDown");

  auto without_state =
      RunHeuristics(Clamp(), candidate, false, HeuristicSettings{});
  EXPECT_EQ(FindIssue(without_state, IssueKind::kIsolation), nullptr);
}

TEST(HeuristicsTest, TestNamingConvention) {
  auto report = RunHeuristics(
      Clamp(),
      Wrap("void check_low(void) { TEST_ASSERT_EQUAL_INT(0, clamp(-3, 0, 10)); }\n"
           "void test_high(void) { TEST_ASSERT_EQUAL_INT(10, clamp(42, 0, 10)); }\n"
           "void test_mid(void) { TEST_ASSERT_EQUAL_INT(4, clamp(4, 0, 10)); }\n"
           "int main(void) { UNITY_BEGIN(); RUN_TEST(check_low);\n"
           "  RUN_TEST(test_high); RUN_TEST(test_mid); return UNITY_END(); }\n"),
      false, HeuristicSettings{});
  const auto *issue = FindIssue(report, IssueKind::kConvention);
  ASSERT_NE(issue, nullptr);
  EXPECT_EQ(issue->severity, Severity::kNote);
  EXPECT_EQ(issue->description,
            "check_low is registered with RUN_TEST but is not named test_*");
}

TEST(HeuristicsTest, ContradictoryAssertions) {
  auto report = RunHeuristics(
      Clamp(),
      Wrap("void test_both(void) {\n"
           "  TEST_ASSERT_TRUE(clamp(5, 0, 10) == 5);\n"
           "  TEST_ASSERT_FALSE(clamp(5, 0, 10) == 5);\n"
           "  TEST_ASSERT_EQUAL_INT(0, clamp(-2, 0, 10));\n}\n"),
      false, HeuristicSettings{});
  const auto *issue = FindIssue(report, IssueKind::kConsistency);
  ASSERT_NE(issue, nullptr);
  EXPECT_TRUE(issue->IsBlocking());
  EXPECT_EQ(issue->description,
            "test_both asserts clamp(5, 0, 10) == 5 both true and false");
}

TEST(HeuristicsTest, ExactFloatComparison) {
  auto report = RunHeuristics(
      Clamp(),
      Wrap("void test_a(void) {\n"
           "  TEST_ASSERT_EQUAL_FLOAT(1.0f, (float)clamp(1, 0, 2));\n"
           "  TEST_ASSERT_EQUAL_INT(0, clamp(-1, 0, 2));\n"
           "  TEST_ASSERT_EQUAL_INT(2, clamp(3, 0, 2));\n}\n"),
      false, HeuristicSettings{});
  const auto *issue = FindIssue(report, IssueKind::kPrecision);
  ASSERT_NE(issue, nullptr);
  EXPECT_EQ(issue->severity, Severity::kWarning);
}

TEST(HeuristicsTest, CallArgumentsAndStripping) {
  auto calls = validator::CallArguments(
      "x = f(a, g(b, c)); s.f(1); f ( 2 ); ff(3);", "f");
  ASSERT_EQ(calls.size(), 2u);
  EXPECT_EQ(calls[0], (std::vector<std::string>{"a", "g(b, c)"}));
  EXPECT_EQ(calls[1], (std::vector<std::string>{"2"}));

  EXPECT_EQ(validator::StripCommentsAndStrings(
                "a /* f(1) */ b // f(2)\n\"f(3)\" 'x'"),
            "a   b \n\"\" ''");
}

TEST(HeuristicsTest, RedeclaredPrototypeIsNotACall) {
  auto report = RunHeuristics(
      Clamp(),
      Wrap("extern int clamp(int v, int lo, int hi);\n"
           "void test_a(void) { TEST_ASSERT_EQUAL_INT(0, clamp(0, 0, 0)); }\n"
           "void test_zero(void) { TEST_ASSERT_EQUAL_INT(0, clamp(0, 0, 0)); }\n"),
      false, HeuristicSettings{});
  const auto *issue = FindIssue(report, IssueKind::kUnrealisticValues);
  ASSERT_NE(issue, nullptr);
  EXPECT_EQ(issue->description, "every call of clamp passes only zero arguments");

  auto calls = validator::CallArguments(
      "int f(int a); x = f(1); uint8_t f(void); char *f(char c); y = a * f(2);",
      "f");
  ASSERT_EQ(calls.size(), 2u);
  EXPECT_EQ(calls[0], (std::vector<std::string>{"1"}));
  EXPECT_EQ(calls[1], (std::vector<std::string>{"2"}));
}

TEST(HeuristicsTest, MissingEdgeCaseNames) {
  auto report = RunHeuristics(
      Clamp(),
      Wrap("void test_a(void) { TEST_ASSERT_EQUAL_INT(5, clamp(5, 0, 10)); }\n"
           "void test_b(void) { TEST_ASSERT_EQUAL_INT(0, clamp(-3, 0, 10)); }\n"
           "void test_c(void) { TEST_ASSERT_EQUAL_INT(10, clamp(42, 0, 10)); }\n"),
      false, HeuristicSettings{});
  const auto *issue = FindIssue(report, IssueKind::kInsufficientCoverage);
  ASSERT_NE(issue, nullptr);
  EXPECT_EQ(issue->severity, Severity::kWarning);
  EXPECT_EQ(issue->description, "no test of clamp is named for an edge case "
                                "(min, max, zero, negative, boundary)");

  auto single = RunHeuristics(Clamp(), test_fakes::kClampWeakTests, false,
                              HeuristicSettings{});
  for (const auto &found : single.issues) {
    EXPECT_EQ(found.description.find("edge case"), std::string::npos);
  }
}

TEST(HeuristicsTest, TearDownResetsStubCallCounts) {
  validator::TargetEnvironment environment;
  environment.stub_names = {"hal_read", "log_event"};
  auto candidate = [](const std::string &tear_down) {
    return "#include \"unity.h\"\n"
           "void setUp(void) { hal_read_stub_call_count = 0; }\n"
           "void tearDown(void) {" +
           tear_down +
           "}\n"
           "void test_clamp_low(void) {\n"
           "  hal_read_stub_return = 2;\n"
           "  TEST_ASSERT_EQUAL_INT(0, clamp(-3, 0, 10));\n"
           "  TEST_ASSERT_EQUAL_INT(5, clamp(5, 0, 10));\n"
           "  TEST_ASSERT_EQUAL_INT(10, clamp(42, 0, 10));\n"
           "}\n";
  };

  auto stale = RunHeuristics(Clamp(), candidate(" hal_read_stub_return = 0; "),
                             true, HeuristicSettings{}, environment);
  const auto *issue = FindIssue(stale, IssueKind::kIsolation);
  ASSERT_NE(issue, nullptr);
  EXPECT_EQ(issue->severity, Severity::kWarning);
  EXPECT_EQ(issue->description, "tearDown does not reset hal_read_stub_call_count");
  EXPECT_EQ(stale.issues.size(), 1u);

  auto reset = RunHeuristics(Clamp(), candidate(" hal_read_stub_call_count = 0; "),
                             true, HeuristicSettings{}, environment);
  EXPECT_TRUE(reset.issues.empty());
}

TEST(HeuristicsTest, DistantAssertedLiterals) {
  auto report = RunHeuristics(
      Clamp(),
      Wrap("void test_clamp_high(void) {\n"
           "  TEST_ASSERT_EQUAL(1, 5000);\n"
           "  TEST_ASSERT_EQUAL_INT(7, 8);\n"
           "  TEST_ASSERT_EQUAL_INT(0, clamp(-1, 0, 2));\n"
           "  TEST_ASSERT_EQUAL_INT(2, clamp(3, 0, 2));\n"
           "  TEST_ASSERT_EQUAL_INT(1, clamp(1, 0, 2));\n}\n"),
      false, HeuristicSettings{});
  ASSERT_EQ(report.issues.size(), 1u);
  EXPECT_EQ(report.issues[0].kind, IssueKind::kConsistency);
  EXPECT_EQ(report.issues[0].severity, Severity::kWarning);
  EXPECT_EQ(report.issues[0].description,
            "TEST_ASSERT_EQUAL(1, 5000) compares literals 4999 apart");
}

namespace {
struct EmbeddedCase {
  std::string source;
  std::string missing_tests;
  std::string covering_tests;
  std::string description;
};

std::vector<std::string> Notes(const std::string &source,
                               const std::string &tests) {
  auto unit = analyzer::SourceAnalyzer().Parse("src/hw.c", source);
  const models::FunctionSignature *target = nullptr;
  for (const auto &function : unit.functions) {
    if (function.is_definition) {
      target = &function;
    }
  }
  validator::TargetEnvironment environment;
  environment.unit_text = source;
  auto report = RunHeuristics(*target, Wrap(tests), false, HeuristicSettings{},
                              environment);
  std::vector<std::string> notes;
  for (const auto &issue : report.issues) {
    if (issue.severity == Severity::kNote) {
      notes.push_back(issue.description);
    }
  }
  return notes;
}
} // namespace

TEST(HeuristicsTest, EmbeddedFeaturesNeedMatchingTests) {
  std::vector<EmbeddedCase> cases = {
      {"int sample(volatile int *port) { return *port + 1; }\n",
       "void test_sample_max(void) { int p = 1; "
       "TEST_ASSERT_EQUAL_INT(2, sample(&p)); }\n",
       "void test_sample_max(void) { volatile int p = 1; "
       "TEST_ASSERT_EQUAL_INT(2, sample(&p)); }\n",
       "sample reads volatile storage but no test declares volatile data"},
      {"struct flags { unsigned int ready : 1; unsigned int mode : 3; };\n"
       "int is_ready(struct flags *f) { return f->ready; }\n",
       "void test_is_ready_zero(void) { struct flags f = {0}; "
       "TEST_ASSERT_EQUAL_INT(0, is_ready(&f)); }\n",
       "void test_is_ready_max(void) { struct flags f = {0}; f.ready = 1 << 0; "
       "TEST_ASSERT_EQUAL_INT(1, is_ready(&f)); }\n",
       "is_ready works on bit-fields but no test uses bit operations"},
      {"int step(int state) {\n  switch (state) {\n  case 0: return 1;\n"
       "  default: return 0;\n  }\n}\n",
       "void test_step_zero(void) { TEST_ASSERT_EQUAL_INT(1, step(3 - 3)); "
       "TEST_ASSERT_EQUAL_INT(0, step(1)); }\n",
       "void test_step_transition(void) { TEST_ASSERT_EQUAL_INT(1, step(3 - 3)); "
       "TEST_ASSERT_EQUAL_INT(0, step(1)); }\n",
       "step switches on a state but no test checks a state transition"},
      {"int service(int ticks) { return wdt_kick(ticks); }\n",
       "void test_service_max(void) { TEST_ASSERT_EQUAL_INT(0, service(9)); }\n",
       "void test_service_timeout(void) { TEST_ASSERT_EQUAL_INT(0, service(9)); "
       "}\n",
       "service services a watchdog but no test covers feeding or timeout"},
      {"void on_irq(int line) { dma_start(line); }\n",
       "void test_on_irq_max(void) { on_irq(7); TEST_PASS(); }\n",
       "void test_on_irq_max(void) { on_irq(7); "
       "TEST_ASSERT_EQUAL_UINT(1, dma_start_stub_call_count); }\n",
       "on_irq handles DMA or interrupts but no test simulates the hardware"},
      {"unsigned status(void) { return *(volatile unsigned *)0x40021000u; }\n",
       "void test_status_max(void) { TEST_ASSERT_EQUAL_UINT(0, status()); }\n",
       "void test_status_max(void) { unsigned status_reg = status(); "
       "TEST_ASSERT_EQUAL_UINT(status_reg, status()); }\n",
       "status accesses registers at fixed addresses but no test inspects "
       "register state"},
  };
  for (const auto &c : cases) {
    auto missing = Notes(c.source, c.missing_tests);
    EXPECT_NE(std::find(missing.begin(), missing.end(), c.description),
              missing.end())
        << c.description;
    auto covered = Notes(c.source, c.covering_tests);
    EXPECT_EQ(std::find(covered.begin(), covered.end(), c.description),
              covered.end())
        << c.description;
  }
}

TEST(HeuristicsTest, PlainTargetsGetNoEmbeddedNotes) {
  validator::TargetEnvironment environment;
  environment.unit_text = test_fakes::kClampSource;
  auto report = RunHeuristics(Clamp(), test_fakes::kClampTests, false,
                              HeuristicSettings{}, environment);
  EXPECT_TRUE(report.issues.empty());
}
