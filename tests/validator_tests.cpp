#include <gtest/gtest.h>

#include "../src/analyzer/source_analyzer.hpp"
#include "../src/validator/validator.hpp"
#include "test_fakes.hpp"

using models::IssueKind;
using models::QualityTier;
using test_fakes::FakeToolchain;
using validator::ValidationTarget;
using validator::Validator;
using validator::ValidatorSettings;

namespace {
struct Fixture {
  models::SourceUnit unit;
  ValidationTarget target;

  explicit Fixture(const std::string &text) {
    unit = analyzer::SourceAnalyzer().Parse("src/clamp.c", text);
    target.unit = &unit;
    target.target = unit.functions.at(0);
  }
};
} // namespace

TEST(ValidatorTest, AssembleUnitOrder) {
  Fixture fixture(test_fakes::kClampSource);
  models::StubSpec stub;
  stub.code = "/* stub: hal_read */\nint hal_read(int c) { return 0; }\n";
  fixture.target.stubs.push_back(stub);
  fixture.target.forward_declarations.push_back("int hal_read(int c)");

  auto unit = Validator::AssembleUnit(fixture.target, "CANDIDATE");
  auto declaration = unit.find("int hal_read(int c);\n");
  auto source = unit.find("/* ==== unit under test: src/clamp.c ==== */");
  auto stubs = unit.find("/* ==== stubs ==== */");
  auto candidate = unit.find("/* ==== candidate ==== */\nCANDIDATE\n");
  ASSERT_NE(declaration, std::string::npos);
  ASSERT_NE(source, std::string::npos);
  ASSERT_NE(stubs, std::string::npos);
  ASSERT_NE(candidate, std::string::npos);
  EXPECT_LT(declaration, source);
  EXPECT_LT(source, stubs);
  EXPECT_LT(stubs, candidate);
  EXPECT_EQ(unit.find("#define main"), std::string::npos);
}

TEST(ValidatorTest, UnitMainIsRenamed) {
  Fixture fixture(std::string(test_fakes::kClampSource) +
                  "int main(void) { return clamp(1, 0, 2); }\n");
  auto unit = Validator::AssembleUnit(fixture.target, "int main(void) {}");
  auto define = unit.find("#define main ctestgen_unit_main\n");
  auto undef = unit.find("#undef main\n");
  auto candidate = unit.find("/* ==== candidate ==== */");
  ASSERT_NE(define, std::string::npos);
  ASSERT_NE(undef, std::string::npos);
  EXPECT_LT(define, undef);
  EXPECT_LT(undef, candidate);
}

TEST(ValidatorTest, ThoroughCandidateIsHigh) {
  Fixture fixture(test_fakes::kClampSource);
  FakeToolchain toolchain;
  Validator validator(toolchain, ValidatorSettings{});
  auto result = validator.Validate(fixture.target, test_fakes::kClampTests);
  EXPECT_TRUE(result.compiles);
  EXPECT_TRUE(result.issues.empty());
  EXPECT_EQ(result.tier, QualityTier::kHigh);
  EXPECT_EQ(result.assertion_count, 3);
  ASSERT_EQ(toolchain.Units().size(), 1u);
  EXPECT_NE(toolchain.Units()[0].find("int clamp(int value"), std::string::npos);
}

TEST(ValidatorTest, WeakCandidateIsMedium) {
  Fixture fixture(test_fakes::kClampSource);
  FakeToolchain toolchain;
  Validator validator(toolchain, ValidatorSettings{});
  auto result = validator.Validate(fixture.target, test_fakes::kClampWeakTests);
  EXPECT_EQ(result.tier, QualityTier::kMedium);
  ASSERT_EQ(result.issues.size(), 1u);
  EXPECT_EQ(result.issues[0].kind, IssueKind::kInsufficientCoverage);
}

TEST(ValidatorTest, CompilerErrorsAreBlockingAndVerbatim) {
  const std::string error =
      "candidate_unit.c:31:28: error: implicit declaration of function "
      "'clamp_range' [-Werror=implicit-function-declaration]";
  Fixture fixture(test_fakes::kClampSource);
  FakeToolchain toolchain([&error](const std::string &) {
    return validator::CompileResult{
        false, "candidate_unit.c: In function 'test_x':\n" + error + "\n"};
  });
  Validator validator(toolchain, ValidatorSettings{});
  auto result = validator.Validate(fixture.target, test_fakes::kClampTests);
  EXPECT_FALSE(result.compiles);
  EXPECT_EQ(result.tier, QualityTier::kLow);
  ASSERT_FALSE(result.issues.empty());
  EXPECT_EQ(result.issues[0].kind, IssueKind::kCompilation);
  EXPECT_EQ(result.issues[0].description, error);
  EXPECT_TRUE(result.issues[0].IsBlocking());
}

TEST(ValidatorTest, SilentCompilerFailureStillRecordsAnError) {
  Fixture fixture(test_fakes::kClampSource);
  FakeToolchain toolchain([](const std::string &) {
    return validator::CompileResult{false, ""};
  });
  Validator validator(toolchain, ValidatorSettings{});
  auto result = validator.Validate(fixture.target, test_fakes::kClampTests);
  ASSERT_EQ(result.Errors().size(), 1u);
  EXPECT_EQ(result.Errors()[0], "error: compiler failed without diagnostics");
  EXPECT_EQ(result.tier, QualityTier::kLow);
}

TEST(ValidatorTest, WarningsDoNotBlock) {
  Fixture fixture(test_fakes::kClampSource);
  FakeToolchain toolchain([](const std::string &) {
    return validator::CompileResult{
        true, "candidate_unit.c:5:7: warning: unused variable 'x'\n"};
  });
  Validator validator(toolchain, ValidatorSettings{});
  auto result = validator.Validate(fixture.target, test_fakes::kClampTests);
  EXPECT_EQ(result.Warnings().size(), 1u);
  EXPECT_EQ(result.tier, QualityTier::kHigh);
}

TEST(ValidatorTest, StubsRequireSetUpAndTearDown) {
  Fixture fixture(test_fakes::kClampSource);
  models::StubSpec stub;
  stub.code = "int hal_read(int c) { return 0; }\n";
  fixture.target.stubs.push_back(stub);
  FakeToolchain toolchain;
  Validator validator(toolchain, ValidatorSettings{});

  std::string candidate = test_fakes::kClampTests;
  auto set_up = candidate.find("void setUp(void) {}\n");
  candidate.erase(set_up, std::string("void setUp(void) {}\n").size());
  auto result = validator.Validate(fixture.target, candidate);
  EXPECT_EQ(result.tier, QualityTier::kMedium);
  ASSERT_EQ(result.issues.size(), 1u);
  EXPECT_EQ(result.issues[0].kind, IssueKind::kIsolation);
}
