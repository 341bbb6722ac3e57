#include <gtest/gtest.h>

#include "../src/analyzer/codebase.hpp"
#include "../src/analyzer/source_analyzer.hpp"

#include <algorithm>

using analyzer::Codebase;
using analyzer::SourceAnalyzer;
using models::FunctionId;

namespace {
std::vector<std::string> Names(const std::vector<models::FunctionSignature> &v) {
  std::vector<std::string> result;
  for (const auto &signature : v) {
    result.push_back(signature.name);
  }
  return result;
}

Codebase MakeCodebase() {
  SourceAnalyzer analyzer;
  std::vector<models::SourceUnit> units;
  units.push_back(analyzer.Parse("src/sensor.c", R"(
#include "hal.h"
#define CLAMP(v) ((v) < 0 ? 0 : (v))

static int scale(int raw) { return CLAMP(raw) * read_gain(); }

int read_sensor(int channel) {
  int raw = hal_read(channel);
  log_event("read");
  printf("%d\n", raw);
  return scale(raw) + offset_for(channel);
}

int main(void) { return read_sensor(0); }
)"));
  units.push_back(analyzer.Parse("src/calibration.c", R"(
int offset_for(int channel) { return channel * 2; }
static int scale(int raw) { return raw; }
)"));
  units.push_back(analyzer.Parse("include/hal.h", R"(
int hal_read(int channel);
void (*get_callback(void))(int);
)"));
  return Codebase::Build(std::move(units));
}
} // namespace

TEST(CodebaseTest, UnitsAreOrderedByPath) {
  auto codebase = MakeCodebase();
  ASSERT_EQ(codebase.GetUnits().size(), 3u);
  EXPECT_EQ(codebase.GetUnits()[0].path, "include/hal.h");
  EXPECT_EQ(codebase.GetUnits()[1].path, "src/calibration.c");
  EXPECT_EQ(codebase.GetUnits()[2].path, "src/sensor.c");
  EXPECT_TRUE(codebase.IsMacro("CLAMP"));
}

TEST(CodebaseTest, ResolvePrefersOwnUnit) {
  auto codebase = MakeCodebase();
  auto own = codebase.Resolve("src/sensor.c", "scale");
  ASSERT_TRUE(own.has_value());
  EXPECT_EQ(own->unit_path, "src/sensor.c");

  auto other = codebase.Resolve("src/sensor.c", "offset_for");
  ASSERT_TRUE(other.has_value());
  EXPECT_EQ(other->unit_path, "src/calibration.c");

  // static functions of other units are invisible
  auto hidden = codebase.Resolve("include/hal.h", "scale");
  EXPECT_FALSE(hidden.has_value());

  EXPECT_FALSE(codebase.Resolve("src/sensor.c", "hal_read").has_value());
}

TEST(CodebaseTest, GraphEdges) {
  auto codebase = MakeCodebase();
  FunctionId read_sensor{"src/sensor.c", "read_sensor"};
  const auto &direct = codebase.GetGraph().DirectDependencies(read_sensor);
  EXPECT_EQ(direct, (std::set<FunctionId>{{"src/calibration.c", "offset_for"},
                                          {"src/sensor.c", "scale"}}));
  const auto &unresolved = codebase.GetGraph().UnresolvedCalls(read_sensor);
  EXPECT_EQ(unresolved,
            (std::set<std::string>{"hal_read", "log_event", "printf"}));
}

TEST(CodebaseTest, ShapeOfFallsBackToImplicitDeclaration) {
  auto codebase = MakeCodebase();
  auto declared = codebase.ShapeOf("src/sensor.c", "hal_read");
  EXPECT_FALSE(declared.is_implicit);
  EXPECT_EQ(declared.Prototype(), "int hal_read(int channel)");

  auto implicit = codebase.ShapeOf("src/sensor.c", "log_event");
  EXPECT_TRUE(implicit.is_implicit);
  EXPECT_EQ(implicit.Prototype(), "int log_event()");
}

TEST(CodebaseTest, IsDeclaredForLooksAtUnitAndHeaders) {
  auto codebase = MakeCodebase();
  EXPECT_TRUE(codebase.IsDeclaredFor("src/sensor.c", "hal_read"));
  EXPECT_TRUE(codebase.IsDeclaredFor("src/sensor.c", "scale"));
  EXPECT_FALSE(codebase.IsDeclaredFor("src/sensor.c", "offset_for"));
  EXPECT_FALSE(codebase.IsDeclaredFor("src/sensor.c", "log_event"));
}

TEST(CodebaseTest, CollectsExternalDependencies) {
  auto codebase = MakeCodebase();
  auto deps =
      codebase.CollectExternalDependencies({"src/sensor.c", "read_sensor"});

  EXPECT_EQ(Names(deps.to_stub),
            (std::vector<std::string>{"hal_read", "log_event", "offset_for",
                                      "read_gain"}));
  EXPECT_EQ(Names(deps.internal), (std::vector<std::string>{"scale"}));
  EXPECT_TRUE(deps.not_stubbed.empty());
}

TEST(CodebaseTest, OpaqueShapesAreNotStubbed) {
  SourceAnalyzer analyzer;
  std::vector<models::SourceUnit> units;
  units.push_back(analyzer.Parse("include/hal.h",
                                 "void (*get_callback(void))(int);\n"));
  units.push_back(analyzer.Parse(
      "src/dispatch.c", "void dispatch(int v) { get_callback()(v); }\n"));
  auto codebase = Codebase::Build(std::move(units));
  auto deps = codebase.CollectExternalDependencies({"src/dispatch.c", "dispatch"});
  EXPECT_TRUE(deps.to_stub.empty());
  EXPECT_EQ(deps.not_stubbed, (std::vector<std::string>{"get_callback"}));
}

TEST(CodebaseTest, RecursiveTargetsTerminate) {
  SourceAnalyzer analyzer;
  std::vector<models::SourceUnit> units;
  units.push_back(analyzer.Parse("src/parity.c", R"(
int is_odd(unsigned n);
int is_even(unsigned n) { return n == 0 ? 1 : is_odd(n - 1); }
int is_odd(unsigned n) { return n == 0 ? 0 : is_even(n - 1) + trace(n); }
)"));
  auto codebase = Codebase::Build(std::move(units));
  auto deps = codebase.CollectExternalDependencies({"src/parity.c", "is_even"});
  EXPECT_EQ(Names(deps.internal), (std::vector<std::string>{"is_odd"}));
  EXPECT_EQ(Names(deps.to_stub), (std::vector<std::string>{"trace"}));
}

TEST(CodebaseTest, IncludedHeaderHelpersAreNotStubbed) {
  SourceAnalyzer analyzer;
  std::vector<models::SourceUnit> units;
  units.push_back(analyzer.Parse("include/util.h", R"(
static inline int twice(int v) { return v * 2 + bias(); }
)"));
  units.push_back(analyzer.Parse("src/a.c", R"(
#include "util.h"
int f(int x) { return twice(x); }
)"));
  auto codebase = Codebase::Build(std::move(units));

  auto callee = codebase.Resolve("src/a.c", "twice");
  ASSERT_TRUE(callee.has_value());
  EXPECT_EQ(callee->unit_path, "include/util.h");

  auto deps = codebase.CollectExternalDependencies({"src/a.c", "f"});
  EXPECT_EQ(Names(deps.to_stub), (std::vector<std::string>{"bias"}));
  EXPECT_EQ(Names(deps.internal), (std::vector<std::string>{"twice"}));
  EXPECT_TRUE(deps.not_stubbed.empty());
}

TEST(CodebaseTest, IncludesMatchesWholePathComponents) {
  SourceAnalyzer analyzer;
  std::vector<models::SourceUnit> units;
  units.push_back(analyzer.Parse("include/drv/util.h", "int u(void);\n"));
  units.push_back(analyzer.Parse("include/myutil.h", "int m(void);\n"));
  units.push_back(analyzer.Parse("src/a.c", "#include <drv/util.h>\n"
                                            "#include \"util.h\"\n"));
  auto codebase = Codebase::Build(std::move(units));
  EXPECT_TRUE(codebase.Includes("src/a.c", codebase.GetUnits()[0]));
  EXPECT_FALSE(codebase.Includes("src/a.c", codebase.GetUnits()[1]));
  EXPECT_FALSE(codebase.Includes("src/missing.c", codebase.GetUnits()[0]));
}
