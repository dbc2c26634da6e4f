#include "tooling.hpp"

#include "fakes.hpp"

#include <gtest/gtest.h>

#include <string>

using taco::ParamType;
using taco::ToolResult;
using taco_test::MakeTool;
using taco_test::Param;

namespace {

ToolResult Echo(const nlohmann::json& p) { return ToolResult::Ok(p); }

TEST(ToolResultTest, Constructors) {
  auto ok = ToolResult::Ok(3);
  EXPECT_EQ(ok.kind, ToolResult::Kind::Value);
  EXPECT_EQ(ok.value, 3);

  auto needs = ToolResult::Needs("save_file", {{"path", "/tmp"}});
  EXPECT_EQ(needs.kind, ToolResult::Kind::NeedsTool);
  EXPECT_EQ(needs.child_tool, "save_file");
  EXPECT_EQ(needs.seed_args["path"], "/tmp");

  auto junk_seed = ToolResult::Needs("x", nlohmann::json::array({1, 2}));
  EXPECT_TRUE(junk_seed.seed_args.is_object());
  EXPECT_TRUE(junk_seed.seed_args.empty());

  auto fail = ToolResult::Fail("io", "disk full");
  EXPECT_EQ(fail.kind, ToolResult::Kind::Error);
  EXPECT_EQ(fail.error_kind, "io");
  EXPECT_EQ(fail.error, "disk full");
}

TEST(ToolRegistryTest, RegisterAndResolve) {
  taco::ToolRegistry registry;
  std::string err;
  ASSERT_TRUE(registry.RegisterTool(MakeTool("echo", {Param("text")}, Echo), &err)) << err;
  EXPECT_TRUE(registry.HasTool("echo"));
  EXPECT_FALSE(registry.HasTool("nope"));
  EXPECT_FALSE(registry.Resolve("nope").has_value());

  auto d = registry.Resolve("echo");
  ASSERT_TRUE(d.has_value());
  ASSERT_TRUE(d->project_child_result);
  nlohmann::json params = nlohmann::json::object();
  d->project_child_result("child", 7, &params);
  EXPECT_EQ(params["child_result"], 7);

  auto out = d->tool->Invoke({{"text", "hi"}});
  EXPECT_EQ(out.value["text"], "hi");
}

TEST(ToolRegistryTest, RejectsBadDescriptors) {
  taco::ToolRegistry registry;
  std::string err;
  EXPECT_FALSE(registry.RegisterTool(MakeTool("", {}, Echo), &err));
  EXPECT_EQ(err, "tool name is empty");

  auto no_impl = MakeTool("empty", {}, Echo);
  no_impl.tool.reset();
  EXPECT_FALSE(registry.RegisterTool(no_impl, &err));
  EXPECT_NE(err.find("no implementation"), std::string::npos);

  EXPECT_FALSE(registry.RegisterTool(MakeTool("dup", {Param("a"), Param("a")}, Echo), &err));
  EXPECT_NE(err.find("declares parameter a twice"), std::string::npos);
  EXPECT_TRUE(registry.List().empty());
}

TEST(ToolRegistryTest, ListAndSummaryAreSortedByName) {
  taco::ToolRegistry registry;
  std::string err;
  ASSERT_TRUE(registry.RegisterTool(MakeTool("zeta", {}, Echo), &err));
  ASSERT_TRUE(registry.RegisterTool(MakeTool("alpha", {Param("x", ParamType::Number), Param("n", ParamType::Integer)}, Echo), &err));

  auto list = registry.List();
  ASSERT_EQ(list.size(), 2u);
  EXPECT_EQ(list[0].name, "alpha");
  EXPECT_EQ(registry.Summary(),
            "- alpha(x: number, n: integer): test tool alpha\n"
            "- zeta(): test tool zeta\n");
}

TEST(ToolRegistryTest, SurvivesMove) {
  taco::ToolRegistry registry;
  std::string err;
  ASSERT_TRUE(registry.RegisterTool(MakeTool("echo", {}, Echo), &err));
  taco::ToolRegistry moved(std::move(registry));
  EXPECT_TRUE(moved.HasTool("echo"));
}

TEST(CoerceParameterTest, Strings) {
  nlohmann::json out;
  std::string err;
  EXPECT_TRUE(taco::CoerceParameter(Param("name"), "  Ada  ", &out, &err));
  EXPECT_EQ(out, "Ada");
  EXPECT_FALSE(taco::CoerceParameter(Param("name"), "   ", &out, &err));
  EXPECT_EQ(err, "name must not be empty");
}

TEST(CoerceParameterTest, Numbers) {
  auto spec = Param("amount", ParamType::Number);
  nlohmann::json out;
  std::string err;
  EXPECT_TRUE(taco::CoerceParameter(spec, "$250,000", &out, &err));
  EXPECT_DOUBLE_EQ(out.get<double>(), 250000.0);
  EXPECT_TRUE(taco::CoerceParameter(spec, "5.5%", &out, &err));
  EXPECT_DOUBLE_EQ(out.get<double>(), 5.5);
  EXPECT_TRUE(taco::CoerceParameter(spec, 12, &out, &err));
  EXPECT_DOUBLE_EQ(out.get<double>(), 12.0);

  EXPECT_FALSE(taco::CoerceParameter(spec, "lots", &out, &err));
  EXPECT_EQ(err, "amount must be a number, got \"lots\"");
}

TEST(CoerceParameterTest, Integers) {
  auto spec = Param("count", ParamType::Integer);
  nlohmann::json out;
  std::string err;
  EXPECT_TRUE(taco::CoerceParameter(spec, "1,200", &out, &err));
  EXPECT_EQ(out.get<long long>(), 1200);
  EXPECT_FALSE(taco::CoerceParameter(spec, "2.5", &out, &err));
  EXPECT_NE(err.find("must be a whole number"), std::string::npos);
}

TEST(CoerceParameterTest, Booleans) {
  auto spec = Param("force", ParamType::Boolean);
  nlohmann::json out;
  std::string err;
  EXPECT_TRUE(taco::CoerceParameter(spec, "Yes", &out, &err));
  EXPECT_EQ(out, true);
  EXPECT_TRUE(taco::CoerceParameter(spec, "off", &out, &err));
  EXPECT_EQ(out, false);
  EXPECT_TRUE(taco::CoerceParameter(spec, true, &out, &err));
  EXPECT_EQ(out, true);
  EXPECT_FALSE(taco::CoerceParameter(spec, "perhaps", &out, &err));
  EXPECT_NE(err.find("must be yes or no"), std::string::npos);
}

TEST(CoerceParameterTest, ValidatorRunsAfterCoercion) {
  auto spec = Param("age", ParamType::Integer);
  spec.validator = [](const nlohmann::json& v, std::string* err) {
    if (v.get<long long>() >= 0) return true;
    *err = "age must not be negative";
    return false;
  };
  nlohmann::json out = "untouched";
  std::string err;
  EXPECT_FALSE(taco::CoerceParameter(spec, "-3", &out, &err));
  EXPECT_EQ(err, "age must not be negative");
  EXPECT_EQ(out, "untouched");

  spec.validator = [](const nlohmann::json&, std::string*) { return false; };
  EXPECT_FALSE(taco::CoerceParameter(spec, "3", &out, &err));
  EXPECT_EQ(err, "age is not valid");
}

TEST(ToolingTest, MissingParametersKeepsDeclaredOrder) {
  auto d = MakeTool("t", {Param("a"), Param("b"), Param("c")}, Echo);
  auto missing = taco::MissingParameters(d, {{"b", 1}, {"extra", 2}});
  ASSERT_EQ(missing.size(), 2u);
  EXPECT_EQ(missing[0], "a");
  EXPECT_EQ(missing[1], "c");
  EXPECT_EQ(taco::MissingParameters(d, nlohmann::json()).size(), 3u);
}

TEST(ToolingTest, DescribeTool) {
  auto d = MakeTool("convert", {Param("value", ParamType::Number)}, Echo);
  d.parameters[0].description = "temperature to convert";
  d.usage = "convert 21 C to F";
  const auto text = taco::DescribeTool(d);
  EXPECT_NE(text.find("Tool: convert\n"), std::string::npos);
  EXPECT_NE(text.find("  - value (number) - temperature to convert\n"), std::string::npos);
  EXPECT_NE(text.find("Usage:\nconvert 21 C to F"), std::string::npos);

  EXPECT_NE(taco::DescribeTool(MakeTool("bare", {}, Echo)).find("(none)"), std::string::npos);
}

TEST(ToolingTest, ParseJsonLoose) {
  auto whole = taco::ParseJsonLoose(" {\"a\": 1} ");
  ASSERT_TRUE(whole.has_value());
  EXPECT_EQ((*whole)["a"], 1);

  auto embedded = taco::ParseJsonLoose("Sure! Here it is: {\"code\": \"print('}')\"} hope that helps");
  ASSERT_TRUE(embedded.has_value());
  EXPECT_EQ((*embedded)["code"], "print('}')");

  EXPECT_FALSE(taco::ParseJsonLoose("no json here").has_value());
  EXPECT_FALSE(taco::ParseJsonLoose("").has_value());
  EXPECT_FALSE(taco::ParseJsonLoose("{broken").has_value());
}

}  // namespace
