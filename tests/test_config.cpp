#include "config.hpp"

#include "fakes.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <string>

namespace {

void WriteFile(const std::filesystem::path& path, const std::string& text) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << text;
}

nlohmann::json ReadJson(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  return nlohmann::json::parse(in, nullptr, false);
}

class EnvGuard {
 public:
  EnvGuard() {
    for (const char* name : kNames) unsetenv(name);
  }
  ~EnvGuard() {
    for (const char* name : kNames) unsetenv(name);
  }

 private:
  static constexpr const char* kNames[] = {"OLLAMA_HOST", "TACO_MODEL", "TACO_MAX_STACK_DEPTH", "TACO_DEBUG_LEVEL", "TACO_CONFIG"};
};

TEST(ConfigTest, ParseHttpEndpoint) {
  auto ep = taco::ParseHttpEndpoint("http://gpu-box:8080/ollama", 11434);
  EXPECT_EQ(ep.scheme, "http");
  EXPECT_EQ(ep.host, "gpu-box");
  EXPECT_EQ(ep.port, 8080);
  EXPECT_EQ(ep.base_path, "/ollama");

  ep = taco::ParseHttpEndpoint("https://models.local/", 11434);
  EXPECT_EQ(ep.scheme, "https");
  EXPECT_EQ(ep.host, "models.local");
  EXPECT_EQ(ep.port, 11434);
  EXPECT_TRUE(ep.base_path.empty());

  ep = taco::ParseHttpEndpoint("0.0.0.0:11500", 11434);
  EXPECT_EQ(ep.host, "0.0.0.0");
  EXPECT_EQ(ep.port, 11500);

  ep = taco::ParseHttpEndpoint("", 11434);
  EXPECT_EQ(ep.host, "127.0.0.1");
  EXPECT_EQ(ep.port, 11434);
}

TEST(ConfigTest, MissingFileGivesDefaults) {
  std::string err;
  auto cfg = taco::LoadConfigFile((taco_test::ScratchDir() / "absent.json").string(), &err);
  EXPECT_TRUE(err.empty());
  EXPECT_EQ(cfg.default_model, "llama3");
  EXPECT_EQ(cfg.engine.max_stack_depth, 20);
  EXPECT_FALSE(cfg.engine.depth_increment.has_value());
  EXPECT_EQ(cfg.engine.Increment(), 20);
  EXPECT_EQ(cfg.ollama.port, 11434);
  EXPECT_FALSE(cfg.debug);
}

TEST(ConfigTest, MalformedFileKeepsDefaultsAndReports) {
  const auto path = taco_test::ScratchDir() / "config.json";
  WriteFile(path, "{ not json");
  std::string err;
  auto cfg = taco::LoadConfigFile(path.string(), &err);
  EXPECT_EQ(err, "config: invalid json in " + path.string());
  EXPECT_EQ(cfg.default_model, "llama3");
}

TEST(ConfigTest, FileValuesAreApplied) {
  const auto path = taco_test::ScratchDir() / "config.json";
  WriteFile(path, R"({
    "model": {"default": "mistral", "host": "http://box:9000"},
    "engine": {"max_stack_depth": 8, "depth_increment": 4},
    "display": {"debug": true},
    "tools": {"create_code": {"workingdir": "/srv/code"}},
    "chat": {"history_file": "~/.taco_history.json"},
    "unrelated": 1
  })");
  std::string err;
  auto cfg = taco::LoadConfigFile(path.string(), &err);
  EXPECT_TRUE(err.empty()) << err;
  EXPECT_EQ(cfg.default_model, "mistral");
  EXPECT_EQ(cfg.ollama.host, "box");
  EXPECT_EQ(cfg.ollama.port, 9000);
  EXPECT_EQ(cfg.engine.max_stack_depth, 8);
  EXPECT_EQ(cfg.engine.Increment(), 4);
  EXPECT_TRUE(cfg.debug);
  EXPECT_EQ(cfg.create_code_workingdir, "/srv/code");
  EXPECT_EQ(cfg.history_file, "~/.taco_history.json");
  EXPECT_EQ(cfg.config_path, path.string());
}

TEST(ConfigTest, NonPositiveDepthsFallBack) {
  const auto path = taco_test::ScratchDir() / "config.json";
  WriteFile(path, R"({"engine": {"max_stack_depth": 0, "depth_increment": -3}})");
  std::string err;
  auto cfg = taco::LoadConfigFile(path.string(), &err);
  EXPECT_EQ(cfg.engine.max_stack_depth, 20);
  EXPECT_FALSE(cfg.engine.depth_increment.has_value());
  EXPECT_EQ(cfg.engine.Increment(), 20);
}

TEST(ConfigTest, IncrementFollowsMaxDepthFromFile) {
  const auto path = taco_test::ScratchDir() / "config.json";
  WriteFile(path, R"({"engine": {"max_stack_depth": 5}})");
  std::string err;
  auto cfg = taco::LoadConfigFile(path.string(), &err);
  EXPECT_EQ(cfg.engine.max_stack_depth, 5);
  EXPECT_EQ(cfg.engine.Increment(), 5);
}

TEST(ConfigTest, IncrementFollowsMaxDepthFromEnvironment) {
  EnvGuard guard;
  setenv("TACO_MAX_STACK_DEPTH", "5", 1);
  taco::TacoConfig cfg;
  taco::ApplyEnvOverrides(&cfg);
  EXPECT_EQ(cfg.engine.max_stack_depth, 5);
  EXPECT_EQ(cfg.engine.Increment(), 5);

  cfg.engine.depth_increment = 3;
  taco::ApplyEnvOverrides(&cfg);
  EXPECT_EQ(cfg.engine.Increment(), 3);
}

TEST(ConfigTest, EnvironmentOverridesFile) {
  EnvGuard guard;
  const auto path = taco_test::ScratchDir() / "config.json";
  WriteFile(path, R"({"model": {"default": "mistral"}, "engine": {"max_stack_depth": 8}})");
  setenv("TACO_CONFIG", path.c_str(), 1);
  setenv("TACO_MODEL", "qwen2", 1);
  setenv("OLLAMA_HOST", "http://remote:1234", 1);
  setenv("TACO_MAX_STACK_DEPTH", "12", 1);
  setenv("TACO_DEBUG_LEVEL", "verbose", 1);

  std::string err;
  auto cfg = taco::LoadConfig(&err);
  EXPECT_TRUE(err.empty()) << err;
  EXPECT_EQ(cfg.default_model, "qwen2");
  EXPECT_EQ(cfg.ollama.host, "remote");
  EXPECT_EQ(cfg.ollama.port, 1234);
  EXPECT_EQ(cfg.engine.max_stack_depth, 12);
  EXPECT_TRUE(cfg.debug);
}

TEST(ConfigTest, InvalidDepthOverrideIsIgnored) {
  EnvGuard guard;
  setenv("TACO_MAX_STACK_DEPTH", "lots", 1);
  setenv("TACO_DEBUG_LEVEL", "INFO", 1);
  taco::TacoConfig cfg;
  taco::ApplyEnvOverrides(&cfg);
  EXPECT_EQ(cfg.engine.max_stack_depth, 20);
  EXPECT_FALSE(cfg.debug);
}

TEST(ConfigTest, SetConfigValueCreatesTypedEntries) {
  const auto path = taco_test::ScratchDir() / "nested" / "config.json";
  std::string err;
  ASSERT_TRUE(taco::SetConfigValue(path.string(), "engine.max_stack_depth", "30", &err)) << err;
  ASSERT_TRUE(taco::SetConfigValue(path.string(), "display.debug", "true", &err)) << err;
  ASSERT_TRUE(taco::SetConfigValue(path.string(), "model.default", "mistral", &err)) << err;

  auto j = ReadJson(path);
  ASSERT_FALSE(j.is_discarded());
  EXPECT_EQ(j["engine"]["max_stack_depth"], 30);
  EXPECT_EQ(j["display"]["debug"], true);
  EXPECT_EQ(j["model"]["default"], "mistral");

  auto cfg = taco::LoadConfigFile(path.string(), &err);
  EXPECT_EQ(cfg.engine.max_stack_depth, 30);
  EXPECT_TRUE(cfg.debug);
  EXPECT_EQ(cfg.default_model, "mistral");
}

TEST(ConfigTest, SetConfigValueKeepsUnknownKeys) {
  const auto path = taco_test::ScratchDir() / "config.json";
  WriteFile(path, R"({"custom": {"keep": "me"}, "model": {"default": "llama3", "extra": 5}})");
  std::string err;
  ASSERT_TRUE(taco::SetConfigValue(path.string(), "model.default", "phi3", &err)) << err;
  auto j = ReadJson(path);
  EXPECT_EQ(j["custom"]["keep"], "me");
  EXPECT_EQ(j["model"]["extra"], 5);
  EXPECT_EQ(j["model"]["default"], "phi3");
}

TEST(ConfigTest, SetConfigValueRejectsBadInput) {
  const auto dir = taco_test::ScratchDir();
  std::string err;
  EXPECT_FALSE(taco::SetConfigValue((dir / "c.json").string(), "nodot", "x", &err));
  EXPECT_EQ(err, "config: key must look like section.key");
  EXPECT_FALSE(taco::SetConfigValue((dir / "c.json").string(), "a.b.c", "x", &err));

  WriteFile(dir / "bad.json", "[1, 2");
  EXPECT_FALSE(taco::SetConfigValue((dir / "bad.json").string(), "model.default", "x", &err));
  EXPECT_NE(err.find("invalid json"), std::string::npos);
}

TEST(ConfigTest, ExpandUser) {
  const char* home = std::getenv("HOME");
  if (home && *home) {
    EXPECT_EQ(taco::ExpandUser("~/code"), std::string(home) + "/code");
    EXPECT_EQ(taco::ExpandUser("~"), std::string(home));
  }
  EXPECT_EQ(taco::ExpandUser("/abs/path"), "/abs/path");
  EXPECT_EQ(taco::ExpandUser("~other/x"), "~other/x");
  EXPECT_EQ(taco::ExpandUser(""), "");
}

}  // namespace
