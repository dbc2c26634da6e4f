#pragma once

#include <optional>
#include <string>

namespace taco {

struct HttpEndpoint {
  std::string scheme = "http";
  std::string host = "127.0.0.1";
  int port = 11434;
  std::string base_path;
};

struct EngineConfig {
  int max_stack_depth = 20;
  // Unset means one more full max_stack_depth per extension.
  std::optional<int> depth_increment;

  int Increment() const { return depth_increment.value_or(max_stack_depth); }
};

struct TacoConfig {
  std::string default_model = "llama3";
  HttpEndpoint ollama;
  EngineConfig engine;
  bool debug = false;
  std::string create_code_workingdir = "~/code_projects";
  std::string history_file;
  std::string contexts_dir = "~/.config/taco/contexts";
  // Empty means no active context.
  std::string active_context;
  std::string config_path;
};

HttpEndpoint ParseHttpEndpoint(const std::string& url, int default_port);

std::string DefaultConfigPath();
std::string ExpandUser(const std::string& path);

// Reads the JSON file at `path` on top of the defaults. A missing file is not an
// error; a malformed one leaves the defaults in place and reports through `err`.
TacoConfig LoadConfigFile(const std::string& path, std::string* err);

// File first (TACO_CONFIG or the default path), then environment overrides.
TacoConfig LoadConfig(std::string* err);

void ApplyEnvOverrides(TacoConfig* cfg);

bool SetConfigValue(const std::string& path, const std::string& key_path, const std::string& value, std::string* err);

}  // namespace taco
