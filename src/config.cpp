#include "config.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <utility>

namespace taco {
namespace {

static bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static std::string GetEnvStr(const char* name) {
  const char* v = std::getenv(name);
  return v ? std::string(v) : std::string();
}

static std::string ToUpper(std::string s) {
  for (auto& c : s) {
    if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
  }
  return s;
}

static std::string FormatEndpoint(const HttpEndpoint& ep) {
  return ep.scheme + "://" + ep.host + ":" + std::to_string(ep.port) + ep.base_path;
}

static void ApplyJson(const nlohmann::json& j, TacoConfig* cfg) {
  if (j.contains("model") && j["model"].is_object()) {
    const auto& m = j["model"];
    if (m.contains("default") && m["default"].is_string()) cfg->default_model = m["default"].get<std::string>();
    if (m.contains("host") && m["host"].is_string()) cfg->ollama = ParseHttpEndpoint(m["host"].get<std::string>(), 11434);
  }
  if (j.contains("engine") && j["engine"].is_object()) {
    const auto& e = j["engine"];
    if (e.contains("max_stack_depth") && e["max_stack_depth"].is_number_integer()) {
      cfg->engine.max_stack_depth = e["max_stack_depth"].get<int>();
    }
    if (e.contains("depth_increment") && e["depth_increment"].is_number_integer()) {
      cfg->engine.depth_increment = e["depth_increment"].get<int>();
    }
  }
  if (j.contains("display") && j["display"].is_object()) {
    const auto& d = j["display"];
    if (d.contains("debug") && d["debug"].is_boolean()) cfg->debug = d["debug"].get<bool>();
  }
  if (j.contains("tools") && j["tools"].is_object() && j["tools"].contains("create_code") &&
      j["tools"]["create_code"].is_object()) {
    const auto& cc = j["tools"]["create_code"];
    if (cc.contains("workingdir") && cc["workingdir"].is_string()) {
      cfg->create_code_workingdir = cc["workingdir"].get<std::string>();
    }
  }
  if (j.contains("chat") && j["chat"].is_object()) {
    const auto& c = j["chat"];
    if (c.contains("history_file") && c["history_file"].is_string()) cfg->history_file = c["history_file"].get<std::string>();
  }
  if (j.contains("context") && j["context"].is_object()) {
    const auto& c = j["context"];
    if (c.contains("dir") && c["dir"].is_string()) cfg->contexts_dir = c["dir"].get<std::string>();
    if (c.contains("active") && c["active"].is_string()) cfg->active_context = c["active"].get<std::string>();
  }
}

static nlohmann::json ToJson(const TacoConfig& cfg) {
  nlohmann::json j;
  j["model"] = {{"default", cfg.default_model}, {"host", FormatEndpoint(cfg.ollama)}};
  j["engine"] = {{"max_stack_depth", cfg.engine.max_stack_depth}};
  if (cfg.engine.depth_increment) j["engine"]["depth_increment"] = *cfg.engine.depth_increment;
  j["display"] = {{"debug", cfg.debug}};
  j["tools"] = {{"create_code", {{"workingdir", cfg.create_code_workingdir}}}};
  j["chat"] = {{"history_file", cfg.history_file}};
  j["context"] = {{"dir", cfg.contexts_dir}, {"active", cfg.active_context}};
  return j;
}

}  // namespace

HttpEndpoint ParseHttpEndpoint(const std::string& url, int default_port) {
  HttpEndpoint ep;
  ep.port = 0;
  std::string s = url;
  if (StartsWith(s, "http://")) {
    ep.scheme = "http";
    s = s.substr(7);
  } else if (StartsWith(s, "https://")) {
    ep.scheme = "https";
    s = s.substr(8);
  }

  auto slash_pos = s.find('/');
  if (slash_pos != std::string::npos) {
    ep.base_path = s.substr(slash_pos);
    s = s.substr(0, slash_pos);
  }
  if (ep.base_path == "/") ep.base_path.clear();

  auto colon_pos = s.rfind(':');
  if (colon_pos != std::string::npos) {
    ep.host = s.substr(0, colon_pos);
    ep.port = std::atoi(s.substr(colon_pos + 1).c_str());
  } else if (!s.empty()) {
    ep.host = s;
  }
  if (ep.port == 0) ep.port = default_port;
  if (ep.host.empty()) ep.host = "127.0.0.1";
  return ep;
}

std::string ExpandUser(const std::string& path) {
  if (path.empty() || path[0] != '~') return path;
  if (path.size() > 1 && path[1] != '/') return path;
  const auto home = GetEnvStr("HOME");
  if (home.empty()) return path;
  return home + path.substr(1);
}

std::string DefaultConfigPath() {
  return ExpandUser("~/.config/taco/config.json");
}

TacoConfig LoadConfigFile(const std::string& path, std::string* err) {
  TacoConfig cfg;
  cfg.config_path = path;
  std::error_code ec;
  if (path.empty() || !std::filesystem::exists(path, ec)) return cfg;

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    if (err) *err = "config: cannot open " + path;
    return cfg;
  }
  auto j = nlohmann::json::parse(in, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    if (err) *err = "config: invalid json in " + path;
    return cfg;
  }
  ApplyJson(j, &cfg);
  if (cfg.engine.max_stack_depth <= 0) cfg.engine.max_stack_depth = EngineConfig{}.max_stack_depth;
  if (cfg.engine.depth_increment && *cfg.engine.depth_increment <= 0) cfg.engine.depth_increment.reset();
  return cfg;
}

void ApplyEnvOverrides(TacoConfig* cfg) {
  if (auto host = GetEnvStr("OLLAMA_HOST"); !host.empty()) cfg->ollama = ParseHttpEndpoint(host, 11434);
  if (auto model = GetEnvStr("TACO_MODEL"); !model.empty()) cfg->default_model = model;
  if (auto depth = GetEnvStr("TACO_MAX_STACK_DEPTH"); !depth.empty()) {
    const int n = std::atoi(depth.c_str());
    if (n > 0) cfg->engine.max_stack_depth = n;
  }
  if (auto level = ToUpper(GetEnvStr("TACO_DEBUG_LEVEL")); level == "DEBUG" || level == "VERBOSE") cfg->debug = true;
}

TacoConfig LoadConfig(std::string* err) {
  std::string path = GetEnvStr("TACO_CONFIG");
  if (path.empty()) path = DefaultConfigPath();
  auto cfg = LoadConfigFile(ExpandUser(path), err);
  ApplyEnvOverrides(&cfg);
  return cfg;
}

bool SetConfigValue(const std::string& path, const std::string& key_path, const std::string& value, std::string* err) {
  auto dot = key_path.find('.');
  if (dot == std::string::npos || dot == 0 || dot + 1 >= key_path.size() ||
      key_path.find('.', dot + 1) != std::string::npos) {
    if (err) *err = "config: key must look like section.key";
    return false;
  }
  const auto section = key_path.substr(0, dot);
  const auto key = key_path.substr(dot + 1);

  std::error_code ec;
  nlohmann::json j = ToJson(TacoConfig{});
  if (std::filesystem::exists(path, ec)) {
    std::ifstream in(path, std::ios::binary);
    auto existing = nlohmann::json::parse(in, nullptr, false);
    if (existing.is_discarded() || !existing.is_object()) {
      if (err) *err = "config: invalid json in " + path;
      return false;
    }
    j = std::move(existing);
  }
  if (!j.contains(section) || !j[section].is_object()) j[section] = nlohmann::json::object();

  // Numbers and booleans keep their JSON type so LoadConfigFile reads them back.
  auto parsed = nlohmann::json::parse(value, nullptr, false);
  if (!parsed.is_discarded() && (parsed.is_number() || parsed.is_boolean())) {
    j[section][key] = parsed;
  } else {
    j[section][key] = value;
  }

  const auto parent = std::filesystem::path(path).parent_path();
  if (!parent.empty()) std::filesystem::create_directories(parent, ec);
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    if (err) *err = "config: cannot write " + path;
    return false;
  }
  out << j.dump(2);
  return static_cast<bool>(out);
}

}  // namespace taco
