#include "context.hpp"

#include "config.hpp"
#include "log.hpp"

#include <filesystem>
#include <fstream>
#include <utility>

namespace taco {
namespace {

constexpr const char* kDefaultSuffix = "_default";

static std::string VariableText(const nlohmann::json& v) {
  return v.is_string() ? v.get<std::string>() : v.dump();
}

static bool ValidContextName(const std::string& name) {
  if (name.empty() || name == "." || name == "..") return false;
  return name.find('/') == std::string::npos && name.find('\\') == std::string::npos;
}

static std::vector<ContextTemplate> BuiltinContexts() {
  ContextTemplate chat;
  chat.name = "general_chat";
  chat.text =
      "You are having a conversation with a human user. Respond in a {style} tone.\n"
      "Current conversation topic: {topic}\n"
      "User information: {user_info}\n";
  chat.variables = {{"style", "helpful and friendly"},
                    {"topic", "general conversation"},
                    {"user_info", "No specific information provided"}};

  ContextTemplate code;
  code.name = "code_assistant";
  code.text =
      "You are a coding assistant helping with {language} programming.\n"
      "Expertise level: {expertise}\n"
      "Programming style: {style}\n"
      "Include explanations: {explanations}\n";
  code.variables = {{"language", "Python"},
                    {"expertise", "intermediate"},
                    {"style", "clean and readable"},
                    {"explanations", "yes"}};
  return {chat, code};
}

}  // namespace

std::string RenderTemplate(const std::string& text, const nlohmann::json& variables) {
  std::string out;
  out.reserve(text.size());
  size_t i = 0;
  while (i < text.size()) {
    if (text[i] == '{') {
      const auto close = text.find('}', i + 1);
      if (close != std::string::npos && close > i + 1) {
        const auto key = text.substr(i + 1, close - i - 1);
        if (variables.is_object() && variables.contains(key)) out += VariableText(variables[key]);
        i = close + 1;
        continue;
      }
    }
    out.push_back(text[i]);
    i++;
  }
  return out;
}

std::string ContextTemplate::Render() const {
  return RenderTemplate(text, variables);
}

std::string ContextTemplate::Description() const {
  size_t start = 0;
  while (start < text.size()) {
    auto end = text.find('\n', start);
    if (end == std::string::npos) end = text.size();
    auto line = text.substr(start, end - start);
    if (line.find_first_not_of(" \t\r") != std::string::npos) return line;
    start = end + 1;
  }
  return "Empty context";
}

ContextManager::ContextManager(std::string contexts_dir, std::string config_path)
    : contexts_dir_(std::move(contexts_dir)), config_path_(std::move(config_path)) {}

void ContextManager::Load() {
  std::map<std::string, ContextTemplate> loaded;
  for (auto& c : BuiltinContexts()) loaded[c.name] = std::move(c);

  std::error_code ec;
  if (!contexts_dir_.empty() && std::filesystem::is_directory(contexts_dir_, ec)) {
    for (const auto& entry : std::filesystem::directory_iterator(contexts_dir_, ec)) {
      if (!entry.is_regular_file() || entry.path().extension() != ".json") continue;
      std::ifstream in(entry.path(), std::ios::binary);
      auto j = nlohmann::json::parse(in, nullptr, false);
      if (j.is_discarded() || !j.is_object()) {
        LogWarn("context", "skip_invalid file=" + entry.path().string());
        continue;
      }
      ContextTemplate ctx;
      ctx.name = entry.path().stem().string();
      if (j.contains("template") && j["template"].is_string()) ctx.text = j["template"].get<std::string>();
      if (j.contains("variables") && j["variables"].is_object()) ctx.variables = j["variables"];
      loaded[ctx.name] = std::move(ctx);
    }
  }
  LogDebug("context", "loaded count=" + std::to_string(loaded.size()) + " dir=" + contexts_dir_);

  std::lock_guard<std::mutex> lock(mu_);
  contexts_ = std::move(loaded);
  if (active_ && contexts_.find(*active_) == contexts_.end()) active_.reset();
}

std::vector<ContextTemplate> ContextManager::List() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<ContextTemplate> out;
  out.reserve(contexts_.size());
  for (const auto& [_, c] : contexts_) out.push_back(c);
  return out;
}

std::optional<ContextTemplate> ContextManager::Find(const std::string& name) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = contexts_.find(name);
  if (it == contexts_.end()) return std::nullopt;
  return it->second;
}

bool ContextManager::Create(const std::string& name, const std::string& text, std::string* err) {
  if (!ValidContextName(name)) {
    if (err) *err = "context: invalid name '" + name + "'";
    return false;
  }
  std::lock_guard<std::mutex> lock(mu_);
  ContextTemplate ctx;
  ctx.name = name;
  ctx.text = text;
  if (!SaveLocked(ctx, err)) return false;
  contexts_[name] = std::move(ctx);
  return true;
}

bool ContextManager::SetVariable(const std::string& name,
                                 const std::string& key,
                                 const nlohmann::json& value,
                                 std::string* err) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = contexts_.find(name);
  if (it == contexts_.end()) {
    if (err) *err = "context: '" + name + "' not found";
    return false;
  }
  ContextTemplate updated = it->second;
  updated.variables[key] = value;
  if (!SaveLocked(updated, err)) return false;
  it->second = std::move(updated);
  return true;
}

bool ContextManager::SetActive(const std::string& name, std::string* err) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (contexts_.find(name) == contexts_.end()) {
      if (err) *err = "context: '" + name + "' not found";
      return false;
    }
    active_ = name;
  }
  LogDebug("context", "active=" + name);
  return PersistActive(name, err);
}

bool ContextManager::ClearActive(std::string* err) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    active_.reset();
  }
  return PersistActive("", err);
}

void ContextManager::RestoreActive(const std::string& name) {
  if (name.empty()) return;
  std::lock_guard<std::mutex> lock(mu_);
  if (contexts_.find(name) == contexts_.end()) {
    LogWarn("context", "unknown_active name=" + name);
    return;
  }
  active_ = name;
}

std::optional<std::string> ContextManager::Active() const {
  std::lock_guard<std::mutex> lock(mu_);
  return active_;
}

std::string ContextManager::ActiveContent() const {
  std::lock_guard<std::mutex> lock(mu_);
  if (!active_) return "";
  auto it = contexts_.find(*active_);
  return it == contexts_.end() ? std::string() : it->second.Render();
}

nlohmann::json ContextManager::ParameterDefaults() const {
  std::lock_guard<std::mutex> lock(mu_);
  nlohmann::json out = nlohmann::json::object();
  if (!active_) return out;
  auto it = contexts_.find(*active_);
  if (it == contexts_.end()) return out;
  const std::string suffix = kDefaultSuffix;
  for (auto v = it->second.variables.begin(); v != it->second.variables.end(); ++v) {
    const auto& key = v.key();
    if (key.size() > suffix.size() && key.compare(key.size() - suffix.size(), suffix.size(), suffix) == 0) {
      out[key.substr(0, key.size() - suffix.size())] = v.value();
    }
  }
  return out;
}

bool ContextManager::SaveLocked(const ContextTemplate& ctx, std::string* err) const {
  if (contexts_dir_.empty()) return true;
  std::error_code ec;
  std::filesystem::create_directories(contexts_dir_, ec);
  const auto path = std::filesystem::path(contexts_dir_) / (ctx.name + ".json");
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    if (err) *err = "context: cannot write " + path.string();
    return false;
  }
  nlohmann::json j = {{"template", ctx.text}, {"variables", ctx.variables}};
  out << j.dump(2);
  if (!out) {
    if (err) *err = "context: write failed for " + path.string();
    return false;
  }
  return true;
}

bool ContextManager::PersistActive(const std::string& name, std::string* err) const {
  if (config_path_.empty()) return true;
  return SetConfigValue(config_path_, "context.active", name, err);
}

}  // namespace taco
