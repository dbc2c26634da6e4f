#pragma once

#include <nlohmann/json.hpp>

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace taco {

// A named system-prompt template. `{key}` placeholders are filled from `variables`;
// variables named "<param>_default" also seed tool parameters while the context is active.
struct ContextTemplate {
  std::string name;
  std::string text;
  nlohmann::json variables = nlohmann::json::object();

  std::string Render() const;
  // First non-empty line of the template.
  std::string Description() const;
};

// Replaces known placeholders, then drops any that are left.
std::string RenderTemplate(const std::string& text, const nlohmann::json& variables);

class ContextManager {
 public:
  // `config_path` receives context.active when the active context changes; empty disables that.
  ContextManager(std::string contexts_dir, std::string config_path);

  // Built-in contexts first, then every *.json under the contexts dir (same name wins).
  // Unreadable files are skipped with a warning. A missing dir is not an error.
  void Load();

  std::vector<ContextTemplate> List() const;
  std::optional<ContextTemplate> Find(const std::string& name) const;

  bool Create(const std::string& name, const std::string& text, std::string* err);
  bool SetVariable(const std::string& name, const std::string& key, const nlohmann::json& value, std::string* err);

  bool SetActive(const std::string& name, std::string* err);
  bool ClearActive(std::string* err);
  // Applies a name read from config without writing it back; unknown names are ignored.
  void RestoreActive(const std::string& name);

  std::optional<std::string> Active() const;
  // Rendered text of the active context, or empty when none is active.
  std::string ActiveContent() const;
  // {"workingdir": "~/proj", ...} from the active context's "*_default" variables.
  nlohmann::json ParameterDefaults() const;

 private:
  bool SaveLocked(const ContextTemplate& ctx, std::string* err) const;
  bool PersistActive(const std::string& name, std::string* err) const;

  std::string contexts_dir_;
  std::string config_path_;
  mutable std::mutex mu_;
  std::map<std::string, ContextTemplate> contexts_;
  std::optional<std::string> active_;
};

}  // namespace taco
