#pragma once

#include <nlohmann/json.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace taco {

enum class ParamType { String, Number, Integer, Boolean };

// Runs after type coercion. Returning false rejects the value; `err` says why.
using ParamValidator = std::function<bool(const nlohmann::json& value, std::string* err)>;

struct ParamSpec {
  std::string name;
  ParamType type = ParamType::String;
  std::string description;
  std::string question;
  ParamValidator validator;
};

struct ToolResult {
  enum class Kind { Value, NeedsTool, Error };

  Kind kind = Kind::Value;
  nlohmann::json value;
  std::string child_tool;
  nlohmann::json seed_args = nlohmann::json::object();
  std::string error_kind;
  std::string error;

  static ToolResult Ok(nlohmann::json value);
  static ToolResult Needs(std::string child_tool, nlohmann::json seed_args);
  static ToolResult Fail(std::string error_kind, std::string message);
};

class ITool {
 public:
  virtual ~ITool() = default;
  virtual ToolResult Invoke(const nlohmann::json& params) = 0;
};

using ToolHandler = std::function<ToolResult(const nlohmann::json& params)>;

class FunctionTool : public ITool {
 public:
  explicit FunctionTool(ToolHandler handler) : handler_(std::move(handler)) {}
  ToolResult Invoke(const nlohmann::json& params) override { return handler_(params); }

 private:
  ToolHandler handler_;
};

// How a finished child's value lands in the parent's parameters before the parent resumes.
using ChildResultProjection =
    std::function<void(const std::string& child_tool, const nlohmann::json& result, nlohmann::json* params)>;

// Stores the value under "<child_tool>_result".
void DefaultChildResultProjection(const std::string& child_tool, const nlohmann::json& result, nlohmann::json* params);

struct ToolDescriptor {
  std::string name;
  std::string description;
  std::string usage;
  std::vector<ParamSpec> parameters;
  // Filled from the workflow's original request when the selection did not supply it.
  std::string request_parameter;
  ChildResultProjection project_child_result;
  std::shared_ptr<ITool> tool;

  const ParamSpec* FindParameter(const std::string& param_name) const;
};

class ToolRegistry {
 public:
  ToolRegistry() = default;
  ToolRegistry(const ToolRegistry&) = delete;
  ToolRegistry& operator=(const ToolRegistry&) = delete;
  ToolRegistry(ToolRegistry&& other) noexcept;
  ToolRegistry& operator=(ToolRegistry&& other) noexcept;

  bool RegisterTool(ToolDescriptor descriptor, std::string* err);
  bool HasTool(const std::string& name) const;
  std::optional<ToolDescriptor> Resolve(const std::string& name) const;
  std::vector<ToolDescriptor> List() const;

  // One line per tool, "- name(param: type, ...): description", sorted by name.
  std::string Summary() const;

 private:
  mutable std::shared_mutex mu_;
  std::unordered_map<std::string, ToolDescriptor> tools_;
};

std::string ParamTypeName(ParamType type);

// Converts user text (or a seeded JSON value) to the declared type, then runs the validator.
bool CoerceParameter(const ParamSpec& spec, const nlohmann::json& raw, nlohmann::json* out, std::string* err);

std::vector<std::string> MissingParameters(const ToolDescriptor& descriptor, const nlohmann::json& collected);

std::string DescribeTool(const ToolDescriptor& descriptor);

std::optional<nlohmann::json> ParseJsonLoose(const std::string& text);

}  // namespace taco
