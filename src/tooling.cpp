#include "tooling.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace taco {
namespace {

static std::string Trim(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
  return s.substr(start, end - start);
}

static std::string ToLower(std::string s) {
  for (auto& ch : s) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  return s;
}

static std::optional<std::string> ExtractFirstJsonObject(const std::string& text) {
  auto pos = text.find('{');
  if (pos == std::string::npos) return std::nullopt;
  int depth = 0;
  bool in_string = false;
  bool escape = false;
  for (size_t i = pos; i < text.size(); i++) {
    char c = text[i];
    if (in_string) {
      if (escape) {
        escape = false;
      } else if (c == '\\') {
        escape = true;
      } else if (c == '"') {
        in_string = false;
      }
      continue;
    }
    if (c == '"') {
      in_string = true;
      continue;
    }
    if (c == '{') depth++;
    if (c == '}') {
      depth--;
      if (depth == 0) return text.substr(pos, i - pos + 1);
    }
  }
  return std::nullopt;
}

// Accepts "5.5", "5.5%", "$250,000" and similar user spellings.
static std::string CleanNumberText(const std::string& raw) {
  std::string out;
  out.reserve(raw.size());
  for (char ch : Trim(raw)) {
    if (ch == ',' || ch == '$' || ch == '%' || ch == '_') continue;
    out.push_back(ch);
  }
  return out;
}

static bool ParseDouble(const std::string& raw, double* out) {
  const auto text = CleanNumberText(raw);
  if (text.empty()) return false;
  errno = 0;
  char* end = nullptr;
  const double v = std::strtod(text.c_str(), &end);
  if (end == text.c_str() || *end != '\0' || errno == ERANGE) return false;
  *out = v;
  return true;
}

static bool ParseInteger(const std::string& raw, long long* out) {
  const auto text = CleanNumberText(raw);
  if (text.empty()) return false;
  errno = 0;
  char* end = nullptr;
  const long long v = std::strtoll(text.c_str(), &end, 10);
  if (end == text.c_str() || *end != '\0' || errno == ERANGE) return false;
  *out = v;
  return true;
}

static bool ParseBool(const std::string& raw, bool* out) {
  const auto v = ToLower(Trim(raw));
  if (v == "1" || v == "true" || v == "yes" || v == "y" || v == "on") {
    *out = true;
    return true;
  }
  if (v == "0" || v == "false" || v == "no" || v == "n" || v == "off") {
    *out = false;
    return true;
  }
  return false;
}

}  // namespace

ToolResult ToolResult::Ok(nlohmann::json value) {
  ToolResult r;
  r.kind = Kind::Value;
  r.value = std::move(value);
  return r;
}

ToolResult ToolResult::Needs(std::string child_tool, nlohmann::json seed_args) {
  ToolResult r;
  r.kind = Kind::NeedsTool;
  r.child_tool = std::move(child_tool);
  if (seed_args.is_object()) r.seed_args = std::move(seed_args);
  return r;
}

ToolResult ToolResult::Fail(std::string error_kind, std::string message) {
  ToolResult r;
  r.kind = Kind::Error;
  r.error_kind = std::move(error_kind);
  r.error = std::move(message);
  return r;
}

void DefaultChildResultProjection(const std::string& child_tool, const nlohmann::json& result, nlohmann::json* params) {
  if (!params) return;
  (*params)[child_tool + "_result"] = result;
}

const ParamSpec* ToolDescriptor::FindParameter(const std::string& param_name) const {
  for (const auto& p : parameters) {
    if (p.name == param_name) return &p;
  }
  return nullptr;
}

ToolRegistry::ToolRegistry(ToolRegistry&& other) noexcept {
  std::unique_lock<std::shared_mutex> lock(other.mu_);
  tools_ = std::move(other.tools_);
}

ToolRegistry& ToolRegistry::operator=(ToolRegistry&& other) noexcept {
  if (this == &other) return *this;
  std::unique_lock<std::shared_mutex> lock_other(other.mu_);
  std::unique_lock<std::shared_mutex> lock_this(mu_);
  tools_ = std::move(other.tools_);
  return *this;
}

bool ToolRegistry::RegisterTool(ToolDescriptor descriptor, std::string* err) {
  if (descriptor.name.empty()) {
    if (err) *err = "tool name is empty";
    return false;
  }
  if (!descriptor.tool) {
    if (err) *err = "tool " + descriptor.name + " has no implementation";
    return false;
  }
  for (size_t i = 0; i < descriptor.parameters.size(); i++) {
    for (size_t k = i + 1; k < descriptor.parameters.size(); k++) {
      if (descriptor.parameters[i].name == descriptor.parameters[k].name) {
        if (err) *err = "tool " + descriptor.name + " declares parameter " + descriptor.parameters[i].name + " twice";
        return false;
      }
    }
  }
  if (!descriptor.project_child_result) descriptor.project_child_result = DefaultChildResultProjection;

  std::unique_lock<std::shared_mutex> lock(mu_);
  const auto name = descriptor.name;
  tools_[name] = std::move(descriptor);
  return true;
}

bool ToolRegistry::HasTool(const std::string& name) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return tools_.find(name) != tools_.end();
}

std::optional<ToolDescriptor> ToolRegistry::Resolve(const std::string& name) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  auto it = tools_.find(name);
  if (it == tools_.end()) return std::nullopt;
  return it->second;
}

std::vector<ToolDescriptor> ToolRegistry::List() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  std::vector<ToolDescriptor> out;
  out.reserve(tools_.size());
  for (const auto& [_, d] : tools_) out.push_back(d);
  std::sort(out.begin(), out.end(), [](const ToolDescriptor& a, const ToolDescriptor& b) { return a.name < b.name; });
  return out;
}

std::string ToolRegistry::Summary() const {
  std::ostringstream oss;
  for (const auto& d : List()) {
    oss << "- " << d.name << "(";
    for (size_t i = 0; i < d.parameters.size(); i++) {
      if (i > 0) oss << ", ";
      oss << d.parameters[i].name << ": " << ParamTypeName(d.parameters[i].type);
    }
    oss << "): " << d.description << "\n";
  }
  return oss.str();
}

std::string ParamTypeName(ParamType type) {
  switch (type) {
    case ParamType::String:
      return "string";
    case ParamType::Number:
      return "number";
    case ParamType::Integer:
      return "integer";
    case ParamType::Boolean:
      return "boolean";
  }
  return "string";
}

bool CoerceParameter(const ParamSpec& spec, const nlohmann::json& raw, nlohmann::json* out, std::string* err) {
  nlohmann::json value;
  const std::string text = raw.is_string() ? raw.get<std::string>() : raw.dump();

  switch (spec.type) {
    case ParamType::String: {
      auto trimmed = raw.is_string() ? Trim(text) : text;
      if (trimmed.empty()) {
        if (err) *err = spec.name + " must not be empty";
        return false;
      }
      value = trimmed;
      break;
    }
    case ParamType::Number: {
      double d = 0.0;
      if (raw.is_number()) {
        d = raw.get<double>();
      } else if (!ParseDouble(text, &d)) {
        if (err) *err = spec.name + " must be a number, got \"" + text + "\"";
        return false;
      }
      value = d;
      break;
    }
    case ParamType::Integer: {
      long long n = 0;
      if (raw.is_number_integer()) {
        n = raw.get<long long>();
      } else if (!ParseInteger(text, &n)) {
        if (err) *err = spec.name + " must be a whole number, got \"" + text + "\"";
        return false;
      }
      value = n;
      break;
    }
    case ParamType::Boolean: {
      bool b = false;
      if (raw.is_boolean()) {
        b = raw.get<bool>();
      } else if (!ParseBool(text, &b)) {
        if (err) *err = spec.name + " must be yes or no, got \"" + text + "\"";
        return false;
      }
      value = b;
      break;
    }
  }

  if (spec.validator) {
    std::string verr;
    if (!spec.validator(value, &verr)) {
      if (err) *err = verr.empty() ? spec.name + " is not valid" : verr;
      return false;
    }
  }
  if (out) *out = std::move(value);
  return true;
}

std::vector<std::string> MissingParameters(const ToolDescriptor& descriptor, const nlohmann::json& collected) {
  std::vector<std::string> out;
  for (const auto& p : descriptor.parameters) {
    if (!collected.is_object() || !collected.contains(p.name)) out.push_back(p.name);
  }
  return out;
}

std::string DescribeTool(const ToolDescriptor& descriptor) {
  std::ostringstream oss;
  oss << "Tool: " << descriptor.name << "\n";
  oss << "Description: " << descriptor.description << "\n\n";
  oss << "Parameters:\n";
  if (descriptor.parameters.empty()) oss << "  (none)\n";
  for (const auto& p : descriptor.parameters) {
    oss << "  - " << p.name << " (" << ParamTypeName(p.type) << ")";
    if (!p.description.empty()) oss << " - " << p.description;
    oss << "\n";
  }
  if (!descriptor.usage.empty()) oss << "\nUsage:\n" << descriptor.usage << "\n";
  return oss.str();
}

std::optional<nlohmann::json> ParseJsonLoose(const std::string& text) {
  auto trimmed = Trim(text);
  if (trimmed.empty()) return std::nullopt;
  if (auto j = nlohmann::json::parse(trimmed, nullptr, false); !j.is_discarded()) return j;
  if (auto obj = ExtractFirstJsonObject(trimmed)) {
    auto j = nlohmann::json::parse(*obj, nullptr, false);
    if (!j.is_discarded()) return j;
  }
  return std::nullopt;
}

}  // namespace taco
