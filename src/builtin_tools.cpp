#include "builtin_tools.hpp"

#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <utility>
#include <vector>

namespace taco {
namespace {

static double Round2(double v) {
  return std::round(v * 100.0) / 100.0;
}

static std::string ToUpper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return s;
}

static std::string StringParam(const nlohmann::json& params, const char* key) {
  if (!params.contains(key) || !params[key].is_string()) return "";
  return params[key].get<std::string>();
}

static bool ValidateUnit(const nlohmann::json& value, std::string* err) {
  if (value.is_string() && NormalizeTemperatureUnit(value.get<std::string>())) return true;
  if (err) *err = "valid units are Celsius/C, Fahrenheit/F, Kelvin/K";
  return false;
}

static bool ValidateFilename(const nlohmann::json& value, std::string* err) {
  const auto name = value.is_string() ? value.get<std::string>() : std::string();
  if (name.find('/') != std::string::npos || name.find('\\') != std::string::npos || name == "." || name == "..") {
    if (err) *err = "filename must not contain a directory";
    return false;
  }
  return true;
}

static ParamSpec Param(std::string name, ParamType type, std::string description, std::string question = "") {
  ParamSpec p;
  p.name = std::move(name);
  p.type = type;
  p.description = std::move(description);
  p.question = std::move(question);
  return p;
}

static ToolDescriptor MakeSaveFile() {
  ToolDescriptor d;
  d.name = "save_file";
  d.description = "Write content to a file under a directory";
  d.usage = R"json({"tool_call": {"name": "save_file", "parameters": {"path": "~/proj", "filename": "main.py", "content": "print(1)"}}})json";
  d.parameters.push_back(Param("path", ParamType::String, "directory to write into", "Which directory should the file go in?"));
  auto filename = Param("filename", ParamType::String, "file name without directory", "What should the file be called?");
  filename.validator = ValidateFilename;
  d.parameters.push_back(std::move(filename));
  d.parameters.push_back(Param("content", ParamType::String, "file contents", "What should the file contain?"));
  d.tool = std::make_shared<FunctionTool>([](const nlohmann::json& params) {
    const auto dir = std::filesystem::path(ExpandUser(StringParam(params, "path")));
    const auto content = StringParam(params, "content");
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) return ToolResult::Fail("io", "cannot create directory " + dir.string() + ": " + ec.message());
    const auto full = dir / StringParam(params, "filename");
    std::ofstream out(full, std::ios::binary | std::ios::trunc);
    if (!out) return ToolResult::Fail("io", "cannot open " + full.string() + " for writing");
    out << content;
    if (!out) return ToolResult::Fail("io", "write failed for " + full.string());
    return ToolResult::Ok({{"path", full.string()}, {"bytes", content.size()}});
  });
  return d;
}

static ToolDescriptor MakeCreateCode(const TacoConfig& cfg, IProvider* provider, ModelNameFn current_model) {
  ToolDescriptor d;
  d.name = "create_code";
  d.description = "Generate code from a natural language request and save it to a working directory";
  d.usage = R"({"tool_call": {"name": "create_code", "parameters": {"prompt": "a python script that prints primes", "workingdir": "~/code_projects"}}})";
  d.parameters.push_back(Param("prompt", ParamType::String, "what the code should do"));
  std::string question = "Which directory should the code be saved in?";
  if (!cfg.create_code_workingdir.empty()) question += " (configured default: " + cfg.create_code_workingdir + ")";
  d.parameters.push_back(Param("workingdir", ParamType::String, "directory for the generated files", question));
  d.request_parameter = "prompt";

  d.tool = std::make_shared<FunctionTool>([provider, current_model](const nlohmann::json& params) {
    if (params.contains("save_file_result")) {
      const auto& saved = params["save_file_result"];
      nlohmann::json out = {{"status", "complete"}};
      if (saved.is_object() && saved.contains("path")) out["path"] = saved["path"];
      if (params.contains("language")) out["language"] = params["language"];
      if (params.contains("description")) out["description"] = params["description"];
      return ToolResult::Ok(out);
    }
    if (!provider) return ToolResult::Fail("unavailable", "no model backend configured");

    std::ostringstream prompt;
    prompt << "Generate code for the following request:\n" << StringParam(params, "prompt") << "\n\n";
    prompt << "Return only a JSON object with the keys \"code\", \"language\", \"filename\" and \"description\".\n";

    ChatRequest req;
    req.model = current_model ? current_model() : std::string();
    req.messages.push_back(ChatMessage{"user", prompt.str()});
    std::string err;
    auto resp = provider->ChatOnce(req, &err);
    if (!resp) return ToolResult::Fail("generation", err.empty() ? "model returned nothing" : err);

    std::string code = resp->content;
    std::string filename = "generated_code.txt";
    nlohmann::json seed;
    if (auto j = ParseJsonLoose(resp->content); j && j->is_object()) {
      if (j->contains("code") && (*j)["code"].is_string()) code = (*j)["code"].get<std::string>();
      if (j->contains("filename") && (*j)["filename"].is_string()) {
        const auto suggested = std::filesystem::path((*j)["filename"].get<std::string>()).filename().string();
        if (!suggested.empty()) filename = suggested;
      }
    } else {
      LogDebug("tool-call", "create_code response was not json; saving raw text");
    }
    seed["path"] = StringParam(params, "workingdir");
    seed["filename"] = filename;
    seed["content"] = code;
    return ToolResult::Needs("save_file", seed);
  });
  return d;
}

static ToolDescriptor MakeConvertTemperature() {
  ToolDescriptor d;
  d.name = "convert_temperature";
  d.description = "Convert temperature between Celsius, Fahrenheit, and Kelvin";
  d.usage = R"({"tool_call": {"name": "convert_temperature", "parameters": {"value": 32, "from_unit": "F", "to_unit": "C"}}})";
  d.parameters.push_back(Param("value", ParamType::Number, "temperature to convert", "What temperature should be converted?"));
  auto from = Param("from_unit", ParamType::String, "C, F or K", "Which unit is it in (C, F or K)?");
  from.validator = ValidateUnit;
  auto to = Param("to_unit", ParamType::String, "C, F or K", "Which unit should it be converted to (C, F or K)?");
  to.validator = ValidateUnit;
  d.parameters.push_back(std::move(from));
  d.parameters.push_back(std::move(to));
  d.tool = std::make_shared<FunctionTool>([](const nlohmann::json& params) {
    const auto from = NormalizeTemperatureUnit(StringParam(params, "from_unit"));
    const auto to = NormalizeTemperatureUnit(StringParam(params, "to_unit"));
    if (!from || !to || !params.contains("value") || !params["value"].is_number()) {
      return ToolResult::Fail("invalid_argument", "value, from_unit and to_unit are required");
    }
    auto v = ConvertTemperature(params["value"].get<double>(), *from, *to);
    if (!v) return ToolResult::Fail("invalid_argument", "unsupported conversion");
    return ToolResult::Ok(*v);
  });
  return d;
}

static ToolDescriptor MakeAnalyzeText() {
  ToolDescriptor d;
  d.name = "analyze_text";
  d.description = "Analyze text and return word, character and sentence statistics";
  d.usage = R"({"tool_call": {"name": "analyze_text", "parameters": {"text": "This is a sample text to analyze."}}})";
  d.parameters.push_back(Param("text", ParamType::String, "text to analyze", "What text should be analyzed?"));
  d.tool = std::make_shared<FunctionTool>(
      [](const nlohmann::json& params) { return ToolResult::Ok(AnalyzeText(StringParam(params, "text"))); });
  return d;
}

static ToolDescriptor MakeCompoundInterest() {
  ToolDescriptor d;
  d.name = "calculate_compound_interest";
  d.description = "Calculate compound interest for an investment";
  d.usage = R"({"tool_call": {"name": "calculate_compound_interest", "parameters": {"principal": 10000, "rate": 5, "time": 10, "compounds_per_year": 12}}})";
  d.parameters.push_back(Param("principal", ParamType::Number, "initial investment", "How much is invested?"));
  d.parameters.push_back(Param("rate", ParamType::Number, "annual rate, 0.05 or 5 both mean 5%", "What is the annual interest rate?"));
  d.parameters.push_back(Param("time", ParamType::Number, "years", "For how many years?"));
  auto compounds = Param("compounds_per_year", ParamType::Integer, "compounding periods per year",
                         "How many times per year is interest compounded?");
  compounds.validator = [](const nlohmann::json& value, std::string* err) {
    if (value.is_number_integer() && value.get<long long>() > 0) return true;
    if (err) *err = "compounds_per_year must be at least 1";
    return false;
  };
  d.parameters.push_back(std::move(compounds));
  d.tool = std::make_shared<FunctionTool>([](const nlohmann::json& params) {
    const double principal = params.value("principal", 0.0);
    double rate = params.value("rate", 0.0);
    const double time = params.value("time", 0.0);
    const double n = static_cast<double>(params.value("compounds_per_year", 12LL));
    if (rate > 1.0) rate /= 100.0;
    const double final_amount = principal * std::pow(1.0 + rate / n, n * time);
    return ToolResult::Ok({{"final_amount", Round2(final_amount)},
                           {"interest_earned", Round2(final_amount - principal)},
                           {"input_rate_percent", rate * 100.0}});
  });
  return d;
}

}  // namespace

std::optional<char> NormalizeTemperatureUnit(const std::string& unit) {
  const auto u = ToUpper(unit);
  if (u == "C" || u == "CELSIUS") return 'C';
  if (u == "F" || u == "FAHRENHEIT") return 'F';
  if (u == "K" || u == "KELVIN") return 'K';
  return std::nullopt;
}

std::optional<double> ConvertTemperature(double value, char from, char to) {
  double celsius = 0.0;
  switch (from) {
    case 'C':
      celsius = value;
      break;
    case 'F':
      celsius = (value - 32.0) * 5.0 / 9.0;
      break;
    case 'K':
      celsius = value - 273.15;
      break;
    default:
      return std::nullopt;
  }
  switch (to) {
    case 'C':
      return Round2(celsius);
    case 'F':
      return Round2(celsius * 9.0 / 5.0 + 32.0);
    case 'K':
      return Round2(celsius + 273.15);
    default:
      return std::nullopt;
  }
}

nlohmann::json AnalyzeText(const std::string& text) {
  std::istringstream iss(text);
  std::vector<std::string> words;
  for (std::string w; iss >> w;) words.push_back(w);
  size_t letters = 0;
  for (const auto& w : words) letters += w.size();
  const auto sentences = std::count_if(text.begin(), text.end(), [](char c) { return c == '.' || c == '!' || c == '?'; });

  nlohmann::json out;
  out["word_count"] = words.size();
  out["char_count"] = text.size();
  out["avg_word_length"] = Round2(static_cast<double>(letters) / static_cast<double>(std::max<size_t>(words.size(), 1)));
  out["sentence_count"] = sentences;
  return out;
}

std::optional<ToolRegistry> BuildDefaultToolRegistry(const TacoConfig& cfg,
                                                     IProvider* provider,
                                                     ModelNameFn current_model,
                                                     std::string* err) {
  ToolRegistry registry;
  std::vector<ToolDescriptor> tools;
  tools.push_back(MakeCreateCode(cfg, provider, std::move(current_model)));
  tools.push_back(MakeSaveFile());
  tools.push_back(MakeConvertTemperature());
  tools.push_back(MakeAnalyzeText());
  tools.push_back(MakeCompoundInterest());
  for (auto& t : tools) {
    if (!registry.RegisterTool(std::move(t), err)) return std::nullopt;
  }
  return std::make_optional<ToolRegistry>(std::move(registry));
}

}  // namespace taco
