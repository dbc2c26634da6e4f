#include "reasoner.hpp"

#include "log.hpp"
#include "tooling.hpp"

#include <algorithm>
#include <cctype>
#include <utility>
#include <vector>

namespace taco {
namespace {

static std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

static std::string Trim(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
  return s.substr(start, end - start);
}

// Lowercase alphabetic words; "Verdict: Unrelated." -> {"verdict", "unrelated"}.
static std::vector<std::string> Words(const std::string& text) {
  std::vector<std::string> out;
  std::string cur;
  for (char ch : text) {
    if (std::isalpha(static_cast<unsigned char>(ch))) {
      cur.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    } else if (!cur.empty()) {
      out.push_back(cur);
      cur.clear();
    }
  }
  if (!cur.empty()) out.push_back(cur);
  return out;
}

static SelectionDecision PlainReply(std::string text) {
  SelectionDecision d;
  d.kind = SelectionDecision::Kind::NoToolNeeded;
  d.reply = std::move(text);
  return d;
}

}  // namespace

ProviderReasoner::ProviderReasoner(IProvider& provider, std::string model)
    : provider_(provider), model_(std::move(model)) {}

std::optional<std::string> ProviderReasoner::Ask(const std::string& prompt, std::string* err) {
  ChatRequest req;
  req.model = model_;
  req.temperature = 0.0f;
  req.messages.push_back(ChatMessage{"user", prompt});
  std::string provider_err;
  auto resp = provider_.ChatOnce(req, &provider_err);
  if (!resp) {
    if (err) *err = provider_err.empty() ? provider_.Name() + ": no response" : provider_err;
    return std::nullopt;
  }
  return resp->content;
}

std::optional<SelectionDecision> ProviderReasoner::Select(const std::string& prompt, std::string* err) {
  auto text = Ask(prompt, err);
  if (!text) return std::nullopt;
  LogDebug("reasoner", "selection_raw=" + TruncateForLog(*text, 400));
  return ParseSelectionDecision(*text);
}

std::optional<Continuity> ProviderReasoner::JudgeContinuity(const std::string& prompt, std::string* err) {
  auto text = Ask(prompt, err);
  if (!text) return std::nullopt;
  LogDebug("reasoner", "continuity_raw=" + TruncateForLog(*text, 200));
  return ParseContinuityVerdict(*text);
}

SelectionDecision ParseSelectionDecision(const std::string& text) {
  auto j = ParseJsonLoose(text);
  if (!j || !j->is_object()) return PlainReply(Trim(text));

  if (j->contains("tool_call") && (*j)["tool_call"].is_object()) {
    const auto& call = (*j)["tool_call"];
    if (call.contains("name") && call["name"].is_string() && !call["name"].get<std::string>().empty()) {
      SelectionDecision d;
      d.kind = SelectionDecision::Kind::UseTool;
      d.tool_name = call["name"].get<std::string>();
      if (call.contains("parameters") && call["parameters"].is_object()) {
        d.arguments = call["parameters"];
      } else if (call.contains("arguments") && call["arguments"].is_object()) {
        d.arguments = call["arguments"];
      }
      return d;
    }
  }
  if (j->contains("reply") && (*j)["reply"].is_string()) return PlainReply((*j)["reply"].get<std::string>());
  return PlainReply(Trim(text));
}

Continuity ParseContinuityVerdict(const std::string& text) {
  if (auto j = ParseJsonLoose(text); j && j->is_object() && j->contains("verdict") && (*j)["verdict"].is_string()) {
    return ToLower((*j)["verdict"].get<std::string>()) == "unrelated" ? Continuity::Unrelated : Continuity::Related;
  }
  // Only a leading verdict counts; "this is not unrelated" must not end the workflow.
  const auto words = Words(text);
  size_t i = 0;
  if (i < words.size() && (words[i] == "verdict" || words[i] == "answer")) i++;
  if (i < words.size() && words[i] == "unrelated") return Continuity::Unrelated;
  return Continuity::Related;
}

}  // namespace taco
