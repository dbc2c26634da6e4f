#include "abandonment.hpp"

#include <cctype>
#include <string>

namespace taco {
namespace {

static std::string NormalizeForMatch(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char ch : s) {
    if (ch == '\'') continue;
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
  }
  return out;
}

static std::string TrimPunct(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && (std::isspace(static_cast<unsigned char>(s[start])) || std::ispunct(static_cast<unsigned char>(s[start])))) start++;
  size_t end = s.size();
  while (end > start && (std::isspace(static_cast<unsigned char>(s[end - 1])) || std::ispunct(static_cast<unsigned char>(s[end - 1])))) end--;
  return s.substr(start, end - start);
}

}  // namespace

bool IsExplicitContextSwitch(const std::string& text) {
  static const char* kPhrases[] = {
      "forget about", "never mind", "nevermind", "lets talk about", "change the subject", "different question", "something else",
  };
  const auto lower = NormalizeForMatch(text);
  for (const char* phrase : kPhrases) {
    if (lower.find(phrase) != std::string::npos) return true;
  }
  return false;
}

std::optional<bool> ParseYesNo(const std::string& text) {
  const auto v = TrimPunct(NormalizeForMatch(text));
  if (v == "y" || v == "yes" || v == "yeah" || v == "yep" || v == "sure" || v == "ok" || v == "okay" || v == "continue") {
    return true;
  }
  if (v == "n" || v == "no" || v == "nope" || v == "cancel" || v == "stop" || v == "abort") return false;
  return std::nullopt;
}

}  // namespace taco
