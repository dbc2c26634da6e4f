#pragma once

#include "providers/provider.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace taco {

struct SelectionDecision {
  enum class Kind { NoToolNeeded, UseTool };

  Kind kind = Kind::NoToolNeeded;
  std::string reply;
  std::string tool_name;
  nlohmann::json arguments = nlohmann::json::object();
};

enum class Continuity { Related, Unrelated };

// The decision-making side of the engine. A nullopt return means the collaborator could not
// be reached; `err` carries the reason.
class IReasoner {
 public:
  virtual ~IReasoner() = default;

  virtual std::optional<SelectionDecision> Select(const std::string& prompt, std::string* err) = 0;
  virtual std::optional<Continuity> JudgeContinuity(const std::string& prompt, std::string* err) = 0;
};

class ProviderReasoner : public IReasoner {
 public:
  ProviderReasoner(IProvider& provider, std::string model);

  void SetModel(std::string model) { model_ = std::move(model); }
  const std::string& Model() const { return model_; }

  std::optional<SelectionDecision> Select(const std::string& prompt, std::string* err) override;
  std::optional<Continuity> JudgeContinuity(const std::string& prompt, std::string* err) override;

 private:
  std::optional<std::string> Ask(const std::string& prompt, std::string* err);

  IProvider& provider_;
  std::string model_;
};

// Accepts bare or fenced JSON ({"tool_call": {"name", "parameters"|"arguments"}} or
// {"reply": ...}); anything else is a plain reply.
SelectionDecision ParseSelectionDecision(const std::string& text);

// {"verdict": "..."} first, then a keyword scan. Undecidable answers count as related.
Continuity ParseContinuityVerdict(const std::string& text);

}  // namespace taco
