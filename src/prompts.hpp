#pragma once

#include "session_manager.hpp"

#include <optional>
#include <string>
#include <vector>

namespace taco {

// Asks for one JSON object: {"tool_call": {"name": ..., "parameters": {...}}} or {"reply": "..."}.
// A non-empty `context` (the active context's text) leads the prompt.
std::string RenderSelectionPrompt(const std::vector<ChatMessage>& history,
                                  const std::string& registry_summary,
                                  const std::string& original_request,
                                  const std::string& context = std::string());

// Asks for {"verdict": "related"} or {"verdict": "unrelated"} about `new_message`.
std::string RenderContinuityPrompt(const std::string& stack_summary,
                                   const std::optional<std::string>& original_request,
                                   const std::vector<ChatMessage>& history,
                                   const std::string& new_message,
                                   const std::string& context = std::string());

}  // namespace taco
