#include "prompts.hpp"

#include <sstream>

namespace taco {
namespace {

constexpr size_t kMaxHistoryMessages = 20;

static void AppendHistory(std::ostringstream& oss, const std::vector<ChatMessage>& history) {
  if (history.empty()) {
    oss << "(no earlier messages)\n";
    return;
  }
  const size_t start = history.size() > kMaxHistoryMessages ? history.size() - kMaxHistoryMessages : 0;
  for (size_t i = start; i < history.size(); i++) {
    oss << history[i].role << ": " << history[i].content << "\n";
  }
}

static void AppendContext(std::ostringstream& oss, const std::string& context) {
  if (context.empty()) return;
  oss << "Context:\n" << context;
  if (context.back() != '\n') oss << "\n";
  oss << "\n";
}

}  // namespace

std::string RenderSelectionPrompt(const std::vector<ChatMessage>& history,
                                  const std::string& registry_summary,
                                  const std::string& original_request,
                                  const std::string& context) {
  std::ostringstream oss;
  AppendContext(oss, context);
  oss << "You are TACO, a terminal assistant that can call tools.\n\n";
  oss << "Available tools:\n";
  oss << (registry_summary.empty() ? "(none)" : registry_summary) << "\n\n";
  oss << "Conversation so far:\n";
  AppendHistory(oss, history);
  oss << "\nCurrent request: " << original_request << "\n\n";
  oss << "If a tool is needed, answer with exactly one JSON object and nothing else:\n";
  oss << "{\"tool_call\": {\"name\": \"<tool name>\", \"parameters\": {\"<param>\": <value>}}}\n";
  oss << "Only include parameters the user actually stated; missing ones will be asked for.\n";
  oss << "If no tool is needed, answer with:\n";
  oss << "{\"reply\": \"<your answer to the user>\"}\n";
  return oss.str();
}

std::string RenderContinuityPrompt(const std::string& stack_summary,
                                   const std::optional<std::string>& original_request,
                                   const std::vector<ChatMessage>& history,
                                   const std::string& new_message,
                                   const std::string& context) {
  std::ostringstream oss;
  AppendContext(oss, context);
  oss << "The user is in the middle of a tool workflow.\n\n";
  oss << stack_summary << "\n\n";
  if (original_request) oss << "The workflow started from: " << *original_request << "\n\n";
  oss << "Conversation so far:\n";
  AppendHistory(oss, history);
  oss << "\nNew message: " << new_message << "\n\n";
  oss << "Is the new message an answer or follow-up for the current workflow, or an unrelated new topic?\n";
  oss << "Answer with exactly one JSON object: {\"verdict\": \"related\"} or {\"verdict\": \"unrelated\"}\n";
  return oss.str();
}

}  // namespace taco
