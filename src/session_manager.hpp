#pragma once

#include "tool_stack.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace taco {

struct ChatMessage {
  std::string role;
  std::string content;
};

enum class EngineState {
  Idle,
  AwaitingSelection,
  CollectingParameters,
  ReadyToExecute,
  Executing,
  AwaitingChildCompletion,
  AwaitingDepthDecision,
};

std::string EngineStateName(EngineState state);

// A child push that hit the depth ceiling and waits for extend-or-cancel.
struct PendingPush {
  std::string tool_name;
  nlohmann::json seed_args = nlohmann::json::object();
};

// Everything one chat session owns. Engine operations take this by reference and lock `mu`
// for every read or mutation; nothing here is shared between sessions.
struct SessionContext {
  explicit SessionContext(std::string id, size_t max_stack_depth = 20)
      : session_id(std::move(id)), stack(max_stack_depth) {}

  std::string session_id;
  std::vector<ChatMessage> history;

  ToolStack stack;
  std::optional<std::string> original_request;
  EngineState state = EngineState::Idle;
  // Bumped whenever the workflow ends; completions carrying an older value are dropped.
  uint64_t generation = 0;

  bool awaiting_confirmation = false;
  std::optional<PendingPush> pending_push;
  std::string failing_parameter;
  int validation_failures = 0;

  std::mutex mu;
};

void AppendToHistory(SessionContext& session, const std::string& role, const std::string& content);
std::vector<ChatMessage> HistorySnapshot(SessionContext& session);
void ReplaceHistory(SessionContext& session, std::vector<ChatMessage> history);

class SessionManager {
 public:
  explicit SessionManager(size_t max_stack_depth = 20) : max_stack_depth_(max_stack_depth) {}

  std::string EnsureSessionId(const std::string& preferred);
  std::shared_ptr<SessionContext> GetOrCreate(const std::string& session_id);
  bool Remove(const std::string& session_id);
  size_t Count() const;

 private:
  size_t max_stack_depth_;
  mutable std::mutex mu_;
  std::unordered_map<std::string, std::shared_ptr<SessionContext>> sessions_;
};

bool SaveHistory(const std::string& path, const std::vector<ChatMessage>& history, std::string* err);
std::optional<std::vector<ChatMessage>> LoadHistory(const std::string& path, std::string* err);

std::string NewId(const std::string& prefix);

}  // namespace taco
