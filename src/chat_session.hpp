#pragma once

#include "context.hpp"
#include "orchestrator.hpp"
#include "providers/provider.hpp"
#include "session_manager.hpp"
#include "tooling.hpp"

#include <functional>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace taco {

struct ChatTurn {
  std::string text;
  std::vector<WorkflowOutcome> outcomes;
  bool exit = false;
};

// Routes one line of user input: slash commands, yes/no answers the engine is waiting for,
// new requests, and input for the active tool. Ready tools run until the workflow needs the
// user again.
class ChatSession {
 public:
  using ModelGetter = std::function<std::string()>;
  using ModelSetter = std::function<void(const std::string&)>;

  ChatSession(Orchestrator& engine,
              const ToolRegistry& registry,
              std::shared_ptr<SessionContext> session,
              IProvider* provider = nullptr,
              ModelGetter current_model = {},
              ModelSetter switch_model = {},
              ContextManager* contexts = nullptr);

  ChatTurn HandleInput(const std::string& line);

  bool SaveHistoryTo(const std::string& path, std::string* err);
  bool LoadHistoryFrom(const std::string& path, std::string* err);

  SessionContext& Session() { return *session_; }

 private:
  ChatTurn HandleCommand(const std::string& line);
  ChatTurn RouteText(const std::string& text);
  void Drive(EngineReply reply, ChatTurn* turn);

  std::string HelpText() const;
  std::string StatusText();
  std::string ToolsText() const;
  std::string ModelsText();
  std::string ModelCommand(const std::vector<std::string>& parts);
  std::string ContextCommand(const std::string& line, const std::vector<std::string>& parts);

  Orchestrator& engine_;
  const ToolRegistry& registry_;
  std::shared_ptr<SessionContext> session_;
  IProvider* provider_;
  ModelGetter current_model_;
  ModelSetter switch_model_;
  ContextManager* contexts_;
};

// Reads lines from `in` until EOF or an exit command, printing replies to `out`.
void RunChatLoop(ChatSession& chat, std::istream& in, std::ostream& out);

}  // namespace taco
