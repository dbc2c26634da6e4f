#include "chat_session.hpp"

#include "abandonment.hpp"
#include "log.hpp"

#include <cctype>
#include <iostream>
#include <sstream>
#include <utility>

namespace taco {
namespace {

// Upper bound on tool runs per user turn. A parent that keeps re-requesting a child never
// grows the stack, so the depth limit alone does not stop it.
constexpr int kMaxAutoSteps = 256;

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

static std::vector<std::string> SplitWords(const std::string& s) {
  std::istringstream iss(s);
  std::vector<std::string> out;
  for (std::string w; iss >> w;) out.push_back(w);
  return out;
}

// "/status" is a command; "/home/me/code" is an answer that happens to be a path.
static bool IsCommand(const std::string& text) {
  if (text.empty() || text.front() != '/') return false;
  const auto word_end = text.find_first_of(" \t");
  return text.substr(1, word_end == std::string::npos ? std::string::npos : word_end - 1).find('/') == std::string::npos;
}

// Text after the first `n` words of `line`, with surrounding whitespace removed.
static std::string RestAfterWords(const std::string& line, size_t n) {
  size_t pos = 0;
  for (size_t i = 0; i < n; i++) {
    pos = line.find_first_not_of(" \t", pos);
    if (pos == std::string::npos) return "";
    pos = line.find_first_of(" \t", pos);
    if (pos == std::string::npos) return "";
  }
  return Trim(line.substr(pos));
}

static void AppendLine(std::string* text, const std::string& line) {
  if (line.empty()) return;
  if (!text->empty()) text->push_back('\n');
  *text += line;
}

}  // namespace

ChatSession::ChatSession(Orchestrator& engine,
                         const ToolRegistry& registry,
                         std::shared_ptr<SessionContext> session,
                         IProvider* provider,
                         ModelGetter current_model,
                         ModelSetter switch_model,
                         ContextManager* contexts)
    : engine_(engine),
      registry_(registry),
      session_(std::move(session)),
      provider_(provider),
      current_model_(std::move(current_model)),
      switch_model_(std::move(switch_model)),
      contexts_(contexts) {}

ChatTurn ChatSession::HandleInput(const std::string& line) {
  const auto text = Trim(line);
  if (text.empty()) {
    ChatTurn turn;
    turn.text = engine_.HandleEmptyInput(*session_).message;
    return turn;
  }
  if (IsCommand(text)) return HandleCommand(text);

  AppendToHistory(*session_, "user", text);
  auto turn = RouteText(text);
  if (!turn.text.empty()) AppendToHistory(*session_, "assistant", turn.text);
  return turn;
}

ChatTurn ChatSession::RouteText(const std::string& text) {
  ChatTurn turn;
  const auto status = engine_.Status(*session_);

  if (status.awaiting_confirmation || status.state == EngineState::AwaitingDepthDecision) {
    auto answer = ParseYesNo(text);
    if (!answer) {
      turn.text = "Please answer yes or no.";
      return turn;
    }
    auto reply = status.awaiting_confirmation ? engine_.ConfirmContinue(*session_, *answer)
                                              : engine_.ResolveDepthLimit(*session_, *answer);
    Drive(std::move(reply), &turn);
    return turn;
  }

  if (status.state == EngineState::Idle) {
    Drive(engine_.SubmitUserRequest(*session_, text), &turn);
  } else {
    Drive(engine_.DetectContextSwitch(*session_, text), &turn);
  }
  return turn;
}

void ChatSession::Drive(EngineReply reply, ChatTurn* turn) {
  for (int step = 0;; step++) {
    if (reply.stale) return;
    if (reply.outcome) turn->outcomes.push_back(*reply.outcome);
    AppendLine(&turn->text, reply.message);
    if (reply.state != EngineState::ReadyToExecute) return;
    if (step >= kMaxAutoSteps) {
      LogWarn("chat", "auto_execute_paused steps=" + std::to_string(step));
      AppendLine(&turn->text, "Paused after " + std::to_string(step) + " tool runs. Send any message to continue or /cancel.");
      return;
    }
    reply = engine_.ExecuteActiveTool(*session_);
  }
}

ChatTurn ChatSession::HandleCommand(const std::string& line) {
  ChatTurn turn;
  const auto parts = SplitWords(line);
  const auto cmd = ToLower(parts.front());

  if (cmd == "/bye" || cmd == "/exit" || cmd == "/quit" || cmd == "/q") {
    turn.exit = true;
  } else if (cmd == "/help") {
    turn.text = HelpText();
  } else if (cmd == "/status") {
    turn.text = StatusText();
  } else if (cmd == "/cancel") {
    auto reply = engine_.Cancel(*session_);
    if (reply.outcome) {
      turn.outcomes.push_back(*reply.outcome);
      turn.text = reply.message;
    } else {
      turn.text = "No active tool workflow to cancel.";
    }
  } else if (cmd == "/clear") {
    auto reply = engine_.Cancel(*session_);
    if (reply.outcome) turn.outcomes.push_back(*reply.outcome);
    ReplaceHistory(*session_, {});
    turn.text = "Chat history and tool stack cleared";
  } else if (cmd == "/tools") {
    turn.text = "Available tools:\n" + ToolsText();
  } else if (cmd == "/tool") {
    if (parts.size() < 2) {
      turn.text = "Usage: /tool <tool_name>";
    } else if (auto desc = registry_.Resolve(parts[1])) {
      turn.text = DescribeTool(*desc);
    } else {
      turn.text = "Error: Tool '" + parts[1] + "' not found";
    }
  } else if (cmd == "/list") {
    const auto what = parts.size() > 1 ? ToLower(parts[1]) : std::string();
    if (what == "model" || what == "models") {
      turn.text = ModelsText();
    } else if (what == "tools") {
      turn.text = "Registered tools:\n" + ToolsText();
    } else {
      turn.text = "Please specify what to list. Options: 'models' or 'tools'";
    }
  } else if (cmd == "/model") {
    turn.text = ModelCommand(parts);
  } else if (cmd == "/context") {
    turn.text = ContextCommand(line, parts);
  } else if (cmd == "/mode") {
    if (parts.size() < 2) {
      turn.text = std::string("Current mode: ") + (DebugLoggingEnabled() ? "Debug" : "Normal");
    } else if (ToLower(parts[1]) == "debug") {
      SetDebugLogging(true);
      turn.text = "Switched to Debug mode";
    } else if (ToLower(parts[1]) == "normal") {
      SetDebugLogging(false);
      turn.text = "Switched to Normal mode";
    } else {
      turn.text = "Invalid mode. Options: normal, debug";
    }
  } else if (cmd == "/save" || cmd == "/load") {
    std::string err;
    if (parts.size() < 2) {
      turn.text = "Usage: " + cmd + " <file>";
    } else if (cmd == "/save") {
      turn.text = SaveHistoryTo(parts[1], &err) ? "Chat history saved to " + parts[1] : "Error: " + err;
    } else {
      turn.text = LoadHistoryFrom(parts[1], &err) ? "Chat history loaded from " + parts[1] : "Error: " + err;
    }
  } else {
    turn.text = "Unknown command: " + cmd;
  }
  return turn;
}

bool ChatSession::SaveHistoryTo(const std::string& path, std::string* err) {
  return SaveHistory(path, HistorySnapshot(*session_), err);
}

bool ChatSession::LoadHistoryFrom(const std::string& path, std::string* err) {
  auto history = LoadHistory(path, err);
  if (!history) return false;
  ReplaceHistory(*session_, std::move(*history));
  return true;
}

std::string ChatSession::HelpText() const {
  std::string out =
      "Available commands:\n"
      "/help - Show this help message\n"
      "/bye - Exit the chat session (also: /exit, /quit)\n"
      "/mode [normal|debug] - Switch between normal and debug modes\n"
      "/model [name] - Show or switch the current model\n"
      "/clear - Clear the chat history and tool stack\n"
      "/tools - List available tools\n"
      "/tool <name> - Show detailed information about a specific tool\n"
      "/list models - List all available models\n"
      "/list tools - List all registered tools\n"
      "/status - Show current tool stack and workflow status\n"
      "/cancel - Cancel current tool workflow\n"
      "/save <file>, /load <file> - Save or load chat history\n"
      "/context [list|show|use <name>|off] - Show or switch the active context\n"
      "/context new <name> <template> - Create a context template\n"
      "/context set <key> <value> - Set a variable on the active context\n"
      "\nCurrent mode: ";
  out += DebugLoggingEnabled() ? "Debug" : "Normal";
  return out;
}

std::string ChatSession::StatusText() {
  const auto status = engine_.Status(*session_);
  std::string out = status.formatted;
  out += "\nState: " + EngineStateName(status.state);
  if (status.awaiting_confirmation) out += " (waiting for confirmation)";
  return out;
}

std::string ChatSession::ToolsText() const {
  std::string out;
  for (const auto& d : registry_.List()) out += "- " + d.name + " - " + d.description + "\n";
  if (out.empty()) out = "(none)\n";
  return out;
}

std::string ChatSession::ModelsText() {
  if (!provider_) return "No model backend configured.";
  std::string err;
  auto models = provider_->ListModels(&err);
  if (!err.empty()) return "Error: " + err;
  if (models.empty()) return "No models found. Make sure Ollama is running.";
  std::string out = "Available models:\n";
  for (const auto& m : models) out += FormatModelLine(m) + "\n";
  return out;
}

std::string ChatSession::ModelCommand(const std::vector<std::string>& parts) {
  const auto current = current_model_ ? current_model_() : std::string();
  if (parts.size() < 2) return "Current model: " + (current.empty() ? std::string("(none)") : current);
  if (!switch_model_) return "Model switching is not available";

  const auto& name = parts[1];
  if (provider_) {
    std::string err;
    auto models = provider_->ListModels(&err);
    if (!err.empty()) return "Error: " + err;
    bool found = false;
    for (const auto& m : models) {
      if (m.id == name || m.id == name + ":latest") found = true;
    }
    if (!found) return "Error: Model '" + name + "' not found";
  }
  switch_model_(name);
  return "Switched to model: " + name;
}

std::string ChatSession::ContextCommand(const std::string& line, const std::vector<std::string>& parts) {
  if (!contexts_) return "Contexts are not available";
  const auto sub = parts.size() > 1 ? ToLower(parts[1]) : std::string();
  const auto active = contexts_->Active();
  std::string err;

  if (sub.empty()) return active ? "Active context: " + *active : "No active context";
  if (sub == "list") {
    const auto all = contexts_->List();
    if (all.empty()) return "No contexts available";
    std::string out = "Available contexts:";
    for (const auto& c : all) {
      out += "\n" + std::string(active && *active == c.name ? "* " : "- ") + c.name + " - " + c.Description();
    }
    return out;
  }
  if (sub == "show") {
    if (!active) return "No active context";
    return "Context " + *active + ":\n" + contexts_->ActiveContent();
  }
  if (sub == "use") {
    if (parts.size() < 3) return "Usage: /context use <name>";
    if (!contexts_->Find(parts[2])) return "Error: Context '" + parts[2] + "' not found";
    if (!contexts_->SetActive(parts[2], &err)) return "Error: " + err;
    return "Switched to context: " + parts[2];
  }
  if (sub == "off") {
    if (!contexts_->ClearActive(&err)) return "Error: " + err;
    return "Context cleared";
  }
  if (sub == "new") {
    const auto text = RestAfterWords(line, 3);
    if (parts.size() < 4 || text.empty()) return "Usage: /context new <name> <template>";
    if (!contexts_->Create(parts[2], text, &err)) return "Error: " + err;
    return "Created context: " + parts[2];
  }
  if (sub == "set") {
    const auto text = RestAfterWords(line, 3);
    if (parts.size() < 4 || text.empty()) return "Usage: /context set <key> <value>";
    if (!active) return "No active context";
    // Numbers and booleans keep their JSON type.
    auto value = nlohmann::json::parse(text, nullptr, false);
    if (value.is_discarded() || !(value.is_number() || value.is_boolean())) value = text;
    if (!contexts_->SetVariable(*active, parts[2], value, &err)) return "Error: " + err;
    return "Updated " + parts[2] + " in context " + *active;
  }
  return "Unknown context command: " + parts[1] + ". Options: list, show, use, off, new, set";
}

void RunChatLoop(ChatSession& chat, std::istream& in, std::ostream& out) {
  out << "Type /help for commands, /exit to quit\n";
  std::string line;
  while (true) {
    out << "\n[You]: " << std::flush;
    if (!std::getline(in, line)) break;
    auto turn = chat.HandleInput(line);
    if (turn.exit) break;
    if (!turn.text.empty()) out << "\n[Assistant]: " << turn.text << "\n";
  }
  out << "Chat session ended\n";
}

}  // namespace taco
