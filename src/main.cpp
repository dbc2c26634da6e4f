#include "builtin_tools.hpp"
#include "chat_session.hpp"
#include "config.hpp"
#include "context.hpp"
#include "log.hpp"
#include "ollama_provider.hpp"
#include "orchestrator.hpp"
#include "reasoner.hpp"
#include "session_manager.hpp"

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

static void PrintUsage(std::ostream& out) {
  out << "usage: taco <command> [args]\n"
      << "  chat [--model M] [--history FILE]   interactive chat\n"
      << "  query \"<text>\" [--model M]          one request, answer printed\n"
      << "  models                              list models on the Ollama host\n"
      << "  tools                               list built-in tools\n"
      << "  config set <section.key> <value>    update the config file\n";
}

static std::optional<std::string> FlagValue(const std::vector<std::string>& args, const std::string& flag) {
  for (size_t i = 0; i + 1 < args.size(); i++) {
    if (args[i] == flag) return args[i + 1];
  }
  return std::nullopt;
}

static std::vector<std::string> Positional(const std::vector<std::string>& args) {
  std::vector<std::string> out;
  for (size_t i = 0; i < args.size(); i++) {
    if (args[i].rfind("--", 0) == 0) {
      i++;
      continue;
    }
    out.push_back(args[i]);
  }
  return out;
}

static int RunModels(taco::IProvider& provider) {
  std::string err;
  auto models = provider.ListModels(&err);
  if (!err.empty()) {
    std::cerr << "error: " << err << "\n";
    return 1;
  }
  if (models.empty()) {
    std::cout << "No models found. Make sure Ollama is running.\n";
    return 0;
  }
  for (const auto& m : models) std::cout << taco::FormatModelLine(m) << "\n";
  return 0;
}

static int RunConfigSet(const taco::TacoConfig& cfg, const std::vector<std::string>& pos) {
  if (pos.size() != 4 || pos[1] != "set") {
    PrintUsage(std::cerr);
    return 2;
  }
  std::string err;
  if (!taco::SetConfigValue(cfg.config_path, pos[2], pos[3], &err)) {
    std::cerr << "error: " << err << "\n";
    return 1;
  }
  std::cout << "Set " << pos[2] << " = " << pos[3] << " in " << cfg.config_path << "\n";
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  if (args.empty() || args[0] == "-h" || args[0] == "--help") {
    PrintUsage(args.empty() ? std::cerr : std::cout);
    return args.empty() ? 2 : 0;
  }
  const auto command = args[0];
  const std::vector<std::string> rest(args.begin() + 1, args.end());

  std::string cfg_err;
  auto cfg = taco::LoadConfig(&cfg_err);
  if (!cfg_err.empty()) taco::LogWarn("config", cfg_err);
  taco::SetDebugLogging(cfg.debug);
  if (auto m = FlagValue(rest, "--model")) cfg.default_model = *m;

  taco::LogDebug("config", "path=" + cfg.config_path + " model=" + cfg.default_model);
  taco::LogDebug("ollama", "endpoint=" + cfg.ollama.scheme + "://" + cfg.ollama.host + ":" +
                               std::to_string(cfg.ollama.port) + cfg.ollama.base_path);

  if (command == "config") return RunConfigSet(cfg, Positional(args));

  taco::OllamaProvider provider(cfg.ollama);
  if (command == "models") return RunModels(provider);

  taco::ProviderReasoner reasoner(provider, cfg.default_model);
  std::string err;
  auto registry = taco::BuildDefaultToolRegistry(
      cfg, &provider, [&reasoner]() { return reasoner.Model(); }, &err);
  if (!registry) {
    std::cerr << "error: " << err << "\n";
    return 1;
  }

  if (command == "tools") {
    for (const auto& d : registry->List()) std::cout << d.name << " - " << d.description << "\n";
    return 0;
  }

  taco::ContextManager contexts(taco::ExpandUser(cfg.contexts_dir), cfg.config_path);
  contexts.Load();
  contexts.RestoreActive(cfg.active_context);

  taco::Orchestrator engine(*registry, reasoner, cfg.engine, &contexts);
  taco::SessionManager sessions(static_cast<size_t>(cfg.engine.max_stack_depth));
  auto session = sessions.GetOrCreate(sessions.EnsureSessionId(""));
  taco::ChatSession chat(
      engine, *registry, session, &provider, [&reasoner]() { return reasoner.Model(); },
      [&reasoner](const std::string& model) { reasoner.SetModel(model); }, &contexts);

  if (command == "query") {
    const auto pos = Positional(rest);
    if (pos.empty()) {
      PrintUsage(std::cerr);
      return 2;
    }
    auto turn = chat.HandleInput(pos[0]);
    std::cout << turn.text << "\n";
    for (const auto& o : turn.outcomes) {
      if (o.kind == taco::WorkflowOutcome::Kind::Failed) return 1;
    }
    // A one-shot query cannot answer follow-up questions.
    if (engine.Status(*session).state != taco::EngineState::Idle) {
      std::cerr << "query needs more input; use `taco chat` for multi-step tools\n";
      engine.Cancel(*session);
      return 1;
    }
    return 0;
  }

  if (command == "chat") {
    const auto history_file = FlagValue(rest, "--history").value_or(cfg.history_file);
    const auto history_path = taco::ExpandUser(history_file);
    if (!history_path.empty()) {
      std::string load_err;
      if (!chat.LoadHistoryFrom(history_path, &load_err)) taco::LogDebug("chat", load_err);
    }
    std::cout << "Chat session started with model: " << reasoner.Model() << "\n";
    taco::RunChatLoop(chat, std::cin, std::cout);
    if (!history_path.empty()) {
      std::string save_err;
      if (!chat.SaveHistoryTo(history_path, &save_err)) taco::LogWarn("chat", save_err);
    }
    return 0;
  }

  PrintUsage(std::cerr);
  return 2;
}
