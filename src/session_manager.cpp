#include "session_manager.hpp"

#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace taco {
namespace {

static std::string Hex(uint64_t v) {
  std::ostringstream oss;
  oss << std::hex << v;
  return oss.str();
}

static uint64_t Rand64() {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  return rng();
}

}  // namespace

std::string EngineStateName(EngineState state) {
  switch (state) {
    case EngineState::Idle:
      return "idle";
    case EngineState::AwaitingSelection:
      return "awaiting_selection";
    case EngineState::CollectingParameters:
      return "collecting_parameters";
    case EngineState::ReadyToExecute:
      return "ready_to_execute";
    case EngineState::Executing:
      return "executing";
    case EngineState::AwaitingChildCompletion:
      return "awaiting_child_completion";
    case EngineState::AwaitingDepthDecision:
      return "awaiting_depth_decision";
  }
  return "unknown";
}

void AppendToHistory(SessionContext& session, const std::string& role, const std::string& content) {
  std::lock_guard<std::mutex> lock(session.mu);
  session.history.push_back(ChatMessage{role, content});
}

std::vector<ChatMessage> HistorySnapshot(SessionContext& session) {
  std::lock_guard<std::mutex> lock(session.mu);
  return session.history;
}

void ReplaceHistory(SessionContext& session, std::vector<ChatMessage> history) {
  std::lock_guard<std::mutex> lock(session.mu);
  session.history = std::move(history);
}

std::string SessionManager::EnsureSessionId(const std::string& preferred) {
  if (!preferred.empty()) return preferred;
  return NewId("sess");
}

std::shared_ptr<SessionContext> SessionManager::GetOrCreate(const std::string& session_id) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = sessions_.find(session_id);
  if (it != sessions_.end()) return it->second;
  auto s = std::make_shared<SessionContext>(session_id, max_stack_depth_);
  sessions_.emplace(session_id, s);
  return s;
}

bool SessionManager::Remove(const std::string& session_id) {
  std::lock_guard<std::mutex> lock(mu_);
  return sessions_.erase(session_id) > 0;
}

size_t SessionManager::Count() const {
  std::lock_guard<std::mutex> lock(mu_);
  return sessions_.size();
}

bool SaveHistory(const std::string& path, const std::vector<ChatMessage>& history, std::string* err) {
  nlohmann::json j = nlohmann::json::array();
  for (const auto& m : history) j.push_back({{"role", m.role}, {"content", m.content}});

  std::error_code ec;
  const auto parent = std::filesystem::path(path).parent_path();
  if (!parent.empty()) std::filesystem::create_directories(parent, ec);
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    if (err) *err = "history: cannot write " + path;
    return false;
  }
  out << j.dump(2);
  if (!out) {
    if (err) *err = "history: write failed for " + path;
    return false;
  }
  return true;
}

std::optional<std::vector<ChatMessage>> LoadHistory(const std::string& path, std::string* err) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    if (err) *err = "history: cannot open " + path;
    return std::nullopt;
  }
  auto j = nlohmann::json::parse(in, nullptr, false);
  if (j.is_discarded() || !j.is_array()) {
    if (err) *err = "history: invalid json in " + path;
    return std::nullopt;
  }
  std::vector<ChatMessage> out;
  for (const auto& m : j) {
    if (!m.is_object() || !m.contains("role") || !m["role"].is_string()) continue;
    ChatMessage cm;
    cm.role = m["role"].get<std::string>();
    if (m.contains("content") && m["content"].is_string()) cm.content = m["content"].get<std::string>();
    out.push_back(std::move(cm));
  }
  return out;
}

std::string NewId(const std::string& prefix) {
  return prefix + "_" + Hex(Rand64());
}

}  // namespace taco
