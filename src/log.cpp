#include "log.hpp"

#include <atomic>
#include <cstring>
#include <iostream>
#include <mutex>
#include <string>

namespace taco {
namespace {

std::atomic<bool> g_debug{false};
std::mutex g_log_mu;

static void Emit(const std::string& tag, const std::string& message) {
  std::lock_guard<std::mutex> lock(g_log_mu);
  std::cerr << "[" << tag << "] " << message << "\n";
}

}  // namespace

void SetDebugLogging(bool enabled) {
  g_debug.store(enabled);
}

bool DebugLoggingEnabled() {
  return g_debug.load();
}

void LogDebug(const std::string& tag, const std::string& message) {
  if (!g_debug.load()) return;
  Emit(tag, message);
}

void LogWarn(const std::string& tag, const std::string& message) {
  Emit(tag, message);
}

std::string TruncateForLog(std::string s, size_t max_chars) {
  if (max_chars == 0) return {};
  if (s.size() <= max_chars) return s;
  constexpr const char* kSuffix = "...(truncated)";
  if (max_chars <= std::strlen(kSuffix)) return std::string(kSuffix).substr(0, max_chars);
  s.resize(max_chars - std::strlen(kSuffix));
  s += kSuffix;
  return s;
}

}  // namespace taco
