#pragma once

#include <cstddef>
#include <string>

namespace taco {

void SetDebugLogging(bool enabled);
bool DebugLoggingEnabled();

// "[tag] message" lines on stderr. Debug lines are dropped unless debug logging is on.
void LogDebug(const std::string& tag, const std::string& message);
void LogWarn(const std::string& tag, const std::string& message);

std::string TruncateForLog(std::string s, size_t max_chars);

}  // namespace taco
