#pragma once

#include <optional>
#include <string>

namespace taco {

// Phrases that abandon the current workflow without asking the collaborator.
bool IsExplicitContextSwitch(const std::string& text);

// y/yes/sure/ok -> true, n/no/cancel/stop -> false, anything else -> nullopt.
std::optional<bool> ParseYesNo(const std::string& text);

}  // namespace taco
