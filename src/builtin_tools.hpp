#pragma once

#include "config.hpp"
#include "providers/provider.hpp"
#include "tooling.hpp"

#include <functional>
#include <optional>
#include <string>

namespace taco {

using ModelNameFn = std::function<std::string()>;

// create_code, save_file, convert_temperature, analyze_text and calculate_compound_interest.
// create_code needs `provider`; without one it reports an error when run.
std::optional<ToolRegistry> BuildDefaultToolRegistry(const TacoConfig& cfg,
                                                     IProvider* provider,
                                                     ModelNameFn current_model,
                                                     std::string* err);

// Celsius/C, Fahrenheit/F, Kelvin/K (any case) to a single letter, or nullopt.
std::optional<char> NormalizeTemperatureUnit(const std::string& unit);

std::optional<double> ConvertTemperature(double value, char from, char to);

nlohmann::json AnalyzeText(const std::string& text);

}  // namespace taco
