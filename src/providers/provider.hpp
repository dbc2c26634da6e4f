#pragma once

#include "session_manager.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace taco {

struct ModelInfo {
  std::string id;
  uint64_t size_bytes = 0;
  std::string modified_at;
};

// "- llama3:latest (4.7 GB, modified 2024-05-01T10:00:00Z)"; details are omitted when unknown.
std::string FormatModelLine(const ModelInfo& model);

struct ChatRequest {
  std::string model;
  std::vector<ChatMessage> messages;
  std::optional<float> temperature;
};

struct ChatResponse {
  std::string model;
  std::string content;
};

class IProvider {
 public:
  virtual ~IProvider() = default;

  virtual std::string Name() const = 0;
  virtual std::vector<ModelInfo> ListModels(std::string* err) = 0;
  virtual std::optional<ChatResponse> ChatOnce(const ChatRequest& req, std::string* err) = 0;
};

}  // namespace taco
