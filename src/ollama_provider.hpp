#pragma once

#include "config.hpp"
#include "providers/provider.hpp"

namespace taco {

class OllamaProvider : public IProvider {
 public:
  explicit OllamaProvider(HttpEndpoint endpoint);

  std::string Name() const override;
  std::vector<ModelInfo> ListModels(std::string* err) override;
  std::optional<ChatResponse> ChatOnce(const ChatRequest& req, std::string* err) override;

 private:
  HttpEndpoint endpoint_;
};

}  // namespace taco
