#include "ollama_provider.hpp"

#include "log.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <iomanip>
#include <memory>
#include <sstream>
#include <string>
#include <utility>

namespace taco {
namespace {

static std::unique_ptr<httplib::Client> MakeClient(const HttpEndpoint& ep) {
  auto cli = std::make_unique<httplib::Client>(ep.host, ep.port);
  cli->set_connection_timeout(5);
  cli->set_read_timeout(300);
  cli->set_write_timeout(30);
  return cli;
}

static std::string JoinPath(const std::string& base, const std::string& path) {
  if (base.empty()) return path;
  if (base.back() == '/' && !path.empty() && path.front() == '/') return base + path.substr(1);
  if (base.back() != '/' && !path.empty() && path.front() != '/') return base + "/" + path;
  return base + path;
}

}  // namespace

OllamaProvider::OllamaProvider(HttpEndpoint endpoint) : endpoint_(std::move(endpoint)) {}

std::string OllamaProvider::Name() const {
  return "ollama";
}

std::vector<ModelInfo> OllamaProvider::ListModels(std::string* err) {
  auto cli = MakeClient(endpoint_);
  auto res = cli->Get(JoinPath(endpoint_.base_path, "/api/tags"));
  if (!res) {
    if (err) *err = "ollama: failed to connect to " + endpoint_.host + ":" + std::to_string(endpoint_.port);
    return {};
  }
  if (res->status < 200 || res->status >= 300) {
    if (err) *err = "ollama: /api/tags http " + std::to_string(res->status);
    return {};
  }

  auto j = nlohmann::json::parse(res->body, nullptr, false);
  if (j.is_discarded()) {
    if (err) *err = "ollama: invalid json from /api/tags";
    return {};
  }
  std::vector<ModelInfo> out;
  if (!j.contains("models") || !j["models"].is_array()) return out;
  for (const auto& m : j["models"]) {
    if (!m.is_object()) continue;
    ModelInfo info;
    if (m.contains("name") && m["name"].is_string()) info.id = m["name"].get<std::string>();
    if (m.contains("size") && m["size"].is_number_unsigned()) info.size_bytes = m["size"].get<uint64_t>();
    if (m.contains("modified_at") && m["modified_at"].is_string()) info.modified_at = m["modified_at"].get<std::string>();
    if (!info.id.empty()) out.push_back(std::move(info));
  }
  LogDebug("ollama", "list_models count=" + std::to_string(out.size()));
  return out;
}

std::optional<ChatResponse> OllamaProvider::ChatOnce(const ChatRequest& req, std::string* err) {
  auto cli = MakeClient(endpoint_);
  nlohmann::json j;
  j["model"] = req.model;
  j["stream"] = false;
  j["messages"] = nlohmann::json::array();
  for (const auto& m : req.messages) {
    j["messages"].push_back({{"role", m.role}, {"content", m.content}});
  }
  if (req.temperature) j["options"]["temperature"] = *req.temperature;

  LogDebug("ollama", "chat model=" + req.model + " messages=" + std::to_string(req.messages.size()));
  auto res = cli->Post(JoinPath(endpoint_.base_path, "/api/chat"), j.dump(), "application/json");
  if (!res) {
    if (err) *err = "ollama: failed to connect to " + endpoint_.host + ":" + std::to_string(endpoint_.port);
    return std::nullopt;
  }
  if (res->status < 200 || res->status >= 300) {
    if (err) *err = "ollama: /api/chat http " + std::to_string(res->status) + " body=" + TruncateForLog(res->body, 200);
    return std::nullopt;
  }
  auto jr = nlohmann::json::parse(res->body, nullptr, false);
  if (jr.is_discarded() || !jr.contains("message") || !jr["message"].is_object()) {
    if (err) *err = "ollama: invalid json from /api/chat";
    return std::nullopt;
  }
  ChatResponse out;
  out.model = req.model;
  if (jr["message"].contains("content") && jr["message"]["content"].is_string()) {
    out.content = jr["message"]["content"].get<std::string>();
  }
  LogDebug("ollama", "chat_done chars=" + std::to_string(out.content.size()));
  return out;
}

std::string FormatModelLine(const ModelInfo& model) {
  std::string line = "- " + model.id;
  std::string details;
  if (model.size_bytes > 0) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << static_cast<double>(model.size_bytes) / 1e9 << " GB";
    details = oss.str();
  }
  if (!model.modified_at.empty()) details += (details.empty() ? "" : ", ") + std::string("modified ") + model.modified_at;
  if (!details.empty()) line += " (" + details + ")";
  return line;
}

}  // namespace taco
