#pragma once

#include "providers/provider.hpp"
#include "reasoner.hpp"
#include "tooling.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <deque>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace taco_test {

// Replays scripted decisions. An empty selection queue answers with a plain reply and an
// empty verdict queue answers "related"; a scripted nullopt simulates an unreachable backend.
class FakeReasoner : public taco::IReasoner {
 public:
  std::optional<taco::SelectionDecision> Select(const std::string& prompt, std::string* err) override {
    selection_prompts.push_back(prompt);
    if (selections.empty()) return Reply("(no scripted reply)");
    auto next = selections.front();
    selections.pop_front();
    if (!next && err) *err = "connection refused";
    return next;
  }

  std::optional<taco::Continuity> JudgeContinuity(const std::string& prompt, std::string* err) override {
    continuity_prompts.push_back(prompt);
    if (verdicts.empty()) return taco::Continuity::Related;
    auto next = verdicts.front();
    verdicts.pop_front();
    if (!next && err) *err = "connection refused";
    return next;
  }

  static taco::SelectionDecision Reply(std::string text) {
    taco::SelectionDecision d;
    d.kind = taco::SelectionDecision::Kind::NoToolNeeded;
    d.reply = std::move(text);
    return d;
  }

  static taco::SelectionDecision UseTool(std::string name, nlohmann::json args = nlohmann::json::object()) {
    taco::SelectionDecision d;
    d.kind = taco::SelectionDecision::Kind::UseTool;
    d.tool_name = std::move(name);
    d.arguments = std::move(args);
    return d;
  }

  std::deque<std::optional<taco::SelectionDecision>> selections;
  std::deque<std::optional<taco::Continuity>> verdicts;
  std::vector<std::string> selection_prompts;
  std::vector<std::string> continuity_prompts;
};

class FakeProvider : public taco::IProvider {
 public:
  std::string Name() const override { return "fake"; }

  std::vector<taco::ModelInfo> ListModels(std::string* err) override {
    if (!list_error.empty()) {
      if (err) *err = list_error;
      return {};
    }
    return models;
  }

  std::optional<taco::ChatResponse> ChatOnce(const taco::ChatRequest& req, std::string* err) override {
    requests.push_back(req);
    if (responses.empty()) {
      if (err) *err = "fake: offline";
      return std::nullopt;
    }
    taco::ChatResponse resp;
    resp.model = req.model;
    resp.content = responses.front();
    responses.pop_front();
    return resp;
  }

  std::vector<taco::ModelInfo> models;
  std::string list_error;
  std::deque<std::string> responses;
  std::vector<taco::ChatRequest> requests;
};

inline taco::ParamSpec Param(std::string name, taco::ParamType type = taco::ParamType::String) {
  taco::ParamSpec p;
  p.name = std::move(name);
  p.type = type;
  return p;
}

inline taco::ToolDescriptor MakeTool(std::string name, std::vector<taco::ParamSpec> params, taco::ToolHandler handler) {
  taco::ToolDescriptor d;
  d.name = std::move(name);
  d.description = "test tool " + d.name;
  d.parameters = std::move(params);
  d.tool = std::make_shared<taco::FunctionTool>(std::move(handler));
  return d;
}

inline void MustRegister(taco::ToolRegistry* registry, taco::ToolDescriptor d) {
  std::string err;
  ASSERT_TRUE(registry->RegisterTool(std::move(d), &err)) << err;
}

// Fresh directory under the system temp dir, named after the running test.
inline std::filesystem::path ScratchDir() {
  const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
  auto dir = std::filesystem::temp_directory_path() /
             ("taco_" + std::string(info->test_suite_name()) + "_" + std::string(info->name()));
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
  std::filesystem::create_directories(dir, ec);
  return dir;
}

}  // namespace taco_test
