#include "chat_session.hpp"

#include "fakes.hpp"
#include "log.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <string>

using taco::EngineState;
using taco::ToolResult;
using taco::WorkflowOutcome;
using taco_test::FakeProvider;
using taco_test::FakeReasoner;
using taco_test::MakeTool;
using taco_test::MustRegister;
using taco_test::Param;

namespace {

class ChatSessionTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto convert = MakeTool("convert", {Param("value", taco::ParamType::Number), Param("unit")}, [](const nlohmann::json& p) {
      return ToolResult::Ok(std::to_string(static_cast<int>(p["value"].get<double>())) + " " + p["unit"].get<std::string>());
    });
    convert.parameters[0].question = "What value?";
    convert.parameters[1].question = "Which unit?";
    MustRegister(&registry, std::move(convert));
    MustRegister(&registry, MakeTool("recurse", {}, [](const nlohmann::json&) { return ToolResult::Needs("recurse", {}); }));
  }

  taco::ToolRegistry registry;
  FakeReasoner reasoner;
  FakeProvider provider;
  std::string model = "llama3";
  taco::Orchestrator engine{registry, reasoner, taco::EngineConfig{3, 3}};
  std::shared_ptr<taco::SessionContext> session = std::make_shared<taco::SessionContext>("chat");
  taco::ChatSession chat{engine,
                         registry,
                         session,
                         &provider,
                         [this]() { return model; },
                         [this](const std::string& m) { model = m; }};
};

TEST_F(ChatSessionTest, ReadyToolRunsWithinTheSameTurn) {
  reasoner.selections.push_back(FakeReasoner::UseTool("convert", {{"value", 21}, {"unit", "C"}}));
  auto turn = chat.HandleInput("convert 21 C");
  ASSERT_EQ(turn.outcomes.size(), 1u);
  EXPECT_EQ(turn.outcomes[0].kind, WorkflowOutcome::Kind::Completed);
  EXPECT_NE(turn.text.find("21 C"), std::string::npos);
  EXPECT_EQ(engine.Status(*session).state, EngineState::Idle);

  auto history = taco::HistorySnapshot(*session);
  ASSERT_EQ(history.size(), 2u);
  EXPECT_EQ(history[0].role, "user");
  EXPECT_EQ(history[0].content, "convert 21 C");
  EXPECT_EQ(history[1].role, "assistant");
}

TEST_F(ChatSessionTest, QuestionsAreAskedOneAtATime) {
  reasoner.selections.push_back(FakeReasoner::UseTool("convert"));
  auto turn = chat.HandleInput("convert something");
  EXPECT_EQ(turn.text, "What value?");

  turn = chat.HandleInput("40");
  EXPECT_EQ(turn.text, "Which unit?");

  turn = chat.HandleInput("F");
  ASSERT_EQ(turn.outcomes.size(), 1u);
  EXPECT_NE(turn.text.find("40 F"), std::string::npos);
  EXPECT_EQ(reasoner.continuity_prompts.size(), 2u);
}

TEST_F(ChatSessionTest, EmptyInputAsksAndNoCancels) {
  reasoner.selections.push_back(FakeReasoner::UseTool("convert"));
  chat.HandleInput("convert something");

  auto turn = chat.HandleInput("   ");
  EXPECT_NE(turn.text.find("Continue with current task?"), std::string::npos);

  turn = chat.HandleInput("maybe");
  EXPECT_EQ(turn.text, "Please answer yes or no.");

  turn = chat.HandleInput("no");
  ASSERT_EQ(turn.outcomes.size(), 1u);
  EXPECT_EQ(turn.outcomes[0].kind, WorkflowOutcome::Kind::Cancelled);
  EXPECT_TRUE(session->stack.Empty());
}

TEST_F(ChatSessionTest, EmptyInputThenYesResumesQuestion) {
  reasoner.selections.push_back(FakeReasoner::UseTool("convert"));
  chat.HandleInput("convert something");
  chat.HandleInput("");

  auto turn = chat.HandleInput("yes");
  EXPECT_EQ(turn.text, "What value?");
  EXPECT_EQ(engine.Status(*session).state, EngineState::CollectingParameters);
}

TEST_F(ChatSessionTest, DepthLimitQuestionIsAnsweredInChat) {
  reasoner.selections.push_back(FakeReasoner::UseTool("recurse"));
  auto turn = chat.HandleInput("recurse");
  EXPECT_EQ(engine.Status(*session).state, EngineState::AwaitingDepthDecision);
  EXPECT_NE(turn.text.find("Continue for another 3 levels?"), std::string::npos);

  turn = chat.HandleInput("n");
  ASSERT_EQ(turn.outcomes.size(), 1u);
  EXPECT_EQ(turn.outcomes[0].reason, "depth_limit");
  EXPECT_TRUE(session->stack.Empty());
}

TEST_F(ChatSessionTest, RunawayParentChildLoopPausesTheTurn) {
  MustRegister(&registry, MakeTool("ping", {}, [](const nlohmann::json&) { return ToolResult::Needs("pong", {}); }));
  MustRegister(&registry, MakeTool("pong", {}, [](const nlohmann::json&) { return ToolResult::Ok("pong"); }));
  reasoner.selections.push_back(FakeReasoner::UseTool("ping"));

  auto turn = chat.HandleInput("ping");
  EXPECT_NE(turn.text.find("Paused after"), std::string::npos);
  EXPECT_EQ(engine.Status(*session).state, EngineState::ReadyToExecute);

  turn = chat.HandleInput("/cancel");
  ASSERT_EQ(turn.outcomes.size(), 1u);
  EXPECT_TRUE(session->stack.Empty());
}

TEST_F(ChatSessionTest, UnrelatedMessageStartsOver) {
  reasoner.selections.push_back(FakeReasoner::UseTool("convert"));
  chat.HandleInput("convert something");

  reasoner.verdicts.push_back(taco::Continuity::Unrelated);
  reasoner.selections.push_back(FakeReasoner::Reply("Paris."));
  auto turn = chat.HandleInput("what is the capital of France?");
  ASSERT_EQ(turn.outcomes.size(), 1u);
  EXPECT_EQ(turn.outcomes[0].reason, "context_switch");
  EXPECT_NE(turn.text.find("Paris."), std::string::npos);
  EXPECT_EQ(engine.Status(*session).state, EngineState::Idle);
}

TEST_F(ChatSessionTest, AbsolutePathAnswerIsNotACommand) {
  reasoner.selections.push_back(FakeReasoner::UseTool("convert", {{"value", 1}}));
  chat.HandleInput("convert 1");
  auto turn = chat.HandleInput("/srv/units/c");
  ASSERT_EQ(turn.outcomes.size(), 1u);
  EXPECT_EQ(turn.outcomes[0].value, "1 /srv/units/c");
}

TEST_F(ChatSessionTest, CancelWithoutWorkflow) {
  auto turn = chat.HandleInput("/cancel");
  EXPECT_EQ(turn.text, "No active tool workflow to cancel.");
  EXPECT_TRUE(turn.outcomes.empty());
}

TEST_F(ChatSessionTest, ClearDropsHistoryAndWorkflow) {
  reasoner.selections.push_back(FakeReasoner::UseTool("convert"));
  chat.HandleInput("convert something");
  auto turn = chat.HandleInput("/clear");
  EXPECT_EQ(turn.text, "Chat history and tool stack cleared");
  EXPECT_TRUE(taco::HistorySnapshot(*session).empty());
  EXPECT_TRUE(session->stack.Empty());
}

TEST_F(ChatSessionTest, StatusShowsStackAndState) {
  EXPECT_NE(chat.HandleInput("/status").text.find("No active tool workflow"), std::string::npos);

  reasoner.selections.push_back(FakeReasoner::UseTool("convert"));
  chat.HandleInput("convert something");
  auto text = chat.HandleInput("/status").text;
  EXPECT_NE(text.find("convert [collecting value (+1 more)]"), std::string::npos);
  EXPECT_NE(text.find("State: collecting_parameters"), std::string::npos);
}

TEST_F(ChatSessionTest, ToolCommands) {
  auto tools = chat.HandleInput("/tools").text;
  EXPECT_NE(tools.find("- convert"), std::string::npos);
  EXPECT_NE(tools.find("- recurse"), std::string::npos);

  EXPECT_NE(chat.HandleInput("/tool convert").text.find("value (number)"), std::string::npos);
  EXPECT_EQ(chat.HandleInput("/tool nope").text, "Error: Tool 'nope' not found");
  EXPECT_EQ(chat.HandleInput("/tool").text, "Usage: /tool <tool_name>");
  EXPECT_NE(chat.HandleInput("/list tools").text.find("Registered tools:"), std::string::npos);
}

TEST_F(ChatSessionTest, ModelCommands) {
  provider.models = {{"llama3:latest", 4661224676, "2024-05-01T10:00:00Z"}, {"mistral"}};
  EXPECT_EQ(chat.HandleInput("/model").text, "Current model: llama3");
  EXPECT_EQ(chat.HandleInput("/model mistral").text, "Switched to model: mistral");
  EXPECT_EQ(model, "mistral");
  EXPECT_EQ(chat.HandleInput("/model llama3").text, "Switched to model: llama3");
  EXPECT_EQ(chat.HandleInput("/model gpt").text, "Error: Model 'gpt' not found");
  EXPECT_EQ(model, "llama3");

  auto listing = chat.HandleInput("/list models").text;
  EXPECT_NE(listing.find("- llama3:latest (4.7 GB, modified 2024-05-01T10:00:00Z)\n"), std::string::npos);
  EXPECT_NE(listing.find("- mistral\n"), std::string::npos);

  provider.list_error = "ollama: failed to connect";
  EXPECT_EQ(chat.HandleInput("/list models").text, "Error: ollama: failed to connect");
}

TEST_F(ChatSessionTest, ModeCommandTogglesDebugLogging) {
  EXPECT_EQ(chat.HandleInput("/mode debug").text, "Switched to Debug mode");
  EXPECT_TRUE(taco::DebugLoggingEnabled());
  EXPECT_EQ(chat.HandleInput("/mode").text, "Current mode: Debug");
  EXPECT_EQ(chat.HandleInput("/mode normal").text, "Switched to Normal mode");
  EXPECT_FALSE(taco::DebugLoggingEnabled());
  EXPECT_EQ(chat.HandleInput("/mode loud").text, "Invalid mode. Options: normal, debug");
}

TEST_F(ChatSessionTest, ExitAndUnknownCommands) {
  EXPECT_TRUE(chat.HandleInput("/bye").exit);
  EXPECT_TRUE(chat.HandleInput("/quit").exit);
  EXPECT_TRUE(chat.HandleInput("/EXIT").exit);
  auto turn = chat.HandleInput("/frobnicate");
  EXPECT_FALSE(turn.exit);
  EXPECT_EQ(turn.text, "Unknown command: /frobnicate");
  EXPECT_NE(chat.HandleInput("/help").text.find("/status"), std::string::npos);
}

TEST_F(ChatSessionTest, SaveAndLoadHistoryCommands) {
  const auto path = (taco_test::ScratchDir() / "history.json").string();
  reasoner.selections.push_back(FakeReasoner::Reply("hi!"));
  chat.HandleInput("hello");
  EXPECT_EQ(chat.HandleInput("/save " + path).text, "Chat history saved to " + path);

  chat.HandleInput("/clear");
  EXPECT_EQ(chat.HandleInput("/load " + path).text, "Chat history loaded from " + path);
  auto history = taco::HistorySnapshot(*session);
  ASSERT_EQ(history.size(), 2u);
  EXPECT_EQ(history[1].content, "hi!");

  EXPECT_EQ(chat.HandleInput("/load").text, "Usage: /load <file>");
  EXPECT_NE(chat.HandleInput("/load /nonexistent/taco.json").text.find("Error: history: cannot open"), std::string::npos);
}

TEST_F(ChatSessionTest, ChatLoopStopsOnExit) {
  reasoner.selections.push_back(FakeReasoner::Reply("hi!"));
  std::istringstream in("hello\n/bye\nnever read\n");
  std::ostringstream out;
  taco::RunChatLoop(chat, in, out);
  const auto text = out.str();
  EXPECT_NE(text.find("[Assistant]: hi!"), std::string::npos);
  EXPECT_NE(text.find("Chat session ended"), std::string::npos);
  EXPECT_EQ(reasoner.selection_prompts.size(), 1u);
}

}  // namespace
