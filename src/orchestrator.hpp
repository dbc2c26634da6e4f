#pragma once

#include "config.hpp"
#include "context.hpp"
#include "reasoner.hpp"
#include "session_manager.hpp"
#include "tooling.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace taco {

enum class EngineErrorKind {
  UnknownTool,
  ParameterValidationFailed,
  ToolExecutionFailed,
  DepthExceeded,
  CollaboratorUnavailable,
  InvalidState,
};

std::string EngineErrorKindName(EngineErrorKind kind);

struct EngineError {
  EngineErrorKind kind = EngineErrorKind::InvalidState;
  std::string message;
};

// Terminal result of a workflow. Exactly one is produced each time a workflow ends.
struct WorkflowOutcome {
  enum class Kind { Completed, Cancelled, Failed };

  Kind kind = Kind::Completed;
  nlohmann::json value;
  std::string reason;
  std::optional<EngineError> error;
};

struct FrameStatus {
  std::string tool_name;
  bool is_top = false;
  size_t missing_parameter_count = 0;
  std::optional<std::string> pending_child;
};

struct StatusSnapshot {
  EngineState state = EngineState::Idle;
  std::vector<FrameStatus> frames;
  std::optional<std::string> original_request;
  size_t max_depth = 0;
  bool awaiting_confirmation = false;
  std::string formatted;
};

struct EngineReply {
  EngineState state = EngineState::Idle;
  std::string message;
  std::optional<EngineError> error;
  std::optional<WorkflowOutcome> outcome;
  std::optional<StatusSnapshot> snapshot;
  // The input abandoned the workflow and should be handled as a fresh request.
  bool context_switch = false;
  // A completion arrived for a workflow that no longer exists and was dropped.
  bool stale = false;
};

// A collaborator call issued against a given workflow generation.
struct PendingCall {
  uint64_t generation = 0;
  std::string prompt;
};

struct ExecutionTicket {
  uint64_t generation = 0;
  std::string tool_name;
  nlohmann::json parameters;
  std::shared_ptr<ITool> tool;
};

// Invokes the tool and turns anything it throws into an Error result.
ToolResult RunTool(const ExecutionTicket& ticket);

// Drives one session's tool stack. Every operation locks the session for its whole mutation;
// collaborator calls and tool invocations happen between a Begin* and a Complete* call with
// the lock released, and Complete* drops results whose generation is no longer current.
// The synchronous wrappers chain the two halves for callers that do not need to interleave.
class Orchestrator {
 public:
  // `contexts` is optional; when given, the active context leads every collaborator prompt and
  // its "<param>_default" variables fill declared parameters nobody supplied.
  Orchestrator(const ToolRegistry& registry,
               IReasoner& reasoner,
               EngineConfig config,
               const ContextManager* contexts = nullptr);

  EngineReply SubmitUserRequest(SessionContext& s, const std::string& text);
  std::optional<PendingCall> BeginSelection(SessionContext& s, const std::string& text, EngineReply* reply);
  EngineReply CompleteSelection(SessionContext& s,
                                uint64_t generation,
                                const std::optional<SelectionDecision>& decision,
                                const std::string& collaborator_error);

  EngineReply SupplyParameterValue(SessionContext& s, const std::string& text);

  EngineReply ExecuteActiveTool(SessionContext& s);
  std::optional<ExecutionTicket> BeginExecution(SessionContext& s, EngineReply* reply);
  EngineReply CompleteExecution(SessionContext& s, uint64_t generation, const ToolResult& result);

  EngineReply Cancel(SessionContext& s);

  EngineReply HandleEmptyInput(SessionContext& s);
  EngineReply ConfirmContinue(SessionContext& s, bool proceed);

  // Answer to a DepthExceeded choice point.
  EngineReply ResolveDepthLimit(SessionContext& s, bool extend);

  // Unrelated input cancels the workflow and is resubmitted as a new request; related input
  // goes to the active step.
  EngineReply DetectContextSwitch(SessionContext& s, const std::string& text);
  std::optional<PendingCall> BeginContinuityCheck(SessionContext& s, const std::string& text, EngineReply* reply);
  EngineReply CompleteContinuityCheck(SessionContext& s,
                                      uint64_t generation,
                                      const std::optional<Continuity>& verdict,
                                      const std::string& collaborator_error);

  StatusSnapshot Status(SessionContext& s) const;

  const EngineConfig& Config() const { return config_; }

 private:
  EngineReply PushFrameLocked(SessionContext& s,
                              const ToolDescriptor& descriptor,
                              const nlohmann::json& seed_args,
                              bool seed_from_request);
  EngineReply SettleTopLocked(SessionContext& s);
  EngineReply CancelLocked(SessionContext& s, const std::string& reason);
  EngineReply FailLocked(SessionContext& s, EngineErrorKind kind, const std::string& message);
  EngineReply DepthExceededLocked(SessionContext& s, const std::string& child_tool, const nlohmann::json& seed_args);
  EngineReply InvalidStateLocked(const SessionContext& s, const std::string& operation) const;
  EngineReply StaleLocked(const SessionContext& s) const;
  void ResetLocked(SessionContext& s);
  std::string PromptForTopLocked(const SessionContext& s) const;
  StatusSnapshot SnapshotLocked(const SessionContext& s) const;
  std::string ActiveContext() const;

  const ToolRegistry& registry_;
  IReasoner& reasoner_;
  EngineConfig config_;
  const ContextManager* contexts_;
};

}  // namespace taco
