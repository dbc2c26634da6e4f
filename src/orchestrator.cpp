#include "orchestrator.hpp"

#include "abandonment.hpp"
#include "log.hpp"
#include "prompts.hpp"

#include <exception>
#include <string>
#include <utility>

namespace taco {
namespace {

static std::string ValueText(const nlohmann::json& value) {
  if (value.is_string()) return value.get<std::string>();
  if (value.is_null()) return "";
  return value.dump(2);
}

static std::string Depth(const ToolStack& stack) {
  return std::to_string(stack.Depth()) + "/" + std::to_string(stack.MaxDepth());
}

}  // namespace

std::string EngineErrorKindName(EngineErrorKind kind) {
  switch (kind) {
    case EngineErrorKind::UnknownTool:
      return "unknown_tool";
    case EngineErrorKind::ParameterValidationFailed:
      return "parameter_validation_failed";
    case EngineErrorKind::ToolExecutionFailed:
      return "tool_execution_failed";
    case EngineErrorKind::DepthExceeded:
      return "depth_exceeded";
    case EngineErrorKind::CollaboratorUnavailable:
      return "collaborator_unavailable";
    case EngineErrorKind::InvalidState:
      return "invalid_state";
  }
  return "unknown";
}

ToolResult RunTool(const ExecutionTicket& ticket) {
  LogDebug("tool-call", ticket.tool_name + " params=" + TruncateForLog(ticket.parameters.dump(), 400));
  ToolResult result;
  try {
    result = ticket.tool->Invoke(ticket.parameters);
  } catch (const std::exception& e) {
    result = ToolResult::Fail("exception", e.what());
  } catch (...) {
    result = ToolResult::Fail("exception", "unknown exception");
  }
  switch (result.kind) {
    case ToolResult::Kind::Value:
      LogDebug("tool-result", ticket.tool_name + " value=" + TruncateForLog(result.value.dump(), 400));
      break;
    case ToolResult::Kind::NeedsTool:
      LogDebug("tool-result", ticket.tool_name + " needs_tool=" + result.child_tool);
      break;
    case ToolResult::Kind::Error:
      LogDebug("tool-result", ticket.tool_name + " error_kind=" + result.error_kind + " error=" + result.error);
      break;
  }
  return result;
}

Orchestrator::Orchestrator(const ToolRegistry& registry,
                           IReasoner& reasoner,
                           EngineConfig config,
                           const ContextManager* contexts)
    : registry_(registry), reasoner_(reasoner), config_(config), contexts_(contexts) {
  if (config_.max_stack_depth < 1) config_.max_stack_depth = 1;
  if (config_.depth_increment && *config_.depth_increment < 1) config_.depth_increment = 1;
}

EngineReply Orchestrator::SubmitUserRequest(SessionContext& s, const std::string& text) {
  EngineReply reply;
  auto call = BeginSelection(s, text, &reply);
  if (!call) return reply;
  std::string err;
  auto decision = reasoner_.Select(call->prompt, &err);
  return CompleteSelection(s, call->generation, decision, err);
}

std::optional<PendingCall> Orchestrator::BeginSelection(SessionContext& s, const std::string& text, EngineReply* reply) {
  std::lock_guard<std::mutex> lock(s.mu);
  if (s.state != EngineState::Idle) {
    if (reply) *reply = InvalidStateLocked(s, "submit_user_request");
    return std::nullopt;
  }
  s.stack.SetMaxDepth(static_cast<size_t>(config_.max_stack_depth));
  s.original_request = text;
  s.state = EngineState::AwaitingSelection;
  LogDebug("engine", "selection_start generation=" + std::to_string(s.generation));

  PendingCall call;
  call.generation = s.generation;
  call.prompt = RenderSelectionPrompt(s.history, registry_.Summary(), text, ActiveContext());
  return call;
}

EngineReply Orchestrator::CompleteSelection(SessionContext& s,
                                            uint64_t generation,
                                            const std::optional<SelectionDecision>& decision,
                                            const std::string& collaborator_error) {
  std::lock_guard<std::mutex> lock(s.mu);
  if (generation != s.generation || s.state != EngineState::AwaitingSelection) return StaleLocked(s);

  EngineReply reply;
  if (!decision) {
    s.original_request.reset();
    s.state = EngineState::Idle;
    reply.state = s.state;
    reply.error = EngineError{EngineErrorKind::CollaboratorUnavailable,
                              collaborator_error.empty() ? "reasoning backend unavailable" : collaborator_error};
    reply.message = "Could not reach the model: " + reply.error->message;
    return reply;
  }

  if (decision->kind == SelectionDecision::Kind::NoToolNeeded) {
    s.original_request.reset();
    s.state = EngineState::Idle;
    reply.state = s.state;
    reply.message = decision->reply;
    return reply;
  }

  auto desc = registry_.Resolve(decision->tool_name);
  if (!desc) {
    LogDebug("engine", "unknown_tool name=" + decision->tool_name);
    s.original_request.reset();
    s.state = EngineState::Idle;
    reply.state = s.state;
    reply.error = EngineError{EngineErrorKind::UnknownTool, "unknown tool: " + decision->tool_name};
    reply.message = "The model asked for a tool that does not exist: " + decision->tool_name;
    return reply;
  }
  return PushFrameLocked(s, *desc, decision->arguments, true);
}

EngineReply Orchestrator::SupplyParameterValue(SessionContext& s, const std::string& text) {
  std::lock_guard<std::mutex> lock(s.mu);
  if (s.state != EngineState::CollectingParameters || s.awaiting_confirmation) {
    return InvalidStateLocked(s, "supply_parameter_value");
  }
  ToolFrame* top = s.stack.Top();
  auto desc = registry_.Resolve(top->tool_name);
  if (!desc) return FailLocked(s, EngineErrorKind::UnknownTool, "tool is no longer registered: " + top->tool_name);

  const std::string name = top->missing_parameters.front();
  const ParamSpec* spec = desc->FindParameter(name);
  if (!spec) return FailLocked(s, EngineErrorKind::ToolExecutionFailed, "undeclared parameter: " + name);

  nlohmann::json value;
  std::string err;
  if (!CoerceParameter(*spec, nlohmann::json(text), &value, &err)) {
    if (s.failing_parameter == name) {
      s.validation_failures++;
    } else {
      s.failing_parameter = name;
      s.validation_failures = 1;
    }
    LogDebug("engine", "validation_failed tool=" + top->tool_name + " param=" + name +
                           " attempt=" + std::to_string(s.validation_failures));
    if (s.validation_failures >= 2) {
      return FailLocked(s, EngineErrorKind::ToolExecutionFailed,
                        top->tool_name + ": parameter '" + name + "' rejected twice: " + err);
    }
    EngineReply reply;
    reply.state = s.state;
    reply.error = EngineError{EngineErrorKind::ParameterValidationFailed, err};
    reply.message = "That value for " + name + " was not accepted (" + err + "). Expected a " +
                    ParamTypeName(spec->type) + (spec->description.empty() ? "" : ": " + spec->description) +
                    ".\n" + PromptForTopLocked(s);
    return reply;
  }

  top->collected_parameters[name] = value;
  top->missing_parameters.erase(top->missing_parameters.begin());
  s.failing_parameter.clear();
  s.validation_failures = 0;
  LogDebug("engine", "param_set tool=" + top->tool_name + " param=" + name);
  return SettleTopLocked(s);
}

EngineReply Orchestrator::ExecuteActiveTool(SessionContext& s) {
  EngineReply reply;
  auto ticket = BeginExecution(s, &reply);
  if (!ticket) return reply;
  auto result = RunTool(*ticket);
  return CompleteExecution(s, ticket->generation, result);
}

std::optional<ExecutionTicket> Orchestrator::BeginExecution(SessionContext& s, EngineReply* reply) {
  std::lock_guard<std::mutex> lock(s.mu);
  if (s.state != EngineState::ReadyToExecute || s.awaiting_confirmation) {
    if (reply) *reply = InvalidStateLocked(s, "execute_active_tool");
    return std::nullopt;
  }
  const ToolFrame* top = s.stack.Top();
  auto desc = registry_.Resolve(top->tool_name);
  if (!desc || !desc->tool) {
    auto r = FailLocked(s, EngineErrorKind::UnknownTool, "tool is no longer registered: " + top->tool_name);
    if (reply) *reply = std::move(r);
    return std::nullopt;
  }
  s.state = EngineState::Executing;

  ExecutionTicket ticket;
  ticket.generation = s.generation;
  ticket.tool_name = top->tool_name;
  ticket.parameters = top->collected_parameters;
  ticket.tool = desc->tool;
  return ticket;
}

EngineReply Orchestrator::CompleteExecution(SessionContext& s, uint64_t generation, const ToolResult& result) {
  std::lock_guard<std::mutex> lock(s.mu);
  if (generation != s.generation || s.state != EngineState::Executing) return StaleLocked(s);

  const std::string tool_name = s.stack.Top()->tool_name;

  if (result.kind == ToolResult::Kind::Error) {
    std::string msg = tool_name + ": ";
    if (!result.error_kind.empty()) msg += result.error_kind + ": ";
    msg += result.error;
    return FailLocked(s, EngineErrorKind::ToolExecutionFailed, msg);
  }

  if (result.kind == ToolResult::Kind::NeedsTool) {
    auto child = registry_.Resolve(result.child_tool);
    if (!child) {
      return FailLocked(s, EngineErrorKind::UnknownTool, tool_name + " requested unknown tool: " + result.child_tool);
    }
    if (!s.stack.CanPush()) return DepthExceededLocked(s, result.child_tool, result.seed_args);
    s.stack.Top()->pending_child = result.child_tool;
    return PushFrameLocked(s, *child, result.seed_args, false);
  }

  auto finished = s.stack.Pop();
  LogDebug("engine", "pop tool=" + finished->tool_name + " depth=" + Depth(s.stack));
  if (s.stack.Empty()) {
    EngineReply reply;
    reply.outcome = WorkflowOutcome{WorkflowOutcome::Kind::Completed, result.value, "", std::nullopt};
    ResetLocked(s);
    reply.state = s.state;
    reply.message = ValueText(result.value);
    return reply;
  }

  s.state = EngineState::AwaitingChildCompletion;
  ToolFrame* parent = s.stack.Top();
  parent->pending_child.reset();
  auto parent_desc = registry_.Resolve(parent->tool_name);
  if (!parent_desc) return FailLocked(s, EngineErrorKind::UnknownTool, "tool is no longer registered: " + parent->tool_name);
  const auto& project = parent_desc->project_child_result ? parent_desc->project_child_result
                                                          : ChildResultProjection(DefaultChildResultProjection);
  project(finished->tool_name, result.value, &parent->collected_parameters);
  LogDebug("engine", "resume tool=" + parent->tool_name + " child=" + finished->tool_name);
  return SettleTopLocked(s);
}

EngineReply Orchestrator::Cancel(SessionContext& s) {
  std::lock_guard<std::mutex> lock(s.mu);
  if (s.state == EngineState::Idle) {
    EngineReply reply;
    reply.state = s.state;
    reply.message = "No active tool workflow.";
    return reply;
  }
  return CancelLocked(s, "explicit");
}

EngineReply Orchestrator::HandleEmptyInput(SessionContext& s) {
  std::lock_guard<std::mutex> lock(s.mu);
  EngineReply reply;
  reply.state = s.state;
  if (s.state == EngineState::Idle) return reply;
  s.awaiting_confirmation = true;
  reply.message = PromptForTopLocked(s);
  return reply;
}

EngineReply Orchestrator::ConfirmContinue(SessionContext& s, bool proceed) {
  std::lock_guard<std::mutex> lock(s.mu);
  if (!s.awaiting_confirmation) return InvalidStateLocked(s, "confirm_continue");
  s.awaiting_confirmation = false;
  if (!proceed) return CancelLocked(s, "explicit");
  EngineReply reply;
  reply.state = s.state;
  reply.message = PromptForTopLocked(s);
  return reply;
}

EngineReply Orchestrator::ResolveDepthLimit(SessionContext& s, bool extend) {
  std::lock_guard<std::mutex> lock(s.mu);
  if (s.state != EngineState::AwaitingDepthDecision || !s.pending_push) {
    return InvalidStateLocked(s, "resolve_depth_limit");
  }
  if (!extend) return CancelLocked(s, "depth_limit");

  PendingPush push = std::move(*s.pending_push);
  s.pending_push.reset();
  s.stack.Extend(static_cast<size_t>(config_.Increment()));
  LogDebug("engine", "depth_extended max=" + std::to_string(s.stack.MaxDepth()));

  auto child = registry_.Resolve(push.tool_name);
  if (!child) return FailLocked(s, EngineErrorKind::UnknownTool, "unknown tool: " + push.tool_name);
  if (ToolFrame* top = s.stack.Top()) top->pending_child = push.tool_name;
  return PushFrameLocked(s, *child, push.seed_args, false);
}

EngineReply Orchestrator::DetectContextSwitch(SessionContext& s, const std::string& text) {
  EngineReply reply;
  auto call = BeginContinuityCheck(s, text, &reply);
  if (call) {
    std::string err;
    auto verdict = reasoner_.JudgeContinuity(call->prompt, &err);
    reply = CompleteContinuityCheck(s, call->generation, verdict, err);
  }
  if (reply.stale || reply.error) return reply;

  if (reply.context_switch) {
    auto next = SubmitUserRequest(s, text);
    next.outcome = reply.outcome;
    next.context_switch = true;
    next.message = reply.message + (next.message.empty() ? "" : "\n" + next.message);
    return next;
  }
  if (reply.state == EngineState::CollectingParameters) return SupplyParameterValue(s, text);
  return reply;
}

std::optional<PendingCall> Orchestrator::BeginContinuityCheck(SessionContext& s,
                                                              const std::string& text,
                                                              EngineReply* reply) {
  std::lock_guard<std::mutex> lock(s.mu);
  const bool in_flight = s.state == EngineState::AwaitingSelection || s.state == EngineState::Executing ||
                         s.state == EngineState::AwaitingChildCompletion;
  if (s.state == EngineState::Idle || in_flight) {
    if (reply) *reply = InvalidStateLocked(s, "detect_context_switch");
    return std::nullopt;
  }
  if (IsExplicitContextSwitch(text)) {
    LogDebug("engine", "context_switch explicit=true");
    auto r = CancelLocked(s, "context_switch");
    r.context_switch = true;
    if (reply) *reply = std::move(r);
    return std::nullopt;
  }

  PendingCall call;
  call.generation = s.generation;
  call.prompt =
      RenderContinuityPrompt(s.stack.Format(s.original_request), s.original_request, s.history, text, ActiveContext());
  return call;
}

EngineReply Orchestrator::CompleteContinuityCheck(SessionContext& s,
                                                  uint64_t generation,
                                                  const std::optional<Continuity>& verdict,
                                                  const std::string& collaborator_error) {
  std::lock_guard<std::mutex> lock(s.mu);
  if (generation != s.generation || s.state == EngineState::Idle) return StaleLocked(s);

  if (!verdict) {
    EngineReply reply;
    reply.state = s.state;
    reply.error = EngineError{EngineErrorKind::CollaboratorUnavailable,
                              collaborator_error.empty() ? "reasoning backend unavailable" : collaborator_error};
    reply.message = "Could not reach the model: " + reply.error->message + "\nYour workflow is unchanged; try again.";
    return reply;
  }
  if (*verdict == Continuity::Unrelated) {
    LogDebug("engine", "context_switch explicit=false");
    auto reply = CancelLocked(s, "context_switch");
    reply.context_switch = true;
    return reply;
  }
  EngineReply reply;
  reply.state = s.state;
  if (s.state != EngineState::CollectingParameters) reply.message = PromptForTopLocked(s);
  return reply;
}

std::string Orchestrator::ActiveContext() const {
  return contexts_ ? contexts_->ActiveContent() : std::string();
}

StatusSnapshot Orchestrator::Status(SessionContext& s) const {
  std::lock_guard<std::mutex> lock(s.mu);
  return SnapshotLocked(s);
}

EngineReply Orchestrator::PushFrameLocked(SessionContext& s,
                                          const ToolDescriptor& descriptor,
                                          const nlohmann::json& seed_args,
                                          bool seed_from_request) {
  ToolFrame frame;
  frame.tool_name = descriptor.name;

  if (seed_args.is_object()) {
    for (auto it = seed_args.begin(); it != seed_args.end(); ++it) {
      const ParamSpec* spec = descriptor.FindParameter(it.key());
      if (!spec) {
        frame.collected_parameters[it.key()] = it.value();
        continue;
      }
      nlohmann::json value;
      std::string err;
      if (CoerceParameter(*spec, it.value(), &value, &err)) {
        frame.collected_parameters[it.key()] = value;
      } else {
        LogDebug("engine", "seed_dropped tool=" + descriptor.name + " param=" + it.key() + " err=" + err);
      }
    }
  }
  if (seed_from_request && s.original_request && !descriptor.request_parameter.empty() &&
      !frame.collected_parameters.contains(descriptor.request_parameter)) {
    if (const ParamSpec* spec = descriptor.FindParameter(descriptor.request_parameter)) {
      nlohmann::json value;
      std::string err;
      if (CoerceParameter(*spec, nlohmann::json(*s.original_request), &value, &err)) {
        frame.collected_parameters[descriptor.request_parameter] = value;
      }
    }
  }
  if (contexts_) {
    const auto defaults = contexts_->ParameterDefaults();
    for (auto it = defaults.begin(); it != defaults.end(); ++it) {
      const ParamSpec* spec = descriptor.FindParameter(it.key());
      if (!spec || frame.collected_parameters.contains(it.key())) continue;
      nlohmann::json value;
      std::string err;
      if (CoerceParameter(*spec, it.value(), &value, &err)) {
        frame.collected_parameters[it.key()] = value;
        LogDebug("engine", "context_default tool=" + descriptor.name + " param=" + it.key());
      }
    }
  }
  frame.missing_parameters = MissingParameters(descriptor, frame.collected_parameters);

  if (!s.stack.Push(std::move(frame))) return DepthExceededLocked(s, descriptor.name, seed_args);
  LogDebug("engine", "push tool=" + descriptor.name + " depth=" + Depth(s.stack));
  s.failing_parameter.clear();
  s.validation_failures = 0;
  return SettleTopLocked(s);
}

EngineReply Orchestrator::SettleTopLocked(SessionContext& s) {
  ToolFrame* top = s.stack.Top();
  auto desc = registry_.Resolve(top->tool_name);
  if (!desc) return FailLocked(s, EngineErrorKind::UnknownTool, "tool is no longer registered: " + top->tool_name);
  top->missing_parameters = MissingParameters(*desc, top->collected_parameters);
  s.state = top->missing_parameters.empty() ? EngineState::ReadyToExecute : EngineState::CollectingParameters;

  EngineReply reply;
  reply.state = s.state;
  reply.message = PromptForTopLocked(s);
  return reply;
}

EngineReply Orchestrator::CancelLocked(SessionContext& s, const std::string& reason) {
  LogDebug("engine", "cancel reason=" + reason + " depth=" + Depth(s.stack));
  EngineReply reply;
  // A selection still in flight has pushed nothing, so there is no workflow to report on.
  if (!s.stack.Empty()) reply.outcome = WorkflowOutcome{WorkflowOutcome::Kind::Cancelled, nullptr, reason, std::nullopt};
  ResetLocked(s);
  reply.state = s.state;
  reply.message = "Tool workflow cancelled.";
  return reply;
}

EngineReply Orchestrator::FailLocked(SessionContext& s, EngineErrorKind kind, const std::string& message) {
  LogWarn("engine", "workflow_failed kind=" + EngineErrorKindName(kind) + " error=" + message);
  EngineError error{kind, message};
  EngineReply reply;
  reply.error = error;
  reply.outcome = WorkflowOutcome{WorkflowOutcome::Kind::Failed, nullptr, "", error};
  ResetLocked(s);
  reply.state = s.state;
  reply.message = "Tool workflow failed: " + message;
  return reply;
}

EngineReply Orchestrator::DepthExceededLocked(SessionContext& s,
                                              const std::string& child_tool,
                                              const nlohmann::json& seed_args) {
  LogDebug("engine", "depth_exceeded requested=" + child_tool + " depth=" + Depth(s.stack));
  s.pending_push = PendingPush{child_tool, seed_args};
  s.state = EngineState::AwaitingDepthDecision;

  EngineReply reply;
  reply.state = s.state;
  reply.error = EngineError{EngineErrorKind::DepthExceeded,
                            "tool stack depth " + std::to_string(s.stack.Depth()) + " reached while pushing " + child_tool};
  reply.snapshot = SnapshotLocked(s);
  reply.message = reply.snapshot->formatted + "\n\n" + PromptForTopLocked(s);
  return reply;
}

EngineReply Orchestrator::InvalidStateLocked(const SessionContext& s, const std::string& operation) const {
  EngineReply reply;
  reply.state = s.state;
  reply.error = EngineError{EngineErrorKind::InvalidState,
                            operation + " is not valid while " + EngineStateName(s.state)};
  reply.message = reply.error->message;
  return reply;
}

EngineReply Orchestrator::StaleLocked(const SessionContext& s) const {
  LogDebug("engine", "stale_result_dropped generation=" + std::to_string(s.generation));
  EngineReply reply;
  reply.state = s.state;
  reply.stale = true;
  return reply;
}

void Orchestrator::ResetLocked(SessionContext& s) {
  s.stack.Clear();
  s.stack.SetMaxDepth(static_cast<size_t>(config_.max_stack_depth));
  s.original_request.reset();
  s.state = EngineState::Idle;
  s.generation++;
  s.awaiting_confirmation = false;
  s.pending_push.reset();
  s.failing_parameter.clear();
  s.validation_failures = 0;
}

std::string Orchestrator::PromptForTopLocked(const SessionContext& s) const {
  if (s.awaiting_confirmation) return "Continue with current task? [Y/n]";

  const ToolFrame* top = s.stack.Top();
  if (!top) return "";
  switch (s.state) {
    case EngineState::AwaitingDepthDecision:
      return "Tool stack depth has reached " + std::to_string(s.stack.Depth()) + " levels. Continue for another " +
             std::to_string(config_.Increment()) + " levels? [y/N]";
    case EngineState::ReadyToExecute:
      return "Running " + top->tool_name + "...";
    case EngineState::CollectingParameters: {
      const std::string& name = top->missing_parameters.front();
      auto desc = registry_.Resolve(top->tool_name);
      const ParamSpec* spec = desc ? desc->FindParameter(name) : nullptr;
      if (spec && !spec->question.empty()) return spec->question;
      std::string q = "Please provide " + name;
      if (spec) q += " (" + ParamTypeName(spec->type) + (spec->description.empty() ? "" : ", " + spec->description) + ")";
      return q + " for " + top->tool_name + ":";
    }
    default:
      return "";
  }
}

StatusSnapshot Orchestrator::SnapshotLocked(const SessionContext& s) const {
  StatusSnapshot out;
  out.state = s.state;
  out.original_request = s.original_request;
  out.max_depth = s.stack.MaxDepth();
  out.awaiting_confirmation = s.awaiting_confirmation;
  const auto& frames = s.stack.Frames();
  for (size_t i = 0; i < frames.size(); i++) {
    FrameStatus f;
    f.tool_name = frames[i].tool_name;
    f.is_top = i + 1 == frames.size();
    f.missing_parameter_count = frames[i].missing_parameters.size();
    f.pending_child = frames[i].pending_child;
    out.frames.push_back(std::move(f));
  }
  out.formatted = s.stack.Format(s.original_request);
  return out;
}

}  // namespace taco
