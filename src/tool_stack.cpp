#include "tool_stack.hpp"

#include <sstream>
#include <utility>

namespace taco {

bool ToolStack::Push(ToolFrame frame) {
  if (!CanPush()) return false;
  frames_.push_back(std::move(frame));
  return true;
}

std::optional<ToolFrame> ToolStack::Pop() {
  if (frames_.empty()) return std::nullopt;
  ToolFrame top = std::move(frames_.back());
  frames_.pop_back();
  return top;
}

bool ToolStack::SetMaxDepth(size_t max_depth) {
  if (max_depth < frames_.size()) return false;
  max_depth_ = max_depth;
  return true;
}

std::string ToolStack::Format(const std::optional<std::string>& original_request) const {
  if (frames_.empty()) return "No active tool workflow";

  std::ostringstream oss;
  oss << "Tool Stack (" << frames_.size() << "/" << max_depth_ << "):";
  for (size_t i = 0; i < frames_.size(); i++) {
    const auto& f = frames_[i];
    oss << "\n" << std::string(i * 2, ' ') << "└─ " << f.tool_name << " [";
    if (f.pending_child) {
      oss << "paused, waiting for " << *f.pending_child;
    } else if (!f.missing_parameters.empty()) {
      oss << "collecting " << f.missing_parameters.front();
      if (f.missing_parameters.size() > 1) oss << " (+" << (f.missing_parameters.size() - 1) << " more)";
    } else {
      oss << "ready";
    }
    oss << "]";
  }
  if (original_request) oss << "\n\nOriginal request: " << *original_request;
  return oss.str();
}

}  // namespace taco
