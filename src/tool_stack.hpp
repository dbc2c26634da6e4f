#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace taco {

struct ToolFrame {
  std::string tool_name;
  nlohmann::json collected_parameters = nlohmann::json::object();
  std::vector<std::string> missing_parameters;
  std::chrono::system_clock::time_point created_at = std::chrono::system_clock::now();
  std::optional<std::string> pending_child;
};

// Frames in push order; the back is the active frame. Depth never exceeds MaxDepth().
class ToolStack {
 public:
  explicit ToolStack(size_t max_depth = 20) : max_depth_(max_depth) {}

  bool CanPush() const { return frames_.size() < max_depth_; }
  bool Push(ToolFrame frame);
  std::optional<ToolFrame> Pop();
  void Clear() { frames_.clear(); }

  ToolFrame* Top() { return frames_.empty() ? nullptr : &frames_.back(); }
  const ToolFrame* Top() const { return frames_.empty() ? nullptr : &frames_.back(); }

  bool Empty() const { return frames_.empty(); }
  size_t Depth() const { return frames_.size(); }
  size_t MaxDepth() const { return max_depth_; }

  // Lowering the ceiling below the current depth is refused.
  bool SetMaxDepth(size_t max_depth);
  void Extend(size_t increment) { max_depth_ += increment; }

  const std::vector<ToolFrame>& Frames() const { return frames_; }

  // Indented tree of frames with their status, plus the original request when given.
  std::string Format(const std::optional<std::string>& original_request) const;

 private:
  size_t max_depth_;
  std::vector<ToolFrame> frames_;
};

}  // namespace taco
