#pragma once

#include <compare>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace stepflow {

// One fork taken at an ancestor split: the split step and the 1-based branch index.
struct branch_frame {
  std::string split;
  std::size_t index = 0;

  auto operator<=>(const branch_frame&) const = default;
};

// Ordered list of forks from the run root down to a branch. The root path is empty.
class branch_path {
 public:
  branch_path() = default;

  explicit branch_path(std::vector<branch_frame> frames) : frames_(std::move(frames)) {}

  [[nodiscard]] auto push(std::string split, std::size_t index) const -> branch_path {
    auto frames = frames_;
    frames.push_back(branch_frame{std::move(split), index});
    return branch_path{std::move(frames)};
  }

  [[nodiscard]] auto pop() const -> branch_path {
    if (frames_.empty()) {
      throw std::logic_error("branch_path: pop on the root path");
    }
    return branch_path{std::vector<branch_frame>(frames_.begin(), frames_.end() - 1)};
  }

  [[nodiscard]] auto empty() const noexcept -> bool {
    return frames_.empty();
  }

  [[nodiscard]] auto depth() const noexcept -> std::size_t {
    return frames_.size();
  }

  [[nodiscard]] auto back() const -> const branch_frame& {
    if (frames_.empty()) {
      throw std::logic_error("branch_path: root path has no frame");
    }
    return frames_.back();
  }

  [[nodiscard]] auto frames() const noexcept -> const std::vector<branch_frame>& {
    return frames_;
  }

  // "cross_validation[3]", nested forks joined with '/', "/" for the root.
  [[nodiscard]] auto to_string() const -> std::string {
    if (frames_.empty()) {
      return "/";
    }
    std::string out;
    for (const auto& frame : frames_) {
      if (!out.empty()) {
        out += '/';
      }
      out += frame.split;
      out += '[';
      out += std::to_string(frame.index);
      out += ']';
    }
    return out;
  }

  auto operator<=>(const branch_path&) const = default;

 private:
  std::vector<branch_frame> frames_;
};

}  // namespace stepflow
