#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "context.hpp"

namespace stepflow {

enum class step_kind { linear, split_static, split_foreach, join };

[[nodiscard]] constexpr auto to_string(step_kind kind) noexcept -> std::string_view {
  switch (kind) {
    case step_kind::linear:
      return "linear";
    case step_kind::split_static:
      return "split-static";
    case step_kind::split_foreach:
      return "split-foreach";
    case step_kind::join:
      return "join";
  }
  return "unknown";
}

// Resource and environment requirements of a step. The engine records them on the step
// and never interprets them; an external execution substrate may.
struct step_config {
  std::optional<std::size_t>         memory_mb;
  std::map<std::string, std::string> environment;
};

using step_body = std::function<step_output(step_input&)>;
using join_body = std::function<step_output(join_input&)>;

struct step_definition {
  std::string              name;
  step_kind                kind = step_kind::linear;
  step_body                body;   // linear and split steps; empty means no-op
  join_body                merge;  // join steps; empty means nothing is forwarded
  std::vector<std::string> successors;
  std::size_t              arity = 0;  // join steps: number of incoming edges
  step_config              config;

  [[nodiscard]] auto is_split() const noexcept -> bool {
    return kind == step_kind::split_static || kind == step_kind::split_foreach;
  }

  [[nodiscard]] auto is_end() const noexcept -> bool {
    return successors.empty();
  }
};

}  // namespace stepflow
