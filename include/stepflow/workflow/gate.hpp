#pragma once

#include <cmath>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

#include "../log.hpp"

namespace stepflow {

enum class gate_outcome { fired, skipped };

[[nodiscard]] constexpr auto to_string(gate_outcome outcome) noexcept -> std::string_view {
  return outcome == gate_outcome::fired ? "fired" : "skipped";
}

// Guards a terminal action behind `metric >= threshold`. A closed gate is logged and is not
// an error; an exception thrown by the action propagates to the caller.
class threshold_gate {
 public:
  threshold_gate(std::string metric, double threshold)
      : metric_(std::move(metric)), threshold_(threshold) {}

  [[nodiscard]] auto metric() const noexcept -> const std::string& {
    return metric_;
  }

  [[nodiscard]] auto threshold() const noexcept -> double {
    return threshold_;
  }

  // NaN (no branch contributed a value) never opens the gate.
  [[nodiscard]] auto is_open(double value) const noexcept -> bool {
    return !std::isnan(value) && value >= threshold_;
  }

  auto run(double value, const std::function<void()>& action) const -> gate_outcome {
    return run(value, action, *log::get());
  }

  auto run(double value, const std::function<void()>& action, spdlog::logger& logger) const
      -> gate_outcome {
    if (!is_open(value)) {
      logger.info("{} = {} is below the threshold {}, skipping", metric_, value, threshold_);
      return gate_outcome::skipped;
    }
    logger.info("{} = {} meets the threshold {}", metric_, value, threshold_);
    action();
    return gate_outcome::fired;
  }

 private:
  std::string metric_;
  double      threshold_;
};

}  // namespace stepflow
