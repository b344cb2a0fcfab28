#pragma once

#include <concepts>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <map>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include <spdlog/fmt/fmt.h>

#include "errors.hpp"

namespace stepflow {

using parameter_value = std::variant<bool, std::int64_t, double, std::string>;

// Declaration of a run parameter: its default fixes the type. `env` names an environment
// variable that, when set, replaces the default.
struct parameter_spec {
  std::string     name;
  parameter_value default_value;
  std::string     help;
  std::string     env;
};

[[nodiscard]] inline auto type_name(const parameter_value& value) -> std::string_view {
  switch (value.index()) {
    case 0:
      return "bool";
    case 1:
      return "integer";
    case 2:
      return "number";
    default:
      return "string";
  }
}

// Run-scoped parameters, fixed when the run starts.
class run_parameters {
 public:
  using container = std::map<std::string, parameter_value, std::less<>>;

  run_parameters() = default;

  run_parameters(std::initializer_list<container::value_type> values) : values_(values) {}

  explicit run_parameters(container values) : values_(std::move(values)) {}

  [[nodiscard]] auto contains(std::string_view name) const -> bool {
    return values_.find(name) != values_.end();
  }

  [[nodiscard]] auto at(std::string_view name) const -> const parameter_value& {
    auto it = values_.find(name);
    if (it == values_.end()) {
      throw configuration_error(fmt::format("unknown run parameter '{}'", name));
    }
    return it->second;
  }

  // Numeric parameters convert between integer and floating point; bool and string do not.
  template <class T>
  [[nodiscard]] auto get(std::string_view name) const -> T {
    const auto& value = at(name);
    return std::visit(
        [&](const auto& held) -> T {
          using held_type = std::decay_t<decltype(held)>;
          if constexpr (std::same_as<held_type, T>) {
            return held;
          } else if constexpr (std::is_arithmetic_v<T> && !std::same_as<T, bool>
                               && std::is_arithmetic_v<held_type>
                               && !std::same_as<held_type, bool>) {
            return static_cast<T>(held);
          } else {
            throw configuration_error(fmt::format("run parameter '{}' is a {}", name,
                                                  type_name(value)));
          }
        },
        value);
  }

  // Copy with `name` set to `value`.
  [[nodiscard]] auto with(std::string name, parameter_value value) const -> run_parameters {
    auto copy = values_;
    copy.insert_or_assign(std::move(name), std::move(value));
    return run_parameters{std::move(copy)};
  }

  [[nodiscard]] auto values() const noexcept -> const container& {
    return values_;
  }

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return values_.size();
  }

 private:
  container values_;
};

}  // namespace stepflow
