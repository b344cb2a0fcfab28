#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <span>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "execution.hpp"
#include "log.hpp"
#include "workflow/engine.hpp"
#include "workflow/errors.hpp"
#include "workflow/parameters.hpp"

namespace stepflow::config {

struct engine_settings {
  std::size_t               threads       = 0;  // 0 runs every branch inline
  empty_foreach_policy      empty_foreach = empty_foreach_policy::join_immediately;
  spdlog::level::level_enum log_level     = spdlog::level::info;
};

// {"engine": {...}, "parameters": {...}}; parameters stay raw until resolved against the
// declarations of the workflow that consumes them.
struct stepflow_config {
  engine_settings engine;
  nlohmann::json  parameters = nlohmann::json::object();
};

namespace _detail {

template <class T>
auto get_opt(const nlohmann::json& obj, const char* key) -> std::optional<T> {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) {
    return std::nullopt;
  }
  try {
    return it->get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw configuration_error(fmt::format("config key '{}': {}", key, e.what()));
  }
}

inline auto parse_policy(std::string_view name) -> empty_foreach_policy {
  if (name == "join_immediately") {
    return empty_foreach_policy::join_immediately;
  }
  if (name == "fail") {
    return empty_foreach_policy::fail;
  }
  throw configuration_error(fmt::format(
      "unknown empty_foreach policy '{}' (expected join_immediately or fail)", name));
}

inline auto parse_level(std::string_view name) -> spdlog::level::level_enum {
  auto level = log::parse_level(name);
  if (level == spdlog::level::off && name != "off") {
    throw configuration_error(fmt::format("unknown log level '{}'", name));
  }
  return level;
}

inline auto from_json(const parameter_spec& spec, const nlohmann::json& value) -> parameter_value {
  auto mismatch = [&] -> configuration_error {
    return configuration_error(fmt::format("parameter '{}' expects a {}, got {}", spec.name,
                                           type_name(spec.default_value), value.type_name()));
  };
  switch (spec.default_value.index()) {
    case 0:
      if (!value.is_boolean()) {
        throw mismatch();
      }
      return value.get<bool>();
    case 1:
      if (!value.is_number_integer()) {
        throw mismatch();
      }
      return value.get<std::int64_t>();
    case 2:
      if (!value.is_number()) {
        throw mismatch();
      }
      return value.get<double>();
    default:
      if (!value.is_string()) {
        throw mismatch();
      }
      return value.get<std::string>();
  }
}

inline auto from_env(const parameter_spec& spec, const std::string& text) -> parameter_value {
  auto invalid = [&] -> configuration_error {
    return configuration_error(fmt::format("environment variable {}='{}' is not a valid {}",
                                           spec.env, text, type_name(spec.default_value)));
  };
  switch (spec.default_value.index()) {
    case 0:
      if (text == "true" || text == "1") {
        return true;
      }
      if (text == "false" || text == "0") {
        return false;
      }
      throw invalid();
    case 1: {
      std::size_t consumed = 0;
      try {
        auto value = std::stoll(text, &consumed);
        if (consumed == text.size()) {
          return static_cast<std::int64_t>(value);
        }
      } catch (const std::logic_error&) {
        throw invalid();
      }
      throw invalid();
    }
    case 2: {
      std::size_t consumed = 0;
      try {
        auto value = std::stod(text, &consumed);
        if (consumed == text.size()) {
          return value;
        }
      } catch (const std::logic_error&) {
        throw invalid();
      }
      throw invalid();
    }
    default:
      return text;
  }
}

}  // namespace _detail

// Parses a configuration document. Absent sections keep their defaults.
[[nodiscard]] inline auto parse(std::string_view text) -> stepflow_config {
  nlohmann::json document;
  try {
    document = nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error& e) {
    throw configuration_error(fmt::format("invalid configuration: {}", e.what()));
  }
  if (!document.is_object()) {
    throw configuration_error("configuration must be a JSON object");
  }

  stepflow_config config;
  for (const auto& [key, value] : document.items()) {
    if (key != "engine" && key != "parameters") {
      throw configuration_error(fmt::format("unknown configuration section '{}'", key));
    }
  }

  if (auto it = document.find("engine"); it != document.end()) {
    const auto& engine = *it;
    if (!engine.is_object()) {
      throw configuration_error("'engine' must be an object");
    }
    if (auto threads = _detail::get_opt<std::int64_t>(engine, "threads")) {
      if (*threads < 0) {
        throw configuration_error(fmt::format("engine.threads must not be negative, got {}",
                                              *threads));
      }
      config.engine.threads = static_cast<std::size_t>(*threads);
    }
    if (auto policy = _detail::get_opt<std::string>(engine, "empty_foreach")) {
      config.engine.empty_foreach = _detail::parse_policy(*policy);
    }
    if (auto level = _detail::get_opt<std::string>(engine, "log_level")) {
      config.engine.log_level = _detail::parse_level(*level);
    }
  }

  if (auto it = document.find("parameters"); it != document.end()) {
    if (!it->is_object()) {
      throw configuration_error("'parameters' must be an object");
    }
    config.parameters = *it;
  }
  return config;
}

[[nodiscard]] inline auto load(const std::filesystem::path& file_name) -> stepflow_config {
  std::ifstream file(file_name);
  if (!file.is_open()) {
    throw configuration_error(fmt::format("could not open config file {}", file_name.string()));
  }
  std::stringstream content;
  content << file.rdbuf();
  return parse(content.str());
}

// Resolves declared parameters: declared default, then the environment variable the
// declaration names, then `values`. Names in `values` that nothing declares are rejected.
[[nodiscard]] inline auto resolve_parameters(
    std::span<const parameter_spec> specs,
    const nlohmann::json&           values = nlohmann::json::object()) -> run_parameters {
  if (!values.is_object()) {
    throw configuration_error("parameters must be a JSON object");
  }
  for (const auto& [name, value] : values.items()) {
    bool declared = false;
    for (const auto& spec : specs) {
      declared = declared || spec.name == name;
    }
    if (!declared) {
      throw configuration_error(fmt::format("unknown run parameter '{}'", name));
    }
  }

  run_parameters::container resolved;
  for (const auto& spec : specs) {
    auto value = spec.default_value;
    if (!spec.env.empty()) {
      if (const char* env = std::getenv(spec.env.c_str()); env != nullptr && *env != '\0') {
        value = _detail::from_env(spec, env);
      }
    }
    if (auto it = values.find(spec.name); it != values.end()) {
      value = _detail::from_json(spec, *it);
    }
    resolved.insert_or_assign(spec.name, std::move(value));
  }
  return run_parameters{std::move(resolved)};
}

// An engine together with the pool its scheduler submits to. The pool is declared first so
// it outlives the engine.
struct configured_engine {
  std::unique_ptr<execution::thread_pool> pool;
  stepflow::engine                        engine;
};

[[nodiscard]] inline auto build_engine(const engine_settings&          settings,
                                       std::shared_ptr<spdlog::logger> logger = {})
    -> configured_engine {
  if (!logger) {
    logger = log::get();
  }
  logger->set_level(settings.log_level);

  configured_engine configured;
  engine_options    options{.empty_foreach = settings.empty_foreach, .logger = logger};
  if (settings.threads > 0) {
    configured.pool   = std::make_unique<execution::thread_pool>(settings.threads);
    options.scheduler = configured.pool->get_scheduler();
  }
  configured.engine = stepflow::engine{std::move(options)};
  return configured;
}

}  // namespace stepflow::config
