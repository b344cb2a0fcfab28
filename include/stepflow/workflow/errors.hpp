#pragma once

#include <cstddef>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

#include <spdlog/fmt/fmt.h>

#include "branch_path.hpp"

namespace stepflow {

// Base of every error the workflow core raises.
class workflow_error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;

  [[nodiscard]] virtual auto kind() const noexcept -> const char* {
    return "workflow_error";
  }
};

// Best-effort message of an exception_ptr, for logs and wrapping errors.
[[nodiscard]] inline auto describe(const std::exception_ptr& ep) -> std::string {
  if (!ep) {
    return "no error";
  }
  try {
    std::rethrow_exception(ep);
  } catch (const std::exception& e) {
    return e.what();
  } catch (...) {
    return "unknown exception";
  }
}

// Kind of a workflow_error behind an exception_ptr, or "exception" for foreign errors.
[[nodiscard]] inline auto kind_of(const std::exception_ptr& ep) -> std::string {
  if (!ep) {
    return {};
  }
  try {
    std::rethrow_exception(ep);
  } catch (const workflow_error& e) {
    return e.kind();
  } catch (...) {
    return "exception";
  }
}

// Structural defect in a step graph, detected while building it.
class graph_error : public workflow_error {
 public:
  using workflow_error::workflow_error;

  [[nodiscard]] auto kind() const noexcept -> const char* override {
    return "graph_error";
  }
};

// A run initializer (e.g. connecting to the experiment tracker) failed; no step ran.
class run_initialization_error : public workflow_error {
 public:
  explicit run_initialization_error(const std::string& message, std::exception_ptr cause = {})
      : workflow_error(message), cause_(std::move(cause)) {}

  [[nodiscard]] auto kind() const noexcept -> const char* override {
    return "run_initialization_error";
  }

  [[nodiscard]] auto cause() const noexcept -> const std::exception_ptr& {
    return cause_;
  }

 private:
  std::exception_ptr cause_;
};

// A step body raised. Carries the step, the branch it ran on and the original error.
class step_execution_error : public workflow_error {
 public:
  step_execution_error(std::string step, branch_path path, std::exception_ptr cause)
      : workflow_error(fmt::format("step '{}' failed on branch {}: {}", step, path.to_string(),
                                   describe(cause))),
        step_(std::move(step)),
        path_(std::move(path)),
        cause_(std::move(cause)) {}

  [[nodiscard]] auto kind() const noexcept -> const char* override {
    return "step_execution_error";
  }

  [[nodiscard]] auto step() const noexcept -> const std::string& {
    return step_;
  }

  [[nodiscard]] auto path() const noexcept -> const branch_path& {
    return path_;
  }

  [[nodiscard]] auto cause() const noexcept -> const std::exception_ptr& {
    return cause_;
  }

 private:
  std::string        step_;
  branch_path        path_;
  std::exception_ptr cause_;
};

// A foreach step produced no element under empty_foreach_policy::fail.
class empty_foreach_error : public workflow_error {
 public:
  explicit empty_foreach_error(const std::string& step)
      : workflow_error(fmt::format("foreach step '{}' produced no elements", step)), step_(step) {}

  [[nodiscard]] auto kind() const noexcept -> const char* override {
    return "empty_foreach_error";
  }

  [[nodiscard]] auto step() const noexcept -> const std::string& {
    return step_;
  }

 private:
  std::string step_;
};

// Two converging branches supply different values for an artifact forwarded without an
// explicit resolution.
class merge_conflict_error : public workflow_error {
 public:
  merge_conflict_error(std::string artifact, std::size_t first_branch, std::size_t second_branch)
      : workflow_error(fmt::format(
            "artifact '{}' has conflicting values in branches {} and {}; select one branch or "
            "aggregate explicitly",
            artifact, first_branch, second_branch)),
        artifact_(std::move(artifact)) {}

  [[nodiscard]] auto kind() const noexcept -> const char* override {
    return "merge_conflict_error";
  }

  [[nodiscard]] auto artifact() const noexcept -> const std::string& {
    return artifact_;
  }

 private:
  std::string artifact_;
};

class missing_artifact_error : public workflow_error {
 public:
  explicit missing_artifact_error(const std::string& name)
      : workflow_error(fmt::format("artifact '{}' is not available", name)) {}

  [[nodiscard]] auto kind() const noexcept -> const char* override {
    return "missing_artifact_error";
  }
};

class artifact_type_error : public workflow_error {
 public:
  using workflow_error::workflow_error;

  [[nodiscard]] auto kind() const noexcept -> const char* override {
    return "artifact_type_error";
  }
};

// Second write to an existing (branch path, step) scope of the artifact store.
class artifact_store_error : public workflow_error {
 public:
  using workflow_error::workflow_error;

  [[nodiscard]] auto kind() const noexcept -> const char* override {
    return "artifact_store_error";
  }
};

class configuration_error : public workflow_error {
 public:
  using workflow_error::workflow_error;

  [[nodiscard]] auto kind() const noexcept -> const char* override {
    return "configuration_error";
  }
};

}  // namespace stepflow
