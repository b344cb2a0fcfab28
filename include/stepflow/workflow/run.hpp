#pragma once

#include <chrono>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "artifact.hpp"
#include "artifact_store.hpp"
#include "branch_path.hpp"
#include "errors.hpp"

namespace stepflow {

namespace _engine_detail {
class _run;
}  // namespace _engine_detail

enum class run_state { pending, running, succeeded, failed };

enum class step_state { pending, running, awaiting_join, succeeded, failed, skipped };

[[nodiscard]] constexpr auto to_string(run_state state) noexcept -> std::string_view {
  switch (state) {
    case run_state::pending:
      return "pending";
    case run_state::running:
      return "running";
    case run_state::succeeded:
      return "succeeded";
    case run_state::failed:
      return "failed";
  }
  return "unknown";
}

[[nodiscard]] constexpr auto to_string(step_state state) noexcept -> std::string_view {
  switch (state) {
    case step_state::pending:
      return "pending";
    case step_state::running:
      return "running";
    case step_state::awaiting_join:
      return "awaiting_join";
    case step_state::succeeded:
      return "succeeded";
    case step_state::failed:
      return "failed";
    case step_state::skipped:
      return "skipped";
  }
  return "unknown";
}

// One execution of one step on one branch.
struct step_record {
  using clock = std::chrono::system_clock;

  std::string       step;
  branch_path       path;
  step_state        state = step_state::pending;
  std::string       error;
  clock::time_point started;
  clock::time_point finished;
};

// Outcome of engine::run. Step failures are reported here, never thrown by run().
class run_result {
 public:
  [[nodiscard]] auto run_id() const noexcept -> const std::string& {
    return run_id_;
  }

  [[nodiscard]] auto state() const noexcept -> run_state {
    return state_;
  }

  [[nodiscard]] auto succeeded() const noexcept -> bool {
    return state_ == run_state::succeeded;
  }

  // Outgoing view of the end step; empty unless succeeded.
  [[nodiscard]] auto artifacts() const noexcept -> const artifact_map& {
    return artifacts_;
  }

  // Everything published during the run, including by branches that failed.
  [[nodiscard]] auto store() const noexcept -> const artifact_store& {
    return *store_;
  }

  [[nodiscard]] auto records() const noexcept -> const std::vector<step_record>& {
    return records_;
  }

  [[nodiscard]] auto executions_of(std::string_view step) const -> std::vector<step_record> {
    std::vector<step_record> out;
    for (const auto& record : records_) {
      if (record.step == step) {
        out.push_back(record);
      }
    }
    return out;
  }

  // The first failure of the run, in time.
  [[nodiscard]] auto error() const noexcept -> const std::exception_ptr& {
    return error_;
  }

  // Kind of the innermost workflow error behind the engine's wrappers; a wrapper's own kind
  // when the cause is foreign or a plain workflow_error.
  [[nodiscard]] auto error_kind() const -> std::string {
    auto kind    = kind_of(error_);
    auto current = error_;
    while (current) {
      current = cause_of(current);
      if (!current) {
        break;
      }
      if (auto inner = kind_of(current); inner != "exception" && inner != "workflow_error") {
        kind = std::move(inner);
      }
    }
    return kind;
  }

  [[nodiscard]] auto error_message() const -> std::string {
    return error_ ? describe(error_) : std::string{};
  }

  // Branch the first failure happened on; empty for initialization failures.
  [[nodiscard]] auto failed_path() const noexcept -> const std::optional<branch_path>& {
    return failed_path_;
  }

  // The error a step body or initializer raised, unwrapped from the engine's wrappers.
  [[nodiscard]] auto root_cause() const -> std::exception_ptr {
    auto current = error_;
    while (current) {
      auto inner = cause_of(current);
      if (!inner) {
        return current;
      }
      current = std::move(inner);
    }
    return current;
  }

  void rethrow_if_failed() const {
    if (error_) {
      std::rethrow_exception(error_);
    }
  }

 private:
  friend class _engine_detail::_run;

  // Nested cause of an engine wrapper; null for any other error.
  static auto cause_of(const std::exception_ptr& ep) -> std::exception_ptr {
    try {
      std::rethrow_exception(ep);
    } catch (const step_execution_error& e) {
      return e.cause();
    } catch (const run_initialization_error& e) {
      return e.cause();
    } catch (...) {
      return {};
    }
  }

  run_result(std::string run_id, std::shared_ptr<const artifact_store> store)
      : run_id_(std::move(run_id)), store_(std::move(store)) {}

  std::string                           run_id_;
  run_state                             state_ = run_state::pending;
  artifact_map                          artifacts_;
  std::shared_ptr<const artifact_store> store_;
  std::vector<step_record>              records_;
  std::exception_ptr                    error_;
  std::optional<branch_path>            failed_path_;
};

}  // namespace stepflow
