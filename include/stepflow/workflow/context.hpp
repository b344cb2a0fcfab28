#pragma once

#include <concepts>
#include <cstddef>
#include <memory>
#include <optional>
#include <ranges>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "artifact.hpp"
#include "branch_path.hpp"
#include "errors.hpp"
#include "merge.hpp"
#include "parameters.hpp"

namespace stepflow {

// Identity and immutable settings of one run, shared by every step execution.
struct run_info {
  std::string                     run_id;
  std::string                     workflow;
  run_parameters                  parameters;
  std::shared_ptr<spdlog::logger> logger;
};

// What a step body hands back to the engine: the artifacts it produced and, for foreach
// steps, the elements to fan out over.
class step_output {
 public:
  step_output() = default;

  template <class T>
  auto set(std::string name, T&& value) -> step_output& {
    artifacts_.set(std::move(name), std::forward<T>(value));
    return *this;
  }

  // Adds every entry of `artifacts`, replacing same-named ones.
  auto merge(const artifact_map& artifacts) -> step_output& {
    artifacts_ = artifacts_.overlaid_with(artifacts);
    return *this;
  }

  template <std::ranges::input_range R>
  auto foreach_over(R&& items) -> step_output& {
    std::vector<artifact> elements;
    for (auto&& item : items) {
      if constexpr (std::same_as<std::remove_cvref_t<decltype(item)>, artifact>) {
        elements.push_back(item);
      } else {
        elements.push_back(artifact::make(item));
      }
    }
    foreach_items_ = std::move(elements);
    return *this;
  }

  [[nodiscard]] auto artifacts() const noexcept -> const artifact_map& {
    return artifacts_;
  }

  [[nodiscard]] auto foreach_items() const noexcept -> const std::optional<std::vector<artifact>>& {
    return foreach_items_;
  }

 private:
  artifact_map                         artifacts_;
  std::optional<std::vector<artifact>> foreach_items_;
};

// Read-only view a linear or split step body runs against.
class step_input {
 public:
  step_input(const run_info& run, std::string_view step, const branch_path& path,
             const artifact_map& inherited, const artifact& element, std::stop_token stop)
      : run_(&run),
        step_(step),
        path_(&path),
        inherited_(&inherited),
        element_(&element),
        stop_(std::move(stop)) {}

  [[nodiscard]] auto step() const noexcept -> std::string_view {
    return step_;
  }

  [[nodiscard]] auto run_id() const noexcept -> const std::string& {
    return run_->run_id;
  }

  [[nodiscard]] auto parameters() const noexcept -> const run_parameters& {
    return run_->parameters;
  }

  template <class T>
  [[nodiscard]] auto parameter(std::string_view name) const -> T {
    return run_->parameters.get<T>(name);
  }

  [[nodiscard]] auto path() const noexcept -> const branch_path& {
    return *path_;
  }

  // 1-based index of the innermost branch, 0 outside any parallel region.
  [[nodiscard]] auto branch_index() const noexcept -> std::size_t {
    return path_->empty() ? 0 : path_->frames().back().index;
  }

  [[nodiscard]] auto artifacts() const noexcept -> const artifact_map& {
    return *inherited_;
  }

  template <class T>
  [[nodiscard]] auto get(std::string_view name) const -> const T& {
    return inherited_->get<T>(name);
  }

  // Element of the innermost foreach this branch was spawned for.
  [[nodiscard]] auto has_input() const noexcept -> bool {
    return element_->has_value();
  }

  [[nodiscard]] auto input() const -> const artifact& {
    if (!element_->has_value()) {
      throw missing_artifact_error("foreach input");
    }
    return *element_;
  }

  template <class T>
  [[nodiscard]] auto input_as() const -> const T& {
    return input().get<T>();
  }

  [[nodiscard]] auto stop_requested() const noexcept -> bool {
    return stop_.stop_requested();
  }

  [[nodiscard]] auto logger() const noexcept -> spdlog::logger& {
    return *run_->logger;
  }

 private:
  const run_info*     run_;
  std::string_view    step_;
  const branch_path*  path_;
  const artifact_map* inherited_;
  const artifact*     element_;
  std::stop_token     stop_;
};

// View a join body runs against: the completed branches of its region, ordered by branch
// index. Nothing is visible under the join's own context unless the body publishes it.
class join_input {
 public:
  join_input(const run_info& run, std::string_view step, const branch_path& path,
             std::span<const branch_view> branches, const merge_policy& policy)
      : run_(&run), step_(step), path_(&path), branches_(branches), policy_(&policy) {}

  [[nodiscard]] auto step() const noexcept -> std::string_view {
    return step_;
  }

  [[nodiscard]] auto run_id() const noexcept -> const std::string& {
    return run_->run_id;
  }

  [[nodiscard]] auto parameters() const noexcept -> const run_parameters& {
    return run_->parameters;
  }

  template <class T>
  [[nodiscard]] auto parameter(std::string_view name) const -> T {
    return run_->parameters.get<T>(name);
  }

  // Path of the context the join continues, i.e. the split's own path.
  [[nodiscard]] auto path() const noexcept -> const branch_path& {
    return *path_;
  }

  [[nodiscard]] auto branches() const noexcept -> std::span<const branch_view> {
    return branches_;
  }

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return branches_.size();
  }

  [[nodiscard]] auto empty() const noexcept -> bool {
    return branches_.empty();
  }

  [[nodiscard]] auto values(std::string_view name) const -> std::vector<double> {
    return collect_values(branches_, name);
  }

  // Combines `name` across all branches with the engine's metric policy.
  [[nodiscard]] auto aggregate(std::string_view name) const -> metric_summary {
    return aggregate(name, *policy_);
  }

  [[nodiscard]] auto aggregate(std::string_view name, const merge_policy& policy) const
      -> metric_summary {
    auto collected = values(name);
    return policy(collected);
  }

  // The artifact `name` of the branch with the given 1-based index.
  [[nodiscard]] auto select(std::string_view name, std::size_t branch_index) const
      -> const artifact& {
    for (const auto& branch : branches_) {
      if (branch.index == branch_index) {
        return branch.artifacts.at(name);
      }
    }
    throw missing_artifact_error(fmt::format("{} (branch index {})", name, branch_index));
  }

  [[nodiscard]] auto merge_artifacts(const std::vector<std::string>& include = {},
                                     const std::vector<std::string>& exclude = {}) const
      -> artifact_map {
    return merge_branch_artifacts(branches_, include, exclude);
  }

  [[nodiscard]] auto logger() const noexcept -> spdlog::logger& {
    return *run_->logger;
  }

 private:
  const run_info*              run_;
  std::string_view             step_;
  const branch_path*           path_;
  std::span<const branch_view> branches_;
  const merge_policy*          policy_;
};

}  // namespace stepflow
