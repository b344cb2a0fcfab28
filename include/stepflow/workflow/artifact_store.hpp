#pragma once

#include <compare>
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <spdlog/fmt/fmt.h>

#include "artifact.hpp"
#include "branch_path.hpp"
#include "errors.hpp"

namespace stepflow {

// Namespace of one step execution inside a run.
struct artifact_scope {
  branch_path path;
  std::string step;

  auto operator<=>(const artifact_scope&) const = default;
};

// Per-run store of the artifacts each step execution published. Each scope is written
// once; entries of failed branches stay readable for diagnostics.
class artifact_store {
 public:
  explicit artifact_store(std::string run_id) : run_id_(std::move(run_id)) {}

  artifact_store(const artifact_store&)                    = delete;
  auto operator=(const artifact_store&) -> artifact_store& = delete;

  [[nodiscard]] auto run_id() const noexcept -> const std::string& {
    return run_id_;
  }

  void publish(const branch_path& path, std::string_view step, artifact_map artifacts) {
    std::scoped_lock lock(mutex_);
    auto [it, inserted] =
        entries_.try_emplace(artifact_scope{path, std::string{step}}, std::move(artifacts));
    if (!inserted) {
      throw artifact_store_error(fmt::format("run {}: step '{}' on branch {} already published",
                                             run_id_, step, path.to_string()));
    }
  }

  [[nodiscard]] auto find(const branch_path& path, std::string_view step) const
      -> std::optional<artifact_map> {
    std::scoped_lock lock(mutex_);
    auto             it = entries_.find(artifact_scope{path, std::string{step}});
    if (it == entries_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  [[nodiscard]] auto at(const branch_path& path, std::string_view step) const -> artifact_map {
    if (auto found = find(path, step)) {
      return std::move(*found);
    }
    throw missing_artifact_error(fmt::format("{}@{}", step, path.to_string()));
  }

  // Every scope the given step published under, in branch path order.
  [[nodiscard]] auto scopes_of(std::string_view step) const -> std::vector<artifact_scope> {
    std::scoped_lock            lock(mutex_);
    std::vector<artifact_scope> out;
    for (const auto& [scope, artifacts] : entries_) {
      if (scope.step == step) {
        out.push_back(scope);
      }
    }
    return out;
  }

  [[nodiscard]] auto scopes() const -> std::vector<artifact_scope> {
    std::scoped_lock            lock(mutex_);
    std::vector<artifact_scope> out;
    out.reserve(entries_.size());
    for (const auto& [scope, artifacts] : entries_) {
      out.push_back(scope);
    }
    return out;
  }

  [[nodiscard]] auto size() const -> std::size_t {
    std::scoped_lock lock(mutex_);
    return entries_.size();
  }

 private:
  std::string                            run_id_;
  mutable std::mutex                     mutex_;
  std::map<artifact_scope, artifact_map> entries_;
};

}  // namespace stepflow
