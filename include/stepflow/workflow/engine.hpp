#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "../execution.hpp"
#include "../log.hpp"
#include "artifact.hpp"
#include "artifact_store.hpp"
#include "branch_path.hpp"
#include "context.hpp"
#include "errors.hpp"
#include "graph.hpp"
#include "merge.hpp"
#include "parameters.hpp"
#include "run.hpp"
#include "step.hpp"

namespace stepflow {

// What a foreach step producing zero elements does.
enum class empty_foreach_policy {
  join_immediately,  // the join runs with no branches
  fail,              // the run fails with empty_foreach_error
};

[[nodiscard]] constexpr auto to_string(empty_foreach_policy policy) noexcept -> std::string_view {
  return policy == empty_foreach_policy::fail ? "fail" : "join_immediately";
}

struct step_invocation {
  std::string_view   step;
  step_kind          kind;
  const branch_path& path;
  std::string_view   run_id;
};

// Wraps every body call. Receives the call to make and returns its output; it may call it
// more than once (retry) or translate errors. The engine never retries by itself.
using step_invoker =
    std::function<step_output(const step_invocation&, const std::function<step_output()>&)>;

// Runs before the start step; its artifacts are visible to the start step.
using run_initializer = std::function<artifact_map(const run_info&)>;

struct engine_options {
  execution::any_scheduler        scheduler;
  empty_foreach_policy            empty_foreach = empty_foreach_policy::join_immediately;
  merge_policy                    metric_policy = merge_policies::mean_std();
  step_invoker                    invoker;
  std::shared_ptr<spdlog::logger> logger;
};

struct run_options {
  std::string                  run_id;  // generated when empty
  std::vector<run_initializer> initializers;
};

namespace _engine_detail {

[[nodiscard]] inline auto generate_run_id() -> std::string {
  static std::mutex      mutex;
  static std::mt19937_64 generator{std::random_device{}()};

  const auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::system_clock::now().time_since_epoch())
                       .count();
  std::scoped_lock lock(mutex);
  return fmt::format("run-{}-{:08x}", now, static_cast<std::uint32_t>(generator()));
}

struct _region;

// Execution context of one branch: where it runs, what it sees, and which region slot it
// settles when it stops.
struct _branch {
  branch_path              path;
  artifact_map             view;
  artifact                 element;
  std::shared_ptr<_region> region;  // innermost open region, null at the run root
  std::size_t              slot = 0;
};

// An open split: its branches settle into `group`; the last one closes the region.
struct _region {
  _region(const step_definition& split_step, const step_definition& join_step,
          _branch parent_branch, std::size_t width, std::size_t record)
      : split(&split_step),
        join(&join_step),
        parent(std::move(parent_branch)),
        group(width),
        join_record(record) {}

  const step_definition*             split;
  const step_definition*             join;
  _branch                            parent;
  execution::task_group<branch_view> group;
  std::size_t                        join_record;
};

// Shared state of one run. Tasks hold it by shared_ptr; the graph and options are only
// touched until the run settles.
class _run : public std::enable_shared_from_this<_run> {
 public:
  _run(const graph& g, const engine_options& options, run_info info)
      : graph_(&g),
        options_(&options),
        info_(std::move(info)),
        store_(std::make_shared<artifact_store>(info_.run_id)) {}

  void start(const std::vector<run_initializer>& initializers) {
    {
      std::scoped_lock lock(mutex_);
      state_ = run_state::running;
    }
    logger().info("run {} of '{}' started", info_.run_id, info_.workflow);

    artifact_map seeded;
    for (const auto& initializer : initializers) {
      try {
        seeded = seeded.overlaid_with(initializer(info_));
      } catch (...) {
        auto cause = std::current_exception();
        auto error = std::make_exception_ptr(run_initialization_error(
            fmt::format("run {} failed to initialize: {}", info_.run_id, describe(cause)), cause));
        record_failure(std::nullopt, error);
        finish(run_state::failed);
        return;
      }
    }

    _branch root{.path = {}, .view = std::move(seeded)};
    const auto* first = &graph_->start();
    try {
      options_->scheduler.execute([self = shared_from_this(), root, first] mutable -> void {
        self->drive(std::move(root), first);
      });
    } catch (...) {
      fail(root, std::current_exception());
    }
  }

  auto wait() -> run_result {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] -> bool { return completed_; });

    run_result result{info_.run_id, store_};
    result.state_       = state_;
    result.artifacts_   = final_artifacts_;
    result.error_       = first_error_;
    result.failed_path_ = failed_path_;
    {
      std::scoped_lock records_lock(records_mutex_);
      result.records_ = records_;
    }
    return result;
  }

 private:
  [[nodiscard]] auto logger() const -> spdlog::logger& {
    return *info_.logger;
  }

  // Runs `branch` from `step` along linear steps until it forks, joins or ends.
  void drive(_branch branch, const step_definition* step) {
    while (true) {
      if (step->kind == step_kind::join) {
        arrive(std::move(branch));
        return;
      }
      if (stop_.stop_requested()) {
        add_record(step->name, branch.path, step_state::skipped);
        logger().debug("step '{}' on {} skipped after failure", step->name,
                       branch.path.to_string());
        settle_stopped(branch);
        return;
      }

      auto record = add_record(step->name, branch.path, step_state::running);
      auto out    = attempt(branch, *step, branch.path, record, [&] -> step_output {
        if (!step->body) {
          return {};
        }
        step_input input(info_, step->name, branch.path, branch.view, branch.element,
                         stop_.get_token());
        return step->body(input);
      });
      if (!out) {
        return;
      }

      branch.view = branch.view.overlaid_with(out->artifacts());
      if (step->is_split()) {
        open_region(std::move(branch), *step, *out);
        return;
      }
      if (step->is_end()) {
        complete(branch);
        return;
      }
      step = &graph_->step(step->successors.front());
    }
  }

  // Invokes one body through the invoker, publishes its output and records the outcome.
  // On failure settles `target` with the wrapped error and returns nullopt.
  auto attempt(const _branch& target, const step_definition& step, const branch_path& path,
               std::size_t record, const std::function<step_output()>& call)
      -> std::optional<step_output> {
    logger().debug("step '{}' started on {}", step.name, path.to_string());
    try {
      step_output out = options_->invoker ? options_->invoker(
                                                step_invocation{step.name, step.kind, path,
                                                                info_.run_id},
                                                call)
                                          : call();
      if (step.kind == step_kind::split_foreach && !out.foreach_items()) {
        throw workflow_error(
            fmt::format("foreach step '{}' returned no element sequence", step.name));
      }
      store_->publish(path, step.name, out.artifacts());
      finish_record(record, step_state::succeeded);
      logger().debug("step '{}' finished on {}", step.name, path.to_string());
      return out;
    } catch (...) {
      auto error = std::make_exception_ptr(
          step_execution_error(step.name, path, std::current_exception()));
      finish_record(record, step_state::failed, describe(error));
      logger().error("{}", describe(error));
      record_failure(path, error);
      settle_error(target, error);
      return std::nullopt;
    }
  }

  void open_region(_branch parent, const step_definition& split, const step_output& out) {
    const auto& join = graph_->step(graph_->matching_join(split.name));

    std::vector<std::pair<const step_definition*, artifact>> targets;
    if (split.kind == step_kind::split_static) {
      for (const auto& name : split.successors) {
        targets.emplace_back(&graph_->step(name), parent.element);
      }
    } else {
      const auto* body = &graph_->step(split.successors.front());
      for (const auto& element : *out.foreach_items()) {
        targets.emplace_back(body, element);
      }
    }

    if (targets.empty() && options_->empty_foreach == empty_foreach_policy::fail) {
      auto error = std::make_exception_ptr(empty_foreach_error(split.name));
      logger().error("{}", describe(error));
      add_record(join.name, parent.path, step_state::skipped);
      record_failure(parent.path, error);
      settle_error(parent, error);
      return;
    }

    auto record = add_record(join.name, parent.path, step_state::awaiting_join);
    if (targets.empty()) {
      logger().info("foreach '{}' on {} produced no elements, joining immediately", split.name,
                    parent.path.to_string());
      run_join(std::move(parent), join, record, {});
      return;
    }

    const auto width  = targets.size();
    auto       region = std::make_shared<_region>(split, join, parent, width, record);
    logger().info("'{}' on {} spawned {} branches", split.name, parent.path.to_string(), width);

    // The last branch may close the region, finish the run and release the graph before this
    // loop returns; nothing but locals is touched after the final execute.
    for (std::size_t i = 0; i < width; ++i) {
      _branch child{.path    = parent.path.push(split.name, i + 1),
                    .view    = parent.view,
                    .element = std::move(targets[i].second),
                    .region  = region,
                    .slot    = i};
      const auto* first = targets[i].first;
      try {
        options_->scheduler.execute([self = shared_from_this(), child, first] mutable -> void {
          self->drive(std::move(child), first);
        });
      } catch (...) {
        auto error = std::current_exception();
        record_failure(child.path, error);
        settle_error(child, error);
      }
    }
  }

  void arrive(_branch branch) {
    auto region = branch.region;
    auto slot   = branch.slot;
    if (region->group.set_value(
            slot, branch_view{std::move(branch.path), slot + 1, std::move(branch.view)})) {
      close_region(region);
    }
  }

  void settle_error(const _branch& branch, std::exception_ptr error) {
    if (!branch.region) {
      finish(run_state::failed);
      return;
    }
    if (branch.region->group.set_error(branch.slot, std::move(error))) {
      close_region(branch.region);
    }
  }

  void settle_stopped(const _branch& branch) {
    if (!branch.region) {
      finish(run_state::failed);
      return;
    }
    if (branch.region->group.set_stopped(branch.slot)) {
      close_region(branch.region);
    }
  }

  void close_region(const std::shared_ptr<_region>& region) {
    const auto& join = *region->join;
    if (region->group.failed()) {
      finish_record(region->join_record, step_state::skipped);
      logger().info("join '{}' on {} skipped: a branch failed", join.name,
                    region->parent.path.to_string());
      settle_error(region->parent, region->group.error());
      return;
    }
    if (region->group.stopped() || stop_.stop_requested()) {
      finish_record(region->join_record, step_state::skipped);
      settle_stopped(region->parent);
      return;
    }
    run_join(region->parent, join, region->join_record, region->group.take_values());
  }

  void run_join(_branch parent, const step_definition& join, std::size_t record,
                std::vector<branch_view> branches) {
    set_record_state(record, step_state::running);
    logger().info("joining {} branches at '{}' on {}", branches.size(), join.name,
                  parent.path.to_string());

    auto out = attempt(parent, join, parent.path, record, [&] -> step_output {
      if (!join.merge) {
        return {};
      }
      join_input input(info_, join.name, parent.path, branches, options_->metric_policy);
      return join.merge(input);
    });
    if (!out) {
      return;
    }
    parent.view = out->artifacts();
    if (join.is_end()) {
      complete(parent);
      return;
    }
    drive(std::move(parent), &graph_->step(join.successors.front()));
  }

  void fail(const _branch& branch, std::exception_ptr error) {
    logger().error("run {}: {}", info_.run_id, describe(error));
    record_failure(branch.path, error);
    settle_error(branch, std::move(error));
  }

  // Keeps the first failure in time and asks every other branch to stop.
  void record_failure(std::optional<branch_path> path, std::exception_ptr error) {
    {
      std::scoped_lock lock(mutex_);
      if (!first_error_) {
        first_error_ = std::move(error);
        failed_path_ = std::move(path);
      }
    }
    stop_.request_stop();
  }

  void complete(const _branch& branch) {
    {
      std::scoped_lock lock(mutex_);
      final_artifacts_ = branch.view;
    }
    finish(run_state::succeeded);
  }

  void finish(run_state state) {
    {
      std::scoped_lock lock(mutex_);
      state_     = first_error_ ? run_state::failed : state;
      completed_ = true;
      if (state_ == run_state::failed) {
        logger().error("run {} failed: {}", info_.run_id, describe(first_error_));
      } else {
        logger().info("run {} succeeded", info_.run_id);
      }
    }
    cv_.notify_all();
  }

  auto add_record(const std::string& step, const branch_path& path, step_state state)
      -> std::size_t {
    std::scoped_lock lock(records_mutex_);
    auto             now = step_record::clock::now();
    records_.push_back(step_record{.step     = step,
                                   .path     = path,
                                   .state    = state,
                                   .error    = {},
                                   .started  = now,
                                   .finished = now});
    return records_.size() - 1;
  }

  void set_record_state(std::size_t index, step_state state) {
    std::scoped_lock lock(records_mutex_);
    records_[index].state   = state;
    records_[index].started = step_record::clock::now();
  }

  void finish_record(std::size_t index, step_state state, std::string error = {}) {
    std::scoped_lock lock(records_mutex_);
    records_[index].state    = state;
    records_[index].error    = std::move(error);
    records_[index].finished = step_record::clock::now();
  }

  const graph*                    graph_;
  const engine_options*           options_;
  run_info                        info_;
  std::shared_ptr<artifact_store> store_;
  std::stop_source                stop_;

  std::mutex                 mutex_;
  std::condition_variable    cv_;
  bool                       completed_ = false;
  run_state                  state_     = run_state::pending;
  artifact_map               final_artifacts_;
  std::exception_ptr         first_error_;
  std::optional<branch_path> failed_path_;

  std::mutex               records_mutex_;
  std::vector<step_record> records_;
};

}  // namespace _engine_detail

// Executes built graphs. One engine may run any number of graphs, sequentially or from
// several threads; each run gets its own store, context and history.
class engine {
 public:
  engine() = default;

  explicit engine(engine_options options) : options_(std::move(options)) {}

  [[nodiscard]] auto options() const noexcept -> const engine_options& {
    return options_;
  }

  // Blocks until the run settles. Step failures are reported in the result.
  [[nodiscard]] auto run(const graph& g, run_parameters parameters = {},
                         run_options options = {}) const -> run_result {
    run_info info{.run_id     = options.run_id.empty() ? _engine_detail::generate_run_id()
                                                       : std::move(options.run_id),
                  .workflow   = g.name(),
                  .parameters = std::move(parameters),
                  .logger     = options_.logger ? options_.logger : log::get()};

    auto state = std::make_shared<_engine_detail::_run>(g, options_, std::move(info));
    state->start(options.initializers);
    return state->wait();
  }

 private:
  engine_options options_;
};

}  // namespace stepflow
