#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <spdlog/fmt/fmt.h>

#include "errors.hpp"
#include "step.hpp"

namespace stepflow {

// Validated, immutable step graph. Only graph_builder::build() creates one.
class graph {
 public:
  [[nodiscard]] auto name() const noexcept -> const std::string& {
    return name_;
  }

  [[nodiscard]] auto start() const noexcept -> const step_definition& {
    return steps_[start_];
  }

  [[nodiscard]] auto end() const noexcept -> const step_definition& {
    return steps_[end_];
  }

  [[nodiscard]] auto contains(std::string_view name) const -> bool {
    return index_.find(name) != index_.end();
  }

  [[nodiscard]] auto step(std::string_view name) const -> const step_definition& {
    auto it = index_.find(name);
    if (it == index_.end()) {
      throw graph_error(fmt::format("graph '{}' has no step '{}'", name_, name));
    }
    return steps_[it->second];
  }

  [[nodiscard]] auto predecessors(std::string_view name) const -> const std::vector<std::string>& {
    return lookup(predecessors_, name, "predecessors");
  }

  [[nodiscard]] auto matching_join(std::string_view split) const -> const std::string& {
    return lookup(join_of_, split, "matching join");
  }

  [[nodiscard]] auto matching_split(std::string_view join) const -> const std::string& {
    return lookup(split_of_, join, "matching split");
  }

  // Kahn order, ties broken by definition order.
  [[nodiscard]] auto topological_order() const noexcept -> const std::vector<std::string>& {
    return order_;
  }

  [[nodiscard]] auto steps() const noexcept -> const std::vector<step_definition>& {
    return steps_;
  }

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return steps_.size();
  }

 private:
  friend class graph_builder;

  graph() = default;

  template <class Map>
  auto lookup(const Map& map, std::string_view key, std::string_view what) const -> const
      typename Map::mapped_type& {
    auto it = map.find(key);
    if (it == map.end()) {
      throw graph_error(fmt::format("graph '{}': no {} for step '{}'", name_, what, key));
    }
    return it->second;
  }

  std::string                                                  name_;
  std::vector<step_definition>                                 steps_;
  std::map<std::string, std::size_t, std::less<>>              index_;
  std::map<std::string, std::vector<std::string>, std::less<>> predecessors_;
  std::map<std::string, std::string, std::less<>>              join_of_;
  std::map<std::string, std::string, std::less<>>              split_of_;
  std::vector<std::string>                                     order_;
  std::size_t                                                  start_ = 0;
  std::size_t                                                  end_   = 0;
};

// Declarative step graph definition. build() validates the structure and raises
// graph_error on the first defect found.
class graph_builder {
 public:
  explicit graph_builder(std::string name = "workflow") : name_(std::move(name)) {}

  auto define_step(step_definition definition) -> graph_builder& {
    if (definition.name.empty()) {
      throw graph_error("step name must not be empty");
    }
    if (index_.contains(definition.name)) {
      throw graph_error(fmt::format("step '{}' is defined twice", definition.name));
    }
    if (definition.kind == step_kind::join && definition.body) {
      throw graph_error(fmt::format("join step '{}' takes a join body", definition.name));
    }
    if (definition.kind != step_kind::join && definition.merge) {
      throw graph_error(fmt::format("step '{}' is not a join but has a join body",
                                    definition.name));
    }
    index_.emplace(definition.name, steps_.size());
    steps_.push_back(std::move(definition));
    return *this;
  }

  auto define_step(std::string name, step_kind kind, step_body body,
                   std::vector<std::string> successors, step_config config = {})
      -> graph_builder& {
    if (kind == step_kind::join) {
      throw graph_error(fmt::format("join step '{}' must be defined with join()", name));
    }
    return define_step(step_definition{.name       = std::move(name),
                                       .kind       = kind,
                                       .body       = std::move(body),
                                       .successors = std::move(successors),
                                       .config     = std::move(config)});
  }

  auto linear(std::string name, step_body body, std::string next, step_config config = {})
      -> graph_builder& {
    return define_step(std::move(name), step_kind::linear, std::move(body), {std::move(next)},
                       std::move(config));
  }

  // Linear step without successor.
  auto end(std::string name, step_body body = {}, step_config config = {}) -> graph_builder& {
    return define_step(std::move(name), step_kind::linear, std::move(body), {},
                       std::move(config));
  }

  auto split(std::string name, step_body body, std::vector<std::string> successors,
             step_config config = {}) -> graph_builder& {
    return define_step(std::move(name), step_kind::split_static, std::move(body),
                       std::move(successors), std::move(config));
  }

  auto foreach(std::string name, step_body body, std::string next, step_config config = {})
      -> graph_builder& {
    return define_step(std::move(name), step_kind::split_foreach, std::move(body),
                       {std::move(next)}, std::move(config));
  }

  // `arity` is the number of incoming edges: 1 for a foreach region, the successor count
  // for a static split. An empty `next` makes the join the end step.
  auto join(std::string name, join_body body, std::size_t arity, std::string next = {},
            step_config config = {}) -> graph_builder& {
    std::vector<std::string> successors;
    if (!next.empty()) {
      successors.push_back(std::move(next));
    }
    return define_step(step_definition{.name       = std::move(name),
                                       .kind       = step_kind::join,
                                       .merge      = std::move(body),
                                       .successors = std::move(successors),
                                       .arity      = arity,
                                       .config     = std::move(config)});
  }

  // Throws graph_error on the first structural defect.
  void validate() const {
    static_cast<void>(build());
  }

  [[nodiscard]] auto build() const -> graph {
    if (steps_.empty()) {
      throw graph_error(fmt::format("graph '{}' has no steps", name_));
    }

    graph g;
    g.name_  = name_;
    g.steps_ = steps_;
    for (const auto& [name, index] : index_) {
      g.index_.emplace(name, index);
      g.predecessors_.try_emplace(name);
    }

    check_edges(g);
    check_acyclic(g);
    check_terminals(g);
    check_in_degrees(g);
    check_regions(g);
    return g;
  }

 private:
  static auto join_names(const std::vector<std::string>& names) -> std::string {
    std::string out;
    for (const auto& name : names) {
      if (!out.empty()) {
        out += ", ";
      }
      out += name;
    }
    return out;
  }

  void check_edges(graph& g) const {
    for (const auto& step : g.steps_) {
      std::set<std::string, std::less<>> seen;
      for (const auto& next : step.successors) {
        if (!index_.contains(next)) {
          throw graph_error(
              fmt::format("step '{}' references undefined step '{}'", step.name, next));
        }
        if (!seen.insert(next).second) {
          throw graph_error(
              fmt::format("step '{}' lists successor '{}' more than once", step.name, next));
        }
        g.predecessors_[next].push_back(step.name);
      }

      const auto count = step.successors.size();
      switch (step.kind) {
        case step_kind::linear:
          if (count > 1) {
            throw graph_error(fmt::format(
                "linear step '{}' has {} successors; declare it as a split", step.name, count));
          }
          break;
        case step_kind::split_static:
          if (count < 2) {
            throw graph_error(
                fmt::format("static split '{}' needs at least two successors", step.name));
          }
          break;
        case step_kind::split_foreach:
          if (count != 1) {
            throw graph_error(
                fmt::format("foreach step '{}' needs exactly one successor", step.name));
          }
          break;
        case step_kind::join:
          if (count > 1) {
            throw graph_error(
                fmt::format("join step '{}' has {} successors", step.name, count));
          }
          if (step.arity == 0) {
            throw graph_error(fmt::format("join step '{}' must declare an arity", step.name));
          }
          break;
      }
    }
  }

  void check_acyclic(graph& g) const {
    const auto               n = g.steps_.size();
    std::vector<std::size_t> indegree(n);
    std::set<std::size_t>    ready;  // definition indices, lowest first
    for (std::size_t i = 0; i < n; ++i) {
      indegree[i] = g.predecessors_.at(g.steps_[i].name).size();
      if (indegree[i] == 0) {
        ready.insert(i);
      }
    }

    while (!ready.empty()) {
      auto current = *ready.begin();
      ready.erase(ready.begin());
      g.order_.push_back(g.steps_[current].name);
      for (const auto& next : g.steps_[current].successors) {
        auto index = g.index_.at(next);
        if (--indegree[index] == 0) {
          ready.insert(index);
        }
      }
    }

    if (g.order_.size() != n) {
      for (std::size_t i = 0; i < n; ++i) {
        if (indegree[i] > 0) {
          throw graph_error(fmt::format("graph '{}' has a cycle through step '{}'", name_,
                                        g.steps_[i].name));
        }
      }
    }
  }

  void check_terminals(graph& g) const {
    std::vector<std::string> starts;
    std::vector<std::string> ends;
    for (const auto& step : g.steps_) {
      if (g.predecessors_.at(step.name).empty()) {
        starts.push_back(step.name);
      }
      if (step.successors.empty()) {
        ends.push_back(step.name);
      }
    }
    if (starts.size() != 1) {
      throw graph_error(fmt::format("graph '{}' must have exactly one start step, found {} ({})",
                                    name_, starts.size(), join_names(starts)));
    }
    if (ends.size() != 1) {
      throw graph_error(fmt::format("graph '{}' must have exactly one end step, found {} ({})",
                                    name_, ends.size(), join_names(ends)));
    }
    g.start_ = g.index_.at(starts.front());
    g.end_   = g.index_.at(ends.front());
  }

  void check_in_degrees(const graph& g) const {
    for (const auto& step : g.steps_) {
      const auto incoming = g.predecessors_.at(step.name).size();
      if (step.kind == step_kind::join) {
        if (incoming != step.arity) {
          throw graph_error(fmt::format("join '{}' declares arity {} but has {} incoming edges",
                                        step.name, step.arity, incoming));
        }
      } else if (incoming > 1) {
        throw graph_error(fmt::format("step '{}' has {} incoming edges but is not a join",
                                      step.name, incoming));
      }
    }
  }

  // Walks the graph in topological order tracking the stack of open splits each step runs
  // under. Every step must see one stack, every join must close the innermost open split,
  // and the end step must run outside any parallel region.
  void check_regions(graph& g) const {
    using region_stack = std::vector<std::string>;
    std::map<std::string, region_stack, std::less<>> stack_at;
    stack_at.emplace(g.start().name, region_stack{});

    for (const auto& name : g.order_) {
      const auto& step = g.steps_[g.index_.at(name)];
      auto        out  = stack_at.at(name);
      if (step.is_split()) {
        out.push_back(step.name);
      }

      for (const auto& next_name : step.successors) {
        const auto& next  = g.steps_[g.index_.at(next_name)];
        auto        stack = out;
        if (next.kind == step_kind::join) {
          if (stack.empty()) {
            throw graph_error(fmt::format("join '{}' has no open split to merge", next.name));
          }
          auto split = stack.back();
          stack.pop_back();

          auto [join_it, new_join] = g.join_of_.try_emplace(split, next.name);
          if (!new_join && join_it->second != next.name) {
            throw graph_error(fmt::format("branches of split '{}' converge at different joins "
                                          "'{}' and '{}'",
                                          split, join_it->second, next.name));
          }
          auto [split_it, new_split] = g.split_of_.try_emplace(next.name, split);
          if (!new_split && split_it->second != split) {
            throw graph_error(fmt::format("join '{}' merges branches of different splits '{}' "
                                          "and '{}'",
                                          next.name, split_it->second, split));
          }
        }

        auto [it, inserted] = stack_at.try_emplace(next.name, stack);
        if (!inserted && it->second != stack) {
          throw graph_error(fmt::format(
              "step '{}' is reachable from overlapping parallel regions", next.name));
        }
      }
    }

    const auto& open_at_end = stack_at.at(g.end().name);
    if (!open_at_end.empty()) {
      throw graph_error(fmt::format("split '{}' is never joined before end step '{}'",
                                    open_at_end.back(), g.end().name));
    }

    for (const auto& step : g.steps_) {
      if (!step.is_split()) {
        continue;
      }
      auto it = g.join_of_.find(step.name);
      if (it == g.join_of_.end()) {
        throw graph_error(fmt::format("split '{}' has no matching join", step.name));
      }
      const auto& join     = g.steps_[g.index_.at(it->second)];
      const auto  expected = step.kind == step_kind::split_foreach ? 1 : step.successors.size();
      if (join.arity != expected) {
        throw graph_error(fmt::format("join '{}' declares arity {} but split '{}' opens {} "
                                      "incoming edges",
                                      join.name, join.arity, step.name, expected));
      }
    }
  }

  std::string                                     name_;
  std::vector<step_definition>                    steps_;
  std::map<std::string, std::size_t, std::less<>> index_;
};

}  // namespace stepflow
