#pragma once

#include <algorithm>
#include <cmath>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <map>
#include <set>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "artifact.hpp"
#include "branch_path.hpp"
#include "errors.hpp"

namespace stepflow {

// Combined value of one metric across the branches of a region.
struct metric_summary {
  double      value  = std::numeric_limits<double>::quiet_NaN();
  double      spread = std::numeric_limits<double>::quiet_NaN();
  std::size_t count  = 0;

  auto operator==(const metric_summary&) const -> bool = default;
};

// Aggregation over per-branch scalar values, given in branch index order. Policies must not
// depend on that order; an empty input yields a summary with NaN value and spread.
using merge_policy = std::function<metric_summary(std::span<const double>)>;

namespace merge_policies {

namespace _detail {

// IEEE total order; NaN is ordered rather than unordered.
inline auto total_less(double a, double b) noexcept -> bool {
  return std::strong_order(a, b) < 0;
}

inline auto sorted(std::span<const double> values) -> std::vector<double> {
  std::vector<double> out(values.begin(), values.end());
  std::ranges::sort(out, total_less);
  return out;
}

inline auto population_std(const std::vector<double>& sorted_values, double mean) -> double {
  double sum_sq = 0.0;
  for (double v : sorted_values) {
    sum_sq += (v - mean) * (v - mean);
  }
  return std::sqrt(sum_sq / static_cast<double>(sorted_values.size()));
}

}  // namespace _detail

// Arithmetic mean and population standard deviation.
inline auto mean_std() -> merge_policy {
  return [](std::span<const double> values) -> metric_summary {
    if (values.empty()) {
      return {};
    }
    auto   ordered = _detail::sorted(values);
    double sum     = 0.0;
    for (double v : ordered) {
      sum += v;
    }
    double mean = sum / static_cast<double>(ordered.size());
    return metric_summary{mean, _detail::population_std(ordered, mean), ordered.size()};
  };
}

// Median; spread is the median absolute deviation.
inline auto median() -> merge_policy {
  return [](std::span<const double> values) -> metric_summary {
    if (values.empty()) {
      return {};
    }
    auto middle = [](const std::vector<double>& v) -> double {
      auto n = v.size();
      return n % 2 == 1 ? v[n / 2] : (v[n / 2 - 1] + v[n / 2]) / 2.0;
    };
    auto                ordered = _detail::sorted(values);
    double              med     = middle(ordered);
    std::vector<double> deviations;
    deviations.reserve(ordered.size());
    for (double v : ordered) {
      deviations.push_back(std::abs(v - med));
    }
    std::ranges::sort(deviations, _detail::total_less);
    return metric_summary{med, middle(deviations), ordered.size()};
  };
}

// Largest value; spread is the range.
inline auto maximum() -> merge_policy {
  return [](std::span<const double> values) -> metric_summary {
    if (values.empty()) {
      return {};
    }
    auto [lo, hi] = std::ranges::minmax(values);
    return metric_summary{hi, hi - lo, values.size()};
  };
}

// Weighted mean with one weight per branch, in branch index order; spread is the weighted
// population standard deviation.
inline auto weighted_mean(std::vector<double> weights) -> merge_policy {
  return [weights = std::move(weights)](std::span<const double> values) -> metric_summary {
    if (values.size() != weights.size()) {
      throw std::invalid_argument("weighted_mean: one weight per branch value required");
    }
    if (values.empty()) {
      return {};
    }
    std::vector<std::pair<double, double>> pairs;
    pairs.reserve(values.size());
    for (std::size_t i = 0; i < values.size(); ++i) {
      pairs.emplace_back(values[i], weights[i]);
    }
    std::ranges::sort(pairs, [](const auto& a, const auto& b) -> bool {
      if (auto order = std::strong_order(a.first, b.first); order != 0) {
        return order < 0;
      }
      return _detail::total_less(a.second, b.second);
    });

    double total = 0.0;
    double sum   = 0.0;
    for (const auto& [v, w] : pairs) {
      total += w;
      sum += v * w;
    }
    if (total <= 0.0) {
      throw std::invalid_argument("weighted_mean: weights must sum to a positive value");
    }
    double mean   = sum / total;
    double sum_sq = 0.0;
    for (const auto& [v, w] : pairs) {
      sum_sq += w * (v - mean) * (v - mean);
    }
    return metric_summary{mean, std::sqrt(sum_sq / total), values.size()};
  };
}

}  // namespace merge_policies

// Scalar held by a numeric artifact.
[[nodiscard]] inline auto numeric_value(const artifact& value) -> double {
  if (const auto* d = value.get_if<double>()) {
    return *d;
  }
  if (const auto* f = value.get_if<float>()) {
    return static_cast<double>(*f);
  }
  if (const auto* i = value.get_if<int>()) {
    return static_cast<double>(*i);
  }
  if (const auto* l = value.get_if<std::int64_t>()) {
    return static_cast<double>(*l);
  }
  if (const auto* u = value.get_if<std::size_t>()) {
    return static_cast<double>(*u);
  }
  throw artifact_type_error(
      fmt::format("artifact of type '{}' is not numeric", value.type().name()));
}

// Final state of one branch as a join sees it.
struct branch_view {
  branch_path  path;
  std::size_t  index = 0;
  artifact_map artifacts;
};

// Values of `name` from every branch, in branch index order.
[[nodiscard]] inline auto collect_values(std::span<const branch_view> branches,
                                         std::string_view name) -> std::vector<double> {
  std::vector<double> values;
  values.reserve(branches.size());
  for (const auto& branch : branches) {
    const auto* found = branch.artifacts.find(name);
    if (found == nullptr) {
      throw missing_artifact_error(fmt::format("{} (branch {})", name, branch.path.to_string()));
    }
    values.push_back(numeric_value(*found));
  }
  return values;
}

// Forwards artifacts by name from converging branches. With an empty `include` every name
// found in any branch is a candidate. A name whose branches disagree raises
// merge_conflict_error; an included name no branch has raises missing_artifact_error.
[[nodiscard]] inline auto merge_branch_artifacts(std::span<const branch_view>     branches,
                                                 const std::vector<std::string>& include = {},
                                                 const std::vector<std::string>& exclude = {})
    -> artifact_map {
  std::set<std::string, std::less<>> excluded(exclude.begin(), exclude.end());
  std::set<std::string, std::less<>> candidates(include.begin(), include.end());
  if (include.empty()) {
    for (const auto& branch : branches) {
      for (const auto& [name, value] : branch.artifacts) {
        candidates.insert(name);
      }
    }
  }

  artifact_map merged;
  for (const auto& name : candidates) {
    if (excluded.contains(name)) {
      continue;
    }
    const artifact* chosen       = nullptr;
    std::size_t     chosen_index = 0;
    for (const auto& branch : branches) {
      const auto* found = branch.artifacts.find(name);
      if (found == nullptr) {
        continue;
      }
      if (chosen == nullptr) {
        chosen       = found;
        chosen_index = branch.index;
      } else if (!(*chosen == *found)) {
        throw merge_conflict_error(name, chosen_index, branch.index);
      }
    }
    if (chosen == nullptr) {
      if (!include.empty()) {
        throw missing_artifact_error(name);
      }
      continue;
    }
    merged.set(name, *chosen);
  }
  return merged;
}

}  // namespace stepflow
