#include <algorithm>
#include <boost/ut.hpp>
#include <cmath>
#include <limits>
#include <memory>
#include <stdexcept>
#include <stepflow/workflow.hpp>
#include <string>
#include <vector>

namespace {

using namespace stepflow;

auto branches_with(const std::string& name, const std::vector<double>& values)
    -> std::vector<branch_view> {
  std::vector<branch_view> branches;
  for (std::size_t i = 0; i < values.size(); ++i) {
    artifact_map artifacts;
    artifacts.set(name, values[i]);
    branches.push_back(
        branch_view{branch_path{}.push("cross_validation", i + 1), i + 1, std::move(artifacts)});
  }
  return branches;
}

}  // namespace

int main() {
  using namespace boost::ut;

  "mean_std_of_identical_values"_test = [] {
    std::vector<double> values(5, 0.8);
    auto                summary = merge_policies::mean_std()(values);

    expect(summary.value == 0.8_d);
    expect(summary.spread == 0.0_d);
    expect(summary.count == 5_ul);
  };

  "mean_std_uses_population_deviation"_test = [] {
    std::vector<double> values{0.6, 0.7, 0.8};
    auto                summary = merge_policies::mean_std()(values);

    expect(std::abs(summary.value - 0.7) < 1e-12);
    expect(std::abs(summary.spread - 0.0816496580927726) < 1e-9);
  };

  "policies_ignore_branch_order"_test = [] {
    std::vector<double> values{0.91, 0.42, 0.77, 0.13, 0.65, 0.58};
    auto                reference = merge_policies::mean_std()(values);
    auto                median    = merge_policies::median()(values);

    std::ranges::sort(values);
    do {
      expect(merge_policies::mean_std()(values) == reference);
      expect(merge_policies::median()(values) == median);
    } while (std::ranges::next_permutation(values).found);
  };

  "empty_input_yields_nan"_test = [] {
    std::vector<double> none;
    for (const auto& policy :
         {merge_policies::mean_std(), merge_policies::median(), merge_policies::maximum()}) {
      auto summary = policy(none);
      expect(std::isnan(summary.value));
      expect(std::isnan(summary.spread));
      expect(summary.count == 0_ul);
    }
  };

  "nan_metrics_are_ordered_deterministically"_test = [] {
    const auto          nan = std::numeric_limits<double>::quiet_NaN();
    std::vector<double> values{0.4, nan, 0.2, nan, 0.9, 0.1, nan, 0.6};

    auto mean     = merge_policies::mean_std()(values);
    auto median   = merge_policies::median()(values);
    auto weighted = merge_policies::weighted_mean(std::vector<double>(8, 1.0))(values);
    expect(std::isnan(mean.value));
    expect(mean.count == 8_ul);
    expect(std::isnan(weighted.value));
    expect(std::abs(median.value - 0.75) < 1e-12);

    std::ranges::reverse(values);
    expect(std::isnan(merge_policies::mean_std()(values).value));
    expect(merge_policies::median()(values).value == median.value);
  };

  "median_of_finite_values_with_one_nan"_test = [] {
    std::vector<double> values{0.3, std::numeric_limits<double>::quiet_NaN(), 0.1};

    // Positive NaN orders after every number, so it is the largest of the three.
    auto summary = merge_policies::median()(values);
    expect(summary.value == 0.3_d);
    expect(summary.count == 3_ul);
  };

  "median_and_maximum"_test = [] {
    std::vector<double> values{0.9, 0.1, 0.5, 0.3};

    auto median = merge_policies::median()(values);
    expect(median.value == 0.4_d);
    expect(median.spread == 0.2_d);

    auto maximum = merge_policies::maximum()(values);
    expect(maximum.value == 0.9_d);
    expect(maximum.spread == 0.8_d);
  };

  "weighted_mean"_test = [] {
    std::vector<double> values{1.0, 3.0};
    auto                summary = merge_policies::weighted_mean({1.0, 3.0})(values);

    expect(summary.value == 2.5_d);
    expect(std::abs(summary.spread - std::sqrt(0.75)) < 1e-12);
    expect(throws<std::invalid_argument>(
        [&] { static_cast<void>(merge_policies::weighted_mean({1.0})(values)); }));
    expect(throws<std::invalid_argument>(
        [&] { static_cast<void>(merge_policies::weighted_mean({0.0, 0.0})(values)); }));
  };

  "numeric_value_accepts_integral_artifacts"_test = [] {
    expect(numeric_value(artifact::make(3)) == 3.0_d);
    expect(numeric_value(artifact::make(std::size_t{4})) == 4.0_d);
    expect(numeric_value(artifact::make(0.5f)) == 0.5_d);
    expect(throws<artifact_type_error>(
        [] { static_cast<void>(numeric_value(artifact::make(std::string{"x"}))); }));
  };

  "collect_values_in_branch_order"_test = [] {
    auto branches = branches_with("test_accuracy", {0.6, 0.7, 0.8});
    expect(collect_values(branches, "test_accuracy") == std::vector<double>{0.6, 0.7, 0.8});
    expect(throws<missing_artifact_error>(
        [&] { static_cast<void>(collect_values(branches, "test_loss")); }));
  };

  "merge_forwards_identical_values"_test = [] {
    auto branches = branches_with("test_accuracy", {0.6, 0.7});
    for (auto& branch : branches) {
      branch.artifacts.set("tracking_run_id", std::string{"abc"});
    }

    auto merged = merge_branch_artifacts(branches, {"tracking_run_id"});
    expect(merged.size() == 1_ul);
    expect(merged.get<std::string>("tracking_run_id") == "abc");
  };

  "merge_conflict_names_the_artifact"_test = [] {
    auto branches = branches_with("test_accuracy", {0.6, 0.7});
    try {
      static_cast<void>(merge_branch_artifacts(branches));
      expect(false) << "expected a merge conflict";
    } catch (const merge_conflict_error& e) {
      expect(e.artifact() == "test_accuracy");
    }
  };

  "merge_exclude_skips_conflicting_names"_test = [] {
    auto branches = branches_with("test_accuracy", {0.6, 0.7});
    branches[1].artifacts.set("model", std::string{"full"});

    auto merged = merge_branch_artifacts(branches, {}, {"test_accuracy"});
    expect(merged.names() == std::vector<std::string>{"model"});
  };

  "merge_shared_instance_is_not_a_conflict"_test = [] {
    struct opaque {
      int id = 0;
    };
    auto shared   = artifact::make(opaque{7});
    auto branches = branches_with("test_accuracy", {0.6, 0.7});
    for (auto& branch : branches) {
      branch.artifacts.set("transformer", shared);
    }
    expect(nothrow([&] { static_cast<void>(merge_branch_artifacts(branches, {"transformer"})); }));

    branches[1].artifacts.set("transformer", artifact::make(opaque{7}));
    expect(throws<merge_conflict_error>(
        [&] { static_cast<void>(merge_branch_artifacts(branches, {"transformer"})); }));
  };

  "merge_missing_included_name"_test = [] {
    auto branches = branches_with("test_accuracy", {0.6});
    expect(throws<missing_artifact_error>(
        [&] { static_cast<void>(merge_branch_artifacts(branches, {"tracking_run_id"})); }));
  };
}
