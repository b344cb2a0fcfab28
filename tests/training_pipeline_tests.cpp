#include <algorithm>
#include <boost/ut.hpp>
#include <cmath>
#include <cstddef>
#include <exception>
#include <optional>
#include <set>
#include <stdexcept>
#include <stepflow/config.hpp>
#include <stepflow/training.hpp>
#include <string>
#include <vector>

#include "training_fakes.hpp"

namespace {

using namespace stepflow;
using namespace stepflow::training;

auto parameters(const nlohmann::json& overrides = nlohmann::json::object()) -> run_parameters {
  auto specs = training_parameters();
  return config::resolve_parameters(specs, overrides);
}

}  // namespace

int main() {
  using namespace boost::ut;

  "kfold_sizes_cover_every_row_once"_test = [] {
    auto folds = kfold_split(10, 3);

    expect(folds.size() == 3_ul);
    expect(folds[0].test.size() == 4_ul);
    expect(folds[1].test.size() == 3_ul);
    expect(folds[2].test.size() == 3_ul);

    std::set<std::size_t> tested;
    for (const auto& current : folds) {
      expect(current.train.size() + current.test.size() == 10_ul);
      expect(std::ranges::is_sorted(current.train));
      for (auto index : current.test) {
        expect(std::ranges::find(current.train, index) == current.train.end());
        tested.insert(index);
      }
    }
    expect(tested.size() == 10_ul);
    expect(folds[2].number == 2_ul);
  };

  "kfold_is_deterministic_per_seed"_test = [] {
    expect(kfold_split(30, 5, true, 7) == kfold_split(30, 5, true, 7));
    expect(kfold_split(30, 5, true, 7) != kfold_split(30, 5, true, 8));

    auto ordered = kfold_split(6, 3, false);
    expect(ordered[0].test == std::vector<std::size_t>{0, 1});
    expect(ordered[0].train == std::vector<std::size_t>{2, 3, 4, 5});
  };

  "kfold_rejects_bad_split_counts"_test = [] {
    expect(throws<std::invalid_argument>([] { static_cast<void>(kfold_split(10, 1)); }));
    expect(throws<std::invalid_argument>([] { static_cast<void>(kfold_split(3, 4)); }));
  };

  "graph_has_training_shape"_test = [] {
    auto services = fakes::make_services(0.8);
    auto workflow = make_training_graph(services.wired());

    expect(workflow.name() == "training");
    expect(workflow.size() == 10_ul);
    expect(workflow.matching_join("start") == "register_model");
    expect(workflow.matching_join("cross_validation") == "average_scores");
    expect(workflow.step("train_fold").config.memory_mb == std::optional<std::size_t>{4096});
    expect(workflow.step("evaluate_fold").config.environment.at("KERAS_BACKEND") == "jax");
  };

  "missing_collaborator_rejected"_test = [] {
    auto services = fakes::make_services(0.8).wired();
    services.registry.reset();
    expect(throws<configuration_error>([&] { static_cast<void>(make_training_graph(services)); }));
  };

  "model_registered_when_accuracy_meets_threshold"_test = [] {
    auto services = fakes::make_services(0.8);
    auto result   = run_training(services.wired(), engine{}, parameters());

    expect(result.succeeded()) << result.error_message();
    expect(result.artifacts().get<gate_outcome>("registration") == gate_outcome::fired);
    expect(std::abs(result.artifacts().get<double>("test_accuracy") - 0.8) < 1e-12);
    expect(std::abs(result.artifacts().get<double>("test_accuracy_std")) < 1e-12);
    expect(services.factory->built() == 6_i);

    auto packages = services.models_registry->packages();
    expect(packages.size() == 1_ul);
    expect(packages.front().registered_name == "penguins");
    expect(packages.front().tracking_run_id == "tracking-root");
    expect(packages.front().trained_model != nullptr);
    expect(packages.front().features_transformer != nullptr);
    expect(packages.front().signature == penguin_signature());
    expect(result.executions_of("end").front().state == step_state::succeeded);
  };

  "model_not_registered_below_threshold"_test = [] {
    auto services = fakes::make_services(0.6);
    auto result   = run_training(services.wired(), engine{}, parameters());

    expect(result.succeeded()) << result.error_message();
    expect(result.artifacts().get<gate_outcome>("registration") == gate_outcome::skipped);
    expect(services.models_registry->packages().empty());
  };

  "threshold_is_a_run_parameter"_test = [] {
    auto services = fakes::make_services(0.6);
    auto result =
        run_training(services.wired(), engine{}, parameters({{"accuracy_threshold", 0.5}}));

    expect(result.succeeded());
    expect(services.models_registry->packages().size() == 1_ul);
  };

  "each_fold_trains_under_a_nested_run"_test = [] {
    auto services = fakes::make_services(0.8);
    auto params   = parameters();
    auto result   = run_training(services.wired(), engine{}, params);
    expect(result.succeeded());

    auto nested = services.tracking->nested();
    expect(nested.size() == 5_ul);
    std::set<std::string> names;
    for (const auto& [parent, name] : nested) {
      expect(parent == "tracking-root");
      names.insert(name);
    }
    expect(names.contains("cross-validation-fold-0"));
    expect(names.contains("cross-validation-fold-4"));
    expect(services.tracking->uri() == params.get<std::string>("tracking_uri"));

    std::size_t fold_metrics = 0;
    std::size_t summaries    = 0;
    for (const auto& call : services.tracking->metrics()) {
      if (call.run_id == "tracking-root") {
        ++summaries;
        expect(call.metrics.contains("test_accuracy_std"));
      } else {
        ++fold_metrics;
        expect(call.run_id.starts_with("tracking-cross-validation-fold-"));
      }
    }
    expect(fold_metrics == 5_ul);
    expect(summaries == 1_ul);

    auto logged = services.tracking->params().at("tracking-root");
    expect(logged.at("epochs") == "50");
    expect(logged.at("batch_size") == "32");
  };

  "fold_count_follows_parameter"_test = [] {
    auto services = fakes::make_services(0.8);
    auto result =
        run_training(services.wired(), engine{}, parameters({{"cross_validation_folds", 3}}));

    expect(result.succeeded());
    expect(result.executions_of("train_fold").size() == 3_ul);
    expect(result.store().scopes_of("evaluate_fold").size() == 3_ul);
  };

  "single_fold_fails_the_run"_test = [] {
    auto services = fakes::make_services(0.8);
    auto result =
        run_training(services.wired(), engine{}, parameters({{"cross_validation_folds", 1}}));

    expect(result.state() == run_state::failed);
    expect(result.failed_path()->to_string() == "start[1]");
    expect(result.error_kind() == "configuration_error");
    expect(throws<configuration_error>([&] { std::rethrow_exception(result.root_cause()); }));
    expect(services.models_registry->packages().empty());
  };

  "unreachable_tracker_fails_initialization"_test = [] {
    auto services = fakes::make_services(0.8, 20, false);
    auto result   = run_training(services.wired(), engine{}, parameters());

    expect(result.state() == run_state::failed);
    expect(result.error_kind() == "run_initialization_error");
    expect(result.records().empty());
    expect(result.error_message().find("failed to connect to tracking server")
           != std::string::npos);
  };

  "runs_on_a_configured_thread_pool"_test = [] {
    auto configured = config::build_engine(config::engine_settings{.threads = 4});
    auto services   = fakes::make_services(0.8, 40);
    auto result     = run_training(services.wired(), configured.engine, parameters(), {},
                                   "training-run");

    expect(result.succeeded()) << result.error_message();
    expect(result.run_id() == "training-run");
    expect(result.store().scopes_of("evaluate_fold").size() == 5_ul);
    expect(services.models_registry->packages().size() == 1_ul);
  };
}
