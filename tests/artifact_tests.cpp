#include <boost/ut.hpp>
#include <cstdint>
#include <memory>
#include <stepflow/workflow.hpp>
#include <string>
#include <thread>
#include <vector>

namespace {

struct opaque_model {
  int layers = 0;
};

}  // namespace

int main() {
  using namespace boost::ut;
  using namespace stepflow;

  "artifact_holds_typed_value"_test = [] {
    auto value = artifact::make(0.8);

    expect(value.has_value());
    expect(value.type() == typeid(double));
    expect(value.get<double>() == 0.8_d);
    expect(value.get_if<int>() == nullptr);
    expect(throws<artifact_type_error>([&] { static_cast<void>(value.get<int>()); }));
  };

  "artifact_stores_string_literals_as_strings"_test = [] {
    auto value = artifact::make("production");
    expect(value.get<std::string>() == "production");
  };

  "artifact_equality_by_value"_test = [] {
    expect(artifact::make(std::string{"run-1"}) == artifact::make(std::string{"run-1"}));
    expect(!(artifact::make(1) == artifact::make(2)));
    expect(!(artifact::make(1) == artifact::make(1.0)));
    expect(!(artifact{} == artifact::make(1)));
    expect(artifact{} == artifact{});
  };

  "artifact_equality_by_identity_for_opaque_types"_test = [] {
    auto first  = artifact::make(opaque_model{3});
    auto second = artifact::make(opaque_model{3});
    auto copy   = first;

    expect(!(first == second));
    expect(first == copy);
    expect(first.same_instance(copy));
    expect(!first.same_instance(second));
  };

  "artifact_map_lookup"_test = [] {
    artifact_map artifacts;
    artifacts.set("test_accuracy", 0.75).set("fold", std::size_t{2});

    expect(artifacts.size() == 2_ul);
    expect(artifacts.contains("fold"));
    expect(artifacts.get<double>("test_accuracy") == 0.75_d);
    expect(artifacts.find("missing") == nullptr);
    expect(throws<missing_artifact_error>([&] { static_cast<void>(artifacts.at("missing")); }));
    expect(throws<artifact_type_error>(
        [&] { static_cast<void>(artifacts.get<std::string>("test_accuracy")); }));
    expect(artifacts.names() == std::vector<std::string>{"fold", "test_accuracy"});
  };

  "artifact_map_overlay_shadows_without_mutating"_test = [] {
    artifact_map inherited;
    inherited.set("model", std::string{"v1"}).set("data", 10);

    artifact_map produced;
    produced.set("model", std::string{"v2"});

    auto view = inherited.overlaid_with(produced);
    expect(view.get<std::string>("model") == "v2");
    expect(view.get<int>("data") == 10_i);
    expect(inherited.get<std::string>("model") == "v1");
  };

  "artifact_map_set_keeps_shared_instance"_test = [] {
    auto         value = artifact::make(opaque_model{1});
    artifact_map artifacts;
    artifacts.set("model", value);

    expect(artifacts.at("model").same_instance(value));
  };

  "branch_path_formatting"_test = [] {
    branch_path root;
    expect(root.to_string() == "/");
    expect(root.empty());

    auto fold = root.push("cross_validation", 3);
    expect(fold.to_string() == "cross_validation[3]");
    expect(fold.back().index == 3_ul);

    auto nested = fold.push("grid", 1);
    expect(nested.to_string() == "cross_validation[3]/grid[1]");
    expect(nested.depth() == 2_ul);
    expect(nested.pop() == fold);
    expect(root < fold);
    expect(throws<std::logic_error>([&] { static_cast<void>(root.pop()); }));
  };

  "artifact_store_scopes_are_write_once"_test = [] {
    artifact_store store("run-1");
    auto           path = branch_path{}.push("cross_validation", 1);

    artifact_map produced;
    produced.set("test_accuracy", 0.9);
    store.publish(path, "evaluate_fold", produced);

    expect(store.size() == 1_ul);
    expect(store.at(path, "evaluate_fold").get<double>("test_accuracy") == 0.9_d);
    expect(!store.find(branch_path{}, "evaluate_fold").has_value());
    expect(throws<artifact_store_error>([&] { store.publish(path, "evaluate_fold", produced); }));
    expect(throws<missing_artifact_error>(
        [&] { static_cast<void>(store.at(branch_path{}, "evaluate_fold")); }));
  };

  "artifact_store_lists_scopes_by_step"_test = [] {
    artifact_store store("run-2");
    for (std::size_t i = 1; i <= 3; ++i) {
      store.publish(branch_path{}.push("cross_validation", i), "train_fold", {});
    }
    store.publish(branch_path{}, "start", {});

    auto scopes = store.scopes_of("train_fold");
    expect(scopes.size() == 3_ul);
    expect(scopes.front().path.to_string() == "cross_validation[1]");
    expect(store.scopes().size() == 4_ul);
  };

  "artifact_store_concurrent_publish"_test = [] {
    artifact_store           store("run-3");
    std::vector<std::thread> writers;
    for (std::size_t i = 1; i <= 8; ++i) {
      writers.emplace_back([&store, i] -> void {
        artifact_map produced;
        produced.set("index", i);
        store.publish(branch_path{}.push("fan", i), "work", std::move(produced));
      });
    }
    for (auto& writer : writers) {
      writer.join();
    }
    expect(store.size() == 8_ul);
  };

  "run_parameters_typed_access"_test = [] {
    run_parameters parameters{{"training_epochs", std::int64_t{50}},
                              {"accuracy_threshold", 0.7},
                              {"tracking_uri", std::string{"http://127.0.0.1:5000"}},
                              {"verbose", true}};

    expect(parameters.get<std::int64_t>("training_epochs") == 50);
    expect(parameters.get<double>("training_epochs") == 50.0_d);
    expect(parameters.get<int>("accuracy_threshold") == 0_i);
    expect(parameters.get<std::string>("tracking_uri") == "http://127.0.0.1:5000");
    expect(parameters.get<bool>("verbose"));
    expect(throws<configuration_error>(
        [&] { static_cast<void>(parameters.get<bool>("training_epochs")); }));
    expect(throws<configuration_error>([&] { static_cast<void>(parameters.at("missing")); }));

    auto changed = parameters.with("training_epochs", std::int64_t{5});
    expect(changed.get<std::int64_t>("training_epochs") == 5);
    expect(parameters.get<std::int64_t>("training_epochs") == 50);
  };
}
