#pragma once

#include <cstddef>
#include <cstdint>
#include <exception>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/fmt/fmt.h>

#include "../workflow.hpp"
#include "interfaces.hpp"
#include "kfold.hpp"

namespace stepflow::training {

// Run parameters of the training workflow. `tracking_uri` defaults to MLFLOW_TRACKING_URI
// when it is set.
[[nodiscard]] inline auto training_parameters() -> std::vector<parameter_spec> {
  return {
      {"tracking_uri", std::string{"http://127.0.0.1:5000"}, "Location of the tracking server.",
       "MLFLOW_TRACKING_URI"},
      {"training_epochs", std::int64_t{50}, "Number of epochs used to train the model.", ""},
      {"training_batch_size", std::int64_t{32}, "Batch size used to train the model.", ""},
      {"accuracy_threshold", 0.7, "Minimum accuracy required to register the model.", ""},
      {"cross_validation_folds", std::int64_t{5}, "Number of cross-validation folds.", ""},
      {"shuffle_seed", std::int64_t{42}, "Seed of the cross-validation shuffle.", ""},
  };
}

[[nodiscard]] inline auto penguin_signature() -> model_signature {
  return model_signature{
      .input_example  = {{"island", std::string{"Biscoe"}},
                         {"culmen_length_mm", 48.6},
                         {"culmen_depth_mm", 16.0},
                         {"flipper_length_mm", 230.0},
                         {"body_mass_g", 5800.0},
                         {"sex", std::string{"MALE"}}},
      .output_example = {{"prediction", std::string{"Adelie"}}, {"confidence", 0.90}},
      .params         = {{"data_capture", false}},
  };
}

struct training_options {
  std::string                        registered_name = "penguins";
  std::string                        mode            = "development";
  model_signature                    signature       = penguin_signature();
  std::vector<std::string>           requirements    = {"scikit-learn", "pandas", "numpy",
                                                        "keras", "jax[cpu]"};
  std::map<std::string, std::string> backend_environment = {{"KERAS_BACKEND", "jax"}};
  std::size_t                        training_memory_mb  = 4096;
};

namespace _pipeline_detail {

using dataset_ptr     = std::shared_ptr<const tabular_dataset>;
using model_ptr       = std::shared_ptr<const model>;
using transformer_ptr = std::shared_ptr<const transformer>;

inline void require(const collaborators& services) {
  if (!services.loader || !services.transformers || !services.models || !services.tracker
      || !services.registry) {
    throw configuration_error("training workflow needs every collaborator");
  }
}

}  // namespace _pipeline_detail

// Cross-validates the model on k folds while training the final model on the whole
// dataset, then registers the final model if the mean fold accuracy meets the threshold.
//
//   start -> cross_validation -(foreach fold)-> transform_fold -> train_fold -> evaluate_fold
//         |                                                                        |
//         |                                              average_scores <-----------
//         |                                                     |
//         -> transform -> train_model ----------------> register_model -> end
[[nodiscard]] inline auto make_training_graph(const collaborators&    services,
                                              const training_options& options = {}) -> graph {
  using namespace _pipeline_detail;
  require(services);

  step_config training_config{.memory_mb   = options.training_memory_mb,
                              .environment = options.backend_environment};
  step_config backend_config{.environment = options.backend_environment};

  graph_builder builder("training");
  builder
      .split(
          "start",
          [services, options](step_input& in) -> step_output {
            in.logger().info("running flow in {} mode", options.mode);
            dataset_ptr data = services.loader->load_dataset();
            in.logger().info("loaded {} rows", data->row_count());
            return step_output{}.set("mode", options.mode).set("data", data);
          },
          {"cross_validation", "transform"})
      .foreach(
          "cross_validation",
          [](step_input& in) -> step_output {
            const auto& data   = in.get<dataset_ptr>("data");
            const auto  splits = in.parameter<std::int64_t>("cross_validation_folds");
            const auto  seed   = in.parameter<std::int64_t>("shuffle_seed");
            if (splits < 2) {
              throw configuration_error(
                  fmt::format("cross_validation_folds must be at least 2, got {}", splits));
            }
            auto folds = kfold_split(data->row_count(), static_cast<std::size_t>(splits), true,
                                     static_cast<std::uint64_t>(seed));
            return step_output{}.foreach_over(folds);
          },
          "transform_fold")
      .linear(
          "transform_fold",
          [services](step_input& in) -> step_output {
            const auto& current = in.input_as<fold>();
            const auto& data    = in.get<dataset_ptr>("data");
            in.logger().info("transforming fold {}", current.number);

            auto train_data = data->subset(current.train);
            auto test_data  = data->subset(current.test);

            auto features = services.transformers->build_features_transformer();
            auto x_train  = features->fit_transform(train_data);
            auto x_test   = features->transform(test_data);

            auto target  = services.transformers->build_target_transformer();
            auto y_train = target->fit_transform(train_data);
            auto y_test  = target->transform(test_data);

            return step_output{}
                .set("fold", current.number)
                .set("x_train", std::move(x_train))
                .set("x_test", std::move(x_test))
                .set("y_train", std::move(y_train))
                .set("y_test", std::move(y_test));
          },
          "train_fold")
      .linear(
          "train_fold",
          [services](step_input& in) -> step_output {
            const auto number = in.get<std::size_t>("fold");
            in.logger().info("training fold {}", number);

            // Each fold trains under its own nested tracking run.
            auto fold_run_id = services.tracker->start_nested_run(
                in.get<std::string>("tracking_run_id"),
                fmt::format("cross-validation-fold-{}", number));

            const auto& x_train = in.get<matrix>("x_train");
            std::shared_ptr<model> trained = services.models->build_model(x_train.cols());
            auto history = trained->fit(x_train, in.get<matrix>("y_train"),
                                        in.parameter<std::int64_t>("training_epochs"),
                                        in.parameter<std::int64_t>("training_batch_size"));
            in.logger().info("fold {} - train_loss: {:f} - train_accuracy: {:f}", number,
                             history.final_loss(), history.final_accuracy());

            return step_output{}
                .set("tracking_fold_run_id", std::move(fold_run_id))
                .set("model", model_ptr{std::move(trained)});
          },
          "evaluate_fold", training_config)
      .linear(
          "evaluate_fold",
          [services](step_input& in) -> step_output {
            const auto number = in.get<std::size_t>("fold");
            in.logger().info("evaluating fold {}", number);

            auto result = in.get<model_ptr>("model")->evaluate(in.get<matrix>("x_test"),
                                                               in.get<matrix>("y_test"));
            in.logger().info("fold {} - test_loss: {:f} - test_accuracy: {:f}", number,
                             result.loss, result.accuracy);
            services.tracker->log_metrics(
                {{"test_loss", result.loss}, {"test_accuracy", result.accuracy}},
                in.get<std::string>("tracking_fold_run_id"));

            return step_output{}
                .set("test_loss", result.loss)
                .set("test_accuracy", result.accuracy);
          },
          "average_scores", backend_config)
      .join(
          "average_scores",
          [services](join_input& in) -> step_output {
            auto forwarded = in.merge_artifacts({"tracking_run_id"});
            auto accuracy  = in.aggregate("test_accuracy");
            auto loss      = in.aggregate("test_loss");
            in.logger().info("accuracy: {:f} ±{:f}", accuracy.value, accuracy.spread);
            in.logger().info("loss: {:f} ±{:f}", loss.value, loss.spread);

            services.tracker->log_metrics({{"test_accuracy", accuracy.value},
                                           {"test_accuracy_std", accuracy.spread},
                                           {"test_loss", loss.value},
                                           {"test_loss_std", loss.spread}},
                                          forwarded.get<std::string>("tracking_run_id"));

            return step_output{}
                .merge(forwarded)
                .set("test_accuracy", accuracy.value)
                .set("test_accuracy_std", accuracy.spread)
                .set("test_loss", loss.value)
                .set("test_loss_std", loss.spread);
          },
          1, "register_model")
      .linear(
          "transform",
          [services](step_input& in) -> step_output {
            const auto& data = in.get<dataset_ptr>("data");

            std::shared_ptr<transformer> features =
                services.transformers->build_features_transformer();
            auto x = features->fit_transform(*data);

            std::shared_ptr<transformer> target =
                services.transformers->build_target_transformer();
            auto y = target->fit_transform(*data);

            return step_output{}
                .set("features_transformer", transformer_ptr{std::move(features)})
                .set("target_transformer", transformer_ptr{std::move(target)})
                .set("x", std::move(x))
                .set("y", std::move(y));
          },
          "train_model")
      .linear(
          "train_model",
          [services](step_input& in) -> step_output {
            const auto  epochs     = in.parameter<std::int64_t>("training_epochs");
            const auto  batch_size = in.parameter<std::int64_t>("training_batch_size");
            const auto& x          = in.get<matrix>("x");

            std::shared_ptr<model> trained = services.models->build_model(x.cols());
            trained->fit(x, in.get<matrix>("y"), epochs, batch_size);
            services.tracker->log_params(
                {{"epochs", std::to_string(epochs)}, {"batch_size", std::to_string(batch_size)}},
                in.get<std::string>("tracking_run_id"));

            return step_output{}.set("model", model_ptr{std::move(trained)});
          },
          "register_model", training_config)
      .join(
          "register_model",
          [services, options](join_input& in) -> step_output {
            auto merged   = in.merge_artifacts();
            auto accuracy = merged.get<double>("test_accuracy");

            threshold_gate gate("test_accuracy", in.parameter<double>("accuracy_threshold"));
            auto           outcome = gate.run(
                accuracy,
                [&] -> void {
                  in.logger().info("registering model '{}'", options.registered_name);
                  services.registry->log_model(model_package{
                      .trained_model        = merged.get<model_ptr>("model"),
                      .features_transformer = merged.get<transformer_ptr>("features_transformer"),
                      .target_transformer   = merged.get<transformer_ptr>("target_transformer"),
                      .signature            = options.signature,
                      .requirements         = options.requirements,
                      .registered_name      = options.registered_name,
                      .tracking_run_id      = merged.get<std::string>("tracking_run_id"),
                  });
                },
                in.logger());

            return step_output{}.merge(merged).set("registration", outcome);
          },
          2, "end", backend_config)
      .end("end", [](step_input& in) -> step_output {
        in.logger().info("the pipeline finished successfully");
        return {};
      });
  return builder.build();
}

// Opens the tracking run every step logs under and seeds its id as `tracking_run_id`.
[[nodiscard]] inline auto tracking_initializer(std::shared_ptr<experiment_tracker> tracker)
    -> run_initializer {
  return [tracker = std::move(tracker)](const run_info& run) -> artifact_map {
    const auto uri = run.parameters.get<std::string>("tracking_uri");
    run.logger->info("tracking server: {}", uri);

    std::string tracking_run_id;
    try {
      tracker->set_tracking_uri(uri);
      tracking_run_id = tracker->start_run(run.run_id);
    } catch (const std::exception& e) {
      throw std::runtime_error(
          fmt::format("failed to connect to tracking server {}: {}", uri, e.what()));
    }

    artifact_map seeded;
    seeded.set("tracking_run_id", std::move(tracking_run_id));
    return seeded;
  };
}

// Builds and runs the training workflow once.
[[nodiscard]] inline auto run_training(const collaborators& services, const engine& runner,
                                       run_parameters          parameters,
                                       const training_options& options = {},
                                       std::string             run_id  = {}) -> run_result {
  auto workflow = make_training_graph(services, options);
  return runner.run(workflow, std::move(parameters),
                    run_options{.run_id       = std::move(run_id),
                                .initializers = {tracking_initializer(services.tracker)}});
}

}  // namespace stepflow::training
