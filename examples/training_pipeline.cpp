#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include <stepflow/config.hpp>
#include <stepflow/training.hpp>

using namespace stepflow;
using namespace stepflow::training;

// Toy collaborators: a synthetic penguin table, a scaling transformer, a nearest-mean model
// and a tracker and registry that print what they receive.

class synthetic_penguins final : public dataset_loader {
 public:
  [[nodiscard]] auto load_dataset() const -> std::shared_ptr<const tabular_dataset> override {
    std::vector<std::vector<cell>> rows;
    for (int i = 0; i < 60; ++i) {
      const bool gentoo = i % 2 == 0;
      rows.push_back({std::string{gentoo ? "Gentoo" : "Adelie"},
                      (gentoo ? 47.5 : 38.8) + static_cast<double>(i % 5) * 0.3,
                      (gentoo ? 5000.0 : 3700.0) + static_cast<double>(i % 7) * 40.0});
    }
    return std::make_shared<const tabular_dataset>(
        std::vector<std::string>{"species", "culmen_length_mm", "body_mass_g"}, std::move(rows));
  }
};

// Scales the numeric columns by their fitted maxima.
class max_scaler final : public transformer {
 public:
  auto fit_transform(const tabular_dataset& data) -> matrix override {
    maxima_.assign(data.column_count(), 1.0);
    for (const auto& row : data.rows()) {
      for (std::size_t c = 1; c < row.size(); ++c) {
        maxima_[c] = std::max(maxima_[c], std::get<double>(row[c]));
      }
    }
    return transform(data);
  }

  [[nodiscard]] auto transform(const tabular_dataset& data) const -> matrix override {
    matrix out(data.row_count(), data.column_count() - 1);
    for (std::size_t r = 0; r < data.row_count(); ++r) {
      for (std::size_t c = 1; c < data.column_count(); ++c) {
        out.at(r, c - 1) = std::get<double>(data.row(r)[c]) / maxima_[c];
      }
    }
    return out;
  }

 private:
  std::vector<double> maxima_;
};

class species_encoder final : public transformer {
 public:
  auto fit_transform(const tabular_dataset& data) -> matrix override {
    return transform(data);
  }

  [[nodiscard]] auto transform(const tabular_dataset& data) const -> matrix override {
    matrix out(data.row_count(), 1);
    for (std::size_t r = 0; r < data.row_count(); ++r) {
      out.at(r, 0) = std::get<std::string>(data.row(r)[0]) == "Gentoo" ? 1.0 : 0.0;
    }
    return out;
  }
};

class toy_transformers final : public transformer_factory {
 public:
  [[nodiscard]] auto build_features_transformer() const -> std::unique_ptr<transformer> override {
    return std::make_unique<max_scaler>();
  }

  [[nodiscard]] auto build_target_transformer() const -> std::unique_ptr<transformer> override {
    return std::make_unique<species_encoder>();
  }
};

// Predicts the class whose mean feature row is closest.
class nearest_mean final : public model {
 public:
  explicit nearest_mean(std::size_t width) : means_(2, std::vector<double>(width, 0.0)) {}

  auto fit(const matrix& x, const matrix& y, std::int64_t epochs, std::int64_t)
      -> training_history override {
    std::vector<double> counts(2, 0.0);
    for (std::size_t r = 0; r < x.rows(); ++r) {
      auto label = static_cast<std::size_t>(y.at(r, 0));
      counts[label] += 1.0;
      for (std::size_t c = 0; c < x.cols(); ++c) {
        means_[label][c] += x.at(r, c);
      }
    }
    for (std::size_t label = 0; label < 2; ++label) {
      for (auto& value : means_[label]) {
        value /= std::max(counts[label], 1.0);
      }
    }
    auto result = evaluate(x, y);
    auto rounds = static_cast<std::size_t>(epochs);
    return training_history{.loss     = std::vector<double>(rounds, result.loss),
                            .accuracy = std::vector<double>(rounds, result.accuracy)};
  }

  [[nodiscard]] auto evaluate(const matrix& x, const matrix& y) const -> evaluation override {
    std::size_t correct = 0;
    for (std::size_t r = 0; r < x.rows(); ++r) {
      auto distance = [&](std::size_t label) -> double {
        double sum = 0.0;
        for (std::size_t c = 0; c < x.cols(); ++c) {
          sum += std::pow(x.at(r, c) - means_[label][c], 2);
        }
        return sum;
      };
      auto predicted = distance(1) < distance(0) ? 1.0 : 0.0;
      correct += predicted == y.at(r, 0) ? 1 : 0;
    }
    auto accuracy =
        x.rows() == 0 ? 0.0 : static_cast<double>(correct) / static_cast<double>(x.rows());
    return evaluation{.loss = 1.0 - accuracy, .accuracy = accuracy};
  }

 private:
  std::vector<std::vector<double>> means_;
};

class toy_models final : public model_factory {
 public:
  [[nodiscard]] auto build_model(std::size_t input_width) const -> std::unique_ptr<model> override {
    return std::make_unique<nearest_mean>(input_width);
  }
};

class printing_tracker final : public experiment_tracker {
 public:
  void set_tracking_uri(const std::string& uri) override {
    std::cout << "tracking uri: " << uri << '\n';
  }

  auto start_run(const std::string& name) -> std::string override {
    return "tracked-" + name;
  }

  auto start_nested_run(const std::string& parent_run_id, const std::string& name)
      -> std::string override {
    return parent_run_id + "/" + name;
  }

  void log_metrics(const std::map<std::string, double>& metrics,
                   const std::string&                   run_id) override {
    for (const auto& [name, value] : metrics) {
      std::cout << run_id << ": " << name << " = " << value << '\n';
    }
  }

  void log_params(const std::map<std::string, std::string>& params,
                  const std::string&                        run_id) override {
    for (const auto& [name, value] : params) {
      std::cout << run_id << ": " << name << " = " << value << '\n';
    }
  }
};

class printing_registry final : public model_registry {
 public:
  void log_model(const model_package& package) override {
    std::cout << "registered '" << package.registered_name << "' from run "
              << package.tracking_run_id << '\n';
  }
};

// Usage: training_pipeline [config.json]
auto main(int argc, char** argv) -> int {
  try {
    auto settings   = argc > 1 ? config::load(argv[1]) : config::stepflow_config{};
    auto specs      = training_parameters();
    auto parameters = config::resolve_parameters(specs, settings.parameters);
    auto configured = config::build_engine(settings.engine);

    collaborators services{.loader       = std::make_shared<synthetic_penguins>(),
                           .transformers = std::make_shared<toy_transformers>(),
                           .models       = std::make_shared<toy_models>(),
                           .tracker      = std::make_shared<printing_tracker>(),
                           .registry     = std::make_shared<printing_registry>()};

    auto result = run_training(services, configured.engine, parameters);
    if (!result.succeeded()) {
      std::cerr << "Training failed: " << result.error_message() << '\n';
      return 1;
    }
    auto outcome = result.artifacts().get<gate_outcome>("registration");
    std::cout << "Registration: " << to_string(outcome) << '\n';
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return 1;
  }
}
