#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <spdlog/fmt/fmt.h>

namespace stepflow::training {

using cell = std::variant<double, std::string>;

// Row-major table of numeric and categorical cells.
class tabular_dataset {
 public:
  tabular_dataset() = default;

  tabular_dataset(std::vector<std::string> columns, std::vector<std::vector<cell>> rows)
      : columns_(std::move(columns)), rows_(std::move(rows)) {
    for (std::size_t i = 0; i < rows_.size(); ++i) {
      if (rows_[i].size() != columns_.size()) {
        throw std::invalid_argument(fmt::format("row {} has {} cells, expected {}", i,
                                                rows_[i].size(), columns_.size()));
      }
    }
  }

  [[nodiscard]] auto columns() const noexcept -> const std::vector<std::string>& {
    return columns_;
  }

  [[nodiscard]] auto column_index(std::string_view name) const -> std::optional<std::size_t> {
    for (std::size_t i = 0; i < columns_.size(); ++i) {
      if (columns_[i] == name) {
        return i;
      }
    }
    return std::nullopt;
  }

  [[nodiscard]] auto row_count() const noexcept -> std::size_t {
    return rows_.size();
  }

  [[nodiscard]] auto column_count() const noexcept -> std::size_t {
    return columns_.size();
  }

  [[nodiscard]] auto row(std::size_t index) const -> const std::vector<cell>& {
    return rows_.at(index);
  }

  [[nodiscard]] auto rows() const noexcept -> const std::vector<std::vector<cell>>& {
    return rows_;
  }

  // Rows at `indices`, in that order.
  [[nodiscard]] auto subset(std::span<const std::size_t> indices) const -> tabular_dataset {
    std::vector<std::vector<cell>> selected;
    selected.reserve(indices.size());
    for (auto index : indices) {
      if (index >= rows_.size()) {
        throw std::out_of_range(
            fmt::format("row index {} out of range ({} rows)", index, rows_.size()));
      }
      selected.push_back(rows_[index]);
    }
    return tabular_dataset{columns_, std::move(selected)};
  }

  auto operator==(const tabular_dataset&) const -> bool = default;

 private:
  std::vector<std::string>       columns_;
  std::vector<std::vector<cell>> rows_;
};

// Dense row-major matrix of transformed features or targets.
class matrix {
 public:
  matrix() = default;

  matrix(std::size_t rows, std::size_t cols) : rows_(rows), cols_(cols), values_(rows * cols) {}

  matrix(std::size_t rows, std::size_t cols, std::vector<double> values)
      : rows_(rows), cols_(cols), values_(std::move(values)) {
    if (values_.size() != rows_ * cols_) {
      throw std::invalid_argument(
          fmt::format("matrix {}x{} needs {} values, got {}", rows_, cols_, rows_ * cols_,
                      values_.size()));
    }
  }

  [[nodiscard]] auto rows() const noexcept -> std::size_t {
    return rows_;
  }

  [[nodiscard]] auto cols() const noexcept -> std::size_t {
    return cols_;
  }

  [[nodiscard]] auto at(std::size_t row, std::size_t col) const -> double {
    return values_.at(row * cols_ + col);
  }

  auto at(std::size_t row, std::size_t col) -> double& {
    return values_.at(row * cols_ + col);
  }

  [[nodiscard]] auto row(std::size_t index) const -> std::span<const double> {
    if (index >= rows_) {
      throw std::out_of_range(fmt::format("matrix row {} out of range", index));
    }
    return std::span<const double>(values_).subspan(index * cols_, cols_);
  }

  [[nodiscard]] auto values() const noexcept -> const std::vector<double>& {
    return values_;
  }

  auto operator==(const matrix&) const -> bool = default;

 private:
  std::size_t         rows_ = 0;
  std::size_t         cols_ = 0;
  std::vector<double> values_;
};

class transformer {
 public:
  virtual ~transformer() = default;

  virtual auto fit_transform(const tabular_dataset& data) -> matrix = 0;

  [[nodiscard]] virtual auto transform(const tabular_dataset& data) const -> matrix = 0;
};

class transformer_factory {
 public:
  virtual ~transformer_factory() = default;

  [[nodiscard]] virtual auto build_features_transformer() const
      -> std::unique_ptr<transformer> = 0;

  [[nodiscard]] virtual auto build_target_transformer() const -> std::unique_ptr<transformer> = 0;
};

// Per-epoch metrics of one fit.
struct training_history {
  std::vector<double> loss;
  std::vector<double> accuracy;

  [[nodiscard]] auto final_loss() const noexcept -> double {
    return loss.empty() ? 0.0 : loss.back();
  }

  [[nodiscard]] auto final_accuracy() const noexcept -> double {
    return accuracy.empty() ? 0.0 : accuracy.back();
  }
};

struct evaluation {
  double loss     = 0.0;
  double accuracy = 0.0;
};

class model {
 public:
  virtual ~model() = default;

  virtual auto fit(const matrix& x, const matrix& y, std::int64_t epochs, std::int64_t batch_size)
      -> training_history = 0;

  [[nodiscard]] virtual auto evaluate(const matrix& x, const matrix& y) const -> evaluation = 0;
};

class model_factory {
 public:
  virtual ~model_factory() = default;

  [[nodiscard]] virtual auto build_model(std::size_t input_width) const
      -> std::unique_ptr<model> = 0;
};

// Experiment tracking service. Run ids are the tracker's own, distinct from workflow run ids.
class experiment_tracker {
 public:
  virtual ~experiment_tracker() = default;

  virtual void set_tracking_uri(const std::string& uri) = 0;

  virtual auto start_run(const std::string& name) -> std::string = 0;

  virtual auto start_nested_run(const std::string& parent_run_id, const std::string& name)
      -> std::string = 0;

  virtual void log_metrics(const std::map<std::string, double>& metrics,
                           const std::string&                   run_id) = 0;

  virtual void log_params(const std::map<std::string, std::string>& params,
                          const std::string&                        run_id) = 0;
};

// Example input and output the registered model serves.
struct model_signature {
  std::map<std::string, cell> input_example;
  std::map<std::string, cell> output_example;
  std::map<std::string, bool> params;

  auto operator==(const model_signature&) const -> bool = default;
};

struct model_package {
  std::shared_ptr<const model>       trained_model;
  std::shared_ptr<const transformer> features_transformer;
  std::shared_ptr<const transformer> target_transformer;
  model_signature                    signature;
  std::vector<std::string>           requirements;
  std::string                        registered_name;
  std::string                        tracking_run_id;
};

class model_registry {
 public:
  virtual ~model_registry() = default;

  virtual void log_model(const model_package& package) = 0;
};

class dataset_loader {
 public:
  virtual ~dataset_loader() = default;

  [[nodiscard]] virtual auto load_dataset() const -> std::shared_ptr<const tabular_dataset> = 0;
};

// External services the training workflow calls from its step bodies.
struct collaborators {
  std::shared_ptr<dataset_loader>      loader;
  std::shared_ptr<transformer_factory> transformers;
  std::shared_ptr<model_factory>       models;
  std::shared_ptr<experiment_tracker>  tracker;
  std::shared_ptr<model_registry>      registry;
};

}  // namespace stepflow::training
