#pragma once

#include <atomic>
#include <cstddef>
#include <exception>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace stepflow::execution {

// Runtime-sized counterpart of when_all: a barrier over `size` independent tasks whose
// width is only known when the group is created. Each task settles its own slot exactly
// once (value, error or stopped); the call that settles the last slot returns true and the
// caller owns the continuation. Values are kept index-addressed so consumers see them in
// spawn order regardless of completion order. The first error wins.
template <class T, class E = std::exception_ptr>
class task_group {
 public:
  explicit task_group(std::size_t size) : slots_(size), claimed_(size, false), pending_(size) {}

  task_group(const task_group&)                    = delete;
  auto operator=(const task_group&) -> task_group& = delete;

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return slots_.size();
  }

  [[nodiscard]] auto settled() const noexcept -> bool {
    return pending_.load(std::memory_order_acquire) == 0;
  }

  auto set_value(std::size_t index, T value) -> bool {
    {
      std::scoped_lock lock(mutex_);
      claim(index);
      slots_[index].emplace(std::move(value));
    }
    return arrive();
  }

  auto set_error(std::size_t index, E error) -> bool {
    {
      std::scoped_lock lock(mutex_);
      claim(index);
      if (!error_.has_value()) {
        error_.emplace(std::move(error));
      }
    }
    error_occurred_.store(true, std::memory_order_release);
    return arrive();
  }

  auto set_stopped(std::size_t index) -> bool {
    {
      std::scoped_lock lock(mutex_);
      claim(index);
    }
    stopped_occurred_.store(true, std::memory_order_release);
    return arrive();
  }

  [[nodiscard]] auto failed() const noexcept -> bool {
    return error_occurred_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto stopped() const noexcept -> bool {
    return stopped_occurred_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto error() const -> const E& {
    std::scoped_lock lock(mutex_);
    if (!error_.has_value()) {
      throw std::logic_error("task_group: no error recorded");
    }
    return *error_;
  }

  // Only meaningful once settled() and neither failed() nor stopped().
  [[nodiscard]] auto take_values() -> std::vector<T> {
    std::scoped_lock lock(mutex_);
    std::vector<T>   values;
    values.reserve(slots_.size());
    for (auto& slot : slots_) {
      if (!slot.has_value()) {
        throw std::logic_error("task_group: slot without a value");
      }
      values.push_back(std::move(*slot));
      slot.reset();
    }
    return values;
  }

 private:
  void claim(std::size_t index) {
    if (index >= slots_.size()) {
      throw std::out_of_range("task_group: slot index out of range");
    }
    if (claimed_[index]) {
      throw std::logic_error("task_group: slot settled twice");
    }
    claimed_[index] = true;
  }

  auto arrive() noexcept -> bool {
    return pending_.fetch_sub(1, std::memory_order_acq_rel) == 1;
  }

  std::vector<std::optional<T>> slots_;
  std::vector<bool>             claimed_;
  std::optional<E>              error_;
  std::atomic<std::size_t>      pending_;
  std::atomic<bool>             error_occurred_{false};
  std::atomic<bool>             stopped_occurred_{false};
  mutable std::mutex            mutex_;
};

}  // namespace stepflow::execution
