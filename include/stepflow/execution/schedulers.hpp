#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include "scheduler.hpp"

namespace stepflow::execution {

// [exec.sched.inline], runs every task to completion on the submitting thread
class inline_scheduler {
 public:
  using scheduler_concept = scheduler_t;

  inline_scheduler() = default;

  static void execute(task t) {
    t();
  }

  [[nodiscard]] static auto forward_progress() noexcept -> forward_progress_guarantee {
    return forward_progress_guarantee::weakly_parallel;
  }

  auto operator==(const inline_scheduler&) const noexcept -> bool = default;
};

// [exec.sched.thread_pool], fixed set of workers draining a shared FIFO queue
class thread_pool {
 public:
  explicit thread_pool(std::size_t num_threads = std::thread::hardware_concurrency()) {
    if (num_threads == 0) {
      num_threads = 1;
    }
    workers_.reserve(num_threads);
    for (std::size_t i = 0; i < num_threads; ++i) {
      workers_.emplace_back([this] -> void { worker_thread(); });
    }
  }

  ~thread_pool() {
    {
      std::scoped_lock lock(mutex_);
      stop_ = true;
    }
    cv_.notify_all();

    for (auto& worker : workers_) {
      if (worker.joinable()) {
        worker.join();
      }
    }
  }

  thread_pool(const thread_pool&)                    = delete;
  auto operator=(const thread_pool&) -> thread_pool& = delete;

  class thread_pool_scheduler {
   public:
    using scheduler_concept = scheduler_t;

    explicit thread_pool_scheduler(thread_pool* pool) noexcept : pool_(pool) {}

    void execute(task t) const {
      pool_->submit(std::move(t));
    }

    [[nodiscard]] static auto forward_progress() noexcept -> forward_progress_guarantee {
      return forward_progress_guarantee::parallel;
    }

    auto operator==(const thread_pool_scheduler& other) const noexcept -> bool {
      return pool_ == other.pool_;
    }

   private:
    thread_pool* pool_;
  };

  auto get_scheduler() noexcept -> thread_pool_scheduler {
    return thread_pool_scheduler{this};
  }

  [[nodiscard]] auto thread_count() const noexcept -> std::size_t {
    return workers_.size();
  }

 private:
  friend class thread_pool_scheduler;

  void submit(task t) {
    {
      std::scoped_lock lock(mutex_);
      if (stop_) {
        throw std::runtime_error("thread_pool: submit after shutdown");
      }
      queue_.push(std::move(t));
    }
    cv_.notify_one();
  }

  void worker_thread() {
    while (true) {
      task t;

      {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this] -> bool { return stop_ || !queue_.empty(); });

        // Drain what is already queued before exiting so no accepted task is lost.
        if (stop_ && queue_.empty()) {
          return;
        }

        t = std::move(queue_.front());
        queue_.pop();
      }

      t();
    }
  }

  std::vector<std::thread> workers_;
  std::queue<task>         queue_;
  std::condition_variable  cv_;
  std::mutex               mutex_;
  bool                     stop_{false};
};

// Type-erased scheduler handle. Default-constructed handles run inline.
class any_scheduler {
 public:
  using scheduler_concept = scheduler_t;

  any_scheduler() : any_scheduler(inline_scheduler{}) {}

  template <class Sch>
    requires(!std::same_as<std::remove_cvref_t<Sch>, any_scheduler>) && scheduler<Sch>
  any_scheduler(Sch&& sch)  // NOLINT(google-explicit-constructor)
      : impl_(std::make_shared<_model<std::remove_cvref_t<Sch>>>(std::forward<Sch>(sch))) {}

  void execute(task t) const {
    impl_->execute(std::move(t));
  }

  [[nodiscard]] auto forward_progress() const noexcept -> forward_progress_guarantee {
    return impl_->forward_progress();
  }

  auto operator==(const any_scheduler& other) const noexcept -> bool {
    return impl_ == other.impl_ || impl_->equals(*other.impl_);
  }

 private:
  struct _concept {
    virtual ~_concept() = default;

    virtual void execute(task t) const = 0;

    [[nodiscard]] virtual auto forward_progress() const noexcept -> forward_progress_guarantee = 0;

    [[nodiscard]] virtual auto equals(const _concept& other) const noexcept -> bool = 0;
  };

  template <class Sch>
  struct _model final : _concept {
    explicit _model(Sch sch) : sch_(std::move(sch)) {}

    void execute(task t) const override {
      sch_.execute(std::move(t));
    }

    [[nodiscard]] auto forward_progress() const noexcept -> forward_progress_guarantee override {
      return sch_.forward_progress();
    }

    [[nodiscard]] auto equals(const _concept& other) const noexcept -> bool override {
      const auto* same = dynamic_cast<const _model*>(&other);
      return same != nullptr && same->sch_ == sch_;
    }

    Sch sch_;
  };

  std::shared_ptr<const _concept> impl_;
};

}  // namespace stepflow::execution
