#include <atomic>
#include <boost/ut.hpp>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <stepflow/execution.hpp>
#include <string>
#include <thread>
#include <vector>

int main() {
  using namespace boost::ut;
  using namespace stepflow::execution;

  "inline_scheduler_same_thread"_test = [] {
    inline_scheduler sch;
    std::thread::id  main_thread = std::this_thread::get_id();
    std::thread::id  work_thread;

    sch.execute([&] -> void { work_thread = std::this_thread::get_id(); });

    expect(work_thread == main_thread);
    expect(inline_scheduler::forward_progress() == forward_progress_guarantee::weakly_parallel);
  };

  "thread_pool_runs_every_task"_test = [] {
    std::atomic<int>        counter{0};
    std::mutex              mutex;
    std::condition_variable cv;
    constexpr int           tasks = 64;

    thread_pool pool(4);
    auto        sch = pool.get_scheduler();
    expect(pool.thread_count() == 4_ul);

    for (int i = 0; i < tasks; ++i) {
      sch.execute([&] -> void {
        if (counter.fetch_add(1) + 1 == tasks) {
          std::scoped_lock lock(mutex);
          cv.notify_one();
        }
      });
    }

    std::unique_lock lock(mutex);
    cv.wait(lock, [&] -> bool { return counter.load() == tasks; });
    expect(counter.load() == tasks);
  };

  "thread_pool_runs_off_the_caller_thread"_test = [] {
    std::thread::id         worker;
    std::mutex              mutex;
    std::condition_variable cv;
    bool                    done = false;
    thread_pool             pool(2);

    pool.get_scheduler().execute([&] -> void {
      std::scoped_lock lock(mutex);
      worker = std::this_thread::get_id();
      done   = true;
      cv.notify_one();
    });

    std::unique_lock lock(mutex);
    cv.wait(lock, [&] -> bool { return done; });
    expect(worker != std::this_thread::get_id());
  };

  "thread_pool_zero_threads_gets_one"_test = [] {
    thread_pool pool(0);
    expect(pool.thread_count() == 1_ul);
  };

  "any_scheduler_defaults_to_inline"_test = [] {
    any_scheduler sch;
    bool          ran = false;
    sch.execute([&] -> void { ran = true; });

    expect(ran);
    expect(sch == any_scheduler{inline_scheduler{}});
    expect(sch.forward_progress() == forward_progress_guarantee::weakly_parallel);
  };

  "any_scheduler_compares_wrapped_schedulers"_test = [] {
    thread_pool first(1);
    thread_pool second(1);

    any_scheduler a = first.get_scheduler();
    any_scheduler b = first.get_scheduler();
    any_scheduler c = second.get_scheduler();

    expect(a == b);
    expect(!(a == c));
    expect(!(a == any_scheduler{}));
    expect(a.forward_progress() == forward_progress_guarantee::parallel);
  };

  "task_group_last_settle_returns_true"_test = [] {
    task_group<int> group(3);

    expect(!group.set_value(2, 30));
    expect(!group.set_value(0, 10));
    expect(!group.settled());
    expect(group.set_value(1, 20));
    expect(group.settled());
    expect(!group.failed());
    expect(!group.stopped());

    auto values = group.take_values();
    expect(values == std::vector<int>{10, 20, 30});
  };

  "task_group_first_error_wins"_test = [] {
    task_group<int> group(3);

    group.set_error(1, std::make_exception_ptr(std::runtime_error("first")));
    group.set_error(0, std::make_exception_ptr(std::runtime_error("second")));
    expect(group.set_value(2, 1));
    expect(group.failed());

    expect(throws<std::runtime_error>([&] { std::rethrow_exception(group.error()); }));
    try {
      std::rethrow_exception(group.error());
    } catch (const std::runtime_error& e) {
      expect(std::string{e.what()} == "first");
    }
  };

  "task_group_stopped_slot"_test = [] {
    task_group<int> group(2);

    expect(!group.set_value(0, 1));
    expect(group.set_stopped(1));
    expect(group.stopped());
    expect(!group.failed());
  };

  "task_group_rejects_double_settle"_test = [] {
    task_group<int> group(2);
    group.set_value(0, 1);

    expect(throws<std::logic_error>([&] { group.set_value(0, 2); }));
    expect(throws<std::out_of_range>([&] { group.set_stopped(5); }));
    expect(throws<std::logic_error>([&] { static_cast<void>(group.error()); }));
  };

  "task_group_concurrent_settle_has_one_winner"_test = [] {
    constexpr std::size_t width = 32;
    task_group<std::size_t> group(width);
    std::atomic<int>        winners{0};

    {
      thread_pool pool(4);
      auto        sch = pool.get_scheduler();
      for (std::size_t i = 0; i < width; ++i) {
        sch.execute([&, i] -> void {
          if (group.set_value(i, i * i)) {
            winners.fetch_add(1);
          }
        });
      }
    }

    expect(winners.load() == 1);
    auto values = group.take_values();
    for (std::size_t i = 0; i < width; ++i) {
      expect(values[i] == i * i);
    }
  };
}
