#pragma once

#include <concepts>
#include <functional>
#include <type_traits>
#include <utility>

namespace stepflow::execution {

// [exec.queries], forward progress a scheduler offers to the work submitted to it
enum class forward_progress_guarantee { concurrent, parallel, weakly_parallel };

// Unit of work submitted to a scheduler. Tasks must not let exceptions escape.
using task = std::function<void()>;

// [exec.sched], schedulers
struct scheduler_t {};

template <class Sch>
concept scheduler =
    std::copy_constructible<std::remove_cvref_t<Sch>>
    && std::equality_comparable<std::remove_cvref_t<Sch>> && requires {
         typename std::remove_cvref_t<Sch>::scheduler_concept;
         requires std::same_as<typename std::remove_cvref_t<Sch>::scheduler_concept, scheduler_t>;
       } && requires(const std::remove_cvref_t<Sch>& sch, task t) {
         sch.execute(std::move(t));
         { sch.forward_progress() } -> std::same_as<forward_progress_guarantee>;
       };

}  // namespace stepflow::execution
