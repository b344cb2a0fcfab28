#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <numeric>
#include <random>
#include <stdexcept>
#include <utility>
#include <vector>

#include <spdlog/fmt/fmt.h>

namespace stepflow::training {

// One cross-validation fold. `number` counts from 0.
struct fold {
  std::size_t              number = 0;
  std::vector<std::size_t> train;
  std::vector<std::size_t> test;

  auto operator==(const fold&) const -> bool = default;
};

// K-fold split of `samples` rows. The first samples % splits folds hold one extra test row;
// test indices are a contiguous run of the (optionally shuffled) row order and the training
// indices are the remaining rows in ascending order.
[[nodiscard]] inline auto kfold_split(std::size_t samples, std::size_t splits, bool shuffle = true,
                                      std::uint64_t seed = 42) -> std::vector<fold> {
  if (splits < 2) {
    throw std::invalid_argument(fmt::format("k-fold needs at least 2 splits, got {}", splits));
  }
  if (splits > samples) {
    throw std::invalid_argument(
        fmt::format("cannot split {} samples into {} folds", samples, splits));
  }

  std::vector<std::size_t> order(samples);
  std::iota(order.begin(), order.end(), std::size_t{0});
  if (shuffle) {
    std::mt19937_64 generator{seed};
    std::ranges::shuffle(order, generator);
  }

  std::vector<fold> folds;
  folds.reserve(splits);
  std::size_t start = 0;
  for (std::size_t k = 0; k < splits; ++k) {
    const auto size = samples / splits + (k < samples % splits ? 1 : 0);

    fold current{.number = k};
    current.test.assign(order.begin() + static_cast<std::ptrdiff_t>(start),
                        order.begin() + static_cast<std::ptrdiff_t>(start + size));

    std::vector<bool> in_test(samples, false);
    for (auto index : current.test) {
      in_test[index] = true;
    }
    current.train.reserve(samples - size);
    for (std::size_t index = 0; index < samples; ++index) {
      if (!in_test[index]) {
        current.train.push_back(index);
      }
    }

    folds.push_back(std::move(current));
    start += size;
  }
  return folds;
}

}  // namespace stepflow::training
