#pragma once

#include <concepts>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <vector>

#include <spdlog/fmt/fmt.h>

#include "errors.hpp"

namespace stepflow {

// Immutable, type-erased artifact value. Copies share the stored instance.
//
// Two artifacts compare equal when they hold the same type and, for equality-comparable
// types, equal values. Other types (models, transformers) only compare equal to copies of
// the same stored instance.
class artifact {
 public:
  artifact() = default;

  template <class T>
  [[nodiscard]] static auto make(T&& value) -> artifact {
    using value_type = std::decay_t<T>;
    if constexpr (std::same_as<value_type, const char*> || std::same_as<value_type, char*>) {
      return artifact{std::make_shared<const _holder<std::string>>(std::string{value})};
    } else {
      static_assert(!std::same_as<value_type, artifact>, "artifact::make on an artifact");
      return artifact{std::make_shared<const _holder<value_type>>(std::forward<T>(value))};
    }
  }

  [[nodiscard]] auto has_value() const noexcept -> bool {
    return holder_ != nullptr;
  }

  [[nodiscard]] auto type() const noexcept -> const std::type_info& {
    return holder_ ? holder_->type() : typeid(void);
  }

  template <class T>
  [[nodiscard]] auto get_if() const noexcept -> const T* {
    if (!holder_ || holder_->type() != typeid(T)) {
      return nullptr;
    }
    return &static_cast<const _holder<T>&>(*holder_).value;
  }

  template <class T>
  [[nodiscard]] auto get() const -> const T& {
    if (const T* value = get_if<T>()) {
      return *value;
    }
    throw artifact_type_error(fmt::format("artifact holds '{}', requested '{}'", type().name(),
                                          typeid(T).name()));
  }

  [[nodiscard]] auto same_instance(const artifact& other) const noexcept -> bool {
    return holder_ == other.holder_;
  }

  friend auto operator==(const artifact& lhs, const artifact& rhs) -> bool {
    if (lhs.holder_ == rhs.holder_) {
      return true;
    }
    if (!lhs.holder_ || !rhs.holder_) {
      return false;
    }
    return lhs.holder_->equals(*rhs.holder_);
  }

 private:
  struct _holder_base {
    virtual ~_holder_base() = default;

    [[nodiscard]] virtual auto type() const noexcept -> const std::type_info& = 0;

    [[nodiscard]] virtual auto equals(const _holder_base& other) const -> bool = 0;
  };

  template <class T>
  struct _holder final : _holder_base {
    template <class U>
    explicit _holder(U&& v) : value(std::forward<U>(v)) {}

    [[nodiscard]] auto type() const noexcept -> const std::type_info& override {
      return typeid(T);
    }

    [[nodiscard]] auto equals(const _holder_base& other) const -> bool override {
      if (other.type() != typeid(T)) {
        return false;
      }
      if constexpr (std::equality_comparable<T>) {
        return value == static_cast<const _holder&>(other).value;
      } else {
        return this == &other;
      }
    }

    T value;
  };

  explicit artifact(std::shared_ptr<const _holder_base> holder) : holder_(std::move(holder)) {}

  std::shared_ptr<const _holder_base> holder_;
};

// Named artifacts visible to, or produced by, one step execution.
class artifact_map {
 public:
  using container      = std::map<std::string, artifact, std::less<>>;
  using const_iterator = container::const_iterator;

  artifact_map() = default;

  [[nodiscard]] auto contains(std::string_view name) const -> bool {
    return entries_.find(name) != entries_.end();
  }

  [[nodiscard]] auto find(std::string_view name) const -> const artifact* {
    auto it = entries_.find(name);
    return it == entries_.end() ? nullptr : &it->second;
  }

  [[nodiscard]] auto at(std::string_view name) const -> const artifact& {
    if (const auto* found = find(name)) {
      return *found;
    }
    throw missing_artifact_error(std::string{name});
  }

  template <class T>
  [[nodiscard]] auto get(std::string_view name) const -> const T& {
    const auto& value = at(name);
    if (const T* typed = value.get_if<T>()) {
      return *typed;
    }
    throw artifact_type_error(fmt::format("artifact '{}' holds '{}', requested '{}'", name,
                                          value.type().name(), typeid(T).name()));
  }

  // Stores `value`, wrapping it unless it already is an artifact.
  template <class T>
  auto set(std::string name, T&& value) -> artifact_map& {
    if constexpr (std::same_as<std::remove_cvref_t<T>, artifact>) {
      entries_.insert_or_assign(std::move(name), std::forward<T>(value));
    } else {
      entries_.insert_or_assign(std::move(name), artifact::make(std::forward<T>(value)));
    }
    return *this;
  }

  // New map holding this map's entries shadowed by `overlay`'s.
  [[nodiscard]] auto overlaid_with(const artifact_map& overlay) const -> artifact_map {
    artifact_map merged = *this;
    for (const auto& [name, value] : overlay.entries_) {
      merged.entries_.insert_or_assign(name, value);
    }
    return merged;
  }

  [[nodiscard]] auto names() const -> std::vector<std::string> {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& [name, value] : entries_) {
      out.push_back(name);
    }
    return out;
  }

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return entries_.size();
  }

  [[nodiscard]] auto empty() const noexcept -> bool {
    return entries_.empty();
  }

  [[nodiscard]] auto begin() const noexcept -> const_iterator {
    return entries_.begin();
  }

  [[nodiscard]] auto end() const noexcept -> const_iterator {
    return entries_.end();
  }

  friend auto operator==(const artifact_map&, const artifact_map&) -> bool = default;

 private:
  container entries_;
};

}  // namespace stepflow
