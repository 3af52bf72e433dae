#pragma once

/** \file operator_registry.hpp
 *  \brief Operator registry: built-in table, user extensions and version token.
 *
 * The version token is part of every cache signature. Any change to operator
 * semantics (registering, replacing or removing an extension, or an explicit
 * bump) advances it, so evaluators compiled against older semantics are never
 * returned from a cache again.
 *
 * Thread-safety: all members are safe for concurrent use.
 */

#include <atomic>
#include <cstdint>
#include <expected>
#include <functional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "verdict/constraint_set.hpp"
#include "verdict/document.hpp"
#include "verdict/error.hpp"

namespace verdict {

/** \brief Predicate of a user-defined operator: (document value, operand) -> holds. */
using custom_predicate = std::function<bool(const value&, const operand&)>;

class operator_registry {
public:
  operator_registry() = default;

  operator_registry(const operator_registry&) = delete;
  operator_registry& operator=(const operator_registry&) = delete;

  /** \brief Register or replace a user-defined operator.
   *
   * \return The new registry version.
   * \pre `name` is non-empty and not a built-in; `pred` is callable.
   */
  auto register_operator(std::string name, custom_predicate pred)
      -> std::expected<std::uint64_t, core::error>;

  /** \brief Remove a user-defined operator. \return The new registry version. */
  auto unregister_operator(std::string_view name) -> std::expected<std::uint64_t, core::error>;

  /** \brief Advance the version without changing the operator table. */
  auto bump_version() noexcept -> std::uint64_t;

  [[nodiscard]] auto current_version() const noexcept -> std::uint64_t {
    return version_.load(std::memory_order_acquire);
  }

  [[nodiscard]] static auto is_builtin(std::string_view name) noexcept -> bool;

  /** \brief True for built-ins and registered extensions. */
  [[nodiscard]] auto contains(std::string_view name) const -> bool;

  /** \brief Evaluate a registered extension (generic interpreter support). */
  auto evaluate_custom(std::string_view name, const value& v, const operand& expected) const
      -> std::expected<bool, core::error>;

  /** \brief Names of registered extensions, sorted. */
  [[nodiscard]] auto custom_names() const -> std::vector<std::string>;

private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, custom_predicate> custom_;
  std::atomic<std::uint64_t> version_{1};
};

} // namespace verdict
