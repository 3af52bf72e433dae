/** \file operator_registry.cpp
 *  \brief Operator registry implementation.
 */

#include "verdict/operator_registry.hpp"

#include <algorithm>
#include <mutex>
#include <utility>

namespace verdict {

auto operator_registry::register_operator(std::string name, custom_predicate pred)
    -> std::expected<std::uint64_t, core::error> {
  if (name.empty()) {
    return std::unexpected(core::error{
      core::error_code::invalid_argument,
      "operator name must be non-empty",
      "registry.register"
    });
  }
  if (is_builtin(name)) {
    return std::unexpected(core::error{
      core::error_code::invalid_argument,
      "operator '" + name + "' shadows a built-in",
      "registry.register"
    });
  }
  if (!pred) {
    return std::unexpected(core::error{
      core::error_code::invalid_argument,
      "operator '" + name + "' has no predicate",
      "registry.register"
    });
  }
  std::unique_lock lock(mutex_);
  custom_.insert_or_assign(std::move(name), std::move(pred));
  return version_.fetch_add(1, std::memory_order_acq_rel) + 1;
}

auto operator_registry::unregister_operator(std::string_view name)
    -> std::expected<std::uint64_t, core::error> {
  std::unique_lock lock(mutex_);
  auto it = custom_.find(std::string(name));
  if (it == custom_.end()) {
    return std::unexpected(core::error{
      core::error_code::not_found,
      "operator '" + std::string(name) + "' is not registered",
      "registry.unregister"
    });
  }
  custom_.erase(it);
  return version_.fetch_add(1, std::memory_order_acq_rel) + 1;
}

auto operator_registry::bump_version() noexcept -> std::uint64_t {
  return version_.fetch_add(1, std::memory_order_acq_rel) + 1;
}

auto operator_registry::is_builtin(std::string_view name) noexcept -> bool {
  return builtin_op(name).has_value();
}

auto operator_registry::contains(std::string_view name) const -> bool {
  if (is_builtin(name)) return true;
  std::shared_lock lock(mutex_);
  return custom_.find(std::string(name)) != custom_.end();
}

auto operator_registry::evaluate_custom(std::string_view name, const value& v,
                                        const operand& expected) const
    -> std::expected<bool, core::error> {
  custom_predicate pred;
  {
    std::shared_lock lock(mutex_);
    auto it = custom_.find(std::string(name));
    if (it == custom_.end()) {
      return std::unexpected(core::error{
        core::error_code::not_found,
        "operator '" + std::string(name) + "' is not registered",
        "registry.evaluate"
      });
    }
    pred = it->second;
  }
  return pred(v, expected);
}

auto operator_registry::custom_names() const -> std::vector<std::string> {
  std::vector<std::string> names;
  {
    std::shared_lock lock(mutex_);
    names.reserve(custom_.size());
    for (const auto& [k, _] : custom_) names.push_back(k);
  }
  std::sort(names.begin(), names.end());
  return names;
}

} // namespace verdict
