#pragma once

/** \file constraint_set.hpp
 *  \brief Constraint-set model consumed by the analyzer and the compiler.
 *
 * A constraint set is an ordered conjunction of per-path constraint lists and
 * quantifier nodes. Declaration order is preserved and is the evaluation order
 * of compiled evaluators.
 *
 * Ownership: value-semantic and self-contained.
 */

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "verdict/document.hpp"

namespace verdict {

/** \brief Ordered, structurally compared field selector sequence. */
class path {
public:
  path() = default;
  path(std::initializer_list<std::string> segments) : segments_(segments) {}
  explicit path(std::vector<std::string> segments) : segments_(std::move(segments)) {}

  /** \brief Split a dotted selector ("user.role" -> [user, role]). */
  static auto parse(std::string_view dotted) -> path;

  [[nodiscard]] auto segments() const noexcept -> const std::vector<std::string>& { return segments_; }
  [[nodiscard]] auto empty() const noexcept -> bool { return segments_.empty(); }
  [[nodiscard]] auto size() const noexcept -> std::size_t { return segments_.size(); }

  auto operator==(const path&) const -> bool = default;

private:
  std::vector<std::string> segments_;
};

auto to_string(const path& p) -> std::string;

/** \brief Finite scalar set; members are kept sorted and unique. NaN sorts after every other double. */
class scalar_set {
public:
  scalar_set() = default;
  scalar_set(std::initializer_list<scalar> members);
  explicit scalar_set(std::vector<scalar> members);

  [[nodiscard]] auto members() const noexcept -> const std::vector<scalar>& { return members_; }
  [[nodiscard]] auto size() const noexcept -> std::size_t { return members_.size(); }
  [[nodiscard]] auto contains(const scalar& s) const -> bool;

  auto operator==(const scalar_set&) const -> bool = default;

private:
  std::vector<scalar> members_;
};

/** \brief Regular expression operand; matched against the whole string. */
struct pattern {
  std::string source; /**< RE2 syntax */
  auto operator==(const pattern&) const -> bool = default;
};

/** \brief Right-hand side of a constraint. */
using operand = std::variant<scalar, scalar_set, pattern>;

/** \brief Built-in operators understood by the code generator. */
enum class op_kind : std::uint8_t { eq, neq, gt, lt, gte, lte, in, not_in, matches, not_matches };

/** \brief Resolve a built-in operator by name; std::nullopt for extensions. */
auto builtin_op(std::string_view name) noexcept -> std::optional<op_kind>;

/** \brief Canonical operator name ("eq", "not-in", ...). */
auto op_name(op_kind op) noexcept -> std::string_view;

/** \brief A single `{operator, value}` predicate. Immutable once built. */
struct constraint {
  std::string op;  /**< built-in name or registered extension */
  operand value;

  static auto eq(scalar v) -> constraint;
  static auto neq(scalar v) -> constraint;
  static auto gt(std::int64_t v) -> constraint;
  static auto lt(std::int64_t v) -> constraint;
  static auto gte(std::int64_t v) -> constraint;
  static auto lte(std::int64_t v) -> constraint;
  static auto in(scalar_set v) -> constraint;
  static auto not_in(scalar_set v) -> constraint;
  static auto matches(std::string regex) -> constraint;
  static auto not_matches(std::string regex) -> constraint;

  auto operator==(const constraint&) const -> bool = default;
};

/** \brief Residual rendering of a constraint, e.g. `[eq "admin"]`. */
auto to_string(const constraint& c) -> std::string;

/** \brief Constraint applied to a field of each collection element. */
struct element_constraint {
  path field;      /**< relative to the element */
  constraint rule;
  auto operator==(const element_constraint&) const -> bool = default;
};

enum class quantifier_kind : std::uint8_t { forall, exists };

auto to_string(quantifier_kind k) noexcept -> std::string_view;

/** \brief forall / exists over the collection at `collection`. */
struct quantifier {
  quantifier_kind kind{quantifier_kind::forall};
  path collection;
  std::vector<element_constraint> body;

  static auto forall(path collection, std::vector<element_constraint> body) -> quantifier;
  static auto exists(path collection, std::vector<element_constraint> body) -> quantifier;

  auto operator==(const quantifier&) const -> bool = default;
};

/** \brief Constraints declared for one path, conjoined in order. */
struct path_constraints {
  path where;
  std::vector<constraint> constraints;
  auto operator==(const path_constraints&) const -> bool = default;
};

using constraint_entry = std::variant<path_constraints, quantifier>;

/** \brief Ordered conjunction of path constraints and quantifiers. */
class constraint_set {
public:
  constraint_set() = default;

  /** \brief Append constraints for `p`; an existing path keeps its position and grows. */
  auto add(path p, std::vector<constraint> cs) -> constraint_set&;

  /** \brief Append a quantifier node. */
  auto add(quantifier q) -> constraint_set&;

  [[nodiscard]] auto entries() const noexcept -> const std::vector<constraint_entry>& { return entries_; }
  [[nodiscard]] auto size() const noexcept -> std::size_t { return entries_.size(); }
  [[nodiscard]] auto empty() const noexcept -> bool { return entries_.empty(); }

  [[nodiscard]] auto find(const path& p) const -> const path_constraints*;

  auto operator==(const constraint_set&) const -> bool = default;

private:
  std::vector<constraint_entry> entries_;
};

} // namespace verdict
