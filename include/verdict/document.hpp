#pragma once

/** \file document.hpp
 *  \brief Nested document values evaluated by compiled policies.
 *
 * A document is a tree of scalars, lists and objects. Objects keep their
 * fields in insertion order. A null field is indistinguishable from an absent
 * one for evaluation purposes.
 *
 * Ownership: value-semantic and self-contained.
 * Thread-safety: immutable after construction; safe for concurrent readers.
 */

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace verdict {

/** \brief Leaf value; alternatives compare strictly by type then value. */
using scalar = std::variant<std::monostate, bool, std::int64_t, double, std::string>;

/** \brief Render a scalar the way residual diagnostics print it ("admin" quoted, 5 bare). */
auto to_string(const scalar& s) -> std::string;

/** \brief A document node: null, boolean, integer, real, string, list or object. */
class value {
public:
  enum class kind : std::uint8_t { null, boolean, integer, real, string, list, object };

  value() = default;
  value(std::nullptr_t) {}
  value(bool b) : kind_(kind::boolean), scalar_(b) {}
  value(int i) : kind_(kind::integer), scalar_(static_cast<std::int64_t>(i)) {}
  value(std::int64_t i) : kind_(kind::integer), scalar_(i) {}
  value(double d) : kind_(kind::real), scalar_(d) {}
  value(const char* s) : kind_(kind::string), scalar_(std::string(s)) {}
  value(std::string s) : kind_(kind::string), scalar_(std::move(s)) {}
  explicit value(scalar s);

  /** \brief Build a list node. */
  static auto list(std::vector<value> items) -> value;

  /** \brief Build an object node; a repeated key keeps the last value. */
  static auto object(std::vector<std::pair<std::string, value>> fields) -> value;

  [[nodiscard]] auto type() const noexcept -> kind { return kind_; }
  [[nodiscard]] auto is_null() const noexcept -> bool { return kind_ == kind::null; }
  [[nodiscard]] auto is_list() const noexcept -> bool { return kind_ == kind::list; }
  [[nodiscard]] auto is_object() const noexcept -> bool { return kind_ == kind::object; }

  /** \brief Scalar payload; std::monostate for null, lists and objects. */
  [[nodiscard]] auto as_scalar() const noexcept -> const scalar& { return scalar_; }

  /** \brief List elements (empty for non-lists). */
  [[nodiscard]] auto items() const noexcept -> const std::vector<value>& { return items_; }

  /** \brief Object field names, parallel to items() (empty for non-objects). */
  [[nodiscard]] auto keys() const noexcept -> const std::vector<std::string>& { return keys_; }

  [[nodiscard]] auto size() const noexcept -> std::size_t { return items_.size(); }

  /** \brief Field lookup. Returns nullptr for non-objects, missing keys and null fields. */
  [[nodiscard]] auto find(std::string_view key) const noexcept -> const value*;

  /** \brief Successive field lookups; nullptr as soon as a segment is absent. */
  [[nodiscard]] auto at(std::span<const std::string> segments) const noexcept -> const value*;

  auto operator==(const value& other) const -> bool = default;

private:
  kind kind_{kind::null};
  scalar scalar_{};
  std::vector<std::string> keys_;
  std::vector<value> items_;
};

/** \brief Compact JSON-like rendering used for witnesses in diagnostics. */
auto to_string(const value& v) -> std::string;

} // namespace verdict
