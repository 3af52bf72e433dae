#pragma once

/** \file residual.hpp
 *  \brief Three-valued evaluation result: satisfied, open or conflict.
 *
 * Open and conflict residuals point at payloads pre-built by the template
 * extractor; producing them copies a shared pointer (plus the witness for
 * conflicts) and never rebuilds path or constraint data. The satisfied
 * residual owns nothing, so returning it never allocates.
 */

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "verdict/constraint_set.hpp"
#include "verdict/document.hpp"

namespace verdict {

/** \brief Payload of an Open residual, built once per compiled path. */
struct open_residual {
  path at;
  std::vector<constraint> constraints;                  /**< scalar path: restated constraints */
  std::optional<quantifier_kind> quantified;            /**< engaged for quantifier entries */
  std::vector<element_constraint> element_constraints;  /**< quantifier body */

  auto operator==(const open_residual&) const -> bool = default;
};

/** \brief Fixed part of a Conflict residual; only the witness varies. */
struct conflict_site {
  path at;
  constraint violated;
  std::optional<path> element_field;  /**< engaged for quantifier element constraints */

  auto operator==(const conflict_site&) const -> bool = default;
};

class residual {
public:
  enum class kind : std::uint8_t { satisfied, open, conflict };

  /** \brief Default-constructed residuals are satisfied. */
  residual() noexcept = default;

  /** \brief The canonical satisfied residual. */
  static auto satisfied() noexcept -> const residual&;
  static auto open(std::shared_ptr<const open_residual> detail) -> residual;
  static auto conflict(std::shared_ptr<const conflict_site> site, value witness) -> residual;

  [[nodiscard]] auto type() const noexcept -> kind { return static_cast<kind>(state_.index()); }
  [[nodiscard]] auto is_satisfied() const noexcept -> bool { return type() == kind::satisfied; }
  [[nodiscard]] auto is_open() const noexcept -> bool { return type() == kind::open; }
  [[nodiscard]] auto is_conflict() const noexcept -> bool { return type() == kind::conflict; }

  /** \brief Path of an open or conflict residual; empty path when satisfied. */
  [[nodiscard]] auto where() const noexcept -> const path&;

  /** \brief Open payload, or nullptr. */
  [[nodiscard]] auto open_detail() const noexcept -> const open_residual*;

  /** \brief Conflict site, or nullptr. */
  [[nodiscard]] auto conflict_detail() const noexcept -> const conflict_site*;

  /** \brief Offending document value of a conflict, or nullptr. */
  [[nodiscard]] auto witness() const noexcept -> const value*;

  /** \brief Structural equality (payloads compared by content, not identity). */
  friend auto operator==(const residual& a, const residual& b) -> bool;

private:
  struct satisfied_state {};
  struct open_state { std::shared_ptr<const open_residual> detail; };
  struct conflict_state { std::shared_ptr<const conflict_site> site; value witness; };

  std::variant<satisfied_state, open_state, conflict_state> state_;
};

/** \brief Audit-log rendering, e.g. `{[role] [[conflict [eq "admin"] "guest"]]}`. */
auto to_string(const residual& r) -> std::string;

} // namespace verdict
