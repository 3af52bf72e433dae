#pragma once

/** \file fragments.hpp
 *  \brief Compiled program fragments: one tagged variant per entry kind.
 *
 * A compiled evaluator is a sequence of fragments built once from a
 * constraint set. Each fragment holds the pre-split path, the shared open
 * template and one compiled check per constraint, so evaluation walks flat
 * data and never re-inspects operator names or operand shapes.
 *
 * Checks are tagged by what they emit:
 * - int_compare: direct int64 comparison (gt/lt/gte/lte, integer eq/neq);
 * - scalar_compare: strictly typed equality for other scalars;
 * - member_test: membership in a precomputed set literal;
 * - pattern_test: precompiled full-string RE2 match; linear in the input.
 *
 * Thread-safety: fragments are immutable after compilation; run() is safe
 * for concurrent callers.
 */

#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "verdict/codegen/templates.hpp"
#include "verdict/constraint_set.hpp"
#include "verdict/document.hpp"
#include "verdict/error.hpp"
#include "verdict/residual.hpp"

namespace re2 { class RE2; }

namespace verdict::codegen {

class member_set;  // src/codegen/member_set.hpp

struct int_compare {
  op_kind op;         /**< eq, neq, gt, lt, gte, lte */
  std::int64_t rhs;
};

struct scalar_compare {
  scalar rhs;
  bool negate{false};  /**< neq */
};

struct member_test {
  std::shared_ptr<const member_set> members;
  bool negate{false};  /**< not-in */
};

struct pattern_test {
  std::shared_ptr<const re2::RE2> rx;
  bool negate{false};  /**< not-matches */
};

using check = std::variant<int_compare, scalar_compare, member_test, pattern_test>;

/** \brief A compiled constraint and the conflict returned when it fails. */
struct check_step {
  check test;
  conflict_template on_fail;
};

/** \brief A compiled element constraint inside a quantifier loop. */
struct element_step {
  std::vector<std::string> field;  /**< relative to the element */
  check test;
  conflict_template on_fail;
};

struct scalar_fragment {
  std::vector<std::string> segments;
  std::shared_ptr<const open_residual> open;
  std::vector<check_step> steps;
};

struct forall_fragment {
  std::vector<std::string> segments;
  std::shared_ptr<const open_residual> open;
  std::vector<element_step> body;
};

struct exists_fragment {
  std::vector<std::string> segments;
  std::shared_ptr<const open_residual> open;
  std::vector<element_step> body;
};

using fragment = std::variant<scalar_fragment, forall_fragment, exists_fragment>;

/** \brief Compile one constraint into a check.
 *
 * \return `unsupported` for operators or operand shapes the generator cannot
 *         emit, `invalid_argument` for patterns that fail to compile.
 */
auto compile_check(const constraint& c) -> std::expected<check, core::error>;

/** \brief Evaluate a compiled check against a resolved (non-null) value.
 *
 * Type mismatches fail the check, except that `neq` and `not-in` hold for a
 * value of another type.
 */
[[nodiscard]] auto passes(const check& c, const value& v) -> bool;

/** \brief Scalar-path compiler: navigate, then test each constraint in order. */
auto compile_scalar_path(const path& p, const std::vector<constraint>& constraints,
                         const entry_templates& t) -> std::expected<fragment, core::error>;

/** \brief Quantifier compiler: a forall or exists loop over the collection. */
auto compile_quantifier(const quantifier& q, const entry_templates& t)
    -> std::expected<fragment, core::error>;

/** \brief Run one fragment. std::nullopt means the entry holds; continue. */
[[nodiscard]] auto run(const fragment& f, const value& doc) -> std::optional<residual>;

} // namespace verdict::codegen
