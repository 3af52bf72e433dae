#pragma once

/** \file eligibility.hpp
 *  \brief Static eligibility analysis of constraint sets for compilation.
 *
 * A set is eligible iff it has at least one path with at least one
 * constraint, every path is non-empty, every operator is a built-in whose
 * operand has the expected shape, and (in baseline mode) no quantifier is
 * present. Ineligible sets belong to the generic interpreter.
 *
 * Analysis is pure: it never mutates the constraint set and has no side effects.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "verdict/constraint_set.hpp"

namespace verdict::analysis {

/** \brief Baseline rejects quantifiers; quantified admits them. */
enum class analysis_mode : std::uint8_t { baseline, quantified };

enum class ineligibility : std::uint8_t {
  no_constraints,         /**< no path carries a constraint */
  empty_path,             /**< a path or relative element path has no segments */
  empty_constraint_list,  /**< a path entry lists no constraints */
  non_builtin_operator,   /**< user-registered or unknown operator */
  quantifier_present,     /**< baseline mode only */
  empty_quantifier_body,  /**< quantifier without element constraints */
  operand_mismatch,       /**< e.g. `gt` with a string, `in` without a set, a NaN literal */
  invalid_pattern,        /**< `matches` operand is not a valid RE2 pattern */
};

auto to_string(ineligibility k) noexcept -> std::string_view;

struct reason {
  ineligibility kind;
  std::string detail;  /**< offending path/operator */
};

struct analysis_result {
  bool eligible{false};
  std::vector<reason> reasons;
  std::size_t path_count{0};
  std::size_t quantifier_count{0};
  std::size_t constraint_count{0};
  std::vector<std::string> custom_operators;  /**< sorted, unique */

  [[nodiscard]] auto has(ineligibility k) const noexcept -> bool;
};

/** \brief True when `op` with operand `v` can be emitted by the code generator. */
auto operand_fits(op_kind op, const operand& v) noexcept -> bool;

/** \brief Analyze a constraint set; see file comment for the eligibility rules. */
auto analyze(const constraint_set& cs, analysis_mode mode = analysis_mode::baseline)
    -> analysis_result;

/** \brief "; "-joined reason list for error messages. */
auto describe(const analysis_result& r) -> std::string;

} // namespace verdict::analysis
