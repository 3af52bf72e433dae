/** \file eligibility.cpp
 *  \brief Eligibility analyzer.
 */

#include "verdict/eligibility.hpp"

#include <algorithm>
#include <cmath>

#include <re2/re2.h>

namespace verdict::analysis {

namespace {

  auto pattern_compiles(const std::string& source) -> bool {
    const re2::RE2 rx(source, re2::RE2::Quiet);
    return rx.ok();
  }

  // NaN never equals itself, so it can neither match nor be compared for reuse.
  auto is_nan(const scalar& s) noexcept -> bool {
    const auto* d = std::get_if<double>(&s);
    return d && std::isnan(*d);
  }

  struct walker {
    analysis_mode mode;
    analysis_result& out;

    void check_constraint(const constraint& c, const std::string& where) {
      ++out.constraint_count;
      auto op = builtin_op(c.op);
      if (!op) {
        out.custom_operators.push_back(c.op);
        out.reasons.push_back({ineligibility::non_builtin_operator, where + " " + c.op});
        return;
      }
      if (!operand_fits(*op, c.value)) {
        out.reasons.push_back({ineligibility::operand_mismatch, where + " " + to_string(c)});
        return;
      }
      if (const auto* p = std::get_if<pattern>(&c.value); p && !pattern_compiles(p->source)) {
        out.reasons.push_back({ineligibility::invalid_pattern, where + " " + p->source});
      }
    }

    // Returns true when the entry contributes at least one constraint.
    auto visit(const path_constraints& pc) -> bool {
      ++out.path_count;
      const auto where = to_string(pc.where);
      if (pc.where.empty()) out.reasons.push_back({ineligibility::empty_path, where});
      if (pc.constraints.empty()) {
        out.reasons.push_back({ineligibility::empty_constraint_list, where});
        return false;
      }
      for (const auto& c : pc.constraints) check_constraint(c, where);
      return true;
    }

    auto visit(const quantifier& q) -> bool {
      ++out.quantifier_count;
      const auto where = std::string(to_string(q.kind)) + " " + to_string(q.collection);
      if (mode == analysis_mode::baseline) {
        out.reasons.push_back({ineligibility::quantifier_present, where});
        return false;
      }
      if (q.collection.empty()) out.reasons.push_back({ineligibility::empty_path, where});
      if (q.body.empty()) {
        out.reasons.push_back({ineligibility::empty_quantifier_body, where});
        return false;
      }
      for (const auto& ec : q.body) {
        if (ec.field.empty()) out.reasons.push_back({ineligibility::empty_path, where + " " + to_string(ec.field)});
        check_constraint(ec.rule, where + " " + to_string(ec.field));
      }
      return true;
    }
  };

} // namespace

auto to_string(ineligibility k) noexcept -> std::string_view {
  switch (k) {
    case ineligibility::no_constraints: return "no_constraints";
    case ineligibility::empty_path: return "empty_path";
    case ineligibility::empty_constraint_list: return "empty_constraint_list";
    case ineligibility::non_builtin_operator: return "non_builtin_operator";
    case ineligibility::quantifier_present: return "quantifier_present";
    case ineligibility::empty_quantifier_body: return "empty_quantifier_body";
    case ineligibility::operand_mismatch: return "operand_mismatch";
    case ineligibility::invalid_pattern: return "invalid_pattern";
  }
  return "unknown";
}

auto analysis_result::has(ineligibility k) const noexcept -> bool {
  return std::any_of(reasons.begin(), reasons.end(), [k](const reason& r){ return r.kind == k; });
}

auto operand_fits(op_kind op, const operand& v) noexcept -> bool {
  switch (op) {
    case op_kind::eq:
    case op_kind::neq: {
      const auto* s = std::get_if<scalar>(&v);
      return s && !std::holds_alternative<std::monostate>(*s) && !is_nan(*s);
    }
    case op_kind::gt:
    case op_kind::lt:
    case op_kind::gte:
    case op_kind::lte: {
      const auto* s = std::get_if<scalar>(&v);
      return s && std::holds_alternative<std::int64_t>(*s);
    }
    case op_kind::in:
    case op_kind::not_in: {
      const auto* set = std::get_if<scalar_set>(&v);
      return set && std::none_of(set->members().begin(), set->members().end(), is_nan);
    }
    case op_kind::matches:
    case op_kind::not_matches:
      return std::holds_alternative<pattern>(v);
  }
  return false;
}

auto analyze(const constraint_set& cs, analysis_mode mode) -> analysis_result {
  analysis_result out;
  walker w{mode, out};
  bool constrained = false;
  for (const auto& e : cs.entries()) {
    const bool contributes = std::visit([&w](const auto& node){ return w.visit(node); }, e);
    constrained = constrained || contributes;
  }
  if (!constrained) out.reasons.push_back({ineligibility::no_constraints, "{}"});

  std::sort(out.custom_operators.begin(), out.custom_operators.end());
  out.custom_operators.erase(std::unique(out.custom_operators.begin(), out.custom_operators.end()),
                             out.custom_operators.end());
  out.eligible = out.reasons.empty();
  return out;
}

auto describe(const analysis_result& r) -> std::string {
  if (r.eligible) return "eligible";
  std::string out;
  for (std::size_t i = 0; i < r.reasons.size(); ++i) {
    if (i) out += "; ";
    out += to_string(r.reasons[i].kind);
    out += ": ";
    out += r.reasons[i].detail;
  }
  return out;
}

} // namespace verdict::analysis
