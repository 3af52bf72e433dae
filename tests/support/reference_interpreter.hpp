#pragma once

#include <memory>
#include <string>

#include <re2/re2.h>

#include "verdict/constraint_set.hpp"
#include "verdict/document.hpp"
#include "verdict/operator_registry.hpp"
#include "verdict/residual.hpp"

namespace reference_interpreter {

// Naive tree-walking evaluator used as the generic-interpreter stand-in:
// re-inspects every constraint per call and builds residual payloads on the fly.
// Understands registered custom operators through the registry.

inline bool holds(const verdict::operator_registry& reg, const verdict::constraint& c, const verdict::value& v) {
  using namespace verdict;
  const bool is_scalar = !v.is_list() && !v.is_object();
  if (c.op == "eq") return is_scalar && v.as_scalar() == std::get<scalar>(c.value);
  if (c.op == "neq") return !(is_scalar && v.as_scalar() == std::get<scalar>(c.value));
  if (c.op == "gt" || c.op == "lt" || c.op == "gte" || c.op == "lte") {
    if (v.type() != value::kind::integer) return false;
    const auto x = std::get<std::int64_t>(v.as_scalar());
    const auto y = std::get<std::int64_t>(std::get<scalar>(c.value));
    if (c.op == "gt") return x > y;
    if (c.op == "lt") return x < y;
    if (c.op == "gte") return x >= y;
    return x <= y;
  }
  if (c.op == "in") return is_scalar && std::get<scalar_set>(c.value).contains(v.as_scalar());
  if (c.op == "not-in") return !(is_scalar && std::get<scalar_set>(c.value).contains(v.as_scalar()));
  if (c.op == "matches" || c.op == "not-matches") {
    if (v.type() != value::kind::string) return false;
    const re2::RE2 rx(std::get<pattern>(c.value).source, re2::RE2::Quiet);
    const bool m = re2::RE2::FullMatch(std::get<std::string>(v.as_scalar()), rx);
    return c.op == "matches" ? m : !m;
  }
  return reg.evaluate_custom(c.op, v, c.value).value_or(false);
}

inline verdict::residual evaluate(const verdict::operator_registry& reg,
                                  const verdict::constraint_set& cs,
                                  const verdict::value& doc) {
  using namespace verdict;
  for (const auto& e : cs.entries()) {
    if (const auto* pc = std::get_if<path_constraints>(&e)) {
      const value* v = doc.at(pc->where.segments());
      if (!v) {
        return residual::open(std::make_shared<const open_residual>(
            open_residual{pc->where, pc->constraints, std::nullopt, {}}));
      }
      for (const auto& c : pc->constraints) {
        if (!holds(reg, c, *v)) {
          return residual::conflict(
              std::make_shared<const conflict_site>(conflict_site{pc->where, c, std::nullopt}), *v);
        }
      }
      continue;
    }
    const auto& q = std::get<quantifier>(e);
    const value* coll = doc.at(q.collection.segments());
    auto open = [&q] {
      return residual::open(std::make_shared<const open_residual>(
          open_residual{q.collection, {}, q.kind, q.body}));
    };
    if (!coll) return open();
    std::vector<value> elems = coll->is_list() ? coll->items() : std::vector<value>{*coll};
    if (q.kind == quantifier_kind::forall) {
      for (const auto& elem : elems) {
        for (const auto& ec : q.body) {
          const value* f = elem.at(ec.field.segments());
          if (!f) return open();
          if (!holds(reg, ec.rule, *f)) {
            return residual::conflict(
                std::make_shared<const conflict_site>(conflict_site{q.collection, ec.rule, ec.field}), *f);
          }
        }
      }
    } else {
      bool found = false;
      for (const auto& elem : elems) {
        bool all = true;
        for (const auto& ec : q.body) {
          const value* f = elem.at(ec.field.segments());
          if (!f || !holds(reg, ec.rule, *f)) { all = false; break; }
        }
        if (all) { found = true; break; }
      }
      if (!found) {
        const auto& first = q.body.front();
        return residual::conflict(
            std::make_shared<const conflict_site>(conflict_site{q.collection, first.rule, first.field}), *coll);
      }
    }
  }
  return residual::satisfied();
}

} // namespace reference_interpreter
