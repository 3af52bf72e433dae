/** \file quantifier.cpp
 *  \brief Quantifier compiler: forall / exists loops over document collections.
 *
 * Loops walk the collection in place. Per element they hold only the cursor
 * and the current element reference; nothing is buffered.
 */

#include "verdict/codegen/fragments.hpp"

#include <span>

#include "loops.hpp"

namespace verdict::codegen {

namespace {

  auto compile_body(const quantifier& q, const entry_templates& t)
      -> std::expected<std::vector<element_step>, core::error> {
    if (t.conflicts.size() != q.body.size()) {
      return std::unexpected(core::error{
        core::error_code::precondition_failed,
        "templates do not match quantifier body at " + to_string(q.collection),
        "codegen.quantifier"
      });
    }
    std::vector<element_step> body;
    body.reserve(q.body.size());
    for (std::size_t i = 0; i < q.body.size(); ++i) {
      auto test = compile_check(q.body[i].rule);
      if (!test) return std::unexpected(test.error());
      body.push_back(element_step{q.body[i].field.segments(), std::move(*test), t.conflicts[i]});
    }
    return body;
  }

  // A non-list collection value is quantified as a single element.
  auto elements_of(const value& coll) -> std::span<const value> {
    if (coll.is_list()) return coll.items();
    return {&coll, 1};
  }

} // namespace

auto compile_quantifier(const quantifier& q, const entry_templates& t)
    -> std::expected<fragment, core::error> {
  if (q.body.empty()) {
    return std::unexpected(core::error{
      core::error_code::unsupported,
      "quantifier over " + to_string(q.collection) + " has no element constraints",
      "codegen.quantifier"
    });
  }
  auto body = compile_body(q, t);
  if (!body) return std::unexpected(body.error());

  if (q.kind == quantifier_kind::forall) {
    return forall_fragment{q.collection.segments(), t.open, std::move(*body)};
  }
  return exists_fragment{q.collection.segments(), t.open, std::move(*body)};
}

auto run_forall(const forall_fragment& f, const value& doc) -> std::optional<residual> {
  const value* coll = doc.at(f.segments);
  if (!coll) return residual::open(f.open);
  for (const auto& elem : elements_of(*coll)) {
    for (const auto& step : f.body) {
      const value* v = elem.at(step.field);
      // Missing element data defeats a universal claim like missing document data.
      if (!v) return residual::open(f.open);
      if (!passes(step.test, *v)) return step.on_fail(*v);
    }
  }
  return std::nullopt;
}

auto run_exists(const exists_fragment& f, const value& doc) -> std::optional<residual> {
  const value* coll = doc.at(f.segments);
  if (!coll) return residual::open(f.open);
  for (const auto& elem : elements_of(*coll)) {
    bool all = true;
    for (const auto& step : f.body) {
      const value* v = elem.at(step.field);
      if (!v || !passes(step.test, *v)) { all = false; break; }
    }
    if (all) return std::nullopt;
  }
  // No element matched: report the first element constraint against the collection.
  return f.body.front().on_fail(*coll);
}

} // namespace verdict::codegen
