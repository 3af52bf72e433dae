/** \file templates.cpp
 *  \brief Template extractor.
 */

#include "verdict/codegen/templates.hpp"

#include <utility>

namespace verdict::codegen {

namespace {

  auto extract_entry(const path_constraints& pc) -> entry_templates {
    entry_templates t;
    t.at = pc.where;
    t.open = std::make_shared<const open_residual>(open_residual{pc.where, pc.constraints, std::nullopt, {}});
    t.conflicts.reserve(pc.constraints.size());
    for (const auto& c : pc.constraints) {
      t.conflicts.emplace_back(std::make_shared<const conflict_site>(conflict_site{pc.where, c, std::nullopt}));
    }
    return t;
  }

  auto extract_entry(const quantifier& q) -> entry_templates {
    entry_templates t;
    t.at = q.collection;
    t.open = std::make_shared<const open_residual>(open_residual{q.collection, {}, q.kind, q.body});
    t.conflicts.reserve(q.body.size());
    for (const auto& ec : q.body) {
      t.conflicts.emplace_back(std::make_shared<const conflict_site>(conflict_site{q.collection, ec.rule, ec.field}));
    }
    return t;
  }

} // namespace

auto extract(const constraint_set& cs) -> templates {
  templates out;
  out.entries.reserve(cs.size());
  for (const auto& e : cs.entries()) {
    out.entries.push_back(std::visit([](const auto& node){ return extract_entry(node); }, e));
  }
  return out;
}

auto template_info(const templates& t) -> template_summary {
  template_summary s;
  s.path_count = t.entries.size();
  s.paths.reserve(t.entries.size());
  for (const auto& e : t.entries) {
    s.paths.push_back(e.at);
    s.total_constraints += e.conflicts.size();
  }
  return s;
}

} // namespace verdict::codegen
