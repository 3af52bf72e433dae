/** \file constraint_set.cpp
 *  \brief Constraint-set model: paths, operands, builders and rendering.
 */

#include "verdict/constraint_set.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <utility>

namespace verdict {

namespace {
  struct op_entry { op_kind op; std::string_view name; };

  constexpr std::array<op_entry, 10> kBuiltins{{
    {op_kind::eq, "eq"},
    {op_kind::neq, "neq"},
    {op_kind::gt, "gt"},
    {op_kind::lt, "lt"},
    {op_kind::gte, "gte"},
    {op_kind::lte, "lte"},
    {op_kind::in, "in"},
    {op_kind::not_in, "not-in"},
    {op_kind::matches, "matches"},
    {op_kind::not_matches, "not-matches"},
  }};

  auto make(op_kind op, operand v) -> constraint {
    return constraint{std::string(op_name(op)), std::move(v)};
  }

  auto is_nan(const scalar& s) noexcept -> bool {
    const auto* d = std::get_if<double>(&s);
    return d && std::isnan(*d);
  }

  // Variant order, except that NaN is equivalent to NaN and greater than any other double.
  auto scalar_less(const scalar& a, const scalar& b) -> bool {
    const bool na = is_nan(a);
    const bool nb = is_nan(b);
    if (!na && !nb) return a < b;
    if (a.index() != b.index()) return a.index() < b.index();
    return !na && nb;
  }
}

auto path::parse(std::string_view dotted) -> path {
  std::vector<std::string> out;
  std::size_t start = 0;
  while (start <= dotted.size()) {
    auto dot = dotted.find('.', start);
    if (dot == std::string_view::npos) dot = dotted.size();
    if (dot > start) out.emplace_back(dotted.substr(start, dot - start));
    start = dot + 1;
  }
  return path(std::move(out));
}

auto to_string(const path& p) -> std::string {
  std::string out = "[";
  for (std::size_t i = 0; i < p.size(); ++i) {
    if (i) out.push_back(' ');
    out += p.segments()[i];
  }
  out.push_back(']');
  return out;
}

scalar_set::scalar_set(std::initializer_list<scalar> members)
    : scalar_set(std::vector<scalar>(members)) {}

scalar_set::scalar_set(std::vector<scalar> members) : members_(std::move(members)) {
  std::sort(members_.begin(), members_.end(), scalar_less);
  members_.erase(std::unique(members_.begin(), members_.end(),
                             [](const scalar& a, const scalar& b) {
                               return !scalar_less(a, b) && !scalar_less(b, a);
                             }),
                 members_.end());
}

auto scalar_set::contains(const scalar& s) const -> bool {
  return std::binary_search(members_.begin(), members_.end(), s, scalar_less);
}

auto builtin_op(std::string_view name) noexcept -> std::optional<op_kind> {
  for (const auto& e : kBuiltins) {
    if (e.name == name) return e.op;
  }
  return std::nullopt;
}

auto op_name(op_kind op) noexcept -> std::string_view {
  return kBuiltins[static_cast<std::size_t>(op)].name;
}

auto constraint::eq(scalar v) -> constraint { return make(op_kind::eq, std::move(v)); }
auto constraint::neq(scalar v) -> constraint { return make(op_kind::neq, std::move(v)); }
auto constraint::gt(std::int64_t v) -> constraint { return make(op_kind::gt, scalar{v}); }
auto constraint::lt(std::int64_t v) -> constraint { return make(op_kind::lt, scalar{v}); }
auto constraint::gte(std::int64_t v) -> constraint { return make(op_kind::gte, scalar{v}); }
auto constraint::lte(std::int64_t v) -> constraint { return make(op_kind::lte, scalar{v}); }
auto constraint::in(scalar_set v) -> constraint { return make(op_kind::in, std::move(v)); }
auto constraint::not_in(scalar_set v) -> constraint { return make(op_kind::not_in, std::move(v)); }
auto constraint::matches(std::string regex) -> constraint {
  return make(op_kind::matches, pattern{std::move(regex)});
}
auto constraint::not_matches(std::string regex) -> constraint {
  return make(op_kind::not_matches, pattern{std::move(regex)});
}

auto to_string(const constraint& c) -> std::string {
  std::string out = "[" + c.op + " ";
  if (const auto* s = std::get_if<scalar>(&c.value)) {
    out += to_string(*s);
  } else if (const auto* set = std::get_if<scalar_set>(&c.value)) {
    out += "#{";
    for (std::size_t i = 0; i < set->size(); ++i) {
      if (i) out.push_back(' ');
      out += to_string(set->members()[i]);
    }
    out += "}";
  } else {
    out += "#\"" + std::get<pattern>(c.value).source + "\"";
  }
  out.push_back(']');
  return out;
}

auto to_string(quantifier_kind k) noexcept -> std::string_view {
  return k == quantifier_kind::forall ? "forall" : "exists";
}

auto quantifier::forall(path collection, std::vector<element_constraint> body) -> quantifier {
  return quantifier{quantifier_kind::forall, std::move(collection), std::move(body)};
}

auto quantifier::exists(path collection, std::vector<element_constraint> body) -> quantifier {
  return quantifier{quantifier_kind::exists, std::move(collection), std::move(body)};
}

auto constraint_set::add(path p, std::vector<constraint> cs) -> constraint_set& {
  for (auto& e : entries_) {
    if (auto* pc = std::get_if<path_constraints>(&e); pc && pc->where == p) {
      pc->constraints.insert(pc->constraints.end(),
                             std::make_move_iterator(cs.begin()),
                             std::make_move_iterator(cs.end()));
      return *this;
    }
  }
  entries_.emplace_back(path_constraints{std::move(p), std::move(cs)});
  return *this;
}

auto constraint_set::add(quantifier q) -> constraint_set& {
  entries_.emplace_back(std::move(q));
  return *this;
}

auto constraint_set::find(const path& p) const -> const path_constraints* {
  for (const auto& e : entries_) {
    if (const auto* pc = std::get_if<path_constraints>(&e); pc && pc->where == p) return pc;
  }
  return nullptr;
}

} // namespace verdict
