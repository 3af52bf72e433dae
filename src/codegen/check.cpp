/** \file check.cpp
 *  \brief Per-constraint check emission and evaluation.
 */

#include "verdict/codegen/fragments.hpp"

#include <type_traits>

#include <re2/re2.h>

#include "member_set.hpp"
#include "verdict/eligibility.hpp"

namespace verdict::codegen {

member_set::member_set(const scalar_set& literal) : size_(literal.size()) {
  for (const auto& m : literal.members()) {
    if (const auto* i = std::get_if<std::int64_t>(&m)) {
      ints_.add(key(*i));
    } else if (const auto* s = std::get_if<std::string>(&m)) {
      strings_.insert(*s);
    } else {
      others_.push_back(m);
    }
  }
}

auto member_set::contains(const value& v) const -> bool {
  const auto& s = v.as_scalar();
  switch (v.type()) {
    case value::kind::integer:
      return ints_.contains(key(std::get<std::int64_t>(s)));
    case value::kind::string:
      return strings_.find(std::get<std::string>(s)) != strings_.end();
    case value::kind::boolean:
    case value::kind::real:
      for (const auto& o : others_) {
        if (o == s) return true;
      }
      return false;
    default:
      return false;
  }
}

auto compile_check(const constraint& c) -> std::expected<check, core::error> {
  auto op = builtin_op(c.op);
  if (!op) {
    return std::unexpected(core::error{
      core::error_code::unsupported,
      "operator '" + c.op + "' is not supported by the code generator",
      "codegen.check"
    });
  }
  if (!analysis::operand_fits(*op, c.value)) {
    return std::unexpected(core::error{
      core::error_code::unsupported,
      "operand of " + to_string(c) + " cannot be emitted",
      "codegen.check"
    });
  }

  switch (*op) {
    case op_kind::eq:
    case op_kind::neq: {
      const auto& rhs = std::get<scalar>(c.value);
      if (const auto* i = std::get_if<std::int64_t>(&rhs)) return int_compare{*op, *i};
      return scalar_compare{rhs, *op == op_kind::neq};
    }
    case op_kind::gt:
    case op_kind::lt:
    case op_kind::gte:
    case op_kind::lte:
      return int_compare{*op, std::get<std::int64_t>(std::get<scalar>(c.value))};
    case op_kind::in:
    case op_kind::not_in:
      return member_test{std::make_shared<const member_set>(std::get<scalar_set>(c.value)),
                         *op == op_kind::not_in};
    case op_kind::matches:
    case op_kind::not_matches: {
      auto rx = std::make_shared<const re2::RE2>(std::get<pattern>(c.value).source, re2::RE2::Quiet);
      if (!rx->ok()) {
        return std::unexpected(core::error{
          core::error_code::invalid_argument,
          "pattern " + to_string(c) + " does not compile: " + rx->error(),
          "codegen.check"
        });
      }
      return pattern_test{std::move(rx), *op == op_kind::not_matches};
    }
  }
  return std::unexpected(core::error{core::error_code::internal, "unreachable operator", "codegen.check"});
}

namespace {

  auto passes_int(const int_compare& t, const value& v) -> bool {
    if (v.type() != value::kind::integer) return t.op == op_kind::neq;
    const auto x = std::get<std::int64_t>(v.as_scalar());
    switch (t.op) {
      case op_kind::eq:  return x == t.rhs;
      case op_kind::neq: return x != t.rhs;
      case op_kind::gt:  return x > t.rhs;
      case op_kind::lt:  return x < t.rhs;
      case op_kind::gte: return x >= t.rhs;
      case op_kind::lte: return x <= t.rhs;
      default: return false;
    }
  }

  auto passes_scalar(const scalar_compare& t, const value& v) -> bool {
    const bool equal = !v.is_list() && !v.is_object() && v.as_scalar() == t.rhs;
    return equal != t.negate;
  }

  auto passes_member(const member_test& t, const value& v) -> bool {
    return t.members->contains(v) != t.negate;
  }

  auto passes_pattern(const pattern_test& t, const value& v) -> bool {
    if (v.type() != value::kind::string) return false;
    return re2::RE2::FullMatch(std::get<std::string>(v.as_scalar()), *t.rx) != t.negate;
  }

} // namespace

auto passes(const check& c, const value& v) -> bool {
  return std::visit([&v](const auto& t) -> bool {
    using T = std::decay_t<decltype(t)>;
    if constexpr (std::is_same_v<T, int_compare>) {
      return passes_int(t, v);
    } else if constexpr (std::is_same_v<T, scalar_compare>) {
      return passes_scalar(t, v);
    } else if constexpr (std::is_same_v<T, member_test>) {
      return passes_member(t, v);
    } else {
      static_assert(std::is_same_v<T, pattern_test>);
      return passes_pattern(t, v);
    }
  }, c);
}

} // namespace verdict::codegen
