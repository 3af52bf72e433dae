/** \file residual.cpp
 *  \brief Residual construction, comparison and rendering.
 */

#include "verdict/residual.hpp"

#include <utility>

namespace verdict {

namespace {
  const path kNoPath{};
}

auto residual::satisfied() noexcept -> const residual& {
  static const residual instance{};
  return instance;
}

auto residual::open(std::shared_ptr<const open_residual> detail) -> residual {
  residual r;
  r.state_ = open_state{std::move(detail)};
  return r;
}

auto residual::conflict(std::shared_ptr<const conflict_site> site, value witness) -> residual {
  residual r;
  r.state_ = conflict_state{std::move(site), std::move(witness)};
  return r;
}

auto residual::where() const noexcept -> const path& {
  if (const auto* o = std::get_if<open_state>(&state_)) return o->detail->at;
  if (const auto* c = std::get_if<conflict_state>(&state_)) return c->site->at;
  return kNoPath;
}

auto residual::open_detail() const noexcept -> const open_residual* {
  const auto* o = std::get_if<open_state>(&state_);
  return o ? o->detail.get() : nullptr;
}

auto residual::conflict_detail() const noexcept -> const conflict_site* {
  const auto* c = std::get_if<conflict_state>(&state_);
  return c ? c->site.get() : nullptr;
}

auto residual::witness() const noexcept -> const value* {
  const auto* c = std::get_if<conflict_state>(&state_);
  return c ? &c->witness : nullptr;
}

auto operator==(const residual& a, const residual& b) -> bool {
  if (a.type() != b.type()) return false;
  switch (a.type()) {
    case residual::kind::satisfied:
      return true;
    case residual::kind::open:
      return *a.open_detail() == *b.open_detail();
    case residual::kind::conflict:
      return *a.conflict_detail() == *b.conflict_detail() && *a.witness() == *b.witness();
  }
  return false;
}

auto to_string(const residual& r) -> std::string {
  if (r.is_satisfied()) return "{}";
  std::string out = "{" + to_string(r.where()) + " [";
  if (const auto* o = r.open_detail()) {
    if (o->quantified) {
      out += "[";
      out += to_string(*o->quantified);
      for (const auto& ec : o->element_constraints) {
        out += " " + to_string(ec.field) + " " + to_string(ec.rule);
      }
      out += "]";
    } else {
      for (std::size_t i = 0; i < o->constraints.size(); ++i) {
        if (i) out.push_back(' ');
        out += to_string(o->constraints[i]);
      }
    }
  } else {
    const auto* site = r.conflict_detail();
    out += "[conflict ";
    if (site->element_field) out += to_string(*site->element_field) + " ";
    out += to_string(site->violated) + " " + to_string(*r.witness()) + "]";
  }
  out += "]}";
  return out;
}

} // namespace verdict
