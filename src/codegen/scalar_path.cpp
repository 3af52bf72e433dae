/** \file scalar_path.cpp
 *  \brief Scalar-path compiler and fragment dispatch.
 */

#include "verdict/codegen/fragments.hpp"

#include <type_traits>

#include "loops.hpp"

namespace verdict::codegen {

auto compile_scalar_path(const path& p, const std::vector<constraint>& constraints,
                         const entry_templates& t) -> std::expected<fragment, core::error> {
  if (t.conflicts.size() != constraints.size()) {
    return std::unexpected(core::error{
      core::error_code::precondition_failed,
      "templates do not match constraints at " + to_string(p),
      "codegen.scalar"
    });
  }
  scalar_fragment f;
  f.segments = p.segments();
  f.open = t.open;
  f.steps.reserve(constraints.size());
  for (std::size_t i = 0; i < constraints.size(); ++i) {
    auto test = compile_check(constraints[i]);
    if (!test) return std::unexpected(test.error());
    f.steps.push_back(check_step{std::move(*test), t.conflicts[i]});
  }
  return f;
}

namespace {

  auto run_scalar(const scalar_fragment& f, const value& doc) -> std::optional<residual> {
    const value* v = doc.at(f.segments);
    if (!v) return residual::open(f.open);
    for (const auto& step : f.steps) {
      if (!passes(step.test, *v)) return step.on_fail(*v);
    }
    return std::nullopt;
  }

} // namespace

auto run(const fragment& f, const value& doc) -> std::optional<residual> {
  return std::visit([&doc](const auto& node) -> std::optional<residual> {
    using T = std::decay_t<decltype(node)>;
    if constexpr (std::is_same_v<T, scalar_fragment>) {
      return run_scalar(node, doc);
    } else if constexpr (std::is_same_v<T, forall_fragment>) {
      return run_forall(node, doc);
    } else {
      static_assert(std::is_same_v<T, exists_fragment>);
      return run_exists(node, doc);
    }
  }, f);
}

} // namespace verdict::codegen
