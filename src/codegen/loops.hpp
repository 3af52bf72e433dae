#pragma once

/** \file loops.hpp
 *  \brief Quantifier loop runners shared by fragment dispatch.
 */

#include <optional>

#include "verdict/codegen/fragments.hpp"

namespace verdict::codegen {

auto run_forall(const forall_fragment& f, const value& doc) -> std::optional<residual>;
auto run_exists(const exists_fragment& f, const value& doc) -> std::optional<residual>;

} // namespace verdict::codegen
