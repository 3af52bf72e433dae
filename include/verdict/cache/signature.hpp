#pragma once

/** \file signature.hpp
 *  \brief Cache key of a compiled evaluator: hash(constraint set, registry version).
 *
 * FNV-1a 64 over a canonical, length-prefixed encoding of the set, so that
 * structurally equal sets (scalar sets are normalized on construction) share
 * a signature and any registry version bump changes it.
 */

#include <cstdint>

#include "verdict/constraint_set.hpp"

namespace verdict::cache {

auto signature_of(const constraint_set& cs, std::uint64_t registry_version) noexcept -> std::uint64_t;

} // namespace verdict::cache
