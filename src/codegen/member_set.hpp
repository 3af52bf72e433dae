#pragma once

/** \file member_set.hpp
 *  \brief Precomputed set literal used by compiled `in` / `not-in` checks.
 *
 * Integers live in a Roaring bitmap (sign bit flipped so negative values
 * order correctly), strings in a hash set, and the rare boolean/real members
 * in a short vector.
 */

#include <cstdint>
#include <string>
#include <unordered_set>
#include <vector>

#include <roaring/roaring64map.hh>

#include "verdict/constraint_set.hpp"
#include "verdict/document.hpp"

namespace verdict::codegen {

class member_set {
public:
  explicit member_set(const scalar_set& literal);

  [[nodiscard]] auto contains(const value& v) const -> bool;
  [[nodiscard]] auto size() const noexcept -> std::size_t { return size_; }

private:
  static constexpr auto key(std::int64_t i) noexcept -> std::uint64_t {
    return static_cast<std::uint64_t>(i) ^ (std::uint64_t{1} << 63);
  }

  roaring::Roaring64Map ints_;
  std::unordered_set<std::string> strings_;
  std::vector<scalar> others_;
  std::size_t size_{0};
};

} // namespace verdict::codegen
