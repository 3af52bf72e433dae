/** \file signature.cpp
 *  \brief Structural FNV-1a signature of constraint sets.
 */

#include "verdict/cache/signature.hpp"

#include <bit>
#include <string_view>
#include <type_traits>
#include <variant>

namespace verdict::cache {

namespace {

  constexpr std::uint64_t FNV_OFFSET = 1469598103934665603ull;
  constexpr std::uint64_t FNV_PRIME = 1099511628211ull;

  enum tag : std::uint8_t {
    tag_path_entry = 1,
    tag_quantifier = 2,
    tag_scalar = 3,
    tag_set = 4,
    tag_pattern = 5,
    tag_version = 6,
  };

  struct fnv64 {
    std::uint64_t h{FNV_OFFSET};

    void bytes(const void* ptr, std::size_t n) noexcept {
      const auto* p = static_cast<const std::uint8_t*>(ptr);
      for (std::size_t i = 0; i < n; ++i) { h ^= p[i]; h *= FNV_PRIME; }
    }
    void u8(std::uint8_t v) noexcept { bytes(&v, 1); }
    void u64(std::uint64_t v) noexcept { bytes(&v, sizeof(v)); }
    void str(std::string_view s) noexcept { u64(s.size()); bytes(s.data(), s.size()); }

    void add(const path& p) noexcept {
      u64(p.size());
      for (const auto& seg : p.segments()) str(seg);
    }

    void add(const scalar& s) noexcept {
      u8(static_cast<std::uint8_t>(s.index()));
      std::visit([this](const auto& x) {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, bool>) u8(x ? 1 : 0);
        else if constexpr (std::is_same_v<T, std::int64_t>) u64(static_cast<std::uint64_t>(x));
        else if constexpr (std::is_same_v<T, double>) u64(std::bit_cast<std::uint64_t>(x));
        else if constexpr (std::is_same_v<T, std::string>) str(x);
      }, s);
    }

    void add(const constraint& c) noexcept {
      str(c.op);
      if (const auto* s = std::get_if<scalar>(&c.value)) {
        u8(tag_scalar);
        add(*s);
      } else if (const auto* set = std::get_if<scalar_set>(&c.value)) {
        u8(tag_set);
        u64(set->size());
        for (const auto& m : set->members()) add(m);
      } else {
        u8(tag_pattern);
        str(std::get<pattern>(c.value).source);
      }
    }

    void add(const path_constraints& pc) noexcept {
      u8(tag_path_entry);
      add(pc.where);
      u64(pc.constraints.size());
      for (const auto& c : pc.constraints) add(c);
    }

    void add(const quantifier& q) noexcept {
      u8(tag_quantifier);
      u8(static_cast<std::uint8_t>(q.kind));
      add(q.collection);
      u64(q.body.size());
      for (const auto& ec : q.body) {
        add(ec.field);
        add(ec.rule);
      }
    }
  };

} // namespace

auto signature_of(const constraint_set& cs, std::uint64_t registry_version) noexcept -> std::uint64_t {
  fnv64 h;
  h.u64(cs.size());
  for (const auto& e : cs.entries()) {
    std::visit([&h](const auto& node){ h.add(node); }, e);
  }
  h.u8(tag_version);
  h.u64(registry_version);
  return h.h;
}

} // namespace verdict::cache
