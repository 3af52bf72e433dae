#pragma once

/** \file evaluator_cache.hpp
 *  \brief Memoizes compiled evaluators by (constraint set, registry version).
 *
 * Entries are never invalidated explicitly: a registry version bump changes
 * every future signature and stale entries age out through LRU eviction.
 * Compilation runs outside the store lock; when two callers race on one
 * signature, both compile and the first inserted evaluator stays resident.
 *
 * Environment (read by cache_config::from_env):
 *  - VERDICT_CACHE_CAPACITY=<n>   maximum resident evaluators (n > 0)
 *  - VERDICT_CACHE_QUANTIFIERS=1  admit quantified constraint sets
 *  - VERDICT_CACHE_DEBUG=1        log misses, rejections and evictions to stderr
 */

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <vector>

#include "verdict/cache/lru_cache.hpp"
#include "verdict/codegen/compiler.hpp"
#include "verdict/constraint_set.hpp"
#include "verdict/eligibility.hpp"
#include "verdict/error.hpp"
#include "verdict/operator_registry.hpp"

namespace verdict::cache {

inline constexpr std::size_t DEFAULT_CAPACITY = 128;

struct cache_config {
  std::size_t capacity{DEFAULT_CAPACITY};
  analysis::analysis_mode mode{analysis::analysis_mode::baseline};
  bool debug{false};

  /** \brief Defaults overridden from the environment; `config_invalid` on a
   *         malformed or zero capacity. */
  static auto from_env() -> std::expected<cache_config, core::error>;
};

struct cache_stats {
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  std::uint64_t total{0};
  double hit_rate{0.0};
  std::size_t size{0};
  std::uint64_t evictions{0};
  std::uint64_t compilations{0};
};

using evaluator_ptr = std::shared_ptr<const codegen::compiled_evaluator>;

class evaluator_cache {
public:
  explicit evaluator_cache(const operator_registry& registry, cache_config config = {});

  evaluator_cache(const evaluator_cache&) = delete;
  evaluator_cache& operator=(const evaluator_cache&) = delete;

  /** \brief Cached evaluator for `cs`, compiling on a miss.
   *
   * \return `not_eligible` when the analyzer rejects the set (the compiler is
   *         not invoked), or the compiler's error.
   */
  auto get_or_compile(const constraint_set& cs) -> std::expected<evaluator_ptr, core::error>;

  /** \brief Lookup only; nullptr when absent. Records a hit or a miss. */
  auto get_cached(const constraint_set& cs) -> evaluator_ptr;

  /** \brief Analyze every set, then compile each through get_or_compile().
   *
   * \return number of sets warmed; `not_eligible` naming the index of the
   *         first ineligible set, in which case nothing is compiled.
   */
  auto warm(const std::vector<constraint_set>& sets) -> std::expected<std::size_t, core::error>;

  [[nodiscard]] auto stats() const -> cache_stats;

  /** \brief Drop all entries and reset the counters. */
  auto clear() -> void;

  [[nodiscard]] auto size() const -> std::size_t { return store_.size(); }
  [[nodiscard]] auto config() const noexcept -> const cache_config& { return config_; }

  /** \brief Signature of `cs` under the registry's current version. */
  [[nodiscard]] auto signature(const constraint_set& cs) const noexcept -> std::uint64_t;

private:
  auto lookup(std::uint64_t sig, const constraint_set& cs) -> evaluator_ptr;

  const operator_registry& registry_;
  cache_config config_;
  LruCache<std::uint64_t, evaluator_ptr> store_;
  std::atomic<std::uint64_t> hits_{0};
  std::atomic<std::uint64_t> misses_{0};
  std::atomic<std::uint64_t> compilations_{0};
};

} // namespace verdict::cache
