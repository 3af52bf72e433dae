/** \file evaluator_cache.cpp
 *  \brief Signature-keyed LRU of compiled evaluators.
 */

#include "verdict/cache/evaluator_cache.hpp"

#include <iostream>
#include <string>

#include "verdict/cache/signature.hpp"
#include "verdict/core/platform_utils.hpp"

namespace verdict::cache {

auto cache_config::from_env() -> std::expected<cache_config, core::error> {
  cache_config cfg;
  if (auto cap = core::env_size("VERDICT_CACHE_CAPACITY")) {
    if (!*cap || **cap == 0) {
      return std::unexpected(core::error{
        core::error_code::config_invalid,
        "VERDICT_CACHE_CAPACITY must be a positive integer, got '" +
            core::safe_getenv("VERDICT_CACHE_CAPACITY").value_or("") + "'",
        "cache.config"
      });
    }
    cfg.capacity = **cap;
  }
  if (core::env_flag("VERDICT_CACHE_QUANTIFIERS")) {
    cfg.mode = analysis::analysis_mode::quantified;
  }
  cfg.debug = core::env_flag("VERDICT_CACHE_DEBUG");
  return cfg;
}

evaluator_cache::evaluator_cache(const operator_registry& registry, cache_config config)
    : registry_(registry)
    , config_(config)
    , store_(config.capacity, [dbg = config.debug](const std::uint64_t& sig, const evaluator_ptr& ev) {
        if (dbg) {
          std::cerr << "[VERDICT][cache] evict sig=" << std::hex << sig << std::dec
                    << " version=" << ev->compiled_version() << std::endl;
        }
      }) {}

auto evaluator_cache::signature(const constraint_set& cs) const noexcept -> std::uint64_t {
  return signature_of(cs, registry_.current_version());
}

auto evaluator_cache::lookup(std::uint64_t sig, const constraint_set& cs) -> evaluator_ptr {
  auto hit = store_.get(sig);
  if (!hit) return nullptr;
  // Signature collision: a different set under the same key is not a hit.
  if ((*hit)->source() != cs) return nullptr;
  return std::move(*hit);
}

auto evaluator_cache::get_or_compile(const constraint_set& cs)
    -> std::expected<evaluator_ptr, core::error> {
  const auto sig = signature(cs);
  if (auto ev = lookup(sig, cs)) {
    hits_.fetch_add(1);
    return ev;
  }
  misses_.fetch_add(1);

  const auto result = analysis::analyze(cs, config_.mode);
  if (!result.eligible) {
    if (config_.debug) {
      std::cerr << "[VERDICT][cache] reject sig=" << std::hex << sig << std::dec
                << ": " << analysis::describe(result) << std::endl;
    }
    return std::unexpected(core::error{
      core::error_code::not_eligible,
      analysis::describe(result),
      "cache.get_or_compile"
    });
  }

  auto compiled = codegen::compile(cs, registry_);
  if (!compiled) return std::unexpected(compiled.error());
  compilations_.fetch_add(1);
  if (config_.debug) {
    std::cerr << "[VERDICT][cache] miss sig=" << std::hex << sig << std::dec
              << " compiled entries=" << cs.size() << std::endl;
  }

  auto resident = store_.get_or_insert(sig, *compiled);
  if (resident->source() != cs) {
    store_.put(sig, *compiled);
    return *compiled;
  }
  return resident;
}

auto evaluator_cache::get_cached(const constraint_set& cs) -> evaluator_ptr {
  auto ev = lookup(signature(cs), cs);
  if (ev) {
    hits_.fetch_add(1);
  } else {
    misses_.fetch_add(1);
  }
  return ev;
}

auto evaluator_cache::warm(const std::vector<constraint_set>& sets)
    -> std::expected<std::size_t, core::error> {
  for (std::size_t i = 0; i < sets.size(); ++i) {
    const auto result = analysis::analyze(sets[i], config_.mode);
    if (!result.eligible) {
      return std::unexpected(core::error{
        core::error_code::not_eligible,
        "constraint set #" + std::to_string(i) + " is not eligible: " + analysis::describe(result),
        "cache.warm"
      });
    }
  }
  for (const auto& cs : sets) {
    auto ev = get_or_compile(cs);
    if (!ev) return std::unexpected(ev.error());
  }
  return sets.size();
}

auto evaluator_cache::stats() const -> cache_stats {
  cache_stats s;
  s.hits = hits_.load();
  s.misses = misses_.load();
  s.total = s.hits + s.misses;
  s.hit_rate = s.total > 0 ? static_cast<double>(s.hits) / static_cast<double>(s.total) : 0.0;
  s.size = store_.size();
  s.evictions = store_.stats().evictions.load();
  s.compilations = compilations_.load();
  return s;
}

auto evaluator_cache::clear() -> void {
  store_.clear();
  store_.reset_stats();
  hits_.store(0);
  misses_.store(0);
  compilations_.store(0);
}

} // namespace verdict::cache
