/** \file compiler.cpp
 *  \brief Evaluator assembly and evaluation loop.
 */

#include "verdict/codegen/compiler.hpp"

#include <chrono>
#include <iostream>
#include <utility>

#include "verdict/core/platform_utils.hpp"

namespace verdict::codegen {

namespace {

  auto compile_entry(const path_constraints& pc, const entry_templates& t)
      -> std::expected<fragment, core::error> {
    return compile_scalar_path(pc.where, pc.constraints, t);
  }

  auto compile_entry(const quantifier& q, const entry_templates& t)
      -> std::expected<fragment, core::error> {
    return compile_quantifier(q, t);
  }

} // namespace

compiled_evaluator::compiled_evaluator(constraint_set source, std::vector<fragment> program,
                                       templates tmpl, std::uint64_t version, tier level,
                                       const operator_registry* registry, fallback_fn fallback)
    : source_(std::move(source))
    , program_(std::move(program))
    , templates_(std::move(tmpl))
    , version_(version)
    , tier_(level)
    , registry_(registry)
    , fallback_(std::move(fallback)) {}

auto compiled_evaluator::evaluate(const value& doc) const -> residual {
  if (tier_ == tier::guarded && registry_->current_version() != version_) {
    return fallback_(doc);
  }
  for (const auto& f : program_) {
    if (auto r = run(f, doc)) return std::move(*r);
  }
  return residual::satisfied();
}

auto compile(const constraint_set& cs, const operator_registry& registry, compile_options opts)
    -> std::expected<std::shared_ptr<const compiled_evaluator>, core::error> {
  const bool dbg = core::env_flag("VERDICT_COMPILER_DEBUG");
  const auto t0 = std::chrono::steady_clock::now();

  if (opts.level == tier::guarded && !opts.fallback) {
    return std::unexpected(core::error{
      core::error_code::invalid_argument,
      "guarded tier requires a fallback evaluator",
      "codegen.compile"
    });
  }

  // Version is read before emission; a concurrent bump leaves this evaluator stale.
  const auto version = registry.current_version();
  auto tmpl = extract(cs);

  std::vector<fragment> program;
  program.reserve(cs.size());
  for (std::size_t i = 0; i < cs.size(); ++i) {
    const auto& entry = cs.entries()[i];
    const auto& t = tmpl.entries[i];
    auto f = std::visit([&t](const auto& node){ return compile_entry(node, t); }, entry);
    if (!f) {
      if (dbg) {
        std::cerr << "[VERDICT][compile] aborted at " << to_string(t.at)
                  << ": " << f.error().message << std::endl;
      }
      return std::unexpected(f.error());
    }
    program.push_back(std::move(*f));
  }

  const auto* guard = opts.level == tier::guarded ? &registry : nullptr;
  auto evaluator = std::make_shared<const compiled_evaluator>(
      cs, std::move(program), std::move(tmpl), version, opts.level, guard, std::move(opts.fallback));

  if (dbg) {
    const auto us = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - t0).count();
    const auto info = evaluator->summary();
    std::cerr << "[VERDICT][compile] entries=" << info.path_count
              << " constraints=" << info.total_constraints
              << " version=" << version
              << " tier=" << (opts.level == tier::guarded ? "guarded" : "inlined")
              << " in " << us << " us" << std::endl;
  }
  return evaluator;
}

} // namespace verdict::codegen
