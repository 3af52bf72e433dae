#pragma once

/** \file compiler.hpp
 *  \brief Compile a constraint set into an immutable, thread-safe evaluator.
 *
 * compile() extracts templates, then emits one fragment per entry (scalar
 * paths through the scalar-path compiler, quantifiers through the quantifier
 * compiler). The resulting evaluator walks the fragments in declaration
 * order and returns the first open or conflict residual, or Satisfied.
 *
 * Callers are expected to run analysis::analyze() first; compile() itself
 * fails with `unsupported` on anything the generator cannot emit and never
 * degrades to a partial program.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <vector>

#include "verdict/codegen/fragments.hpp"
#include "verdict/codegen/templates.hpp"
#include "verdict/constraint_set.hpp"
#include "verdict/document.hpp"
#include "verdict/error.hpp"
#include "verdict/operator_registry.hpp"
#include "verdict/residual.hpp"

namespace verdict::codegen {

/** \brief Evaluator flavour. */
enum class tier : std::uint8_t {
  inlined,  /**< compiled program only */
  guarded,  /**< falls back when the registry version moved since compilation */
};

/** \brief Generic interpreter hook used by the guarded tier. */
using fallback_fn = std::function<residual(const value&)>;

struct compile_options {
  tier level{tier::inlined};
  fallback_fn fallback;  /**< required for tier::guarded */
};

/** \brief Compiled policy: `value -> residual`. Immutable once built. */
class compiled_evaluator {
public:
  compiled_evaluator(constraint_set source, std::vector<fragment> program, templates tmpl,
                     std::uint64_t version, tier level, const operator_registry* registry,
                     fallback_fn fallback);

  compiled_evaluator(const compiled_evaluator&) = delete;
  compiled_evaluator& operator=(const compiled_evaluator&) = delete;

  /** \brief Evaluate a document. Never fails; thread-safe. */
  [[nodiscard]] auto evaluate(const value& doc) const -> residual;

  [[nodiscard]] auto operator()(const value& doc) const -> residual { return evaluate(doc); }

  /** \brief The constraint set this evaluator was compiled from. */
  [[nodiscard]] auto source() const noexcept -> const constraint_set& { return source_; }

  /** \brief Registry version at compile time. */
  [[nodiscard]] auto compiled_version() const noexcept -> std::uint64_t { return version_; }

  [[nodiscard]] auto level() const noexcept -> tier { return tier_; }

  [[nodiscard]] auto fragment_count() const noexcept -> std::size_t { return program_.size(); }

  [[nodiscard]] auto summary() const -> template_summary { return template_info(templates_); }

private:
  constraint_set source_;
  std::vector<fragment> program_;
  templates templates_;
  std::uint64_t version_;
  tier tier_;
  const operator_registry* registry_;  // guarded tier; must outlive the evaluator
  fallback_fn fallback_;
};

/** \brief Compile `cs` against the current version of `registry`.
 *
 * \return `unsupported` when an operator cannot be emitted, `invalid_argument`
 *         for a bad pattern or a guarded tier without fallback.
 *
 * The guarded tier keeps a pointer to `registry`; the registry must outlive it.
 */
auto compile(const constraint_set& cs, const operator_registry& registry,
             compile_options opts = {})
    -> std::expected<std::shared_ptr<const compiled_evaluator>, core::error>;

} // namespace verdict::codegen
