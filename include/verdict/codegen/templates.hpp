#pragma once

/** \file templates.hpp
 *  \brief Pre-computed residual shapes for compiled evaluators.
 *
 * For every entry of a constraint set the extractor builds, once:
 * - the open residual returned when the path (or quantified collection) is absent;
 * - one conflict template per constraint, fixing everything but the witness.
 *
 * The compiled hot path therefore never rebuilds path lists or constraint
 * descriptions; it only plugs the runtime witness into a template.
 */

#include <cstddef>
#include <memory>
#include <vector>

#include "verdict/constraint_set.hpp"
#include "verdict/residual.hpp"

namespace verdict::codegen {

/** \brief `witness -> Conflict{path, constraint, witness}` with the site pre-built. */
class conflict_template {
public:
  explicit conflict_template(std::shared_ptr<const conflict_site> site) : site_(std::move(site)) {}

  [[nodiscard]] auto operator()(const value& witness) const -> residual {
    return residual::conflict(site_, witness);
  }

  [[nodiscard]] auto site() const noexcept -> const conflict_site& { return *site_; }

private:
  std::shared_ptr<const conflict_site> site_;
};

/** \brief Templates of one constraint-set entry (path or quantifier). */
struct entry_templates {
  path at;
  std::shared_ptr<const open_residual> open;
  std::vector<conflict_template> conflicts;  /**< parallel to the entry's constraints */

  /** \brief The pre-built open residual. */
  [[nodiscard]] auto absent() const -> residual { return residual::open(open); }
};

/** \brief Templates for a whole set, parallel to constraint_set::entries(). */
struct templates {
  std::vector<entry_templates> entries;
};

/** \brief Extract templates; deterministic and infallible for well-formed sets. */
auto extract(const constraint_set& cs) -> templates;

/** \brief Diagnostics summary of extracted templates. */
struct template_summary {
  std::size_t path_count{0};
  std::vector<path> paths;
  std::size_t total_constraints{0};
};

auto template_info(const templates& t) -> template_summary;

} // namespace verdict::codegen
