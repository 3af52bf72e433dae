#include <catch2/catch_all.hpp>
#include <verdict/residual.hpp>

#include <memory>

using namespace verdict;

namespace {
  auto open_role() {
    return std::make_shared<const open_residual>(
        open_residual{path{"role"}, {constraint::eq("admin")}, std::nullopt, {}});
  }
  auto role_site() {
    return std::make_shared<const conflict_site>(conflict_site{path{"role"}, constraint::eq("admin"), std::nullopt});
  }
}

TEST_CASE("satisfied residual is canonical", "[residual]") {
  const auto& a = residual::satisfied();
  const auto& b = residual::satisfied();
  REQUIRE(&a == &b);
  REQUIRE(a.is_satisfied());
  REQUIRE(a.where().empty());
  REQUIRE(a.open_detail() == nullptr);
  REQUIRE(a.conflict_detail() == nullptr);
  REQUIRE(a.witness() == nullptr);
  REQUIRE(residual{} == a);
}

TEST_CASE("open residual restates path constraints", "[residual]") {
  const auto r = residual::open(open_role());
  REQUIRE(r.is_open());
  REQUIRE(r.where() == path{"role"});
  REQUIRE(r.open_detail()->constraints.size() == 1);
  REQUIRE(to_string(r) == "{[role] [[eq \"admin\"]]}");
}

TEST_CASE("conflict residual carries the witness", "[residual]") {
  const auto r = residual::conflict(role_site(), value{"guest"});
  REQUIRE(r.is_conflict());
  REQUIRE(r.where() == path{"role"});
  REQUIRE(r.conflict_detail()->violated == constraint::eq("admin"));
  REQUIRE(*r.witness() == value{"guest"});
  REQUIRE(to_string(r) == "{[role] [[conflict [eq \"admin\"] \"guest\"]]}");
}

TEST_CASE("residual equality is structural", "[residual]") {
  REQUIRE(residual::open(open_role()) == residual::open(open_role()));
  REQUIRE(residual::conflict(role_site(), value{"guest"}) == residual::conflict(role_site(), value{"guest"}));
  REQUIRE_FALSE(residual::conflict(role_site(), value{"guest"}) == residual::conflict(role_site(), value{"root"}));
  REQUIRE_FALSE(residual::open(open_role()) == residual::satisfied());
  REQUIRE_FALSE(residual::open(open_role()) == residual::conflict(role_site(), value{"guest"}));
}

TEST_CASE("quantifier residual rendering", "[residual][quantifier]") {
  const std::vector<element_constraint> body{{path{"qty"}, constraint::lte(5)}};
  const auto open = residual::open(std::make_shared<const open_residual>(
      open_residual{path{"items"}, {}, quantifier_kind::forall, body}));
  REQUIRE(to_string(open) == "{[items] [[forall [qty] [lte 5]]]}");

  const auto conflict = residual::conflict(
      std::make_shared<const conflict_site>(conflict_site{path{"items"}, constraint::lte(5), path{"qty"}}),
      value{9});
  REQUIRE(to_string(conflict) == "{[items] [[conflict [qty] [lte 5] 9]]}");
  REQUIRE(to_string(residual::satisfied()) == "{}");
}
