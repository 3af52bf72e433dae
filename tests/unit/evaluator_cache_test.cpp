#include <catch2/catch_all.hpp>
#include <verdict/cache/evaluator_cache.hpp>

#include <cstdlib>
#include <limits>
#include <string>
#include <thread>
#include <vector>

using namespace verdict;
using namespace verdict::cache;
using verdict::core::error_code;

namespace {

  auto role_is(const std::string& role) -> constraint_set {
    constraint_set cs;
    cs.add(path{"role"}, {constraint::eq(role)});
    return cs;
  }

  void set_env_var(const char* name, const char* v) {
#if defined(_WIN32)
    _putenv_s(name, v ? v : "");
#else
    if (v) setenv(name, v, 1); else unsetenv(name);
#endif
  }

  struct env_guard {
    const char* name;
    env_guard(const char* n, const char* v) : name(n) { set_env_var(n, v); }
    ~env_guard() { set_env_var(name, nullptr); }
  };

}

TEST_CASE("cache returns the same evaluator on repeat lookups", "[cache]") {
  operator_registry reg;
  evaluator_cache cache(reg);
  const auto cs = role_is("admin");

  auto first = cache.get_or_compile(cs);
  REQUIRE(first.has_value());
  auto second = cache.get_or_compile(cs);
  REQUIRE(second.has_value());
  REQUIRE(first->get() == second->get());

  const auto s = cache.stats();
  REQUIRE(s.misses == 1);
  REQUIRE(s.hits == 1);
  REQUIRE(s.total == 2);
  REQUIRE(s.hit_rate == Catch::Approx(0.5));
  REQUIRE(s.size == 1);
  REQUIRE(s.compilations == 1);
}

TEST_CASE("cached evaluator answers the role policy", "[cache]") {
  operator_registry reg;
  evaluator_cache cache(reg);
  auto ev = cache.get_or_compile(role_is("admin"));
  REQUIRE(ev.has_value());
  REQUIRE((**ev)(value::object({{"role", "admin"}})).is_satisfied());
  REQUIRE((**ev)(value::object({})).is_open());
  REQUIRE((**ev)(value::object({{"role", "guest"}})).is_conflict());
}

TEST_CASE("structurally equal sets hit the same entry", "[cache]") {
  operator_registry reg;
  evaluator_cache cache(reg);
  constraint_set a;
  a.add(path{"role"}, {constraint::in({"ops", "admin"})});
  constraint_set b;
  b.add(path::parse("role"), {constraint::in({"admin", "ops", "admin"})});
  auto ea = cache.get_or_compile(a);
  auto eb = cache.get_or_compile(b);
  REQUIRE(ea.has_value());
  REQUIRE(eb.has_value());
  REQUIRE(ea->get() == eb->get());
}

TEST_CASE("registry version bump forces recompilation", "[cache][version]") {
  operator_registry reg;
  evaluator_cache cache(reg);
  const auto cs = role_is("admin");

  auto before = cache.get_or_compile(cs);
  REQUIRE(before.has_value());
  const auto sig_before = cache.signature(cs);

  (void)reg.bump_version();
  REQUIRE(cache.signature(cs) != sig_before);
  REQUIRE(cache.get_cached(cs) == nullptr);

  auto after = cache.get_or_compile(cs);
  REQUIRE(after.has_value());
  REQUIRE(after->get() != before->get());
  REQUIRE((*after)->compiled_version() == 2);
  REQUIRE(cache.stats().compilations == 2);
  // the stale entry is not invalidated, only outranked
  REQUIRE(cache.size() == 2);
}

TEST_CASE("ineligible sets are rejected without compiling", "[cache][errors]") {
  operator_registry reg;
  REQUIRE(reg.register_operator("within-radius", [](const value&, const operand&){ return true; }).has_value());
  evaluator_cache cache(reg);

  constraint_set cs;
  cs.add(path{"loc"}, {constraint{"within-radius", scalar{std::int64_t{10}}}});
  auto r = cache.get_or_compile(cs);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().code == error_code::not_eligible);
  REQUIRE(r.error().message.find("within-radius") != std::string::npos);

  const auto s = cache.stats();
  REQUIRE(s.misses == 1);
  REQUIRE(s.compilations == 0);
  REQUIRE(s.size == 0);
}

TEST_CASE("NaN literals are rejected the same way on every lookup", "[cache][errors]") {
  operator_registry reg;
  evaluator_cache cache(reg);
  const double nan = std::numeric_limits<double>::quiet_NaN();

  constraint_set eq_nan;
  eq_nan.add(path{"ratio"}, {constraint::eq(nan)});
  constraint_set in_nan;
  in_nan.add(path{"ratio"}, {constraint::in({0.5, nan})});

  for (const auto* cs : {&eq_nan, &in_nan}) {
    for (int i = 0; i < 2; ++i) {
      auto r = cache.get_or_compile(*cs);
      REQUIRE_FALSE(r.has_value());
      REQUIRE(r.error().code == error_code::not_eligible);
      REQUIRE(r.error().message.find("operand_mismatch") != std::string::npos);
    }
  }

  const auto s = cache.stats();
  REQUIRE(s.compilations == 0);
  REQUIRE(s.size == 0);

  constraint_set ratio;
  ratio.add(path{"ratio"}, {constraint::eq(0.5)});
  auto first = cache.get_or_compile(ratio);
  auto second = cache.get_or_compile(ratio);
  REQUIRE(first.has_value());
  REQUIRE(second.has_value());
  REQUIRE(first->get() == second->get());
  REQUIRE(cache.stats().compilations == 1);
}

TEST_CASE("baseline cache rejects quantifiers; quantified mode admits them", "[cache][quantifier]") {
  operator_registry reg;
  constraint_set cs;
  cs.add(quantifier::forall(path{"items"}, {{path{"qty"}, constraint::lte(5)}}));

  evaluator_cache baseline(reg);
  auto rejected = baseline.get_or_compile(cs);
  REQUIRE_FALSE(rejected.has_value());
  REQUIRE(rejected.error().code == error_code::not_eligible);

  evaluator_cache quantified(reg, cache_config{DEFAULT_CAPACITY, analysis::analysis_mode::quantified, false});
  auto ev = quantified.get_or_compile(cs);
  REQUIRE(ev.has_value());
  const auto items = [](std::int64_t q) {
    return value::object({{"items", value::list({value::object({{"qty", 1}}), value::object({{"qty", q}})})}});
  };
  REQUIRE((**ev)(items(2)).is_satisfied());
  const auto r = (**ev)(items(9));
  REQUIRE(r.is_conflict());
  REQUIRE(*r.witness() == value{9});
}

TEST_CASE("cache evicts the least recently used evaluator", "[cache][lru]") {
  operator_registry reg;
  evaluator_cache cache(reg, cache_config{3, analysis::analysis_mode::baseline, false});

  REQUIRE(cache.get_or_compile(role_is("a")).has_value());
  REQUIRE(cache.get_or_compile(role_is("b")).has_value());
  REQUIRE(cache.get_or_compile(role_is("c")).has_value());
  REQUIRE(cache.get_or_compile(role_is("a")).has_value());  // refresh a
  REQUIRE(cache.get_or_compile(role_is("d")).has_value());  // evicts b

  REQUIRE(cache.size() == 3);
  REQUIRE(cache.stats().evictions == 1);
  REQUIRE(cache.get_cached(role_is("a")) != nullptr);
  REQUIRE(cache.get_cached(role_is("c")) != nullptr);
  REQUIRE(cache.get_cached(role_is("d")) != nullptr);
  REQUIRE(cache.get_cached(role_is("b")) == nullptr);
}

TEST_CASE("get_cached never compiles", "[cache]") {
  operator_registry reg;
  evaluator_cache cache(reg);
  REQUIRE(cache.get_cached(role_is("admin")) == nullptr);
  REQUIRE(cache.stats().misses == 1);
  REQUIRE(cache.stats().compilations == 0);
  REQUIRE(cache.size() == 0);
}

TEST_CASE("clear drops entries and counters", "[cache]") {
  operator_registry reg;
  evaluator_cache cache(reg);
  REQUIRE(cache.get_or_compile(role_is("admin")).has_value());
  REQUIRE(cache.get_or_compile(role_is("admin")).has_value());
  cache.clear();
  const auto s = cache.stats();
  REQUIRE(s.size == 0);
  REQUIRE(s.hits == 0);
  REQUIRE(s.misses == 0);
  REQUIRE(s.hit_rate == 0.0);
  REQUIRE(cache.get_cached(role_is("admin")) == nullptr);
}

TEST_CASE("warm compiles a batch", "[cache][warm]") {
  operator_registry reg;
  evaluator_cache cache(reg);
  auto n = cache.warm({role_is("a"), role_is("b"), role_is("a")});
  REQUIRE(n.has_value());
  REQUIRE(*n == 3);
  REQUIRE(cache.size() == 2);
  REQUIRE(cache.stats().compilations == 2);
}

TEST_CASE("warm fails the whole batch on an ineligible set", "[cache][warm][errors]") {
  operator_registry reg;
  evaluator_cache cache(reg);
  constraint_set custom;
  custom.add(path{"loc"}, {constraint{"near", scalar{std::int64_t{1}}}});

  auto r = cache.warm({role_is("a"), custom, role_is("b")});
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().code == error_code::not_eligible);
  REQUIRE(r.error().message.find("#1") != std::string::npos);
  REQUIRE(cache.size() == 0);
  REQUIRE(cache.stats().compilations == 0);
}

TEST_CASE("concurrent lookups of one set share a resident evaluator", "[cache][concurrency]") {
  operator_registry reg;
  evaluator_cache cache(reg);
  const auto cs = role_is("admin");

  std::vector<evaluator_ptr> seen(8);
  std::vector<std::thread> threads;
  for (std::size_t t = 0; t < seen.size(); ++t) {
    threads.emplace_back([&, t]{
      for (int i = 0; i < 50; ++i) {
        auto ev = cache.get_or_compile(cs);
        if (ev) seen[t] = *ev;
      }
    });
  }
  for (auto& th : threads) th.join();

  // racing compiles may run, but only one evaluator stays resident
  REQUIRE(cache.size() == 1);
  const auto resident = cache.get_cached(cs);
  REQUIRE(resident != nullptr);
  for (const auto& ev : seen) REQUIRE(ev == resident);
  REQUIRE(cache.stats().total == 8 * 50 + 1);
}

TEST_CASE("cache_config defaults and environment overrides", "[cache][config][env]") {
  set_env_var("VERDICT_CACHE_CAPACITY", nullptr);
  set_env_var("VERDICT_CACHE_QUANTIFIERS", nullptr);
  {
    auto cfg = cache_config::from_env();
    REQUIRE(cfg.has_value());
    REQUIRE(cfg->capacity == DEFAULT_CAPACITY);
    REQUIRE(cfg->mode == analysis::analysis_mode::baseline);
  }
  {
    env_guard cap("VERDICT_CACHE_CAPACITY", "16");
    env_guard quant("VERDICT_CACHE_QUANTIFIERS", "1");
    auto cfg = cache_config::from_env();
    REQUIRE(cfg.has_value());
    REQUIRE(cfg->capacity == 16);
    REQUIRE(cfg->mode == analysis::analysis_mode::quantified);
  }
}

TEST_CASE("cache_config rejects malformed capacity", "[cache][config][env][errors]") {
  for (const char* bad : {"0", "-3", "12x", ""}) {
    env_guard cap("VERDICT_CACHE_CAPACITY", bad);
    auto cfg = cache_config::from_env();
    REQUIRE_FALSE(cfg.has_value());
    REQUIRE(cfg.error().code == error_code::config_invalid);
  }
}
